/** DaemonConfig [MailCache]
 *
 * Tunables and file locations for the daemon. Values come from mailcache.json in
 * the config directory; missing keys keep their defaults.
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef DaemonConfig_hpp
#define DaemonConfig_hpp

#include <memory>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "mailcache/reconciler.hpp"
#include "mailcache/models/account.hpp"

class DaemonConfig {
public:
    std::string configDir;
    std::string socketPath;

    int recencyWindowDays = 14;
    int sequenceFloor = 100;
    int prefetchCount = 10;
    int syncIntervalSeconds = 30 * 60;
    int drainIntervalSeconds = 10;
    int restartGraceMs = 500;
    int freshCacheSeconds = 300;

    DaemonConfig(std::string configDir);

    static DaemonConfig load(std::string configDir);

    void applyJSON(const nlohmann::json & json);

    ReconcilerOptions reconcilerOptions();

    std::string databasePath();
    std::string identityPath();
    std::string accountsPath();

    nlohmann::json toJSON();

    // Reads accounts.json. Throws SyncException if the file is malformed or an
    // account is missing required fields.
    std::vector<std::shared_ptr<Account>> loadAccounts();
};

#endif /* DaemonConfig_hpp */
