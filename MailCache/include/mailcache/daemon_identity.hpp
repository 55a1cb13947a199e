/** DaemonIdentity [MailCache]
 *
 * The PID:VERSION record a running daemon leaves in the config directory, and
 * the start-up check that uses it to refuse a duplicate daemon or retire one
 * left over from an older build.
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

#ifndef DaemonIdentity_hpp
#define DaemonIdentity_hpp

#include <memory>
#include <string>

#include "spdlog/spdlog.h"

#include "mailcache/process_inspector.hpp"

enum class IdentityCheckOutcome {
    Proceed,
    AlreadyRunning,
    ReplacedStale
};

struct DaemonIdentityRecord {
    int pid = 0;
    std::string version;
};

class DaemonIdentity {
    std::string _path;
    ProcessInspector * _inspector;
    std::string _version;
    std::shared_ptr<spdlog::logger> logger;

public:
    DaemonIdentity(std::string path, ProcessInspector * inspector, std::string version);

    // Returns false when there is no file or it cannot be parsed.
    bool read(DaemonIdentityRecord & record);

    void write();

    // Deletes the file only if it still names this process.
    bool removeIfOwned();

    /*
     Decides whether this process may become the daemon. A live daemon of the
     same version wins and the caller should exit. A live daemon of another
     version is sent SIGTERM and given up to graceMs to go away.
     */
    IdentityCheckOutcome selfCheck(int graceMs);
};

std::string IdentityCheckOutcomeName(IdentityCheckOutcome outcome);

#endif /* DaemonIdentity_hpp */
