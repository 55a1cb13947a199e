/** MailUtils [MailCache]
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

#ifndef MailUtils_hpp
#define MailUtils_hpp

#include <memory>
#include <string>
#include <vector>

#include <stdio.h>
#include "MailCore/MailCore.h"
#include "nlohmann/json.hpp"

class Account;

class MailUtils {

public:
    static std::string getEnvUTF8(std::string key);
    static std::string configDirPath();

    static nlohmann::json contactJSONFromAddress(mailcore::Address * addr);
    static nlohmann::json contactsJSONFromAddresses(mailcore::Array * addrs);

    static std::string snippetFromText(std::string text);

    static mailcore::IndexSet * indexSetFromUIDs(const std::vector<uint32_t> & uids);

    static std::string qmarks(size_t count);

    static void configureSessionForAccount(mailcore::IMAPSession & session, std::shared_ptr<Account> account);

    template<typename T>
    static std::vector<std::vector<T>> chunksOfVector(std::vector<T> & v, size_t chunkSize) {
        std::vector<std::vector<T>> results{};

        while (v.size() > 0) {
            auto from = v.begin();
            auto to = v.size() > chunkSize ? from + chunkSize : v.end();

            results.push_back(std::vector<T>{std::make_move_iterator(from), std::make_move_iterator(to)});
            v.erase(from, to);
        }
        return results;
    }
};

#endif /* MailUtils_hpp */
