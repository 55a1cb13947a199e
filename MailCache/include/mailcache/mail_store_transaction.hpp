/** MailStoreTransaction [MailCache]
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

#ifndef MailStoreTransaction_hpp
#define MailStoreTransaction_hpp

#include <chrono>
#include <string>

#include "mailcache/mail_store.hpp"

// BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless commit()
// was called. Commits slower than 80ms are logged.
class MailStoreTransaction
{
public:
    explicit MailStoreTransaction(MailStore * store, std::string nameHint = "");
    virtual ~MailStoreTransaction() noexcept;

    void commit();

private:
    MailStoreTransaction(const MailStoreTransaction&);
    MailStoreTransaction& operator=(const MailStoreTransaction&);

    MailStore * mStore;
    bool mCommitted;
    std::chrono::system_clock::time_point mStart;
    std::chrono::system_clock::time_point mBegan;
    std::string mNameHint;
};

#endif
