/** Constants [MailCache]
 *
 * Schema, defaults and error code names shared across the daemon.
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

#ifndef constants_hpp
#define constants_hpp

#include <map>
#include <string>
#include <vector>

#include "MailCore/MailCore.h"

#define AS_MCSTR(X)         mailcore::String::uniquedStringWithUTF8Characters(X.c_str())

#ifdef _WIN32
#define FS_PATH_SEP "\\"
#else
#define FS_PATH_SEP "/"
#endif

#ifndef MAILCACHE_VERSION
#define MAILCACHE_VERSION "0.0.0-dev"
#endif

#define MUTATION_KIND_DELETE       "delete"
#define MUTATION_KIND_MOVE_TRASH   "move_trash"
#define MUTATION_KIND_MARK_READ    "mark_read"

#define SNIPPET_MAX_LENGTH 200

// longest request line a client may send before its connection is closed
#define IPC_MAX_LINE_BYTES (1024 * 1024)

static const int CURRENT_SCHEMA_VERSION = 2;

static std::vector<std::string> SETUP_QUERIES = {
    "CREATE TABLE IF NOT EXISTS MailboxCheckpoint ("
        "accountId VARCHAR(40),"
        "mailbox VARCHAR(255),"
        "data TEXT,"
        "generationId INTEGER,"
        "lastSyncTime INTEGER,"
        "PRIMARY KEY (accountId, mailbox))",

    "CREATE TABLE IF NOT EXISTS Message ("
        "accountId VARCHAR(40),"
        "mailbox VARCHAR(255),"
        "remoteUID INTEGER,"
        "data TEXT,"
        "headerMessageId VARCHAR(255),"
        "receivedAt INTEGER,"
        "unread TINYINT(1),"
        "PRIMARY KEY (accountId, mailbox, remoteUID))",

    "CREATE INDEX IF NOT EXISTS MessageReceivedIndex ON Message (accountId, mailbox, receivedAt DESC)",

    "CREATE TABLE IF NOT EXISTS `MessageBody` ("
        "accountId VARCHAR(40),"
        "mailbox VARCHAR(255),"
        "remoteUID INTEGER,"
        "`value` TEXT,"
        "fetchedAt INTEGER,"
        "PRIMARY KEY (accountId, mailbox, remoteUID),"
        "FOREIGN KEY (accountId, mailbox, remoteUID) REFERENCES Message(accountId, mailbox, remoteUID) ON DELETE CASCADE)",

    "CREATE TABLE IF NOT EXISTS Attachment ("
        "accountId VARCHAR(40),"
        "mailbox VARCHAR(255),"
        "remoteUID INTEGER,"
        "partId VARCHAR(40),"
        "data TEXT,"
        "PRIMARY KEY (accountId, mailbox, remoteUID, partId),"
        "FOREIGN KEY (accountId, mailbox, remoteUID) REFERENCES Message(accountId, mailbox, remoteUID) ON DELETE CASCADE)",

    "CREATE TABLE IF NOT EXISTS SyncLock ("
        "accountId VARCHAR(40) PRIMARY KEY,"
        "data TEXT,"
        "pid INTEGER,"
        "startFingerprint INTEGER,"
        "acquiredAt INTEGER)",

    "CREATE TABLE IF NOT EXISTS PendingMutation ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "accountId VARCHAR(40),"
        "mailbox VARCHAR(255),"
        "remoteUID INTEGER,"
        "kind VARCHAR(20),"
        "data TEXT,"
        "createdAt INTEGER,"
        "retries INTEGER DEFAULT 0,"
        "lastError TEXT)",

    "CREATE INDEX IF NOT EXISTS PendingMutationOrderIndex ON PendingMutation (accountId, createdAt, id)",
};

// Added in schema version 2
static std::vector<std::string> V2_SETUP_QUERIES = {
    "CREATE TABLE IF NOT EXISTS MutationLog ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "accountId VARCHAR(40),"
        "mailbox VARCHAR(255),"
        "remoteUID INTEGER,"
        "kind VARCHAR(20),"
        "status VARCHAR(20),"
        "error TEXT,"
        "createdAt INTEGER)",
};

// Common trash folder names, used when the server does not flag one.
static std::vector<std::string> TRASH_FOLDER_NAMES = {
    "Trash",
    "[Gmail]/Trash",
    "[Google Mail]/Trash",
    "Deleted Items",
    "Deleted Messages",
    "INBOX.Trash",
};

static std::map<mailcore::ErrorCode, std::string> ErrorCodeToTypeMap = {
    {mailcore::ErrorNone, "ErrorNone"},
    {mailcore::ErrorConnection, "ErrorConnection"},
    {mailcore::ErrorTLSNotAvailable, "ErrorTLSNotAvailable"},
    {mailcore::ErrorParse, "ErrorParse"},
    {mailcore::ErrorCertificate, "ErrorCertificate"},
    {mailcore::ErrorAuthentication, "ErrorAuthentication"},
    {mailcore::ErrorGmailIMAPNotEnabled, "ErrorGmailIMAPNotEnabled"},
    {mailcore::ErrorGmailExceededBandwidthLimit, "ErrorGmailExceededBandwidthLimit"},
    {mailcore::ErrorGmailTooManySimultaneousConnections, "ErrorGmailTooManySimultaneousConnections"},
    {mailcore::ErrorMobileMeMoved, "ErrorMobileMeMoved"},
    {mailcore::ErrorYahooUnavailable, "ErrorYahooUnavailable"},
    {mailcore::ErrorNonExistantFolder, "ErrorNonExistantFolder"},
    {mailcore::ErrorRename, "ErrorRename"},
    {mailcore::ErrorDelete, "ErrorDelete"},
    {mailcore::ErrorCreate, "ErrorCreate"},
    {mailcore::ErrorSubscribe, "ErrorSubscribe"},
    {mailcore::ErrorAppend, "ErrorAppend"},
    {mailcore::ErrorCopy, "ErrorCopy"},
    {mailcore::ErrorExpunge, "ErrorExpunge"},
    {mailcore::ErrorFetch, "ErrorFetch"},
    {mailcore::ErrorIdle, "ErrorIdle"},
    {mailcore::ErrorIdentity, "ErrorIdentity"},
    {mailcore::ErrorNamespace, "ErrorNamespace"},
    {mailcore::ErrorStore, "ErrorStore"},
    {mailcore::ErrorCapability, "ErrorCapability"},
    {mailcore::ErrorStartTLSNotAvailable, "ErrorStartTLSNotAvailable"},
    {mailcore::ErrorStorageLimit, "ErrorStorageLimit"},
    {mailcore::ErrorFetchMessageList, "ErrorFetchMessageList"},
    {mailcore::ErrorDeleteMessage, "ErrorDeleteMessage"},
    {mailcore::ErrorInvalidAccount, "ErrorInvalidAccount"},
    {mailcore::ErrorFile, "ErrorFile"},
    {mailcore::ErrorCompression, "ErrorCompression"},
    {mailcore::ErrorNoop, "ErrorNoop"},
    {mailcore::ErrorGmailApplicationSpecificPasswordRequired, "ErrorGmailApplicationSpecificPasswordRequired"},
    {mailcore::ErrorServerDate, "ErrorServerDate"},
    {mailcore::ErrorNoValidServerFound, "ErrorNoValidServerFound"},
    {mailcore::ErrorCustomCommand, "ErrorCustomCommand"},
    {mailcore::ErrorAuthenticationRequired, "ErrorAuthenticationRequired"},
};

#endif /* constants_hpp */
