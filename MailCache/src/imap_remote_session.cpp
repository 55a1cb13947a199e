#include "mailcache/imap_remote_session.hpp"
#include "mailcache/mail_utils.hpp"
#include "mailcache/sync_exception.hpp"
#include "mailcache/constants.hpp"

#include <algorithm>

using namespace mailcore;

static std::string stringOrBlank(String * str) {
    return str == nullptr ? "" : std::string(str->UTF8Characters());
}

static std::string nameForEncoding(Encoding encoding) {
    switch (encoding) {
        case Encoding7Bit: return "7bit";
        case Encoding8Bit: return "8bit";
        case EncodingBinary: return "binary";
        case EncodingBase64: return "base64";
        case EncodingQuotedPrintable: return "quoted-printable";
        case EncodingUUEncode: return "uuencode";
        default: return "";
    }
}

IMAPRemoteSession::IMAPRemoteSession(std::shared_ptr<Account> account) :
    account(account), logger(spdlog::get("logger")), trashPath("")
{
    MailUtils::configureSessionForAccount(session, account);
}

IMAPMessagesRequestKind IMAPRemoteSession::metadataRequestKind() {
    return IMAPMessagesRequestKind(IMAPMessagesRequestKindUid | IMAPMessagesRequestKindFlags | IMAPMessagesRequestKindHeaders | IMAPMessagesRequestKindStructure | IMAPMessagesRequestKindInternalDate);
}

std::shared_ptr<Message> IMAPRemoteSession::messageFromIMAP(std::string mailbox, IMAPMessage * msg) {
    auto message = std::make_shared<Message>(account->id(), mailbox, msg->uid());
    MessageHeader * header = msg->header();

    message->setHeaderMessageId(stringOrBlank(header->messageID()));
    message->setSubject(stringOrBlank(header->subject()));
    message->setDate(header->date());

    // The receipt time comes from INTERNALDATE. Some servers omit it, in
    // which case the Date header is the best we have.
    time_t received = header->receivedDate();
    message->setReceivedAt(received > 0 ? received : header->date());

    nlohmann::json from = nlohmann::json::array();
    if (header->from() != nullptr) {
        from.push_back(MailUtils::contactJSONFromAddress(header->from()));
    }
    message->setFrom(from);
    message->setTo(MailUtils::contactsJSONFromAddresses(header->to()));
    message->setReplyTo(MailUtils::contactsJSONFromAddresses(header->replyTo()));
    message->setUnread(!(msg->flags() & MessageFlagSeen));

    std::vector<std::string> refs{};
    Array * references = header->references();
    if (references != nullptr) {
        for (unsigned int ii = 0; ii < references->count(); ii ++) {
            refs.push_back(((String *)references->objectAtIndex(ii))->UTF8Characters());
        }
    }
    message->setReferences(refs);

    std::vector<Attachment> attachments{};
    Array * parts = msg->attachments();
    if (parts != nullptr) {
        for (unsigned int ii = 0; ii < parts->count(); ii ++) {
            IMAPPart * part = (IMAPPart *)parts->objectAtIndex(ii);
            Attachment a{account->id(), mailbox, msg->uid(), stringOrBlank(part->partID())};
            a.setFilename(stringOrBlank(part->filename()));
            if (part->mimeType() != nullptr) {
                a.setContentType(stringOrBlank(part->mimeType()));
            }
            a.setSize(part->size());
            a.setEncoding(nameForEncoding(part->encoding()));
            attachments.push_back(a);
        }
    }
    message->setAttachments(attachments);

    return message;
}

std::vector<std::shared_ptr<Message>> IMAPRemoteSession::messagesFromArray(std::string mailbox, Array * msgs) {
    std::vector<std::shared_ptr<Message>> results{};
    if (msgs == nullptr) {
        return results;
    }
    for (unsigned int ii = 0; ii < msgs->count(); ii ++) {
        results.push_back(messageFromIMAP(mailbox, (IMAPMessage *)msgs->objectAtIndex(ii)));
    }
    return results;
}

uint32_t IMAPRemoteSession::generationId(std::string mailbox) {
    AutoreleasePool pool;
    ErrorCode err = ErrorCode::ErrorNone;

    IMAPFolderStatus * status = session.folderStatus(AS_MCSTR(mailbox), &err);
    if (err != ErrorNone) {
        throw SyncException(err, "generationId - folderStatus");
    }
    if (status == nullptr) {
        throw SyncException("no-folder-status", "folderStatus returned nothing for " + mailbox, true);
    }
    return status->uidValidity();
}

std::vector<std::shared_ptr<Message>> IMAPRemoteSession::fetchLatestMetadata(std::string mailbox, int count) {
    AutoreleasePool pool;
    ErrorCode err = ErrorCode::ErrorNone;

    IMAPFolderStatus * status = session.folderStatus(AS_MCSTR(mailbox), &err);
    if (err != ErrorNone) {
        throw SyncException(err, "fetchLatestMetadata - folderStatus");
    }
    uint32_t total = status == nullptr ? 0 : status->messageCount();
    if (total == 0 || count <= 0) {
        return {};
    }

    // sequence numbers are 1-based and ranges are inclusive of location + length
    uint32_t start = total > (uint32_t)count ? total - count + 1 : 1;
    IndexSet * numbers = IndexSet::indexSetWithRange(RangeMake(start, total - start));

    Array * msgs = session.fetchMessagesByNumber(AS_MCSTR(mailbox), metadataRequestKind(), numbers, nullptr, &err);
    if (err != ErrorNone) {
        throw SyncException(err, "fetchLatestMetadata - fetchMessagesByNumber");
    }
    logger->info("-- Fetched metadata for {} of {} messages in {}", msgs == nullptr ? 0 : msgs->count(), total, mailbox);
    return messagesFromArray(mailbox, msgs);
}

std::map<uint32_t, bool> IMAPRemoteSession::fetchFlagsSince(std::string mailbox, time_t since) {
    AutoreleasePool pool;
    ErrorCode err = ErrorCode::ErrorNone;
    std::map<uint32_t, bool> results{};

    IndexSet * uids = session.search(AS_MCSTR(mailbox), IMAPSearchExpression::searchSinceReceivedDate(since), &err);
    if (err != ErrorNone) {
        throw SyncException(err, "fetchFlagsSince - search");
    }
    if (uids == nullptr || uids->count() == 0) {
        return results;
    }

    Array * msgs = session.fetchMessagesByUID(AS_MCSTR(mailbox), IMAPMessagesRequestKind(IMAPMessagesRequestKindUid | IMAPMessagesRequestKindFlags), uids, nullptr, &err);
    if (err != ErrorNone) {
        throw SyncException(err, "fetchFlagsSince - fetchMessagesByUID");
    }
    for (unsigned int ii = 0; ii < msgs->count(); ii ++) {
        IMAPMessage * msg = (IMAPMessage *)msgs->objectAtIndex(ii);
        results[msg->uid()] = !(msg->flags() & MessageFlagSeen);
    }
    return results;
}

std::vector<std::shared_ptr<Message>> IMAPRemoteSession::fetchMetadataByUID(std::string mailbox, std::vector<uint32_t> uids) {
    AutoreleasePool pool;
    ErrorCode err = ErrorCode::ErrorNone;
    if (uids.empty()) {
        return {};
    }

    Array * msgs = session.fetchMessagesByUID(AS_MCSTR(mailbox), metadataRequestKind(), MailUtils::indexSetFromUIDs(uids), nullptr, &err);
    if (err != ErrorNone) {
        throw SyncException(err, "fetchMetadataByUID - fetchMessagesByUID");
    }
    return messagesFromArray(mailbox, msgs);
}

std::vector<uint32_t> IMAPRemoteSession::fetchAllUIDs(std::string mailbox) {
    AutoreleasePool pool;
    ErrorCode err = ErrorCode::ErrorNone;

    IndexSet * all = IndexSet::indexSetWithRange(RangeMake(1, UINT64_MAX));
    Array * msgs = session.fetchMessagesByUID(AS_MCSTR(mailbox), IMAPMessagesRequestKindUid, all, nullptr, &err);
    if (err != ErrorNone) {
        throw SyncException(err, "fetchAllUIDs - fetchMessagesByUID");
    }

    std::vector<uint32_t> uids{};
    for (unsigned int ii = 0; ii < msgs->count(); ii ++) {
        uids.push_back(((IMAPMessage *)msgs->objectAtIndex(ii))->uid());
    }
    return uids;
}

bool IMAPRemoteSession::uidExists(std::string mailbox, uint32_t uid) {
    ErrorCode err = ErrorCode::ErrorNone;
    Array * msgs = session.fetchMessagesByUID(AS_MCSTR(mailbox), IMAPMessagesRequestKindUid, IndexSet::indexSetWithIndex(uid), nullptr, &err);
    if (err != ErrorNone) {
        throw SyncException(err, "uidExists - fetchMessagesByUID");
    }
    if (msgs == nullptr) {
        return false;
    }
    for (unsigned int ii = 0; ii < msgs->count(); ii ++) {
        if (((IMAPMessage *)msgs->objectAtIndex(ii))->uid() == uid) {
            return true;
        }
    }
    return false;
}

RemoteBody IMAPRemoteSession::fetchBody(std::string mailbox, uint32_t uid) {
    AutoreleasePool pool;
    ErrorCode err = ErrorCode::ErrorNone;

    Data * data = session.fetchMessageByUID(AS_MCSTR(mailbox), uid, nullptr, &err);
    if (err == ErrorFetch || (err == ErrorNone && data == nullptr)) {
        // Messages can just disappear: deleted or moved by another client
        // after we last listed the mailbox. ErrorFetch is also what a NO or
        // BAD reply looks like, so only a UID the server no longer lists
        // counts as vanished.
        if (!uidExists(mailbox, uid)) {
            logger->info("-- Message {} in {} no longer exists remotely", uid, mailbox);
            throw RemoteVanishedException(account->id(), mailbox, uid);
        }
        if (err == ErrorNone) {
            throw SyncException("empty-fetch", "fetchBody - fetchMessageByUID returned no data for " + std::to_string(uid), true);
        }
    }
    if (err != ErrorNone) {
        throw SyncException(err, "fetchBody - fetchMessageByUID");
    }

    MessageParser * messageParser = MessageParser::messageParserWithData(data);
    RemoteBody result{};
    result.body = stringOrBlank(messageParser->htmlBodyRendering());
    result.plainText = stringOrBlank(messageParser->plainTextBodyRendering(true));
    return result;
}

void IMAPRemoteSession::deleteMessage(std::string mailbox, uint32_t uid) {
    AutoreleasePool pool;
    ErrorCode err = ErrorCode::ErrorNone;
    String * path = AS_MCSTR(mailbox);
    IndexSet * uids = IndexSet::indexSetWithIndex(uid);

    session.storeFlagsByUID(path, uids, IMAPStoreFlagsRequestKindAdd, MessageFlagDeleted, &err);
    if (err != ErrorNone) {
        throw SyncException(err, "deleteMessage - storeFlagsByUID");
    }

    session.expungeUIDs(path, uids, &err);
    if (err != ErrorNone) {
        logger->info("-- deleteMessage Expunge (UIDs) failed (error: {}), Expunging (Basic) from {}", ErrorCodeToTypeMap[err], mailbox);
        err = ErrorNone;
        session.expunge(path, &err);
    }
    if (err != ErrorNone) {
        throw SyncException(err, "deleteMessage - expunge");
    }
}

std::string IMAPRemoteSession::findTrashPath() {
    if (trashPath != "") {
        return trashPath;
    }

    ErrorCode err = ErrorCode::ErrorNone;
    Array * folders = session.fetchAllFolders(&err);
    if (err != ErrorNone) {
        throw SyncException(err, "findTrashPath - fetchAllFolders");
    }

    std::vector<std::string> paths{};
    for (unsigned int ii = 0; ii < folders->count(); ii ++) {
        IMAPFolder * folder = (IMAPFolder *)folders->objectAtIndex(ii);
        if (folder->flags() & IMAPFolderFlagTrash) {
            trashPath = folder->path()->UTF8Characters();
            return trashPath;
        }
        std::string path = folder->path()->UTF8Characters();
        std::transform(path.begin(), path.end(), path.begin(), ::tolower);
        paths.push_back(path);
    }

    // no \Trash flag, look for a folder with a familiar name
    for (auto name : TRASH_FOLDER_NAMES) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
        for (unsigned int ii = 0; ii < paths.size(); ii ++) {
            if (paths[ii] == lower) {
                trashPath = ((IMAPFolder *)folders->objectAtIndex(ii))->path()->UTF8Characters();
                return trashPath;
            }
        }
    }

    throw SyncException("no-trash-folder", "Could not identify the trash folder for " + account->emailAddress(), false);
}

void IMAPRemoteSession::moveToTrash(std::string mailbox, uint32_t uid) {
    AutoreleasePool pool;
    ErrorCode err = ErrorCode::ErrorNone;
    String * path = AS_MCSTR(mailbox);
    IndexSet * uids = IndexSet::indexSetWithIndex(uid);
    std::string trash = findTrashPath();
    HashMap * uidmap = nullptr;

    if (trash == mailbox) {
        deleteMessage(mailbox, uid);
        return;
    }

    // MOVE when the server has it, otherwise COPY, STORE, EXPUNGE.
    IndexSet * capabilities = session.storedCapabilities();
    if (capabilities != nullptr && capabilities->containsIndex(IMAPCapabilityMove)) {
        session.moveMessages(path, uids, AS_MCSTR(trash), &uidmap, &err);
        if (err != ErrorNone) {
            throw SyncException(err, "moveToTrash - moveMessages");
        }
    } else {
        session.copyMessages(path, uids, AS_MCSTR(trash), &uidmap, &err);
        if (err != ErrorNone) {
            throw SyncException(err, "moveToTrash - copyMessages");
        }
        session.storeFlagsByUID(path, uids, IMAPStoreFlagsRequestKindAdd, MessageFlagDeleted, &err);
        if (err != ErrorNone) {
            throw SyncException(err, "moveToTrash - storeFlagsByUID");
        }
        session.expungeUIDs(path, uids, &err);
        if (err != ErrorNone) {
            err = ErrorNone;
            session.expunge(path, &err);
        }
        if (err != ErrorNone) {
            throw SyncException(err, "moveToTrash - expunge");
        }
    }
}

void IMAPRemoteSession::markRead(std::string mailbox, uint32_t uid) {
    AutoreleasePool pool;
    ErrorCode err = ErrorCode::ErrorNone;

    session.storeFlagsByUID(AS_MCSTR(mailbox), IndexSet::indexSetWithIndex(uid), IMAPStoreFlagsRequestKindAdd, MessageFlagSeen, &err);
    if (err != ErrorNone) {
        throw SyncException(err, "markRead - storeFlagsByUID");
    }
}
