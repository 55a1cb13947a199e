#include "mailcache/mail_store_transaction.hpp"
#include "spdlog/spdlog.h"

MailStoreTransaction::MailStoreTransaction(MailStore * store, std::string nameHint) :
    mStore(store), mCommitted(false), mStart(std::chrono::system_clock::now()), mBegan(std::chrono::system_clock::now()), mNameHint(nameHint)
{
    mStore->beginTransaction();
    mBegan = std::chrono::system_clock::now();
}

MailStoreTransaction::~MailStoreTransaction() noexcept
{
    if (false == mCommitted) {
        try {
            mStore->rollbackTransaction();
        } catch (SQLite::Exception & ex) {
            spdlog::get("logger")->warn("Transaction={} rollback failed: {}", mNameHint, ex.what());
        }
    }
}

void MailStoreTransaction::commit()
{
    if (false == mCommitted) {
        mStore->commitTransaction();
        mCommitted = true;

        auto now = std::chrono::system_clock::now();
        auto elapsed = now - mStart;
        long long milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
        if (milliseconds > 80) {
            long long waiting = std::chrono::duration_cast<std::chrono::milliseconds>(mBegan - mStart).count();
            spdlog::get("logger")->warn("[SLOW] Transaction={} took {}ms, {}ms of it waiting for the write lock", mNameHint, milliseconds, waiting);
        }
    } else {
        throw SQLite::Exception("Transaction " + mNameHint + " was already committed");
    }
}
