/** main [MailCache]
 *
 * Entry point for mailcached: the long-running daemon plus the one-shot
 * migrate, status, stop and reset modes.
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

#include <functional>
#include <iostream>
#include <string>
#include <thread>
#include <time.h>
#include <pthread.h>
#include <signal.h>
#include <sqlite3.h>

#include "MailCore/MailCore.h"
#include "SQLiteCpp/SQLiteCpp.h"
#include "StanfordCPPLib/exceptions.h"
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/stdout_sinks.h"
#include "optionparser.h"

#include "mailcache/constants.hpp"
#include "mailcache/daemon.hpp"
#include "mailcache/daemon_config.hpp"
#include "mailcache/daemon_identity.hpp"
#include "mailcache/imap_remote_session.hpp"
#include "mailcache/ipc_client.hpp"
#include "mailcache/ipc_server.hpp"
#include "mailcache/mail_store.hpp"
#include "mailcache/mail_utils.hpp"
#include "mailcache/process_inspector.hpp"
#include "mailcache/spd_log_extensions.hpp"
#include "mailcache/sync_exception.hpp"
#include "mailcache/sync_lock_manager.hpp"
#include "mailcache/thread_utils.hpp"

using nlohmann::json;
using option::Option;
using option::ArgStatus;

struct CArg: public option::Arg
{
    static ArgStatus Required(const Option& option, bool)
    {
        return option.arg == 0 ? option::ARG_ILLEGAL : option::ARG_OK;
    }
    static ArgStatus Optional(const Option& option, bool)
    {
        return option.arg == 0 ? option::ARG_IGNORE : option::ARG_OK;
    }
};

#define USAGE_STRING "USAGE: CONFIG_DIR_PATH=/path mailcached --mode <mode> [options]\n\nOptions:"

enum  optionIndex { UNKNOWN, HELP, ACCOUNT, MODE, ORPHAN, VERBOSE };
const option::Descriptor usage[] =
{
    {UNKNOWN, 0,"" , "",        CArg::None,      USAGE_STRING },
    {HELP,    0,"" , "help",    CArg::None,      "  --help  \tPrint usage and exit." },
    {ACCOUNT, 0,"a", "account", CArg::Optional,  "  --account, -a  \tAccount ID, required for --mode reset." },
    {MODE,    0,"m", "mode",    CArg::Required,  "  --mode, -m  \tRequired: daemon, migrate, status, stop, or reset." },
    {ORPHAN,  0,"o", "orphan",  CArg::None,      "  --orphan, -o  \tOptional: run in the foreground and log to stdout." },
    {VERBOSE, 0,"v", "verbose", CArg::None,      "  --verbose, -v  \tOptional: enable debug logging." },
    {0,0,0,0,0,0}
};

int runSingleFunctionAndExit(std::function<void()> fn) {
    json resp = {{"error", nullptr}};
    int code = 0;
    try {
        fn();
    } catch (SyncException & ex) {
        resp["error"] = ex.toJSON();
        code = 1;
    } catch (std::exception & ex) {
        resp["error"] = ex.what();
        code = 1;
    }
    std::cout << "\n" << resp.dump() << std::endl;
    return code;
}

void setupLogging(std::string configDir, bool orphan, bool verbose) {
    std::vector<std::shared_ptr<spdlog::sinks::sink>> sinks;
    std::string pattern;

    if (!orphan) {
        pattern = "%P %+";
        std::string logPath = configDir + FS_PATH_SEP + "mailcache-daemon.log";
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath, 1048576 * 5, 3));
        sinks.push_back(std::make_shared<SPDFlusherSink>());
    } else {
        pattern = "[%N] %l: %v";
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    // Always log critical errors to stderr as well as the log file / stdout.
    auto stderr_sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
    stderr_sink->set_level(spdlog::level::critical);
    sinks.push_back(stderr_sink);

    auto logger = std::make_shared<spdlog::logger>("logger", std::begin(sinks), std::end(sinks));
    logger->set_formatter(SPDFormatterWithThreadNames(pattern));
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::register_logger(logger);
}

void runStatus(DaemonConfig & config, SystemProcessInspector & inspector) {
    DaemonIdentity identity{config.identityPath(), &inspector, MAILCACHE_VERSION};
    DaemonIdentityRecord record;
    json resp = {{"version", MAILCACHE_VERSION}, {"daemon", nullptr}};

    bool running = identity.read(record) && inspector.isRunning(record.pid);
    if (running) {
        resp["daemon"] = {{"pid", record.pid}, {"version", record.version}};
        try {
            IPCClient client{config.socketPath};
            resp["accounts"] = client.request({{"type", "get_accounts"}})["accounts"];
            std::cout << resp.dump() << std::endl;
            return;
        } catch (SyncException & ex) {
            spdlog::get("logger")->warn("Daemon pid {} is running but its socket is unavailable: {}", record.pid, ex.debuginfo);
        }
    }

    // No daemon to ask: read the same numbers from the database directly.
    MailStore store(config.databasePath());
    SyncLockManager locks(&store, &inspector);
    json accounts = json::array();
    for (auto & account : config.loadAccounts()) {
        accounts.push_back({
            {"id", account->id()},
            {"email", account->emailAddress()},
            {"syncing", locks.isLocked(account->id())},
            {"last_sync_time", store.lastSyncTime(account->id())},
            {"cached_count", store.messageCount(account->id())},
            {"pending_mutation_count", store.pendingMutationCount(account->id())},
        });
    }
    resp["accounts"] = accounts;
    std::cout << resp.dump() << std::endl;
}

void runStop(DaemonConfig & config, SystemProcessInspector & inspector) {
    DaemonIdentity identity{config.identityPath(), &inspector, MAILCACHE_VERSION};
    DaemonIdentityRecord record;
    if (!identity.read(record) || !inspector.isRunning(record.pid)) {
        throw SyncException("not-running", "No daemon is running", false);
    }
    if (!inspector.terminate(record.pid)) {
        throw SyncException("signal-failed", "Could not signal pid " + std::to_string(record.pid), false);
    }
    spdlog::get("logger")->info("Sent SIGTERM to daemon pid {}", record.pid);
}

int runDaemon(DaemonConfig & config, SystemProcessInspector & inspector, sigset_t signals) {
    auto logger = spdlog::get("logger");
    DaemonIdentity identity{config.identityPath(), &inspector, MAILCACHE_VERSION};

    IdentityCheckOutcome outcome = identity.selfCheck(config.restartGraceMs);
    if (outcome == IdentityCheckOutcome::AlreadyRunning) {
        logger->info("A daemon of this version is already running, exiting");
        return 0;
    }

    logger->info("------------- Starting MailCache {} ({}) ---------------", MAILCACHE_VERSION, IdentityCheckOutcomeName(outcome));
    logger->info("Config: {}", config.toJSON().dump());

    // An invalid accounts file must fail before the identity file names us.
    std::vector<std::shared_ptr<Account>> accounts = config.loadAccounts();
    identity.write();

    Daemon daemon{config, accounts, [](std::shared_ptr<Account> account) {
        return std::make_shared<IMAPRemoteSession>(account);
    }, &inspector};
    daemon.requestStopOnSignal(signals);

    IPCServer server{&daemon, config.socketPath};
    daemon.start();
    server.start();

    daemon.waitForStopRequest();

    server.stop();
    daemon.stop();
    identity.removeIfOwned();
    logger->info("------------- MailCache stopped ---------------");
    return 0;
}

int main(int argc, const char * argv[]) {
    // SIGTERM and SIGINT are collected by a sigwait thread in daemon mode.
    // Blocking them before the first thread is created (the log flusher
    // among them) keeps every thread from taking the default action.
    sigset_t signals = BlockStopSignals();
    SetThreadName("main");

    // initialize the stanford exception handler
    exceptions::setProgramNameForStackTrace(argv[0]);
    exceptions::setTopLevelExceptionHandlerEnabled(true);

    // parse launch arguments, skip program name argv[0] if present
    argc-=(argc>0); argv+=(argc>0);
    option::Stats  stats(usage, argc, argv);
    option::Option options[20], buffer[20];
    option::Parser parse(usage, argc, argv, options, buffer);

    if (parse.error())
        return 1;

    if (options[HELP] || argc == 0 || !options[MODE]) {
        option::printUsage(std::cout, usage);
        return 1;
    }

    // check required environment
    std::string eConfigDirPath = MailUtils::getEnvUTF8("CONFIG_DIR_PATH");
    if (eConfigDirPath == "") {
        option::printUsage(std::cout, usage);
        return 1;
    }

    // keep sqlite's temporary files inside the config directory as well
    sqlite3_temp_directory = sqlite3_mprintf("%s", eConfigDirPath.c_str());

    setupLogging(eConfigDirPath, options[ORPHAN] != nullptr, options[VERBOSE] != nullptr);

    std::string mode(options[MODE].arg);
    DaemonConfig config = DaemonConfig::load(eConfigDirPath);
    SystemProcessInspector inspector;

    if (mode != "daemon") {
        // the one-shot modes keep the default Ctrl-C behavior
        pthread_sigmask(SIG_UNBLOCK, &signals, nullptr);
    }

    if (mode == "migrate") {
        return runSingleFunctionAndExit([&](){
            MailStore store(config.databasePath());
            store.migrate();
        });
    }

    if (mode == "reset") {
        if (!options[ACCOUNT] || options[ACCOUNT].arg == nullptr) {
            option::printUsage(std::cout, usage);
            return 1;
        }
        std::string accountId = options[ACCOUNT].arg;
        return runSingleFunctionAndExit([&](){
            MailStore store(config.databasePath());
            store.migrate();
            store.resetForAccount(accountId);
        });
    }

    if (mode == "status") {
        return runSingleFunctionAndExit([&](){
            runStatus(config, inspector);
        });
    }

    if (mode == "stop") {
        return runSingleFunctionAndExit([&](){
            runStop(config, inspector);
        });
    }

    if (mode == "daemon") {
        return runDaemon(config, inspector, signals);
    }

    option::printUsage(std::cout, usage);
    return 1;
}
