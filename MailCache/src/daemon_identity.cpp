#include "mailcache/daemon_identity.hpp"
#include "mailcache/sync_exception.hpp"

#include <chrono>
#include <fstream>
#include <stdexcept>
#include <stdio.h>
#include <thread>

std::string IdentityCheckOutcomeName(IdentityCheckOutcome outcome) {
    switch (outcome) {
        case IdentityCheckOutcome::Proceed: return "proceed";
        case IdentityCheckOutcome::AlreadyRunning: return "already-running";
        case IdentityCheckOutcome::ReplacedStale: return "replaced-stale";
    }
    return "unknown";
}

DaemonIdentity::DaemonIdentity(std::string path, ProcessInspector * inspector, std::string version) :
    _path(path), _inspector(inspector), _version(version), logger(spdlog::get("logger"))
{
}

bool DaemonIdentity::read(DaemonIdentityRecord & record) {
    std::ifstream in(_path);
    if (!in.good()) {
        return false;
    }
    std::string line;
    std::getline(in, line);

    size_t sep = line.find(':');
    if (sep == std::string::npos || sep == 0) {
        return false;
    }
    try {
        record.pid = std::stoi(line.substr(0, sep));
    } catch (std::logic_error & ex) {
        return false;
    }
    record.version = line.substr(sep + 1);
    return true;
}

void DaemonIdentity::write() {
    std::ofstream out(_path, std::ios::trunc);
    if (!out.good()) {
        throw SyncException("identity-write-failed", "Could not write " + _path, false);
    }
    out << _inspector->currentPid() << ":" << _version << "\n";
}

bool DaemonIdentity::removeIfOwned() {
    DaemonIdentityRecord record;
    if (!read(record) || record.pid != _inspector->currentPid()) {
        return false;
    }
    return ::remove(_path.c_str()) == 0;
}

IdentityCheckOutcome DaemonIdentity::selfCheck(int graceMs) {
    DaemonIdentityRecord record;
    if (!read(record)) {
        return IdentityCheckOutcome::Proceed;
    }
    if (record.pid == _inspector->currentPid() || !_inspector->isRunning(record.pid)) {
        logger->info("Ignoring identity file left by pid {} ({})", record.pid, record.version);
        return IdentityCheckOutcome::Proceed;
    }
    if (record.version == _version) {
        logger->info("Daemon {} is already running as pid {}", _version, record.pid);
        return IdentityCheckOutcome::AlreadyRunning;
    }

    logger->warn("Daemon {} (pid {}) does not match this build ({}), stopping it", record.version, record.pid, _version);
    if (!_inspector->terminate(record.pid)) {
        logger->warn("Could not signal pid {}", record.pid);
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(graceMs);
    while (_inspector->isRunning(record.pid)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            logger->warn("pid {} is still running after {}ms, continuing anyway", record.pid, graceMs);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(25));
    }
    return IdentityCheckOutcome::ReplacedStale;
}
