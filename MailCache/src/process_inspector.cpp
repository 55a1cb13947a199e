#include "mailcache/process_inspector.hpp"

#include <errno.h>
#include <signal.h>
#include <unistd.h>

#include <fstream>
#include <sstream>
#include <vector>

#include "spdlog/spdlog.h"

SystemProcessInspector::SystemProcessInspector(std::string procRoot) :
    _procRoot(procRoot)
{
}

std::string SystemProcessInspector::readProcFile(int pid, std::string name) {
    std::string path = _procRoot + "/" + (pid == 0 ? std::string("self") : std::to_string(pid)) + "/" + name;
    std::ifstream in(path);
    if (!in.good()) {
        return "";
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

int SystemProcessInspector::currentPid() {
    return (int)getpid();
}

int64_t SystemProcessInspector::startFingerprint(int pid) {
    if (pid <= 0) {
        return 0;
    }
    std::string stat = readProcFile(pid, "stat");

    // The command name is wrapped in parens and may itself contain spaces
    // or parens, so fields are counted from the last ')'. starttime is field
    // 22 overall, the 20th after the command.
    size_t close = stat.rfind(')');
    if (close == std::string::npos) {
        return 0;
    }
    std::istringstream fields(stat.substr(close + 1));
    std::string field;
    for (int ii = 0; ii < 20; ii ++) {
        if (!(fields >> field)) {
            return 0;
        }
    }
    try {
        return std::stoll(field);
    } catch (std::exception & ex) {
        spdlog::get("logger")->warn("Could not parse start time of process {}: {}", pid, ex.what());
        return 0;
    }
}

bool SystemProcessInspector::isOwnProcessFamily(int pid) {
    if (pid <= 0) {
        return false;
    }
    std::string mine = readProcFile(0, "comm");
    std::string theirs = readProcFile(pid, "comm");
    return mine != "" && mine == theirs;
}

bool SystemProcessInspector::isRunning(int pid) {
    if (pid <= 0) {
        return false;
    }
    if (kill(pid, 0) == 0) {
        return true;
    }
    // EPERM means the process exists but belongs to someone else
    return errno == EPERM;
}

bool SystemProcessInspector::terminate(int pid) {
    if (pid <= 0) {
        return false;
    }
    return kill(pid, SIGTERM) == 0;
}
