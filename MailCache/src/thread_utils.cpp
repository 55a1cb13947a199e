#include "mailcache/thread_utils.hpp"
#include <spdlog/details/os.h>

#include <map>
#include <mutex>
#include <thread>

#include <pthread.h>

static std::map<size_t, std::string> names{};
static std::mutex namesMtx;

void SetThreadName(const char* threadName)
{
    {
        std::lock_guard<std::mutex> lock(namesMtx);
        names[spdlog::details::os::thread_id()] = threadName;
    }
#ifdef __APPLE__
    pthread_setname_np(threadName);
#else
    // linux limits thread names to 16 bytes including the terminator
    std::string truncated = std::string(threadName).substr(0, 15);
    pthread_setname_np(pthread_self(), truncated.c_str());
#endif
}

std::string GetThreadName(size_t spdlog_thread_id)
{
    std::lock_guard<std::mutex> lock(namesMtx);
    auto it = names.find(spdlog_thread_id);
    if (it == names.end()) {
        return std::to_string(spdlog_thread_id);
    }
    return it->second;
}

sigset_t BlockStopSignals()
{
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGINT);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    return signals;
}
