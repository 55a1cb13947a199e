#ifndef FakeProcessInspector_hpp
#define FakeProcessInspector_hpp

#include <map>
#include <mutex>
#include <set>
#include <vector>

#include "mailcache/process_inspector.hpp"

// Process table under test control. The current process is pid 1000.
class FakeProcessInspector : public ProcessInspector {
    std::mutex mtx;

public:
    int pid = 1000;
    std::map<int, int64_t> fingerprints{{1000, 5000}};
    std::set<int> running{1000};
    std::set<int> family{};
    std::vector<int> terminated{};
    bool exitsOnTerminate = true;

    int currentPid() override {
        return pid;
    }

    int64_t startFingerprint(int p) override {
        std::lock_guard<std::mutex> lck(mtx);
        return fingerprints.count(p) ? fingerprints[p] : 0;
    }

    bool isOwnProcessFamily(int p) override {
        std::lock_guard<std::mutex> lck(mtx);
        return family.count(p) > 0;
    }

    bool isRunning(int p) override {
        std::lock_guard<std::mutex> lck(mtx);
        return running.count(p) > 0;
    }

    bool terminate(int p) override {
        std::lock_guard<std::mutex> lck(mtx);
        terminated.push_back(p);
        if (exitsOnTerminate) {
            running.erase(p);
            fingerprints.erase(p);
        }
        return true;
    }
};

#endif /* FakeProcessInspector_hpp */
