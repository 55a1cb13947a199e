#include <gtest/gtest.h>
#include <fstream>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "mailcache/process_inspector.hpp"
#include "TestSupport.hpp"

TEST(SystemProcessInspectorTest, DescribesCurrentProcess) {
    SystemProcessInspector inspector;
    int pid = inspector.currentPid();
    EXPECT_EQ(pid, (int)getpid());
    EXPECT_TRUE(inspector.isRunning(pid));
    EXPECT_GT(inspector.startFingerprint(pid), 0);
    EXPECT_TRUE(inspector.isOwnProcessFamily(pid));
    EXPECT_FALSE(inspector.isRunning(0));
    EXPECT_EQ(inspector.startFingerprint(-1), 0);
}

TEST(SystemProcessInspectorTest, TerminatesChild) {
    pid_t child = fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
        pause();
        _exit(0);
    }

    SystemProcessInspector inspector;
    EXPECT_TRUE(inspector.isRunning(child));
    EXPECT_TRUE(inspector.isOwnProcessFamily(child));
    EXPECT_TRUE(inspector.terminate(child));

    int status = 0;
    ASSERT_EQ(waitpid(child, &status, 0), child);
    EXPECT_TRUE(WIFSIGNALED(status));
    EXPECT_FALSE(inspector.isRunning(child));
    EXPECT_EQ(inspector.startFingerprint(child), 0);
}

TEST(SystemProcessInspectorTest, ParsesStartTimeAfterCommandName) {
    std::string dir = makeScratchDir();
    system(("mkdir -p " + dir + "/4242").c_str());
    {
        std::ofstream out(dir + "/4242/stat");
        out << "4242 (odd) name (x) S 1 4242 4242 0 -1 4194560 100 0 0 0 1 2 0 0 20 0 1 0 987654 1000 10\n";
    }

    SystemProcessInspector inspector{dir};
    EXPECT_EQ(inspector.startFingerprint(4242), 987654);
    EXPECT_EQ(inspector.startFingerprint(4243), 0);
    removeScratchDir(dir);
}
