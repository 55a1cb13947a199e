#include <gtest/gtest.h>
#include <fstream>

#include "mailcache/daemon_identity.hpp"
#include "FakeProcessInspector.hpp"
#include "TestSupport.hpp"

class DaemonIdentityTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = makeScratchDir();
        path = dir + "/mailcache.pid";
    }

    void TearDown() override {
        removeScratchDir(dir);
    }

    void writeFile(std::string contents) {
        std::ofstream out(path, std::ios::trunc);
        out << contents;
    }

    bool fileExists() {
        std::ifstream in(path);
        return in.good();
    }

    std::string dir;
    std::string path;
    FakeProcessInspector inspector;
};

TEST_F(DaemonIdentityTest, ProceedsWithoutIdentityFile) {
    DaemonIdentity identity{path, &inspector, "1.0.0"};
    EXPECT_EQ(identity.selfCheck(100), IdentityCheckOutcome::Proceed);
}

TEST_F(DaemonIdentityTest, WriteThenRead) {
    DaemonIdentity identity{path, &inspector, "1.0.0"};
    identity.write();

    DaemonIdentityRecord record;
    ASSERT_TRUE(identity.read(record));
    EXPECT_EQ(record.pid, 1000);
    EXPECT_EQ(record.version, "1.0.0");
}

TEST_F(DaemonIdentityTest, MalformedFileIsIgnored) {
    writeFile("not a pid file");
    DaemonIdentity identity{path, &inspector, "1.0.0"};
    DaemonIdentityRecord record;
    EXPECT_FALSE(identity.read(record));
    EXPECT_EQ(identity.selfCheck(100), IdentityCheckOutcome::Proceed);

    writeFile("abc:1.0.0");
    EXPECT_FALSE(identity.read(record));
}

TEST_F(DaemonIdentityTest, DeadOwnerIsIgnored) {
    writeFile("2000:0.9.0\n");
    DaemonIdentity identity{path, &inspector, "1.0.0"};
    EXPECT_EQ(identity.selfCheck(100), IdentityCheckOutcome::Proceed);
    EXPECT_TRUE(inspector.terminated.empty());
}

TEST_F(DaemonIdentityTest, SameVersionAlreadyRunning) {
    inspector.running.insert(2000);
    writeFile("2000:1.0.0\n");
    DaemonIdentity identity{path, &inspector, "1.0.0"};

    EXPECT_EQ(identity.selfCheck(100), IdentityCheckOutcome::AlreadyRunning);
    EXPECT_TRUE(inspector.terminated.empty());
}

TEST_F(DaemonIdentityTest, OtherVersionIsReplaced) {
    inspector.running.insert(2000);
    writeFile("2000:0.9.0\n");
    DaemonIdentity identity{path, &inspector, "1.0.0"};

    EXPECT_EQ(identity.selfCheck(100), IdentityCheckOutcome::ReplacedStale);
    EXPECT_EQ(inspector.terminated, (std::vector<int>{2000}));
}

TEST_F(DaemonIdentityTest, ReplacementGivesUpAfterGracePeriod) {
    inspector.exitsOnTerminate = false;
    inspector.running.insert(2000);
    writeFile("2000:0.9.0\n");
    DaemonIdentity identity{path, &inspector, "1.0.0"};

    auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(identity.selfCheck(100), IdentityCheckOutcome::ReplacedStale);
    EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(100));
}

TEST_F(DaemonIdentityTest, RemoveOnlyWhenOwned) {
    writeFile("2000:1.0.0\n");
    DaemonIdentity identity{path, &inspector, "1.0.0"};
    EXPECT_FALSE(identity.removeIfOwned());
    EXPECT_TRUE(fileExists());

    identity.write();
    EXPECT_TRUE(identity.removeIfOwned());
    EXPECT_FALSE(fileExists());
}

TEST(IdentityCheckOutcomeTest, Names) {
    EXPECT_EQ(IdentityCheckOutcomeName(IdentityCheckOutcome::ReplacedStale), "replaced-stale");
    EXPECT_EQ(IdentityCheckOutcomeName(IdentityCheckOutcome::AlreadyRunning), "already-running");
}
