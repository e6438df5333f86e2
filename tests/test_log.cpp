#include <gtest/gtest.h>
#include <core/log.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

class LogTest : public ::testing::Test {
protected:
    fs::path path = fs::temp_directory_path() / "sshkit_log_test.log";
    std::string previous;

    void SetUp() override {
        previous = sshkit_log_path();
        fs::remove(path);
        set_log_path(path.string());
    }

    void TearDown() override {
        set_log_path(previous);
        fs::remove(path);
    }

    std::string contents() {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST_F(LogTest, DefaultsToTempDir) {
    EXPECT_EQ(fs::path(previous).filename().string(), "sshkit_debug.log");
}

TEST_F(LogTest, WritesTimestampedLines) {
    sshkit_log("first");
    sshkit_log("second");

    std::string text = contents();
    ASSERT_NE(text.find("] first\n"), std::string::npos);
    ASSERT_NE(text.find("] second\n"), std::string::npos);
    EXPECT_EQ(text[0], '[');
    EXPECT_EQ(text[3], ':');
    EXPECT_EQ(text[9], '.');
}

TEST_F(LogTest, TagsErrorKind) {
    sshkit_log(SSHError::HANDSHAKE, "kex failed");
    EXPECT_NE(contents().find("[handshake] kex failed"), std::string::npos);
}

TEST_F(LogTest, EmptyPathKeepsCurrent) {
    set_log_path("");
    EXPECT_EQ(sshkit_log_path(), path.string());
}

TEST_F(LogTest, CommandResultSummary) {
    SSHResult r;
    r.exit_code = 2;
    r.stdout_data = "out";
    r.stderr_data = "err";
    sshkit_log_ssh("host:22", "ls", r);

    std::string text = contents();
    EXPECT_NE(text.find("host:22 CMD: ls"), std::string::npos);
    EXPECT_NE(text.find("exit=2 signal=- stdout(3)=out"), std::string::npos);
    EXPECT_NE(text.find("stderr(3)=err"), std::string::npos);
}
