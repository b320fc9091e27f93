#include <gtest/gtest.h>
#include "Fakes.h"
#include "../../agents/login-page-detection/include/screenshot.hpp"
#include <chrono>
#include <thread>

namespace {
// The script sees: $1=<url> $2=<output png>
std::vector<std::string> shell(const std::string& script) {
    return {"/bin/sh", "-c", script, "sh"};
}
}

TEST(ScreenshotTest, ReturnsWrittenFile) {
    TempDir tmp;
    CommandScreenshotter shots(shell("test \"$1\" = https://example.com/login && printf png > \"$2\""),
                               (tmp.path() / "shots").string(), std::chrono::seconds(10));
    std::string path = shots.capture("https://example.com/login");
    EXPECT_EQ(path.find((tmp.path() / "shots").string()), 0u);
    EXPECT_NE(path.find("example.com_login_"), std::string::npos);
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST(ScreenshotTest, FailsWithoutFile) {
    TempDir tmp;
    CommandScreenshotter shots(shell("exit 0"), tmp.path().string(), std::chrono::seconds(10));
    EXPECT_THROW(shots.capture("https://example.com/"), std::runtime_error);
    CommandScreenshotter failing(shell("printf png > \"$2\"; exit 3"), tmp.path().string(), std::chrono::seconds(10));
    EXPECT_THROW(failing.capture("https://example.com/"), std::runtime_error);
}

TEST(ScreenshotTest, TimeoutKillsBrowserLeftBehind) {
    TempDir tmp;
    std::filesystem::path pid_file = tmp.path() / "browser.pid";
    // stands in for a browser launched by the screenshot script
    CommandScreenshotter shots(shell("sleep 37 & echo $! > '" + pid_file.string() + "'; wait"),
                               (tmp.path() / "shots").string(), std::chrono::seconds(1));

    EXPECT_THROW(shots.capture("https://example.com/login"), std::runtime_error);
    long browser = read_pid_file(pid_file);
    ASSERT_GT(browser, 0);
    for (int i = 0; i < 20 && process_alive(browser); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    EXPECT_FALSE(process_alive(browser));
}
