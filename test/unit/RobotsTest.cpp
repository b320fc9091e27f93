#include <gtest/gtest.h>
#include "Fakes.h"
#include "../../agents/login-page-detection/include/robots.hpp"

namespace {
std::vector<PriorityRule> login_rules() {
    return {{"log-?in", 5}, {"auth", 3}, {"account", 2}};
}

FakeTransport robots_server(const std::string& body, long status = 200, const std::string& type = "text/plain") {
    return FakeTransport([=](const HttpRequest& req) {
        if (req.url == "https://example.com/robots.txt") return make_response(status, body, type);
        return make_response(404);
    });
}
}

TEST(RobotsTest, ParsesAllowAndDisallow) {
    const char* txt =
        "User-agent: *\n"
        "Disallow: /login # members only\n"
        "ALLOW : /account/settings\n"
        "Crawl-delay: 10\n"
        "Sitemap: https://example.com/sitemap.xml\n"
        "# Disallow: /commented\n"
        "Disallow: *.php\n"
        "Disallow:\n"
        "Disallow: /sign%20in\n"
        "garbage line\n";
    auto paths = paths_from_robots_txt(txt);
    ASSERT_EQ(paths.size(), 3u);
    EXPECT_EQ(paths[0].stm, "disallow");
    EXPECT_EQ(paths[0].path, "/login");
    EXPECT_EQ(paths[1].stm, "allow");
    EXPECT_EQ(paths[1].path, "/account/settings");
    EXPECT_EQ(paths[2].path, "/sign in");
}

TEST(RobotsTest, HandlesCrlfAndEmptyFile) {
    EXPECT_TRUE(paths_from_robots_txt("").empty());
    auto paths = paths_from_robots_txt("Disallow: /auth\r\nAllow: /x\r\n");
    ASSERT_EQ(paths.size(), 2u);
    EXPECT_EQ(paths[0].path, "/auth");
}

TEST(RobotsTest, CollectsSitemapLines) {
    auto maps = sitemaps_from_robots_txt("sitemap: https://example.com/a.xml\nSitemap:https://example.com/b.xml\n");
    ASSERT_EQ(maps.size(), 2u);
    EXPECT_EQ(maps[1], "https://example.com/b.xml");
}

TEST(RobotsTest, EmitsConfirmedLoginPage) {
    auto http = robots_server("User-agent: *\nDisallow: /login\n");
    FakeScreenshotter shots;
    FakeOracle oracle;
    oracle.login.insert("https://example.com/login");

    RobotsStrategy strategy(RobotsStrategyConfig{}, login_rules(), false, http, shots);
    auto out = strategy.discover({"example.com", "https://example.com/"}, oracle);

    ASSERT_EQ(out.candidates.size(), 1u);
    const Candidate& c = out.candidates[0];
    EXPECT_EQ(c.url, "https://example.com/login");
    EXPECT_EQ(c.strategy, Strategy::Robots);
    ASSERT_TRUE(c.priority.has_value());
    EXPECT_EQ(c.priority->priority, 5);
    EXPECT_EQ(*c.priority->regex, "log-?in");
    const auto& info = std::get<RobotsInfo>(c.info);
    EXPECT_EQ(info.path, "/login");
    EXPECT_EQ(info.stm, "disallow");
    EXPECT_FALSE(out.robots_txt.has_value());
}

TEST(RobotsTest, SkipsZeroPriorityDuplicatesAndNegatives) {
    auto http = robots_server(
        "Disallow: /private\n"
        "Disallow: /login\n"
        "Allow: /login\n"
        "Disallow: /auth\n");
    FakeScreenshotter shots;
    FakeOracle oracle; // nothing is a login page

    RobotsStrategy strategy(RobotsStrategyConfig{}, login_rules(), true, http, shots);
    auto out = strategy.discover({"example.com", "https://example.com/"}, oracle);

    EXPECT_TRUE(out.candidates.empty());
    EXPECT_EQ(shots.captured, (std::vector<std::string>{"https://example.com/login", "https://example.com/auth"}));
    ASSERT_TRUE(out.robots_txt.has_value());
}

TEST(RobotsTest, SortsByPriorityAndTruncates) {
    auto http = robots_server(
        "Disallow: /account\n"
        "Disallow: /auth\n"
        "Disallow: /login\n"
        "Disallow: /account/login\n");
    FakeScreenshotter shots;
    FakeOracle oracle;
    for (const char* p : {"/account", "/auth", "/login", "/account/login"}) {
        oracle.login.insert(std::string("https://example.com") + p);
    }

    RobotsStrategyConfig cfg;
    cfg.max_candidates = 3;
    RobotsStrategy strategy(cfg, login_rules(), false, http, shots);
    auto out = strategy.discover({"example.com", "https://example.com/"}, oracle);

    ASSERT_EQ(out.candidates.size(), 3u);
    EXPECT_EQ(out.candidates[0].url, "https://example.com/login");
    EXPECT_EQ(out.candidates[1].url, "https://example.com/account/login");
    EXPECT_EQ(out.candidates[2].url, "https://example.com/auth");
    for (std::size_t i = 1; i < out.candidates.size(); ++i) {
        EXPECT_GE(out.candidates[i - 1].priority->priority, out.candidates[i].priority->priority);
    }
}

TEST(RobotsTest, OracleFailureSkipsOnlyThatUrl) {
    auto http = robots_server("Disallow: /login\nDisallow: /auth\nDisallow: /account\n");
    FakeScreenshotter shots;
    shots.failing.insert("https://example.com/account");
    FakeOracle oracle;
    oracle.broken.insert("https://example.com/login");
    oracle.login.insert("https://example.com/auth");
    oracle.login.insert("https://example.com/account");

    RobotsStrategy strategy(RobotsStrategyConfig{}, login_rules(), false, http, shots);
    auto out = strategy.discover({"example.com", "https://example.com/"}, oracle);
    ASSERT_EQ(out.candidates.size(), 1u);
    EXPECT_EQ(out.candidates[0].url, "https://example.com/auth");
}

TEST(RobotsTest, RequiresPlainTextOk) {
    FakeScreenshotter shots;
    FakeOracle oracle;
    {
        auto http = robots_server("Disallow: /login\n", 200, "text/html; charset=utf-8");
        RobotsStrategy strategy(RobotsStrategyConfig{}, login_rules(), true, http, shots);
        auto out = strategy.discover({"example.com", "https://example.com/"}, oracle);
        EXPECT_TRUE(out.candidates.empty());
        EXPECT_FALSE(out.robots_txt.has_value());
    }
    {
        auto http = robots_server("Disallow: /login\n", 404);
        RobotsStrategy strategy(RobotsStrategyConfig{}, login_rules(), false, http, shots);
        EXPECT_TRUE(strategy.discover({"example.com", "https://example.com/"}, oracle).candidates.empty());
    }
    EXPECT_TRUE(shots.captured.empty());
}

TEST(RobotsTest, FetchesFromResolvedOrigin) {
    FakeTransport http([](const HttpRequest& req) {
        if (req.url == "https://www.example.com:8443/robots.txt") {
            return make_response(200, "Disallow: /login\n", "text/plain");
        }
        return make_response(404);
    });
    FakeScreenshotter shots;
    FakeOracle oracle;
    oracle.login.insert("https://www.example.com:8443/login");
    RobotsStrategy strategy(RobotsStrategyConfig{}, login_rules(), false, http, shots);
    auto out = strategy.discover({"example.com", "https://www.example.com:8443/home?x=1"}, oracle);
    ASSERT_EQ(out.candidates.size(), 1u);
    EXPECT_EQ(http.requests()[0].timeout_ms, 30000);
}
