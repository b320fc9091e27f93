#include <gtest/gtest.h>
#include "../../agents/login-page-detection/include/config.hpp"
#include <cstdlib>

using json = nlohmann::json;

TEST(ConfigTest, DefaultsForEmptyConfig) {
    LoginPageConfig c = login_page_config_from_json(json::object());
    ASSERT_EQ(c.strategy_scope.size(), 4u);
    EXPECT_EQ(c.strategy_scope[3], Strategy::Crawling);
    EXPECT_FALSE(c.url_regexes.empty());
    EXPECT_EQ(c.robots.max_candidates, 3);
    EXPECT_EQ(c.sitemap.max_sitemap_size, 10 * 1024 * 1024);
    EXPECT_EQ(c.metasearch.search_term, "%s login");
    EXPECT_FALSE(c.store_robots);
}

TEST(ConfigTest, OverridesAndExplicitEmptyRegexes) {
    json cfg = json::parse(R"({
        "login_page_config": {
            "login_page_strategy_scope": ["sitemap", "ROBOTS"],
            "login_page_url_regexes": [],
            "robots_strategy_config": {"max_candidates": 7},
            "sitemap_strategy_config": {"max_recursion_level": 1},
            "metasearch_strategy_config": {"search_engines": ["bing"], "search_results_number": 5}
        },
        "artifacts_config": {"store_robots": true, "store_sitemap": true}
    })");
    LoginPageConfig c = login_page_config_from_json(cfg);
    EXPECT_EQ(c.strategy_scope, (std::vector<Strategy>{Strategy::Sitemap, Strategy::Robots}));
    EXPECT_TRUE(c.url_regexes.empty());
    EXPECT_EQ(c.robots.max_candidates, 7);
    EXPECT_EQ(c.robots.timeout_fetch_robots, 30);
    EXPECT_EQ(c.sitemap.max_recursion_level, 1);
    EXPECT_EQ(c.metasearch.search_engines, (std::vector<std::string>{"bing"}));
    EXPECT_EQ(c.metasearch.search_results_number, 5);
    EXPECT_TRUE(c.store_robots);
    EXPECT_TRUE(c.store_sitemap);
}

TEST(ConfigTest, RejectsWrongShapes) {
    EXPECT_THROW(login_page_config_from_json(json::parse(R"({"login_page_config": []})")), std::invalid_argument);
    EXPECT_THROW(login_page_config_from_json(
                     json::parse(R"({"login_page_config": {"login_page_strategy_scope": ["TELEPATHY"]}})")),
                 std::invalid_argument);
    EXPECT_THROW(login_page_config_from_json(
                     json::parse(R"({"login_page_config": {"robots_strategy_config": {"max_candidates": "x"}}})")),
                 json::exception);
}

TEST(ConfigTest, WorkerEnvironment) {
    ::setenv("QUEUE_NAME", "landscape_analysis_treq", 1);
    ::setenv("TASK_TIMEOUT_S", "120", 1);
    ::setenv("ORACLE_MODE", "CHAT", 1);
    ::setenv("ORACLE_NO_SAVE", "false", 1);
    WorkerConfig c = load_worker_config();
    EXPECT_EQ(c.analysis(), "landscape_analysis");
    EXPECT_EQ(c.task_timeout_s, 120);
    EXPECT_EQ(c.oracle.mode, "chat");
    EXPECT_FALSE(c.oracle.no_save);
    EXPECT_EQ(c.collector_retry_s, 5);
    ::unsetenv("QUEUE_NAME");
    ::unsetenv("TASK_TIMEOUT_S");
    ::unsetenv("ORACLE_MODE");
    ::unsetenv("ORACLE_NO_SAVE");

    c.queue_name = "other_queue";
    EXPECT_EQ(c.analysis(), "other_queue");
}
