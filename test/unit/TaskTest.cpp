#include <gtest/gtest.h>
#include "../../agents/login-page-detection/include/task.hpp"

using json = nlohmann::json;

namespace {
json sample_task() {
    return json::parse(R"({
        "domain": "example.com",
        "scan_config": {"domain": "scan.example.com", "depth": 2},
        "landscape_analysis_config": {"login_page_config": {"login_page_strategy_scope": ["ROBOTS"]}},
        "landscape_analysis_result": {"stale": true},
        "task_config": {"task_id": "t-1", "reply_to": "/tasks/t-1", "task_state": "RECEIVED",
                        "task_timestamp_request_received": 1.5, "priority": "high"},
        "api_status": 500,
        "owner": "scheduler"
    })");
}
}

TEST(TaskTest, StrategyNames) {
    EXPECT_EQ(strategy_name(Strategy::Metasearch), "METASEARCH");
    EXPECT_EQ(strategy_from_name(" crawling "), Strategy::Crawling);
    EXPECT_THROW(strategy_from_name("GUESSING"), std::invalid_argument);
}

TEST(TaskTest, ParsesAndKeepsUnknownFields) {
    Task t = task_from_json(sample_task(), "landscape_analysis");
    EXPECT_EQ(t.domain, "example.com");
    EXPECT_EQ(t.analysis, "landscape_analysis");
    EXPECT_EQ(t.task_config.task_id, "t-1");
    EXPECT_EQ(*t.task_config.reply_to, "/tasks/t-1");
    EXPECT_EQ(*t.task_config.task_state, TaskState::Received);
    EXPECT_EQ(t.scan_domain(), "scan.example.com");
    EXPECT_FALSE(t.result.has_value());
    EXPECT_FALSE(t.api_status.has_value());

    json back = task_to_json(t);
    EXPECT_EQ(back["owner"], "scheduler");
    EXPECT_EQ(back["scan_config"]["depth"], 2);
    EXPECT_EQ(back["task_config"]["priority"], "high");
    EXPECT_EQ(back["task_config"]["task_timestamp_request_received"], 1.5);
    EXPECT_EQ(back["landscape_analysis_config"]["login_page_config"]["login_page_strategy_scope"][0], "ROBOTS");
    EXPECT_EQ(back["landscape_analysis_result"], json::object());
    EXPECT_FALSE(back.contains("api_status"));
}

TEST(TaskTest, RejectsTasksWithoutDomain) {
    EXPECT_THROW(task_from_json(json::parse(R"({"task_config": {}})"), "landscape_analysis"), std::invalid_argument);
    EXPECT_THROW(task_from_json(json::parse(R"({"domain": ""})"), "landscape_analysis"), std::invalid_argument);
    EXPECT_THROW(task_from_json(json::array(), "landscape_analysis"), std::invalid_argument);
    EXPECT_THROW(task_from_json(json::parse(R"({"domain": "a.com", "task_config": 3})"), "landscape_analysis"),
                 std::invalid_argument);
}

TEST(TaskTest, ScanDomainFallsBackToDomain) {
    Task t = task_from_json(json::parse(R"({"domain": "example.com", "scan_config": {"domain": ""}})"), "x");
    EXPECT_EQ(t.scan_domain(), "example.com");
}

TEST(TaskTest, TransitionsAreTimestamped) {
    Task t = task_from_json(sample_task(), "landscape_analysis");
    t.transition(TaskState::Running, 10.0);
    t.transition(TaskState::TimedOut, 20.0);
    json tc = task_to_json(t)["task_config"];
    EXPECT_EQ(tc["task_state"], "TIMED_OUT");
    EXPECT_EQ(tc["task_timestamp_running"], 10.0);
    EXPECT_EQ(tc["task_timestamp_timed_out"], 20.0);
}

TEST(TaskTest, FailureResultIsOnlyTheMarker) {
    Task t = task_from_json(sample_task(), "landscape_analysis");
    t.result = AnalysisResult::failure(kTimeoutMarker);
    t.api_status = 0;
    t.api_error = std::string("connection refused");
    json j = task_to_json(t);
    EXPECT_EQ(j["landscape_analysis_result"], json::parse(R"({"exception": "Process timeout"})"));
    EXPECT_EQ(j["api_status"], 0);
    EXPECT_EQ(j["api_error"], "connection refused");
}

TEST(TaskTest, ResultWireFormat) {
    AnalysisResult r;
    r.resolved = {"https://example.com/", "example.com"};
    Candidate robots;
    robots.url = "https://example.com/login";
    robots.strategy = Strategy::Robots;
    robots.priority = Priority{5, std::string("log-?in")};
    robots.info = RobotsInfo{"/login", "disallow"};
    r.candidates.push_back(robots);

    Candidate crawl;
    crawl.url = "https://example.com/account";
    crawl.strategy = Strategy::Crawling;
    crawl.info = CrawlingInfo{2, 1, "/out/flow_2/page_1.png"};
    CrawlPath path;
    path.select_options = json::array({"en"});
    CrawlAction a;
    a.step = 1;
    a.click_position = ClickPoint{5, 6};
    a.element_html = std::string("<button>Login</button>");
    a.url = "https://example.com/";
    path.clicks.push_back(a);
    crawl.actions = path;
    r.candidates.push_back(crawl);
    r.strategy_errors.push_back({Strategy::Metasearch, "searxng down"});

    json j = r;
    EXPECT_EQ(j["resolved"]["domain"], "example.com");
    const json& c0 = j["login_page_candidates"][0];
    EXPECT_EQ(c0["login_page_candidate"], "https://example.com/login");
    EXPECT_EQ(c0["login_page_strategy"], "ROBOTS");
    EXPECT_EQ(c0["login_page_priority"]["priority"], 5);
    EXPECT_EQ(c0["login_page_info"]["stm"], "disallow");
    EXPECT_FALSE(c0.contains("login_page_actions"));

    const json& c1 = j["login_page_candidates"][1];
    EXPECT_TRUE(c1["login_page_priority"].is_null());
    EXPECT_EQ(c1["login_page_actions"][0]["selectOptions"][0], "en");
    EXPECT_EQ(c1["login_page_actions"][1]["clickPosition"]["x"], 5);
    EXPECT_EQ(j["login_page_strategy_errors"][0]["strategy"], "METASEARCH");
    EXPECT_FALSE(j.contains("robots"));

    AnalysisResult back = analysis_result_from_json(j);
    ASSERT_EQ(back.candidates.size(), 2u);
    EXPECT_EQ(back.candidates[1].actions->clicks[0].element_html, a.element_html);
    EXPECT_EQ(std::get<CrawlingInfo>(back.candidates[1].info).flow, 2);
    EXPECT_EQ(back.strategy_errors[0].error, "searxng down");
}
