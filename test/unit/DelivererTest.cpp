#include <gtest/gtest.h>
#include "Fakes.h"
#include "../../agents/login-page-detection/include/deliverer.hpp"

using json = nlohmann::json;

namespace {
WorkerConfig test_config() {
    WorkerConfig cfg;
    cfg.collector_url = "http://collector/api/login_candidates";
    cfg.brain_url = "http://brain:8080/";
    cfg.brain_user = "worker";
    cfg.brain_password = "s3cret";
    cfg.collector_retry_s = 5;
    cfg.callback_retry_s = 60;
    return cfg;
}

Task completed_task(const std::string& reply_to = "") {
    json j = {{"domain", "example.com"}, {"task_config", {{"task_id", "t-1"}}}};
    if (!reply_to.empty()) j["task_config"]["reply_to"] = reply_to;
    Task t = task_from_json(j, "landscape_analysis");
    AnalysisResult r;
    r.resolved = {"https://example.com/", "example.com"};
    Candidate a;
    a.url = "https://example.com/login";
    a.strategy = Strategy::Robots;
    a.info = RobotsInfo{"/login", "disallow"};
    Candidate b = a;
    b.url = " https://example.com/login ";
    b.strategy = Strategy::Metasearch;
    b.info = MetasearchInfo{};
    r.candidates = {a, b};
    t.result = r;
    return t;
}

struct Sleeps {
    std::vector<long> seconds;
    ResultDeliverer::SleepFn fn() {
        return [this](std::chrono::seconds s) { seconds.push_back((long)s.count()); };
    }
};
}

TEST(DelivererTest, CollectorRetriedOnceThenCallback) {
    int collector_calls = 0;
    FakeTransport http([&](const HttpRequest& req) {
        if (req.url == "http://collector/api/login_candidates") {
            return make_response(++collector_calls == 1 ? 500 : 200, "busy");
        }
        return make_response(200);
    });
    Sleeps sleeps;
    WorkerConfig cfg = test_config();
    ResultDeliverer deliverer(cfg, http, sleeps.fn());
    Task task = completed_task();

    DeliveryReceipt receipt = deliverer.deliver(task, "/tasks/t-1");
    EXPECT_TRUE(receipt.collector_ok);
    EXPECT_EQ(receipt.collector_attempts, 2);
    EXPECT_EQ(*task.api_status, 200);
    EXPECT_FALSE(task.api_error.has_value());
    EXPECT_EQ(sleeps.seconds, (std::vector<long>{5}));

    auto reqs = http.requests();
    ASSERT_EQ(reqs.size(), 3u);
    json payload = json::parse(reqs[1].body);
    EXPECT_EQ(payload["task_id"], "t-1");
    ASSERT_EQ(payload["candidates"].size(), 1u);
    EXPECT_EQ(payload["candidates"][0]["id"], 1);
    EXPECT_EQ(payload["candidates"][0]["url"], "https://example.com/login");
    EXPECT_TRUE(payload["candidates"][0]["actions"].is_null());
    EXPECT_EQ(payload["candidates"][0]["scan_domain"], "example.com");

    const HttpRequest& put = reqs[2];
    EXPECT_EQ(put.method, "PUT");
    EXPECT_EQ(put.url, "http://brain:8080/tasks/t-1");
    EXPECT_EQ(put.user, "worker");
    EXPECT_EQ(put.password, "s3cret");
    EXPECT_TRUE(receipt.callback_sent);
    EXPECT_EQ(receipt.callback_attempts, 1);

    json sent = json::parse(put.body);
    EXPECT_EQ(sent["task_config"]["task_state"], "RESPONSE_SENT");
    EXPECT_EQ(sent["api_status"], 200);
    EXPECT_EQ(*task.task_config.task_state, TaskState::ResponseSent);
}

TEST(DelivererTest, CollectorFailureRecordedOnTask) {
    FakeTransport http([](const HttpRequest& req) -> HttpResponse {
        if (req.method == "POST") throw std::runtime_error("Couldn't connect to server");
        return make_response(200);
    });
    Sleeps sleeps;
    ResultDeliverer deliverer(test_config(), http, sleeps.fn());
    Task task = completed_task("/tasks/t-1");

    DeliveryReceipt receipt = deliverer.deliver(task, "");
    EXPECT_FALSE(receipt.collector_ok);
    EXPECT_EQ(receipt.collector_attempts, 2);
    EXPECT_EQ(*task.api_status, 0);
    EXPECT_EQ(*task.api_error, "Couldn't connect to server");

    // the callback still goes out, carrying the failure
    EXPECT_TRUE(receipt.callback_sent);
    json sent = json::parse(http.requests().back().body);
    EXPECT_EQ(sent["api_status"], 0);
    EXPECT_EQ(sent["api_error"], "Couldn't connect to server");
}

TEST(DelivererTest, CollectorHttpErrorKeepsBody) {
    FakeTransport http([](const HttpRequest& req) {
        if (req.method == "POST") return make_response(422, "bad candidates");
        return make_response(200);
    });
    Sleeps sleeps;
    ResultDeliverer deliverer(test_config(), http, sleeps.fn());
    Task task = completed_task();
    deliverer.deliver(task, "");
    EXPECT_EQ(*task.api_status, 422);
    EXPECT_EQ(*task.api_error, "HTTP 422: bad candidates");
}

TEST(DelivererTest, CallbackRetriedUntilAccepted) {
    int puts = 0;
    FakeTransport http([&](const HttpRequest& req) -> HttpResponse {
        if (req.method == "POST") return make_response(200);
        ++puts;
        if (puts == 2) throw std::runtime_error("Connection reset");
        return make_response(puts < 4 ? 503 : 200);
    });
    Sleeps sleeps;
    ResultDeliverer deliverer(test_config(), http, sleeps.fn());
    Task task = completed_task();

    DeliveryReceipt receipt = deliverer.deliver(task, "tasks/t-1");
    EXPECT_TRUE(receipt.callback_sent);
    EXPECT_EQ(receipt.callback_attempts, 4);
    EXPECT_EQ(receipt.callback_status, 200);
    EXPECT_EQ(sleeps.seconds, (std::vector<long>{60, 60, 60}));
    EXPECT_EQ(http.requests().back().url, "http://brain:8080/tasks/t-1");
}

TEST(DelivererTest, PropertyReplyToWins) {
    FakeTransport http([](const HttpRequest&) { return make_response(200); });
    Sleeps sleeps;
    ResultDeliverer deliverer(test_config(), http, sleeps.fn());
    Task task = completed_task("/from/body");
    deliverer.deliver(task, "/from/property");
    EXPECT_EQ(http.requests().back().url, "http://brain:8080/from/property");
}

TEST(DelivererTest, NoReplyToSkipsCallback) {
    FakeTransport http([](const HttpRequest&) { return make_response(200); });
    Sleeps sleeps;
    ResultDeliverer deliverer(test_config(), http, sleeps.fn());
    Task task = completed_task();

    DeliveryReceipt receipt = deliverer.deliver(task, "");
    EXPECT_TRUE(receipt.collector_ok);
    EXPECT_FALSE(receipt.callback_sent);
    EXPECT_EQ(receipt.callback_attempts, 0);
    EXPECT_EQ(http.requests().size(), 1u);
}

TEST(DelivererTest, ExceptionResultSendsEmptyList) {
    FakeTransport http([](const HttpRequest&) { return make_response(200); });
    Sleeps sleeps;
    ResultDeliverer deliverer(test_config(), http, sleeps.fn());
    Task task = completed_task();
    task.result = AnalysisResult::failure("Process timeout");

    deliverer.deliver(task, "/tasks/t-1");
    auto reqs = http.requests();
    json payload = json::parse(reqs[0].body);
    EXPECT_TRUE(payload["candidates"].empty());
    json sent = json::parse(reqs[1].body);
    EXPECT_EQ(sent["landscape_analysis_result"], json::parse(R"({"exception": "Process timeout"})"));
}
