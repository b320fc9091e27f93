#pragma once
#include "config.hpp"
#include "task.hpp"
#include "../../../shared/cpp/agent_sdk/include/http.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>

struct DeliveryReceipt {
    bool collector_ok{false};
    long collector_status{0}; // 0 = transport error
    std::optional<std::string> collector_error;
    int collector_attempts{0};
    bool callback_sent{false}; // false when the task has no reply-to
    long callback_status{0};
    int callback_attempts{0};
};

class ResultDeliverer {
public:
    using SleepFn = std::function<void(std::chrono::seconds)>;

    ResultDeliverer(const WorkerConfig& cfg, HttpTransport& http, SleepFn sleep = {});

    // POSTs the reconciled candidates to the collector (one retry), records
    // api_status/api_error on the task, then PUTs the task to the callback
    // until it answers 200. reply_to_property wins over task_config.reply_to.
    DeliveryReceipt deliver(Task& task, const std::string& reply_to_property);

private:
    void post_collector(Task& task, DeliveryReceipt& receipt);
    void put_callback(Task& task, const std::string& reply_to, DeliveryReceipt& receipt);

    WorkerConfig cfg_;
    HttpTransport& http_;
    SleepFn sleep_;
};
