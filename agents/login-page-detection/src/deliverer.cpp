#include "../include/deliverer.hpp"
#include "../include/reconciler.hpp"
#include "../../../shared/cpp/agent_sdk/include/util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <thread>

using json = nlohmann::json;

ResultDeliverer::ResultDeliverer(const WorkerConfig& cfg, HttpTransport& http, SleepFn sleep)
    : cfg_(cfg), http_(http), sleep_(std::move(sleep)) {
    if (!sleep_) sleep_ = [](std::chrono::seconds s) { std::this_thread::sleep_for(s); };
}

DeliveryReceipt ResultDeliverer::deliver(Task& task, const std::string& reply_to_property) {
    DeliveryReceipt receipt;
    post_collector(task, receipt);

    std::string reply_to = reply_to_property;
    if (reply_to.empty() && task.task_config.reply_to) reply_to = *task.task_config.reply_to;
    if (reply_to.empty()) {
        spdlog::warn("[deliverer] task {} has no reply-to, skipping callback", task.task_config.task_id);
        return receipt;
    }
    put_callback(task, reply_to, receipt);
    return receipt;
}

void ResultDeliverer::post_collector(Task& task, DeliveryReceipt& receipt) {
    std::vector<Candidate> raw;
    if (task.result && !task.result->exception) raw = task.result->candidates;
    auto merged = merge_candidates(std::move(raw), task.scan_domain());
    std::string body = collector_payload(merged, task.task_config.task_id).dump();

    for (int attempt = 1; attempt <= 2; ++attempt) {
        receipt.collector_attempts = attempt;
        try {
            HttpResponse r = http_post_json(http_, cfg_.collector_url, body);
            receipt.collector_status = r.status;
            if (r.status == 200) {
                receipt.collector_ok = true;
                receipt.collector_error.reset();
                spdlog::info("[deliverer] sent {} candidates of task {} to collector", merged.size(),
                             task.task_config.task_id);
                break;
            }
            receipt.collector_error = "HTTP " + std::to_string(r.status) + ": " + r.body.substr(0, 512);
        } catch (const std::exception& e) {
            receipt.collector_status = 0;
            receipt.collector_error = e.what();
        }
        spdlog::warn("[deliverer] collector attempt {} for task {} failed: {}", attempt, task.task_config.task_id,
                     *receipt.collector_error);
        if (attempt == 1) sleep_(std::chrono::seconds(cfg_.collector_retry_s));
    }

    task.api_status = receipt.collector_status;
    task.api_error = receipt.collector_error;
}

void ResultDeliverer::put_callback(Task& task, const std::string& reply_to, DeliveryReceipt& receipt) {
    std::string url = cfg_.brain_url;
    while (!url.empty() && url.back() == '/') url.pop_back();
    url += (reply_to.empty() || reply_to[0] != '/') ? "/" + reply_to : reply_to;

    task.transition(TaskState::ResponseSent, unix_now());
    std::string body = task_to_json(task).dump();

    while (true) {
        ++receipt.callback_attempts;
        try {
            HttpResponse r = http_put_json(http_, url, body, cfg_.brain_user, cfg_.brain_password);
            receipt.callback_status = r.status;
            if (r.status == 200) {
                receipt.callback_sent = true;
                spdlog::info("[deliverer] replied task {} to {}", task.task_config.task_id, url);
                return;
            }
            spdlog::warn("[deliverer] callback {} returned {}, retrying in {}s", url, r.status, cfg_.callback_retry_s);
        } catch (const std::exception& e) {
            receipt.callback_status = 0;
            spdlog::warn("[deliverer] callback {} failed: {}, retrying in {}s", url, e.what(), cfg_.callback_retry_s);
        }
        sleep_(std::chrono::seconds(cfg_.callback_retry_s));
    }
}
