#include "../include/queue_client.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

using json = nlohmann::json;

QueueClient::QueueClient(std::string base_url, HttpTransport& transport)
    : base_(std::move(base_url)), transport_(transport) {
    if (!base_.empty() && base_.back() == '/') base_.pop_back();
}

std::optional<Delivery> QueueClient::consume(const std::string& queue) {
    HttpResponse r;
    try {
        r = http_get(transport_, base_ + "/queues/" + url_escape(queue) + "/consume");
    } catch (const std::exception& e) {
        spdlog::warn("[queue-client] consume failed: {}", e.what());
        return std::nullopt;
    }
    if (r.status == 204) return std::nullopt;
    if (r.status < 200 || r.status >= 300) {
        spdlog::warn("[queue-client] consume returned status {}", r.status);
        return std::nullopt;
    }
    auto j = json::parse(r.body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("delivery_tag") || !j["delivery_tag"].is_string()) {
        spdlog::warn("[queue-client] consume returned malformed delivery");
        return std::nullopt;
    }
    Delivery d;
    try {
        d.delivery_tag = j.at("delivery_tag").get<std::string>();
        d.correlation_id = j.value("correlation_id", std::string());
        d.reply_to = j.value("reply_to", std::string());
        d.redelivered = j.value("redelivered", false);
        d.body_json = j.value("body", json::object()).dump();
    } catch (const json::exception& e) {
        spdlog::warn("[queue-client] consume returned malformed delivery: {}", e.what());
        return std::nullopt;
    }
    return d;
}

AckResult QueueClient::settle(const std::string& what, const std::string& delivery_tag, const std::string& url) {
    HttpResponse r;
    try {
        r = http_post_json(transport_, url, "{}");
    } catch (const std::exception& e) {
        spdlog::warn("[queue-client] {} {} failed: {}", what, delivery_tag, e.what());
        return AckResult::Failed;
    }
    if (r.status >= 200 && r.status < 300) return AckResult::Ok;
    if (r.status >= 400 && r.status < 500) {
        spdlog::warn("[queue-client] {} {} rejected with status {}", what, delivery_tag, r.status);
        return AckResult::Rejected;
    }
    spdlog::warn("[queue-client] {} {} returned status {}", what, delivery_tag, r.status);
    return AckResult::Failed;
}

AckResult QueueClient::ack(const std::string& delivery_tag) {
    return settle("ack", delivery_tag, base_ + "/ack/" + url_escape(delivery_tag));
}

AckResult QueueClient::nack(const std::string& delivery_tag, bool requeue) {
    return settle("nack", delivery_tag,
                  base_ + "/nack/" + url_escape(delivery_tag) + (requeue ? "?requeue=1" : "?requeue=0"));
}

bool QueueClient::publish(const std::string& queue, const OutgoingMessage& m, std::string* out_id) {
    json body = json::parse(m.body_json.empty() ? "{}" : m.body_json);
    json j = {{"body", body}};
    if (!m.correlation_id.empty()) j["correlation_id"] = m.correlation_id;
    if (!m.reply_to.empty()) j["reply_to"] = m.reply_to;
    HttpResponse r;
    try {
        r = http_post_json(transport_, base_ + "/queues/" + url_escape(queue) + "/publish", j.dump());
    } catch (const std::exception& e) {
        spdlog::warn("[queue-client] publish failed: {}", e.what());
        return false;
    }
    if (r.status < 200 || r.status >= 300) return false;
    auto reply = json::parse(r.body, nullptr, false);
    if (out_id && !reply.is_discarded() && reply.contains("id")) *out_id = reply["id"].get<std::string>();
    return true;
}
