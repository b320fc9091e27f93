#pragma once
#include "http.hpp"
#include <string>
#include <optional>

struct Delivery {
    std::string delivery_tag;
    std::string correlation_id;
    std::string reply_to;
    bool redelivered{false};
    std::string body_json; // raw JSON string
};

// Rejected: the broker refused the tag (4xx); retrying cannot succeed.
// Failed: transport error or 5xx; worth retrying.
enum class AckResult { Ok, Rejected, Failed };

struct OutgoingMessage {
    std::string body_json;
    std::string correlation_id;
    std::string reply_to;
};

// Client side of the broker HTTP API. Not thread-safe: one owner per instance.
class QueueClient {
public:
    QueueClient(std::string base_url, HttpTransport& transport);
    std::optional<Delivery> consume(const std::string& queue);
    AckResult ack(const std::string& delivery_tag);
    AckResult nack(const std::string& delivery_tag, bool requeue);
    bool publish(const std::string& queue, const OutgoingMessage& m, std::string* out_id = nullptr);

private:
    AckResult settle(const std::string& what, const std::string& delivery_tag, const std::string& url);

    std::string base_;
    HttpTransport& transport_;
};
