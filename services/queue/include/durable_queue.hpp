#pragma once
#include "message.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>

struct QueueCounts {
    std::size_t ready{0};
    std::size_t unacked{0};
};

// SQLite-backed queue with at-least-once delivery. A consumed message stays
// unacked until ack/nack; unacked messages older than the redelivery timeout
// are handed out again.
class DurableQueue {
public:
    DurableQueue(const std::string& db_path, double redelivery_timeout_s);
    ~DurableQueue();
    DurableQueue(const DurableQueue&) = delete;
    DurableQueue& operator=(const DurableQueue&) = delete;

    Message publish(Message m);
    std::optional<QueueDelivery> consume(const std::string& queue, double now);
    bool ack(const std::string& delivery_tag);
    bool nack(const std::string& delivery_tag, bool requeue);
    std::map<std::string, QueueCounts> stats();

private:
    void init();
    void exec(const std::string& sql);
    void prepare_statements();
    void close_statements();
    std::optional<std::pair<std::string, int>> parse_tag(const std::string& delivery_tag) const;

    std::mutex mtx_;
    double redelivery_timeout_s_;
    struct sqlite3* db_ {nullptr};
    struct sqlite3_stmt* insert_stmt_ {nullptr};
    struct sqlite3_stmt* expire_stmt_ {nullptr};
    struct sqlite3_stmt* next_stmt_ {nullptr};
    struct sqlite3_stmt* mark_stmt_ {nullptr};
    struct sqlite3_stmt* delete_stmt_ {nullptr};
    struct sqlite3_stmt* requeue_stmt_ {nullptr};
    struct sqlite3_stmt* stats_stmt_ {nullptr};
};
