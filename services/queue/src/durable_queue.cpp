#include "../include/durable_queue.hpp"
#include "../../../shared/cpp/agent_sdk/include/util.hpp"
#include <sqlite3.h>
#include <stdexcept>

namespace {
enum MessageState { kReady = 0, kUnacked = 1 };

void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

std::string column_text(sqlite3_stmt* st, int idx) {
    const unsigned char* t = sqlite3_column_text(st, idx);
    return t ? reinterpret_cast<const char*>(t) : std::string();
}

// Resets the statement on scope exit so it never holds a read lock.
struct StmtReset {
    sqlite3_stmt* st;
    ~StmtReset() { sqlite3_reset(st); sqlite3_clear_bindings(st); }
};
}

DurableQueue::DurableQueue(const std::string& db_path, double redelivery_timeout_s)
    : redelivery_timeout_s_(redelivery_timeout_s) {
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        throw std::runtime_error("Failed to open SQLite DB: " + db_path + ": " + msg);
    }
    init();
    prepare_statements();
}

DurableQueue::~DurableQueue() {
    close_statements();
    if (db_) sqlite3_close(db_);
}

void DurableQueue::init() {
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=FULL;");
    exec("CREATE TABLE IF NOT EXISTS messages (\n"
         "  seq INTEGER PRIMARY KEY AUTOINCREMENT,\n"
         "  id TEXT UNIQUE NOT NULL,\n"
         "  queue TEXT NOT NULL,\n"
         "  body TEXT NOT NULL,\n"
         "  correlation_id TEXT,\n"
         "  reply_to TEXT,\n"
         "  state INTEGER NOT NULL DEFAULT 0,\n"
         "  delivery_count INTEGER NOT NULL DEFAULT 0,\n"
         "  delivered_at REAL\n"
         ");");
    exec("CREATE INDEX IF NOT EXISTS idx_messages_queue_state ON messages(queue, state, seq);");
}

void DurableQueue::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw std::runtime_error("SQLite error: " + msg);
    }
}

void DurableQueue::prepare_statements() {
    auto prepare = [&](const char* sql, sqlite3_stmt** out, const char* what) {
        if (sqlite3_prepare_v2(db_, sql, -1, out, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("prepare ") + what + " failed: " + sqlite3_errmsg(db_));
        }
    };
    prepare("INSERT INTO messages (id, queue, body, correlation_id, reply_to, state, delivery_count) "
            "VALUES (?, ?, ?, ?, ?, 0, 0);", &insert_stmt_, "insert");
    prepare("UPDATE messages SET state = 0 WHERE queue = ? AND state = 1 AND delivered_at < ?;",
            &expire_stmt_, "expire");
    prepare("SELECT id, body, correlation_id, reply_to, delivery_count FROM messages "
            "WHERE queue = ? AND state = 0 ORDER BY seq LIMIT 1;", &next_stmt_, "next");
    prepare("UPDATE messages SET state = 1, delivery_count = delivery_count + 1, delivered_at = ? WHERE id = ?;",
            &mark_stmt_, "mark");
    prepare("DELETE FROM messages WHERE id = ? AND state = 1 AND delivery_count = ?;", &delete_stmt_, "delete");
    prepare("UPDATE messages SET state = 0 WHERE id = ? AND state = 1 AND delivery_count = ?;",
            &requeue_stmt_, "requeue");
    prepare("SELECT queue, SUM(CASE WHEN state = 0 THEN 1 ELSE 0 END), SUM(CASE WHEN state = 1 THEN 1 ELSE 0 END) "
            "FROM messages GROUP BY queue;", &stats_stmt_, "stats");
}

void DurableQueue::close_statements() {
    for (sqlite3_stmt** st : {&insert_stmt_, &expire_stmt_, &next_stmt_, &mark_stmt_,
                              &delete_stmt_, &requeue_stmt_, &stats_stmt_}) {
        if (*st) { sqlite3_finalize(*st); *st = nullptr; }
    }
}

Message DurableQueue::publish(Message m) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (m.id.empty()) m.id = random_hex(16);
    m.delivery_count = 0;
    StmtReset guard{insert_stmt_};
    bind_text(insert_stmt_, 1, m.id);
    bind_text(insert_stmt_, 2, m.queue);
    bind_text(insert_stmt_, 3, m.body);
    bind_text(insert_stmt_, 4, m.correlation_id);
    bind_text(insert_stmt_, 5, m.reply_to);
    if (sqlite3_step(insert_stmt_) != SQLITE_DONE) {
        throw std::runtime_error(std::string("insert message failed: ") + sqlite3_errmsg(db_));
    }
    return m;
}

std::optional<QueueDelivery> DurableQueue::consume(const std::string& queue, double now) {
    std::lock_guard<std::mutex> lock(mtx_);
    exec("BEGIN IMMEDIATE;");
    try {
        {
            StmtReset guard{expire_stmt_};
            bind_text(expire_stmt_, 1, queue);
            sqlite3_bind_double(expire_stmt_, 2, now - redelivery_timeout_s_);
            if (sqlite3_step(expire_stmt_) != SQLITE_DONE) throw std::runtime_error("expire unacked failed");
        }

        std::optional<QueueDelivery> out;
        {
            StmtReset guard{next_stmt_};
            bind_text(next_stmt_, 1, queue);
            int rc = sqlite3_step(next_stmt_);
            if (rc == SQLITE_ROW) {
                QueueDelivery d;
                d.message.id = column_text(next_stmt_, 0);
                d.message.queue = queue;
                d.message.body = column_text(next_stmt_, 1);
                d.message.correlation_id = column_text(next_stmt_, 2);
                d.message.reply_to = column_text(next_stmt_, 3);
                d.message.delivery_count = sqlite3_column_int(next_stmt_, 4) + 1;
                d.redelivered = d.message.delivery_count > 1;
                d.delivery_tag = d.message.id + "." + std::to_string(d.message.delivery_count);
                out = std::move(d);
            } else if (rc != SQLITE_DONE) {
                throw std::runtime_error("select next message failed");
            }
        }

        if (out) {
            StmtReset guard{mark_stmt_};
            sqlite3_bind_double(mark_stmt_, 1, now);
            bind_text(mark_stmt_, 2, out->message.id);
            if (sqlite3_step(mark_stmt_) != SQLITE_DONE) throw std::runtime_error("mark delivered failed");
        }
        exec("COMMIT;");
        return out;
    } catch (...) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
}

std::optional<std::pair<std::string, int>> DurableQueue::parse_tag(const std::string& delivery_tag) const {
    auto dot = delivery_tag.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == delivery_tag.size()) return std::nullopt;
    if (delivery_tag.size() - dot - 1 > 9) return std::nullopt; // keeps the count within int
    int count = 0;
    for (std::size_t i = dot + 1; i < delivery_tag.size(); ++i) {
        char c = delivery_tag[i];
        if (c < '0' || c > '9') return std::nullopt;
        count = count * 10 + (c - '0');
    }
    return std::make_pair(delivery_tag.substr(0, dot), count);
}

bool DurableQueue::ack(const std::string& delivery_tag) {
    auto tag = parse_tag(delivery_tag);
    if (!tag) return false;
    std::lock_guard<std::mutex> lock(mtx_);
    StmtReset guard{delete_stmt_};
    bind_text(delete_stmt_, 1, tag->first);
    sqlite3_bind_int(delete_stmt_, 2, tag->second);
    if (sqlite3_step(delete_stmt_) != SQLITE_DONE) {
        throw std::runtime_error(std::string("ack failed: ") + sqlite3_errmsg(db_));
    }
    return sqlite3_changes(db_) > 0;
}

bool DurableQueue::nack(const std::string& delivery_tag, bool requeue) {
    if (!requeue) return ack(delivery_tag);
    auto tag = parse_tag(delivery_tag);
    if (!tag) return false;
    std::lock_guard<std::mutex> lock(mtx_);
    StmtReset guard{requeue_stmt_};
    bind_text(requeue_stmt_, 1, tag->first);
    sqlite3_bind_int(requeue_stmt_, 2, tag->second);
    if (sqlite3_step(requeue_stmt_) != SQLITE_DONE) {
        throw std::runtime_error(std::string("requeue failed: ") + sqlite3_errmsg(db_));
    }
    return sqlite3_changes(db_) > 0;
}

std::map<std::string, QueueCounts> DurableQueue::stats() {
    std::lock_guard<std::mutex> lock(mtx_);
    std::map<std::string, QueueCounts> out;
    StmtReset guard{stats_stmt_};
    while (sqlite3_step(stats_stmt_) == SQLITE_ROW) {
        QueueCounts c;
        c.ready = (std::size_t)sqlite3_column_int64(stats_stmt_, 1);
        c.unacked = (std::size_t)sqlite3_column_int64(stats_stmt_, 2);
        out[column_text(stats_stmt_, 0)] = c;
    }
    return out;
}
