#include "../include/consumer.hpp"
#include "../../../shared/cpp/agent_sdk/include/util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

TaskConsumer::TaskConsumer(QueueClient& client, ConsumerOptions opts, TaskProcessor processor)
    : client_(client), opts_(std::move(opts)), processor_(std::move(processor)) {
    if (opts_.prefetch < 1) opts_.prefetch = 1;
}

TaskConsumer::~TaskConsumer() {
    reap_workers(true);
}

void TaskConsumer::run(const std::atomic<bool>& stop) {
    spdlog::info("[consumer] consuming {} (prefetch {})", opts_.queue, opts_.prefetch);
    while (!stop.load()) {
        std::size_t seen = pushed();
        drain_acks();
        reap_workers(false);

        if (opts_.once && consumed_ > 0) {
            if (idle()) break;
        } else if (unacked_ < opts_.prefetch) {
            if (auto d = client_.consume(opts_.queue)) {
                dispatch(std::move(*d));
                continue;
            }
            if (opts_.once && idle()) {
                spdlog::info("[consumer] queue {} is empty", opts_.queue);
                break;
            }
        }
        wait_for_ack(seen);
    }

    if (stop.load()) spdlog::info("[consumer] stopping, waiting for {} in-flight task(s)", workers_.size());
    int rounds_after_workers = 0;
    while (true) {
        std::size_t seen = pushed();
        drain_acks();
        reap_workers(false);
        if (idle()) break;
        if (workers_.empty() && ++rounds_after_workers > kShutdownAckRounds) {
            spdlog::error("[consumer] giving up on {} acknowledgment(s); the broker will redeliver", unacked_);
            break;
        }
        wait_for_ack(seen);
    }
    reap_workers(true);
    spdlog::info("[consumer] stopped after {} deliveries", consumed_);
}

std::size_t TaskConsumer::pushed() {
    std::lock_guard<std::mutex> lock(mu_);
    return pushed_;
}

void TaskConsumer::wait_for_ack(std::size_t seen) {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait_for(lock, opts_.poll, [this, seen] { return pushed_ != seen; });
}

void TaskConsumer::dispatch(Delivery d) {
    ++unacked_;
    ++consumed_;
    spdlog::info("[consumer] received {} (correlation {}{})", d.delivery_tag, d.correlation_id,
                 d.redelivered ? ", redelivered" : "");
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread t([this, d = std::move(d), done] {
        handle(d);
        done->store(true);
    });
    workers_.push_back({std::move(t), done});
}

void TaskConsumer::handle(const Delivery& d) {
    Task task;
    try {
        task = task_from_json(json::parse(d.body_json), opts_.analysis);
    } catch (const std::exception& e) {
        spdlog::error("[consumer] rejecting {}: {}", d.delivery_tag, e.what());
        push_ack({d.delivery_tag, false, false});
        return;
    }
    if (task.task_config.task_id.empty()) task.task_config.task_id = d.correlation_id;
    task.transition(TaskState::Received, unix_now());

    try {
        processor_(task, d);
    } catch (const std::exception& e) {
        spdlog::error("[consumer] task {} failed, requeueing: {}", task.task_config.task_id, e.what());
        push_ack({d.delivery_tag, false, true});
        return;
    }
    push_ack({d.delivery_tag, true, false});
}

void TaskConsumer::push_ack(AckRequest r) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        acks_.push_back(std::move(r));
        ++pushed_;
    }
    cv_.notify_one();
}

void TaskConsumer::drain_acks() {
    std::deque<AckRequest> pending;
    {
        std::lock_guard<std::mutex> lock(mu_);
        pending.swap(acks_);
    }
    std::deque<AckRequest> failed;
    for (auto& r : pending) {
        AckResult res = r.ack ? client_.ack(r.delivery_tag) : client_.nack(r.delivery_tag, r.requeue);
        switch (res) {
        case AckResult::Ok:
            --unacked_;
            spdlog::info("[consumer] {} {}", r.ack ? "acked" : (r.requeue ? "requeued" : "rejected"), r.delivery_tag);
            break;
        case AckResult::Rejected:
            // Stale or unknown tag: the broker already redelivered or dropped the message.
            --unacked_;
            spdlog::error("[consumer] broker refused {} of {}, dropping it", r.ack ? "ack" : "nack", r.delivery_tag);
            break;
        case AckResult::Failed:
            spdlog::warn("[consumer] {} of {} failed, will retry", r.ack ? "ack" : "nack", r.delivery_tag);
            failed.push_back(std::move(r));
            break;
        }
    }
    if (!failed.empty()) {
        std::lock_guard<std::mutex> lock(mu_);
        for (auto it = failed.rbegin(); it != failed.rend(); ++it) acks_.push_front(std::move(*it));
    }
}

void TaskConsumer::reap_workers(bool all) {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (all || it->done->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

bool TaskConsumer::idle() {
    std::lock_guard<std::mutex> lock(mu_);
    return unacked_ == 0 && acks_.empty() && workers_.empty();
}
