#pragma once
#include "task.hpp"
#include "../../../shared/cpp/agent_sdk/include/queue_client.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Executes and delivers one task. Throwing means the task could not be
// handled at all; the delivery is then requeued.
using TaskProcessor = std::function<void(Task&, const Delivery&)>;

struct ConsumerOptions {
    std::string queue;
    std::string analysis;
    int prefetch{1};
    std::chrono::milliseconds poll{1000};
    bool once{false}; // handle at most one delivery, then drain and return
};

// Owns the queue client: only the thread inside run() talks to the broker.
// Each delivery is processed on its own thread, which hands its ack back
// through a mutex-protected channel.
class TaskConsumer {
public:
    TaskConsumer(QueueClient& client, ConsumerOptions opts, TaskProcessor processor);
    ~TaskConsumer();
    TaskConsumer(const TaskConsumer&) = delete;
    TaskConsumer& operator=(const TaskConsumer&) = delete;

    // Returns after stop is set (or after one delivery with once) once every
    // in-flight task finished and its acknowledgment was attempted.
    void run(const std::atomic<bool>& stop);

    // Deliveries taken from the broker so far.
    int consumed() const { return consumed_; }

private:
    struct AckRequest {
        std::string delivery_tag;
        bool ack{true};
        bool requeue{false};
    };
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void dispatch(Delivery d);
    void handle(const Delivery& d);
    void push_ack(AckRequest r);
    void drain_acks();
    void reap_workers(bool all);
    bool idle();
    std::size_t pushed();
    void wait_for_ack(std::size_t seen);

    static constexpr int kShutdownAckRounds = 3;

    QueueClient& client_;
    ConsumerOptions opts_;
    TaskProcessor processor_;

    std::mutex mu_;
    std::condition_variable cv_;
    std::deque<AckRequest> acks_;
    std::size_t pushed_{0};

    std::vector<Worker> workers_;
    int unacked_{0};
    int consumed_{0};
};
