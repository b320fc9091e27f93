#include "../include/analysis.hpp"
#include "../include/config.hpp"
#include "../include/consumer.hpp"
#include "../include/deliverer.hpp"
#include "../include/executor.hpp"
#include "../../../shared/cpp/agent_sdk/include/http.hpp"
#include "../../../shared/cpp/agent_sdk/include/queue_client.hpp"
#include "../../../shared/cpp/agent_sdk/include/util.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <csignal>
#include <climits>
#include <string>
#include <unistd.h>

static std::atomic<bool> g_stop{false};

static void on_signal(int) {
    g_stop.store(true);
}

static std::string self_exe(const char* argv0) {
    char buf[PATH_MAX];
    ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0) return argv0;
    return std::string(buf, (std::size_t)n);
}

static void usage() {
    spdlog::error("usage: lpd_worker [--once] [--poll-ms N] [--queue NAME] [--prefetch N] [--task-timeout S]");
}

int main(int argc, char** argv) {
    WorkerConfig cfg = load_worker_config();
    init_logging(cfg.log_level);

    if (argc == 5 && std::string(argv[1]) == "--run-analysis") {
        http_global_init();
        return run_analysis_child(cfg, argv[2], argv[3], argv[4]);
    }

    bool once = false;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--once") once = true;
            else if (a == "--poll-ms" && i + 1 < argc) cfg.poll_ms = std::stoi(argv[++i]);
            else if (a == "--queue" && i + 1 < argc) cfg.queue_name = argv[++i];
            else if (a == "--prefetch" && i + 1 < argc) cfg.prefetch = std::stoi(argv[++i]);
            else if (a == "--task-timeout" && i + 1 < argc) cfg.task_timeout_s = std::stoi(argv[++i]);
            else {
                usage();
                return 2;
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("[worker] bad argument: {}", e.what());
        usage();
        return 2;
    }

    http_global_init();
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    std::signal(SIGPIPE, SIG_IGN);

    spdlog::info("[worker] Starting. QUEUE_URL={} queue={} analysis={} prefetch={} timeout={}s oracle={}",
                 cfg.queue_url, cfg.queue_name, cfg.analysis(), cfg.prefetch, cfg.task_timeout_s, cfg.oracle.mode);

    CurlTransport http;
    QueueClient client(cfg.queue_url, http);
    TaskExecutor executor({self_exe(argv[0])}, cfg.work_dir, std::chrono::seconds(cfg.task_timeout_s));
    // Delivery threads share the transport; CurlTransport keeps no state between requests.
    ResultDeliverer deliverer(cfg, http);

    ConsumerOptions opts;
    opts.queue = cfg.queue_name;
    opts.analysis = cfg.analysis();
    opts.prefetch = cfg.prefetch;
    opts.poll = std::chrono::milliseconds(cfg.poll_ms);
    opts.once = once;

    TaskConsumer consumer(client, opts, [&](Task& task, const Delivery& d) {
        executor.execute(task);
        DeliveryReceipt r = deliverer.deliver(task, d.reply_to);
        spdlog::info("[worker] task {} done: collector {} ({}), callback {} after {} attempt(s)",
                     task.task_config.task_id, r.collector_ok ? "ok" : "failed", r.collector_status,
                     r.callback_sent ? "sent" : "skipped", r.callback_attempts);
    });
    consumer.run(g_stop);
    return 0;
}
