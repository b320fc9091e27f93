#include <string>
#include <map>
#include <memory>
#include <cstring>
#include <filesystem>
#include <csignal>
#include <pthread.h>
#include <unistd.h>
#include <microhttpd.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "../include/durable_queue.hpp"
#include "../../../shared/cpp/agent_sdk/include/util.hpp"

using json = nlohmann::json;

#if MHD_VERSION >= 0x00097002
using mhd_result = enum MHD_Result;
#else
using mhd_result = int;
#endif

static std::unique_ptr<DurableQueue> g_queue;

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
};

static mhd_result send_response(struct MHD_Connection* conn, unsigned int status, const std::string& body,
                                const char* ctype = "application/json") {
    struct MHD_Response* resp = MHD_create_response_from_buffer(body.size(), (void*)body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, ctype);
    mhd_result ret = MHD_queue_response(conn, status, resp);
    MHD_destroy_response(resp);
    return ret;
}

static std::string query_arg(struct MHD_Connection* conn, const char* key) {
    const char* v = MHD_lookup_connection_value(conn, MHD_GET_ARGUMENT_KIND, key);
    return v ? std::string(v) : std::string();
}

// "/queues/<name>/<verb>" -> (name, verb)
static bool split_queue_path(const std::string& path, std::string& name, std::string& verb) {
    static const std::string prefix = "/queues/";
    if (path.rfind(prefix, 0) != 0) return false;
    auto rest = path.substr(prefix.size());
    auto slash = rest.find('/');
    if (slash == std::string::npos || slash == 0) return false;
    name = rest.substr(0, slash);
    verb = rest.substr(slash + 1);
    return !verb.empty();
}

static void request_completed(void* /*cls*/, struct MHD_Connection* /*connection*/, void** con_cls,
                              enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

static mhd_result handler(void* /*cls*/, struct MHD_Connection* connection, const char* url, const char* method,
                          const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}};
        *con_cls = ci;
        return MHD_YES;
    }

    if (0 == strcmp(method, MHD_HTTP_METHOD_POST)) {
        if (*upload_data_size) {
            ci->body.append(upload_data, *upload_data_size);
            *upload_data_size = 0;
            return MHD_YES;
        }
    }

    std::string path(url);
    try {
        std::string queue, verb;
        if (split_queue_path(path, queue, verb)) {
            if (ci->method == "POST" && verb == "publish") {
                auto j = json::parse(ci->body);
                Message m;
                m.queue = queue;
                m.body = j.value("body", json::object()).dump();
                m.correlation_id = j.value("correlation_id", std::string());
                m.reply_to = j.value("reply_to", std::string());
                m = g_queue->publish(std::move(m));
                spdlog::info("[queue] published {} on {}", m.id, queue);
                return send_response(connection, MHD_HTTP_OK, json({{"id", m.id}}).dump());
            }
            if (ci->method == "GET" && verb == "consume") {
                auto d = g_queue->consume(queue, unix_now());
                if (!d) return send_response(connection, MHD_HTTP_NO_CONTENT, "", "text/plain");
                spdlog::info("[queue] delivering {} on {}{}", d->delivery_tag, queue,
                             d->redelivered ? " (redelivered)" : "");
                json out = {
                    {"delivery_tag", d->delivery_tag},
                    {"correlation_id", d->message.correlation_id},
                    {"reply_to", d->message.reply_to},
                    {"redelivered", d->redelivered},
                    {"body", json::parse(d->message.body)}
                };
                return send_response(connection, MHD_HTTP_OK, out.dump());
            }
        }
        if (ci->method == "POST" && path.rfind("/ack/", 0) == 0) {
            std::string tag = path.substr(std::string("/ack/").size());
            if (!g_queue->ack(tag)) {
                return send_response(connection, MHD_HTTP_NOT_FOUND, json({{"error", "unknown delivery tag"}}).dump());
            }
            spdlog::info("[queue] acked {}", tag);
            return send_response(connection, MHD_HTTP_OK, json({{"ok", true}}).dump());
        }
        if (ci->method == "POST" && path.rfind("/nack/", 0) == 0) {
            std::string tag = path.substr(std::string("/nack/").size());
            bool requeue = query_arg(connection, "requeue") != "0";
            if (!g_queue->nack(tag, requeue)) {
                return send_response(connection, MHD_HTTP_NOT_FOUND, json({{"error", "unknown delivery tag"}}).dump());
            }
            spdlog::info("[queue] nacked {} (requeue={})", tag, requeue);
            return send_response(connection, MHD_HTTP_OK, json({{"ok", true}}).dump());
        }
        if (ci->method == "GET" && path == "/stats") {
            json queues = json::object();
            for (const auto& kv : g_queue->stats()) {
                queues[kv.first] = {{"ready", kv.second.ready}, {"unacked", kv.second.unacked}};
            }
            return send_response(connection, MHD_HTTP_OK, json({{"queues", queues}}).dump());
        }
        return send_response(connection, MHD_HTTP_NOT_FOUND, json({{"error","not found"}}).dump());
    } catch (const json::exception& e) {
        return send_response(connection, MHD_HTTP_BAD_REQUEST, json({{"error", e.what()}}).dump());
    } catch (const std::exception& e) {
        spdlog::error("[queue] {} {} failed: {}", ci->method, path, e.what());
        return send_response(connection, MHD_HTTP_INTERNAL_SERVER_ERROR, json({{"error", e.what()}}).dump());
    }
}

int main(int, char**) {
    init_logging(getenv_or("LOG_LEVEL", "info"));
    int port = (int)getenv_long_or("QUEUE_PORT", 7000);
    std::string db_path = getenv_or("QUEUE_DB_PATH", "./data/queue.db");
    double redelivery_s = (double)getenv_long_or("QUEUE_REDELIVERY_S", 4 * 60 * 60);

    try {
        std::filesystem::path parent = std::filesystem::path(db_path).parent_path();
        if (!parent.empty()) std::filesystem::create_directories(parent);
        g_queue = std::make_unique<DurableQueue>(db_path, redelivery_s);
    } catch (const std::exception& e) {
        spdlog::critical("[queue] {}", e.what());
        return 1;
    }

    // Block before the daemon thread starts so it inherits the mask and sigwait sees the signal.
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);

    spdlog::info("[queue] Starting HTTP server on port {} (db={}, redelivery={}s)", port, db_path, redelivery_s);
    struct MHD_Daemon* d = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD, port, nullptr, nullptr,
                                            &handler, nullptr,
                                            MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                                            MHD_OPTION_END);
    if (!d) {
        spdlog::critical("[queue] Failed to start HTTP server");
        return 1;
    }

    int sig = 0;
    sigwait(&set, &sig);
    spdlog::info("[queue] signal {} received, stopping", sig);

    MHD_stop_daemon(d);
    g_queue.reset();
    return 0;
}
