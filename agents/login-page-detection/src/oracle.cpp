#include "../include/oracle.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <regex>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

using json = nlohmann::json;

const char* const kClassificationPrompt =
    "Analyze the provided image and determine if it contains input fields associated with the login flow "
    "of a web page. Specifically, look for:\n"
    "Username or email input fields (e.g., forms with user ID, unique user ID, email address, or similar fields).\n"
    "Password input fields (fields intended for password entry).\n"
    "Follow this structured approach:\n"
    "Identify all input fields in the image.\n"
    "Filter out irrelevant input fields, such as those related to search, comments, or non-login-related data "
    "collection.\n"
    "Determine if at least one relevant login-related input field is present and visible on the page.\n"
    "Explain your reasoning step by step to justify your decision.\n"
    "Output Format (Important):\n"
    "After explaining your reasoning, respond strictly with either:\n"
    "\"YES\" (if a relevant login input field is present and visible).\n"
    "\"NO\" (if no relevant login input field is found).\n";

namespace {
constexpr std::size_t kReplyBytes = 1024;

class Socket {
public:
    explicit Socket(int fd) : fd_(fd) {}
    ~Socket() { if (fd_ >= 0) ::close(fd_); }
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;
    int get() const { return fd_; }

private:
    int fd_;
};

struct AddrInfo {
    addrinfo* head{nullptr};
    ~AddrInfo() { if (head) freeaddrinfo(head); }
};

std::string errno_text() { return std::strerror(errno); }
}

Verdict parse_socket_reply(const std::string& reply) {
    std::string text = reply;
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == '\0')) text.pop_back();
    if (text.empty()) throw OracleError("empty reply from classifier");
    if (text.rfind("Error:", 0) == 0) throw OracleError("classifier: " + text);
    Verdict v;
    v.login_present = text.find("YES") != std::string::npos;
    v.raw = text;
    return v;
}

std::optional<std::string> extract_final_answer(const std::string& text) {
    static const std::regex re("\\b(YES|NO)\\b", std::regex::ECMAScript | std::regex::icase);
    std::optional<std::string> last;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), re); it != std::sregex_iterator(); ++it) {
        last = (*it)[1].str();
    }
    if (last) {
        for (auto& c : *last) c = (char)std::toupper((unsigned char)c);
    }
    return last;
}

std::string image_url_for_path(const std::string& path, const std::string& image_base_url) {
    if (path.rfind("http://", 0) == 0 || path.rfind("https://", 0) == 0) return path;
    static const std::string marker = "screenshot_flows";
    std::string base = image_base_url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    auto pos = path.find(marker);
    if (pos == std::string::npos) {
        return base + (path.empty() || path[0] != '/' ? "/" : "") + path;
    }
    return base + "/" + path.substr(pos);
}

SocketOracle::SocketOracle(std::string host, int port, int timeout_s, bool no_save)
    : host_(std::move(host)), port_(port), timeout_s_(timeout_s), no_save_(no_save) {}

Verdict SocketOracle::classify(const std::string& image_ref) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    AddrInfo res;
    int rc = getaddrinfo(host_.c_str(), std::to_string(port_).c_str(), &hints, &res.head);
    if (rc != 0) throw OracleError("resolve " + host_ + ": " + gai_strerror(rc));

    std::string last_error = "no address";
    for (addrinfo* ai = res.head; ai; ai = ai->ai_next) {
        Socket sock(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (sock.get() < 0) { last_error = errno_text(); continue; }

        timeval tv{};
        tv.tv_sec = timeout_s_;
        setsockopt(sock.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(sock.get(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        if (::connect(sock.get(), ai->ai_addr, ai->ai_addrlen) != 0) { last_error = errno_text(); continue; }

        std::string line = image_ref + (no_save_ ? " noSave" : "") + "\n";
        std::size_t sent = 0;
        while (sent < line.size()) {
            ssize_t n = ::send(sock.get(), line.data() + sent, line.size() - sent, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) continue;
                throw OracleError("send to classifier: " + errno_text());
            }
            sent += (std::size_t)n;
        }

        char buf[kReplyBytes];
        ssize_t n;
        do {
            n = ::recv(sock.get(), buf, sizeof(buf), 0);
        } while (n < 0 && errno == EINTR);
        if (n < 0) throw OracleError("recv from classifier: " + errno_text());
        Verdict v = parse_socket_reply(std::string(buf, (std::size_t)n));
        spdlog::debug("[oracle] {} -> {}", image_ref, v.raw);
        return v;
    }
    throw OracleError("connect " + host_ + ":" + std::to_string(port_) + ": " + last_error);
}

ChatCompletionOracle::ChatCompletionOracle(const OracleConfig& cfg, HttpTransport& transport)
    : cfg_(cfg), transport_(transport) {}

Verdict ChatCompletionOracle::classify(const std::string& image_ref) {
    json body = {
        {"model", cfg_.chat_model},
        {"messages", json::array({
            json{{"role", "system"}, {"content", "You are a helpful assistant."}},
            json{{"role", "user"}, {"content", json::array({
                json{{"type", "image_url"},
                     {"image_url", {{"url", image_url_for_path(image_ref, cfg_.image_base_url)}}}},
                json{{"type", "text"}, {"text", kClassificationPrompt}}
            })}}
        })},
        {"max_tokens", cfg_.chat_max_tokens}
    };

    HttpRequest req;
    req.method = "POST";
    req.url = cfg_.chat_url;
    req.body = body.dump();
    req.headers.push_back("Content-Type: application/json");
    if (!cfg_.chat_api_key.empty()) req.headers.push_back("Authorization: Bearer " + cfg_.chat_api_key);
    req.timeout_ms = (long)cfg_.timeout_s * 1000;

    HttpResponse r;
    try {
        r = transport_.perform(req);
    } catch (const std::exception& e) {
        throw OracleError(std::string("chat request failed: ") + e.what());
    }
    if (r.status < 200 || r.status >= 300) {
        throw OracleError("chat failed: status " + std::to_string(r.status));
    }

    std::string content;
    try {
        auto data = json::parse(r.body);
        content = data.at("choices").at(0).at("message").at("content").get<std::string>();
    } catch (const json::exception& e) {
        throw OracleError(std::string("malformed chat response: ") + e.what());
    }

    auto answer = extract_final_answer(content);
    if (!answer) throw OracleError("no YES/NO in chat response");
    Verdict v;
    v.login_present = *answer == "YES";
    v.raw = content;
    spdlog::debug("[oracle] {} -> {}", image_ref, *answer);
    return v;
}

std::unique_ptr<ClassificationOracle> make_oracle(const OracleConfig& cfg, HttpTransport& transport) {
    if (cfg.mode == "socket") {
        return std::make_unique<SocketOracle>(cfg.host, cfg.port, cfg.timeout_s, cfg.no_save);
    }
    if (cfg.mode == "chat") return std::make_unique<ChatCompletionOracle>(cfg, transport);
    throw std::invalid_argument("unknown ORACLE_MODE: " + cfg.mode);
}
