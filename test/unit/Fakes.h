#pragma once
#include "../../agents/login-page-detection/include/crawling.hpp"
#include "../../agents/login-page-detection/include/oracle.hpp"
#include "../../agents/login-page-detection/include/screenshot.hpp"
#include "../../shared/cpp/agent_sdk/include/http.hpp"
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>

// Answers requests from a handler and records every request it saw.
class FakeTransport : public HttpTransport {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    explicit FakeTransport(Handler handler = {}) : handler_(std::move(handler)) {}

    HttpResponse perform(const HttpRequest& req) override {
        Handler h;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            requests_.push_back(req);
            h = handler_;
        }
        if (!h) throw std::runtime_error("no route for " + req.url);
        return h(req);
    }

    void set_handler(Handler h) {
        std::lock_guard<std::mutex> lock(mtx_);
        handler_ = std::move(h);
    }

    std::vector<HttpRequest> requests() {
        std::lock_guard<std::mutex> lock(mtx_);
        return requests_;
    }

private:
    std::mutex mtx_;
    Handler handler_;
    std::vector<HttpRequest> requests_;
};

inline HttpResponse make_response(long status, const std::string& body = "", const std::string& content_type = "") {
    HttpResponse r;
    r.status = status;
    r.body = body;
    r.content_type = content_type;
    return r;
}

// Screenshot paths embed the URL so FakeOracle can answer per URL.
class FakeScreenshotter : public Screenshotter {
public:
    std::string capture(const std::string& url) override {
        captured.push_back(url);
        if (failing.count(url)) throw std::runtime_error("browser crashed");
        return "/shots/" + url;
    }

    std::set<std::string> failing;
    std::vector<std::string> captured;
};

class FakeOracle : public ClassificationOracle {
public:
    Verdict classify(const std::string& image_ref) override {
        std::string url = image_ref.substr(std::string("/shots/").size());
        classified.push_back(url);
        if (broken.count(url)) throw OracleError("Error: model unavailable");
        Verdict v;
        v.login_present = login.count(url) > 0;
        v.raw = v.login_present ? "YES" : "NO";
        return v;
    }

    std::set<std::string> login;  // positive verdicts
    std::set<std::string> broken; // classification failures
    std::vector<std::string> classified;
};

class FakeCrawler : public ExternalCrawler {
public:
    CrawlOutcome run(const std::string& domain) override {
        domains.push_back(domain);
        return outcome;
    }

    CrawlOutcome outcome;
    std::vector<std::string> domains;
};

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        static int counter = 0;
        path_ = std::filesystem::temp_directory_path() /
                ("lpd_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Running and not a zombie waiting for a reaper.
inline bool process_alive(long pid) {
    std::ifstream in("/proc/" + std::to_string(pid) + "/stat");
    std::string stat;
    if (!std::getline(in, stat)) return false;
    auto close = stat.rfind(')');
    return close != std::string::npos && close + 2 < stat.size() && stat[close + 2] != 'Z' && stat[close + 2] != 'X';
}

inline long read_pid_file(const std::filesystem::path& p) {
    std::ifstream in(p);
    long pid = 0;
    in >> pid;
    return pid;
}
