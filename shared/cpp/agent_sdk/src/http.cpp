#include "../include/http.hpp"
#include <curl/curl.h>
#include <stdexcept>

namespace {
struct WriteState {
    std::string* buf;
    std::size_t limit;
};

static size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    auto* st = static_cast<WriteState*>(userp);
    if (st->limit && st->buf->size() + total > st->limit) {
        return 0; // aborts the transfer with CURLE_WRITE_ERROR
    }
    st->buf->append(static_cast<char*>(contents), total);
    return total;
}

struct CurlHandle {
    CURL* h{nullptr};
    CurlHandle() { h = curl_easy_init(); if (!h) throw std::runtime_error("curl_easy_init failed"); }
    ~CurlHandle() { if (h) curl_easy_cleanup(h); }
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct HeaderList {
    struct curl_slist* list{nullptr};
    ~HeaderList() { if (list) curl_slist_free_all(list); }
    void add(const std::string& h) { list = curl_slist_append(list, h.c_str()); }
};
}

void http_global_init() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpResponse CurlTransport::perform(const HttpRequest& req) {
    CurlHandle c;
    HeaderList headers;
    for (const auto& h : req.headers) headers.add(h);

    std::string buf;
    WriteState state{&buf, req.max_body_bytes};

    curl_easy_setopt(c.h, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, req.timeout_ms);
    curl_easy_setopt(c.h, CURLOPT_FOLLOWLOCATION, req.follow_redirects ? 1L : 0L);
    curl_easy_setopt(c.h, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(c.h, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(c.h, CURLOPT_USERAGENT,
                     "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0 Safari/537.36");
    if (headers.list) curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, headers.list);
    if (!req.user.empty()) {
        curl_easy_setopt(c.h, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(c.h, CURLOPT_USERNAME, req.user.c_str());
        curl_easy_setopt(c.h, CURLOPT_PASSWORD, req.password.c_str());
    }

    if (req.method == "POST") {
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, req.body.c_str());
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)req.body.size());
    } else if (req.method != "GET") {
        curl_easy_setopt(c.h, CURLOPT_CUSTOMREQUEST, req.method.c_str());
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, req.body.c_str());
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)req.body.size());
    }

    CURLcode code = curl_easy_perform(c.h);
    if (code != CURLE_OK) {
        if (code == CURLE_WRITE_ERROR && state.limit) {
            throw std::runtime_error("response body of " + req.url + " exceeds " +
                                     std::to_string(state.limit) + " bytes");
        }
        throw std::runtime_error(std::string("curl_easy_perform failed: ") + curl_easy_strerror(code));
    }

    HttpResponse resp;
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &resp.status);
    char* ctype = nullptr;
    curl_easy_getinfo(c.h, CURLINFO_CONTENT_TYPE, &ctype);
    if (ctype) resp.content_type = ctype;
    char* eff = nullptr;
    curl_easy_getinfo(c.h, CURLINFO_EFFECTIVE_URL, &eff);
    resp.effective_url = eff ? eff : req.url;
    resp.body = std::move(buf);
    return resp;
}

HttpResponse http_get(HttpTransport& transport, const std::string& url, long timeout_ms) {
    HttpRequest req;
    req.url = url;
    req.timeout_ms = timeout_ms;
    return transport.perform(req);
}

HttpResponse http_post_json(HttpTransport& transport, const std::string& url, const std::string& json_body,
                            long timeout_ms) {
    HttpRequest req;
    req.method = "POST";
    req.url = url;
    req.body = json_body;
    req.headers.push_back("Content-Type: application/json");
    req.timeout_ms = timeout_ms;
    return transport.perform(req);
}

HttpResponse http_put_json(HttpTransport& transport, const std::string& url, const std::string& json_body,
                           const std::string& user, const std::string& password, long timeout_ms) {
    HttpRequest req;
    req.method = "PUT";
    req.url = url;
    req.body = json_body;
    req.headers.push_back("Content-Type: application/json");
    req.user = user;
    req.password = password;
    req.timeout_ms = timeout_ms;
    return transport.perform(req);
}

std::string url_escape(const std::string& s) {
    CurlHandle c;
    char* out = curl_easy_escape(c.h, s.c_str(), (int)s.size());
    if (!out) throw std::runtime_error("curl_easy_escape failed");
    std::string r(out);
    curl_free(out);
    return r;
}
