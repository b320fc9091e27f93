#pragma once
#include <string>
#include <vector>
#include <cstddef>

struct HttpRequest {
    std::string method{"GET"};
    std::string url;
    std::string body;
    std::vector<std::string> headers; // "Name: value"
    long timeout_ms{30000};
    std::string user;     // basic auth when non-empty
    std::string password;
    std::size_t max_body_bytes{0}; // 0 = unlimited
    bool follow_redirects{true};
};

struct HttpResponse {
    long status{0};
    std::string body;
    std::string content_type;
    std::string effective_url;
};

// Throws std::runtime_error on transport errors (DNS, connect, timeout, body cap).
// Any HTTP status is returned as a response.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse perform(const HttpRequest& req) = 0;
};

class CurlTransport : public HttpTransport {
public:
    HttpResponse perform(const HttpRequest& req) override;
};

// Must be called once before any thread starts issuing requests.
void http_global_init();

HttpResponse http_get(HttpTransport& transport, const std::string& url, long timeout_ms = 30000);
HttpResponse http_post_json(HttpTransport& transport, const std::string& url, const std::string& json_body,
                            long timeout_ms = 30000);
HttpResponse http_put_json(HttpTransport& transport, const std::string& url, const std::string& json_body,
                           const std::string& user, const std::string& password, long timeout_ms = 30000);

// Percent-encodes a query component.
std::string url_escape(const std::string& s);
