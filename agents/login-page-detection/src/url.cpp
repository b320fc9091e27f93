#include "../include/url.hpp"
#include "../../../shared/cpp/agent_sdk/include/util.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <regex>
#include <stdexcept>
#include <unordered_set>

namespace {
// Second-level public suffixes common enough to matter for TLD+1 matching.
const std::unordered_set<std::string>& multi_label_suffixes() {
    static const std::unordered_set<std::string> s = {
        "co.uk", "org.uk", "ac.uk", "gov.uk", "ltd.uk", "plc.uk", "me.uk", "net.uk", "sch.uk",
        "com.au", "net.au", "org.au", "edu.au", "gov.au", "asn.au", "id.au",
        "co.nz", "org.nz", "net.nz", "govt.nz", "ac.nz",
        "co.jp", "or.jp", "ne.jp", "ac.jp", "go.jp",
        "co.kr", "or.kr", "ne.kr",
        "com.br", "net.br", "org.br", "gov.br",
        "com.cn", "net.cn", "org.cn", "gov.cn",
        "com.hk", "org.hk", "com.sg", "edu.sg", "com.my", "com.tw", "org.tw",
        "co.in", "net.in", "org.in", "firm.in", "gen.in", "ind.in",
        "co.za", "org.za", "gov.za",
        "com.mx", "org.mx", "gob.mx", "com.ar", "com.co", "com.pe", "com.ve", "com.uy",
        "com.tr", "org.tr", "gen.tr", "com.ua", "com.pl", "co.il", "org.il", "ac.il",
        "com.eg", "com.sa", "com.pk", "com.ng", "co.ke", "co.id", "or.id", "co.th", "in.th",
        "com.vn", "com.ph", "com.bd",
    };
    return s;
}

bool is_default_port(const std::string& scheme, const std::string& port) {
    return (scheme == "https" && port == "443") || (scheme == "http" && port == "80");
}

// Spaces are accepted and stored percent-encoded; dot segments are resolved on set.
constexpr unsigned int kUrlFlags = CURLU_ALLOW_SPACE | CURLU_URLENCODE;

struct UrlHandle {
    CURLU* h{curl_url()};
    ~UrlHandle() { if (h) curl_url_cleanup(h); }
    UrlHandle() = default;
    UrlHandle(const UrlHandle&) = delete;
    UrlHandle& operator=(const UrlHandle&) = delete;
};

std::optional<std::string> url_part(CURLU* h, CURLUPart part) {
    char* out = nullptr;
    if (curl_url_get(h, part, &out, 0) != CURLUE_OK || !out) return std::nullopt;
    std::string v(out);
    curl_free(out);
    return v;
}

std::optional<UrlParts> parts_of(CURLU* h) {
    UrlParts u;
    auto scheme = url_part(h, CURLUPART_SCHEME);
    auto host = url_part(h, CURLUPART_HOST);
    if (!scheme || !host || host->empty()) return std::nullopt;
    u.scheme = to_lower(*scheme);
    u.host = to_lower(*host);
    u.port = url_part(h, CURLUPART_PORT).value_or("");
    u.path = url_part(h, CURLUPART_PATH).value_or("/");
    if (u.path.empty() || u.path[0] != '/') u.path = "/" + u.path;
    u.query = url_part(h, CURLUPART_QUERY).value_or("");
    return u;
}
}

std::optional<UrlParts> parse_url(const std::string& raw) {
    std::string url = trim(raw);
    if (url.find("://") == std::string::npos) return std::nullopt;
    UrlHandle uh;
    if (!uh.h || curl_url_set(uh.h, CURLUPART_URL, url.c_str(), kUrlFlags) != CURLUE_OK) return std::nullopt;
    return parts_of(uh.h);
}

std::string url_origin(const UrlParts& u) {
    std::string out = u.scheme + "://" + u.host;
    if (!u.port.empty() && !is_default_port(u.scheme, u.port)) out += ":" + u.port;
    return out;
}

std::string normalize_url(const std::string& url) {
    auto u = parse_url(url);
    if (!u) return trim(url);
    std::string out = url_origin(*u) + u->path;
    if (!u->query.empty()) out += "?" + u->query;
    return out;
}

std::string join_origin(const std::string& base, const std::string& path) {
    auto b = parse_url(base);
    if (!b) throw std::invalid_argument("not an absolute URL: " + base);
    std::string origin = url_origin(*b) + "/";
    std::string rel = path.empty() || path[0] != '/' ? "/" + path : path;

    // Setting a relative URL on a handle holding the origin resolves it against that origin.
    UrlHandle uh;
    if (!uh.h || curl_url_set(uh.h, CURLUPART_URL, origin.c_str(), kUrlFlags) != CURLUE_OK ||
        curl_url_set(uh.h, CURLUPART_URL, rel.c_str(), kUrlFlags) != CURLUE_OK) {
        throw std::invalid_argument("cannot join " + path + " onto " + base);
    }
    auto u = parts_of(uh.h);
    if (!u) throw std::invalid_argument("cannot join " + path + " onto " + base);
    std::string out = url_origin(*u) + u->path;
    if (!u->query.empty()) out += "?" + u->query;
    return out;
}

std::string percent_decode(const std::string& s) {
    int len = 0;
    char* out = curl_easy_unescape(nullptr, s.c_str(), (int)s.size(), &len);
    if (!out) throw std::runtime_error("percent decoding failed");
    std::string v(out, (std::size_t)len);
    curl_free(out);
    return v;
}

std::string registrable_domain(const std::string& host_in) {
    std::string host = to_lower(trim(host_in));
    while (!host.empty() && host.back() == '.') host.pop_back();
    std::vector<std::string> labels;
    std::size_t start = 0;
    while (start <= host.size()) {
        auto dot = host.find('.', start);
        if (dot == std::string::npos) { labels.push_back(host.substr(start)); break; }
        labels.push_back(host.substr(start, dot - start));
        start = dot + 1;
    }
    if (labels.size() <= 2) return host;
    bool ipv4 = std::all_of(labels.begin(), labels.end(), [](const std::string& l) {
        return !l.empty() && std::all_of(l.begin(), l.end(), [](char c) { return c >= '0' && c <= '9'; });
    });
    if (ipv4 || host.find(':') != std::string::npos) return host;
    std::string last_two = labels[labels.size() - 2] + "." + labels.back();
    std::size_t keep = multi_label_suffixes().count(last_two) ? 3 : 2;
    std::string out;
    for (std::size_t i = labels.size() - keep; i < labels.size(); ++i) {
        if (!out.empty()) out += ".";
        out += labels[i];
    }
    return out;
}

bool is_same_registrable_domain(const std::string& url_a, const std::string& url_b) {
    auto a = parse_url(url_a);
    auto b = parse_url(url_b);
    if (!a || !b) return false;
    return registrable_domain(a->host) == registrable_domain(b->host);
}

Priority url_priority(const std::string& url, const std::vector<PriorityRule>& rules) {
    Priority best;
    for (const auto& rule : rules) {
        try {
            std::regex re(rule.regex, std::regex::ECMAScript | std::regex::icase);
            if (std::regex_search(url, re) && rule.priority > best.priority) {
                best.priority = rule.priority;
                best.regex = rule.regex;
            }
        } catch (const std::regex_error& e) {
            spdlog::warn("[url] skipping invalid login page regex '{}': {}", rule.regex, e.what());
        }
    }
    return best;
}

std::string sanitize_for_filename(const std::string& url) {
    std::string out;
    out.reserve(url.size());
    for (char c : url) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '-' || c == '.';
        out.push_back(ok ? c : '_');
    }
    if (out.size() > 120) out.resize(120);
    return out;
}
