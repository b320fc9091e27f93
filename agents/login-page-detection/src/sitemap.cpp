#include "../include/sitemap.hpp"
#include "../include/robots.hpp"
#include "../include/url.hpp"
#include "../../../shared/cpp/agent_sdk/include/util.hpp"
#include <pugixml.hpp>
#include <zlib.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <deque>
#include <set>
#include <sstream>

namespace {
// "news:title" -> "title"
const char* local_name(const char* tag) {
    const char* colon = std::strchr(tag, ':');
    return colon ? colon + 1 : tag;
}

pugi::xml_node child_named(pugi::xml_node node, const char* name) {
    for (pugi::xml_node c : node.children()) {
        if (c.type() == pugi::node_element && std::strcmp(local_name(c.name()), name) == 0) return c;
    }
    return pugi::xml_node();
}

std::optional<std::string> text_of(pugi::xml_node node, const char* name) {
    pugi::xml_node c = child_named(node, name);
    if (!c) return std::nullopt;
    std::string v = trim(c.text().get());
    if (v.empty()) return std::nullopt;
    return v;
}

SitemapPage page_from_xml(pugi::xml_node url_node) {
    SitemapPage p;
    p.url = text_of(url_node, "loc").value_or("");
    if (auto pr = text_of(url_node, "priority")) {
        try {
            p.priority = std::stod(*pr);
        } catch (const std::exception&) {
            spdlog::debug("[sitemap] bad priority '{}' for {}", *pr, p.url);
        }
    }
    if (auto lm = text_of(url_node, "lastmod")) p.last_modified = parse_w3c_datetime(*lm);
    if (auto cf = text_of(url_node, "changefreq")) p.change_frequency = to_lower(*cf);
    if (pugi::xml_node news = child_named(url_node, "news")) {
        if (auto title = text_of(news, "title")) p.news_story = *title;
    }
    return p;
}

bool looks_like_xml(const std::string& body) {
    std::size_t i = 0;
    if (body.compare(0, 3, "\xEF\xBB\xBF") == 0) i = 3;
    while (i < body.size() && std::isspace((unsigned char)body[i])) ++i;
    return i < body.size() && body[i] == '<';
}
}

bool is_gzip(const std::string& body) {
    return body.size() >= 2 && (unsigned char)body[0] == 0x1f && (unsigned char)body[1] == 0x8b;
}

std::string gunzip(const std::string& body, std::size_t max_bytes) {
    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));
    // 16 + MAX_WBITS: expect a gzip header and trailer
    if (inflateInit2(&stream, 16 + MAX_WBITS) != Z_OK) throw std::runtime_error("inflateInit2 failed");
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(body.data()));
    stream.avail_in = (uInt)body.size();

    std::string out;
    char buf[16384];
    int err = Z_OK;
    while (err != Z_STREAM_END) {
        stream.next_out = reinterpret_cast<Bytef*>(buf);
        stream.avail_out = sizeof(buf);
        err = inflate(&stream, Z_NO_FLUSH);
        if (err != Z_OK && err != Z_STREAM_END) {
            std::string msg = stream.msg ? stream.msg : "truncated stream";
            inflateEnd(&stream);
            throw std::runtime_error("corrupt gzip sitemap: " + msg);
        }
        out.append(buf, sizeof(buf) - stream.avail_out);
        if (max_bytes > 0 && out.size() > max_bytes) {
            inflateEnd(&stream);
            throw std::runtime_error("gzip sitemap inflates past " + std::to_string(max_bytes) + " bytes");
        }
        if (err == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
            inflateEnd(&stream);
            throw std::runtime_error("corrupt gzip sitemap: truncated stream");
        }
    }
    inflateEnd(&stream);
    return out;
}

std::optional<double> parse_w3c_datetime(const std::string& raw) {
    std::string s = trim(raw);
    int y = 0, mo = 1, d = 1, h = 0, mi = 0;
    double sec = 0;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2d%n", &y, &mo, &d, &consumed) != 3) return std::nullopt;
    std::string rest = s.substr((std::size_t)consumed);
    long offset = 0;
    if (!rest.empty() && (rest[0] == 'T' || rest[0] == 't' || rest[0] == ' ')) {
        int n = 0;
        if (std::sscanf(rest.c_str() + 1, "%2d:%2d%n", &h, &mi, &n) != 2) return std::nullopt;
        std::size_t pos = 1 + (std::size_t)n;
        if (pos < rest.size() && rest[pos] == ':') {
            int m = 0;
            if (std::sscanf(rest.c_str() + pos + 1, "%lf%n", &sec, &m) != 1) return std::nullopt;
            pos += 1 + (std::size_t)m;
        }
        std::string tz = rest.substr(pos);
        if (!tz.empty() && tz != "Z" && tz != "z") {
            int oh = 0, om = 0;
            char sign = tz[0];
            if ((sign != '+' && sign != '-') || std::sscanf(tz.c_str() + 1, "%2d:%2d", &oh, &om) != 2) {
                return std::nullopt;
            }
            offset = (sign == '+' ? 1 : -1) * (oh * 3600L + om * 60L);
        }
    } else if (!rest.empty()) {
        return std::nullopt;
    }
    if (mo < 1 || mo > 12 || d < 1 || d > 31 || h > 23 || mi > 59 || sec >= 61) return std::nullopt;

    std::tm tm{};
    tm.tm_year = y - 1900;
    tm.tm_mon = mo - 1;
    tm.tm_mday = d;
    tm.tm_hour = h;
    tm.tm_min = mi;
    double whole = (double)timegm(&tm);
    return whole + sec - (double)offset;
}

SitemapDocument parse_sitemap(const std::string& body) {
    SitemapDocument doc;
    if (!looks_like_xml(body)) {
        std::istringstream in(body);
        std::string line;
        while (std::getline(in, line)) {
            line = trim(line);
            if (line.rfind("http://", 0) == 0 || line.rfind("https://", 0) == 0) {
                SitemapPage p;
                p.url = line;
                doc.pages.push_back(std::move(p));
            }
        }
        return doc;
    }

    pugi::xml_document xml;
    pugi::xml_parse_result parsed = xml.load_buffer(body.data(), body.size());
    if (!parsed) throw std::runtime_error(std::string("malformed sitemap XML: ") + parsed.description());

    pugi::xml_node root = xml.document_element();
    std::string name = local_name(root.name());
    if (name == "urlset") {
        for (pugi::xml_node u : root.children()) {
            if (u.type() != pugi::node_element || std::strcmp(local_name(u.name()), "url") != 0) continue;
            SitemapPage p = page_from_xml(u);
            if (!p.url.empty()) doc.pages.push_back(std::move(p));
        }
    } else if (name == "sitemapindex") {
        for (pugi::xml_node sm : root.children()) {
            if (sm.type() != pugi::node_element || std::strcmp(local_name(sm.name()), "sitemap") != 0) continue;
            if (auto loc = text_of(sm, "loc")) doc.sitemaps.push_back(*loc);
        }
    } else {
        throw std::runtime_error("unsupported sitemap root <" + std::string(root.name()) + ">");
    }
    return doc;
}

std::vector<SitemapPage> collect_sitemap_pages(HttpTransport& http, const std::vector<std::string>& roots,
                                               const SitemapStrategyConfig& cfg) {
    std::vector<SitemapPage> pages;
    std::set<std::string> seen;
    std::deque<std::pair<std::string, int>> todo;
    for (const auto& r : roots) {
        if (seen.insert(r).second) todo.emplace_back(r, 0);
    }

    while (!todo.empty()) {
        auto [url, depth] = todo.front();
        todo.pop_front();

        HttpRequest req;
        req.url = url;
        req.timeout_ms = (long)cfg.timeout_fetch_sitemap * 1000;
        req.max_body_bytes = (std::size_t)cfg.max_sitemap_size;
        HttpResponse r;
        try {
            r = http.perform(req);
        } catch (const std::exception& e) {
            spdlog::warn("[sitemap] fetching {} failed: {}", url, e.what());
            continue;
        }
        if (r.status != 200) {
            spdlog::debug("[sitemap] {} returned {}", url, r.status);
            continue;
        }

        SitemapDocument doc;
        try {
            // .xml.gz files and gzip bodies sent without Content-Encoding
            doc = parse_sitemap(is_gzip(r.body) ? gunzip(r.body, (std::size_t)cfg.max_sitemap_size) : r.body);
        } catch (const std::exception& e) {
            spdlog::warn("[sitemap] {}: {}", url, e.what());
            continue;
        }
        spdlog::info("[sitemap] {}: {} pages, {} sub-sitemaps", url, doc.pages.size(), doc.sitemaps.size());

        for (auto& p : doc.pages) pages.push_back(std::move(p));
        if (depth + 1 > cfg.max_recursion_level) {
            if (!doc.sitemaps.empty()) spdlog::info("[sitemap] recursion limit reached at {}", url);
            continue;
        }
        for (const auto& child : doc.sitemaps) {
            if (seen.insert(child).second) todo.emplace_back(child, depth + 1);
        }
    }
    return pages;
}

SitemapStrategy::SitemapStrategy(SitemapStrategyConfig cfg, std::vector<PriorityRule> rules, bool store_sitemap,
                                 HttpTransport& http, Screenshotter& shots)
    : cfg_(cfg), rules_(std::move(rules)), store_sitemap_(store_sitemap), http_(http), shots_(shots) {}

std::vector<std::string> SitemapStrategy::sitemap_roots(const std::string& resolved_url) {
    std::vector<std::string> roots;
    try {
        if (auto robots = fetch_robots_txt(http_, resolved_url, cfg_.timeout_fetch_sitemap)) {
            roots = sitemaps_from_robots_txt(*robots);
        }
    } catch (const std::exception& e) {
        spdlog::info("[sitemap] robots.txt unavailable for {}: {}", resolved_url, e.what());
    }
    roots.push_back(join_origin(resolved_url, "/sitemap.xml"));
    roots.push_back(join_origin(resolved_url, "/sitemap_index.xml"));
    return roots;
}

StrategyOutput SitemapStrategy::discover(const DiscoveryTarget& target, ClassificationOracle& oracle) {
    StrategyOutput out;
    std::vector<SitemapPage> pages = collect_sitemap_pages(http_, sitemap_roots(target.resolved_url), cfg_);

    std::set<std::string> checked;
    for (const auto& page : pages) {
        Priority prio = url_priority(page.url, rules_);
        if (prio.priority <= 0) continue;
        if (!is_same_registrable_domain(target.resolved_url, page.url)) continue;
        std::string url = normalize_url(page.url);
        if (!checked.insert(url).second) continue;

        auto verdict = inspect_url(url, shots_, oracle, "sitemap");
        if (!verdict || !verdict->login_present) continue;

        Candidate c;
        c.url = url;
        c.strategy = Strategy::Sitemap;
        c.priority = prio;
        c.info = SitemapInfo{page.priority, page.last_modified, page.change_frequency, page.news_story};
        out.candidates.push_back(std::move(c));
    }
    rank_and_truncate(out.candidates, cfg_.max_candidates);
    if (store_sitemap_ && !pages.empty()) out.sitemap = std::move(pages);
    spdlog::info("[sitemap] {} candidates for {}", out.candidates.size(), target.resolved_url);
    return out;
}
