#pragma once
#include "config.hpp"
#include "strategy.hpp"
#include "../../../shared/cpp/agent_sdk/include/http.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

struct SitemapDocument {
    std::vector<std::string> sitemaps; // <sitemapindex> children
    std::vector<SitemapPage> pages;    // <urlset> entries or plain-text lines
};

// Accepts <urlset>, <sitemapindex> and plain text (one URL per line).
// Throws std::runtime_error on malformed XML or an unknown root element.
SitemapDocument parse_sitemap(const std::string& body);

// True when the body starts with the gzip magic bytes.
bool is_gzip(const std::string& body);

// Inflates a gzip body. Throws std::runtime_error on corrupt data or when the
// output would exceed max_bytes.
std::string gunzip(const std::string& body, std::size_t max_bytes);

// W3C datetime ("2024-03-01", "2024-03-01T10:00:00+02:00", ...) as unix seconds.
std::optional<double> parse_w3c_datetime(const std::string& s);

// Walks every sitemap reachable from the roots, depth-limited, each body capped.
// Unreachable or broken sitemaps are logged and skipped.
std::vector<SitemapPage> collect_sitemap_pages(HttpTransport& http, const std::vector<std::string>& roots,
                                               const SitemapStrategyConfig& cfg);

class SitemapStrategy : public CandidateStrategy {
public:
    SitemapStrategy(SitemapStrategyConfig cfg, std::vector<PriorityRule> rules, bool store_sitemap,
                    HttpTransport& http, Screenshotter& shots);
    Strategy kind() const override { return Strategy::Sitemap; }
    StrategyOutput discover(const DiscoveryTarget& target, ClassificationOracle& oracle) override;

private:
    std::vector<std::string> sitemap_roots(const std::string& resolved_url);

    SitemapStrategyConfig cfg_;
    std::vector<PriorityRule> rules_;
    bool store_sitemap_;
    HttpTransport& http_;
    Screenshotter& shots_;
};
