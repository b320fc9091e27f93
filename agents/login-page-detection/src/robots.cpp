#include "../include/robots.hpp"
#include "../include/url.hpp"
#include "../../../shared/cpp/agent_sdk/include/util.hpp"
#include <spdlog/spdlog.h>
#include <set>
#include <sstream>
#include <stdexcept>

namespace {
// Splits "field: value" after stripping comments; false for blank or malformed lines.
bool split_directive(std::string line, std::string& field, std::string& value) {
    auto hash = line.find('#');
    if (hash != std::string::npos) line.erase(hash);
    line = trim(line);
    if (line.empty()) return false;
    auto colon = line.find(':');
    if (colon == std::string::npos) return false;
    field = to_lower(trim(line.substr(0, colon)));
    value = trim(line.substr(colon + 1));
    return true;
}
}

std::vector<RobotsPath> paths_from_robots_txt(const std::string& robots_txt) {
    std::vector<RobotsPath> out;
    std::istringstream in(robots_txt);
    std::string line, field, value;
    while (std::getline(in, line)) {
        if (!split_directive(line, field, value)) continue;
        if (field != "allow" && field != "disallow") continue;
        value = percent_decode(value);
        if (!value.empty() && value[0] == '/') out.push_back({field, value});
    }
    return out;
}

std::vector<std::string> sitemaps_from_robots_txt(const std::string& robots_txt) {
    std::vector<std::string> out;
    std::istringstream in(robots_txt);
    std::string line, field, value;
    while (std::getline(in, line)) {
        // URLs may contain '#', so don't strip comments here
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        if (to_lower(trim(line.substr(0, colon))) != "sitemap") continue;
        value = trim(line.substr(colon + 1));
        if (!value.empty()) out.push_back(value);
    }
    return out;
}

std::optional<std::string> fetch_robots_txt(HttpTransport& http, const std::string& resolved_url, int timeout_s) {
    std::string robots_url = join_origin(resolved_url, "/robots.txt");
    spdlog::info("[robots] requesting {}", robots_url);
    HttpResponse r = http_get(http, robots_url, (long)timeout_s * 1000);
    if (r.status != 200 || to_lower(r.content_type).find("text/plain") == std::string::npos) {
        spdlog::info("[robots] no robots.txt on {} (status {}, content type '{}')", robots_url, r.status,
                     r.content_type);
        return std::nullopt;
    }
    return r.body;
}

RobotsStrategy::RobotsStrategy(RobotsStrategyConfig cfg, std::vector<PriorityRule> rules, bool store_robots,
                               HttpTransport& http, Screenshotter& shots)
    : cfg_(cfg), rules_(std::move(rules)), store_robots_(store_robots), http_(http), shots_(shots) {}

StrategyOutput RobotsStrategy::discover(const DiscoveryTarget& target, ClassificationOracle& oracle) {
    StrategyOutput out;
    auto robots_txt = fetch_robots_txt(http_, target.resolved_url, cfg_.timeout_fetch_robots);
    if (!robots_txt) return out;
    if (store_robots_) out.robots_txt = *robots_txt;

    std::set<std::string> checked;
    for (const auto& rp : paths_from_robots_txt(*robots_txt)) {
        Priority prio = url_priority(rp.path, rules_);
        if (prio.priority <= 0) continue;
        std::string url;
        try {
            url = normalize_url(join_origin(target.resolved_url, rp.path));
        } catch (const std::invalid_argument& e) {
            spdlog::debug("[robots] skipping {}: {}", rp.path, e.what());
            continue;
        }
        if (!checked.insert(url).second) continue;

        auto verdict = inspect_url(url, shots_, oracle, "robots");
        if (!verdict || !verdict->login_present) continue;

        Candidate c;
        c.url = url;
        c.strategy = Strategy::Robots;
        c.priority = prio;
        c.info = RobotsInfo{rp.path, rp.stm};
        out.candidates.push_back(std::move(c));
    }
    rank_and_truncate(out.candidates, cfg_.max_candidates);
    spdlog::info("[robots] {} candidates for {}", out.candidates.size(), target.resolved_url);
    return out;
}
