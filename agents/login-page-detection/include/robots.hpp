#pragma once
#include "config.hpp"
#include "strategy.hpp"
#include "../../../shared/cpp/agent_sdk/include/http.hpp"
#include <string>
#include <vector>

struct RobotsPath {
    std::string stm; // "allow" | "disallow"
    std::string path;
};

// Allow/Disallow rules in file order. Only values starting with '/' are kept.
std::vector<RobotsPath> paths_from_robots_txt(const std::string& robots_txt);

// Values of every "Sitemap:" line.
std::vector<std::string> sitemaps_from_robots_txt(const std::string& robots_txt);

// Fetches <origin>/robots.txt; nullopt unless 200 with a text/plain body.
// Transport errors throw.
std::optional<std::string> fetch_robots_txt(HttpTransport& http, const std::string& resolved_url, int timeout_s);

class RobotsStrategy : public CandidateStrategy {
public:
    RobotsStrategy(RobotsStrategyConfig cfg, std::vector<PriorityRule> rules, bool store_robots,
                   HttpTransport& http, Screenshotter& shots);
    Strategy kind() const override { return Strategy::Robots; }
    StrategyOutput discover(const DiscoveryTarget& target, ClassificationOracle& oracle) override;

private:
    RobotsStrategyConfig cfg_;
    std::vector<PriorityRule> rules_;
    bool store_robots_;
    HttpTransport& http_;
    Screenshotter& shots_;
};
