#pragma once
#include "config.hpp"
#include "strategy.hpp"
#include "../../../shared/cpp/agent_sdk/include/http.hpp"
#include <string>
#include <vector>

// "<base>/search?q=...&engines=...&safesearch=0&format=json&pageno=<page>"
// Engines are lowercased and joined in reverse order.
std::string searxng_query_url(const std::string& searxng_url, const std::string& term,
                              const std::vector<std::string>& engines, int page);

class MetasearchStrategy : public CandidateStrategy {
public:
    MetasearchStrategy(MetasearchStrategyConfig cfg, std::vector<PriorityRule> rules, std::string searxng_url,
                       HttpTransport& http, Screenshotter& shots);
    Strategy kind() const override { return Strategy::Metasearch; }
    StrategyOutput discover(const DiscoveryTarget& target, ClassificationOracle& oracle) override;

private:
    MetasearchStrategyConfig cfg_;
    std::vector<PriorityRule> rules_;
    std::string searxng_url_;
    HttpTransport& http_;
    Screenshotter& shots_;
};
