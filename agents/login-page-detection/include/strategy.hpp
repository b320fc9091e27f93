#pragma once
#include "oracle.hpp"
#include "screenshot.hpp"
#include "task.hpp"
#include <optional>
#include <string>
#include <vector>

struct DiscoveryTarget {
    std::string domain;
    std::string resolved_url;
};

struct StrategyOutput {
    std::vector<Candidate> candidates;
    std::optional<std::string> robots_txt;
    std::optional<std::vector<SitemapPage>> sitemap;
};

// A strategy throws only when its whole contribution is lost (source
// unreachable, crawler failed); per-URL problems are logged and skipped.
class CandidateStrategy {
public:
    virtual ~CandidateStrategy() = default;
    virtual Strategy kind() const = 0;
    virtual StrategyOutput discover(const DiscoveryTarget& target, ClassificationOracle& oracle) = 0;
};

// Screenshot + classify. nullopt when either step failed (already logged).
std::optional<Verdict> inspect_url(const std::string& url, Screenshotter& shots, ClassificationOracle& oracle,
                                   const char* tag);

// Stable sort by descending priority, then cut to max.
void rank_and_truncate(std::vector<Candidate>& candidates, int max);
