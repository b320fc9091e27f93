#include "../include/strategy.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

std::optional<Verdict> inspect_url(const std::string& url, Screenshotter& shots, ClassificationOracle& oracle,
                                   const char* tag) {
    std::string shot;
    try {
        shot = shots.capture(url);
    } catch (const std::exception& e) {
        spdlog::warn("[{}] screenshot failed for {}: {}", tag, url, e.what());
        return std::nullopt;
    }
    try {
        Verdict v = oracle.classify(shot);
        spdlog::info("[{}] {} classified {}", tag, url, v.login_present ? "LOGIN_PRESENT" : "NOT_PRESENT");
        return v;
    } catch (const std::exception& e) {
        spdlog::warn("[{}] classification failed for {} ({}): {}", tag, url, shot, e.what());
        return std::nullopt;
    }
}

void rank_and_truncate(std::vector<Candidate>& candidates, int max) {
    std::stable_sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        int pa = a.priority ? a.priority->priority : 0;
        int pb = b.priority ? b.priority->priority : 0;
        return pa > pb;
    });
    if (max >= 0 && candidates.size() > (std::size_t)max) candidates.resize((std::size_t)max);
}
