#pragma once
#include "task.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

struct MergedCandidate {
    int id{0};
    std::string url;
    Strategy strategy{Strategy::Robots};
    std::optional<CrawlPath> actions;
    std::string scan_domain;
};

// Groups by trimmed URL (empty URLs dropped). Each group keeps its CRAWLING
// record if there is one, else the first seen. Ids are 1..N in first-seen order.
std::vector<MergedCandidate> merge_candidates(std::vector<Candidate> candidates, const std::string& scan_domain);

// {candidates: [{id, url, actions, scan_domain}], task_id}
nlohmann::json collector_payload(const std::vector<MergedCandidate>& merged, const std::string& task_id);
