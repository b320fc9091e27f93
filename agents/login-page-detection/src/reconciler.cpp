#include "../include/reconciler.hpp"
#include "../../../shared/cpp/agent_sdk/include/util.hpp"
#include <unordered_map>

using json = nlohmann::json;

std::vector<MergedCandidate> merge_candidates(std::vector<Candidate> candidates, const std::string& scan_domain) {
    std::vector<MergedCandidate> out;
    std::unordered_map<std::string, std::size_t> index;

    for (auto& c : candidates) {
        std::string url = trim(c.url);
        if (url.empty()) continue;

        auto it = index.find(url);
        if (it == index.end()) {
            MergedCandidate m;
            m.id = (int)out.size() + 1;
            m.url = url;
            m.strategy = c.strategy;
            m.actions = std::move(c.actions);
            m.scan_domain = scan_domain;
            index.emplace(url, out.size());
            out.push_back(std::move(m));
            continue;
        }

        MergedCandidate& kept = out[it->second];
        if (c.strategy == Strategy::Crawling && kept.strategy != Strategy::Crawling) {
            kept.strategy = c.strategy;
            kept.actions = std::move(c.actions);
        }
    }
    return out;
}

json collector_payload(const std::vector<MergedCandidate>& merged, const std::string& task_id) {
    json list = json::array();
    for (const auto& m : merged) {
        json actions = nullptr;
        if (m.actions) actions = *m.actions;
        list.push_back({{"id", m.id}, {"url", m.url}, {"actions", actions}, {"scan_domain", m.scan_domain}});
    }
    return {{"candidates", list}, {"task_id", task_id}};
}
