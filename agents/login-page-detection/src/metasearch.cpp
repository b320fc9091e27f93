#include "../include/metasearch.hpp"
#include "../include/url.hpp"
#include "../../../shared/cpp/agent_sdk/include/util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <set>

using json = nlohmann::json;

std::string searxng_query_url(const std::string& searxng_url, const std::string& term,
                              const std::vector<std::string>& engines, int page) {
    std::string base = searxng_url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    std::string joined;
    for (auto it = engines.rbegin(); it != engines.rend(); ++it) {
        if (!joined.empty()) joined += ",";
        joined += to_lower(trim(*it));
    }
    return base + "/search?q=" + url_escape(term) + "&engines=" + joined +
           "&safesearch=0&format=json&pageno=" + std::to_string(page);
}

MetasearchStrategy::MetasearchStrategy(MetasearchStrategyConfig cfg, std::vector<PriorityRule> rules,
                                       std::string searxng_url, HttpTransport& http, Screenshotter& shots)
    : cfg_(std::move(cfg)), rules_(std::move(rules)), searxng_url_(std::move(searxng_url)), http_(http),
      shots_(shots) {}

StrategyOutput MetasearchStrategy::discover(const DiscoveryTarget& target, ClassificationOracle& oracle) {
    StrategyOutput out;
    auto resolved = parse_url(target.resolved_url);
    std::string tld = registrable_domain(resolved ? resolved->host : target.domain);
    std::string term = cfg_.search_term;
    for (auto pos = term.find("%s"); pos != std::string::npos; pos = term.find("%s", pos + tld.size())) {
        term.replace(pos, 2, tld);
    }

    const std::size_t wanted = cfg_.search_results_number > 0 ? (std::size_t)cfg_.search_results_number : 0;
    std::set<std::string> checked;
    int hit_ctr = 0;

    for (int page = 1; out.candidates.size() < wanted; ++page) {
        std::size_t before = out.candidates.size();
        std::string url = searxng_query_url(searxng_url_, term, cfg_.search_engines, page);
        spdlog::info("[metasearch] requesting results page #{}: {}", page, url);

        json results;
        try {
            HttpRequest req;
            req.url = url;
            req.headers.push_back("Accept: application/json");
            HttpResponse r = http_.perform(req);
            if (r.status != 200) {
                spdlog::info("[metasearch] searxng returned status {}, stopping", r.status);
                break;
            }
            json data = json::parse(r.body);
            results = data.value("results", json::array());
            auto unresponsive = data.value("unresponsive_engines", json::array());
            if (!unresponsive.empty()) spdlog::info("[metasearch] unresponsive engines: {}", unresponsive.dump());
        } catch (const std::exception& e) {
            spdlog::info("[metasearch] searxng request failed, stopping: {}", e.what());
            break;
        }
        spdlog::info("[metasearch] {} results on page #{}", results.size(), page);

        for (const auto& res : results) {
            ++hit_ctr;
            std::string res_url = res.value("url", "");
            if (res_url.empty() || !is_same_registrable_domain(target.resolved_url, res_url)) continue;
            std::string norm = normalize_url(res_url);
            if (!checked.insert(norm).second) continue;

            // searched with a login keyword already, so any priority qualifies
            Priority prio = url_priority(res_url, rules_);
            auto verdict = inspect_url(norm, shots_, oracle, "metasearch");
            if (!verdict || !verdict->login_present) continue;

            MetasearchInfo info;
            info.result_hit = hit_ctr;
            for (const auto& e : res.value("engines", json::array())) {
                if (e.is_string()) info.result_engines.push_back(to_upper(e.get<std::string>()));
            }
            info.result_raw = res;

            Candidate c;
            c.url = norm;
            c.strategy = Strategy::Metasearch;
            c.priority = prio;
            c.info = std::move(info);
            out.candidates.push_back(std::move(c));
            if (out.candidates.size() >= wanted) break;
        }

        if (out.candidates.size() >= wanted) break;
        if (results.empty()) {
            spdlog::info("[metasearch] no results on page #{}, stopping", page);
            break;
        }
        if (out.candidates.size() == before) {
            spdlog::info("[metasearch] no new candidates on page #{}, stopping", page);
            break;
        }
    }
    spdlog::info("[metasearch] {} candidates for {}", out.candidates.size(), target.resolved_url);
    return out;
}
