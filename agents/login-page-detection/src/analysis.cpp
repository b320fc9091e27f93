#include "../include/analysis.hpp"
#include "../include/metasearch.hpp"
#include "../include/robots.hpp"
#include "../include/sitemap.hpp"
#include "../include/url.hpp"
#include "../../../shared/cpp/agent_sdk/include/util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <map>

using json = nlohmann::json;

ResolvedTarget resolve_domain(HttpTransport& http, const std::string& domain, long timeout_ms) {
    for (const char* scheme : {"https://", "http://"}) {
        std::string url = std::string(scheme) + domain + "/";
        try {
            HttpResponse r = http_get(http, url, timeout_ms);
            std::string effective = r.effective_url.empty() ? url : r.effective_url;
            auto parts = parse_url(effective);
            spdlog::info("[analysis] resolved {} to {} (status {})", domain, effective, r.status);
            return ResolvedTarget{normalize_url(effective), parts ? parts->host : domain};
        } catch (const std::exception& e) {
            spdlog::info("[analysis] {} unreachable: {}", url, e.what());
        }
    }
    spdlog::warn("[analysis] could not resolve {}, assuming https", domain);
    return ResolvedTarget{"https://" + domain + "/", domain};
}

std::vector<std::unique_ptr<CandidateStrategy>> build_strategies(const LoginPageConfig& cfg, AnalysisDeps& deps) {
    std::vector<std::unique_ptr<CandidateStrategy>> out;
    for (Strategy s : cfg.strategy_scope) {
        switch (s) {
        case Strategy::Robots:
            out.push_back(std::make_unique<RobotsStrategy>(cfg.robots, cfg.url_regexes, cfg.store_robots, deps.http,
                                                           deps.shots));
            break;
        case Strategy::Sitemap:
            out.push_back(std::make_unique<SitemapStrategy>(cfg.sitemap, cfg.url_regexes, cfg.store_sitemap,
                                                            deps.http, deps.shots));
            break;
        case Strategy::Metasearch:
            out.push_back(std::make_unique<MetasearchStrategy>(cfg.metasearch, cfg.url_regexes, deps.searxng_url,
                                                               deps.http, deps.shots));
            break;
        case Strategy::Crawling:
            out.push_back(std::make_unique<CrawlingStrategy>(deps.crawler));
            break;
        }
    }
    return out;
}

AnalysisResult run_landscape_analysis(const Task& task, AnalysisDeps& deps) {
    LoginPageConfig cfg = login_page_config_from_json(task.analysis_config);

    AnalysisResult result;
    result.resolved = resolve_domain(deps.http, task.domain);
    DiscoveryTarget target{task.domain, result.resolved.url};

    for (auto& strategy : build_strategies(cfg, deps)) {
        std::string name = strategy_name(strategy->kind());
        spdlog::info("[analysis] running {} for {}", name, task.domain);
        try {
            StrategyOutput out = strategy->discover(target, deps.oracle);
            for (auto& c : out.candidates) result.candidates.push_back(std::move(c));
            if (out.robots_txt) result.robots = std::move(out.robots_txt);
            if (out.sitemap) result.sitemap = std::move(out.sitemap);
        } catch (const std::exception& e) {
            spdlog::error("[analysis] {} failed for {}: {}", name, task.domain, e.what());
            result.strategy_errors.push_back({strategy->kind(), e.what()});
        }
    }
    spdlog::info("[analysis] {} raw candidates for {}", result.candidates.size(), task.domain);
    return result;
}

const AnalysisFn* find_analysis(const std::string& name) {
    static const std::map<std::string, AnalysisFn> registry = {
        {"landscape_analysis", run_landscape_analysis},
    };
    auto it = registry.find(name);
    return it == registry.end() ? nullptr : &it->second;
}

int run_analysis_child(const WorkerConfig& cfg, const std::string& analysis, const std::string& task_file,
                       const std::string& result_file) {
    AnalysisResult result;
    try {
        const AnalysisFn* fn = find_analysis(analysis);
        if (!fn) throw std::invalid_argument("unknown analysis: " + analysis);

        Task task = task_from_json(json::parse(read_text_file(task_file)), analysis);

        CurlTransport http;
        auto oracle = make_oracle(cfg.oracle, http);
        CommandScreenshotter shots(split_command(cfg.screenshot_cmd), cfg.screenshot_dir,
                                   std::chrono::seconds(cfg.screenshot_timeout_s));
        SubprocessCrawler crawler(split_command(cfg.crawler_cmd), cfg.crawler_output_dir, cfg.crawler_actions_dir);
        AnalysisDeps deps{http, *oracle, shots, crawler, cfg.searxng_url};

        result = (*fn)(task, deps);
    } catch (const std::exception& e) {
        spdlog::error("[analysis] {}", e.what());
        result = AnalysisResult::failure(e.what());
    }

    try {
        json j = result;
        write_text_file(result_file, j.dump());
    } catch (const std::exception& e) {
        spdlog::critical("[analysis] cannot write result to {}: {}", result_file, e.what());
        return 2;
    }
    return 0;
}
