#include "../include/crawling.hpp"
#include "../include/process.hpp"
#include "../include/url.hpp"
#include "../../../shared/cpp/agent_sdk/include/util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {
struct PageRef {
    int flow;
    int page;
    fs::path path;
};

std::vector<std::pair<int, fs::path>> numbered_entries(const fs::path& dir, const std::string& prefix,
                                                       const std::string& suffix, bool want_dirs) {
    std::vector<std::pair<int, fs::path>> out;
    for (const auto& e : fs::directory_iterator(dir)) {
        std::string name = e.path().filename().string();
        if (e.is_directory() != want_dirs) {
            throw std::runtime_error("unexpected entry in crawl output: " + e.path().string());
        }
        out.emplace_back(parse_numbered_name(name, prefix, suffix), e.path());
    }
    std::sort(out.begin(), out.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    return out;
}

CrawlPath load_flow_actions(const fs::path& actions_dir, int flow) {
    std::string flow_name = "flow_" + std::to_string(flow);
    fs::path file = actions_dir / flow_name / ("click_actions_flow_" + std::to_string(flow) + ".json");
    json j;
    try {
        j = json::parse(read_text_file(file));
    } catch (const json::exception& e) {
        throw std::runtime_error("bad action log " + file.string() + ": " + e.what());
    }
    return crawl_path_from_json(j);
}
}

SubprocessCrawler::SubprocessCrawler(std::vector<std::string> command, std::string output_root,
                                     std::string actions_root)
    : command_(std::move(command)), output_root_(std::move(output_root)), actions_root_(std::move(actions_root)) {
    if (command_.empty()) throw std::invalid_argument("empty crawler command");
}

CrawlOutcome SubprocessCrawler::run(const std::string& domain) {
    std::vector<std::string> argv = command_;
    argv.push_back(domain);
    spdlog::info("[crawling] starting crawler for {}", domain);

    ProcessOptions opts;
    opts.on_line = [](const std::string& line) { spdlog::info("[crawler] {}", line); };
    ProcessResult r = run_process(argv, opts);

    CrawlOutcome out;
    out.exit_status = r.exit_code;
    std::string dir = crawl_directory_name(domain);
    out.output_directory = (fs::path(output_root_) / dir).string();
    out.actions_directory = (fs::path(actions_root_) / dir).string();
    return out;
}

std::string crawl_directory_name(const std::string& domain) {
    std::string s = domain;
    for (const char* scheme : {"https://", "http://"}) {
        if (s.rfind(scheme, 0) == 0) {
            s = s.substr(std::string(scheme).size());
            break;
        }
    }
    for (auto& c : s) {
        if (!std::isalnum((unsigned char)c) && c != '_') c = '_';
    }
    return s;
}

int parse_numbered_name(const std::string& name, const std::string& prefix, const std::string& suffix) {
    bool ok = name.size() > prefix.size() + suffix.size() && name.compare(0, prefix.size(), prefix) == 0 &&
              name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
    std::string digits = ok ? name.substr(prefix.size(), name.size() - prefix.size() - suffix.size()) : "";
    ok = ok && digits.size() <= 9 &&
         std::all_of(digits.begin(), digits.end(), [](char c) { return std::isdigit((unsigned char)c); });
    if (!ok) throw std::runtime_error("malformed crawl file name '" + name + "', expected " + prefix + "<N>" + suffix);
    return std::stoi(digits);
}

std::vector<Candidate> candidates_from_crawl(const CrawlOutcome& outcome) {
    std::vector<Candidate> out;
    fs::path output_dir(outcome.output_directory);
    if (!fs::is_directory(output_dir)) {
        spdlog::info("[crawling] no classified pages in {}", output_dir.string());
        return out;
    }

    std::map<std::string, std::size_t> by_url;
    for (const auto& [flow, flow_dir] : numbered_entries(output_dir, "flow_", "", true)) {
        auto pages = numbered_entries(flow_dir, "page_", ".png", false);
        if (pages.empty()) continue;
        CrawlPath log = load_flow_actions(outcome.actions_directory, flow);

        for (const auto& [page, page_path] : pages) {
            std::string file = page_path.filename().string();
            auto hit = std::find_if(log.clicks.begin(), log.clicks.end(), [&](const CrawlAction& a) {
                return fs::path(a.screenshot).filename().string() == file;
            });
            if (hit == log.clicks.end()) {
                throw std::runtime_error("flow_" + std::to_string(flow) + " has no action for " + file);
            }
            if (hit->url.empty()) {
                spdlog::warn("[crawling] flow_{}/{} has no URL, skipping", flow, file);
                continue;
            }

            CrawlPath replay;
            replay.select_options = log.select_options;
            replay.clicks.assign(log.clicks.begin(), hit);

            Candidate c;
            c.url = normalize_url(hit->url);
            c.strategy = Strategy::Crawling;
            c.info = CrawlingInfo{flow, page, page_path.string()};
            c.actions = std::move(replay);

            auto it = by_url.find(c.url);
            if (it == by_url.end()) {
                by_url.emplace(c.url, out.size());
                out.push_back(std::move(c));
            } else if (c.actions->clicks.size() < out[it->second].actions->clicks.size()) {
                // flows and pages are visited in ascending order, so ties keep the earlier one
                out[it->second] = std::move(c);
            }
        }
    }
    return out;
}

CrawlingStrategy::CrawlingStrategy(ExternalCrawler& crawler) : crawler_(crawler) {}

StrategyOutput CrawlingStrategy::discover(const DiscoveryTarget& target, ClassificationOracle&) {
    CrawlOutcome outcome = crawler_.run(target.domain);
    if (outcome.exit_status != 0) {
        throw std::runtime_error("crawler exited with status " + std::to_string(outcome.exit_status));
    }
    StrategyOutput out;
    out.candidates = candidates_from_crawl(outcome);
    spdlog::info("[crawling] {} candidates for {}", out.candidates.size(), target.domain);
    return out;
}
