#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

enum class Strategy { Robots, Sitemap, Metasearch, Crawling };

std::string strategy_name(Strategy s);
// Case-insensitive; throws std::invalid_argument on unknown names.
Strategy strategy_from_name(const std::string& name);

struct Priority {
    int priority{0};
    std::optional<std::string> regex; // rule that produced the score
};

struct RobotsInfo {
    std::string path;
    std::string stm; // "allow" | "disallow"
};

struct SitemapInfo {
    std::optional<double> priority;
    std::optional<double> last_modified; // unix seconds
    std::optional<std::string> change_frequency;
    std::optional<std::string> news_story;
};

struct MetasearchInfo {
    int result_hit{0};
    std::vector<std::string> result_engines;
    nlohmann::json result_raw;
};

struct CrawlingInfo {
    int flow{0};
    int page{0};
    std::string screenshot;
};

using StrategyInfo = std::variant<RobotsInfo, SitemapInfo, MetasearchInfo, CrawlingInfo>;

struct ClickPoint {
    int x{0};
    int y{0};
};

struct CrawlAction {
    int step{0};
    std::optional<ClickPoint> click_position;
    std::optional<std::string> element_html;
    std::string screenshot;
    std::string url;
};

// Replay path for a crawled page: select options applied first, then clicks in order.
struct CrawlPath {
    nlohmann::json select_options; // null when the flow set no select elements
    std::vector<CrawlAction> clicks;
};

struct Candidate {
    std::string url;
    Strategy strategy{Strategy::Robots};
    std::optional<Priority> priority;
    StrategyInfo info;
    std::optional<CrawlPath> actions;
};

struct StrategyError {
    Strategy strategy{Strategy::Robots};
    std::string error;
};

struct SitemapPage {
    std::string url;
    std::optional<double> priority;
    std::optional<double> last_modified;
    std::optional<std::string> change_frequency;
    std::optional<std::string> news_story;
};

struct ResolvedTarget {
    std::string url;
    std::string domain;
};

// Either a failure marker ({"exception": ...}) or a completed analysis.
struct AnalysisResult {
    std::optional<std::string> exception;
    ResolvedTarget resolved;
    std::vector<Candidate> candidates;
    std::vector<StrategyError> strategy_errors;
    std::optional<std::string> robots;
    std::optional<std::vector<SitemapPage>> sitemap;

    static AnalysisResult failure(std::string message);
};

extern const char* const kTimeoutMarker;

enum class TaskState { Received, Running, Completed, TimedOut, ResponseSent };

std::string task_state_name(TaskState s);

struct TaskConfig {
    std::string task_id;
    std::optional<std::string> reply_to;
    std::optional<TaskState> task_state;
    nlohmann::json extra = nlohmann::json::object(); // timestamps and unknown fields, kept verbatim
};

struct Task {
    std::string domain;
    std::string analysis;
    nlohmann::json analysis_config = nlohmann::json::object();
    TaskConfig task_config;
    std::optional<AnalysisResult> result;
    std::optional<long> api_status;
    std::optional<std::string> api_error;
    nlohmann::json extra = nlohmann::json::object(); // everything else in the document

    // Records the transition and its timestamp in task_config.
    void transition(TaskState s, double now);
    std::string scan_domain() const;
};

void to_json(nlohmann::json& j, const Priority& p);
void to_json(nlohmann::json& j, const CrawlPath& p);
void to_json(nlohmann::json& j, const Candidate& c);
void to_json(nlohmann::json& j, const SitemapPage& p);
void to_json(nlohmann::json& j, const AnalysisResult& r);

Candidate candidate_from_json(const nlohmann::json& j);
CrawlPath crawl_path_from_json(const nlohmann::json& j);
AnalysisResult analysis_result_from_json(const nlohmann::json& j);

// Throws std::invalid_argument when required fields are missing.
Task task_from_json(const nlohmann::json& j, const std::string& analysis);
nlohmann::json task_to_json(const Task& t);
