#include "../include/task.hpp"
#include <stdexcept>
#include "../../../shared/cpp/agent_sdk/include/util.hpp"

using json = nlohmann::json;

const char* const kTimeoutMarker = "Process timeout";

namespace {
template <typename T>
json opt(const std::optional<T>& v) {
    return v ? json(*v) : json(nullptr);
}

template <typename T>
std::optional<T> opt_from(const json& j, const char* key) {
    if (!j.is_object() || !j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<T>();
}

struct InfoToJson {
    json operator()(const RobotsInfo& i) const { return {{"path", i.path}, {"stm", i.stm}}; }
    json operator()(const SitemapInfo& i) const {
        return {{"priority", opt(i.priority)}, {"last_modified", opt(i.last_modified)},
                {"change_frequency", opt(i.change_frequency)}, {"news_story", opt(i.news_story)}};
    }
    json operator()(const MetasearchInfo& i) const {
        return {{"result_hit", i.result_hit}, {"result_engines", i.result_engines}, {"result_raw", i.result_raw}};
    }
    json operator()(const CrawlingInfo& i) const {
        return {{"flow", i.flow}, {"page", i.page}, {"screenshot", i.screenshot}};
    }
};

StrategyInfo info_from_json(Strategy s, const json& j) {
    json o = j.is_object() ? j : json::object();
    switch (s) {
    case Strategy::Robots:
        return RobotsInfo{o.value("path", std::string()), o.value("stm", std::string())};
    case Strategy::Sitemap:
        return SitemapInfo{opt_from<double>(o, "priority"), opt_from<double>(o, "last_modified"),
                           opt_from<std::string>(o, "change_frequency"), opt_from<std::string>(o, "news_story")};
    case Strategy::Metasearch: {
        MetasearchInfo m;
        m.result_hit = o.value("result_hit", 0);
        m.result_engines = o.value("result_engines", std::vector<std::string>());
        m.result_raw = o.value("result_raw", json());
        return m;
    }
    case Strategy::Crawling:
        return CrawlingInfo{o.value("flow", 0), o.value("page", 0), o.value("screenshot", std::string())};
    }
    throw std::invalid_argument("unknown strategy");
}

const char* timestamp_key(TaskState s) {
    switch (s) {
    case TaskState::Received: return "task_timestamp_request_received";
    case TaskState::Running: return "task_timestamp_running";
    case TaskState::Completed: return "task_timestamp_completed";
    case TaskState::TimedOut: return "task_timestamp_timed_out";
    case TaskState::ResponseSent: return "task_timestamp_response_sent";
    }
    return "task_timestamp_unknown";
}

std::optional<TaskState> task_state_from_name(const std::string& name) {
    for (TaskState s : {TaskState::Received, TaskState::Running, TaskState::Completed,
                        TaskState::TimedOut, TaskState::ResponseSent}) {
        if (task_state_name(s) == name) return s;
    }
    return std::nullopt;
}
}

std::string strategy_name(Strategy s) {
    switch (s) {
    case Strategy::Robots: return "ROBOTS";
    case Strategy::Sitemap: return "SITEMAP";
    case Strategy::Metasearch: return "METASEARCH";
    case Strategy::Crawling: return "CRAWLING";
    }
    return "UNKNOWN";
}

Strategy strategy_from_name(const std::string& name) {
    std::string n = to_upper(trim(name));
    if (n == "ROBOTS") return Strategy::Robots;
    if (n == "SITEMAP") return Strategy::Sitemap;
    if (n == "METASEARCH") return Strategy::Metasearch;
    if (n == "CRAWLING") return Strategy::Crawling;
    throw std::invalid_argument("unknown login page strategy: " + name);
}

std::string task_state_name(TaskState s) {
    switch (s) {
    case TaskState::Received: return "RECEIVED";
    case TaskState::Running: return "RUNNING";
    case TaskState::Completed: return "COMPLETED";
    case TaskState::TimedOut: return "TIMED_OUT";
    case TaskState::ResponseSent: return "RESPONSE_SENT";
    }
    return "UNKNOWN";
}

AnalysisResult AnalysisResult::failure(std::string message) {
    AnalysisResult r;
    r.exception = std::move(message);
    return r;
}

void Task::transition(TaskState s, double now) {
    task_config.task_state = s;
    task_config.extra[timestamp_key(s)] = now;
}

std::string Task::scan_domain() const {
    if (extra.contains("scan_config") && extra["scan_config"].is_object()) {
        const auto& sc = extra["scan_config"];
        if (sc.contains("domain") && sc["domain"].is_string() && !sc["domain"].get<std::string>().empty()) {
            return sc["domain"].get<std::string>();
        }
    }
    return domain;
}

void to_json(json& j, const Priority& p) {
    j = {{"priority", p.priority}, {"regex", opt(p.regex)}};
}

void to_json(json& j, const CrawlPath& p) {
    j = json::array();
    j.push_back({{"selectOptions", p.select_options}});
    for (const auto& a : p.clicks) {
        json click = a.click_position ? json{{"x", a.click_position->x}, {"y", a.click_position->y}} : json(nullptr);
        j.push_back({{"step", a.step}, {"clickPosition", click}, {"elementHTML", opt(a.element_html)},
                     {"screenshot", a.screenshot}, {"url", a.url}});
    }
}

void to_json(json& j, const Candidate& c) {
    j = {
        {"login_page_candidate", c.url},
        {"login_page_strategy", strategy_name(c.strategy)},
        {"login_page_priority", c.priority ? json(*c.priority) : json(nullptr)},
        {"login_page_info", std::visit(InfoToJson{}, c.info)}
    };
    if (c.actions) j["login_page_actions"] = *c.actions;
}

void to_json(json& j, const SitemapPage& p) {
    j = {{"url", p.url}, {"priority", opt(p.priority)}, {"last_modified", opt(p.last_modified)},
         {"change_frequency", opt(p.change_frequency)}, {"news_story", opt(p.news_story)}};
}

void to_json(json& j, const AnalysisResult& r) {
    if (r.exception) {
        j = {{"exception", *r.exception}};
        return;
    }
    json errors = json::array();
    for (const auto& e : r.strategy_errors) {
        errors.push_back({{"strategy", strategy_name(e.strategy)}, {"error", e.error}});
    }
    j = {
        {"resolved", {{"url", r.resolved.url}, {"domain", r.resolved.domain}}},
        {"login_page_candidates", r.candidates},
        {"login_page_strategy_errors", errors}
    };
    if (r.robots) j["robots"] = *r.robots;
    if (r.sitemap) j["sitemap"] = *r.sitemap;
}

CrawlPath crawl_path_from_json(const json& j) {
    if (!j.is_array()) throw std::invalid_argument("crawl actions must be an array");
    CrawlPath p;
    for (const auto& e : j) {
        if (!e.is_object()) throw std::invalid_argument("crawl action must be an object");
        if (e.contains("selectOptions")) {
            p.select_options = e["selectOptions"];
            continue;
        }
        CrawlAction a;
        a.step = e.at("step").get<int>();
        if (e.contains("clickPosition") && e["clickPosition"].is_object()) {
            a.click_position = ClickPoint{e["clickPosition"].at("x").get<int>(), e["clickPosition"].at("y").get<int>()};
        }
        a.element_html = opt_from<std::string>(e, "elementHTML");
        a.screenshot = e.value("screenshot", std::string());
        a.url = e.value("url", std::string());
        p.clicks.push_back(std::move(a));
    }
    return p;
}

Candidate candidate_from_json(const json& j) {
    Candidate c;
    c.url = j.at("login_page_candidate").get<std::string>();
    c.strategy = strategy_from_name(j.at("login_page_strategy").get<std::string>());
    if (j.contains("login_page_priority") && j["login_page_priority"].is_object()) {
        const auto& p = j["login_page_priority"];
        c.priority = Priority{p.value("priority", 0), opt_from<std::string>(p, "regex")};
    }
    c.info = info_from_json(c.strategy, j.value("login_page_info", json::object()));
    if (j.contains("login_page_actions") && j["login_page_actions"].is_array()) {
        c.actions = crawl_path_from_json(j["login_page_actions"]);
    }
    return c;
}

AnalysisResult analysis_result_from_json(const json& j) {
    if (!j.is_object()) throw std::invalid_argument("analysis result must be an object");
    if (j.contains("exception")) {
        const auto& e = j["exception"];
        return AnalysisResult::failure(e.is_string() ? e.get<std::string>() : e.dump());
    }
    AnalysisResult r;
    if (j.contains("resolved") && j["resolved"].is_object()) {
        r.resolved.url = j["resolved"].value("url", std::string());
        r.resolved.domain = j["resolved"].value("domain", std::string());
    }
    for (const auto& c : j.value("login_page_candidates", json::array())) {
        r.candidates.push_back(candidate_from_json(c));
    }
    for (const auto& e : j.value("login_page_strategy_errors", json::array())) {
        r.strategy_errors.push_back({strategy_from_name(e.at("strategy").get<std::string>()),
                                     e.value("error", std::string())});
    }
    if (j.contains("robots") && j["robots"].is_string()) r.robots = j["robots"].get<std::string>();
    if (j.contains("sitemap") && j["sitemap"].is_array()) {
        std::vector<SitemapPage> pages;
        for (const auto& p : j["sitemap"]) {
            pages.push_back({p.value("url", std::string()), opt_from<double>(p, "priority"),
                             opt_from<double>(p, "last_modified"), opt_from<std::string>(p, "change_frequency"),
                             opt_from<std::string>(p, "news_story")});
        }
        r.sitemap = std::move(pages);
    }
    return r;
}

Task task_from_json(const json& j, const std::string& analysis) {
    if (!j.is_object()) throw std::invalid_argument("task must be a JSON object");
    if (!j.contains("domain") || !j["domain"].is_string() || j["domain"].get<std::string>().empty()) {
        throw std::invalid_argument("task has no domain");
    }
    const std::string config_key = analysis + "_config";
    const std::string result_key = analysis + "_result";

    Task t;
    t.analysis = analysis;
    t.domain = j["domain"].get<std::string>();
    if (j.contains(config_key) && j[config_key].is_object()) t.analysis_config = j[config_key];

    json tc = j.value("task_config", json::object());
    if (!tc.is_object()) throw std::invalid_argument("task_config must be an object");
    if (tc.contains("task_id") && !tc["task_id"].is_null()) {
        t.task_config.task_id = tc["task_id"].is_string() ? tc["task_id"].get<std::string>() : tc["task_id"].dump();
    }
    if (tc.contains("reply_to") && tc["reply_to"].is_string() && !tc["reply_to"].get<std::string>().empty()) {
        t.task_config.reply_to = tc["reply_to"].get<std::string>();
    }
    if (tc.contains("task_state") && tc["task_state"].is_string()) {
        t.task_config.task_state = task_state_from_name(tc["task_state"].get<std::string>());
    }
    for (auto it = tc.begin(); it != tc.end(); ++it) {
        if (it.key() == "task_id" || it.key() == "reply_to" || it.key() == "task_state") continue;
        t.task_config.extra[it.key()] = it.value();
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        const auto& k = it.key();
        if (k == "domain" || k == config_key || k == result_key || k == "task_config" ||
            k == "api_status" || k == "api_error") continue;
        t.extra[k] = it.value();
    }
    return t;
}

json task_to_json(const Task& t) {
    json j = t.extra;
    j["domain"] = t.domain;
    j[t.analysis + "_config"] = t.analysis_config;

    json tc = t.task_config.extra;
    tc["task_id"] = t.task_config.task_id;
    if (t.task_config.reply_to) tc["reply_to"] = *t.task_config.reply_to;
    if (t.task_config.task_state) tc["task_state"] = task_state_name(*t.task_config.task_state);
    j["task_config"] = tc;

    j[t.analysis + "_result"] = t.result ? json(*t.result) : json::object();
    if (t.api_status) {
        j["api_status"] = *t.api_status;
        j["api_error"] = opt(t.api_error);
    }
    return j;
}
