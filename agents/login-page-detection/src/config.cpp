#include "../include/config.hpp"
#include "../../../shared/cpp/agent_sdk/include/util.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace {
const std::vector<PriorityRule>& default_url_regexes() {
    static const std::vector<PriorityRule> rules = {
        {"log-?in", 5}, {"sign-?in", 5}, {"sso", 4}, {"auth", 3}, {"account", 2}, {"session", 1},
    };
    return rules;
}

json section(const json& parent, const char* key) {
    if (!parent.is_object() || !parent.contains(key) || parent[key].is_null()) return json::object();
    if (!parent[key].is_object()) throw std::invalid_argument(std::string(key) + " must be an object");
    return parent[key];
}
}

std::string WorkerConfig::analysis() const {
    static const std::string suffix = "_treq";
    if (queue_name.size() > suffix.size() &&
        queue_name.compare(queue_name.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return queue_name.substr(0, queue_name.size() - suffix.size());
    }
    return queue_name;
}

WorkerConfig load_worker_config() {
    WorkerConfig c;
    c.queue_url = getenv_or("QUEUE_URL", c.queue_url);
    c.queue_name = getenv_or("QUEUE_NAME", c.queue_name);
    c.brain_url = getenv_or("BRAIN_URL", c.brain_url);
    c.brain_user = getenv_or("BRAIN_USER", c.brain_user);
    c.brain_password = getenv_or("BRAIN_PASSWORD", c.brain_password);
    c.collector_url = getenv_or("COLLECTOR_URL", c.collector_url);
    c.collector_retry_s = (int)getenv_long_or("COLLECTOR_RETRY_S", c.collector_retry_s);
    c.callback_retry_s = (int)getenv_long_or("CALLBACK_RETRY_S", c.callback_retry_s);
    c.task_timeout_s = (int)getenv_long_or("TASK_TIMEOUT_S", c.task_timeout_s);
    c.prefetch = (int)getenv_long_or("PREFETCH", c.prefetch);
    c.poll_ms = (int)getenv_long_or("POLL_MS", c.poll_ms);
    c.work_dir = getenv_or("WORK_DIR", c.work_dir);

    c.oracle.mode = to_lower(getenv_or("ORACLE_MODE", c.oracle.mode));
    c.oracle.host = getenv_or("ORACLE_HOST", c.oracle.host);
    c.oracle.port = (int)getenv_long_or("ORACLE_PORT", c.oracle.port);
    c.oracle.timeout_s = (int)getenv_long_or("ORACLE_TIMEOUT_S", c.oracle.timeout_s);
    c.oracle.no_save = getenv_bool_or("ORACLE_NO_SAVE", c.oracle.no_save);
    c.oracle.chat_url = getenv_or("CHAT_URL", c.oracle.chat_url);
    c.oracle.chat_model = getenv_or("CHAT_MODEL", c.oracle.chat_model);
    c.oracle.chat_api_key = getenv_or("CHAT_API_KEY", c.oracle.chat_api_key);
    c.oracle.chat_max_tokens = (int)getenv_long_or("CHAT_MAX_TOKENS", c.oracle.chat_max_tokens);
    c.oracle.image_base_url = getenv_or("IMAGE_BASE_URL", c.oracle.image_base_url);

    c.screenshot_cmd = getenv_or("SCREENSHOT_CMD", c.screenshot_cmd);
    c.screenshot_dir = getenv_or("SCREENSHOT_DIR", c.screenshot_dir);
    c.screenshot_timeout_s = (int)getenv_long_or("SCREENSHOT_TIMEOUT_S", c.screenshot_timeout_s);
    c.crawler_cmd = getenv_or("CRAWLER_CMD", c.crawler_cmd);
    c.crawler_output_dir = getenv_or("CRAWLER_OUTPUT_DIR", c.crawler_output_dir);
    c.crawler_actions_dir = getenv_or("CRAWLER_ACTIONS_DIR", c.crawler_actions_dir);
    c.searxng_url = getenv_or("SEARXNG_URL", c.searxng_url);
    c.log_level = getenv_or("LOG_LEVEL", c.log_level);
    return c;
}

LoginPageConfig login_page_config_from_json(const json& analysis_config) {
    LoginPageConfig c;
    json lp = section(analysis_config, "login_page_config");

    if (lp.contains("login_page_strategy_scope")) {
        c.strategy_scope.clear();
        for (const auto& s : lp.at("login_page_strategy_scope")) {
            c.strategy_scope.push_back(strategy_from_name(s.get<std::string>()));
        }
    }

    if (lp.contains("login_page_url_regexes")) {
        for (const auto& r : lp.at("login_page_url_regexes")) {
            c.url_regexes.push_back({r.at("regex").get<std::string>(), r.at("priority").get<int>()});
        }
    } else {
        c.url_regexes = default_url_regexes();
    }

    json robots = section(lp, "robots_strategy_config");
    c.robots.max_candidates = robots.value("max_candidates", c.robots.max_candidates);
    c.robots.timeout_fetch_robots = robots.value("timeout_fetch_robots", c.robots.timeout_fetch_robots);

    json sitemap = section(lp, "sitemap_strategy_config");
    c.sitemap.max_candidates = sitemap.value("max_candidates", c.sitemap.max_candidates);
    c.sitemap.max_recursion_level = sitemap.value("max_recursion_level", c.sitemap.max_recursion_level);
    c.sitemap.max_sitemap_size = sitemap.value("max_sitemap_size", c.sitemap.max_sitemap_size);
    c.sitemap.timeout_fetch_sitemap = sitemap.value("timeout_fetch_sitemap", c.sitemap.timeout_fetch_sitemap);

    json meta = section(lp, "metasearch_strategy_config");
    c.metasearch.search_engines = meta.value("search_engines", c.metasearch.search_engines);
    c.metasearch.search_term = meta.value("search_term", c.metasearch.search_term);
    c.metasearch.search_results_number = meta.value("search_results_number", c.metasearch.search_results_number);

    json artifacts = section(analysis_config, "artifacts_config");
    c.store_robots = artifacts.value("store_robots", c.store_robots);
    c.store_sitemap = artifacts.value("store_sitemap", c.store_sitemap);
    return c;
}
