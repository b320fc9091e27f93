#pragma once
#include "task.hpp"
#include "url.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct OracleConfig {
    std::string mode{"socket"}; // socket|chat
    std::string host{"172.17.0.1"};
    int port{5060};
    int timeout_s{60};
    bool no_save{true};
    std::string chat_url{"http://localhost:8000/v1/chat/completions"};
    std::string chat_model{"Qwen/Qwen2.5-VL-7B-Instruct"};
    std::string chat_api_key;
    int chat_max_tokens{512};
    std::string image_base_url{"http://localhost:8001"};
};

struct WorkerConfig {
    std::string queue_url{"http://localhost:7000"};
    std::string queue_name{"landscape_analysis_treq"};
    std::string brain_url{"http://localhost:8080"};
    std::string brain_user;
    std::string brain_password;
    std::string collector_url{"http://localhost:4050/api/login_candidates"};
    int collector_retry_s{5};
    int callback_retry_s{60};
    int task_timeout_s{3 * 60 * 60};
    int prefetch{1};
    int poll_ms{1000};
    std::string work_dir{"/tmp/lpd-worker"};
    OracleConfig oracle;
    std::string screenshot_cmd{"node screenshot.js"};
    std::string screenshot_dir{"/app/modules/loginpagedetection/screenshot_flows/strategies"};
    int screenshot_timeout_s{120};
    std::string crawler_cmd{"node crawler.js"};
    std::string crawler_output_dir{"/app/modules/loginpagedetection/output_images"};
    std::string crawler_actions_dir{"/app/modules/loginpagedetection/screenshot_flows"};
    std::string searxng_url{"http://searxng:8080"};
    std::string log_level{"info"};

    // Name of the analysis served by the queue: "<analysis>_treq".
    std::string analysis() const;
};

// Reads every setting from the environment; flags are applied by main.
WorkerConfig load_worker_config();

struct RobotsStrategyConfig {
    int max_candidates{3};
    int timeout_fetch_robots{30};
};

struct SitemapStrategyConfig {
    int max_candidates{3};
    int max_recursion_level{3};
    long max_sitemap_size{10 * 1024 * 1024};
    int timeout_fetch_sitemap{30};
};

struct MetasearchStrategyConfig {
    std::vector<std::string> search_engines{"google", "bing", "duckduckgo"};
    std::string search_term{"%s login"};
    int search_results_number{3};
};

struct LoginPageConfig {
    std::vector<Strategy> strategy_scope{Strategy::Robots, Strategy::Sitemap, Strategy::Metasearch,
                                         Strategy::Crawling};
    std::vector<PriorityRule> url_regexes;
    RobotsStrategyConfig robots;
    SitemapStrategyConfig sitemap;
    MetasearchStrategyConfig metasearch;
    bool store_robots{false};
    bool store_sitemap{false};
};

// Parses "<analysis>_config"; missing keys keep their defaults. Throws on wrong types.
LoginPageConfig login_page_config_from_json(const nlohmann::json& analysis_config);
