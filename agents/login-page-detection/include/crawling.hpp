#pragma once
#include "strategy.hpp"
#include <chrono>
#include <string>
#include <vector>

struct CrawlOutcome {
    int exit_status{0};
    std::string output_directory;  // <root>/<domain_>, flow_N/page_K.png that passed classification
    std::string actions_directory; // <root>/<domain_>, flow_N/click_actions_flow_N.json
};

class ExternalCrawler {
public:
    virtual ~ExternalCrawler() = default;
    virtual CrawlOutcome run(const std::string& domain) = 0;
};

// "<cmd...> <domain>" with output streamed to the log. Stays in the caller's
// process group so the executor deadline reaches it.
class SubprocessCrawler : public ExternalCrawler {
public:
    SubprocessCrawler(std::vector<std::string> command, std::string output_root, std::string actions_root);
    CrawlOutcome run(const std::string& domain) override;

private:
    std::vector<std::string> command_;
    std::string output_root_;
    std::string actions_root_;
};

// "https://www.example.com" -> "www_example_com"
std::string crawl_directory_name(const std::string& domain);

// Number in "<prefix><digits><suffix>"; throws std::runtime_error otherwise.
int parse_numbered_name(const std::string& name, const std::string& prefix, const std::string& suffix);

// One candidate per distinct URL with its shortest replay path
// (ties: lowest flow, then lowest page). Throws on a malformed layout.
std::vector<Candidate> candidates_from_crawl(const CrawlOutcome& outcome);

class CrawlingStrategy : public CandidateStrategy {
public:
    explicit CrawlingStrategy(ExternalCrawler& crawler);
    Strategy kind() const override { return Strategy::Crawling; }
    // The crawler's classification service already filtered the pages: no oracle calls here.
    StrategyOutput discover(const DiscoveryTarget& target, ClassificationOracle& oracle) override;

private:
    ExternalCrawler& crawler_;
};
