#pragma once
#include "config.hpp"
#include "crawling.hpp"
#include "oracle.hpp"
#include "screenshot.hpp"
#include "strategy.hpp"
#include "task.hpp"
#include "../../../shared/cpp/agent_sdk/include/http.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

// Collaborators shared by every strategy of one analysis run.
struct AnalysisDeps {
    HttpTransport& http;
    ClassificationOracle& oracle;
    Screenshotter& shots;
    ExternalCrawler& crawler;
    std::string searxng_url;
};

// GET https://<domain>/, then http://; falls back to https://<domain>/ when both fail.
ResolvedTarget resolve_domain(HttpTransport& http, const std::string& domain, long timeout_ms = 30000);

std::vector<std::unique_ptr<CandidateStrategy>> build_strategies(const LoginPageConfig& cfg, AnalysisDeps& deps);

// Runs the strategies in scope order; a strategy that throws is recorded in
// strategy_errors and the others still run.
AnalysisResult run_landscape_analysis(const Task& task, AnalysisDeps& deps);

using AnalysisFn = std::function<AnalysisResult(const Task&, AnalysisDeps&)>;

// nullptr for unknown analysis names.
const AnalysisFn* find_analysis(const std::string& name);

// Entry point of the --run-analysis child: reads the task file, writes the
// result file. Returns the process exit code.
int run_analysis_child(const WorkerConfig& cfg, const std::string& analysis, const std::string& task_file,
                       const std::string& result_file);
