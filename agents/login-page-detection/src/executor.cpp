#include "../include/executor.hpp"
#include "../include/process.hpp"
#include "../../../shared/cpp/agent_sdk/include/util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {
struct ScratchFile {
    fs::path path;
    ~ScratchFile() {
        std::error_code ec;
        fs::remove(path, ec);
    }
};
}

TaskExecutor::TaskExecutor(std::vector<std::string> command, std::string work_dir, std::chrono::seconds timeout)
    : command_(std::move(command)), work_dir_(std::move(work_dir)), timeout_(timeout) {}

AnalysisResult TaskExecutor::execute(Task& task) {
    fs::create_directories(work_dir_);
    std::string stem = random_hex(8);
    ScratchFile task_file{fs::path(work_dir_) / ("task_" + stem + ".json")};
    ScratchFile result_file{fs::path(work_dir_) / ("result_" + stem + ".json")};
    write_text_file(task_file.path, task_to_json(task).dump());

    std::vector<std::string> argv = command_;
    argv.insert(argv.end(), {"--run-analysis", task.analysis, task_file.path.string(), result_file.path.string()});

    ProcessOptions opts;
    opts.timeout = timeout_;
    opts.own_process_group = true;

    task.transition(TaskState::Running, unix_now());
    spdlog::info("[executor] task {} running {} for {}", task.task_config.task_id, task.analysis, task.domain);
    ProcessResult pr = run_process(argv, opts);

    AnalysisResult result;
    if (pr.timed_out) {
        spdlog::error("[executor] task {} exceeded {}s, killed", task.task_config.task_id, timeout_.count());
        result = AnalysisResult::failure(kTimeoutMarker);
        task.transition(TaskState::TimedOut, unix_now());
    } else {
        try {
            result = analysis_result_from_json(json::parse(read_text_file(result_file.path)));
        } catch (const std::exception& e) {
            spdlog::error("[executor] task {}: no usable result ({})", task.task_config.task_id, e.what());
            result = AnalysisResult::failure("Analysis process exited with status " + std::to_string(pr.exit_code));
        }
        task.transition(TaskState::Completed, unix_now());
    }
    task.result = result;
    return result;
}
