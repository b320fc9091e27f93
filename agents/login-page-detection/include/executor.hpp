#pragma once
#include "task.hpp"
#include <chrono>
#include <string>
#include <vector>

// Runs an analysis in a child process with a hard deadline. The child is
// <command...> --run-analysis <analysis> <task file> <result file>, leading its
// own process group so the deadline takes its helpers down with it.
class TaskExecutor {
public:
    TaskExecutor(std::vector<std::string> command, std::string work_dir, std::chrono::seconds timeout);

    // Sets task.result and moves the task through RUNNING to COMPLETED or
    // TIMED_OUT. Analysis failures become {exception}; throws only when the
    // child cannot be started or the task file cannot be written.
    AnalysisResult execute(Task& task);

private:
    std::vector<std::string> command_;
    std::string work_dir_;
    std::chrono::seconds timeout_;
};
