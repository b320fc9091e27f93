#pragma once
#include <chrono>
#include <functional>
#include <string>
#include <vector>

struct ProcessOptions {
    std::chrono::milliseconds timeout{0}; // 0 = wait forever; on expiry the child and its descendants are killed
    // Child leads its own process group; a timeout kills the whole group.
    bool own_process_group{false};
    // Receives stdout and stderr line by line; unset means the child inherits ours.
    std::function<void(const std::string&)> on_line;
};

struct ProcessResult {
    int exit_code{-1};   // 128 + signal when killed by a signal
    int term_signal{0};
    bool timed_out{false};
};

// Runs argv[0] (PATH lookup) to completion. Throws std::runtime_error when the
// child cannot be created; an exec failure shows up as exit code 127.
ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& opts = {});
