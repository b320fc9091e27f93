#include "../include/screenshot.hpp"
#include "../include/process.hpp"
#include "../include/url.hpp"
#include "../../../shared/cpp/agent_sdk/include/util.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

CommandScreenshotter::CommandScreenshotter(std::vector<std::string> command, std::string output_dir,
                                           std::chrono::seconds timeout)
    : command_(std::move(command)), output_dir_(std::move(output_dir)), timeout_(timeout) {
    if (command_.empty()) throw std::invalid_argument("empty screenshot command");
}

std::string CommandScreenshotter::capture(const std::string& url) {
    fs::create_directories(output_dir_);
    fs::path out = fs::path(output_dir_) / (sanitize_for_filename(url) + "_" + random_hex(4) + ".png");

    std::vector<std::string> argv = command_;
    argv.push_back(url);
    argv.push_back(out.string());

    ProcessOptions opts;
    opts.timeout = timeout_;
    opts.on_line = [](const std::string& line) { spdlog::debug("[screenshot] {}", line); };
    ProcessResult r = run_process(argv, opts);

    if (r.timed_out) throw std::runtime_error("screenshot of " + url + " timed out");
    if (r.exit_code != 0) {
        throw std::runtime_error("screenshot of " + url + " failed with exit code " + std::to_string(r.exit_code));
    }
    std::error_code ec;
    if (!fs::exists(out, ec)) throw std::runtime_error("screenshot of " + url + " produced no file");
    return out.string();
}
