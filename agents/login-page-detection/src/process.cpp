#include "../include/process.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {
void emit_lines(std::string& pending, const std::function<void(const std::string&)>& on_line) {
    std::size_t start = 0;
    for (auto nl = pending.find('\n', start); nl != std::string::npos; nl = pending.find('\n', start)) {
        std::string line = pending.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        on_line(line);
        start = nl + 1;
    }
    pending.erase(0, start);
}

// Every process below root in the current /proc snapshot.
std::vector<pid_t> descendants(pid_t root) {
    std::multimap<pid_t, pid_t> children;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator("/proc", ec)) {
        const std::string name = entry.path().filename().string();
        if (name.empty() || !std::all_of(name.begin(), name.end(), [](char c) { return c >= '0' && c <= '9'; })) {
            continue;
        }
        std::ifstream in(entry.path() / "stat");
        std::string stat;
        if (!std::getline(in, stat)) continue;
        // "pid (comm) state ppid ..."; comm may itself contain ')'
        auto close = stat.rfind(')');
        if (close == std::string::npos) continue;
        std::istringstream fields(stat.substr(close + 1));
        char state = 0;
        long ppid = 0;
        if (fields >> state >> ppid) children.emplace((pid_t)ppid, (pid_t)std::stol(name));
    }

    std::vector<pid_t> out;
    std::vector<pid_t> todo{root};
    while (!todo.empty()) {
        pid_t p = todo.back();
        todo.pop_back();
        auto range = children.equal_range(p);
        for (auto it = range.first; it != range.second; ++it) {
            out.push_back(it->second);
            todo.push_back(it->second);
        }
    }
    return out;
}

// The child is stopped first so it cannot fork while its tree is collected.
// Helpers that moved to another process group are found through their parent.
void kill_child(pid_t pid, bool group) {
    ::kill(pid, SIGSTOP);
    for (pid_t d : descendants(pid)) ::kill(d, SIGKILL);
    if (group) ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
}
}

ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& opts) {
    if (argv.empty()) throw std::invalid_argument("run_process: empty command");

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    int fds[2] = {-1, -1};
    if (opts.on_line && ::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        if (fds[0] >= 0) { ::close(fds[0]); ::close(fds[1]); }
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(err));
    }
    if (pid == 0) {
        // Child: only async-signal-safe calls until exec.
        if (opts.own_process_group) ::setpgid(0, 0);
        if (fds[1] >= 0) {
            ::dup2(fds[1], STDOUT_FILENO);
            ::dup2(fds[1], STDERR_FILENO);
        }
        ::execvp(cargv[0], cargv.data());
        ::_exit(127);
    }

    if (opts.own_process_group) ::setpgid(pid, pid); // EACCES after exec is fine, the child did it
    int fd = fds[0];
    if (fds[1] >= 0) ::close(fds[1]);

    const auto start = std::chrono::steady_clock::now();
    ProcessResult result;
    std::string pending;
    int status = 0;
    bool reaped = false;
    char buf[4096];

    while (true) {
        if (fd >= 0) {
            struct pollfd p{fd, POLLIN, 0};
            int pr = ::poll(&p, 1, 100);
            if (pr > 0) {
                ssize_t n = ::read(fd, buf, sizeof(buf));
                if (n > 0) {
                    pending.append(buf, (std::size_t)n);
                    emit_lines(pending, opts.on_line);
                } else if (n == 0 || errno != EINTR) {
                    ::close(fd);
                    fd = -1;
                }
            }
        } else if (!reaped) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }

        if (!reaped) {
            pid_t r = ::waitpid(pid, &status, WNOHANG);
            if (r == pid) {
                reaped = true;
            } else if (r < 0 && errno != EINTR) {
                if (fd >= 0) ::close(fd);
                throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
            }
        }

        if (reaped) {
            // Drain what the child left in the pipe; grandchildren may keep it open, don't wait for them.
            if (fd >= 0) {
                struct pollfd p{fd, POLLIN, 0};
                while (::poll(&p, 1, 0) > 0) {
                    ssize_t n = ::read(fd, buf, sizeof(buf));
                    if (n <= 0) break;
                    pending.append(buf, (std::size_t)n);
                }
                ::close(fd);
                fd = -1;
            }
            break;
        }

        if (opts.timeout.count() > 0 && std::chrono::steady_clock::now() - start >= opts.timeout) {
            kill_child(pid, opts.own_process_group);
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            result.timed_out = true;
            if (fd >= 0) { ::close(fd); fd = -1; }
            break;
        }
    }

    if (opts.on_line) {
        emit_lines(pending, opts.on_line);
        if (!pending.empty()) opts.on_line(pending);
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.exit_code = 128 + result.term_signal;
    }
    return result;
}
