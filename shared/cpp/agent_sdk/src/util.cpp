#include "../include/util.hpp"
#include <openssl/rand.h>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <chrono>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

long getenv_long_or(const char* key, long def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    try {
        return std::stol(v);
    } catch (const std::exception&) {
        spdlog::warn("[config] ignoring non-numeric {}={}", key, v);
        return def;
    }
}

bool getenv_bool_or(const char* key, bool def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    std::string s = to_lower(v);
    return s == "1" || s == "true" || s == "yes" || s == "on";
}

std::string random_hex(std::size_t n) {
    std::vector<unsigned char> bytes(n);
    if (RAND_bytes(bytes.data(), (int)bytes.size()) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(n * 2);
    for (unsigned char b : bytes) {
        out.push_back(digits[(b >> 4) & 0xF]);
        out.push_back(digits[b & 0xF]);
    }
    return out;
}

double unix_now() {
    using namespace std::chrono;
    return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

std::string read_text_file(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open " + p.string());
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

void write_text_file(const std::filesystem::path& p, const std::string& text) {
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    if (!f) throw std::runtime_error("cannot write " + p.string());
    f.write(text.data(), (std::streamsize)text.size());
    if (!f) throw std::runtime_error("short write to " + p.string());
}

std::string trim(const std::string& s) {
    auto b = std::find_if_not(s.begin(), s.end(), [](unsigned char c){ return std::isspace(c); });
    auto e = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c){ return std::isspace(c); }).base();
    return b < e ? std::string(b, e) : std::string();
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::toupper(c); });
    return s;
}

std::vector<std::string> split_command(const std::string& cmd) {
    std::vector<std::string> out;
    std::istringstream ss(cmd);
    std::string part;
    while (ss >> part) out.push_back(part);
    return out;
}

void init_logging(const std::string& level) {
    spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e %^%l%$ [pid %P] %v");
    spdlog::set_level(spdlog::level::from_str(to_lower(level)));
}
