#pragma once
#include <string>
#include <vector>
#include <filesystem>

std::string getenv_or(const char* key, const std::string& def);
long getenv_long_or(const char* key, long def);
bool getenv_bool_or(const char* key, bool def);

// Hex string of n cryptographically random bytes.
std::string random_hex(std::size_t n);

double unix_now();

std::string read_text_file(const std::filesystem::path& p);
// Creates missing parent directories.
void write_text_file(const std::filesystem::path& p, const std::string& text);

std::string trim(const std::string& s);
std::string to_lower(std::string s);
std::string to_upper(std::string s);
std::vector<std::string> split_command(const std::string& cmd);

// Applies LOG_LEVEL (trace|debug|info|warn|error) and the common log pattern.
void init_logging(const std::string& level);
