#pragma once
#include "task.hpp"
#include <optional>
#include <string>
#include <vector>

struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;  // empty when absent
    std::string path;  // always starts with '/'
    std::string query; // without '?'
};

std::optional<UrlParts> parse_url(const std::string& url);

// Lowercases scheme and host, drops default ports and the fragment, and gives
// an empty path as "/". Unparseable input is returned trimmed.
std::string normalize_url(const std::string& url);

// "scheme://host[:port]"
std::string url_origin(const UrlParts& u);

// Joins an absolute path onto the origin of base.
std::string join_origin(const std::string& base, const std::string& path);

std::string percent_decode(const std::string& s);

// TLD+1 of a host name ("login.example.co.uk" -> "example.co.uk").
std::string registrable_domain(const std::string& host);

// True when both URLs share one registrable domain.
bool is_same_registrable_domain(const std::string& url_a, const std::string& url_b);

struct PriorityRule {
    std::string regex;
    int priority{0};
};

// Highest priority among rules whose regex matches the URL (case-insensitive);
// {0, nullopt} when none match. Invalid regexes are skipped.
Priority url_priority(const std::string& url, const std::vector<PriorityRule>& rules);

// Turns a URL into something usable inside a file name.
std::string sanitize_for_filename(const std::string& url);
