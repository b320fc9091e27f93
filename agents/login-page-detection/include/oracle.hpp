#pragma once
#include "config.hpp"
#include "../../../shared/cpp/agent_sdk/include/http.hpp"
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

struct Verdict {
    bool login_present{false};
    std::string raw;
};

// Connection, protocol or parse failure. Never a negative verdict.
class OracleError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ClassificationOracle {
public:
    virtual ~ClassificationOracle() = default;
    // image_ref is a screenshot path or URL. Throws OracleError.
    virtual Verdict classify(const std::string& image_ref) = 0;
};

// One TCP connection per request: "<path>[ noSave]\n", reply of at most 1024 bytes.
class SocketOracle : public ClassificationOracle {
public:
    SocketOracle(std::string host, int port, int timeout_s, bool no_save);
    Verdict classify(const std::string& image_ref) override;

private:
    std::string host_;
    int port_;
    int timeout_s_;
    bool no_save_;
};

// OpenAI-compatible chat completion with an image_url part.
class ChatCompletionOracle : public ClassificationOracle {
public:
    ChatCompletionOracle(const OracleConfig& cfg, HttpTransport& transport);
    Verdict classify(const std::string& image_ref) override;

private:
    OracleConfig cfg_;
    HttpTransport& transport_;
};

// "Error: ..." or an empty reply throws; otherwise YES anywhere is positive.
Verdict parse_socket_reply(const std::string& reply);

// Last standalone YES/NO (any case), upper-cased; nullopt when there is none.
std::optional<std::string> extract_final_answer(const std::string& text);

// Maps a local screenshot path under screenshot_flows to the image server URL.
// URLs pass through unchanged.
std::string image_url_for_path(const std::string& path, const std::string& image_base_url);

extern const char* const kClassificationPrompt;

std::unique_ptr<ClassificationOracle> make_oracle(const OracleConfig& cfg, HttpTransport& transport);
