#pragma once
#include <chrono>
#include <string>
#include <vector>

class Screenshotter {
public:
    virtual ~Screenshotter() = default;
    // Returns the path of the captured PNG. Throws std::runtime_error on failure.
    virtual std::string capture(const std::string& url) = 0;
};

// Runs "<cmd...> <url> <output.png>" and expects the file to exist afterwards.
class CommandScreenshotter : public Screenshotter {
public:
    CommandScreenshotter(std::vector<std::string> command, std::string output_dir, std::chrono::seconds timeout);
    std::string capture(const std::string& url) override;

private:
    std::vector<std::string> command_;
    std::string output_dir_;
    std::chrono::seconds timeout_;
};
