#pragma once
#include "DetectionRules.h"
#include "../core/Config.h"
#include "../core/Finding.h"
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace secret_hunter {

struct AnalyzerOptions {
    DecodePolicy decode_policy = DecodePolicy::Replace;
    size_t max_line_length = 4096;
    std::chrono::milliseconds timeout{0}; // 0 = none

    static AnalyzerOptions from_config(const Config& cfg);
};

class ContentAnalyzer {
public:
    using Emit = std::function<void(Finding&&)>;

    ContentAnalyzer(const RuleSet& rules, AnalyzerOptions options);

    // Reads `file` line by line and emits one Finding per rule match, in line
    // order. Throws FileAccessError if the file cannot be opened or read, or
    // if reading exceeds the configured timeout. Findings from lines read
    // before a failure have already been emitted.
    void analyze(const std::filesystem::path& file, const std::string& display_path, const Emit& emit) const;

    std::vector<Finding> analyze(const std::filesystem::path& file, const std::string& display_path) const;

    // Matches a single, already decoded line.
    void analyze_line(const std::string& line, size_t line_number, const std::string& file_path,
                      const std::string& display_path, const Emit& emit) const;

private:
    const RuleSet& rules_;
    AnalyzerOptions options_;
};

}
