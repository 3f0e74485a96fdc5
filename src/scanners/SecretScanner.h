#pragma once
#include "DetectionRules.h"
#include "../core/ScanContext.h"
#include <filesystem>
#include <string>
#include <vector>

namespace secret_hunter {

// Runs the pipeline: validate root, walk, filter, analyze, report.
class SecretScanner {
public:
    explicit SecretScanner(RuleSet rules);

    std::string name() const { return "secrets"; }
    std::string description() const { return "Flags hardcoded credentials and exposed email addresses in text files"; }

    // Throws PathError if the root cannot be scanned; nothing is reported in
    // that case. Per-file failures are recorded in the report and passed to
    // the sink, never thrown.
    ScanStatus run(ScanContext& context);

    const RuleSet& rules() const { return rules_; }

private:
    ScanStatus run_sequential(ScanContext& context, const std::filesystem::path& root);
    ScanStatus run_parallel(ScanContext& context, const std::filesystem::path& root);

    std::string display_path(const ScanContext& context, const std::filesystem::path& root,
                             const std::filesystem::path& file) const;

    RuleSet rules_;
};

}
