#include "ConfigValidator.h"
#include "Utils.h"
#include "../scanners/DetectionRules.h"
#include <algorithm>
#include <iostream>

namespace secret_hunter {

std::string ConfigValidator::normalize_extension(const std::string& ext) {
    std::string e = utils::to_lower(utils::trim(ext));
    if(e.empty()) return e;
    if(e[0] != '.') e.insert(e.begin(), '.');
    return e;
}

bool ConfigValidator::validate(Config& cfg) {
    // Extensions: normalize, drop blanks and duplicates, keep first-seen order
    std::vector<std::string> exts;
    for(const auto& raw : cfg.extensions) {
        std::string e = normalize_extension(raw);
        if(e.empty() || e == ".") continue;
        if(std::find(exts.begin(), exts.end(), e) == exts.end()) exts.push_back(e);
    }
    if(exts.empty()) {
        std::cerr << "No file extensions to scan (check --extensions)\n";
        return false;
    }
    cfg.extensions = std::move(exts);

    const auto known = RuleSet::known_rule_names();
    for(const auto& r : cfg.disable_rules) {
        if(std::find(known.begin(), known.end(), r) == known.end()) {
            std::cerr << "Unknown rule: " << r << " (known: email, password, api_key)\n";
            return false;
        }
    }
    size_t disabled = 0;
    for(const auto& k : known) {
        if(std::find(cfg.disable_rules.begin(), cfg.disable_rules.end(), k) != cfg.disable_rules.end()) ++disabled;
    }
    if(disabled == known.size()) {
        std::cerr << "All detection rules are disabled\n";
        return false;
    }

    if(cfg.max_line_length < 256) {
        std::cerr << "--max-line-length must be at least 256\n";
        return false;
    }
    if(cfg.file_timeout_seconds < 0) {
        std::cerr << "--file-timeout cannot be negative\n";
        return false;
    }
    if(cfg.parallel_max_threads < 0 || cfg.parallel_max_threads > 256) {
        std::cerr << "--parallel-threads must be between 0 and 256\n";
        return false;
    }
    if(cfg.parallel_max_threads > 0) cfg.parallel = true;
    if(cfg.fail_on_count < 0) {
        std::cerr << "--fail-on-count cannot be negative\n";
        return false;
    }

    if(cfg.verbose && cfg.quiet) {
        std::cerr << "--verbose and --quiet are mutually exclusive\n";
        return false;
    }
    if(cfg.keep_cap_dac && !cfg.drop_priv) {
        std::cerr << "--keep-cap-dac requires --drop-priv\n";
        return false;
    }
    if(cfg.seccomp_strict) cfg.seccomp = true;
    // pretty only affects JSON; harmless otherwise
    if(cfg.hash_files && !cfg.json) {
        std::cerr << "--hash-files requires --json\n";
        return false;
    }
    return true;
}

bool ConfigValidator::load_external_files(Config& cfg) {
    if(cfg.extensions_file.empty()) return true;
    return load_extensions_file(cfg);
}

bool ConfigValidator::load_extensions_file(Config& cfg) {
    auto entries = utils::read_list_file(cfg.extensions_file);
    if(!entries) {
        std::cerr << "Failed to open extensions file: " << cfg.extensions_file << "\n";
        return false;
    }
    for(const auto& e : *entries) cfg.extensions.push_back(e);
    return true;
}

}
