#include "ArgumentParser.h"
#include "BuildInfo.h"
#include "Utils.h"
#include <iostream>
#include <stdexcept>

namespace secret_hunter {

ArgumentParser::ArgumentParser() {
    auto csv = [](const std::string& v){ return utils::split_csv(v); };
    specs_ = {
        {"--extensions", ArgKind::CSV, "LIST", "Replace the scanned filename suffixes (e.g. .py,.env)", [=](Config& c, const std::string& v){ c.extensions = csv(v); }},
        {"--extensions-file", ArgKind::String, "FILE", "Add suffixes from FILE (one per line, # comments)", [](Config& c, const std::string& v){ c.extensions_file = v; }},
        {"--disable-rules", ArgKind::CSV, "LIST", "Disable rules: email, password, api_key", [=](Config& c, const std::string& v){ c.disable_rules = csv(v); }},
        {"--follow-symlinks", ArgKind::None, nullptr, "Descend into symlinked directories", [](Config& c, const std::string&){ c.follow_symlinks = true; }},
        {"--absolute-paths", ArgKind::None, nullptr, "Report absolute file paths", [](Config& c, const std::string&){ c.absolute_paths = true; }},
        {"--decode", ArgKind::String, "replace|drop", "Handling of invalid UTF-8 bytes", [this](Config& c, const std::string& v){
            std::string p = utils::to_lower(v);
            if(p == "replace") c.decode_policy = DecodePolicy::Replace;
            else if(p == "drop" || p == "ignore") c.decode_policy = DecodePolicy::Drop;
            else { std::cerr << "Invalid value for --decode: " << v << "\n"; int_error_ = true; }
        }},
        {"--max-line-length", ArgKind::Int, "N", "Match only the first N bytes of a line", [this](Config& c, const std::string& v){ parse_int(v, "--max-line-length", c.max_line_length); }},
        {"--file-timeout", ArgKind::Int, "SECONDS", "Give up on a file after SECONDS (0 = never)", [this](Config& c, const std::string& v){ parse_int(v, "--file-timeout", c.file_timeout_seconds); }},
        {"--parallel", ArgKind::None, nullptr, "Analyze files on a worker pool", [](Config& c, const std::string&){ c.parallel = true; }},
        {"--parallel-threads", ArgKind::Int, "N", "Worker count (implies --parallel)", [this](Config& c, const std::string& v){ parse_int(v, "--parallel-threads", c.parallel_max_threads); }},
        {"--json", ArgKind::None, nullptr, "Emit a JSON document instead of alerts", [](Config& c, const std::string&){ c.json = true; }},
        {"--pretty", ArgKind::None, nullptr, "Indent JSON output", [](Config& c, const std::string&){ c.pretty = true; }},
        {"--output", ArgKind::String, "FILE", "Write the report to FILE (default stdout)", [](Config& c, const std::string& v){ c.output_file = v; }},
        {"--hash-files", ArgKind::None, nullptr, "Include SHA256 of files with findings (JSON)", [](Config& c, const std::string&){ c.hash_files = true; }},
        {"--fail-on-count", ArgKind::Int, "N", "Exit 1 if N or more issues are found", [this](Config& c, const std::string& v){ parse_int(v, "--fail-on-count", c.fail_on_count); }},
        {"--log-level", ArgKind::String, "LEVEL", "error, warn, info, debug or trace", [](Config& c, const std::string& v){ c.log_level = v; }},
        {"--verbose", ArgKind::None, nullptr, "Debug logging", [](Config& c, const std::string&){ c.verbose = true; }},
        {"--quiet", ArgKind::None, nullptr, "Only log errors", [](Config& c, const std::string&){ c.quiet = true; }},
        {"--drop-priv", ArgKind::None, nullptr, "Drop Linux capabilities before scanning", [](Config& c, const std::string&){ c.drop_priv = true; }},
        {"--keep-cap-dac", ArgKind::None, nullptr, "Retain CAP_DAC_READ_SEARCH when dropping", [](Config& c, const std::string&){ c.keep_cap_dac = true; }},
        {"--seccomp", ArgKind::None, nullptr, "Apply seccomp profile before scanning", [](Config& c, const std::string&){ c.seccomp = true; }},
        {"--seccomp-strict", ArgKind::None, nullptr, "Fail if seccomp cannot be applied", [](Config& c, const std::string&){ c.seccomp_strict = true; }},
    };
}

const ArgumentParser::FlagSpec* ArgumentParser::find_spec(const std::string& flag) const {
    for(const auto& s : specs_) if(flag == s.name) return &s;
    return nullptr;
}

bool ArgumentParser::parse_int(const std::string& v, const char* flag, int& out) {
    try {
        size_t used = 0;
        int n = std::stoi(v, &used);
        if(used != v.size()) throw std::invalid_argument(v);
        out = n;
        return true;
    } catch(const std::exception&) {
        std::cerr << "Invalid integer for " << flag << ": " << v << "\n";
        int_error_ = true;
        return false;
    }
}

void ArgumentParser::print_help() const {
    std::cout << "usage: secret-hunter [options] [DIRECTORY]\n\n"
              << "Flags email addresses and hardcoded credentials in text files under DIRECTORY.\n"
              << "Prompts for DIRECTORY when it is not given.\n\noptions:\n";
    auto line = [](const std::string& name, const std::string& help){
        std::cout << "  " << name;
        if(name.size() < 32) for(size_t i = name.size(); i < 32; ++i) std::cout << ' '; else std::cout << ' ';
        std::cout << help << "\n";
    };
    for(const auto& s : specs_) {
        std::string name = s.name;
        if(s.arg) { name += ' '; name += s.arg; }
        line(name, s.help);
    }
    line("--version", "Print version & exit");
    line("--help", "Show this help");
}

void ArgumentParser::print_version() {
    std::cout << "secret-hunter " << buildinfo::APP_VERSION << " (git=" << buildinfo::GIT_COMMIT
              << ", compiler=" << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION
              << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg) {
    exit_code_ = 0;
    int_error_ = false;
    bool have_root = false;
    bool only_positional = false;
    for(int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if(!only_positional && a == "--") { only_positional = true; continue; }
        if(!only_positional && a.size() > 1 && a[0] == '-') {
            if(a == "--help" || a == "-h") { print_help(); exit_code_ = 0; return false; }
            if(a == "--version") { print_version(); exit_code_ = 0; return false; }
            const FlagSpec* spec = find_spec(a);
            if(!spec) {
                std::cerr << "Unknown arg: " << a << "\n";
                exit_code_ = 2;
                return false;
            }
            std::string val;
            if(spec->kind != ArgKind::None) {
                if(i + 1 >= argc) {
                    std::cerr << "Missing value for " << a << "\n";
                    exit_code_ = 2;
                    return false;
                }
                val = argv[++i];
            }
            spec->apply(cfg, val);
            if(int_error_) { exit_code_ = 2; return false; }
            continue;
        }
        if(have_root) {
            std::cerr << "Only one directory may be given (got '" << cfg.root_path << "' and '" << a << "')\n";
            exit_code_ = 2;
            return false;
        }
        cfg.root_path = a;
        have_root = true;
    }
    return true;
}

}
