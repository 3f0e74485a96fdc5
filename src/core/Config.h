#pragma once
#include <string>
#include <vector>

namespace secret_hunter {

// How bytes that are not valid UTF-8 are handled before pattern matching.
enum class DecodePolicy { Replace, Drop };

struct Config {
    std::string root_path; // directory to scan; prompted for when empty
    std::vector<std::string> extensions = default_extensions(); // filename suffixes, lower case
    std::string extensions_file; // newline-delimited suffixes merged into extensions (# comments)
    std::vector<std::string> disable_rules; // rule names: email, password, api_key
    bool follow_symlinks = false; // descend into symlinked directories
    bool absolute_paths = false; // report absolute paths instead of root-relative ones
    DecodePolicy decode_policy = DecodePolicy::Replace;
    int max_line_length = 4096; // bytes of a line handed to the matcher
    int file_timeout_seconds = 30; // 0 = no per-file deadline
    bool parallel = false;
    int parallel_max_threads = 0; // 0 = hardware concurrency
    bool json = false;
    bool pretty = false;
    std::string output_file; // empty = stdout
    bool hash_files = false; // SHA256 of files with findings (JSON only)
    int fail_on_count = 0; // if >0, exit non-zero when total findings >= this
    std::string log_level; // explicit --log-level value
    bool verbose = false;
    bool quiet = false;
    bool drop_priv = false;
    bool keep_cap_dac = false;
    bool seccomp = false;
    bool seccomp_strict = false;

    static std::vector<std::string> default_extensions();
};

const char* decode_policy_name(DecodePolicy p);

}
