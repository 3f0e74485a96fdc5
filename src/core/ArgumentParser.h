#pragma once
#include "Config.h"
#include <functional>
#include <string>
#include <vector>

namespace secret_hunter {

class ArgumentParser {
public:
    ArgumentParser();

    // Fills cfg from argv. Returns false when the program should exit right
    // away: after --help / --version (exit_code() == 0) or on a usage error
    // (exit_code() == 2, message already printed to stderr).
    bool parse(int argc, char** argv, Config& cfg);

    int exit_code() const { return exit_code_; }

    void print_help() const;
    static void print_version();

private:
    enum class ArgKind { None, String, Int, CSV };
    struct FlagSpec {
        const char* name;
        ArgKind kind;
        const char* arg;
        const char* help;
        std::function<void(Config&, const std::string&)> apply;
    };

    const FlagSpec* find_spec(const std::string& flag) const;
    bool parse_int(const std::string& v, const char* flag, int& out);

    std::vector<FlagSpec> specs_;
    int exit_code_ = 0;
    bool int_error_ = false;
};

}
