#pragma once
#include "Config.h"
#include <string>

namespace secret_hunter {

class ConfigValidator {
public:
    // Normalizes cfg in place and reports the first problem on stderr.
    // Returns false if the configuration cannot be used.
    bool validate(Config& cfg);

    // Merges --extensions-file into cfg.extensions.
    bool load_external_files(Config& cfg);

    // ".TXT" -> ".txt", "txt" -> ".txt"; empty for blank input.
    static std::string normalize_extension(const std::string& ext);

private:
    bool load_extensions_file(Config& cfg);
};

}
