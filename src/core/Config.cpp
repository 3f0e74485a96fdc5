#include "Config.h"

namespace secret_hunter {

std::vector<std::string> Config::default_extensions() {
    return {".txt", ".py", ".log", ".json", ".md", ".csv", ".xml", ".env",
            ".yml", ".yaml", ".ini", ".cfg"};
}

const char* decode_policy_name(DecodePolicy p) {
    switch(p) {
        case DecodePolicy::Replace: return "replace";
        case DecodePolicy::Drop: return "drop";
    }
    return "replace";
}

}
