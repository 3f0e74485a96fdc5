#pragma once
#include <string>
#include <cstddef>

namespace secret_hunter {

enum class FindingKind { Email, Password, ApiKey };

struct Finding {
    FindingKind kind = FindingKind::Email;
    std::string file_path;    // absolute
    std::string display_path; // as shown to the user
    size_t line_number = 0;   // 1-based
    std::string raw_line;     // without line terminator
    std::string extracted_value;
};

// "EMAIL", "PASSWORD", "API KEY" as used in alert headers
const char* kind_label(FindingKind kind);
// "email", "password", "api_key" as used in rule names and JSON
const char* kind_id(FindingKind kind);
const char* kind_severity(FindingKind kind);

inline bool operator==(const Finding& a, const Finding& b) {
    return a.kind == b.kind && a.file_path == b.file_path && a.display_path == b.display_path &&
           a.line_number == b.line_number && a.raw_line == b.raw_line && a.extracted_value == b.extracted_value;
}

}
