#pragma once
#include <string>
#include <vector>
#include <optional>
#include "Config.h"

namespace secret_hunter {
namespace utils {

std::string trim(const std::string& s);
std::string to_lower(std::string s);
bool ends_with(const std::string& s, const std::string& suffix);
std::vector<std::string> split_csv(const std::string& s);

// Reads newline-delimited entries, skipping blank lines and '#' comments.
// Returns nullopt if the file cannot be opened.
std::optional<std::vector<std::string>> read_list_file(const std::string& path);

// Rewrites s so it is valid UTF-8. Invalid sequences (bad lead bytes, truncated
// or overlong sequences, surrogates, code points above U+10FFFF) are replaced
// by U+FFFD or dropped, one per maximal invalid subpart.
void sanitize_utf8(std::string& s, DecodePolicy policy);

// Lowercase hex SHA256 of a file; empty if OpenSSL is unavailable or the file
// cannot be read.
std::string sha256_file(const std::string& path);
bool have_sha256();

}
}
