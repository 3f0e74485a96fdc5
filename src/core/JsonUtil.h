#pragma once
#include <string>
#include <chrono>

namespace secret_hunter {
namespace jsonutil {

// Escapes a string for embedding between JSON quotes. Bytes >= 0x20 other than
// '"' and '\\' pass through unchanged (input is expected to be valid UTF-8).
std::string escape(const std::string& s);

// UTC ISO-8601 with 'Z' suffix; empty string for a default-constructed time point.
std::string time_to_iso(std::chrono::system_clock::time_point tp);

}
}
