#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace secret_hunter {

// Case-insensitive filename suffix allowlist. A suffix matches the whole
// filename too, so ".env" accepts a file literally named ".env".
class ExtensionFilter {
public:
    explicit ExtensionFilter(std::vector<std::string> suffixes);

    bool accepts(const std::filesystem::path& file) const;
    const std::vector<std::string>& suffixes() const { return suffixes_; }

private:
    std::vector<std::string> suffixes_; // lower case
};

}
