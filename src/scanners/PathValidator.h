#pragma once
#include <filesystem>
#include <string>

namespace secret_hunter {

class PathValidator {
public:
    // Resolves `path` against the working directory and checks that it names a
    // listable directory. Returns the absolute, lexically normalized path.
    // Throws PathError otherwise.
    static std::filesystem::path validate(const std::string& path);
};

}
