#pragma once
#include <stdexcept>
#include <string>

namespace secret_hunter {

// Root path could not be used; fatal for the run.
class PathError : public std::runtime_error {
public:
    enum class Reason { Empty, NotFound, NotADirectory, PermissionDenied };

    PathError(Reason reason, const std::string& path, const std::string& message)
        : std::runtime_error(message), reason_(reason), path_(path) {}

    Reason reason() const { return reason_; }
    const std::string& path() const { return path_; }

private:
    Reason reason_;
    std::string path_;
};

// A single candidate file could not be read; the scan continues with the next file.
class FileAccessError : public std::runtime_error {
public:
    FileAccessError(const std::string& path, const std::string& message)
        : std::runtime_error(path + ": " + message), path_(path), detail_(message) {}

    const std::string& path() const { return path_; }
    const std::string& detail() const { return detail_; }

private:
    std::string path_;
    std::string detail_;
};

}
