#include "PathValidator.h"
#include "../core/Errors.h"
#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <sys/stat.h>

namespace fs = std::filesystem;
namespace secret_hunter {

fs::path PathValidator::validate(const std::string& path) {
    if(path.empty()) {
        throw PathError(PathError::Reason::Empty, path, "Error: no directory path was given.");
    }

    std::error_code ec;
    fs::path abs = fs::absolute(fs::path(path), ec);
    if(ec) {
        throw PathError(PathError::Reason::NotFound, path,
                        "Error: the directory '" + path + "' could not be resolved: " + ec.message());
    }
    abs = abs.lexically_normal();
    // "dir/" normalizes to "dir/"; drop the empty trailing component
    if(abs.has_relative_path() && abs.filename().empty()) abs = abs.parent_path();

    struct stat st{};
    if(stat(abs.c_str(), &st) != 0) {
        int err = errno;
        if(err == EACCES) {
            throw PathError(PathError::Reason::PermissionDenied, abs.string(),
                            "Error: you do not have permission to access '" + abs.string() + "'.");
        }
        if(err == ENOTDIR) {
            throw PathError(PathError::Reason::NotADirectory, abs.string(),
                            "Error: '" + abs.string() + "' is not a directory.");
        }
        throw PathError(PathError::Reason::NotFound, abs.string(),
                        "Error: the directory '" + abs.string() + "' was not found.");
    }
    if(!S_ISDIR(st.st_mode)) {
        throw PathError(PathError::Reason::NotADirectory, abs.string(),
                        "Error: '" + abs.string() + "' is a file, not a directory.");
    }

    DIR* dir = opendir(abs.c_str());
    if(!dir) {
        int err = errno;
        throw PathError(PathError::Reason::PermissionDenied, abs.string(),
                        "Error: you do not have permission to access '" + abs.string() + "': " + std::strerror(err));
    }
    closedir(dir);
    return abs;
}

}
