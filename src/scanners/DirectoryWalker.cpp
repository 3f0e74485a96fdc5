#include "DirectoryWalker.h"
#include "../core/Logging.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <sys/stat.h>

namespace fs = std::filesystem;
namespace secret_hunter {

DirectoryWalker::DirectoryWalker(fs::path root, WalkOptions options, SkipCallback on_skip)
    : root_(std::move(root)), options_(options), on_skip_(std::move(on_skip)) {}

void DirectoryWalker::skip(const fs::path& p, const std::string& reason) {
    Logger::instance().debug("walk: skipping " + p.string() + ": " + reason);
    if(on_skip_) on_skip_(p.string(), reason);
}

// Lists `dir` and pushes a frame for it. The directory identity is recorded
// before listing so a failed listing is not retried through another path.
bool DirectoryWalker::enter(const fs::path& dir) {
    struct stat st{};
    if(stat(dir.c_str(), &st) != 0) {
        skip(dir, std::strerror(errno));
        return false;
    }
    DirKey key{st.st_dev, st.st_ino};
    if(!visited_.insert(key).second) {
        Logger::instance().debug("walk: already visited " + dir.string());
        return false;
    }

    DIR* d = opendir(dir.c_str());
    if(!d) {
        skip(dir, std::strerror(errno));
        return false;
    }
    Frame frame;
    frame.dir = dir;
    int read_err = 0;
    for(;;) {
        errno = 0;
        struct dirent* entry = readdir(d);
        if(!entry) { read_err = errno; break; }
        const char* name = entry->d_name;
        if(std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0) continue;
        frame.names.emplace_back(name);
    }
    closedir(d);
    if(read_err != 0) {
        // keep what was listed; the rest of this directory is lost
        skip(dir, std::string("incomplete listing: ") + std::strerror(read_err));
    }
    std::sort(frame.names.begin(), frame.names.end());
    stack_.push_back(std::move(frame));
    ++directories_entered_;
    return true;
}

bool DirectoryWalker::next(fs::path& out) {
    if(!started_) {
        started_ = true;
        enter(root_);
    }
    while(!stack_.empty()) {
        Frame& top = stack_.back();
        if(top.pos >= top.names.size()) {
            stack_.pop_back();
            continue;
        }
        fs::path p = top.dir / top.names[top.pos++];

        struct stat lst{};
        if(lstat(p.c_str(), &lst) != 0) {
            // deleted between listing and now
            Logger::instance().debug("walk: vanished " + p.string());
            continue;
        }
        struct stat st = lst;
        if(S_ISLNK(lst.st_mode)) {
            if(stat(p.c_str(), &st) != 0) {
                Logger::instance().debug("walk: dangling symlink " + p.string());
                continue;
            }
            if(S_ISDIR(st.st_mode) && !options_.follow_symlinks) continue;
        }

        if(S_ISDIR(st.st_mode)) {
            // `top` may dangle after enter() grows the stack
            enter(p);
            continue;
        }
        if(S_ISREG(st.st_mode)) {
            out = std::move(p);
            return true;
        }
        // fifos, sockets, devices
    }
    return false;
}

}
