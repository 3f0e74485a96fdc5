#pragma once
#include <filesystem>
#include <functional>
#include <string>
#include <unordered_set>
#include <vector>
#include <sys/types.h>

namespace secret_hunter {

struct WalkOptions {
    bool follow_symlinks = false;
};

// Lazy depth-first walk over a directory tree. Siblings are visited in byte
// order of their names; directories are entered as soon as they are reached.
// Each directory identity (device, inode) is entered at most once, so symlink
// loops terminate. Only regular files are produced.
class DirectoryWalker {
public:
    using SkipCallback = std::function<void(const std::string& path, const std::string& reason)>;

    DirectoryWalker(std::filesystem::path root, WalkOptions options, SkipCallback on_skip = nullptr);

    // Advances to the next regular file. Returns false once the tree is exhausted.
    bool next(std::filesystem::path& out);

    size_t directories_entered() const { return directories_entered_; }

private:
    struct DirKey { dev_t dev; ino_t ino; };
    struct DirKeyHash { size_t operator()(const DirKey& k) const noexcept { return std::hash<dev_t>()(k.dev) ^ (std::hash<ino_t>()(k.ino) << 1); } };
    struct DirKeyEq { bool operator()(const DirKey& a, const DirKey& b) const noexcept { return a.dev == b.dev && a.ino == b.ino; } };

    struct Frame {
        std::filesystem::path dir;
        std::vector<std::string> names; // sorted
        size_t pos = 0;
    };

    bool enter(const std::filesystem::path& dir);
    void skip(const std::filesystem::path& p, const std::string& reason);

    std::filesystem::path root_;
    WalkOptions options_;
    SkipCallback on_skip_;
    std::vector<Frame> stack_;
    std::unordered_set<DirKey, DirKeyHash, DirKeyEq> visited_;
    bool started_ = false;
    size_t directories_entered_ = 0;
};

}
