#include "SecretScanner.h"
#include "ContentAnalyzer.h"
#include "DirectoryWalker.h"
#include "ExtensionFilter.h"
#include "PathValidator.h"
#include "../core/Errors.h"
#include "../core/Logging.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace fs = std::filesystem;
namespace secret_hunter {

namespace {
    struct FileOutcome {
        std::vector<Finding> findings;
        std::string error; // non-empty on FileAccessError; findings before it are kept
        bool done = false;
    };

    void record_error(ScanContext& context, const std::string& path, const std::string& message) {
        Logger::instance().warn("Could not read file: " + path + " (" + message + ")");
        context.report.add_file_error(path, message);
        context.sink.on_file_error(path, message);
    }
}

SecretScanner::SecretScanner(RuleSet rules) : rules_(std::move(rules)) {}

std::string SecretScanner::display_path(const ScanContext& context, const fs::path& root, const fs::path& file) const {
    if(context.config.absolute_paths) return file.string();
    fs::path rel = file.lexically_relative(root);
    if(rel.empty()) return file.string();
    return rel.string();
}

ScanStatus SecretScanner::run(ScanContext& context) {
    const fs::path root = PathValidator::validate(context.config.root_path);
    Logger::instance().debug("Scanning " + root.string() + " with " + std::to_string(rules_.rules().size()) + " rule(s)");

    context.report.start(root.string());
    context.sink.on_scan_start(root.string());

    ScanStatus status = context.config.parallel ? run_parallel(context, root) : run_sequential(context, root);

    context.report.finish(status);
    context.sink.on_scan_end(context.report);
    return status;
}

ScanStatus SecretScanner::run_sequential(ScanContext& context, const fs::path& root) {
    ExtensionFilter filter(context.config.extensions);
    ContentAnalyzer analyzer(rules_, AnalyzerOptions::from_config(context.config));
    DirectoryWalker walker(root, WalkOptions{context.config.follow_symlinks},
        [&](const std::string& path, const std::string& reason){
            Logger::instance().warn("Skipping directory: " + path + " (" + reason + ")");
            context.report.add_skipped_directory(path, reason);
        });

    fs::path file;
    while(walker.next(file)) {
        if(context.stopped()) return ScanStatus::Interrupted;
        context.report.count_file_visited();
        if(!filter.accepts(file)) {
            context.report.count_file_filtered();
            continue;
        }
        Logger::instance().trace("Analyzing " + file.string());
        try {
            analyzer.analyze(file, display_path(context, root, file), [&](Finding&& f){
                context.report.count_finding(f.kind);
                context.sink.on_finding(f);
            });
            context.report.count_file_scanned();
        } catch(const FileAccessError& ex) {
            record_error(context, ex.path(), ex.detail());
        }
    }
    return context.stopped() ? ScanStatus::Interrupted : ScanStatus::Completed;
}

// Files are collected first so the emission order is the traversal order
// regardless of which worker finishes first.
ScanStatus SecretScanner::run_parallel(ScanContext& context, const fs::path& root) {
    ExtensionFilter filter(context.config.extensions);
    ContentAnalyzer analyzer(rules_, AnalyzerOptions::from_config(context.config));
    DirectoryWalker walker(root, WalkOptions{context.config.follow_symlinks},
        [&](const std::string& path, const std::string& reason){
            Logger::instance().warn("Skipping directory: " + path + " (" + reason + ")");
            context.report.add_skipped_directory(path, reason);
        });

    std::vector<fs::path> files;
    fs::path file;
    while(walker.next(file)) {
        if(context.stopped()) return ScanStatus::Interrupted;
        context.report.count_file_visited();
        if(!filter.accepts(file)) {
            context.report.count_file_filtered();
            continue;
        }
        files.push_back(file);
    }
    if(files.empty()) return context.stopped() ? ScanStatus::Interrupted : ScanStatus::Completed;

    size_t threads = context.config.parallel_max_threads > 0
        ? static_cast<size_t>(context.config.parallel_max_threads)
        : std::max(1u, std::thread::hardware_concurrency());
    threads = std::min(threads, files.size());
    Logger::instance().debug("Analyzing " + std::to_string(files.size()) + " file(s) on " + std::to_string(threads) + " thread(s)");

    std::vector<FileOutcome> outcomes(files.size());
    std::vector<std::string> displays(files.size());
    for(size_t i = 0; i < files.size(); ++i) displays[i] = display_path(context, root, files[i]);

    std::mutex mutex;
    std::condition_variable cv;
    std::atomic<size_t> next_index{0};

    auto worker = [&]() {
        for(;;) {
            if(context.stopped()) break;
            size_t i = next_index.fetch_add(1);
            if(i >= files.size()) break;
            FileOutcome local;
            try {
                analyzer.analyze(files[i], displays[i], [&](Finding&& f){ local.findings.push_back(std::move(f)); });
            } catch(const FileAccessError& ex) {
                local.error = ex.detail();
            }
            local.done = true;
            {
                std::lock_guard<std::mutex> lock(mutex);
                outcomes[i] = std::move(local);
            }
            cv.notify_all();
        }
        // Wake the emitter so it can notice a stop request. Notifying under the
        // lock keeps the wakeup from landing between its predicate check and
        // its wait.
        std::lock_guard<std::mutex> lock(mutex);
        cv.notify_all();
    };

    std::vector<std::thread> pool;
    pool.reserve(threads);
    for(size_t t = 0; t < threads; ++t) pool.emplace_back(worker);

    bool interrupted = false;
    for(size_t i = 0; i < files.size(); ++i) {
        FileOutcome outcome;
        {
            std::unique_lock<std::mutex> lock(mutex);
            auto ready = [&]{ return outcomes[i].done || (context.stopped() && next_index.load() <= i); };
            // A signal handler sets the stop flag without notifying, so the
            // predicate is polled as well.
            while(!cv.wait_for(lock, std::chrono::milliseconds(100), ready)) {}
            if(!outcomes[i].done) { interrupted = true; break; }
            outcome = std::move(outcomes[i]);
        }
        // Same order as the sequential scan: findings read before a failure
        // are reported, then the failure.
        for(const auto& f : outcome.findings) {
            context.report.count_finding(f.kind);
            context.sink.on_finding(f);
        }
        if(!outcome.error.empty()) {
            record_error(context, files[i].string(), outcome.error);
            continue;
        }
        context.report.count_file_scanned();
    }
    for(auto& t : pool) t.join();

    if(interrupted || context.stopped()) return ScanStatus::Interrupted;
    return ScanStatus::Completed;
}

}
