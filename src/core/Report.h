#pragma once
#include "Finding.h"
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace secret_hunter {

enum class ScanStatus { Completed, Interrupted };

const char* scan_status_name(ScanStatus status);

// Run statistics. Findings are counted here, not stored; sinks decide what
// to retain. Safe to update from worker threads.
class Report {
public:
    void start(const std::string& root);
    void finish(ScanStatus status);

    void count_file_visited();
    void count_file_filtered();
    void count_file_scanned();
    void count_finding(FindingKind kind);

    // Per-file read failure (non-fatal).
    void add_file_error(const std::string& path, const std::string& message);
    // Directory that could not be listed (non-fatal).
    void add_skipped_directory(const std::string& path, const std::string& message);

    const std::string& root() const { return root_; }
    ScanStatus status() const { return status_; }
    std::chrono::system_clock::time_point started_at() const { return started_at_; }
    std::chrono::system_clock::time_point finished_at() const { return finished_at_; }

    size_t files_visited() const;
    size_t files_filtered() const;
    size_t files_scanned() const;
    size_t files_failed() const;
    size_t directories_skipped() const;
    size_t finding_count() const;
    size_t finding_count(FindingKind kind) const;
    std::map<std::string, size_t> finding_counts_by_kind() const;

    // (path, message) pairs in the order they were recorded
    std::vector<std::pair<std::string,std::string>> warnings() const;

    // true when every visited file was read to the end and every directory listed
    bool clean() const;

private:
    std::string root_;
    ScanStatus status_ = ScanStatus::Completed;
    std::chrono::system_clock::time_point started_at_{};
    std::chrono::system_clock::time_point finished_at_{};
    size_t files_visited_ = 0;
    size_t files_filtered_ = 0;
    size_t files_scanned_ = 0;
    size_t files_failed_ = 0;
    size_t directories_skipped_ = 0;
    std::map<FindingKind, size_t> finding_counts_;
    std::vector<std::pair<std::string,std::string>> warnings_;
    mutable std::mutex mutex_;
};

}
