#include "Report.h"

namespace secret_hunter {

const char* scan_status_name(ScanStatus status) {
    switch(status) {
        case ScanStatus::Completed: return "completed";
        case ScanStatus::Interrupted: return "interrupted";
    }
    return "unknown";
}

void Report::start(const std::string& root) {
    std::lock_guard<std::mutex> lock(mutex_);
    root_ = root;
    started_at_ = std::chrono::system_clock::now();
}

void Report::finish(ScanStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = status;
    finished_at_ = std::chrono::system_clock::now();
}

void Report::count_file_visited() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++files_visited_;
}

void Report::count_file_filtered() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++files_filtered_;
}

void Report::count_file_scanned() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++files_scanned_;
}

void Report::count_finding(FindingKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++finding_counts_[kind];
}

void Report::add_file_error(const std::string& path, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++files_failed_;
    warnings_.emplace_back(path, message);
}

void Report::add_skipped_directory(const std::string& path, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++directories_skipped_;
    warnings_.emplace_back(path, message);
}

size_t Report::files_visited() const { std::lock_guard<std::mutex> lock(mutex_); return files_visited_; }
size_t Report::files_filtered() const { std::lock_guard<std::mutex> lock(mutex_); return files_filtered_; }
size_t Report::files_scanned() const { std::lock_guard<std::mutex> lock(mutex_); return files_scanned_; }
size_t Report::files_failed() const { std::lock_guard<std::mutex> lock(mutex_); return files_failed_; }
size_t Report::directories_skipped() const { std::lock_guard<std::mutex> lock(mutex_); return directories_skipped_; }

size_t Report::finding_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for(const auto& kv : finding_counts_) total += kv.second;
    return total;
}

size_t Report::finding_count(FindingKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = finding_counts_.find(kind);
    return it == finding_counts_.end() ? 0 : it->second;
}

std::map<std::string, size_t> Report::finding_counts_by_kind() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, size_t> out;
    for(const auto& kv : finding_counts_) out[kind_id(kv.first)] = kv.second;
    return out;
}

std::vector<std::pair<std::string,std::string>> Report::warnings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return warnings_;
}

bool Report::clean() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_failed_ == 0 && directories_skipped_ == 0;
}

}
