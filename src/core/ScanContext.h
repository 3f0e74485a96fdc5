#pragma once
#include "Config.h"
#include "Report.h"
#include "FindingSink.h"
#include <atomic>

namespace secret_hunter {

struct ScanContext {
    ScanContext(const Config& cfg, Report& rep, FindingSink& out, const std::atomic<bool>* stop = nullptr)
        : config(cfg), report(rep), sink(out), stop_requested(stop) {}

    const Config& config;
    Report& report;
    FindingSink& sink;
    const std::atomic<bool>* stop_requested; // set asynchronously (signal handler, caller)

    bool stopped() const { return stop_requested && stop_requested->load(std::memory_order_relaxed); }
};

}
