#pragma once
#include "Finding.h"
#include <string>

namespace secret_hunter {

class Report;

// Receives pipeline events in emission order. Implementations render or
// collect them; they never change scan state.
class FindingSink {
public:
    virtual ~FindingSink() = default;
    virtual void on_scan_start(const std::string& root) = 0;
    virtual void on_finding(const Finding& finding) = 0;
    virtual void on_file_error(const std::string& path, const std::string& message) = 0;
    virtual void on_scan_end(const Report& report) = 0;
};

}
