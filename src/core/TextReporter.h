#pragma once
#include "FindingSink.h"
#include <ostream>

namespace secret_hunter {

// Streams one alert block per finding as it arrives.
class TextReporter : public FindingSink {
public:
    explicit TextReporter(std::ostream& out) : out_(out) {}

    void on_scan_start(const std::string& root) override;
    void on_finding(const Finding& finding) override;
    void on_file_error(const std::string& path, const std::string& message) override;
    void on_scan_end(const Report& report) override;

    static const char* separator() { return "------------------------------"; }

private:
    std::ostream& out_;
};

}
