#pragma once
#include "Config.h"
#include "FindingSink.h"
#include <ostream>
#include <string>
#include <vector>

namespace secret_hunter {

// Buffers findings and writes a single JSON document when the scan ends.
class JSONWriter : public FindingSink {
public:
    JSONWriter(std::ostream& out, const Config& cfg) : out_(out), cfg_(cfg) {}

    void on_scan_start(const std::string& root) override;
    void on_finding(const Finding& finding) override;
    void on_file_error(const std::string& path, const std::string& message) override;
    void on_scan_end(const Report& report) override;

    // Document for the findings buffered so far.
    std::string write(const Report& report) const;

    const std::vector<Finding>& findings() const { return findings_; }

private:
    std::ostream& out_;
    const Config& cfg_;
    std::vector<Finding> findings_;
};

}
