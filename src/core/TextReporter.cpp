#include "TextReporter.h"
#include "Report.h"
#include "Utils.h"

namespace secret_hunter {

void TextReporter::on_scan_start(const std::string& root) {
    out_ << "Scanning directory: " << root << "\n";
    out_.flush();
}

void TextReporter::on_finding(const Finding& finding) {
    out_ << "[ALERT: " << kind_label(finding.kind) << "] Found in " << finding.display_path
         << " (Line " << finding.line_number << ")\n";
    switch(finding.kind) {
        case FindingKind::Email:
            out_ << "    Line: " << utils::trim(finding.raw_line) << "\n";
            out_ << "    Email found: " << finding.extracted_value << "\n";
            break;
        case FindingKind::Password:
            out_ << "   LEAKED PASSWORD: \"" << finding.extracted_value << "\"\n";
            break;
        case FindingKind::ApiKey:
            out_ << "   LEAKED API_KEY: \"" << finding.extracted_value << "\"\n";
            break;
    }
    out_ << separator() << "\n";
}

// Read failures are logged to stderr by the scanner; keeping them out of this
// stream leaves the alert blocks intact.
void TextReporter::on_file_error(const std::string&, const std::string&) {}

void TextReporter::on_scan_end(const Report& report) {
    if(report.status() == ScanStatus::Interrupted) {
        out_ << "Scan interrupted; results are partial.\n";
    } else if(report.clean()) {
        out_ << "Scan completed successfully.\n";
    } else {
        out_ << "Scan completed with ";
        if(report.files_failed() > 0) {
            out_ << report.files_failed() << " unreadable file(s)";
            if(report.directories_skipped() > 0) out_ << " and ";
        }
        if(report.directories_skipped() > 0) out_ << report.directories_skipped() << " unreadable director(ies)";
        out_ << ".\n";
    }
    out_ << "Total issues found: " << report.finding_count() << "\n";
    out_.flush();
}

}
