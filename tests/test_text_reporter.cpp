#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/TextReporter.h"
#include "../src/core/Report.h"
#include <sstream>

namespace secret_hunter {

class TextReporterTest : public ::testing::Test {
protected:
    std::ostringstream out;
    TextReporter reporter{out};
    Report report;

    Finding make(FindingKind kind, const std::string& path, size_t line, const std::string& raw, const std::string& value) {
        Finding f;
        f.kind = kind;
        f.file_path = "/scan/" + path;
        f.display_path = path;
        f.line_number = line;
        f.raw_line = raw;
        f.extracted_value = value;
        return f;
    }
};

TEST_F(TextReporterTest, BannerOnStart) {
    reporter.on_scan_start("/srv/app");
    EXPECT_EQ(out.str(), "Scanning directory: /srv/app\n");
}

TEST_F(TextReporterTest, EmailBlockShowsTrimmedLine) {
    reporter.on_finding(make(FindingKind::Email, "notes.txt", 3, "   Contact admin@startup.io  \t", "admin@startup.io"));
    EXPECT_EQ(out.str(),
              "[ALERT: EMAIL] Found in notes.txt (Line 3)\n"
              "    Line: Contact admin@startup.io\n"
              "    Email found: admin@startup.io\n"
              "------------------------------\n");
}

TEST_F(TextReporterTest, PasswordBlock) {
    reporter.on_finding(make(FindingKind::Password, "src/app.py", 12, "db_password = \"s3cr3t\"", "s3cr3t"));
    EXPECT_EQ(out.str(),
              "[ALERT: PASSWORD] Found in src/app.py (Line 12)\n"
              "   LEAKED PASSWORD: \"s3cr3t\"\n"
              "------------------------------\n");
}

TEST_F(TextReporterTest, ApiKeyBlock) {
    reporter.on_finding(make(FindingKind::ApiKey, "config.json", 2, "\"api_key\": \"k\"", "k"));
    EXPECT_EQ(out.str(),
              "[ALERT: API KEY] Found in config.json (Line 2)\n"
              "   LEAKED API_KEY: \"k\"\n"
              "------------------------------\n");
}

TEST_F(TextReporterTest, FileErrorsStayOutOfTheStream) {
    reporter.on_file_error("/scan/locked.txt", "cannot open: Permission denied");
    EXPECT_EQ(out.str(), "");
}

TEST_F(TextReporterTest, SuccessfulSummary) {
    report.start("/scan");
    report.count_finding(FindingKind::Email);
    report.count_finding(FindingKind::Password);
    report.finish(ScanStatus::Completed);
    reporter.on_scan_end(report);
    EXPECT_EQ(out.str(), "Scan completed successfully.\nTotal issues found: 2\n");
}

TEST_F(TextReporterTest, SummaryWithUnreadableFiles) {
    report.start("/scan");
    report.add_file_error("/scan/a.txt", "cannot open");
    report.add_file_error("/scan/b.txt", "cannot open");
    report.finish(ScanStatus::Completed);
    reporter.on_scan_end(report);
    EXPECT_EQ(out.str(), "Scan completed with 2 unreadable file(s).\nTotal issues found: 0\n");
}

TEST_F(TextReporterTest, SummaryWithUnreadableFilesAndDirectories) {
    report.start("/scan");
    report.add_file_error("/scan/a.txt", "cannot open");
    report.add_skipped_directory("/scan/locked", "Permission denied");
    report.finish(ScanStatus::Completed);
    reporter.on_scan_end(report);
    EXPECT_EQ(out.str(),
              "Scan completed with 1 unreadable file(s) and 1 unreadable director(ies).\n"
              "Total issues found: 0\n");
}

TEST_F(TextReporterTest, SummaryWithUnreadableDirectoryOnly) {
    report.start("/scan");
    report.add_skipped_directory("/scan/locked", "Permission denied");
    report.finish(ScanStatus::Completed);
    reporter.on_scan_end(report);
    EXPECT_EQ(out.str(), "Scan completed with 1 unreadable director(ies).\nTotal issues found: 0\n");
}

TEST_F(TextReporterTest, InterruptedSummary) {
    report.start("/scan");
    report.count_finding(FindingKind::ApiKey);
    report.finish(ScanStatus::Interrupted);
    reporter.on_scan_end(report);
    EXPECT_EQ(out.str(), "Scan interrupted; results are partial.\nTotal issues found: 1\n");
}

}
