#include "ContentAnalyzer.h"
#include "../core/Errors.h"
#include "../core/Logging.h"
#include "../core/Utils.h"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <ios>

namespace fs = std::filesystem;
namespace secret_hunter {

namespace {
    // Reads through the next '\n' but keeps at most `max` bytes of the line,
    // so one huge line costs no more memory than a short one. Sets
    // `overflowed` when bytes were dropped. Returns false at end of input
    // when nothing was read.
    bool read_bounded_line(std::streambuf& sb, std::string& line, size_t max, bool& overflowed) {
        using traits = std::streambuf::traits_type;
        line.clear();
        overflowed = false;
        bool got_any = false;
        for(;;) {
            traits::int_type c = sb.sbumpc();
            if(traits::eq_int_type(c, traits::eof())) return got_any;
            got_any = true;
            char ch = traits::to_char_type(c);
            if(ch == '\n') return true;
            if(line.size() < max) line.push_back(ch);
            else overflowed = true;
        }
    }
}

AnalyzerOptions AnalyzerOptions::from_config(const Config& cfg) {
    AnalyzerOptions o;
    o.decode_policy = cfg.decode_policy;
    o.max_line_length = cfg.max_line_length > 0 ? static_cast<size_t>(cfg.max_line_length) : 4096;
    o.timeout = std::chrono::seconds(cfg.file_timeout_seconds > 0 ? cfg.file_timeout_seconds : 0);
    return o;
}

ContentAnalyzer::ContentAnalyzer(const RuleSet& rules, AnalyzerOptions options)
    : rules_(rules), options_(options) {}

void ContentAnalyzer::analyze_line(const std::string& line, size_t line_number, const std::string& file_path,
                                   const std::string& display_path, const Emit& emit) const {
    for(auto& m : rules_.match_line(line)) {
        Finding f;
        f.kind = m.kind;
        f.file_path = file_path;
        f.display_path = display_path;
        f.line_number = line_number;
        f.raw_line = line;
        f.extracted_value = std::move(m.value);
        emit(std::move(f));
    }
}

void ContentAnalyzer::analyze(const fs::path& file, const std::string& display_path, const Emit& emit) const {
    const std::string path = file.string();
    std::ifstream in(file, std::ios::binary);
    if(!in.is_open()) {
        throw FileAccessError(path, std::string("cannot open: ") + std::strerror(errno));
    }

    const bool timed = options_.timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + options_.timeout;
    // max + 1 so a CR right after a full-length line can still be stripped
    const size_t keep = options_.max_line_length + 1;
    std::string line;
    line.reserve(keep);
    size_t line_number = 0;
    bool truncated_logged = false;
    bool overflowed = false;
    for(;;) {
        try {
            if(!read_bounded_line(*in.rdbuf(), line, keep, overflowed)) break;
        } catch(const std::ios_base::failure& ex) {
            throw FileAccessError(path, "read error after line " + std::to_string(line_number) + ": " + ex.what());
        }
        ++line_number;
        if(!overflowed && !line.empty() && line.back() == '\r') line.pop_back();
        if(line.size() > options_.max_line_length || overflowed) {
            if(!truncated_logged) {
                Logger::instance().debug(path + ": line " + std::to_string(line_number) + " longer than " +
                                         std::to_string(options_.max_line_length) + " bytes, matching its prefix only");
                truncated_logged = true;
            }
            if(line.size() > options_.max_line_length) line.resize(options_.max_line_length);
        }
        utils::sanitize_utf8(line, options_.decode_policy);
        analyze_line(line, line_number, path, display_path, emit);

        if(timed && std::chrono::steady_clock::now() > deadline) {
            throw FileAccessError(path, "timed out after " + std::to_string(
                std::chrono::duration_cast<std::chrono::seconds>(options_.timeout).count()) + "s at line " +
                std::to_string(line_number));
        }
    }
}

std::vector<Finding> ContentAnalyzer::analyze(const fs::path& file, const std::string& display_path) const {
    std::vector<Finding> out;
    analyze(file, display_path, [&](Finding&& f){ out.push_back(std::move(f)); });
    return out;
}

}
