#include "JSONWriter.h"
#include "BuildInfo.h"
#include "JsonUtil.h"
#include "Report.h"
#include "Utils.h"
#include <chrono>
#include <map>
#include <sstream>

namespace secret_hunter {
namespace {
    struct CanonVal {
        enum Type { T_OBJ, T_ARR, T_STR, T_NUM } type = T_OBJ;
        std::map<std::string, CanonVal> obj; // sorted keys
        std::vector<CanonVal> arr;
        std::string str; // string contents or number token
        CanonVal() = default;
        explicit CanonVal(Type t): type(t) {}
    };

    using jsonutil::escape; using jsonutil::time_to_iso;

    void put_str(CanonVal& o, const std::string& k, const std::string& v) {
        o.obj[k].type = CanonVal::T_STR;
        o.obj[k].str = v;
    }

    void put_num(CanonVal& o, const std::string& k, long long v) {
        o.obj[k].type = CanonVal::T_NUM;
        o.obj[k].str = std::to_string(v);
    }

    void newline(std::ostream& os, int indent, int depth) {
        if(indent <= 0) return;
        os << '\n';
        for(int i = 0; i < indent * depth; ++i) os << ' ';
    }

    void canon_emit(const CanonVal& v, std::ostream& os, int indent, int depth) {
        switch(v.type) {
            case CanonVal::T_STR:
                os << '"' << escape(v.str) << '"';
                break;
            case CanonVal::T_NUM:
                os << v.str;
                break;
            case CanonVal::T_ARR: {
                os << '[';
                bool first = true;
                for(const auto& e : v.arr) {
                    if(!first) os << ',';
                    first = false;
                    newline(os, indent, depth + 1);
                    canon_emit(e, os, indent, depth + 1);
                }
                if(!v.arr.empty()) newline(os, indent, depth);
                os << ']';
                break;
            }
            case CanonVal::T_OBJ: {
                os << '{';
                bool first = true;
                for(const auto& kv : v.obj) {
                    if(!first) os << ',';
                    first = false;
                    newline(os, indent, depth + 1);
                    os << '"' << escape(kv.first) << '"' << ':';
                    if(indent > 0) os << ' ';
                    canon_emit(kv.second, os, indent, depth + 1);
                }
                if(!v.obj.empty()) newline(os, indent, depth);
                os << '}';
                break;
            }
        }
    }

    CanonVal build_meta_object(const Report& report, const Config& cfg) {
        CanonVal meta{CanonVal::T_OBJ};
        put_str(meta, "tool", "secret-hunter");
        put_str(meta, "tool_version", buildinfo::APP_VERSION);
        put_str(meta, "root", report.root());
        put_str(meta, "started_at", time_to_iso(report.started_at()));
        put_str(meta, "finished_at", time_to_iso(report.finished_at()));
        put_str(meta, "decode_policy", decode_policy_name(cfg.decode_policy));

        CanonVal prov{CanonVal::T_OBJ};
        put_str(prov, "compiler_id", buildinfo::COMPILER_ID);
        put_str(prov, "compiler_version", buildinfo::COMPILER_VERSION);
        put_str(prov, "git_commit", buildinfo::GIT_COMMIT);
        put_str(prov, "cxx_standard", buildinfo::CXX_STANDARD);
        put_str(prov, "build_type", buildinfo::BUILD_TYPE);
        meta.obj["provenance"] = std::move(prov);

        CanonVal exts{CanonVal::T_ARR};
        for(const auto& e : cfg.extensions) {
            CanonVal s{CanonVal::T_STR};
            s.str = e;
            exts.arr.push_back(std::move(s));
        }
        meta.obj["extensions"] = std::move(exts);
        return meta;
    }

    CanonVal build_summary_object(const Report& report) {
        CanonVal summary{CanonVal::T_OBJ};
        put_str(summary, "status", scan_status_name(report.status()));
        put_num(summary, "files_visited", static_cast<long long>(report.files_visited()));
        put_num(summary, "files_scanned", static_cast<long long>(report.files_scanned()));
        put_num(summary, "files_filtered", static_cast<long long>(report.files_filtered()));
        put_num(summary, "files_failed", static_cast<long long>(report.files_failed()));
        put_num(summary, "directories_skipped", static_cast<long long>(report.directories_skipped()));
        put_num(summary, "finding_count_total", static_cast<long long>(report.finding_count()));

        long long elapsed_ms = 0;
        if(report.started_at().time_since_epoch().count() && report.finished_at() >= report.started_at()) {
            elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(report.finished_at() - report.started_at()).count();
        }
        put_num(summary, "duration_ms", elapsed_ms);

        CanonVal counts{CanonVal::T_OBJ};
        for(const auto& kv : report.finding_counts_by_kind()) put_num(counts, kv.first, static_cast<long long>(kv.second));
        summary.obj["finding_counts"] = std::move(counts);
        return summary;
    }

    CanonVal build_findings_array(const std::vector<Finding>& findings, bool hash_files) {
        CanonVal arr{CanonVal::T_ARR};
        std::map<std::string, std::string> hashes; // file_path -> sha256
        for(const auto& f : findings) {
            CanonVal fv{CanonVal::T_OBJ};
            put_str(fv, "kind", kind_id(f.kind));
            put_str(fv, "severity", kind_severity(f.kind));
            put_str(fv, "path", f.file_path);
            put_str(fv, "display_path", f.display_path);
            put_num(fv, "line", static_cast<long long>(f.line_number));
            put_str(fv, "line_text", f.raw_line);
            put_str(fv, "value", f.extracted_value);
            if(hash_files) {
                auto it = hashes.find(f.file_path);
                if(it == hashes.end()) it = hashes.emplace(f.file_path, utils::sha256_file(f.file_path)).first;
                if(!it->second.empty()) put_str(fv, "sha256", it->second);
            }
            arr.arr.push_back(std::move(fv));
        }
        return arr;
    }

    CanonVal build_warnings_array(const Report& report) {
        CanonVal warns{CanonVal::T_ARR};
        for(const auto& w : report.warnings()) {
            CanonVal wv{CanonVal::T_OBJ};
            put_str(wv, "path", w.first);
            put_str(wv, "message", w.second);
            warns.arr.push_back(std::move(wv));
        }
        return warns;
    }
}

void JSONWriter::on_scan_start(const std::string&) {
    findings_.clear();
}

void JSONWriter::on_finding(const Finding& finding) {
    findings_.push_back(finding);
}

// file errors reach the document through Report::warnings()
void JSONWriter::on_file_error(const std::string&, const std::string&) {}

std::string JSONWriter::write(const Report& report) const {
    CanonVal root{CanonVal::T_OBJ};
    root.obj["meta"] = build_meta_object(report, cfg_);
    root.obj["summary"] = build_summary_object(report);
    root.obj["findings"] = build_findings_array(findings_, cfg_.hash_files);
    root.obj["warnings"] = build_warnings_array(report);

    std::ostringstream os;
    canon_emit(root, os, cfg_.pretty ? 2 : 0, 0);
    os << "\n";
    return os.str();
}

void JSONWriter::on_scan_end(const Report& report) {
    out_ << write(report);
    out_.flush();
}

}
