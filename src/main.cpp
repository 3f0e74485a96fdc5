#include "core/ArgumentParser.h"
#include "core/Config.h"
#include "core/ConfigValidator.h"
#include "core/Errors.h"
#include "core/JSONWriter.h"
#include "core/Logging.h"
#include "core/Privilege.h"
#include "core/Report.h"
#include "core/ScanContext.h"
#include "core/TextReporter.h"
#include "core/Utils.h"
#include "scanners/SecretScanner.h"
#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>

using namespace secret_hunter;

namespace {
    enum ExitCode {
        kExitOk = 0,
        kExitThreshold = 1,
        kExitUsage = 2,
        kExitPath = 3,
        kExitIo = 4,
        kExitInterrupted = 130
    };

    std::atomic<bool> g_stop{false};

    extern "C" void handle_stop_signal(int) {
        g_stop.store(true, std::memory_order_relaxed);
    }

    void install_signal_handlers() {
        struct sigaction sa{};
        sa.sa_handler = handle_stop_signal;
        sigemptyset(&sa.sa_mask);
        sigaction(SIGINT, &sa, nullptr);
        sigaction(SIGTERM, &sa, nullptr);
    }

    void configure_logging(const Config& cfg) {
        LogLevel level = LogLevel::Info;
        if(cfg.verbose) level = LogLevel::Debug;
        if(cfg.quiet) level = LogLevel::Error;
        if(!cfg.log_level.empty() && !parse_log_level(cfg.log_level, level)) {
            Logger::instance().warn("Unknown log level '" + cfg.log_level + "', using info");
        }
        Logger::instance().set_level(level);
    }
}

int main(int argc, char** argv) {
    Logger::instance().set_level(LogLevel::Info);
    Config cfg;
    ArgumentParser parser;
    if(!parser.parse(argc, argv, cfg)) return parser.exit_code();

    ConfigValidator validator;
    if(!validator.load_external_files(cfg)) return kExitUsage;
    if(!validator.validate(cfg)) return kExitUsage;
    configure_logging(cfg);

    if(cfg.root_path.empty()) {
        std::cout << "Enter directory path here: " << std::flush;
        std::string line;
        if(!std::getline(std::cin, line)) {
            std::cerr << "Error: no directory path was given.\n";
            return kExitPath;
        }
        cfg.root_path = utils::trim(line);
    }

    std::ofstream file_out;
    if(!cfg.output_file.empty()) {
        file_out.open(cfg.output_file, std::ios::out | std::ios::trunc);
        if(!file_out) {
            std::cerr << "Cannot open output file: " << cfg.output_file << "\n";
            return kExitIo;
        }
    }
    std::ostream& out = cfg.output_file.empty() ? std::cout : file_out;

    RuleSet rules = RuleSet::defaults();
    for(const auto& name : cfg.disable_rules) rules.disable(name);

    // Sandbox after every file the process writes is open.
    if(cfg.drop_priv && !drop_capabilities(cfg.keep_cap_dac)) {
        Logger::instance().warn("Continuing with current capabilities");
    }
    if(cfg.seccomp && !apply_seccomp_profile()) {
        std::cerr << "Failed to apply seccomp profile";
        if(cfg.seccomp_strict) { std::cerr << "\n"; return kExitIo; }
        std::cerr << " (continuing)\n";
    }

    install_signal_handlers();

    std::unique_ptr<FindingSink> sink;
    if(cfg.json) sink = std::make_unique<JSONWriter>(out, cfg);
    else sink = std::make_unique<TextReporter>(out);

    Report report;
    ScanContext context(cfg, report, *sink, &g_stop);
    SecretScanner scanner(std::move(rules));

    ScanStatus status = ScanStatus::Completed;
    try {
        status = scanner.run(context);
    } catch(const PathError& ex) {
        Logger::instance().debug("root path rejected: " + ex.path());
        std::cerr << ex.what() << "\n";
        return kExitPath;
    }

    out.flush();
    if(!out) {
        std::cerr << "Failed to write report\n";
        return kExitIo;
    }
    if(status == ScanStatus::Interrupted) return kExitInterrupted;
    if(cfg.fail_on_count > 0 && report.finding_count() >= static_cast<size_t>(cfg.fail_on_count)) return kExitThreshold;
    return kExitOk;
}
