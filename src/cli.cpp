// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "nvcheckup/cli.h"

#include <chrono>
#include <sstream>

#include "nvcheckup/analyzer.h"
#include "nvcheckup/report.h"
#include "nvcheckup/rule_catalog.h"

namespace nvcheckup {

namespace {

const std::string& requireValue(const std::vector<std::string>& args, size_t& i) {
    if (i + 1 >= args.size()) {
        throw UsageError("Flag " + args[i] + " requires a value");
    }
    return args[++i];
}

int parseTimeout(const std::string& value) {
    int timeout = 0;
    size_t consumed = 0;
    try {
        timeout = std::stoi(value, &consumed);
    } catch (const std::logic_error&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != value.size() || timeout <= 0 || timeout > kMaxTimeoutSec) {
        throw UsageError("Invalid timeout: " + value + ". Use 1 to " +
                         std::to_string(kMaxTimeoutSec) + " seconds");
    }
    return timeout;
}

CliOptions parseRunArgs(const std::vector<std::string>& args) {
    CliOptions options;
    options.command = Command::RUN;

    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--mode") {
            options.config.mode = requireValue(args, i);
        } else if (arg == "--rules") {
            options.config.rulesPath = requireValue(args, i);
        } else if (arg == "--timeout") {
            options.config.timeoutSec = parseTimeout(requireValue(args, i));
        } else if (arg == "--json") {
            options.config.jsonOutput = true;
        } else if (arg == "--verbose") {
            options.config.verbose = true;
        } else {
            throw UsageError("Unknown flag: " + arg);
        }
    }

    if (!parseRunMode(options.config.mode).has_value()) {
        throw UsageError("Invalid mode: " + options.config.mode +
                         ". Use: gaming, ai, creator, streaming, full");
    }
    return options;
}

} // namespace

CliOptions parseArgs(const std::vector<std::string>& args) {
    CliOptions options;
    if (args.empty()) {
        return options;
    }

    const std::string& command = args[0];
    if (command == "run") {
        return parseRunArgs(args);
    }
    if (command == "version" || command == "--version" || command == "-v") {
        options.command = Command::VERSION;
        return options;
    }
    if (command == "help" || command == "--help" || command == "-h") {
        options.command = Command::HELP;
        return options;
    }
    throw UsageError("Unknown command: " + command);
}

std::string usageText() {
    std::ostringstream oss;
    oss << "NVCheckup v" << kToolVersion << " — Cross-platform NVIDIA Diagnostic Tool\n"
        << kDisclaimer << "\n"
        << "\n"
        << "Usage:\n"
        << "  nvcheckup <command> [flags]\n"
        << "\n"
        << "Commands:\n"
        << "  run         Run diagnostics and generate a report\n"
        << "  version     Show version information\n"
        << "  help        Show this help\n"
        << "\n"
        << "Run Flags:\n"
        << "  --mode      Diagnostic mode: gaming, ai, creator, streaming, full (default: full)\n"
        << "  --rules     Load rules from a knowledge pack file instead of the built-in one\n"
        << "  --json      Print a JSON report instead of text\n"
        << "  --timeout   Command timeout in seconds, 1-3600 (default: 30)\n"
        << "  --verbose   Enable verbose output\n"
        << "\n"
        << "Exit codes:\n"
        << "  0 no issues, 1 warnings, 2 critical issues, 3 usage error, 4 rule catalog error,\n  5 internal error\n"
        << "\n"
        << "Examples:\n"
        << "  nvcheckup run --mode gaming\n"
        << "  nvcheckup run --mode ai --json\n"
        << "  nvcheckup run --mode full --rules ./knowledge/rules.json\n";
    return oss.str();
}

std::string versionText() {
    return std::string("NVCheckup v") + kToolVersion + "\n" + kDisclaimer + "\n";
}

ExitCode exitCodeForFindings(const std::vector<Finding>& findings) {
    bool hasWarn = false;
    for (const auto& f : findings) {
        if (f.severity == kSeverityCrit) return ExitCode::CRITICAL;
        if (f.severity == kSeverityWarn) hasWarn = true;
    }
    return hasWarn ? ExitCode::WARNINGS : ExitCode::OK;
}

ExitCode runDiagnostics(const RunConfig& config,
                        OutputHandler& console,
                        const FactCollector& collect) {
    ExecutionContext context;
    context.mode = config.mode;
    context.platform = currentPlatform();

    console.printBanner(kToolVersion, kDisclaimer);
    auto start = std::chrono::steady_clock::now();

    RuleCatalog catalog;
    try {
        catalog = config.rulesPath.has_value()
                      ? loadRuleCatalogFile(config.rulesPath.value())
                      : loadEmbeddedRuleCatalog();
    } catch (const LoadError& e) {
        console.printError(std::string("Failed to load rule catalog: ") + e.what());
        return ExitCode::CATALOG_ERROR;
    }
    console.printDebug("Loaded " + std::to_string(catalog.rules.size()) +
                       " rules (knowledge pack " +
                       (catalog.version.empty() ? std::string("unversioned") : catalog.version) + ")");

    if (config.verbose) {
        for (const auto& id : unimplementedRuleIds(catalog.rules)) {
            console.printWarning("Rule '" + id + "' has no check in this build and will be skipped");
        }
    }

    console.printStep(1, 3, "Collecting system and GPU information...");
    CollectorOptions collectorOptions;
    collectorOptions.timeoutSec = config.timeoutSec;
    collectorOptions.debug = config.verbose;
    const FactSnapshot facts = collect(collectorOptions);
    console.printDebug("Detected " + std::to_string(facts.gpus.size()) + " GPU(s) on " +
                       context.platform);

    console.printStep(2, 3, "Analyzing results...");
    const std::vector<Finding> findings = analyze(facts, catalog.rules, context);

    console.printStep(3, 3, "Generating report...");
    double elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();

    if (config.jsonOutput) {
        console.printReport(generateJsonReport(facts, findings, context.mode, elapsed).dump(2));
    } else {
        console.printReport(generateTextReport(facts, findings, context.mode, elapsed));
    }

    return exitCodeForFindings(findings);
}

} // namespace nvcheckup
