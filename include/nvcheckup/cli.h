// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Command-line front end: argument parsing, run orchestration and exit codes.
//
//   nvcheckup run [--mode M] [--rules PATH] [--json] [--timeout N] [--verbose]
//   nvcheckup version
//   nvcheckup help

#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include "collector.h"
#include "console.h"
#include "types.h"
#include "nvcheckup/export.h"

namespace nvcheckup {

/// Raised for unknown commands, unknown flags, bad values and invalid modes.
class NVCHECKUP_API UsageError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Upper bound accepted for --timeout, in seconds.
constexpr int kMaxTimeoutSec = 3600;

enum class Command {
    RUN,
    VERSION,
    HELP
};

enum class ExitCode {
    OK = 0,            // no CRIT or WARN findings
    WARNINGS = 1,      // at least one WARN, no CRIT
    CRITICAL = 2,      // at least one CRIT
    USAGE = 3,
    CATALOG_ERROR = 4, // rule catalog failed to load
    FAILURE = 5        // unexpected internal error
};

struct CliOptions {
    Command command = Command::HELP;
    RunConfig config;
};

/// Parse arguments (without argv[0]). An empty list selects HELP.
/// @throws UsageError on any invalid input
NVCHECKUP_API CliOptions parseArgs(const std::vector<std::string>& args);

NVCHECKUP_API std::string usageText();
NVCHECKUP_API std::string versionText();

/// Map findings to the process exit code.
NVCHECKUP_API ExitCode exitCodeForFindings(const std::vector<Finding>& findings);

using FactCollector = std::function<FactSnapshot(const CollectorOptions&)>;

/// Load the catalog, collect facts, evaluate and print the report.
/// A catalog load failure is reported through console and yields
/// CATALOG_ERROR before any collection happens.
NVCHECKUP_API ExitCode runDiagnostics(const RunConfig& config,
                                      OutputHandler& console,
                                      const FactCollector& collect = collectFacts);

} // namespace nvcheckup
