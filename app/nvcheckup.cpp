// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// NVCheckup: local NVIDIA GPU/driver diagnostic tool.
// Collects system, GPU and driver facts, evaluates the knowledge-pack rules
// for the selected mode and prints a report. Nothing leaves the machine.
//
// Usage:
//   ./nvcheckup run --mode gaming
//   ./nvcheckup run --mode ai --json

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <nvcheckup/cli.h>
#include <nvcheckup/console.h>

int main(int argc, char** argv) {
    using namespace nvcheckup;

    std::vector<std::string> args(argv + 1, argv + argc);

    CliOptions options;
    try {
        options = parseArgs(args);
    } catch (const UsageError& e) {
        std::cerr << e.what() << "\n\n" << usageText();
        return static_cast<int>(ExitCode::USAGE);
    }

    switch (options.command) {
        case Command::VERSION:
            std::cout << versionText();
            return static_cast<int>(ExitCode::OK);
        case Command::HELP:
            std::cout << usageText();
            return static_cast<int>(ExitCode::OK);
        case Command::RUN:
            break;
    }

    std::unique_ptr<OutputHandler> console;
    if (options.config.jsonOutput) {
        console = std::make_unique<SilentConsole>();
    } else {
        console = std::make_unique<TerminalConsole>(options.config.verbose);
    }

    try {
        return static_cast<int>(runDiagnostics(options.config, *console));
    } catch (const std::exception& e) {
        console->printError(std::string("Fatal error: ") + e.what());
        return static_cast<int>(ExitCode::FAILURE);
    }
}
