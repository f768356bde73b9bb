// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "nvcheckup/console.h"

#include <iostream>

namespace nvcheckup {

// ---- TerminalConsole ----

void TerminalConsole::printBanner(const std::string& version, const std::string& disclaimer) {
    std::cout << "\n  " << BOLD << CYAN << "NVCheckup v" << version << RESET << "\n";
    std::cout << "  " << DIM << disclaimer << RESET << "\n\n";
}

void TerminalConsole::printStep(int stepNum, int stepTotal, const std::string& message) {
    std::cout << BOLD << BLUE << "[" << stepNum << "/" << stepTotal << "]" << RESET
              << " " << message << "\n";
}

void TerminalConsole::printError(const std::string& message) {
    std::cerr << RED << "ERROR: " << RESET << message << "\n";
}

void TerminalConsole::printWarning(const std::string& message) {
    std::cout << YELLOW << "WARNING: " << RESET << message << "\n";
}

void TerminalConsole::printInfo(const std::string& message) {
    std::cout << GREEN << "INFO: " << RESET << message << "\n";
}

void TerminalConsole::printReport(const std::string& report) {
    std::cout << "\n" << report << std::flush;
}

void TerminalConsole::printDebug(const std::string& message) {
    if (verbose_) {
        std::cerr << DIM << "[DEBUG] " << message << RESET << "\n";
    }
}

// ---- SilentConsole ----

void SilentConsole::printError(const std::string& message) {
    std::cerr << "ERROR: " << message << "\n";
}

void SilentConsole::printWarning(const std::string& message) {
    std::cerr << "WARNING: " << message << "\n";
}

void SilentConsole::printReport(const std::string& report) {
    if (!silenceReport_) {
        std::cout << report << "\n";
    }
}

} // namespace nvcheckup
