// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Console output system for diagnostic runs.
//
// OutputHandler is the single channel for progress, status and debug
// messages. TerminalConsole writes ANSI-colored text; SilentConsole is used
// for JSON output and tests.

#pragma once

#include <string>

#include "nvcheckup/export.h"

namespace nvcheckup {

/// Abstract output handler interface.
class NVCHECKUP_API OutputHandler {
public:
    virtual ~OutputHandler() = default;

    // === Run Progress ===
    virtual void printBanner(const std::string& version, const std::string& disclaimer) = 0;
    virtual void printStep(int stepNum, int stepTotal, const std::string& message) = 0;

    // === Status Messages ===
    virtual void printError(const std::string& message) = 0;
    virtual void printWarning(const std::string& message) = 0;
    virtual void printInfo(const std::string& message) = 0;

    /// Final rendered report (text or JSON).
    virtual void printReport(const std::string& report) = 0;

    // === Optional Methods (default no-op) ===
    virtual void printDebug(const std::string& /*message*/) {}
};

/// Terminal console with ANSI color output.
/// Errors go to stderr; everything else to stdout. Debug lines are shown
/// only when verbose.
class NVCHECKUP_API TerminalConsole : public OutputHandler {
public:
    explicit TerminalConsole(bool verbose = false) : verbose_(verbose) {}

    void printBanner(const std::string& version, const std::string& disclaimer) override;
    void printStep(int stepNum, int stepTotal, const std::string& message) override;
    void printError(const std::string& message) override;
    void printWarning(const std::string& message) override;
    void printInfo(const std::string& message) override;
    void printReport(const std::string& report) override;
    void printDebug(const std::string& message) override;

    bool verbose() const { return verbose_; }

private:
    bool verbose_;

    // ANSI color codes
    static constexpr const char* RESET  = "\033[0m";
    static constexpr const char* BOLD   = "\033[1m";
    static constexpr const char* DIM    = "\033[90m";
    static constexpr const char* RED    = "\033[91m";
    static constexpr const char* GREEN  = "\033[92m";
    static constexpr const char* YELLOW = "\033[93m";
    static constexpr const char* BLUE   = "\033[94m";
    static constexpr const char* CYAN   = "\033[96m";
};

/// Console that suppresses progress and info output.
/// Errors and warnings go to stderr, keeping stdout free for the report.
class NVCHECKUP_API SilentConsole : public OutputHandler {
public:
    explicit SilentConsole(bool silenceReport = false)
        : silenceReport_(silenceReport) {}

    void printBanner(const std::string&, const std::string&) override {}
    void printStep(int, int, const std::string&) override {}
    void printError(const std::string& message) override;
    void printWarning(const std::string& message) override;
    void printInfo(const std::string&) override {}
    void printReport(const std::string& report) override;

private:
    bool silenceReport_;
};

} // namespace nvcheckup
