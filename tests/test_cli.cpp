// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>
#include <nvcheckup/cli.h>
#include <nvcheckup/report.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace nvcheckup;

// ---- Argument parsing ----

TEST(CliTest, EmptyArgsSelectHelp) {
    EXPECT_EQ(parseArgs({}).command, Command::HELP);
}

TEST(CliTest, RunDefaults) {
    CliOptions options = parseArgs({"run"});
    EXPECT_EQ(options.command, Command::RUN);
    EXPECT_EQ(options.config.mode, "full");
    EXPECT_FALSE(options.config.rulesPath.has_value());
    EXPECT_EQ(options.config.timeoutSec, 30);
    EXPECT_FALSE(options.config.jsonOutput);
    EXPECT_FALSE(options.config.verbose);
}

TEST(CliTest, RunAllFlags) {
    CliOptions options = parseArgs({"run", "--mode", "ai", "--rules", "/tmp/rules.json",
                                    "--timeout", "5", "--json", "--verbose"});
    EXPECT_EQ(options.command, Command::RUN);
    EXPECT_EQ(options.config.mode, "ai");
    ASSERT_TRUE(options.config.rulesPath.has_value());
    EXPECT_EQ(options.config.rulesPath.value(), "/tmp/rules.json");
    EXPECT_EQ(options.config.timeoutSec, 5);
    EXPECT_TRUE(options.config.jsonOutput);
    EXPECT_TRUE(options.config.verbose);
}

TEST(CliTest, VersionAndHelpAliases) {
    for (const char* arg : {"version", "--version", "-v"}) {
        EXPECT_EQ(parseArgs({arg}).command, Command::VERSION) << arg;
    }
    for (const char* arg : {"help", "--help", "-h"}) {
        EXPECT_EQ(parseArgs({arg}).command, Command::HELP) << arg;
    }
}

TEST(CliTest, InvalidModeRejected) {
    try {
        parseArgs({"run", "--mode", "turbo"});
        FAIL() << "Expected UsageError";
    } catch (const UsageError& e) {
        EXPECT_EQ(std::string(e.what()),
                  "Invalid mode: turbo. Use: gaming, ai, creator, streaming, full");
    }
}

TEST(CliTest, ModeIsCaseSensitive) {
    EXPECT_THROW(parseArgs({"run", "--mode", "Gaming"}), UsageError);
}

TEST(CliTest, UnknownFlagAndCommand) {
    EXPECT_THROW(parseArgs({"run", "--fast"}), UsageError);
    EXPECT_THROW(parseArgs({"scan"}), UsageError);
}

TEST(CliTest, MissingFlagValue) {
    EXPECT_THROW(parseArgs({"run", "--mode"}), UsageError);
    EXPECT_THROW(parseArgs({"run", "--rules"}), UsageError);
    EXPECT_THROW(parseArgs({"run", "--timeout"}), UsageError);
}

TEST(CliTest, BadTimeout) {
    EXPECT_THROW(parseArgs({"run", "--timeout", "0"}), UsageError);
    EXPECT_THROW(parseArgs({"run", "--timeout", "-4"}), UsageError);
    EXPECT_THROW(parseArgs({"run", "--timeout", "10s"}), UsageError);
    EXPECT_THROW(parseArgs({"run", "--timeout", "abc"}), UsageError);
    EXPECT_THROW(parseArgs({"run", "--timeout", "99999999999999"}), UsageError);
    EXPECT_THROW(parseArgs({"run", "--timeout", "3601"}), UsageError);
    EXPECT_THROW(parseArgs({"run", "--timeout", "3000000"}), UsageError);
}

TEST(CliTest, TimeoutUpperBound) {
    EXPECT_EQ(parseArgs({"run", "--timeout", "3600"}).config.timeoutSec, kMaxTimeoutSec);
}

TEST(CliTest, UsageMentionsFlags) {
    std::string usage = usageText();
    for (const char* flag : {"--mode", "--rules", "--json", "--timeout", "--verbose"}) {
        EXPECT_NE(usage.find(flag), std::string::npos) << flag;
    }
    EXPECT_NE(versionText().find(kToolVersion), std::string::npos);
}

// ---- Exit codes ----

namespace {

Finding findingWith(const std::string& severity) {
    Finding f;
    f.severity = severity;
    f.title = severity + " finding";
    return f;
}

} // namespace

TEST(CliTest, ExitCodeForFindings) {
    EXPECT_EQ(exitCodeForFindings({}), ExitCode::OK);
    EXPECT_EQ(exitCodeForFindings({findingWith("INFO")}), ExitCode::OK);
    EXPECT_EQ(exitCodeForFindings({findingWith("INFO"), findingWith("WARN")}), ExitCode::WARNINGS);
    EXPECT_EQ(exitCodeForFindings({findingWith("WARN"), findingWith("CRIT")}), ExitCode::CRITICAL);
}

// ---- runDiagnostics ----

class RunDiagnosticsTest : public ::testing::Test {
protected:
    SilentConsole console{true};
    int collectCalls = 0;

    FactCollector collectorReturning(const FactSnapshot& facts) {
        return [this, facts](const CollectorOptions&) {
            ++collectCalls;
            return facts;
        };
    }

    static FactSnapshot healthyMachine() {
        FactSnapshot facts;
        GpuInfo gpu;
        gpu.name = "NVIDIA GeForce RTX 4070";
        gpu.vendor = "NVIDIA";
        gpu.driverVersion = "550.54.14";
        gpu.vramTotalMb = 12282;
        gpu.temperatureC = 45;
        gpu.isNvidia = true;
        facts.gpus = {gpu};
        facts.driver.version = "550.54.14";
        facts.driver.cudaVersion = "12.4";
        return facts;
    }
};

TEST_F(RunDiagnosticsTest, EmptyMachineIsCritical) {
    RunConfig config;
    EXPECT_EQ(runDiagnostics(config, console, collectorReturning(FactSnapshot{})),
              ExitCode::CRITICAL);
    EXPECT_EQ(collectCalls, 1);
}

TEST_F(RunDiagnosticsTest, HealthyMachineIsOk) {
    RunConfig config;
    config.jsonOutput = true;
    EXPECT_EQ(runDiagnostics(config, console, collectorReturning(healthyMachine())),
              ExitCode::OK);
}

TEST_F(RunDiagnosticsTest, HotGpuIsWarning) {
    FactSnapshot facts = healthyMachine();
    facts.gpus[0].temperatureC = 80;

    RunConfig config;
    config.mode = "gaming";
    config.rulesPath = NVCHECKUP_TEST_RULES_FILE;
    EXPECT_EQ(runDiagnostics(config, console, collectorReturning(facts)), ExitCode::WARNINGS);
}

TEST_F(RunDiagnosticsTest, CollectorReceivesRunOptions) {
    RunConfig config;
    config.timeoutSec = 7;
    config.verbose = true;

    CollectorOptions seen;
    runDiagnostics(config, console, [&seen](const CollectorOptions& options) {
        seen = options;
        return FactSnapshot{};
    });
    EXPECT_EQ(seen.timeoutSec, 7);
    EXPECT_TRUE(seen.debug);
}

TEST_F(RunDiagnosticsTest, MissingCatalogFailsBeforeCollection) {
    RunConfig config;
    config.rulesPath = "/nonexistent/nvcheckup/rules.json";
    EXPECT_EQ(runDiagnostics(config, console, collectorReturning(FactSnapshot{})),
              ExitCode::CATALOG_ERROR);
    EXPECT_EQ(collectCalls, 0);
}

TEST_F(RunDiagnosticsTest, CustomCatalogFile) {
    auto path = std::filesystem::temp_directory_path() / "nvcheckup_cli_test_rules.json";
    {
        std::ofstream out(path);
        out << R"({
            "description": "test pack",
            "version": "test",
            "rules": [{
                "id": "hybrid-gpu",
                "title": "Hybrid graphics",
                "category": "display",
                "severity": "INFO",
                "modes": ["full"],
                "description": "Hybrid setup."
            }]
        })";
    }

    FactSnapshot facts;
    GpuInfo nvidia;
    nvidia.name = "NVIDIA GeForce RTX 3060 Laptop GPU";
    nvidia.isNvidia = true;
    GpuInfo igpu;
    igpu.name = "Intel Iris Xe";
    facts.gpus = {nvidia, igpu};

    RunConfig config;
    config.rulesPath = path.string();
    EXPECT_EQ(runDiagnostics(config, console, collectorReturning(facts)), ExitCode::OK);
    EXPECT_EQ(collectCalls, 1);

    std::filesystem::remove(path);
}

TEST_F(RunDiagnosticsTest, MalformedCatalogFile) {
    auto path = std::filesystem::temp_directory_path() / "nvcheckup_cli_test_bad.json";
    {
        std::ofstream out(path);
        out << R"({"description": "bad", "version": "1", "rules": [{"id": "x"}]})";
    }

    RunConfig config;
    config.rulesPath = path.string();
    EXPECT_EQ(runDiagnostics(config, console, collectorReturning(FactSnapshot{})),
              ExitCode::CATALOG_ERROR);
    EXPECT_EQ(collectCalls, 0);

    std::filesystem::remove(path);
}

TEST_F(RunDiagnosticsTest, VerboseJsonRunReportsRulesWithoutChecks) {
    std::ostringstream captured;
    std::streambuf* oldErr = std::cerr.rdbuf(captured.rdbuf());

    RunConfig config;
    config.jsonOutput = true;
    config.verbose = true;
    ExitCode code = runDiagnostics(config, console, collectorReturning(healthyMachine()));

    std::cerr.rdbuf(oldErr);
    EXPECT_EQ(code, ExitCode::OK);
    EXPECT_NE(captured.str().find("'nouveau-loaded'"), std::string::npos);
    EXPECT_NE(captured.str().find("'cuda-driver-mismatch'"), std::string::npos);
}
