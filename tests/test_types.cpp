// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>
#include <nvcheckup/types.h>

using namespace nvcheckup;

// ---- Severity Tests ----

TEST(TypesTest, SeverityRankOrder) {
    EXPECT_LT(severityRank("CRIT"), severityRank("WARN"));
    EXPECT_LT(severityRank("WARN"), severityRank("INFO"));
    EXPECT_LT(severityRank("INFO"), severityRank("NOTICE"));
}

TEST(TypesTest, SeverityRankUnknownSortsLast) {
    EXPECT_EQ(severityRank(""), 3);
    EXPECT_EQ(severityRank("crit"), 3); // case-sensitive
    EXPECT_EQ(severityRank("DEBUG"), severityRank("whatever"));
}

// ---- RunMode Tests ----

TEST(TypesTest, RunModeToString) {
    EXPECT_EQ(runModeToString(RunMode::GAMING), "gaming");
    EXPECT_EQ(runModeToString(RunMode::AI), "ai");
    EXPECT_EQ(runModeToString(RunMode::CREATOR), "creator");
    EXPECT_EQ(runModeToString(RunMode::STREAMING), "streaming");
    EXPECT_EQ(runModeToString(RunMode::FULL), "full");
}

TEST(TypesTest, ParseRunMode) {
    EXPECT_EQ(parseRunMode("gaming"), RunMode::GAMING);
    EXPECT_EQ(parseRunMode("full"), RunMode::FULL);
    EXPECT_FALSE(parseRunMode("Gaming").has_value());
    EXPECT_FALSE(parseRunMode("benchmark").has_value());
    EXPECT_FALSE(parseRunMode("").has_value());
}

TEST(TypesTest, CurrentPlatformIsCanonical) {
    std::string platform = currentPlatform();
#if defined(__linux__)
    EXPECT_EQ(platform, "linux");
#elif defined(_WIN32)
    EXPECT_EQ(platform, "windows");
#else
    EXPECT_FALSE(platform.empty());
#endif
}

// ---- JSON Tests ----

TEST(TypesTest, GpuInfoToJson) {
    GpuInfo gpu;
    gpu.index = 1;
    gpu.name = "NVIDIA GeForce RTX 3060";
    gpu.vendor = "NVIDIA";
    gpu.driverVersion = "535.104.05";
    gpu.vramTotalMb = 12288;
    gpu.temperatureC = 41;
    gpu.isNvidia = true;

    json j = gpu.toJson();
    EXPECT_EQ(j["index"], 1);
    EXPECT_EQ(j["name"], "NVIDIA GeForce RTX 3060");
    EXPECT_EQ(j["driver_version"], "535.104.05");
    EXPECT_EQ(j["vram_total_mb"], 12288);
    EXPECT_EQ(j["temperature_c"], 41);
    EXPECT_EQ(j["is_nvidia"], true);
}

TEST(TypesTest, RuleToJsonOmitsAbsentPlatform) {
    Rule rule;
    rule.id = "low-vram";
    rule.modes = {"ai"};

    json j = rule.toJson();
    EXPECT_EQ(j["id"], "low-vram");
    EXPECT_FALSE(j.contains("platform"));

    rule.platform = "linux";
    EXPECT_EQ(rule.toJson()["platform"], "linux");
}

TEST(TypesTest, FindingToJson) {
    Finding f;
    f.severity = "WARN";
    f.title = "GPU running hot";
    f.evidence = "GPU temperature is 80°C.";
    f.whyItMatters = "Little headroom.";
    f.confidence = 70;
    f.category = "thermal";

    json j = f.toJson();
    EXPECT_EQ(j["severity"], "WARN");
    EXPECT_EQ(j["why_it_matters"], "Little headroom.");
    EXPECT_TRUE(j["next_steps"].is_array());
    EXPECT_TRUE(j["next_steps"].empty());
    EXPECT_EQ(j["confidence"], 70);
}

// ---- Config Tests ----

TEST(TypesTest, RunConfigDefaults) {
    RunConfig config;
    EXPECT_EQ(config.mode, "full");
    EXPECT_EQ(config.timeoutSec, 30);
    EXPECT_FALSE(config.rulesPath.has_value());
    EXPECT_FALSE(config.verbose);
    EXPECT_FALSE(config.jsonOutput);
}

TEST(TypesTest, ExecutionContextDefaults) {
    ExecutionContext context;
    EXPECT_EQ(context.mode, "full");
    EXPECT_EQ(context.platform, currentPlatform());
}
