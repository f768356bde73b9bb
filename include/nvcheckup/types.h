// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Common types for the NVCheckup diagnostic engine.
//
// Facts (SystemInfo, GpuInfo, DriverInfo) are collected once per run and
// never mutated. Rules come from the knowledge pack; Findings are derived
// from a fired Rule plus the facts.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace nvcheckup {

using json = nlohmann::json;

// ---- Severity ----

constexpr const char* kSeverityCrit = "CRIT";
constexpr const char* kSeverityWarn = "WARN";
constexpr const char* kSeverityInfo = "INFO";

/// Sort rank of a severity string: CRIT < WARN < INFO < anything else.
inline int severityRank(const std::string& severity) {
    if (severity == kSeverityCrit) return 0;
    if (severity == kSeverityWarn) return 1;
    if (severity == kSeverityInfo) return 2;
    return 3;
}

// ---- Run Modes ----

enum class RunMode {
    GAMING,
    AI,
    CREATOR,
    STREAMING,
    FULL
};

inline std::string runModeToString(RunMode m) {
    switch (m) {
        case RunMode::GAMING:    return "gaming";
        case RunMode::AI:        return "ai";
        case RunMode::CREATOR:   return "creator";
        case RunMode::STREAMING: return "streaming";
        case RunMode::FULL:      return "full";
    }
    return "unknown";
}

/// Case-sensitive; returns std::nullopt for anything outside the fixed set.
inline std::optional<RunMode> parseRunMode(const std::string& s) {
    if (s == "gaming")    return RunMode::GAMING;
    if (s == "ai")        return RunMode::AI;
    if (s == "creator")   return RunMode::CREATOR;
    if (s == "streaming") return RunMode::STREAMING;
    if (s == "full")      return RunMode::FULL;
    return std::nullopt;
}

// ---- Platform ----

/// Canonical identifier of the platform this binary was built for.
inline std::string currentPlatform() {
#if defined(_WIN32)
    return "windows";
#elif defined(__APPLE__)
    return "macos";
#elif defined(__linux__)
    return "linux";
#elif defined(__FreeBSD__)
    return "freebsd";
#else
    return "unknown";
#endif
}

// ---- Facts ----

struct SystemInfo {
    std::string osName;
    std::string osVersion;
    std::string architecture;
    std::string cpuModel;
    std::string hostname;
    int64_t ramTotalMb = 0; // 0 = unknown

    json toJson() const {
        return json{
            {"os_name", osName},
            {"os_version", osVersion},
            {"architecture", architecture},
            {"cpu_model", cpuModel},
            {"hostname", hostname},
            {"ram_total_mb", ramTotalMb}
        };
    }
};

struct GpuInfo {
    int index = 0;
    std::string name;
    std::string vendor;
    std::string driverVersion;
    int64_t vramTotalMb = 0; // 0 = unknown
    int temperatureC = 0;    // 0 = unknown / not reported
    bool isNvidia = false;

    json toJson() const {
        return json{
            {"index", index},
            {"name", name},
            {"vendor", vendor},
            {"driver_version", driverVersion},
            {"vram_total_mb", vramTotalMb},
            {"temperature_c", temperatureC},
            {"is_nvidia", isNvidia}
        };
    }
};

struct DriverInfo {
    std::string version;     // empty = not detected
    std::string cudaVersion; // empty = not detected

    json toJson() const {
        return json{{"version", version}, {"cuda_version", cudaVersion}};
    }
};

/// Everything the evaluator is allowed to look at for one run.
struct FactSnapshot {
    SystemInfo system;
    std::vector<GpuInfo> gpus;
    DriverInfo driver;
};

// ---- Rules and Findings ----

struct Rule {
    std::string id; // dispatch key for the built-in checks
    std::string title;
    std::string category;
    std::string severity;
    int baseConfidence = 0;
    std::vector<std::string> modes;
    std::optional<std::string> platform; // absent = all platforms
    std::string description;

    json toJson() const {
        json j;
        j["id"] = id;
        j["title"] = title;
        j["category"] = category;
        j["severity"] = severity;
        j["base_confidence"] = baseConfidence;
        j["modes"] = modes;
        if (platform.has_value()) j["platform"] = platform.value();
        j["description"] = description;
        return j;
    }
};

struct Finding {
    std::string severity;
    std::string title;
    std::string evidence;
    std::string whyItMatters;
    std::vector<std::string> nextSteps;
    int confidence = 0;
    std::string category;

    json toJson() const {
        return json{
            {"severity", severity},
            {"title", title},
            {"evidence", evidence},
            {"why_it_matters", whyItMatters},
            {"next_steps", nextSteps},
            {"confidence", confidence},
            {"category", category}
        };
    }
};

// ---- Run Configuration ----

/// Mode and platform, fixed once at the start of a run.
struct ExecutionContext {
    std::string mode = "full";
    std::string platform = currentPlatform();
};

struct RunConfig {
    std::string mode = "full";
    std::optional<std::string> rulesPath; // unset = embedded knowledge pack
    int timeoutSec = 30;                  // per external command
    bool verbose = false;
    bool jsonOutput = false;
};

} // namespace nvcheckup
