// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "nvcheckup/builtin_checks.h"

#include <algorithm>
#include <sstream>

namespace nvcheckup {

namespace {

size_t countNvidia(const std::vector<GpuInfo>& gpus) {
    return static_cast<size_t>(std::count_if(gpus.begin(), gpus.end(),
        [](const GpuInfo& g) { return g.isNvidia; }));
}

} // namespace

std::optional<std::string> checkNoNvidiaGpu(const FactSnapshot& facts) {
    // An empty inventory trivially has no NVIDIA GPU; a non-empty inventory
    // without one is not reported here.
    bool hasNvidia = countNvidia(facts.gpus) > 0;
    if (!hasNvidia && facts.gpus.empty()) {
        return std::string("No NVIDIA GPU detected in system.");
    }
    return std::nullopt;
}

std::optional<std::string> checkHybridGpu(const FactSnapshot& facts) {
    size_t nvidiaCount = countNvidia(facts.gpus);
    if (nvidiaCount > 0 && facts.gpus.size() > nvidiaCount) {
        return std::string("Both NVIDIA and integrated graphics detected.");
    }
    return std::nullopt;
}

std::optional<std::string> checkDriverNotDetected(const FactSnapshot& facts) {
    if (facts.driver.version.empty()) {
        return std::string("nvidia-smi did not return a driver version.");
    }
    return std::nullopt;
}

std::optional<std::string> checkNvidiaSmiMissing(const FactSnapshot& facts) {
    if (facts.gpus.empty() && facts.driver.version.empty()) {
        return std::string("nvidia-smi was not found or returned no data.");
    }
    return std::nullopt;
}

std::optional<std::string> checkLowVram(const FactSnapshot& facts) {
    for (const auto& gpu : facts.gpus) {
        if (gpu.isNvidia && gpu.vramTotalMb > 0 && gpu.vramTotalMb < kLowVramThresholdMb) {
            std::ostringstream oss;
            oss << "GPU " << gpu.name << " has " << gpu.vramTotalMb << " MB VRAM (< 4 GB).";
            return oss.str();
        }
    }
    return std::nullopt;
}

std::optional<std::string> checkGpuRunningHot(const FactSnapshot& facts) {
    for (const auto& gpu : facts.gpus) {
        if (gpu.temperatureC >= kHotTemperatureC && gpu.temperatureC < kThrottleTemperatureC) {
            return "GPU temperature is " + std::to_string(gpu.temperatureC) + "°C.";
        }
    }
    return std::nullopt;
}

std::optional<std::string> checkThermalThrottling(const FactSnapshot& facts) {
    for (const auto& gpu : facts.gpus) {
        if (gpu.temperatureC >= kThrottleTemperatureC) {
            return "GPU temperature is " + std::to_string(gpu.temperatureC) +
                   "°C — exceeds safe limit.";
        }
    }
    return std::nullopt;
}

} // namespace nvcheckup
