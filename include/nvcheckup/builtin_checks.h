// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Built-in checks, one per implemented rule id.
// Each returns the evidence text when it fires, std::nullopt otherwise.
// Threshold checks report the first matching GPU only.

#pragma once

#include <optional>
#include <string>

#include "types.h"
#include "nvcheckup/export.h"

namespace nvcheckup {

constexpr int64_t kLowVramThresholdMb = 4096;
constexpr int kHotTemperatureC = 75;
constexpr int kThrottleTemperatureC = 85;

/// "no-nvidia-gpu": fires only when the GPU inventory is empty.
NVCHECKUP_API std::optional<std::string> checkNoNvidiaGpu(const FactSnapshot& facts);

/// "hybrid-gpu": at least one NVIDIA GPU and at least one other GPU.
NVCHECKUP_API std::optional<std::string> checkHybridGpu(const FactSnapshot& facts);

/// "driver-not-detected": driver version is empty.
NVCHECKUP_API std::optional<std::string> checkDriverNotDetected(const FactSnapshot& facts);

/// "nvidia-smi-missing": no GPUs and no driver version.
NVCHECKUP_API std::optional<std::string> checkNvidiaSmiMissing(const FactSnapshot& facts);

/// "low-vram": NVIDIA GPU with 0 < VRAM < 4096 MB (0 means unknown).
NVCHECKUP_API std::optional<std::string> checkLowVram(const FactSnapshot& facts);

/// "gpu-running-hot": any GPU with 75 <= temperature < 85.
NVCHECKUP_API std::optional<std::string> checkGpuRunningHot(const FactSnapshot& facts);

/// "thermal-throttling": any GPU with temperature >= 85.
NVCHECKUP_API std::optional<std::string> checkThermalThrottling(const FactSnapshot& facts);

} // namespace nvcheckup
