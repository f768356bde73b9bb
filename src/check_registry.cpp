// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "nvcheckup/check_registry.h"

#include <stdexcept>

#include "nvcheckup/builtin_checks.h"

namespace nvcheckup {

void CheckRegistry::registerCheck(CheckInfo info) {
    if (checks_.count(info.ruleId)) {
        throw std::runtime_error("Check already registered: " + info.ruleId);
    }
    std::string id = info.ruleId;
    checks_.emplace(std::move(id), std::move(info));
}

void CheckRegistry::registerCheck(const std::string& ruleId,
                                  const std::string& description,
                                  CheckCallback callback) {
    CheckInfo info;
    info.ruleId = ruleId;
    info.description = description;
    info.callback = std::move(callback);
    registerCheck(std::move(info));
}

const CheckInfo* CheckRegistry::findCheck(const std::string& ruleId) const {
    auto it = checks_.find(ruleId);
    if (it != checks_.end()) {
        return &it->second;
    }
    return nullptr;
}

bool CheckRegistry::hasCheck(const std::string& ruleId) const {
    return checks_.count(ruleId) > 0;
}

const std::map<std::string, CheckInfo>& CheckRegistry::allChecks() const {
    return checks_;
}

size_t CheckRegistry::size() const {
    return checks_.size();
}

std::optional<std::string> CheckRegistry::runCheck(const std::string& ruleId,
                                                   const FactSnapshot& facts) const {
    const CheckInfo* check = findCheck(ruleId);
    if (!check || !check->callback) {
        return std::nullopt;
    }
    return check->callback(facts);
}

const CheckRegistry& CheckRegistry::builtin() {
    static const CheckRegistry registry = [] {
        CheckRegistry r;
        registerBuiltinChecks(r);
        return r;
    }();
    return registry;
}

void registerBuiltinChecks(CheckRegistry& registry) {
    registry.registerCheck("no-nvidia-gpu",
        "GPU inventory is empty", checkNoNvidiaGpu);
    registry.registerCheck("hybrid-gpu",
        "NVIDIA GPU alongside a non-NVIDIA GPU", checkHybridGpu);
    registry.registerCheck("driver-not-detected",
        "Driver version is empty", checkDriverNotDetected);
    registry.registerCheck("nvidia-smi-missing",
        "No GPUs and no driver version", checkNvidiaSmiMissing);
    registry.registerCheck("low-vram",
        "NVIDIA GPU with known VRAM below 4 GB", checkLowVram);
    registry.registerCheck("gpu-running-hot",
        "GPU temperature in [75, 85) C", checkGpuRunningHot);
    registry.registerCheck("thermal-throttling",
        "GPU temperature at or above 85 C", checkThermalThrottling);
}

} // namespace nvcheckup
