// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Report generation: human-readable text and structured JSON.

#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.h"
#include "nvcheckup/export.h"

namespace nvcheckup {

using json = nlohmann::json;

constexpr const char* kToolVersion = "0.2.0";
constexpr const char* kDisclaimer =
    "NVCheckup is an unofficial community tool, not affiliated with or endorsed by NVIDIA Corporation.";

struct SeverityCounts {
    size_t crit = 0;
    size_t warn = 0;
    size_t info = 0;
};

NVCHECKUP_API SeverityCounts countBySeverity(const std::vector<Finding>& findings);

/// Render the text report.
///
/// Sections: header (mode, platform, runtime), SYSTEM INFO, GPU INVENTORY,
/// FINDINGS, PRIVACY & DATA. Unknown VRAM/temperature lines are omitted and
/// an undetected driver or CUDA version is shown as "N/A".
NVCHECKUP_API std::string generateTextReport(const FactSnapshot& facts,
                                             const std::vector<Finding>& findings,
                                             const std::string& mode,
                                             double runtimeSecs);

/// Render the same content as a JSON document.
NVCHECKUP_API json generateJsonReport(const FactSnapshot& facts,
                                      const std::vector<Finding>& findings,
                                      const std::string& mode,
                                      double runtimeSecs);

} // namespace nvcheckup
