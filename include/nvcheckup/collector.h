// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Fact collection from the local machine.
//
// Shells out to nvidia-smi (and, on Windows, cmd/PowerShell) and reads /proc
// on Linux. Collection never throws: a missing tool, a non-zero exit or a
// timeout resolves to empty or "unknown" fact values.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "types.h"
#include "nvcheckup/export.h"

namespace nvcheckup {

struct CommandResult {
    std::string stdoutText; // trimmed
    std::string stderrText; // trimmed
    int exitCode = -1;
    bool launched = false;  // false if the program could not be started
    bool timedOut = false;

    bool ok() const { return launched && !timedOut && exitCode == 0; }
};

struct CollectorOptions {
    int timeoutSec = 30;
    bool debug = false; // trace commands to stderr
};

/// Run a program (looked up in PATH) with arguments and a timeout.
/// A child that outlives the timeout is terminated and reaped.
NVCHECKUP_API CommandResult runCommand(const std::string& program,
                                       const std::vector<std::string>& args,
                                       int timeoutSec = 30,
                                       bool debug = false);

/// Parse `nvidia-smi --query-gpu=index,name,driver_version,memory.total,
/// temperature.gpu --format=csv,noheader,nounits`.
/// Fields are separated by ", "; lines with fewer than five fields are
/// skipped and unparsable numbers become 0.
NVCHECKUP_API std::vector<GpuInfo> parseGpuQueryOutput(const std::string& output);

/// Extract the version after "CUDA Version:" from the nvidia-smi banner.
/// @return Empty string if not present.
NVCHECKUP_API std::string parseCudaVersion(const std::string& banner);

/// First "model name" value from /proc/cpuinfo, or empty.
NVCHECKUP_API std::string parseCpuModel(const std::string& cpuinfo);

/// MemTotal from /proc/meminfo in MB, or 0.
NVCHECKUP_API int64_t parseMemTotalMb(const std::string& meminfo);

NVCHECKUP_API SystemInfo collectSystemInfo(const CollectorOptions& options = {});

struct GpuCollection {
    std::vector<GpuInfo> gpus;
    DriverInfo driver;
};

NVCHECKUP_API GpuCollection collectGpuInfo(const CollectorOptions& options = {});

/// Collect the full fact snapshot for this run.
NVCHECKUP_API FactSnapshot collectFacts(const CollectorOptions& options = {});

} // namespace nvcheckup
