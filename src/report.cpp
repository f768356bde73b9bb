// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "nvcheckup/report.h"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace nvcheckup {

namespace {

std::string ruleLine() {
    std::string line;
    for (int i = 0; i < 72; ++i) line += "─";
    return line + "\n";
}

const std::string& orNA(const std::string& value) {
    static const std::string kNA = "N/A";
    return value.empty() ? kNA : value;
}

double roundTenths(double secs) {
    return std::round(secs * 10.0) / 10.0;
}

} // namespace

SeverityCounts countBySeverity(const std::vector<Finding>& findings) {
    SeverityCounts counts;
    for (const auto& f : findings) {
        if (f.severity == kSeverityCrit)      ++counts.crit;
        else if (f.severity == kSeverityWarn) ++counts.warn;
        else if (f.severity == kSeverityInfo) ++counts.info;
    }
    return counts;
}

std::string generateTextReport(const FactSnapshot& facts,
                               const std::vector<Finding>& findings,
                               const std::string& mode,
                               double runtimeSecs) {
    const std::string line = ruleLine();
    std::ostringstream out;

    out << line;
    out << "  NVCheckup v" << kToolVersion << " — NVIDIA Diagnostic Report\n";
    out << "  " << kDisclaimer << "\n";
    out << line;
    out << "  Mode:      " << mode << "\n";
    out << "  Platform:  " << facts.system.osName << "\n";
    out << "  Runtime:   " << std::fixed << std::setprecision(1) << runtimeSecs << "s\n";
    out << line;

    // System
    out << "\n== SYSTEM INFO ==\n\n";
    out << "  OS:           " << facts.system.osName << " " << facts.system.osVersion << "\n";
    out << "  Architecture: " << facts.system.architecture << "\n";
    out << "  CPU:          " << facts.system.cpuModel << "\n";
    if (facts.system.ramTotalMb > 0) {
        out << "  RAM:          " << facts.system.ramTotalMb << " MB\n";
    }
    out << line;

    // GPUs
    out << "\n== GPU INVENTORY ==\n\n";
    if (facts.gpus.empty()) {
        out << "  No GPUs detected.\n";
    } else {
        for (const auto& gpu : facts.gpus) {
            out << "  [GPU " << gpu.index << "] " << gpu.name << "\n";
            out << "    Driver:  " << gpu.driverVersion << "\n";
            if (gpu.vramTotalMb > 0) {
                out << "    VRAM:    " << gpu.vramTotalMb << " MB\n";
            }
            if (gpu.temperatureC > 0) {
                out << "    Temp:    " << gpu.temperatureC << "°C\n";
            }
            out << "\n";
        }
    }
    out << "  NVIDIA Driver: " << orNA(facts.driver.version) << "\n";
    out << "  CUDA (driver): " << orNA(facts.driver.cudaVersion) << "\n";
    out << line;

    // Findings
    out << "\n== FINDINGS ==\n\n";
    if (findings.empty()) {
        out << "  No issues detected.\n";
    } else {
        SeverityCounts counts = countBySeverity(findings);
        out << "  Total: " << counts.crit << " CRITICAL, " << counts.warn << " WARNING, "
            << counts.info << " INFO\n\n";

        for (size_t i = 0; i < findings.size(); ++i) {
            const Finding& f = findings[i];
            out << "  [" << f.severity << "] #" << (i + 1) << ": " << f.title
                << " (confidence: " << f.confidence << "%)\n";
            out << "    Evidence:     " << f.evidence << "\n";
            out << "    Why:          " << f.whyItMatters << "\n";
            if (!f.nextSteps.empty()) {
                out << "    Next steps:\n";
                for (size_t s = 0; s < f.nextSteps.size(); ++s) {
                    out << "      " << (s + 1) << ". " << f.nextSteps[s] << "\n";
                }
            }
            out << "\n";
        }
    }
    out << line;

    // Privacy
    out << "\n== PRIVACY & DATA ==\n\n";
    out << "  This report was generated locally. No data was sent anywhere.\n";
    out << "  NVCheckup does not modify your system, drivers, or settings.\n\n";
    out << line;
    out << "  " << kDisclaimer << "\n";
    out << line;

    return out.str();
}

json generateJsonReport(const FactSnapshot& facts,
                        const std::vector<Finding>& findings,
                        const std::string& mode,
                        double runtimeSecs) {
    json gpus = json::array();
    for (const auto& gpu : facts.gpus) {
        gpus.push_back(gpu.toJson());
    }

    json findingsJson = json::array();
    for (const auto& f : findings) {
        findingsJson.push_back(f.toJson());
    }

    SeverityCounts counts = countBySeverity(findings);

    return json{
        {"tool", "nvcheckup"},
        {"version", kToolVersion},
        {"disclaimer", kDisclaimer},
        {"mode", mode},
        {"platform", facts.system.osName},
        {"runtime_secs", roundTenths(runtimeSecs)},
        {"system", facts.system.toJson()},
        {"gpus", gpus},
        {"driver", facts.driver.toJson()},
        {"findings", findingsJson},
        {"summary", {
            {"crit", counts.crit},
            {"warn", counts.warn},
            {"info", counts.info},
            {"total", findings.size()}
        }}
    };
}

} // namespace nvcheckup
