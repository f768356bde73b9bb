// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "nvcheckup/analyzer.h"

#include <algorithm>

namespace nvcheckup {

bool isApplicable(const Rule& rule, const ExecutionContext& context) {
    if (std::find(rule.modes.begin(), rule.modes.end(), context.mode) == rule.modes.end()) {
        return false;
    }
    if (rule.platform.has_value() && rule.platform.value() != context.platform) {
        return false;
    }
    return true;
}

Finding makeFinding(const Rule& rule, const std::string& evidence) {
    Finding finding;
    finding.severity = rule.severity;
    finding.title = rule.title;
    finding.evidence = evidence;
    finding.whyItMatters = rule.description;
    finding.confidence = rule.baseConfidence;
    finding.category = rule.category;
    return finding;
}

std::optional<Finding> evaluateRule(const Rule& rule,
                                    const FactSnapshot& facts,
                                    const CheckRegistry& checks) {
    std::optional<std::string> evidence = checks.runCheck(rule.id, facts);
    if (!evidence.has_value()) {
        return std::nullopt;
    }
    return makeFinding(rule, evidence.value());
}

void sortFindings(std::vector<Finding>& findings) {
    std::stable_sort(findings.begin(), findings.end(),
        [](const Finding& a, const Finding& b) {
            return severityRank(a.severity) < severityRank(b.severity);
        });
}

std::vector<Finding> analyze(const FactSnapshot& facts,
                             const std::vector<Rule>& rules,
                             const ExecutionContext& context,
                             const CheckRegistry& checks) {
    std::vector<Finding> findings;

    for (const auto& rule : rules) {
        if (!isApplicable(rule, context)) {
            continue;
        }
        if (auto finding = evaluateRule(rule, facts, checks)) {
            findings.push_back(std::move(finding.value()));
        }
    }

    sortFindings(findings);
    return findings;
}

std::vector<std::string> unimplementedRuleIds(const std::vector<Rule>& rules,
                                              const CheckRegistry& checks) {
    std::vector<std::string> ids;
    for (const auto& rule : rules) {
        if (!checks.hasCheck(rule.id)) {
            ids.push_back(rule.id);
        }
    }
    return ids;
}

} // namespace nvcheckup
