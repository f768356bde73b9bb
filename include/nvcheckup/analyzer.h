// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Rule evaluator.
//
// analyze() is a pure function of (facts, rules, context): it filters rules
// by mode and platform, dispatches each applicable rule to its check by id,
// and returns findings stably sorted CRIT, WARN, INFO, then anything else.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "check_registry.h"
#include "types.h"
#include "nvcheckup/export.h"

namespace nvcheckup {

/// True if the rule lists context.mode exactly and, when it names a
/// platform, that platform equals context.platform. A rule with no modes
/// is never applicable.
NVCHECKUP_API bool isApplicable(const Rule& rule, const ExecutionContext& context);

/// Build a finding from a fired rule. Severity, title, category and
/// confidence are copied verbatim; next steps are left empty.
NVCHECKUP_API Finding makeFinding(const Rule& rule, const std::string& evidence);

/// Evaluate one rule (applicability is not checked here).
/// @return A finding if the rule's check fired; std::nullopt if it did not
///         fire or the id has no check.
NVCHECKUP_API std::optional<Finding> evaluateRule(const Rule& rule,
                                                  const FactSnapshot& facts,
                                                  const CheckRegistry& checks = CheckRegistry::builtin());

/// Stable sort by severity rank; equal severities keep their order.
NVCHECKUP_API void sortFindings(std::vector<Finding>& findings);

/// Evaluate all applicable rules and return the sorted findings.
NVCHECKUP_API std::vector<Finding> analyze(const FactSnapshot& facts,
                                           const std::vector<Rule>& rules,
                                           const ExecutionContext& context,
                                           const CheckRegistry& checks = CheckRegistry::builtin());

/// Catalog rule ids that have no check, in catalog order.
/// Used to surface catalog/engine version skew.
NVCHECKUP_API std::vector<std::string> unimplementedRuleIds(const std::vector<Rule>& rules,
                                                            const CheckRegistry& checks = CheckRegistry::builtin());

} // namespace nvcheckup
