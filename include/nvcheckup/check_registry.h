// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Registry mapping rule ids to check implementations.
//
// The knowledge pack carries rule metadata (text, severity, applicability);
// behavior is routed through this registry by rule id. Rule ids without a
// registered check are inert: they never fire and never fail a run.

#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "types.h"
#include "nvcheckup/export.h"

namespace nvcheckup {

/// A check inspects the facts and returns evidence text when it fires.
using CheckCallback = std::function<std::optional<std::string>(const FactSnapshot&)>;

struct CheckInfo {
    std::string ruleId;
    std::string description;
    CheckCallback callback;
};

class NVCHECKUP_API CheckRegistry {
public:
    /// Register a check for a rule id.
    /// @throws std::runtime_error if a check for the same id is already registered.
    void registerCheck(CheckInfo info);

    /// Convenience overload.
    void registerCheck(const std::string& ruleId,
                       const std::string& description,
                       CheckCallback callback);

    /// Look up a check by exact rule id.
    /// @return Pointer to CheckInfo if found, nullptr otherwise.
    const CheckInfo* findCheck(const std::string& ruleId) const;

    bool hasCheck(const std::string& ruleId) const;

    /// All registered checks, ordered by rule id.
    const std::map<std::string, CheckInfo>& allChecks() const;

    size_t size() const;

    /// Run the check registered for ruleId.
    /// @return Evidence if the check fired; std::nullopt if it did not fire
    ///         or no check exists for the id.
    std::optional<std::string> runCheck(const std::string& ruleId,
                                        const FactSnapshot& facts) const;

    /// The fixed set of built-in checks used by a real run.
    static const CheckRegistry& builtin();

private:
    std::map<std::string, CheckInfo> checks_;
};

/// Register every built-in check (see builtin_checks.h) into registry.
NVCHECKUP_API void registerBuiltinChecks(CheckRegistry& registry);

} // namespace nvcheckup
