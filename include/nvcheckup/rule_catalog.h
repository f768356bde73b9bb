// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Rule catalog loading from the knowledge pack.
//
// The knowledge pack is a JSON document:
//   {"description": "...", "version": "...", "rules": [ {rule}, ... ]}
//
// Loading is all-or-nothing: the first malformed entry fails the whole load,
// so a partial policy is never evaluated.

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "types.h"
#include "nvcheckup/export.h"

namespace nvcheckup {

/// Raised when the catalog is missing, unreadable or does not match the schema.
class NVCHECKUP_API LoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct RuleCatalog {
    std::string description;
    std::string version;
    std::vector<Rule> rules; // catalog order; the evaluator keeps it for ties
};

/// Parse a catalog from JSON text.
///
/// Each rule requires string fields id, title, category, severity and
/// description, plus a string array "modes". base_confidence is optional
/// (integer 0-100, default 0); platform is optional (string or null).
/// Rule ids must be non-empty and unique.
///
/// @throws LoadError on malformed JSON or any schema violation
NVCHECKUP_API RuleCatalog loadRuleCatalog(const std::string& jsonText);

/// Read and parse a catalog file.
/// @throws LoadError if the file cannot be opened or fails to parse
NVCHECKUP_API RuleCatalog loadRuleCatalogFile(const std::string& path);

/// Parse the knowledge pack compiled into the binary.
NVCHECKUP_API RuleCatalog loadEmbeddedRuleCatalog();

/// Raw JSON of the compiled-in knowledge pack (generated at build time).
NVCHECKUP_API const std::string& embeddedRulesJson();

} // namespace nvcheckup
