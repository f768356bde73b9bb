// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "nvcheckup/rule_catalog.h"

#include <fstream>
#include <set>
#include <sstream>

namespace nvcheckup {

namespace {

std::string describeEntry(size_t index, const json& entry) {
    std::string where = "rule #" + std::to_string(index);
    if (entry.is_object() && entry.contains("id") && entry["id"].is_string()) {
        where += " ('" + entry["id"].get<std::string>() + "')";
    }
    return where;
}

std::string requireString(const json& entry, const char* field, const std::string& where) {
    if (!entry.contains(field)) {
        throw LoadError(where + ": missing required field '" + field + "'");
    }
    const json& value = entry[field];
    if (!value.is_string()) {
        throw LoadError(where + ": field '" + field + "' must be a string");
    }
    return value.get<std::string>();
}

Rule parseRule(size_t index, const json& entry) {
    std::string where = describeEntry(index, entry);
    if (!entry.is_object()) {
        throw LoadError(where + ": rule must be a JSON object");
    }

    Rule rule;
    rule.id          = requireString(entry, "id", where);
    rule.title       = requireString(entry, "title", where);
    rule.category    = requireString(entry, "category", where);
    rule.severity    = requireString(entry, "severity", where);
    rule.description = requireString(entry, "description", where);

    if (rule.id.empty()) {
        throw LoadError(where + ": field 'id' must not be empty");
    }

    if (!entry.contains("modes")) {
        throw LoadError(where + ": missing required field 'modes'");
    }
    const json& modes = entry["modes"];
    if (!modes.is_array()) {
        throw LoadError(where + ": field 'modes' must be an array of strings");
    }
    for (const auto& mode : modes) {
        if (!mode.is_string()) {
            throw LoadError(where + ": field 'modes' must be an array of strings");
        }
        rule.modes.push_back(mode.get<std::string>());
    }

    if (entry.contains("base_confidence")) {
        const json& conf = entry["base_confidence"];
        if (!conf.is_number_integer()) {
            throw LoadError(where + ": field 'base_confidence' must be an integer");
        }
        int64_t value = conf.get<int64_t>();
        if (value < 0 || value > 100) {
            throw LoadError(where + ": field 'base_confidence' must be between 0 and 100");
        }
        rule.baseConfidence = static_cast<int>(value);
    }

    if (entry.contains("platform") && !entry["platform"].is_null()) {
        if (!entry["platform"].is_string()) {
            throw LoadError(where + ": field 'platform' must be a string");
        }
        rule.platform = entry["platform"].get<std::string>();
    }

    return rule;
}

} // namespace

RuleCatalog loadRuleCatalog(const std::string& jsonText) {
    json doc;
    try {
        doc = json::parse(jsonText);
    } catch (const json::parse_error& e) {
        throw LoadError(std::string("Rule catalog is not valid JSON: ") + e.what());
    }

    if (!doc.is_object()) {
        throw LoadError("Rule catalog must be a JSON object");
    }

    RuleCatalog catalog;
    if (doc.contains("description")) {
        if (!doc["description"].is_string()) {
            throw LoadError("Rule catalog field 'description' must be a string");
        }
        catalog.description = doc["description"].get<std::string>();
    }
    if (doc.contains("version")) {
        if (!doc["version"].is_string()) {
            throw LoadError("Rule catalog field 'version' must be a string");
        }
        catalog.version = doc["version"].get<std::string>();
    }

    if (!doc.contains("rules") || !doc["rules"].is_array()) {
        throw LoadError("Rule catalog is missing the 'rules' array");
    }

    std::set<std::string> seenIds;
    const json& rules = doc["rules"];
    catalog.rules.reserve(rules.size());
    for (size_t i = 0; i < rules.size(); ++i) {
        Rule rule = parseRule(i, rules[i]);
        if (!seenIds.insert(rule.id).second) {
            throw LoadError("Duplicate rule id: " + rule.id);
        }
        catalog.rules.push_back(std::move(rule));
    }

    return catalog;
}

RuleCatalog loadRuleCatalogFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw LoadError("Cannot open rule catalog: " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw LoadError("Failed to read rule catalog: " + path);
    }

    try {
        return loadRuleCatalog(buffer.str());
    } catch (const LoadError& e) {
        throw LoadError(path + ": " + e.what());
    }
}

RuleCatalog loadEmbeddedRuleCatalog() {
    return loadRuleCatalog(embeddedRulesJson());
}

} // namespace nvcheckup
