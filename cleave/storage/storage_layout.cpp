// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <cleave/core/bytes.hpp>
#include <cleave/core/config.hpp>
#include <cleave/core/config_error.hpp>
#include <cleave/core/int.hpp>
#include <cleave/core/keccak.hpp>
#include <cleave/core/result.hpp>
#include <cleave/core/string_util.hpp>
#include <cleave/partition/facet.hpp>
#include <cleave/storage/storage_layout.hpp>

#include <nlohmann/json.hpp>
#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <map>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

CLEAVE_NAMESPACE_BEGIN

CLEAVE_ANONYMOUS_NAMESPACE_BEGIN

bool is_privileged(std::string_view const variable)
{
    return contains_lower(variable, "admin") ||
           contains_lower(variable, "owner");
}

RiskLevel assess_risk(std::vector<StorageConflict> const &conflicts)
{
    if (std::ranges::any_of(conflicts, [](StorageConflict const &c) {
            return c.severity == ConflictSeverity::Critical;
        })) {
        return RiskLevel::Critical;
    }
    if (conflicts.size() > 2) {
        return RiskLevel::High;
    }
    if (!conflicts.empty()) {
        return RiskLevel::Medium;
    }
    return RiskLevel::Low;
}

std::vector<std::string>
gas_optimizations(std::span<FacetCandidate const> const facets)
{
    std::set<std::string> seen;
    std::size_t small = 0;
    bool large_collection = false;
    for (auto const &facet : facets) {
        for (auto const &var : facet.storage) {
            if (!var.occupies_storage() || !seen.insert(var.name).second) {
                continue;
            }
            if (var.size < 32) {
                ++small;
            }
            if (var.type.find("mapping") != std::string::npos ||
                var.type.find("[]") != std::string::npos) {
                large_collection = true;
            }
        }
    }
    std::vector<std::string> hints;
    if (small > 1) {
        hints.push_back(
            fmt::format("Pack {} small variables into shared slots", small));
    }
    if (large_collection) {
        hints.emplace_back(
            "Keep dynamic collections in namespaced storage to avoid slot "
            "growth collisions");
    }
    return hints;
}

CLEAVE_ANONYMOUS_NAMESPACE_END

char const *to_string(ConflictSeverity const s)
{
    switch (s) {
    case ConflictSeverity::Warning:
        return "warning";
    case ConflictSeverity::Error:
        return "error";
    case ConflictSeverity::Critical:
        return "critical";
    }
    std::unreachable();
}

char const *to_string(RiskLevel const r)
{
    switch (r) {
    case RiskLevel::Low:
        return "low";
    case RiskLevel::Medium:
        return "medium";
    case RiskLevel::High:
        return "high";
    case RiskLevel::Critical:
        return "critical";
    }
    std::unreachable();
}

Result<void> validate(StorageConfig const &config)
{
    if (config.namespace_prefix.empty() || config.version.empty()) {
        return ConfigError::InvalidNamespace;
    }
    return outcome::success();
}

std::vector<std::string> StorageConflict::facets() const
{
    std::vector<std::string> names;
    for (auto const &claim : claimants) {
        if (std::ranges::find(names, claim.facet) == names.end()) {
            names.push_back(claim.facet);
        }
    }
    return names;
}

DiamondStoragePattern const *
StorageLayoutReport::find_pattern(std::string_view const facet) const
{
    auto const it =
        std::ranges::find(diamond_patterns, facet, &DiamondStoragePattern::facet);
    return it == diamond_patterns.end() ? nullptr : &*it;
}

nlohmann::json StorageLayoutReport::to_json() const
{
    nlohmann::json res{};
    res["totalSlots"] = total_slots;
    res["usedSlots"] = used_slots;
    res["conflicts"] = nlohmann::json::array();
    for (auto const &conflict : conflicts) {
        nlohmann::json c{};
        c["slot"] = conflict.slot;
        c["severity"] = to_string(conflict.severity);
        c["claimants"] = nlohmann::json::array();
        for (auto const &claim : conflict.claimants) {
            c["claimants"].push_back(
                {{"facet", claim.facet},
                 {"variable", claim.variable},
                 {"type", claim.type},
                 {"size", claim.size}});
        }
        c["recommendation"] = conflict.recommendation;
        res["conflicts"].push_back(std::move(c));
    }
    res["diamondPatterns"] = nlohmann::json::array();
    for (auto const &pattern : diamond_patterns) {
        res["diamondPatterns"].push_back(
            {{"facet", pattern.facet},
             {"namespace", pattern.namespace_id},
             {"slot", to_hex(pattern.slot)},
             {"storageStruct", pattern.storage_struct},
             {"valid", pattern.valid}});
    }
    res["facetIsolation"] = {
        {"isolated", isolation.isolated},
        {"overlappingFacets", isolation.overlapping_facets},
        {"riskLevel", to_string(isolation.risk_level)}};
    res["isolationScore"] = isolation_score;
    res["gasOptimizations"] = gas_optimizations;
    res["securityIssues"] = security_issues;
    res["recommendations"] = recommendations;
    res["manifestReady"] = manifest_ready;
    return res;
}

std::string
derive_namespace(std::string_view const facet, StorageConfig const &config)
{
    return fmt::format(
        "{}.{}.{}", config.namespace_prefix, to_lower(facet), config.version);
}

bytes32_t derive_storage_slot(std::string_view const namespace_id)
{
    return to_bytes(to_uint256(keccak256(namespace_id)) - uint256_t{1});
}

std::string render_storage_struct(
    FacetCandidate const &facet, std::string_view const namespace_id,
    bytes32_t const &slot)
{
    std::string fields;
    for (auto const &var : facet.storage) {
        if (var.occupies_storage()) {
            fields += fmt::format("        {} {};\n", var.type, var.name);
        }
    }
    if (fields.empty()) {
        fields = "        // no persistent state\n";
    }
    return fmt::format(
        "library {0}Storage {{\n"
        "    // keccak256(\"{1}\") - 1\n"
        "    bytes32 internal constant STORAGE_SLOT =\n"
        "        {2};\n"
        "\n"
        "    struct Layout {{\n"
        "{3}"
        "    }}\n"
        "\n"
        "    function layout() internal pure returns (Layout storage l) {{\n"
        "        bytes32 slot = STORAGE_SLOT;\n"
        "        assembly {{\n"
        "            l.slot := slot\n"
        "        }}\n"
        "    }}\n"
        "}}\n",
        facet.name,
        namespace_id,
        to_hex(slot),
        fields);
}

std::vector<StorageConflict>
detect_conflicts(std::span<FacetCandidate const> const facets)
{
    std::map<uint64_t, std::vector<StorageClaim>> claims;
    for (auto const &facet : facets) {
        for (auto const &var : facet.storage) {
            if (!var.occupies_storage()) {
                continue;
            }
            claims[var.slot].push_back(
                {.facet = facet.name,
                 .variable = var.name,
                 .type = var.type,
                 .size = var.size});
        }
    }

    std::vector<StorageConflict> conflicts;
    for (auto &[slot, claimants] : claims) {
        StorageConflict conflict{.slot = slot, .claimants = std::move(claimants)};
        if (conflict.facets().size() < 2) {
            continue;
        }
        conflict.severity = conflict.claimants.size() > 2
                                ? ConflictSeverity::Error
                                : ConflictSeverity::Warning;
        if (std::ranges::any_of(
                conflict.claimants, [](StorageClaim const &claim) {
                    return is_privileged(claim.variable);
                })) {
            conflict.severity = ConflictSeverity::Critical;
        }
        conflict.recommendation =
            conflict.severity == ConflictSeverity::Critical
                ? fmt::format(
                      "Critical storage conflict at slot {}. Implement "
                      "diamond storage pattern.",
                      slot)
                : fmt::format(
                      "Potential storage conflict at slot {}. Consider "
                      "diamond storage pattern.",
                      slot);
        conflicts.push_back(std::move(conflict));
    }
    return conflicts;
}

Result<StorageLayoutReport> check_storage(
    std::span<FacetCandidate const> const facets, StorageConfig const &config)
{
    if (auto res = validate(config); res.has_error()) {
        LOG_ERROR("storage: {}", res.error().message().c_str());
        return std::move(res).error();
    }

    StorageLayoutReport report;

    std::set<uint64_t> used;
    for (auto const &facet : facets) {
        for (auto const &var : facet.storage) {
            if (var.occupies_storage()) {
                used.insert(var.slot);
            }
        }
    }
    report.used_slots = used.size();
    report.total_slots = used.empty() ? 0 : *used.rbegin() + 1;

    report.conflicts = detect_conflicts(facets);
    for (auto const &conflict : report.conflicts) {
        LOG_WARNING(
            "storage: slot {} claimed by {} facets ({})",
            conflict.slot,
            conflict.facets().size(),
            to_string(conflict.severity));
        for (auto const &name : conflict.facets()) {
            if (std::ranges::find(report.isolation.overlapping_facets, name) ==
                report.isolation.overlapping_facets.end()) {
                report.isolation.overlapping_facets.push_back(name);
            }
        }
        if (conflict.severity == ConflictSeverity::Critical) {
            report.security_issues.push_back(fmt::format(
                "Privileged variable shares slot {} across facets {}",
                conflict.slot,
                fmt::join(conflict.facets(), ", ")));
        }
        report.recommendations.push_back(conflict.recommendation);
    }

    std::map<std::string, unsigned> namespace_uses;
    std::map<bytes32_t, unsigned> slot_uses;
    for (auto const &facet : facets) {
        auto namespace_id = derive_namespace(facet.name, config);
        auto const slot = derive_storage_slot(namespace_id);
        ++namespace_uses[namespace_id];
        ++slot_uses[slot];
        report.diamond_patterns.push_back(
            {.facet = facet.name,
             .namespace_id = namespace_id,
             .slot = slot,
             .storage_struct =
                 render_storage_struct(facet, namespace_id, slot)});
    }
    std::size_t valid = 0;
    for (auto &pattern : report.diamond_patterns) {
        pattern.valid = namespace_uses[pattern.namespace_id] == 1 &&
                        slot_uses[pattern.slot] == 1;
        if (pattern.valid) {
            ++valid;
        }
        else {
            report.security_issues.push_back(fmt::format(
                "Facet {} shares storage namespace {}",
                pattern.facet,
                pattern.namespace_id));
        }
    }
    report.isolation_score =
        facets.empty() ? 100u
                       : static_cast<unsigned>(valid * 100 / facets.size());
    if (report.isolation_score < 100) {
        report.recommendations.emplace_back(
            "Give every facet a unique name so its storage namespace is unique");
    }

    for (auto const &facet : facets) {
        if (!facet.security_classified) {
            report.security_issues.push_back(fmt::format(
                "{} may need security level classification", facet.name));
        }
    }

    report.isolation.risk_level = assess_risk(report.conflicts);
    report.isolation.isolated =
        report.conflicts.empty() && valid == facets.size();
    report.gas_optimizations = gas_optimizations(facets);
    report.manifest_ready =
        report.isolation_score == 100 && report.conflicts.empty() &&
        std::ranges::all_of(facets, [](FacetCandidate const &facet) {
            return facet.security_classified;
        });

    LOG_INFO(
        "storage: {} facets, {} used slots, {} conflicts, isolation {}%, "
        "risk {}",
        facets.size(),
        report.used_slots,
        report.conflicts.size(),
        report.isolation_score,
        to_string(report.isolation.risk_level));
    return report;
}

CLEAVE_NAMESPACE_END
