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

#pragma once

#include <cleave/core/bytes.hpp>
#include <cleave/core/config.hpp>
#include <cleave/core/result.hpp>
#include <cleave/partition/facet.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

CLEAVE_NAMESPACE_BEGIN

struct StorageConfig
{
    std::string namespace_prefix{"payrox.facets"};
    std::string version{"v1"};
};

Result<void> validate(StorageConfig const &);

enum class ConflictSeverity : uint8_t
{
    Warning,
    Error,
    Critical,
};

enum class RiskLevel : uint8_t
{
    Low,
    Medium,
    High,
    Critical,
};

char const *to_string(ConflictSeverity);
char const *to_string(RiskLevel);

struct StorageClaim
{
    std::string facet{};
    std::string variable{};
    std::string type{};
    uint32_t size{32};
};

struct StorageConflict
{
    uint64_t slot{0};
    std::vector<StorageClaim> claimants{};
    ConflictSeverity severity{ConflictSeverity::Warning};
    std::string recommendation{};

    // distinct claiming facets in claim order
    std::vector<std::string> facets() const;
};

struct DiamondStoragePattern
{
    std::string facet{};
    std::string namespace_id{};
    bytes32_t slot{};
    std::string storage_struct{};
    bool valid{false};
};

struct FacetIsolation
{
    bool isolated{true};
    std::vector<std::string> overlapping_facets{};
    RiskLevel risk_level{RiskLevel::Low};
};

struct StorageLayoutReport
{
    uint64_t total_slots{0};
    uint64_t used_slots{0};
    std::vector<StorageConflict> conflicts{};
    std::vector<DiamondStoragePattern> diamond_patterns{};
    FacetIsolation isolation{};
    // percentage of facets with a valid isolated layout
    unsigned isolation_score{100};
    std::vector<std::string> gas_optimizations{};
    std::vector<std::string> security_issues{};
    std::vector<std::string> recommendations{};
    bool manifest_ready{false};

    DiamondStoragePattern const *find_pattern(std::string_view facet) const;

    nlohmann::json to_json() const;
};

std::string derive_namespace(std::string_view facet, StorageConfig const &);

// keccak256(namespace) - 1, which no compiler-assigned slot can reach
bytes32_t derive_storage_slot(std::string_view namespace_id);

std::string render_storage_struct(
    FacetCandidate const &, std::string_view namespace_id,
    bytes32_t const &slot);

std::vector<StorageConflict> detect_conflicts(std::span<FacetCandidate const>);

Result<StorageLayoutReport>
check_storage(std::span<FacetCandidate const>, StorageConfig const & = {});

CLEAVE_NAMESPACE_END
