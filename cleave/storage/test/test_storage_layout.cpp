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
#include <cleave/core/config_error.hpp>
#include <cleave/core/keccak.hpp>
#include <cleave/partition/facet.hpp>
#include <cleave/storage/storage_layout.hpp>
#include <cleave/test/model_builder.hpp>

#include <evmc/evmc.hpp>
#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using namespace cleave;
using namespace cleave::test;
using namespace evmc::literals;

namespace
{
    VariableDescriptor constant(std::string name, uint64_t const slot)
    {
        auto var = make_variable(std::move(name), slot);
        var.is_constant = true;
        return var;
    }

    VariableDescriptor small(std::string name, uint64_t const slot)
    {
        auto var = make_variable(std::move(name), slot, "bool");
        var.size = 1;
        return var;
    }
}

TEST(StorageLayout, privileged_variable_conflict_is_critical)
{
    std::vector<FacetCandidate> const facets{
        make_facet("AdminFacet", {make_variable("owner", 0, "address")}),
        make_facet("CoreFacet1", {make_variable("balance", 0)})};

    auto const res = check_storage(facets);
    ASSERT_FALSE(res.has_error());
    auto const &report = res.value();

    ASSERT_EQ(report.conflicts.size(), 1);
    auto const &conflict = report.conflicts[0];
    EXPECT_EQ(conflict.slot, 0);
    EXPECT_EQ(conflict.severity, ConflictSeverity::Critical);
    EXPECT_EQ(
        conflict.facets(),
        (std::vector<std::string>{"AdminFacet", "CoreFacet1"}));
    EXPECT_NE(
        conflict.recommendation.find("diamond storage pattern"),
        std::string::npos);
    EXPECT_EQ(
        conflict.recommendation,
        "Critical storage conflict at slot 0. Implement diamond storage "
        "pattern.");

    EXPECT_EQ(report.isolation.risk_level, RiskLevel::Critical);
    EXPECT_FALSE(report.isolation.isolated);
    EXPECT_EQ(
        report.isolation.overlapping_facets,
        (std::vector<std::string>{"AdminFacet", "CoreFacet1"}));
    EXPECT_EQ(report.security_issues.size(), 1);
    EXPECT_FALSE(report.manifest_ready);
    // namespaces are still unique, so every pattern is valid
    EXPECT_EQ(report.isolation_score, 100);
}

TEST(StorageLayout, conflict_is_symmetric)
{
    std::vector<FacetCandidate> const forward{
        make_facet("A", {make_variable("x", 2)}),
        make_facet("B", {make_variable("y", 2)})};
    std::vector<FacetCandidate> const backward{forward[1], forward[0]};

    auto const a = detect_conflicts(forward);
    auto const b = detect_conflicts(backward);
    ASSERT_EQ(a.size(), 1);
    ASSERT_EQ(b.size(), 1);
    EXPECT_EQ(a[0].slot, b[0].slot);
    EXPECT_EQ(a[0].severity, b[0].severity);
    EXPECT_EQ(a[0].facets().size(), b[0].facets().size());
}

TEST(StorageLayout, severity_grows_with_claimants)
{
    std::vector<FacetCandidate> const facets{
        make_facet("A", {make_variable("x", 3), make_variable("p", 5)}),
        make_facet("B", {make_variable("y", 3), make_variable("q", 5)}),
        make_facet("C", {make_variable("z", 5), make_variable("r", 7)}),
        make_facet("D", {make_variable("s", 7)})};

    auto const res = check_storage(facets);
    ASSERT_FALSE(res.has_error());
    auto const &report = res.value();

    ASSERT_EQ(report.conflicts.size(), 3);
    EXPECT_EQ(report.conflicts[0].slot, 3);
    EXPECT_EQ(report.conflicts[0].severity, ConflictSeverity::Warning);
    EXPECT_EQ(
        report.conflicts[0].recommendation,
        "Potential storage conflict at slot 3. Consider diamond storage "
        "pattern.");
    EXPECT_EQ(report.conflicts[1].slot, 5);
    EXPECT_EQ(report.conflicts[1].severity, ConflictSeverity::Error);
    EXPECT_EQ(report.conflicts[2].slot, 7);
    EXPECT_EQ(report.conflicts[2].severity, ConflictSeverity::Warning);
    EXPECT_EQ(report.isolation.risk_level, RiskLevel::High);
    EXPECT_TRUE(report.security_issues.empty());
}

TEST(StorageLayout, packed_claimants_count_towards_severity)
{
    std::vector<FacetCandidate> const facets{
        make_facet("A", {small("x", 1), small("y", 1)}),
        make_facet("B", {make_variable("z", 1)})};

    auto const conflicts = detect_conflicts(facets);
    ASSERT_EQ(conflicts.size(), 1);
    EXPECT_EQ(conflicts[0].slot, 1);
    EXPECT_EQ(conflicts[0].claimants.size(), 3);
    EXPECT_EQ(conflicts[0].facets(), (std::vector<std::string>{"A", "B"}));
    EXPECT_EQ(conflicts[0].severity, ConflictSeverity::Error);
}

TEST(StorageLayout, single_conflict_is_medium_risk)
{
    std::vector<FacetCandidate> const facets{
        make_facet("A", {make_variable("x", 1)}),
        make_facet("B", {make_variable("y", 1)})};

    auto const res = check_storage(facets);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().isolation.risk_level, RiskLevel::Medium);
}

TEST(StorageLayout, constants_and_packing_do_not_conflict)
{
    std::vector<FacetCandidate> const facets{
        make_facet("A", {constant("FEE", 0), small("paused", 1), small("locked", 1)}),
        make_facet("B", {constant("RATE", 0), make_variable("total", 2)})};

    auto const res = check_storage(facets);
    ASSERT_FALSE(res.has_error());
    auto const &report = res.value();
    EXPECT_TRUE(report.conflicts.empty());
    EXPECT_TRUE(report.isolation.isolated);
    EXPECT_EQ(report.isolation.risk_level, RiskLevel::Low);
    EXPECT_EQ(report.used_slots, 2);
    EXPECT_EQ(report.total_slots, 3);
    EXPECT_TRUE(report.manifest_ready);
    ASSERT_FALSE(report.gas_optimizations.empty());
    EXPECT_EQ(
        report.gas_optimizations[0],
        "Pack 2 small variables into shared slots");
}

TEST(StorageLayout, namespace_and_slot)
{
    EXPECT_EQ(
        derive_namespace("AdminFacet", StorageConfig{}),
        "payrox.facets.adminfacet.v1");
    EXPECT_EQ(
        derive_namespace(
            "Vault", StorageConfig{.namespace_prefix = "acme", .version = "v3"}),
        "acme.vault.v3");

    EXPECT_EQ(
        keccak256("abc"),
        0x4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45_bytes32);
    EXPECT_EQ(
        derive_storage_slot("abc"),
        0x4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c44_bytes32);

    auto const ns = derive_namespace("AdminFacet", StorageConfig{});
    EXPECT_EQ(derive_storage_slot(ns), derive_storage_slot(ns));
    EXPECT_NE(
        derive_storage_slot(ns),
        derive_storage_slot(derive_namespace("ViewFacet", StorageConfig{})));
}

TEST(StorageLayout, patterns_per_facet)
{
    std::vector<FacetCandidate> const facets{
        make_facet("AdminFacet", {make_variable("owner", 0, "address")}),
        make_facet("ViewFacet")};

    auto const res = check_storage(facets);
    ASSERT_FALSE(res.has_error());
    auto const &report = res.value();
    ASSERT_EQ(report.diamond_patterns.size(), 2);

    auto const *const admin = report.find_pattern("AdminFacet");
    ASSERT_NE(admin, nullptr);
    EXPECT_TRUE(admin->valid);
    EXPECT_EQ(admin->namespace_id, "payrox.facets.adminfacet.v1");
    EXPECT_EQ(admin->slot, derive_storage_slot(admin->namespace_id));
    EXPECT_NE(
        admin->storage_struct.find("library AdminFacetStorage"),
        std::string::npos);
    EXPECT_NE(
        admin->storage_struct.find("address owner;"), std::string::npos);
    EXPECT_NE(admin->storage_struct.find(to_hex(admin->slot)), std::string::npos);

    auto const *const view = report.find_pattern("ViewFacet");
    ASSERT_NE(view, nullptr);
    EXPECT_NE(
        view->storage_struct.find("// no persistent state"), std::string::npos);
    EXPECT_EQ(report.find_pattern("CoreFacet1"), nullptr);
    EXPECT_EQ(report.isolation_score, 100);
}

TEST(StorageLayout, duplicate_namespace_invalidates_patterns)
{
    std::vector<FacetCandidate> const facets{
        make_facet("Vault"), make_facet("vault")};

    auto const res = check_storage(facets);
    ASSERT_FALSE(res.has_error());
    auto const &report = res.value();
    EXPECT_FALSE(report.diamond_patterns[0].valid);
    EXPECT_FALSE(report.diamond_patterns[1].valid);
    EXPECT_EQ(report.isolation_score, 0);
    EXPECT_EQ(report.security_issues.size(), 2);
    EXPECT_FALSE(report.isolation.isolated);
    EXPECT_FALSE(report.manifest_ready);
}

TEST(StorageLayout, unclassified_facet_blocks_manifest)
{
    auto unclassified = make_facet("CoreFacet1");
    unclassified.security_classified = false;
    std::vector<FacetCandidate> const facets{make_facet("AdminFacet"), unclassified};

    auto const res = check_storage(facets);
    ASSERT_FALSE(res.has_error());
    EXPECT_TRUE(res.value().conflicts.empty());
    EXPECT_EQ(res.value().isolation_score, 100);
    EXPECT_FALSE(res.value().manifest_ready);
    EXPECT_EQ(
        res.value().security_issues,
        (std::vector<std::string>{
            "CoreFacet1 may need security level classification"}));
}

TEST(StorageLayout, collection_hint)
{
    std::vector<FacetCandidate> const facets{make_facet(
        "CoreFacet1", {make_variable("balances", 0, "mapping(address => uint256)")})};

    auto const res = check_storage(facets);
    ASSERT_FALSE(res.has_error());
    ASSERT_EQ(res.value().gas_optimizations.size(), 1);
    EXPECT_NE(
        res.value().gas_optimizations[0].find("namespaced storage"),
        std::string::npos);
}

TEST(StorageLayout, no_facets)
{
    auto const res = check_storage(std::vector<FacetCandidate>{});
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().isolation_score, 100);
    EXPECT_EQ(res.value().total_slots, 0);
    EXPECT_TRUE(res.value().diamond_patterns.empty());
}

TEST(StorageLayout, empty_namespace_prefix)
{
    std::vector<FacetCandidate> const facets{make_facet("A")};
    auto const res =
        check_storage(facets, StorageConfig{.namespace_prefix = ""});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ConfigError::InvalidNamespace);
}

TEST(StorageLayout, report_json)
{
    std::vector<FacetCandidate> const facets{
        make_facet("AdminFacet", {make_variable("owner", 0, "address")}),
        make_facet("CoreFacet1", {make_variable("balance", 0)})};
    auto const res = check_storage(facets);
    ASSERT_FALSE(res.has_error());
    auto const j = res.value().to_json();
    EXPECT_EQ(j["conflicts"][0]["severity"], "critical");
    EXPECT_EQ(j["facetIsolation"]["riskLevel"], "critical");
    EXPECT_EQ(j["isolationScore"], 100);
    EXPECT_EQ(j["manifestReady"], false);
    EXPECT_EQ(j["diamondPatterns"].size(), 2);
}
