#include <gtest/gtest.h>
#include "core/ErrorCatalog.hpp"
#include "core/RandomSource.hpp"
#include "network/NetworkSimulator.hpp"
#include "network/ScenarioGenerator.hpp"
#include <set>
#include <nlohmann/json.hpp>

using namespace qkdnet;
using nlohmann::json;

static const std::vector<std::string> kReceivers = {"Bob", "Charlie", "Dave", "Diana"};

TEST(ScenarioGenerator, ArchetypeNamesRoundTrip) {
    for (auto a : all_archetypes()) EXPECT_EQ(parse_archetype(archetype_name(a)), a);
    EXPECT_EQ(parse_archetype("none"), AttackArchetype::NoAttack);
    try {
        parse_archetype("man_in_the_middle");
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.code(), errors::E1005_UNKNOWN_ARCHETYPE);
        EXPECT_EQ(e.parameter(), "attack_scenario");
    }
}

TEST(ScenarioGenerator, NoAttackHasNoAssignments) {
    ScenarioGenerator gen;
    Mt19937RandomSource rng(1);
    ScenarioSpec s = gen.build(AttackArchetype::NoAttack, kReceivers, 3, 0.5, rng);
    EXPECT_TRUE(s.attackers.empty());
    EXPECT_TRUE(s.assignments.empty());
    EXPECT_EQ(s.name, "no_attack");
}

TEST(ScenarioGenerator, NoAttackIgnoresAttackerCount) {
    ScenarioGenerator gen;
    for (int n : {0, 1, 2, 7}) {
        Mt19937RandomSource rng(5);
        ScenarioSpec s = gen.build(AttackArchetype::NoAttack, kReceivers, n, 0.5, rng);
        EXPECT_TRUE(s.attackers.empty()) << n;
        EXPECT_TRUE(s.assignments.empty()) << n;
    }
    Mt19937RandomSource rng(5);
    EXPECT_THROW(gen.build(AttackArchetype::NoAttack, kReceivers, -1, 0.5, rng), ConfigurationError);
}

TEST(ScenarioGenerator, SingleAttackerArchetypesRequireExactlyOne) {
    ScenarioGenerator gen;
    for (AttackArchetype a : {AttackArchetype::SingleAttackerSingleTarget,
                              AttackArchetype::SingleAttackerMultipleTargets}) {
        for (int n : {2, 3}) {
            Mt19937RandomSource rng(1);
            try {
                gen.build(a, kReceivers, n, 0.5, rng);
                FAIL() << "expected ConfigurationError for " << archetype_name(a) << " with " << n;
            } catch (const ConfigurationError& e) {
                EXPECT_EQ(e.code(), errors::E1008_ATTACKER_COUNT);
                EXPECT_EQ(e.parameter(), "num_attackers");
            }
        }
        Mt19937RandomSource rng(1);
        EXPECT_EQ(gen.build(a, kReceivers, 1, 0.5, rng).attackers.size(), 1u);
    }
}

TEST(ScenarioGenerator, SingleAttackerSingleTarget) {
    ScenarioGenerator gen;
    for (uint64_t seed = 0; seed < 50; ++seed) {
        Mt19937RandomSource rng(seed);
        ScenarioSpec s = gen.build(AttackArchetype::SingleAttackerSingleTarget, kReceivers, 1, 0.8, rng);
        ASSERT_EQ(s.attackers.size(), 1u);
        EXPECT_EQ(s.attackers[0].name, "Attacker_1");
        EXPECT_DOUBLE_EQ(s.attackers[0].intercept_probability, 0.8);
        EXPECT_EQ(s.assignments.size(), 1u);
        EXPECT_EQ(s.targets_of("Attacker_1").size(), 1u);
    }
}

TEST(ScenarioGenerator, SingleAttackerMultipleTargetsCoversTwoOrMore) {
    ScenarioGenerator gen;
    std::set<size_t> sizes;
    for (uint64_t seed = 0; seed < 200; ++seed) {
        Mt19937RandomSource rng(seed);
        ScenarioSpec s = gen.build(AttackArchetype::SingleAttackerMultipleTargets, kReceivers, 1, 0.5, rng);
        size_t n = s.targets_of("Attacker_1").size();
        EXPECT_GE(n, 2u);
        EXPECT_LE(n, kReceivers.size());
        sizes.insert(n);
    }
    EXPECT_EQ(sizes.size(), 3u);
}

TEST(ScenarioGenerator, MultipleAttackersSingleTargetsAreDistinct) {
    ScenarioGenerator gen;
    for (uint64_t seed = 0; seed < 50; ++seed) {
        Mt19937RandomSource rng(seed);
        ScenarioSpec s = gen.build(AttackArchetype::MultipleAttackersSingleTargets, kReceivers, 3, 0.5, rng);
        ASSERT_EQ(s.attackers.size(), 3u);
        std::set<std::string> targets;
        for (const auto& a : s.attackers) {
            auto t = s.targets_of(a.name);
            ASSERT_EQ(t.size(), 1u);
            targets.insert(t[0]);
        }
        EXPECT_EQ(targets.size(), 3u);
    }
}

TEST(ScenarioGenerator, MultipleAttackersMultipleTargets) {
    ScenarioGenerator gen;
    Mt19937RandomSource rng(9);
    ScenarioSpec s = gen.build(AttackArchetype::MultipleAttackersMultipleTargets, kReceivers, 2, 0.4, rng);
    ASSERT_EQ(s.attackers.size(), 2u);
    for (const auto& a : s.attackers) EXPECT_GE(s.targets_of(a.name).size(), 2u);
    // chains list attackers in index order
    for (const auto& [receiver, chain] : s.assignments) {
        if (chain.size() == 2) {
            EXPECT_EQ(chain[0], "Attacker_1");
            EXPECT_EQ(chain[1], "Attacker_2");
        }
    }
}

TEST(ScenarioGenerator, RejectsArchetypeThatCannotFit) {
    ScenarioGenerator gen;
    Mt19937RandomSource rng(1);
    try {
        gen.build(AttackArchetype::MultipleAttackersSingleTargets, kReceivers, 5, 0.5, rng);
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.code(), errors::E1008_ATTACKER_COUNT);
    }
    EXPECT_THROW(gen.build(AttackArchetype::MultipleAttackersMultipleTargets, kReceivers, 1, 0.5, rng),
                 ConfigurationError);
    EXPECT_THROW(gen.build(AttackArchetype::SingleAttackerMultipleTargets, {"Bob"}, 1, 0.5, rng),
                 ConfigurationError);
    EXPECT_THROW(gen.build(AttackArchetype::SingleAttackerSingleTarget, kReceivers, 0, 0.5, rng),
                 ConfigurationError);
    EXPECT_THROW(gen.build(AttackArchetype::SingleAttackerSingleTarget, kReceivers, 1, 1.2, rng),
                 ConfigurationError);
    EXPECT_THROW(gen.build(AttackArchetype::NoAttack, {}, 0, 0.5, rng), ConfigurationError);
}

TEST(ScenarioGenerator, RejectsInvertedBounds) {
    ScenarioGenerator::Bounds b;
    b.min_attackers = 3;
    b.max_attackers = 2;
    EXPECT_THROW(ScenarioGenerator{b}, ConfigurationError);
    ScenarioGenerator::Bounds r;
    r.min_rate = 0.8;
    r.max_rate = 0.2;
    EXPECT_THROW(ScenarioGenerator{r}, ConfigurationError);
}

TEST(ScenarioGenerator, RandomizedRatesStayInBounds) {
    ScenarioGenerator::Bounds b;
    b.min_rate = 0.2;
    b.max_rate = 0.6;
    ScenarioGenerator gen(b);
    Mt19937RandomSource rng(77);
    for (const auto& s : gen.generate(40, kReceivers, rng)) {
        for (const auto& a : s.attackers) {
            EXPECT_GE(a.intercept_probability, 0.2);
            EXPECT_LE(a.intercept_probability, 0.6);
        }
        EXPECT_LE(s.attackers.size(), 3u);
        EXPECT_NO_THROW(NetworkSimulator::validate_spec(s, kReceivers));
    }
}

TEST(ScenarioGenerator, BatchDrawsEveryArchetype) {
    ScenarioGenerator gen;
    Mt19937RandomSource rng(5);
    std::set<std::string> seen;
    for (const auto& s : gen.generate(100, kReceivers, rng)) seen.insert(s.name);
    EXPECT_EQ(seen.size(), all_archetypes().size());
}

TEST(ScenarioGenerator, PinnedArchetypeIsHonoured) {
    ScenarioGenerator gen;
    Mt19937RandomSource rng(5);
    for (const auto& s : gen.generate(10, kReceivers, rng, AttackArchetype::MultipleAttackersSingleTargets)) {
        ASSERT_TRUE(s.archetype.has_value());
        EXPECT_EQ(*s.archetype, AttackArchetype::MultipleAttackersSingleTargets);
        EXPECT_GE(s.attackers.size(), 2u);
    }
}

TEST(ScenarioGenerator, SameSeedSameBatch) {
    ScenarioGenerator gen;
    Mt19937RandomSource a(31), b(31);
    auto x = gen.generate(8, kReceivers, a);
    auto y = gen.generate(8, kReceivers, b);
    ASSERT_EQ(x.size(), y.size());
    for (size_t i = 0; i < x.size(); ++i) EXPECT_EQ(x[i].to_json(), y[i].to_json());
    EXPECT_THROW(gen.generate(0, kReceivers, a), ConfigurationError);
}

TEST(ScenarioSpec, FromJsonKeepsChainOrder) {
    json j = {
        {"name", "relay"},
        {"attackers", json::array({ { {"name", "Mallory"}, {"intercept_probability", 0.3} },
                                     { {"name", "Eve"}, {"intercept_probability", 1.0} } })},
        {"assignments", { {"Charlie", json::array({"Eve", "Mallory"})} }}
    };
    ScenarioSpec s = ScenarioSpec::from_json(j);
    EXPECT_EQ(s.name, "relay");
    EXPECT_FALSE(s.archetype.has_value());
    EXPECT_EQ(s.chain_for("Charlie"), (std::vector<std::string>{"Eve", "Mallory"}));
    EXPECT_TRUE(s.chain_for("Bob").empty());
    EXPECT_EQ(ScenarioSpec::from_json(s.to_json()).to_json(), s.to_json());
}

TEST(ScenarioSpec, FromJsonRejectsMistypedFields) {
    json j = { {"attackers", json::array({ { {"intercept_probability", 0.3} } })} };
    try {
        ScenarioSpec::from_json(j);
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.code(), errors::E1009_CONFIG_FILE);
        EXPECT_EQ(e.parameter(), "attackers");
    }
    EXPECT_THROW(ScenarioSpec::from_json(json::array()), ConfigurationError);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
