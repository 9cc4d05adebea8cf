#include "network/ScenarioGenerator.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/RandomSource.hpp"
#include <algorithm>
#include <numeric>

using nlohmann::json;

namespace qkdnet {

const char* archetype_name(AttackArchetype a) {
    switch (a) {
        case AttackArchetype::NoAttack: return "no_attack";
        case AttackArchetype::SingleAttackerSingleTarget: return "single_attacker_single_target";
        case AttackArchetype::SingleAttackerMultipleTargets: return "single_attacker_multiple_targets";
        case AttackArchetype::MultipleAttackersSingleTargets: return "multiple_attackers_single_targets";
        case AttackArchetype::MultipleAttackersMultipleTargets: return "multiple_attackers_multiple_targets";
    }
    return "unknown";
}

AttackArchetype parse_archetype(const std::string& name) {
    if (name == "none") return AttackArchetype::NoAttack;
    for (auto a : all_archetypes()) {
        if (name == archetype_name(a)) return a;
    }
    throw ConfigurationError(errors::E1005_UNKNOWN_ARCHETYPE, "attack_scenario",
                             std::string(errors::D1005_UNKNOWN_ARCHETYPE) + " '" + name + "'");
}

const std::vector<AttackArchetype>& all_archetypes() {
    static const std::vector<AttackArchetype> kAll = {
        AttackArchetype::NoAttack,
        AttackArchetype::SingleAttackerSingleTarget,
        AttackArchetype::SingleAttackerMultipleTargets,
        AttackArchetype::MultipleAttackersSingleTargets,
        AttackArchetype::MultipleAttackersMultipleTargets
    };
    return kAll;
}

std::string attacker_name(int index) {
    return "Attacker_" + std::to_string(index + 1);
}

std::vector<std::string> ScenarioSpec::chain_for(const std::string& receiver) const {
    auto it = assignments.find(receiver);
    if (it == assignments.end()) return {};
    return it->second;
}

std::vector<std::string> ScenarioSpec::targets_of(const std::string& attacker) const {
    std::vector<std::string> out;
    for (const auto& [receiver, chain] : assignments) {
        if (std::find(chain.begin(), chain.end(), attacker) != chain.end()) out.push_back(receiver);
    }
    return out;
}

json ScenarioSpec::to_json() const {
    json j;
    j["name"] = name;
    j["archetype"] = archetype ? json(archetype_name(*archetype)) : json(nullptr);
    json atk = json::array();
    for (const auto& a : attackers) atk.push_back(a.to_json());
    j["attackers"] = atk;
    json asg = json::object();
    for (const auto& [receiver, chain] : assignments) asg[receiver] = chain;
    j["assignments"] = asg;
    return j;
}

ScenarioSpec ScenarioSpec::from_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigurationError(errors::E1009_CONFIG_FILE, "scenario", errors::D1009_BAD_FIELD);
    }
    ScenarioSpec s;
    std::string field = "name";
    try {
        s.name = j.value("name", std::string("custom"));
        field = "archetype";
        if (j.contains("archetype") && !j["archetype"].is_null()) {
            s.archetype = parse_archetype(j["archetype"].get<std::string>());
        }
        field = "attackers";
        for (const auto& a : j.value("attackers", json::array())) {
            AttackerProfile p;
            p.name = a.at("name").get<std::string>();
            p.intercept_probability = a.value("intercept_probability", 0.5);
            s.attackers.push_back(p);
        }
        field = "assignments";
        const json asg = j.value("assignments", json::object());
        for (auto it = asg.begin(); it != asg.end(); ++it) {
            s.assignments[it.key()] = it.value().get<std::vector<std::string>>();
        }
    } catch (const json::exception& e) {
        throw ConfigurationError(errors::E1009_CONFIG_FILE, field,
                                 std::string(errors::D1009_BAD_FIELD) + " (" + e.what() + ")");
    }
    return s;
}

// k distinct receivers, returned in receiver-set order
static std::vector<std::string> sample_receivers(const std::vector<std::string>& receivers, size_t k, RandomSource& rng) {
    std::vector<size_t> idx(receivers.size());
    std::iota(idx.begin(), idx.end(), 0);
    k = std::min(k, idx.size());
    for (size_t i = 0; i < k; ++i) {
        size_t j = i + rng.below(idx.size() - i);
        std::swap(idx[i], idx[j]);
    }
    idx.resize(k);
    std::sort(idx.begin(), idx.end());
    std::vector<std::string> out;
    out.reserve(k);
    for (auto i : idx) out.push_back(receivers[i]);
    return out;
}

// subset size uniform in [2, R]
static size_t multi_target_size(size_t receiver_count, RandomSource& rng) {
    return 2 + rng.below(receiver_count - 1);
}

ScenarioGenerator::ScenarioGenerator() : ScenarioGenerator(Bounds{}) {}

ScenarioGenerator::ScenarioGenerator(Bounds bounds)
: bounds_(bounds) {
    if (bounds_.min_attackers < 1 || bounds_.max_attackers < bounds_.min_attackers) {
        throw ConfigurationError(errors::E1008_ATTACKER_COUNT, "attacker_bounds",
                                 "attacker bounds must satisfy 1 <= min <= max");
    }
    validate_probability(bounds_.min_rate, "min_rate");
    validate_probability(bounds_.max_rate, "max_rate");
    if (bounds_.max_rate < bounds_.min_rate) {
        throw ConfigurationError(errors::E1002_PROBABILITY, "rate_bounds", "max_rate must be >= min_rate");
    }
}

ScenarioSpec ScenarioGenerator::assemble(AttackArchetype archetype, const std::vector<std::string>& receivers,
                                         const std::vector<double>& rates, RandomSource& rng) const {
    if (receivers.empty()) {
        throw ConfigurationError(errors::E1007_RECEIVER_SET, "receivers", errors::D1007_RECEIVERS_EMPTY);
    }
    const size_t R = receivers.size();
    const size_t M = rates.size();

    ScenarioSpec spec;
    spec.archetype = archetype;
    spec.name = archetype_name(archetype);
    for (size_t i = 0; i < M; ++i) {
        AttackerProfile p;
        p.name = attacker_name(static_cast<int>(i));
        p.intercept_probability = rates[i];
        validate_probability(p.intercept_probability, "intercept_rate");
        spec.attackers.push_back(p);
    }

    switch (archetype) {
        case AttackArchetype::NoAttack:
            break;
        case AttackArchetype::SingleAttackerSingleTarget:
            spec.assignments[receivers[rng.below(R)]].push_back(spec.attackers[0].name);
            break;
        case AttackArchetype::SingleAttackerMultipleTargets:
            for (const auto& r : sample_receivers(receivers, multi_target_size(R, rng), rng)) {
                spec.assignments[r].push_back(spec.attackers[0].name);
            }
            break;
        case AttackArchetype::MultipleAttackersSingleTargets: {
            // distinct target per attacker, attacker order follows the sample
            std::vector<std::string> targets = sample_receivers(receivers, M, rng);
            for (size_t i = 0; i < M; ++i) {
                size_t j = i + rng.below(M - i);
                std::swap(targets[i], targets[j]);
                spec.assignments[targets[i]].push_back(spec.attackers[i].name);
            }
            break;
        }
        case AttackArchetype::MultipleAttackersMultipleTargets:
            for (size_t i = 0; i < M; ++i) {
                for (const auto& r : sample_receivers(receivers, multi_target_size(R, rng), rng)) {
                    spec.assignments[r].push_back(spec.attackers[i].name);
                }
            }
            break;
    }
    return spec;
}

static void check_archetype_fits(AttackArchetype archetype, size_t receivers, int num_attackers) {
    switch (archetype) {
        case AttackArchetype::NoAttack:
            return;
        case AttackArchetype::SingleAttackerSingleTarget:
            if (num_attackers < 1) {
                throw ConfigurationError(errors::E1008_ATTACKER_COUNT, "num_attackers", errors::D1008_ATTACKERS_REQUIRED);
            }
            if (num_attackers != 1) {
                throw ConfigurationError(errors::E1008_ATTACKER_COUNT, "num_attackers", errors::D1008_EXACTLY_ONE);
            }
            return;
        case AttackArchetype::SingleAttackerMultipleTargets:
            if (num_attackers < 1) {
                throw ConfigurationError(errors::E1008_ATTACKER_COUNT, "num_attackers", errors::D1008_ATTACKERS_REQUIRED);
            }
            if (num_attackers != 1) {
                throw ConfigurationError(errors::E1008_ATTACKER_COUNT, "num_attackers", errors::D1008_EXACTLY_ONE);
            }
            if (receivers < 2) {
                throw ConfigurationError(errors::E1008_ATTACKER_COUNT, "receivers", errors::D1008_TOO_FEW_RECEIVERS);
            }
            return;
        case AttackArchetype::MultipleAttackersSingleTargets:
            if (num_attackers < 2) {
                throw ConfigurationError(errors::E1008_ATTACKER_COUNT, "num_attackers", errors::D1008_TOO_FEW_FOR_MULTI);
            }
            if (static_cast<size_t>(num_attackers) > receivers) {
                throw ConfigurationError(errors::E1008_ATTACKER_COUNT, "num_attackers", errors::D1008_ATTACKERS_EXCEED_RECEIVERS);
            }
            return;
        case AttackArchetype::MultipleAttackersMultipleTargets:
            if (num_attackers < 2) {
                throw ConfigurationError(errors::E1008_ATTACKER_COUNT, "num_attackers", errors::D1008_TOO_FEW_FOR_MULTI);
            }
            if (receivers < 2) {
                throw ConfigurationError(errors::E1008_ATTACKER_COUNT, "receivers", errors::D1008_TOO_FEW_RECEIVERS);
            }
            return;
    }
}

ScenarioSpec ScenarioGenerator::build(AttackArchetype archetype, const std::vector<std::string>& receivers,
                                      int num_attackers, double intercept_rate, RandomSource& rng) const {
    if (num_attackers < 0) {
        throw ConfigurationError(errors::E1008_ATTACKER_COUNT, "num_attackers", errors::D1008_ATTACKERS_NEGATIVE);
    }
    validate_probability(intercept_rate, "intercept_rate");
    check_archetype_fits(archetype, receivers.size(), num_attackers);

    // no_attack ignores num_attackers so the default config stays usable
    int m = archetype == AttackArchetype::NoAttack ? 0 : num_attackers;
    return assemble(archetype, receivers, std::vector<double>(static_cast<size_t>(m), intercept_rate), rng);
}

ScenarioSpec ScenarioGenerator::randomize(AttackArchetype archetype, const std::vector<std::string>& receivers,
                                          RandomSource& rng) const {
    int m = 0;
    switch (archetype) {
        case AttackArchetype::NoAttack:
            break;
        case AttackArchetype::SingleAttackerSingleTarget:
        case AttackArchetype::SingleAttackerMultipleTargets:
            m = 1;
            break;
        case AttackArchetype::MultipleAttackersSingleTargets:
        case AttackArchetype::MultipleAttackersMultipleTargets: {
            int lo = std::max(2, bounds_.min_attackers);
            int hi = std::max(lo, bounds_.max_attackers);
            if (archetype == AttackArchetype::MultipleAttackersSingleTargets) {
                hi = std::min<int>(hi, static_cast<int>(receivers.size()));
            }
            m = hi >= lo ? lo + static_cast<int>(rng.below(static_cast<size_t>(hi - lo + 1))) : lo;
            break;
        }
    }
    check_archetype_fits(archetype, receivers.size(), m);

    std::vector<double> rates;
    rates.reserve(static_cast<size_t>(m));
    for (int i = 0; i < m; ++i) {
        rates.push_back(bounds_.min_rate + rng.uniform01() * (bounds_.max_rate - bounds_.min_rate));
    }
    return assemble(archetype, receivers, rates, rng);
}

ScenarioSpec ScenarioGenerator::next(const std::vector<std::string>& receivers, RandomSource& rng,
                                     std::optional<AttackArchetype> pinned) const {
    const auto& all = all_archetypes();
    AttackArchetype a = pinned ? *pinned : all[rng.below(all.size())];
    return randomize(a, receivers, rng);
}

std::vector<ScenarioSpec> ScenarioGenerator::generate(int count, const std::vector<std::string>& receivers,
                                                      RandomSource& rng,
                                                      std::optional<AttackArchetype> pinned) const {
    if (count <= 0) {
        throw ConfigurationError(errors::E1010_SCENARIO_COUNT, "num_scenarios", errors::D1010_SCENARIOS_NOT_POSITIVE);
    }
    std::vector<ScenarioSpec> out;
    out.reserve(static_cast<size_t>(count));
    for (int k = 0; k < count; ++k) out.push_back(next(receivers, rng, pinned));
    return out;
}

} // namespace qkdnet
