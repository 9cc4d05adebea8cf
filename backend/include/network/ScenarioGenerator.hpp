#pragma once
#include "simulator/AttackModel.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace qkdnet {

class RandomSource;

enum class AttackArchetype {
    NoAttack,
    SingleAttackerSingleTarget,
    SingleAttackerMultipleTargets,
    MultipleAttackersSingleTargets,
    MultipleAttackersMultipleTargets
};

const char* archetype_name(AttackArchetype a);
// accepts the canonical names plus "none"; throws ConfigurationError otherwise
AttackArchetype parse_archetype(const std::string& name);
const std::vector<AttackArchetype>& all_archetypes();

/**
 * @brief Which attackers sit on which receiver's link.
 *
 * assignments maps a receiver name to its attacker chain, in interception
 * order. Receivers absent from the map carry no attack.
 */
struct ScenarioSpec {
    std::string name;
    std::optional<AttackArchetype> archetype;
    std::vector<AttackerProfile> attackers;
    std::map<std::string, std::vector<std::string>> assignments;

    std::vector<std::string> chain_for(const std::string& receiver) const;
    std::vector<std::string> targets_of(const std::string& attacker) const;

    nlohmann::json to_json() const;
    // throws ConfigurationError on missing or mistyped fields
    static ScenarioSpec from_json(const nlohmann::json& j);
};

std::string attacker_name(int index);

class ScenarioGenerator {
public:
    struct Bounds {
        int min_attackers = 1;
        int max_attackers = 3;
        double min_rate = 0.0;
        double max_rate = 1.0;
    };

    ScenarioGenerator();
    // throws ConfigurationError for inverted or out-of-range bounds
    explicit ScenarioGenerator(Bounds bounds);

    const Bounds& bounds() const { return bounds_; }

    /**
     * @brief Spec for a pinned archetype with caller-chosen parameters.
     *
     * Every attacker gets intercept_rate; only target placement is random.
     */
    ScenarioSpec build(AttackArchetype archetype, const std::vector<std::string>& receivers,
                       int num_attackers, double intercept_rate, RandomSource& rng) const;

    // attacker count, per-attacker rates and targets all drawn within bounds
    ScenarioSpec randomize(AttackArchetype archetype, const std::vector<std::string>& receivers,
                           RandomSource& rng) const;

    // one batch slot: uniform archetype choice unless pinned
    ScenarioSpec next(const std::vector<std::string>& receivers, RandomSource& rng,
                      std::optional<AttackArchetype> pinned = std::nullopt) const;

    std::vector<ScenarioSpec> generate(int count, const std::vector<std::string>& receivers,
                                       RandomSource& rng,
                                       std::optional<AttackArchetype> pinned = std::nullopt) const;

private:
    ScenarioSpec assemble(AttackArchetype archetype, const std::vector<std::string>& receivers,
                          const std::vector<double>& rates, RandomSource& rng) const;

    Bounds bounds_;
};

} // namespace qkdnet
