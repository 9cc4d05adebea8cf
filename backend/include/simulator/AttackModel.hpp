#pragma once
#include "simulator/Qubit.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace qkdnet {

class RandomSource;

struct AttackerProfile {
    std::string name;
    double intercept_probability = 0.0;

    nlohmann::json to_json() const;
};

/**
 * @brief Intercept-resend eavesdropper behaviour for one attacker.
 *
 * Every decision is an independent draw; nothing is remembered between qubits.
 */
class AttackModel {
public:
    // throws ConfigurationError when the probability is outside [0, 1]
    explicit AttackModel(AttackerProfile profile);

    const AttackerProfile& profile() const { return profile_; }
    const std::string& name() const { return profile_.name; }

    /** @brief Bernoulli trial with the attacker's intercept probability */
    bool should_intercept(RandomSource& rng) const;
    /** @brief Uniform choice of measurement basis for an intercepted qubit */
    Basis choose_basis(RandomSource& rng) const;

private:
    AttackerProfile profile_;
};

void validate_probability(double p, const std::string& parameter);

} // namespace qkdnet
