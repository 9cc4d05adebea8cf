#include "simulator/AttackModel.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/RandomSource.hpp"
#include <cmath>
#include <utility>

namespace qkdnet {

nlohmann::json AttackerProfile::to_json() const {
    return {
        {"name", name},
        {"intercept_probability", intercept_probability}
    };
}

void validate_probability(double p, const std::string& parameter) {
    if (!std::isfinite(p) || p < 0.0 || p > 1.0) {
        throw ConfigurationError(errors::E1002_PROBABILITY, parameter, errors::D1002_PROBABILITY_RANGE);
    }
}

AttackModel::AttackModel(AttackerProfile profile)
: profile_(std::move(profile)) {
    validate_probability(profile_.intercept_probability, "intercept_probability[" + profile_.name + "]");
}

bool AttackModel::should_intercept(RandomSource& rng) const {
    return rng.bernoulli(profile_.intercept_probability);
}

Basis AttackModel::choose_basis(RandomSource& rng) const {
    return basis_from_bit(rng.bit());
}

} // namespace qkdnet
