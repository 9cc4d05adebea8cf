#include "simulator/QubitChannel.hpp"
#include "simulator/AttackModel.hpp"
#include "core/RandomSource.hpp"

namespace qkdnet {

QubitChannel::QubitChannel(RandomSource& rng)
: rng_(rng) {}

Qubit QubitChannel::prepare(int bit, Basis basis) {
    Qubit q;
    q.bit = bit & 1;
    q.basis = basis;
    return q;
}

Qubit QubitChannel::intercept(const Qubit& qubit, const AttackModel& attacker) {
    Basis eve_basis = attacker.choose_basis(rng_);
    MeasurementOutcome seen = measure(qubit, eve_basis);
    return prepare(seen.bit, seen.basis_used);
}

MeasurementOutcome QubitChannel::measure(const Qubit& qubit, Basis basis) {
    MeasurementOutcome out;
    out.basis_used = basis;
    out.bit = (qubit.basis == basis) ? qubit.bit : rng_.bit();
    return out;
}

} // namespace qkdnet
