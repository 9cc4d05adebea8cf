#pragma once
#include "simulator/Qubit.hpp"

namespace qkdnet {

class RandomSource;
class AttackModel;

/**
 * @brief Preparation, interception and measurement of single qubits.
 *
 * The channel holds no state of its own beyond the random source it draws
 * from; one channel serves one link run.
 */
class QubitChannel {
public:
    explicit QubitChannel(RandomSource& rng);

    /** @brief Deterministic construction of a qubit */
    static Qubit prepare(int bit, Basis basis);

    /**
     * @brief Intercept-resend: measure in a random basis, re-prepare the result.
     *
     * The returned qubit carries the attacker's basis, so a later measurement
     * in the sender's basis is randomised whenever the attacker guessed wrong.
     */
    Qubit intercept(const Qubit& qubit, const AttackModel& attacker);

    /** @brief Matching basis returns the encoded bit; otherwise a fair coin */
    MeasurementOutcome measure(const Qubit& qubit, Basis basis);

private:
    RandomSource& rng_;
};

} // namespace qkdnet
