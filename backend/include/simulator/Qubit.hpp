#pragma once
#include <string>

namespace qkdnet {

enum class Basis {
    Rectilinear = 0,
    Diagonal = 1
};

inline const char* basis_name(Basis b) {
    return b == Basis::Rectilinear ? "rectilinear" : "diagonal";
}

inline Basis basis_from_bit(int b) {
    return (b & 1) ? Basis::Diagonal : Basis::Rectilinear;
}

/**
 * @brief Classical stand-in for a single prepared qubit.
 *
 * Immutable once prepared; a measurement consumes it.
 */
struct Qubit {
    int bit = 0;
    Basis basis = Basis::Rectilinear;
};

struct MeasurementOutcome {
    int bit = 0;
    Basis basis_used = Basis::Rectilinear;
};

} // namespace qkdnet
