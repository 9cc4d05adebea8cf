#pragma once
#include "simulator/AttackModel.hpp"
#include "simulator/Qubit.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace qkdnet {

class RandomSource;

inline constexpr double kDefaultSecurityThreshold = 11.0;

// How several attackers on one link share the qubits passing through them.
enum class InterceptionMode {
    Independent, // every attacker draws its own trial per qubit
    Exclusive    // the first attacker to intercept a qubit claims it
};

const char* interception_mode_name(InterceptionMode m);
// throws ConfigurationError for anything but "independent" / "exclusive"
InterceptionMode parse_interception_mode(const std::string& name);

struct LinkOptions {
    double security_threshold = kDefaultSecurityThreshold;
    InterceptionMode interception_mode = InterceptionMode::Independent;
};

struct LinkResult {
    std::string receiver;
    int num_qubits = 0;
    std::vector<int> sender_key;   // sifted, index-aligned with receiver_key
    std::vector<int> receiver_key;
    size_t mismatches = 0;
    double qber_percent = 0.0;
    double security_threshold = kDefaultSecurityThreshold;
    bool secure = false;
    // no basis matches survived sifting; neither secure nor compromised
    bool indeterminate = false;
    std::vector<std::string> attackers_involved;
    // qubits intercepted per attacker, chain order
    std::vector<std::pair<std::string, int>> interceptions;
    std::optional<std::string> error;

    size_t sifted_length() const { return sender_key.size(); }
    bool failed() const { return error.has_value(); }
    bool compromised() const { return !failed() && !indeterminate && !secure; }

    nlohmann::json to_json() const;

    static LinkResult failure(const std::string& receiver, int num_qubits,
                              const std::vector<std::string>& attackers,
                              double threshold, const std::string& message);
};

struct SiftedKeys {
    std::vector<int> sender;
    std::vector<int> receiver;
};

// Keep positions where the receiver's basis equals the sender's original basis,
// in index order.
SiftedKeys sift_keys(const std::vector<int>& sender_bits, const std::vector<Basis>& sender_bases,
                     const std::vector<int>& receiver_bits, const std::vector<Basis>& receiver_bases);

size_t count_mismatches(const std::vector<int>& a, const std::vector<int>& b);

// 100 * mismatches / length; 0 for empty keys
double compute_qber_percent(const std::vector<int>& sender_key, const std::vector<int>& receiver_key);

/**
 * @brief One sender -> receiver BB84 exchange over a fixed number of qubits.
 *
 * The attacker chain is applied in the order given. A run is a single pass;
 * all randomness comes from the source handed to run().
 */
class BB84Link {
public:
    // throws ConfigurationError for num_qubits <= 0 or a bad threshold
    BB84Link(int num_qubits, std::vector<AttackModel> chain,
             LinkOptions options = {}, std::string receiver = "Bob");

    LinkResult run(RandomSource& rng) const;

    int num_qubits() const { return num_qubits_; }
    const std::vector<AttackModel>& chain() const { return chain_; }
    const std::string& receiver() const { return receiver_; }

private:
    int num_qubits_;
    std::vector<AttackModel> chain_;
    LinkOptions options_;
    std::string receiver_;
};

void validate_qubit_count(int num_qubits);
void validate_threshold(double threshold);

} // namespace qkdnet
