#include "simulator/BB84Link.hpp"
#include "simulator/QubitChannel.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/RandomSource.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

using nlohmann::json;

namespace qkdnet {

const char* interception_mode_name(InterceptionMode m) {
    return m == InterceptionMode::Exclusive ? "exclusive" : "independent";
}

InterceptionMode parse_interception_mode(const std::string& name) {
    if (name == "independent") return InterceptionMode::Independent;
    if (name == "exclusive") return InterceptionMode::Exclusive;
    throw ConfigurationError(errors::E1000_CONFIGURATION, "interception_mode",
                             "expected 'independent' or 'exclusive', got '" + name + "'");
}

void validate_qubit_count(int num_qubits) {
    if (num_qubits <= 0) {
        throw ConfigurationError(errors::E1001_QUBIT_COUNT, "num_qubits", errors::D1001_QUBITS_NOT_POSITIVE);
    }
}

void validate_threshold(double threshold) {
    if (!std::isfinite(threshold) || threshold <= 0.0 || threshold > 100.0) {
        throw ConfigurationError(errors::E1006_THRESHOLD, "security_threshold", errors::D1006_THRESHOLD_RANGE);
    }
}

json LinkResult::to_json() const {
    json j;
    j["receiver"] = receiver;
    j["num_qubits"] = num_qubits;
    j["sender_key"] = sender_key;
    j["receiver_key"] = receiver_key;
    j["sifted_length"] = sifted_length();
    j["mismatches"] = mismatches;
    j["qber_percent"] = qber_percent;
    j["security_threshold"] = security_threshold;
    j["secure"] = secure;
    j["indeterminate"] = indeterminate;
    j["attackers_involved"] = attackers_involved;
    json inter = json::array();
    for (const auto& [name, count] : interceptions) {
        inter.push_back({ {"attacker", name}, {"qubits", count} });
    }
    j["interceptions"] = inter;
    if (error) {
        j["failed"] = true;
        j["error"] = *error;
    } else {
        j["failed"] = false;
    }
    return j;
}

LinkResult LinkResult::failure(const std::string& receiver, int num_qubits,
                               const std::vector<std::string>& attackers,
                               double threshold, const std::string& message) {
    LinkResult r;
    r.receiver = receiver;
    r.num_qubits = num_qubits;
    r.security_threshold = threshold;
    r.attackers_involved = attackers;
    r.error = message;
    return r;
}

SiftedKeys sift_keys(const std::vector<int>& sender_bits, const std::vector<Basis>& sender_bases,
                     const std::vector<int>& receiver_bits, const std::vector<Basis>& receiver_bases) {
    SiftedKeys out;
    size_t n = std::min({sender_bits.size(), sender_bases.size(), receiver_bits.size(), receiver_bases.size()});
    for (size_t i = 0; i < n; ++i) {
        if (sender_bases[i] == receiver_bases[i]) {
            out.sender.push_back(sender_bits[i]);
            out.receiver.push_back(receiver_bits[i]);
        }
    }
    return out;
}

size_t count_mismatches(const std::vector<int>& a, const std::vector<int>& b) {
    size_t errors = 0;
    size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        if ((a[i] & 1) != (b[i] & 1)) errors++;
    }
    return errors;
}

double compute_qber_percent(const std::vector<int>& sender_key, const std::vector<int>& receiver_key) {
    if (sender_key.empty()) return 0.0;
    return 100.0 * static_cast<double>(count_mismatches(sender_key, receiver_key))
           / static_cast<double>(sender_key.size());
}

BB84Link::BB84Link(int num_qubits, std::vector<AttackModel> chain, LinkOptions options, std::string receiver)
: num_qubits_(num_qubits), chain_(std::move(chain)), options_(options), receiver_(std::move(receiver)) {
    validate_qubit_count(num_qubits_);
    validate_threshold(options_.security_threshold);
}

LinkResult BB84Link::run(RandomSource& rng) const {
    const size_t n = static_cast<size_t>(num_qubits_);
    QubitChannel channel(rng);

    // 1. sender preparation
    std::vector<int> sender_bits(n);
    std::vector<Basis> sender_bases(n);
    std::vector<Qubit> in_flight(n);
    for (size_t i = 0; i < n; ++i) {
        sender_bits[i] = rng.bit();
        sender_bases[i] = basis_from_bit(rng.bit());
        in_flight[i] = QubitChannel::prepare(sender_bits[i], sender_bases[i]);
    }

    // 2. attacker chain, in wiring order
    std::vector<int> intercepted(chain_.size(), 0);
    if (!chain_.empty()) {
        for (size_t i = 0; i < n; ++i) {
            bool claimed = false;
            for (size_t a = 0; a < chain_.size(); ++a) {
                if (claimed && options_.interception_mode == InterceptionMode::Exclusive) break;
                if (!chain_[a].should_intercept(rng)) continue;
                in_flight[i] = channel.intercept(in_flight[i], chain_[a]);
                intercepted[a] += 1;
                claimed = true;
            }
        }
    }

    // 3. receiver measurement
    std::vector<int> receiver_bits(n);
    std::vector<Basis> receiver_bases(n);
    for (size_t i = 0; i < n; ++i) {
        receiver_bases[i] = basis_from_bit(rng.bit());
        receiver_bits[i] = channel.measure(in_flight[i], receiver_bases[i]).bit;
    }

    // 4-6. sifting, QBER, classification
    SiftedKeys keys = sift_keys(sender_bits, sender_bases, receiver_bits, receiver_bases);

    LinkResult r;
    r.receiver = receiver_;
    r.num_qubits = num_qubits_;
    r.security_threshold = options_.security_threshold;
    r.mismatches = count_mismatches(keys.sender, keys.receiver);
    r.qber_percent = compute_qber_percent(keys.sender, keys.receiver);
    r.sender_key = std::move(keys.sender);
    r.receiver_key = std::move(keys.receiver);
    r.indeterminate = r.sender_key.empty();
    r.secure = !r.indeterminate && r.qber_percent < options_.security_threshold;
    for (size_t a = 0; a < chain_.size(); ++a) {
        r.attackers_involved.push_back(chain_[a].name());
        r.interceptions.emplace_back(chain_[a].name(), intercepted[a]);
    }

    if (r.indeterminate) {
        std::cerr << "BB84Link: no basis matches survived sifting on link to " << receiver_
                  << " (n=" << num_qubits_ << "); result is indeterminate" << std::endl;
    }
    return r;
}

} // namespace qkdnet
