#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace qkdnet::errors {

// 1000-1099: configuration errors (fail fast, never clamped)
// 1100-1199: run-time link / scenario failures (recorded, batch continues)

inline constexpr int E1000_CONFIGURATION = 1000;
inline constexpr int E1001_QUBIT_COUNT = 1001;
inline constexpr int E1002_PROBABILITY = 1002;
inline constexpr int E1003_UNKNOWN_RECEIVER = 1003;
inline constexpr int E1004_UNKNOWN_ATTACKER = 1004;
inline constexpr int E1005_UNKNOWN_ARCHETYPE = 1005;
inline constexpr int E1006_THRESHOLD = 1006;
inline constexpr int E1007_RECEIVER_SET = 1007;
inline constexpr int E1008_ATTACKER_COUNT = 1008;
inline constexpr int E1009_CONFIG_FILE = 1009;
inline constexpr int E1010_SCENARIO_COUNT = 1010;
inline constexpr int E1011_PRODUCT_BOUNDS = 1011;

inline constexpr int E1100_LINK_FAILED = 1100;
inline constexpr int E1110_SCENARIO_FAILED = 1110;

inline constexpr const char* MSG_CONFIGURATION = ": Invalid configuration: ";
inline constexpr const char* MSG_E1100_PREFIX = "Error 1100: Link run failed: ";
inline constexpr const char* MSG_E1110_PREFIX = "Error 1110: Scenario run failed: ";

inline constexpr const char* D1001_QUBITS_NOT_POSITIVE = "num_qubits must be > 0";
inline constexpr const char* D1002_PROBABILITY_RANGE = "probability must be within [0, 1]";
inline constexpr const char* D1003_UNKNOWN_RECEIVER = "unknown receiver";
inline constexpr const char* D1004_UNKNOWN_ATTACKER = "unknown attacker";
inline constexpr const char* D1004_DUPLICATE_ATTACKER = "duplicate attacker name";
inline constexpr const char* D1005_UNKNOWN_ARCHETYPE = "unknown attack scenario";
inline constexpr const char* D1006_THRESHOLD_RANGE = "security threshold must be within (0, 100]";
inline constexpr const char* D1007_RECEIVERS_EMPTY = "receiver set must not be empty";
inline constexpr const char* D1007_RECEIVER_DUPLICATE = "duplicate receiver name";
inline constexpr const char* D1008_ATTACKERS_NEGATIVE = "num_attackers must be >= 0";
inline constexpr const char* D1008_ATTACKERS_REQUIRED = "attack scenario requires attackers";
inline constexpr const char* D1008_EXACTLY_ONE = "single-attacker scenario requires exactly 1 attacker";
inline constexpr const char* D1008_ATTACKERS_EXCEED_RECEIVERS = "more single-target attackers than receivers";
inline constexpr const char* D1008_TOO_FEW_FOR_MULTI = "multiple-attacker scenario requires at least 2 attackers";
inline constexpr const char* D1008_TOO_FEW_RECEIVERS = "multiple-target scenario requires at least 2 receivers";
inline constexpr const char* D1009_OPEN_FAILED = "unable to open file";
inline constexpr const char* D1009_PARSE_FAILED = "malformed json";
inline constexpr const char* D1009_BAD_FIELD = "field has wrong type";
inline constexpr const char* D1010_SCENARIOS_NOT_POSITIVE = "num_scenarios must be > 0";
inline constexpr const char* D1010_TRIALS_NOT_POSITIVE = "num_trials must be > 0";
inline constexpr const char* D1010_STEP_RANGE = "sweep step must be within (0, 1]";
inline constexpr const char* D1010_THREADS_NEGATIVE = "worker_threads must be >= 0";
inline constexpr const char* D1011_QUBITS_BOUND = "num_qubits must be within [1, 20]";
inline constexpr const char* D1011_SCENARIOS_BOUND = "num_scenarios must be within [1, 10]";
inline constexpr const char* D1011_UNKNOWN_MODE = "unknown mode";

inline std::string code_string(int code) {
    return std::to_string(code);
}

inline std::string format_with_prefix(const char* prefix, std::string_view detail) {
    std::string out;
    out.reserve(std::char_traits<char>::length(prefix) + detail.size());
    out.append(prefix);
    out.append(detail.data(), detail.size());
    return out;
}

// "Error <code>: Invalid configuration: <parameter>: <detail>" for any 10xx code.
inline std::string format_configuration(int code, std::string_view parameter, std::string_view detail) {
    std::string prefix = "Error " + code_string(code) + MSG_CONFIGURATION;
    std::string d;
    d.append(parameter.data(), parameter.size());
    d.append(": ");
    d.append(detail.data(), detail.size());
    return format_with_prefix(prefix.c_str(), d);
}

inline std::string format_E1100_link_failed(std::string_view receiver, std::string_view what) {
    std::string d;
    d.append(receiver.data(), receiver.size());
    d.append(": ");
    d.append(what.data(), what.size());
    return format_with_prefix(MSG_E1100_PREFIX, d);
}

inline std::string format_E1110_scenario_failed(std::string_view scenario, std::string_view what) {
    std::string d;
    d.append(scenario.data(), scenario.size());
    d.append(": ");
    d.append(what.data(), what.size());
    return format_with_prefix(MSG_E1110_PREFIX, d);
}

} // namespace qkdnet::errors

namespace qkdnet {

// Raised for invalid ranges and dangling references. Carries the catalog code
// and the name of the offending parameter.
class ConfigurationError : public std::runtime_error {
public:
    ConfigurationError(int code, std::string parameter, std::string_view detail)
    : std::runtime_error(errors::format_configuration(code, parameter, detail)),
      code_(code), parameter_(std::move(parameter)) {}

    int code() const noexcept { return code_; }
    const std::string& parameter() const noexcept { return parameter_; }

private:
    int code_;
    std::string parameter_;
};

} // namespace qkdnet
