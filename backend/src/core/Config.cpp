#include "core/Config.hpp"
#include "core/ErrorCatalog.hpp"
#include "network/ScenarioGenerator.hpp"
#include "simulator/BB84Link.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>

using nlohmann::json;

namespace qkdnet {

const char* mode_name(RunMode m) {
    switch (m) {
        case RunMode::Single: return "single";
        case RunMode::Network: return "network";
        case RunMode::Random: return "random";
        case RunMode::Threat: return "threat";
        case RunMode::Correlation: return "correlation";
    }
    return "unknown";
}

RunMode parse_mode(const std::string& name) {
    if (name == "single") return RunMode::Single;
    if (name == "network") return RunMode::Network;
    if (name == "random") return RunMode::Random;
    if (name == "threat") return RunMode::Threat;
    if (name == "correlation") return RunMode::Correlation;
    throw ConfigurationError(errors::E1000_CONFIGURATION, "mode",
                             std::string(errors::D1011_UNKNOWN_MODE) + " '" + name + "'");
}

void SimulationConfig::apply_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigurationError(errors::E1009_CONFIG_FILE, "config", errors::D1009_BAD_FIELD);
    }
    std::string field;
    try {
        for (auto it = j.begin(); it != j.end(); ++it) {
            field = it.key();
            const json& v = it.value();
            if (field == "mode") mode = parse_mode(v.get<std::string>());
            else if (field == "num_qubits") num_qubits = v.get<int>();
            else if (field == "num_scenarios") num_scenarios = v.get<int>();
            else if (field == "num_receivers") num_receivers = v.get<int>();
            else if (field == "receivers") receivers = v.get<std::vector<std::string>>();
            else if (field == "attack_scenario") attack_scenario = v.get<std::string>();
            else if (field == "num_attackers") num_attackers = v.get<int>();
            else if (field == "intercept_rate") intercept_rate = v.get<double>();
            else if (field == "security_threshold") security_threshold = v.get<double>();
            else if (field == "seed") {
                if (v.is_null()) seed.reset();
                else seed = v.get<uint64_t>();
            }
            else if (field == "interception_mode") interception_mode = v.get<std::string>();
            else if (field == "parallel_links") parallel_links = v.get<bool>();
            else if (field == "worker_threads") worker_threads = v.get<int>();
            else if (field == "num_trials") num_trials = v.get<int>();
            else if (field == "analysis_qubits") analysis_qubits = v.get<int>();
            else if (field == "sweep_step") sweep_step = v.get<double>();
            else if (field == "scenario_file") scenario_file = v.get<std::string>();
            else std::cerr << "SimulationConfig: ignoring unknown key '" << field << "'" << std::endl;
        }
    } catch (const json::exception& e) {
        throw ConfigurationError(errors::E1009_CONFIG_FILE, field,
                                 std::string(errors::D1009_BAD_FIELD) + " (" + e.what() + ")");
    }
}

json SimulationConfig::to_json() const {
    return {
        {"mode", mode_name(mode)},
        {"num_qubits", num_qubits},
        {"num_scenarios", num_scenarios},
        {"num_receivers", num_receivers},
        {"receivers", receivers},
        {"attack_scenario", attack_scenario},
        {"num_attackers", num_attackers},
        {"intercept_rate", intercept_rate},
        {"security_threshold", security_threshold},
        {"seed", seed ? json(*seed) : json(nullptr)},
        {"interception_mode", interception_mode},
        {"parallel_links", parallel_links},
        {"worker_threads", worker_threads},
        {"num_trials", num_trials},
        {"analysis_qubits", analysis_qubits},
        {"sweep_step", sweep_step},
        {"scenario_file", scenario_file}
    };
}

void SimulationConfig::validate() const {
    validate_qubit_count(num_qubits);
    validate_qubit_count(analysis_qubits);
    if (num_scenarios <= 0) {
        throw ConfigurationError(errors::E1010_SCENARIO_COUNT, "num_scenarios", errors::D1010_SCENARIOS_NOT_POSITIVE);
    }
    if (receivers.empty() && num_receivers <= 0) {
        throw ConfigurationError(errors::E1007_RECEIVER_SET, "num_receivers", errors::D1007_RECEIVERS_EMPTY);
    }
    parse_archetype(attack_scenario);
    if (num_attackers < 0) {
        throw ConfigurationError(errors::E1008_ATTACKER_COUNT, "num_attackers", errors::D1008_ATTACKERS_NEGATIVE);
    }
    validate_probability(intercept_rate, "intercept_rate");
    validate_threshold(security_threshold);
    parse_interception_mode(interception_mode);
    if (worker_threads < 0) {
        throw ConfigurationError(errors::E1010_SCENARIO_COUNT, "worker_threads", errors::D1010_THREADS_NEGATIVE);
    }
    if (num_trials <= 0) {
        throw ConfigurationError(errors::E1010_SCENARIO_COUNT, "num_trials", errors::D1010_TRIALS_NOT_POSITIVE);
    }
    if (!(sweep_step > 0.0) || sweep_step > 1.0) {
        throw ConfigurationError(errors::E1010_SCENARIO_COUNT, "sweep_step", errors::D1010_STEP_RANGE);
    }
}

SimulationConfig SimulationConfig::load_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        throw ConfigurationError(errors::E1009_CONFIG_FILE, "config",
                                 std::string(errors::D1009_OPEN_FAILED) + " '" + path + "'");
    }
    json j;
    try {
        j = json::parse(f);
    } catch (const json::parse_error& e) {
        throw ConfigurationError(errors::E1009_CONFIG_FILE, "config",
                                 std::string(errors::D1009_PARSE_FAILED) + " '" + path + "': " + e.what());
    }
    SimulationConfig cfg;
    cfg.apply_json(j);
    return cfg;
}

std::optional<std::string> SimulationConfig::path_from_environment() {
    const char* env = std::getenv("QKDNET_CONFIG");
    if (env && *env) return std::string(env);
    return std::nullopt;
}

void check_product_bounds(const SimulationConfig& cfg) {
    if (cfg.num_qubits < 1 || cfg.num_qubits > 20) {
        throw ConfigurationError(errors::E1011_PRODUCT_BOUNDS, "num_qubits", errors::D1011_QUBITS_BOUND);
    }
    if (cfg.mode == RunMode::Random && (cfg.num_scenarios < 1 || cfg.num_scenarios > 10)) {
        throw ConfigurationError(errors::E1011_PRODUCT_BOUNDS, "num_scenarios", errors::D1011_SCENARIOS_BOUND);
    }
}

} // namespace qkdnet
