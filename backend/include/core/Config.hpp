#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace qkdnet {

enum class RunMode {
    Single,      // one link, attacker chain from num_attackers / intercept_rate
    Network,     // one scenario over the receiver set
    Random,      // batch of generated scenarios
    Threat,      // threat profile analysis
    Correlation  // intercept rate vs QBER sweep
};

const char* mode_name(RunMode m);
RunMode parse_mode(const std::string& name);

struct SimulationConfig {
    RunMode mode = RunMode::Random;
    int num_qubits = 10;
    int num_scenarios = 5;
    int num_receivers = 4;
    std::vector<std::string> receivers; // empty: default receiver set of num_receivers
    std::string attack_scenario = "single_attacker_multiple_targets";
    int num_attackers = 1;
    double intercept_rate = 0.5;
    double security_threshold = 11.0;
    std::optional<uint64_t> seed;
    std::string interception_mode = "independent";
    bool parallel_links = false;
    int worker_threads = 0;
    int num_trials = 10;
    int analysis_qubits = 100;
    double sweep_step = 0.05;
    std::string scenario_file;

    // overlay the keys present in j; throws ConfigurationError on mistyped fields
    void apply_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    // core ranges only; product bounds are the boundary layer's business
    void validate() const;

    static SimulationConfig load_file(const std::string& path);
    // path from QKDNET_CONFIG, if set
    static std::optional<std::string> path_from_environment();
};

// product limits applied by the CLI: num_qubits 1-20, num_scenarios 1-10
void check_product_bounds(const SimulationConfig& cfg);

} // namespace qkdnet
