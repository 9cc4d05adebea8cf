#pragma once
#include "core/Config.hpp"
#include "network/NetworkSimulator.hpp"
#include "network/ScenarioGenerator.hpp"
#include "simulator/BB84Link.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace qkdnet {

// Tally for one attacker name across a batch. Links that failed are skipped;
// indeterminate links count as attacked but carry no QBER.
struct AttackerStats {
    std::string name;
    int links_attacked = 0;
    int links_compromised = 0;
    int links_indeterminate = 0;
    double success_rate = 0.0;   // percent of attacked links left insecure
    double average_qber = 0.0;   // over determinate attacked links

    nlohmann::json to_json() const;
};

struct OverallStats {
    int scenarios_run = 0;
    int scenarios_failed = 0;
    int total_links = 0;
    int secure_links = 0;
    int compromised_links = 0;
    int indeterminate_links = 0;
    int failed_links = 0;
    double security_percentage = 0.0;
    std::vector<AttackerStats> attackers;  // sorted by name

    nlohmann::json to_json() const;
};

struct NetworkRunResult {
    std::vector<ScenarioResult> scenarios;
    OverallStats overall_stats;
    int num_qubits = 0;
    int requested_scenarios = 0;
    uint64_t seed = 0;
    bool terminated_early = false;

    // indices of scenarios that failed as a whole
    std::vector<size_t> failed_scenarios() const;
    nlohmann::json to_json() const;
};

OverallStats summarize(const std::vector<ScenarioResult>& scenarios);

struct SimulatorOptions {
    NetworkOptions network;
    ScenarioGenerator::Bounds bounds;
    std::vector<std::string> receivers = NetworkSimulator::default_receivers(4);
};

/**
 * @brief Entry points consumed by the CLI and any transport layer.
 *
 * Stateless between calls: every run builds its own links and random
 * streams from the seed it is given (or a fresh one when none is).
 */
class Simulator {
public:
    explicit Simulator(SimulatorOptions options = {});

    LinkResult run_single_link(int num_qubits, const std::vector<AttackerProfile>& chain,
                               std::optional<uint64_t> seed = std::nullopt) const;

    ScenarioResult run_network_scenario(int num_qubits, const std::vector<std::string>& receivers,
                                        const ScenarioSpec& spec,
                                        std::optional<uint64_t> seed = std::nullopt) const;

    // should_stop is consulted before each scenario with the number completed so far
    NetworkRunResult run_random_batch(int num_qubits, int num_scenarios,
                                      std::optional<uint64_t> seed = std::nullopt,
                                      std::optional<AttackArchetype> pinned = std::nullopt,
                                      const std::function<bool(size_t)>& should_stop = {}) const;

    // Load a scenario description (receivers, attackers, assignments) from JSON.
    // receivers is replaced when the file lists its own.
    static ScenarioSpec load_scenario_file(const std::string& path, std::vector<std::string>& receivers);

    // Dispatch a full configuration to the matching entry point.
    nlohmann::json execute(const SimulationConfig& cfg) const;

    static SimulatorOptions options_from_config(const SimulationConfig& cfg);

    NetworkSimulator& network() { return network_; }
    const ScenarioGenerator& generator() const { return generator_; }
    const SimulatorOptions& options() const { return options_; }

private:
    SimulatorOptions options_;
    NetworkSimulator network_;
    ScenarioGenerator generator_;
};

} // namespace qkdnet
