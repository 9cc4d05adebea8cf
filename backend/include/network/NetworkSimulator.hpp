#pragma once
#include "network/ScenarioGenerator.hpp"
#include "simulator/BB84Link.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace qkdnet {

class RandomSource;

struct ScenarioResult {
    std::string scenario_name;
    std::optional<AttackArchetype> archetype;
    std::vector<AttackerProfile> attackers;
    std::vector<LinkResult> link_results;
    int secure_link_count = 0;
    int compromised_link_count = 0;
    int indeterminate_link_count = 0;
    int failed_link_count = 0;
    double security_percentage = 0.0;
    uint64_t seed = 0;
    // set when the scenario as a whole could not run
    std::optional<std::string> error;

    size_t total_links() const { return link_results.size(); }
    bool failed() const { return error.has_value(); }

    nlohmann::json to_json() const;

    // counts every link as exactly one of secure / compromised / indeterminate / failed
    static ScenarioResult aggregate(const ScenarioSpec& spec, std::vector<LinkResult> links, uint64_t seed);
    static ScenarioResult failure(const std::string& name, std::optional<AttackArchetype> archetype,
                                  uint64_t seed, const std::string& message);
};

struct NetworkOptions {
    LinkOptions link;
    bool parallel_links = false;
    unsigned worker_threads = 0; // 0: hardware concurrency
};

/**
 * @brief Star topology: one sender, a fixed receiver set, attackers per scenario.
 *
 * Each receiver gets its own BB84Link with the chain the scenario assigns to
 * it and its own random stream derive_seed(seed, receiver_index), so results
 * are identical whether links run sequentially or on the thread pool.
 */
class NetworkSimulator {
public:
    using LinkRunner = std::function<LinkResult(const BB84Link&, RandomSource&)>;

    explicit NetworkSimulator(NetworkOptions options = {});

    const NetworkOptions& options() const { return options_; }

    // replaces the per-link protocol run; an empty runner restores the default
    void set_link_runner(LinkRunner runner);

    /**
     * @brief Run every link of one scenario and aggregate the results.
     *
     * Configuration problems (bad counts, dangling receiver or attacker names)
     * throw before any link runs. A link that throws while running is recorded
     * as failed and the others still complete.
     */
    ScenarioResult run(int num_qubits, const std::vector<std::string>& receivers,
                       const ScenarioSpec& spec, uint64_t seed) const;

    // Bob, Charlie, Dave, Diana, then Receiver_5, Receiver_6, ...
    static std::vector<std::string> default_receivers(int count);
    static void validate_receivers(const std::vector<std::string>& receivers);
    static void validate_spec(const ScenarioSpec& spec, const std::vector<std::string>& receivers);

private:
    LinkResult run_link(const BB84Link& link, uint64_t seed) const;

    NetworkOptions options_;
    LinkRunner runner_;
};

} // namespace qkdnet
