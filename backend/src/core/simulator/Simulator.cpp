#include "simulator/Simulator.hpp"
#include "analysis/ThreatAnalysis.hpp"
#include "core/BuildInfo.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/RandomSource.hpp"
#include <fstream>
#include <iostream>
#include <map>

using nlohmann::json;

namespace qkdnet {

json AttackerStats::to_json() const {
    return {
        {"name", name},
        {"links_attacked", links_attacked},
        {"links_compromised", links_compromised},
        {"links_indeterminate", links_indeterminate},
        {"success_rate", success_rate},
        {"average_qber", average_qber}
    };
}

json OverallStats::to_json() const {
    return {
        {"scenarios_run", scenarios_run},
        {"scenarios_failed", scenarios_failed},
        {"total_links", total_links},
        {"secure_links", secure_links},
        {"compromised_links", compromised_links},
        {"indeterminate_links", indeterminate_links},
        {"failed_links", failed_links},
        {"security_percentage", security_percentage}
    };
}

OverallStats summarize(const std::vector<ScenarioResult>& scenarios) {
    OverallStats s;
    for (const auto& sc : scenarios) {
        s.scenarios_run += 1;
        if (sc.failed()) s.scenarios_failed += 1;
        s.total_links += static_cast<int>(sc.total_links());
        s.secure_links += sc.secure_link_count;
        s.compromised_links += sc.compromised_link_count;
        s.indeterminate_links += sc.indeterminate_link_count;
        s.failed_links += sc.failed_link_count;
    }
    if (s.total_links > 0) s.security_percentage = 100.0 * s.secure_links / s.total_links;

    std::map<std::string, AttackerStats> by_name;
    std::map<std::string, double> qber_sum;
    for (const auto& sc : scenarios) {
        for (const auto& l : sc.link_results) {
            if (l.failed()) continue;
            for (const auto& name : l.attackers_involved) {
                AttackerStats& a = by_name[name];
                a.name = name;
                a.links_attacked += 1;
                if (l.indeterminate) {
                    a.links_indeterminate += 1;
                    continue;
                }
                if (l.compromised()) a.links_compromised += 1;
                qber_sum[name] += l.qber_percent;
            }
        }
    }
    for (auto& [name, a] : by_name) {
        a.success_rate = 100.0 * a.links_compromised / a.links_attacked;
        int determinate = a.links_attacked - a.links_indeterminate;
        if (determinate > 0) a.average_qber = qber_sum[name] / determinate;
        s.attackers.push_back(a);
    }
    return s;
}

std::vector<size_t> NetworkRunResult::failed_scenarios() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < scenarios.size(); ++i) {
        if (scenarios[i].failed()) out.push_back(i);
    }
    return out;
}

json NetworkRunResult::to_json() const {
    json sc = json::array();
    for (const auto& s : scenarios) sc.push_back(s.to_json());
    json attacker_stats = json::array();
    for (const auto& a : overall_stats.attackers) attacker_stats.push_back(a.to_json());
    return {
        {"num_qubits", num_qubits},
        {"requested_scenarios", requested_scenarios},
        {"seed", seed},
        {"terminated_early", terminated_early},
        {"scenarios", sc},
        {"failed_scenarios", failed_scenarios()},
        {"overall_stats", overall_stats.to_json()},
        {"attacker_stats", attacker_stats},
        {"meta", buildinfo::meta()}
    };
}

Simulator::Simulator(SimulatorOptions options)
: options_(std::move(options)), network_(options_.network), generator_(options_.bounds) {
    NetworkSimulator::validate_receivers(options_.receivers);
}

SimulatorOptions Simulator::options_from_config(const SimulationConfig& cfg) {
    SimulatorOptions o;
    o.network.link.security_threshold = cfg.security_threshold;
    o.network.link.interception_mode = parse_interception_mode(cfg.interception_mode);
    o.network.parallel_links = cfg.parallel_links;
    o.network.worker_threads = static_cast<unsigned>(cfg.worker_threads < 0 ? 0 : cfg.worker_threads);
    o.receivers = cfg.receivers.empty() ? NetworkSimulator::default_receivers(cfg.num_receivers) : cfg.receivers;
    return o;
}

LinkResult Simulator::run_single_link(int num_qubits, const std::vector<AttackerProfile>& chain,
                                      std::optional<uint64_t> seed) const {
    std::vector<AttackModel> models;
    models.reserve(chain.size());
    for (const auto& p : chain) models.emplace_back(p);
    BB84Link link(num_qubits, std::move(models), options_.network.link, options_.receivers.front());
    Mt19937RandomSource rng(resolve_seed(seed));
    return link.run(rng);
}

ScenarioResult Simulator::run_network_scenario(int num_qubits, const std::vector<std::string>& receivers,
                                               const ScenarioSpec& spec, std::optional<uint64_t> seed) const {
    return network_.run(num_qubits, receivers, spec, resolve_seed(seed));
}

NetworkRunResult Simulator::run_random_batch(int num_qubits, int num_scenarios, std::optional<uint64_t> seed,
                                             std::optional<AttackArchetype> pinned,
                                             const std::function<bool(size_t)>& should_stop) const {
    validate_qubit_count(num_qubits);
    if (num_scenarios <= 0) {
        throw ConfigurationError(errors::E1010_SCENARIO_COUNT, "num_scenarios", errors::D1010_SCENARIOS_NOT_POSITIVE);
    }

    NetworkRunResult out;
    out.num_qubits = num_qubits;
    out.requested_scenarios = num_scenarios;
    out.seed = resolve_seed(seed);

    Mt19937RandomSource gen_rng(derive_seed(out.seed, 0));
    for (int k = 0; k < num_scenarios; ++k) {
        if (should_stop && should_stop(static_cast<size_t>(k))) {
            std::cerr << "Simulator: batch stopped after " << k << " of " << num_scenarios << " scenarios" << std::endl;
            out.terminated_early = true;
            break;
        }
        const uint64_t scenario_seed = derive_seed(out.seed, static_cast<uint64_t>(k) + 1);
        try {
            ScenarioSpec spec = generator_.next(options_.receivers, gen_rng, pinned);
            out.scenarios.push_back(network_.run(num_qubits, options_.receivers, spec, scenario_seed));
        } catch (const std::exception& e) {
            std::string name = pinned ? archetype_name(*pinned) : "scenario_" + std::to_string(k + 1);
            std::string msg = errors::format_E1110_scenario_failed(name, e.what());
            std::cerr << "Simulator: " << msg << std::endl;
            out.scenarios.push_back(ScenarioResult::failure(name, pinned, scenario_seed, msg));
        }
    }
    out.overall_stats = summarize(out.scenarios);
    return out;
}

ScenarioSpec Simulator::load_scenario_file(const std::string& path, std::vector<std::string>& receivers) {
    std::ifstream f(path);
    if (!f) {
        throw ConfigurationError(errors::E1009_CONFIG_FILE, "scenario_file",
                                 std::string(errors::D1009_OPEN_FAILED) + " '" + path + "'");
    }
    json j;
    try {
        j = json::parse(f);
    } catch (const json::parse_error& e) {
        throw ConfigurationError(errors::E1009_CONFIG_FILE, "scenario_file",
                                 std::string(errors::D1009_PARSE_FAILED) + " '" + path + "': " + e.what());
    }
    ScenarioSpec spec = ScenarioSpec::from_json(j);
    if (j.contains("receivers")) {
        try {
            receivers = j["receivers"].get<std::vector<std::string>>();
        } catch (const json::exception& e) {
            throw ConfigurationError(errors::E1009_CONFIG_FILE, "receivers",
                                     std::string(errors::D1009_BAD_FIELD) + " (" + e.what() + ")");
        }
    }
    NetworkSimulator::validate_receivers(receivers);
    NetworkSimulator::validate_spec(spec, receivers);
    return spec;
}

json Simulator::execute(const SimulationConfig& cfg) const {
    cfg.validate();
    json out;
    out["mode"] = mode_name(cfg.mode);

    switch (cfg.mode) {
        case RunMode::Single: {
            std::vector<AttackerProfile> chain;
            for (int i = 0; i < cfg.num_attackers; ++i) chain.push_back({attacker_name(i), cfg.intercept_rate});
            out["result"] = run_single_link(cfg.num_qubits, chain, cfg.seed).to_json();
            break;
        }
        case RunMode::Network: {
            std::vector<std::string> receivers = options_.receivers;
            ScenarioSpec spec;
            const uint64_t base = resolve_seed(cfg.seed);
            if (!cfg.scenario_file.empty()) {
                spec = load_scenario_file(cfg.scenario_file, receivers);
            } else {
                Mt19937RandomSource placement(derive_seed(base, 0));
                spec = generator_.build(parse_archetype(cfg.attack_scenario), receivers,
                                        cfg.num_attackers, cfg.intercept_rate, placement);
            }
            out["scenario"] = spec.to_json();
            out["result"] = run_network_scenario(cfg.num_qubits, receivers, spec, derive_seed(base, 1)).to_json();
            break;
        }
        case RunMode::Random:
            out["result"] = run_random_batch(cfg.num_qubits, cfg.num_scenarios, cfg.seed).to_json();
            break;
        case RunMode::Threat: {
            ThreatAnalyzer analyzer(options_.network.link);
            json rows = json::array();
            for (const auto& r : analyzer.run_threat_analysis(cfg.analysis_qubits, cfg.num_trials, cfg.seed)) {
                rows.push_back(r.to_json());
            }
            out["result"] = { {"threat_scenarios", rows} };
            break;
        }
        case RunMode::Correlation: {
            ThreatAnalyzer analyzer(options_.network.link);
            out["result"] = analyzer.run_correlation_sweep(cfg.analysis_qubits, cfg.num_trials,
                                                           cfg.sweep_step, cfg.seed).to_json();
            break;
        }
    }
    return out;
}

} // namespace qkdnet
