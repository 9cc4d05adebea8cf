#include "network/NetworkSimulator.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/RandomSource.hpp"
#include <algorithm>
#include <iostream>
#include <set>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace asio = boost::asio;
using nlohmann::json;

namespace qkdnet {

json ScenarioResult::to_json() const {
    json j;
    j["scenario_name"] = scenario_name;
    j["archetype"] = archetype ? json(archetype_name(*archetype)) : json(nullptr);
    j["seed"] = seed;
    json atk = json::array();
    for (const auto& a : attackers) atk.push_back(a.to_json());
    j["attackers"] = atk;
    json links = json::array();
    for (const auto& l : link_results) links.push_back(l.to_json());
    j["link_results"] = links;
    j["total_links"] = total_links();
    j["secure_link_count"] = secure_link_count;
    j["compromised_link_count"] = compromised_link_count;
    j["indeterminate_link_count"] = indeterminate_link_count;
    j["failed_link_count"] = failed_link_count;
    j["security_percentage"] = security_percentage;
    j["failed"] = failed();
    if (error) j["error"] = *error;
    return j;
}

ScenarioResult ScenarioResult::aggregate(const ScenarioSpec& spec, std::vector<LinkResult> links, uint64_t seed) {
    ScenarioResult s;
    s.scenario_name = spec.name;
    s.archetype = spec.archetype;
    s.attackers = spec.attackers;
    s.seed = seed;
    s.link_results = std::move(links);
    for (const auto& l : s.link_results) {
        if (l.failed()) s.failed_link_count++;
        else if (l.indeterminate) s.indeterminate_link_count++;
        else if (l.secure) s.secure_link_count++;
        else s.compromised_link_count++;
    }
    if (!s.link_results.empty()) {
        s.security_percentage = 100.0 * s.secure_link_count / static_cast<double>(s.link_results.size());
    }
    return s;
}

ScenarioResult ScenarioResult::failure(const std::string& name, std::optional<AttackArchetype> archetype,
                                       uint64_t seed, const std::string& message) {
    ScenarioResult s;
    s.scenario_name = name;
    s.archetype = archetype;
    s.seed = seed;
    s.error = message;
    return s;
}

NetworkSimulator::NetworkSimulator(NetworkOptions options)
: options_(options) {
    validate_threshold(options_.link.security_threshold);
}

void NetworkSimulator::set_link_runner(LinkRunner runner) {
    runner_ = std::move(runner);
}

std::vector<std::string> NetworkSimulator::default_receivers(int count) {
    static const char* kNames[] = {"Bob", "Charlie", "Dave", "Diana"};
    if (count <= 0) {
        throw ConfigurationError(errors::E1007_RECEIVER_SET, "num_receivers", errors::D1007_RECEIVERS_EMPTY);
    }
    std::vector<std::string> out;
    out.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        if (i < 4) out.emplace_back(kNames[i]);
        else out.push_back("Receiver_" + std::to_string(i + 1));
    }
    return out;
}

void NetworkSimulator::validate_receivers(const std::vector<std::string>& receivers) {
    if (receivers.empty()) {
        throw ConfigurationError(errors::E1007_RECEIVER_SET, "receivers", errors::D1007_RECEIVERS_EMPTY);
    }
    std::set<std::string> seen;
    for (const auto& r : receivers) {
        if (r.empty() || !seen.insert(r).second) {
            throw ConfigurationError(errors::E1007_RECEIVER_SET, "receivers",
                                     std::string(errors::D1007_RECEIVER_DUPLICATE) + " '" + r + "'");
        }
    }
}

void NetworkSimulator::validate_spec(const ScenarioSpec& spec, const std::vector<std::string>& receivers) {
    std::set<std::string> attackers;
    for (const auto& a : spec.attackers) {
        if (!attackers.insert(a.name).second) {
            throw ConfigurationError(errors::E1004_UNKNOWN_ATTACKER, "attackers",
                                     std::string(errors::D1004_DUPLICATE_ATTACKER) + " '" + a.name + "'");
        }
        validate_probability(a.intercept_probability, "intercept_probability[" + a.name + "]");
    }
    for (const auto& [receiver, chain] : spec.assignments) {
        if (std::find(receivers.begin(), receivers.end(), receiver) == receivers.end()) {
            throw ConfigurationError(errors::E1003_UNKNOWN_RECEIVER, "assignments",
                                     std::string(errors::D1003_UNKNOWN_RECEIVER) + " '" + receiver + "'");
        }
        for (const auto& name : chain) {
            if (!attackers.count(name)) {
                throw ConfigurationError(errors::E1004_UNKNOWN_ATTACKER, "assignments[" + receiver + "]",
                                         std::string(errors::D1004_UNKNOWN_ATTACKER) + " '" + name + "'");
            }
        }
    }
}

LinkResult NetworkSimulator::run_link(const BB84Link& link, uint64_t seed) const {
    Mt19937RandomSource rng(seed);
    if (runner_) return runner_(link, rng);
    return link.run(rng);
}

ScenarioResult NetworkSimulator::run(int num_qubits, const std::vector<std::string>& receivers,
                                     const ScenarioSpec& spec, uint64_t seed) const {
    validate_qubit_count(num_qubits);
    validate_receivers(receivers);
    validate_spec(spec, receivers);

    std::unordered_map<std::string, AttackerProfile> profiles;
    for (const auto& a : spec.attackers) profiles[a.name] = a;

    std::vector<BB84Link> links;
    links.reserve(receivers.size());
    for (const auto& r : receivers) {
        std::vector<AttackModel> chain;
        for (const auto& name : spec.chain_for(r)) chain.emplace_back(profiles.at(name));
        links.emplace_back(num_qubits, std::move(chain), options_.link, r);
    }

    std::vector<LinkResult> results(links.size());
    auto record_failure = [&](size_t i, std::string_view what) {
        const BB84Link& link = links[i];
        std::vector<std::string> names;
        for (const auto& m : link.chain()) names.push_back(m.name());
        std::string msg = errors::format_E1100_link_failed(link.receiver(), what);
        std::cerr << "NetworkSimulator: " << msg << std::endl;
        results[i] = LinkResult::failure(link.receiver(), num_qubits, names,
                                         options_.link.security_threshold, msg);
    };
    auto run_one = [&](size_t i) {
        try {
            results[i] = run_link(links[i], derive_seed(seed, i));
        } catch (const std::exception& e) {
            record_failure(i, e.what());
        } catch (...) {
            // non-std throws from a custom runner
            record_failure(i, "unknown exception");
        }
    };

    if (options_.parallel_links && links.size() > 1) {
        unsigned threads = options_.worker_threads;
        if (threads == 0) threads = std::max(1u, std::thread::hardware_concurrency());
        threads = std::min<unsigned>(threads, static_cast<unsigned>(links.size()));
        asio::thread_pool pool(threads);
        for (size_t i = 0; i < links.size(); ++i) {
            asio::post(pool, [&run_one, i]() { run_one(i); });
        }
        pool.join();
    } else {
        for (size_t i = 0; i < links.size(); ++i) run_one(i);
    }

    return ScenarioResult::aggregate(spec, std::move(results), seed);
}

} // namespace qkdnet
