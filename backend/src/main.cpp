#include "core/BuildInfo.hpp"
#include "core/Config.hpp"
#include "core/ErrorCatalog.hpp"
#include "simulator/Simulator.hpp"
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using nlohmann::json;

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -h, --help               Show this help message and exit\n"
              << "      --version            Print version and build info\n"
              << "  -m, --mode MODE          single | network | random | threat | correlation (default random)\n"
              << "  -q, --qubits N           Qubits per link (1-20)\n"
              << "  -n, --scenarios K        Scenarios in a random batch (1-10)\n"
              << "  -r, --receivers N        Size of the default receiver set (Bob, Charlie, Dave, Diana, ...)\n"
              << "      --receiver-names A,B Explicit receiver names\n"
              << "  -a, --scenario NAME      Attack scenario for network mode\n"
              << "      --attackers M        Number of attackers\n"
              << "      --rate R             Intercept rate, 0-1 (values above 1 are read as percent)\n"
              << "      --threshold T        QBER security threshold in percent (default 11)\n"
              << "  -s, --seed S             Seed for a reproducible run\n"
              << "      --interception MODE  independent | exclusive\n"
              << "      --parallel           Run links of a scenario on a thread pool\n"
              << "      --threads N          Worker threads for --parallel (0: hardware)\n"
              << "      --trials N           Trials per point for threat / correlation\n"
              << "      --analysis-qubits N  Qubits per trial for threat / correlation (default 100)\n"
              << "      --step X             Intercept rate step for correlation (default 0.05)\n"
              << "  -c, --config PATH        JSON config file (also QKDNET_CONFIG)\n"
              << "      --scenario-file PATH JSON scenario for network mode\n"
              << "      --no-bounds          Skip product limits on qubits and scenarios\n"
              << std::flush;
}

static void print_error(int code, const std::string& parameter, const std::string& message) {
    json err = { {"error", { {"code", code}, {"parameter", parameter}, {"message", message} }} };
    std::cout << err.dump(2) << std::endl;
}

static json parse_number(const std::string& key, const std::string& text, bool integral) {
    try {
        size_t used = 0;
        if (integral) {
            long long v = std::stoll(text, &used);
            if (used == text.size()) return json(v);
        } else {
            double v = std::stod(text, &used);
            if (used == text.size()) return json(v);
        }
    } catch (const std::exception&) {
        // fall through to the configuration error below
    }
    throw qkdnet::ConfigurationError(qkdnet::errors::E1000_CONFIGURATION, key, "not a number: '" + text + "'");
}

static std::vector<std::string> split_names(const std::string& text) {
    std::vector<std::string> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    // split --flag=value into two tokens
    std::vector<std::string> tokens;
    for (const auto& a : args) {
        auto eq = a.find('=');
        if (a.rfind("--", 0) == 0 && eq != std::string::npos) {
            tokens.push_back(a.substr(0, eq));
            tokens.push_back(a.substr(eq + 1));
        } else {
            tokens.push_back(a);
        }
    }

    try {
        std::string config_path;
        bool bounds = true;
        json overlay = json::object();

        for (size_t i = 0; i < tokens.size(); ++i) {
            const std::string& a = tokens[i];
            auto value = [&]() -> std::string {
                if (i + 1 >= tokens.size()) {
                    throw qkdnet::ConfigurationError(qkdnet::errors::E1000_CONFIGURATION, a, "missing value");
                }
                return tokens[++i];
            };

            if (a == "-h" || a == "--help") { print_usage(argv[0]); return 0; }
            else if (a == "--version") {
                std::cout << qkdnet::buildinfo::version_line("qkdnet_sim") << std::endl;
                return 0;
            }
            else if (a == "-m" || a == "--mode") overlay["mode"] = value();
            else if (a == "-q" || a == "--qubits") overlay["num_qubits"] = parse_number("num_qubits", value(), true);
            else if (a == "-n" || a == "--scenarios") overlay["num_scenarios"] = parse_number("num_scenarios", value(), true);
            else if (a == "-r" || a == "--receivers") overlay["num_receivers"] = parse_number("num_receivers", value(), true);
            else if (a == "--receiver-names") overlay["receivers"] = split_names(value());
            else if (a == "-a" || a == "--scenario") overlay["attack_scenario"] = value();
            else if (a == "--attackers") overlay["num_attackers"] = parse_number("num_attackers", value(), true);
            else if (a == "--rate") {
                double r = parse_number("intercept_rate", value(), false).get<double>();
                // the dashboard sends percentages
                overlay["intercept_rate"] = r > 1.0 ? r / 100.0 : r;
            }
            else if (a == "--threshold") overlay["security_threshold"] = parse_number("security_threshold", value(), false);
            else if (a == "-s" || a == "--seed") {
                json s = parse_number("seed", value(), true);
                if (s.get<long long>() < 0) {
                    throw qkdnet::ConfigurationError(qkdnet::errors::E1000_CONFIGURATION, "seed", "must be >= 0");
                }
                overlay["seed"] = s.get<uint64_t>();
            }
            else if (a == "--interception") overlay["interception_mode"] = value();
            else if (a == "--parallel") overlay["parallel_links"] = true;
            else if (a == "--threads") overlay["worker_threads"] = parse_number("worker_threads", value(), true);
            else if (a == "--trials") overlay["num_trials"] = parse_number("num_trials", value(), true);
            else if (a == "--analysis-qubits") overlay["analysis_qubits"] = parse_number("analysis_qubits", value(), true);
            else if (a == "--step") overlay["sweep_step"] = parse_number("sweep_step", value(), false);
            else if (a == "-c" || a == "--config") config_path = value();
            else if (a == "--scenario-file") overlay["scenario_file"] = value();
            else if (a == "--no-bounds") bounds = false;
            else {
                std::cerr << "Unknown option: " << a << std::endl;
                print_usage(argv[0]);
                return 2;
            }
        }

        if (config_path.empty()) {
            auto env = qkdnet::SimulationConfig::path_from_environment();
            if (env) config_path = *env;
        }

        qkdnet::SimulationConfig cfg;
        if (!config_path.empty()) {
            cfg = qkdnet::SimulationConfig::load_file(config_path);
            std::cerr << "qkdnet_sim: loaded config " << config_path << std::endl;
        }
        cfg.apply_json(overlay);
        if (bounds) qkdnet::check_product_bounds(cfg);
        cfg.validate();

        qkdnet::Simulator sim(qkdnet::Simulator::options_from_config(cfg));
        json out = sim.execute(cfg);
        out["config"] = cfg.to_json();
        std::cout << out.dump(2) << std::endl;
        return 0;
    } catch (const qkdnet::ConfigurationError& e) {
        print_error(e.code(), e.parameter(), e.what());
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "qkdnet_sim: " << e.what() << std::endl;
        print_error(qkdnet::errors::E1110_SCENARIO_FAILED, "", e.what());
        return 1;
    }
}
