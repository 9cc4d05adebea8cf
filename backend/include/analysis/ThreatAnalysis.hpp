#pragma once
#include "simulator/BB84Link.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace qkdnet {

struct ThreatProfile {
    std::string name;
    std::string description;
    std::optional<double> intercept_rate; // nullopt: fresh uniform rate every trial
};

struct ThreatScenarioResult {
    std::string name;
    std::string description;
    double mean_qber = 0.0;  // percent
    double std_qber = 0.0;   // percent, population
    double mean_intercept_rate = 0.0;
    std::string status;
    std::vector<double> qber_samples;
    int indeterminate_trials = 0;

    nlohmann::json to_json() const;
};

struct CorrelationPoint {
    double intercept_rate = 0.0;
    double mean_qber = 0.0;
    double std_qber = 0.0;
    int samples = 0;
};

struct LinearFit {
    double slope = 0.0;
    double intercept = 0.0;
    double r_squared = 0.0;
};

struct CorrelationReport {
    std::vector<CorrelationPoint> points;
    double correlation = 0.0; // Pearson, intercept rate vs mean QBER
    LinearFit fit;
    int num_qubits = 0;
    int num_trials = 0;

    nlohmann::json to_json() const;
};

double mean_of(const std::vector<double>& xs);
double population_stddev(const std::vector<double>& xs);
double pearson_correlation(const std::vector<double>& xs, const std::vector<double>& ys);
LinearFit least_squares_fit(const std::vector<double>& xs, const std::vector<double>& ys);

const std::vector<ThreatProfile>& default_threat_profiles();

// secure / secure_suspicious / detected / detected_obvious, unstable for noisy random-rate profiles
std::string grade_threat(double mean_qber, double std_qber, bool random_rate, double threshold);

/**
 * @brief Repeated single-link trials for threat grading and rate/QBER correlation.
 *
 * Trial k of a run uses the stream derive_seed(seed, k), so a seeded analysis
 * is reproducible. Indeterminate trials are left out of the statistics.
 */
class ThreatAnalyzer {
public:
    explicit ThreatAnalyzer(LinkOptions options = {});

    std::vector<ThreatScenarioResult> run_threat_analysis(int num_qubits, int num_trials,
                                                          std::optional<uint64_t> seed = std::nullopt) const;

    CorrelationReport run_correlation_sweep(int num_qubits, int num_trials, double step = 0.05,
                                            std::optional<uint64_t> seed = std::nullopt) const;

private:
    // nullopt when the trial was indeterminate
    std::optional<double> trial_qber(int num_qubits, double rate, uint64_t seed) const;

    LinkOptions options_;
};

} // namespace qkdnet
