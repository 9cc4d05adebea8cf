#include "analysis/ThreatAnalysis.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/RandomSource.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

using nlohmann::json;

namespace qkdnet {

// stream index reserved for drawing per-trial rates of random-rate profiles
static constexpr uint64_t kRateStream = 0xFFFFFFFFull;

json ThreatScenarioResult::to_json() const {
    return {
        {"name", name},
        {"description", description},
        {"mean_qber_percent", mean_qber},
        {"std_qber_percent", std_qber},
        {"mean_intercept_rate", mean_intercept_rate},
        {"status", status},
        {"qber_samples", qber_samples},
        {"indeterminate_trials", indeterminate_trials}
    };
}

json CorrelationReport::to_json() const {
    json pts = json::array();
    for (const auto& p : points) {
        pts.push_back({
            {"intercept_rate", p.intercept_rate},
            {"mean_qber_percent", p.mean_qber},
            {"std_qber_percent", p.std_qber},
            {"samples", p.samples}
        });
    }
    return {
        {"num_qubits", num_qubits},
        {"num_trials", num_trials},
        {"points", pts},
        {"correlation", correlation},
        {"slope", fit.slope},
        {"intercept", fit.intercept},
        {"r_squared", fit.r_squared}
    };
}

double mean_of(const std::vector<double>& xs) {
    if (xs.empty()) return 0.0;
    double sum = 0.0;
    for (double x : xs) sum += x;
    return sum / static_cast<double>(xs.size());
}

double population_stddev(const std::vector<double>& xs) {
    if (xs.empty()) return 0.0;
    double m = mean_of(xs);
    double acc = 0.0;
    for (double x : xs) acc += (x - m) * (x - m);
    return std::sqrt(acc / static_cast<double>(xs.size()));
}

double pearson_correlation(const std::vector<double>& xs, const std::vector<double>& ys) {
    size_t n = std::min(xs.size(), ys.size());
    if (n < 2) return 0.0;
    double mx = 0.0, my = 0.0;
    for (size_t i = 0; i < n; ++i) { mx += xs[i]; my += ys[i]; }
    mx /= n; my /= n;
    double sxy = 0.0, sxx = 0.0, syy = 0.0;
    for (size_t i = 0; i < n; ++i) {
        sxy += (xs[i] - mx) * (ys[i] - my);
        sxx += (xs[i] - mx) * (xs[i] - mx);
        syy += (ys[i] - my) * (ys[i] - my);
    }
    if (sxx == 0.0 || syy == 0.0) return 0.0;
    return sxy / std::sqrt(sxx * syy);
}

LinearFit least_squares_fit(const std::vector<double>& xs, const std::vector<double>& ys) {
    LinearFit fit;
    size_t n = std::min(xs.size(), ys.size());
    if (n == 0) return fit;
    double mx = 0.0, my = 0.0;
    for (size_t i = 0; i < n; ++i) { mx += xs[i]; my += ys[i]; }
    mx /= n; my /= n;
    double sxy = 0.0, sxx = 0.0;
    for (size_t i = 0; i < n; ++i) {
        sxy += (xs[i] - mx) * (ys[i] - my);
        sxx += (xs[i] - mx) * (xs[i] - mx);
    }
    if (sxx == 0.0) {
        fit.intercept = my;
        return fit;
    }
    fit.slope = sxy / sxx;
    fit.intercept = my - fit.slope * mx;
    double ss_res = 0.0, ss_tot = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double pred = fit.slope * xs[i] + fit.intercept;
        ss_res += (ys[i] - pred) * (ys[i] - pred);
        ss_tot += (ys[i] - my) * (ys[i] - my);
    }
    fit.r_squared = ss_tot > 0.0 ? 1.0 - ss_res / ss_tot : 0.0;
    return fit;
}

const std::vector<ThreatProfile>& default_threat_profiles() {
    static const std::vector<ThreatProfile> kProfiles = {
        {"No Attack", "Baseline - no eavesdropper", 0.0},
        {"Stealth", "Attacker intercepting 10% to stay undetected", 0.1},
        {"Passive", "Classic intercept-resend on half the qubits", 0.5},
        {"Aggressive", "Intercepts every qubit", 1.0},
        {"Variable", "Random intercept rate each trial", std::nullopt}
    };
    return kProfiles;
}

std::string grade_threat(double mean_qber, double std_qber, bool random_rate, double threshold) {
    if (random_rate && std_qber > 5.0) return "unstable";
    if (mean_qber < 5.0) return "secure";
    if (mean_qber < threshold) return "secure_suspicious";
    if (mean_qber < 15.0) return "detected";
    return "detected_obvious";
}

ThreatAnalyzer::ThreatAnalyzer(LinkOptions options)
: options_(options) {
    validate_threshold(options_.security_threshold);
}

std::optional<double> ThreatAnalyzer::trial_qber(int num_qubits, double rate, uint64_t seed) const {
    std::vector<AttackModel> chain;
    if (rate > 0.0) chain.emplace_back(AttackerProfile{"Eve", rate});
    BB84Link link(num_qubits, std::move(chain), options_, "Bob");
    Mt19937RandomSource rng(seed);
    LinkResult r = link.run(rng);
    if (r.indeterminate) return std::nullopt;
    return r.qber_percent;
}

std::vector<ThreatScenarioResult> ThreatAnalyzer::run_threat_analysis(int num_qubits, int num_trials,
                                                                      std::optional<uint64_t> seed) const {
    validate_qubit_count(num_qubits);
    if (num_trials <= 0) {
        throw ConfigurationError(errors::E1010_SCENARIO_COUNT, "num_trials", errors::D1010_TRIALS_NOT_POSITIVE);
    }
    const uint64_t base = resolve_seed(seed);
    Mt19937RandomSource rate_rng(derive_seed(base, kRateStream));
    uint64_t trial_index = 0;

    std::vector<ThreatScenarioResult> out;
    for (const auto& profile : default_threat_profiles()) {
        ThreatScenarioResult res;
        res.name = profile.name;
        res.description = profile.description;
        std::vector<double> rates;
        for (int t = 0; t < num_trials; ++t) {
            double rate = profile.intercept_rate ? *profile.intercept_rate : rate_rng.uniform01();
            rates.push_back(rate);
            auto q = trial_qber(num_qubits, rate, derive_seed(base, trial_index++));
            if (q) res.qber_samples.push_back(*q);
            else res.indeterminate_trials++;
        }
        res.mean_qber = mean_of(res.qber_samples);
        res.std_qber = population_stddev(res.qber_samples);
        res.mean_intercept_rate = mean_of(rates);
        res.status = grade_threat(res.mean_qber, res.std_qber, !profile.intercept_rate.has_value(),
                                  options_.security_threshold);
        std::cerr << "ThreatAnalyzer: " << res.name << " mean " << res.mean_qber << "% +/- "
                  << res.std_qber << "% -> " << res.status << std::endl;
        out.push_back(std::move(res));
    }
    return out;
}

CorrelationReport ThreatAnalyzer::run_correlation_sweep(int num_qubits, int num_trials, double step,
                                                        std::optional<uint64_t> seed) const {
    validate_qubit_count(num_qubits);
    if (num_trials <= 0) {
        throw ConfigurationError(errors::E1010_SCENARIO_COUNT, "num_trials", errors::D1010_TRIALS_NOT_POSITIVE);
    }
    if (!(step > 0.0) || step > 1.0) {
        throw ConfigurationError(errors::E1010_SCENARIO_COUNT, "sweep_step", errors::D1010_STEP_RANGE);
    }
    const uint64_t base = resolve_seed(seed);
    const int steps = static_cast<int>(std::floor(1.0 / step + 1e-9));
    uint64_t trial_index = 0;

    CorrelationReport report;
    report.num_qubits = num_qubits;
    report.num_trials = num_trials;
    for (int i = 0; i <= steps; ++i) {
        CorrelationPoint p;
        p.intercept_rate = std::min(1.0, i * step);
        std::vector<double> samples;
        for (int t = 0; t < num_trials; ++t) {
            auto q = trial_qber(num_qubits, p.intercept_rate, derive_seed(base, trial_index++));
            if (q) samples.push_back(*q);
        }
        p.mean_qber = mean_of(samples);
        p.std_qber = population_stddev(samples);
        p.samples = static_cast<int>(samples.size());
        report.points.push_back(p);
    }

    std::vector<double> xs, ys;
    for (const auto& p : report.points) {
        xs.push_back(p.intercept_rate);
        ys.push_back(p.mean_qber);
    }
    report.correlation = pearson_correlation(xs, ys);
    report.fit = least_squares_fit(xs, ys);
    return report;
}

} // namespace qkdnet
