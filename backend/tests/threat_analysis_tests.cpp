#include <gtest/gtest.h>
#include "analysis/ThreatAnalysis.hpp"
#include "core/ErrorCatalog.hpp"
#include <nlohmann/json.hpp>

using namespace qkdnet;

TEST(Statistics, MeanAndPopulationStddev) {
    std::vector<double> xs = {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
    EXPECT_DOUBLE_EQ(mean_of(xs), 5.0);
    EXPECT_DOUBLE_EQ(population_stddev(xs), 2.0);
    EXPECT_DOUBLE_EQ(mean_of({}), 0.0);
    EXPECT_DOUBLE_EQ(population_stddev({}), 0.0);
}

TEST(Statistics, PearsonAndFit) {
    std::vector<double> xs = {0.0, 1.0, 2.0, 3.0};
    std::vector<double> ys = {1.0, 3.0, 5.0, 7.0};
    EXPECT_NEAR(pearson_correlation(xs, ys), 1.0, 1e-12);
    LinearFit fit = least_squares_fit(xs, ys);
    EXPECT_NEAR(fit.slope, 2.0, 1e-12);
    EXPECT_NEAR(fit.intercept, 1.0, 1e-12);
    EXPECT_NEAR(fit.r_squared, 1.0, 1e-12);

    std::vector<double> flat = {4.0, 4.0, 4.0, 4.0};
    EXPECT_DOUBLE_EQ(pearson_correlation(xs, flat), 0.0);
    std::vector<double> down = {9.0, 6.0, 3.0, 0.0};
    EXPECT_NEAR(pearson_correlation(xs, down), -1.0, 1e-12);
}

TEST(ThreatGrading, Bands) {
    EXPECT_EQ(grade_threat(0.0, 0.0, false, 11.0), "secure");
    EXPECT_EQ(grade_threat(7.0, 1.0, false, 11.0), "secure_suspicious");
    EXPECT_EQ(grade_threat(12.0, 1.0, false, 11.0), "detected");
    EXPECT_EQ(grade_threat(25.0, 3.0, false, 11.0), "detected_obvious");
    EXPECT_EQ(grade_threat(12.0, 8.0, true, 11.0), "unstable");
    EXPECT_EQ(grade_threat(12.0, 8.0, false, 11.0), "detected");
}

TEST(ThreatAnalyzer, ProfilesInOrder) {
    const auto& p = default_threat_profiles();
    ASSERT_EQ(p.size(), 5u);
    EXPECT_EQ(p[0].name, "No Attack");
    EXPECT_DOUBLE_EQ(*p[0].intercept_rate, 0.0);
    EXPECT_DOUBLE_EQ(*p[3].intercept_rate, 1.0);
    EXPECT_FALSE(p[4].intercept_rate.has_value());
}

TEST(ThreatAnalyzer, NoAttackIsSecureAndFullAttackDetected) {
    ThreatAnalyzer analyzer;
    auto rows = analyzer.run_threat_analysis(100, 10, 3);
    ASSERT_EQ(rows.size(), 5u);
    EXPECT_DOUBLE_EQ(rows[0].mean_qber, 0.0);
    EXPECT_EQ(rows[0].status, "secure");
    EXPECT_GT(rows[3].mean_qber, 15.0);
    EXPECT_EQ(rows[3].status, "detected_obvious");
    EXPECT_DOUBLE_EQ(rows[3].mean_intercept_rate, 1.0);
    for (const auto& r : rows) {
        EXPECT_EQ(r.qber_samples.size() + static_cast<size_t>(r.indeterminate_trials), 10u);
    }
    EXPECT_GE(rows[4].mean_intercept_rate, 0.0);
    EXPECT_LE(rows[4].mean_intercept_rate, 1.0);
}

TEST(ThreatAnalyzer, SeededRunIsReproducible) {
    ThreatAnalyzer analyzer;
    auto a = analyzer.run_threat_analysis(50, 4, 21);
    auto b = analyzer.run_threat_analysis(50, 4, 21);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) EXPECT_EQ(a[i].to_json(), b[i].to_json());
}

TEST(ThreatAnalyzer, CorrelationSweepTrendsUpward) {
    ThreatAnalyzer analyzer;
    CorrelationReport rep = analyzer.run_correlation_sweep(100, 10, 0.05, 8);
    ASSERT_EQ(rep.points.size(), 21u);
    EXPECT_DOUBLE_EQ(rep.points.front().intercept_rate, 0.0);
    EXPECT_DOUBLE_EQ(rep.points.back().intercept_rate, 1.0);
    EXPECT_DOUBLE_EQ(rep.points.front().mean_qber, 0.0);
    EXPECT_GT(rep.correlation, 0.9);
    EXPECT_GT(rep.fit.slope, 15.0);
    EXPECT_LT(rep.fit.slope, 35.0);
    EXPECT_GT(rep.fit.r_squared, 0.8);
    auto j = rep.to_json();
    EXPECT_EQ(j["points"].size(), 21u);
}

TEST(ThreatAnalyzer, RejectsBadArguments) {
    ThreatAnalyzer analyzer;
    EXPECT_THROW(analyzer.run_threat_analysis(0, 5, 1), ConfigurationError);
    EXPECT_THROW(analyzer.run_threat_analysis(10, 0, 1), ConfigurationError);
    EXPECT_THROW(analyzer.run_correlation_sweep(10, 5, 0.0, 1), ConfigurationError);
    EXPECT_THROW(analyzer.run_correlation_sweep(10, 5, 1.5, 1), ConfigurationError);
    LinkOptions bad;
    bad.security_threshold = 0.0;
    EXPECT_THROW(ThreatAnalyzer{bad}, ConfigurationError);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
