#include <gtest/gtest.h>
#include "core/Config.hpp"
#include "core/ErrorCatalog.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace qkdnet;
using nlohmann::json;

static std::string write_temp_file(const std::string& name, const std::string& text) {
    std::filesystem::path p = std::filesystem::temp_directory_path() / name;
    std::ofstream f(p);
    f << text;
    f.close();
    return p.string();
}

static int error_code_of(const SimulationConfig& cfg) {
    try {
        cfg.validate();
    } catch (const ConfigurationError& e) {
        return e.code();
    }
    return 0;
}

TEST(SimulationConfig, DefaultsAreValid) {
    SimulationConfig cfg;
    EXPECT_EQ(cfg.mode, RunMode::Random);
    EXPECT_EQ(cfg.num_qubits, 10);
    EXPECT_EQ(cfg.num_scenarios, 5);
    EXPECT_DOUBLE_EQ(cfg.security_threshold, 11.0);
    EXPECT_FALSE(cfg.seed.has_value());
    EXPECT_NO_THROW(cfg.validate());
    EXPECT_NO_THROW(check_product_bounds(cfg));
}

TEST(SimulationConfig, JsonOverlayKeepsUntouchedKeys) {
    SimulationConfig cfg;
    cfg.apply_json({ {"mode", "network"}, {"num_qubits", 16}, {"seed", 5}, {"not_a_key", true} });
    EXPECT_EQ(cfg.mode, RunMode::Network);
    EXPECT_EQ(cfg.num_qubits, 16);
    ASSERT_TRUE(cfg.seed.has_value());
    EXPECT_EQ(*cfg.seed, 5u);
    EXPECT_EQ(cfg.num_scenarios, 5);
    cfg.apply_json({ {"seed", nullptr} });
    EXPECT_FALSE(cfg.seed.has_value());
}

TEST(SimulationConfig, MistypedFieldNamesTheKey) {
    SimulationConfig cfg;
    try {
        cfg.apply_json({ {"num_qubits", "many"} });
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.code(), errors::E1009_CONFIG_FILE);
        EXPECT_EQ(e.parameter(), "num_qubits");
    }
    EXPECT_THROW(cfg.apply_json(json::array()), ConfigurationError);
    EXPECT_THROW(cfg.apply_json({ {"mode", "interactive"} }), ConfigurationError);
}

TEST(SimulationConfig, ToJsonRoundTrips) {
    SimulationConfig cfg;
    cfg.mode = RunMode::Correlation;
    cfg.receivers = {"Bob", "Eve_watch"};
    cfg.seed = 77;
    cfg.interception_mode = "exclusive";
    SimulationConfig copy;
    copy.apply_json(cfg.to_json());
    EXPECT_EQ(copy.to_json(), cfg.to_json());
}

TEST(SimulationConfig, LoadFile) {
    auto path = write_temp_file("qkdnet_config_test.json",
                                R"({"mode": "threat", "num_trials": 3, "security_threshold": 9.5})");
    SimulationConfig cfg = SimulationConfig::load_file(path);
    EXPECT_EQ(cfg.mode, RunMode::Threat);
    EXPECT_EQ(cfg.num_trials, 3);
    EXPECT_DOUBLE_EQ(cfg.security_threshold, 9.5);

    auto bad = write_temp_file("qkdnet_config_bad.json", "{\"mode\": ");
    EXPECT_THROW(SimulationConfig::load_file(bad), ConfigurationError);
    EXPECT_THROW(SimulationConfig::load_file("/nonexistent/qkdnet.json"), ConfigurationError);
}

TEST(SimulationConfig, PathFromEnvironment) {
    ::setenv("QKDNET_CONFIG", "/tmp/qkdnet_env.json", 1);
    auto p = SimulationConfig::path_from_environment();
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(*p, "/tmp/qkdnet_env.json");
    ::unsetenv("QKDNET_CONFIG");
    EXPECT_FALSE(SimulationConfig::path_from_environment().has_value());
}

TEST(SimulationConfig, ValidateReportsCatalogCodes) {
    SimulationConfig cfg;
    cfg.num_qubits = 0;
    EXPECT_EQ(error_code_of(cfg), errors::E1001_QUBIT_COUNT);

    cfg = SimulationConfig{};
    cfg.intercept_rate = 1.5;
    EXPECT_EQ(error_code_of(cfg), errors::E1002_PROBABILITY);

    cfg = SimulationConfig{};
    cfg.attack_scenario = "bogus";
    EXPECT_EQ(error_code_of(cfg), errors::E1005_UNKNOWN_ARCHETYPE);

    cfg = SimulationConfig{};
    cfg.security_threshold = -1.0;
    EXPECT_EQ(error_code_of(cfg), errors::E1006_THRESHOLD);

    cfg = SimulationConfig{};
    cfg.num_receivers = 0;
    EXPECT_EQ(error_code_of(cfg), errors::E1007_RECEIVER_SET);

    cfg = SimulationConfig{};
    cfg.num_scenarios = 0;
    EXPECT_EQ(error_code_of(cfg), errors::E1010_SCENARIO_COUNT);

    cfg = SimulationConfig{};
    cfg.interception_mode = "round_robin";
    EXPECT_EQ(error_code_of(cfg), errors::E1000_CONFIGURATION);
}

TEST(SimulationConfig, ProductBounds) {
    SimulationConfig cfg;
    cfg.num_qubits = 21;
    try {
        check_product_bounds(cfg);
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.code(), errors::E1011_PRODUCT_BOUNDS);
        EXPECT_EQ(e.parameter(), "num_qubits");
    }
    cfg.num_qubits = 20;
    cfg.num_scenarios = 11;
    EXPECT_THROW(check_product_bounds(cfg), ConfigurationError);
    // scenario count only matters for batches
    cfg.mode = RunMode::Network;
    EXPECT_NO_THROW(check_product_bounds(cfg));
    // core limits are wider than the product's
    cfg.num_qubits = 500;
    EXPECT_NO_THROW(cfg.validate());
}

TEST(ErrorCatalog, MessagesCarryPrefixAndParameter) {
    ConfigurationError e(errors::E1001_QUBIT_COUNT, "num_qubits", errors::D1001_QUBITS_NOT_POSITIVE);
    EXPECT_STREQ(e.what(), "Error 1001: Invalid configuration: num_qubits: num_qubits must be > 0");
    EXPECT_EQ(errors::format_E1100_link_failed("Bob", "boom"), "Error 1100: Link run failed: Bob: boom");
    EXPECT_EQ(errors::code_string(errors::E1110_SCENARIO_FAILED), "1110");
}

TEST(ErrorCatalog, MessageNamesTheThrownCode) {
    for (int code : {errors::E1002_PROBABILITY, errors::E1003_UNKNOWN_RECEIVER, errors::E1009_CONFIG_FILE,
                     errors::E1011_PRODUCT_BOUNDS}) {
        ConfigurationError e(code, "p", "d");
        std::string what = e.what();
        EXPECT_EQ(what.rfind("Error " + errors::code_string(code) + ": Invalid configuration: ", 0), 0u) << what;
        EXPECT_EQ(what.find("Error 1000"), std::string::npos) << what;
    }

    SimulationConfig cfg;
    cfg.num_qubits = 21;
    try {
        check_product_bounds(cfg);
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_NE(std::string(e.what()).find("Error 1011"), std::string::npos) << e.what();
    }
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
