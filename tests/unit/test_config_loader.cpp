#include <gtest/gtest.h>
#include "core/config_loader.h"
#include "utils/log.h"
#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace plugsec;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        const std::string name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        configPath_ = (std::filesystem::temp_directory_path() / ("plugsec_config_" + name + ".json")).string();
        savedLevel_ = ::utils::getLogLevel();
    }

    void TearDown() override {
        std::remove(configPath_.c_str());
        ::utils::setLogLevel(savedLevel_);
    }

    void writeConfig(const std::string& content) {
        std::ofstream out(configPath_);
        out << content;
    }

    std::string configPath_;
    ::utils::LogLevel savedLevel_;
};

TEST_F(ConfigLoaderTest, MissingFileYieldsDefaults) {
    SecurityProperties props = loadSecurityConfig("/nonexistent/plugsec.json");
    EXPECT_EQ(10, props.getRateLimitRequests());
    EXPECT_EQ(30000L, props.getTimeoutMs());
}

TEST_F(ConfigLoaderTest, LoadsEverySection) {
    writeConfig(R"({
        "runtime": { "production_mode": true },
        "validator": { "max_file_size": 2048, "max_endpoint_length": 120 },
        "integrity": { "trusted_sources": ["corp.internal"], "acceptance_threshold": 80.0 },
        "permissions": { "allow_unknown_operations": true },
        "sandbox": { "rate_limit_requests": 5, "rate_limit_window_ms": 1000,
                     "timeout_ms": 2000, "worker_threads": 2 },
        "logging": { "level": "WARNING" }
    })");

    SecurityProperties props = loadSecurityConfig(configPath_);

    EXPECT_TRUE(props.isProductionMode());
    EXPECT_EQ(2048L, props.getMaxFileSize());
    EXPECT_EQ(120, props.getMaxEndpointLength());
    EXPECT_EQ(std::vector<std::string>{"corp.internal"}, props.getTrustedSources());
    EXPECT_DOUBLE_EQ(80.0, props.getAcceptanceThreshold());
    EXPECT_TRUE(props.isAllowUnknownOperations());
    EXPECT_EQ(5, props.getRateLimitRequests());
    EXPECT_EQ(1000L, props.getRateLimitWindowMs());
    EXPECT_EQ(2000L, props.getTimeoutMs());
    EXPECT_EQ(2, props.getWorkerThreads());
    EXPECT_EQ("WARNING", props.getLogLevel());

    // Untouched keys keep their defaults
    EXPECT_EQ(64, props.getMinSignatureLength());
    EXPECT_EQ(10000L, props.getFetchTimeoutMs());
}

TEST_F(ConfigLoaderTest, MalformedFileThrows) {
    writeConfig("{ \"sandbox\": { ");
    EXPECT_THROW(loadSecurityConfig(configPath_), std::runtime_error);
}

TEST_F(ConfigLoaderTest, WrongValueTypeThrows) {
    nlohmann::json config = {{"sandbox", {{"timeout_ms", "soon"}}}};
    SecurityProperties props;

    try {
        applySecurityConfig(config, props);
        FAIL() << "Expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("sandbox.timeout_ms"), std::string::npos);
    }
}

TEST_F(ConfigLoaderTest, NonObjectDocumentThrows) {
    SecurityProperties props;
    EXPECT_THROW(applySecurityConfig(nlohmann::json::array(), props), std::runtime_error);
}

TEST_F(ConfigLoaderTest, UnknownSectionsAreIgnored) {
    SecurityProperties props;
    applySecurityConfig({{"ui", {{"theme", "dark"}}}}, props);
    EXPECT_EQ(10, props.getRateLimitRequests());
}

TEST_F(ConfigLoaderTest, ApplyLogLevel) {
    SecurityProperties props;
    props.setLogLevel("error");
    applyLogLevel(props);
    EXPECT_EQ(::utils::LogLevel::ERROR, ::utils::getLogLevel());

    props.setLogLevel("chatty");
    EXPECT_THROW(applyLogLevel(props), std::invalid_argument);
}
