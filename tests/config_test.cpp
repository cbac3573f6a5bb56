#include "src/server/config.h"

#include <map>

#include <gtest/gtest.h>

namespace runbox {
namespace {

using std::chrono::milliseconds;

EnvLookup FakeEnv(std::map<std::string, std::string> vars) {
    return [vars](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

TEST(ServerConfigTest, Defaults) {
    ServerConfig config;
    EXPECT_EQ(config.address, "0.0.0.0:50051");
    EXPECT_EQ(config.pipeline.compile_timeout, milliseconds(5000));
    EXPECT_EQ(config.pipeline.execute_timeout, milliseconds(10000));
    EXPECT_EQ(config.max_active_jobs, 10);
    EXPECT_TRUE(config.probe_versions);
}

TEST(ServerConfigTest, FlagsInBothForms) {
    ServerConfig config;
    ApplyFlags({"--execute-timeout=2.5", "--compile-timeout", "1", "--workdir", "/srv/jobs",
                "--max-active-jobs=3", "--log-level=debug", "--no-probe"},
               &config);
    EXPECT_EQ(config.pipeline.execute_timeout, milliseconds(2500));
    EXPECT_EQ(config.pipeline.compile_timeout, milliseconds(1000));
    EXPECT_EQ(config.workdir, "/srv/jobs");
    EXPECT_EQ(config.max_active_jobs, 3);
    EXPECT_EQ(config.log_level, LogLevel::DEBUG);
    EXPECT_FALSE(config.probe_versions);
    EXPECT_FALSE(config.show_help);
}

TEST(ServerConfigTest, EnvironmentThenFlags) {
    ServerConfig config;
    ApplyEnvironment(FakeEnv({{"RUNBOX_ADDRESS", "127.0.0.1:9000"},
                              {"RUNBOX_EXECUTE_TIMEOUT", "4"}}),
                     &config);
    EXPECT_EQ(config.address, "127.0.0.1:9000");
    EXPECT_EQ(config.pipeline.execute_timeout, milliseconds(4000));

    ApplyFlags({"--execute-timeout=6"}, &config);
    EXPECT_EQ(config.pipeline.execute_timeout, milliseconds(6000));
    EXPECT_EQ(config.address, "127.0.0.1:9000");
}

TEST(ServerConfigTest, BadEnvironmentNamesVariable) {
    ServerConfig config;
    try {
        ApplyEnvironment(FakeEnv({{"RUNBOX_COMPILE_TIMEOUT", "soon"}}), &config);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("RUNBOX_COMPILE_TIMEOUT"), std::string::npos);
    }
}

TEST(ServerConfigTest, RejectsInvalidFlags) {
    ServerConfig config;
    EXPECT_THROW(ApplyFlags({"--execute-timeout=0"}, &config), ConfigError);
    EXPECT_THROW(ApplyFlags({"--execute-timeout=-1"}, &config), ConfigError);
    EXPECT_THROW(ApplyFlags({"--execute-timeout=10s"}, &config), ConfigError);
    EXPECT_THROW(ApplyFlags({"--max-active-jobs=many"}, &config), ConfigError);
    EXPECT_THROW(ApplyFlags({"--log-level=loud"}, &config), ConfigError);
    EXPECT_THROW(ApplyFlags({"--frobnicate=1"}, &config), ConfigError);
    EXPECT_THROW(ApplyFlags({"--address"}, &config), ConfigError);
    EXPECT_THROW(ApplyFlags({"positional"}, &config), ConfigError);
}

TEST(ServerConfigTest, TimeoutBounds) {
    ServerConfig config;
    EXPECT_THROW(ApplyFlags({"--execute-timeout=0.0001"}, &config), ConfigError);
    EXPECT_THROW(ApplyFlags({"--compile-timeout=1e300"}, &config), ConfigError);
    EXPECT_THROW(ApplyFlags({"--execute-timeout=86401"}, &config), ConfigError);

    ApplyFlags({"--execute-timeout=0.001", "--compile-timeout=86400"}, &config);
    EXPECT_EQ(config.pipeline.execute_timeout, milliseconds(1));
    EXPECT_EQ(config.pipeline.compile_timeout, milliseconds(86400000));
}

TEST(ServerConfigTest, Help) {
    ServerConfig config;
    ApplyFlags({"--help"}, &config);
    EXPECT_TRUE(config.show_help);
    EXPECT_NE(Usage("runbox_server").find("--execute-timeout"), std::string::npos);
}

} // namespace
} // namespace runbox
