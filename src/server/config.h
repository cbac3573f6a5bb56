#pragma once

#include "src/server/logger.h"
#include "src/server/pipeline.h"

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace runbox {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ServerConfig {
    std::string address = "0.0.0.0:50051";
    std::string workdir = "/tmp/runbox";
    PipelineConfig pipeline;
    int max_active_jobs = 10;
    LogLevel log_level = LogLevel::INFO;
    bool probe_versions = true;
    bool show_help = false;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads RUNBOX_ADDRESS, RUNBOX_WORKDIR, RUNBOX_COMPILE_TIMEOUT,
// RUNBOX_EXECUTE_TIMEOUT, RUNBOX_MAX_ACTIVE_JOBS and RUNBOX_LOG_LEVEL.
void ApplyEnvironment(const EnvLookup& env, ServerConfig* config);

// Accepts "--name=value" and "--name value". Throws ConfigError.
void ApplyFlags(const std::vector<std::string>& args, ServerConfig* config);

// Defaults, then the process environment, then argv.
ServerConfig LoadServerConfig(int argc, char** argv);

std::string Usage(const std::string& program);

} // namespace runbox
