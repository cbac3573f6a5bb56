#include "src/server/config.h"

#include <cmath>
#include <cstdlib>
#include <sstream>
#include <utility>

namespace runbox {

namespace {

// One day; longer deadlines are treated as configuration mistakes.
constexpr double kMaxTimeoutSeconds = 86400;

std::chrono::milliseconds ParseSeconds(const std::string& name, const std::string& value) {
    size_t used = 0;
    double seconds = 0;
    try {
        seconds = std::stod(value, &used);
    } catch (const std::exception&) {
        throw ConfigError(name + ": expected seconds, got '" + value + "'");
    }
    if (used != value.size() || !std::isfinite(seconds) || seconds <= 0) {
        throw ConfigError(name + ": expected a positive number of seconds, got '" + value + "'");
    }
    if (seconds > kMaxTimeoutSeconds) {
        throw ConfigError(name + ": at most " + std::to_string(static_cast<int>(kMaxTimeoutSeconds)) +
                          " seconds, got '" + value + "'");
    }
    long long millis = std::llround(seconds * 1000);
    if (millis < 1) {
        throw ConfigError(name + ": must be at least 0.001 seconds, got '" + value + "'");
    }
    return std::chrono::milliseconds(millis);
}

int ParsePositiveInt(const std::string& name, const std::string& value) {
    size_t used = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw ConfigError(name + ": expected an integer, got '" + value + "'");
    }
    if (used != value.size() || parsed <= 0) {
        throw ConfigError(name + ": expected a positive integer, got '" + value + "'");
    }
    return parsed;
}

LogLevel ParseLogLevel(const std::string& name, const std::string& value) {
    LogLevel level;
    if (!Logger::ParseLevel(value, &level)) {
        throw ConfigError(name + ": unknown log level '" + value + "'");
    }
    return level;
}

void ApplySetting(const std::string& name, const std::string& value, ServerConfig* config) {
    if (name == "address") {
        if (value.empty()) throw ConfigError("address: must not be empty");
        config->address = value;
    } else if (name == "workdir") {
        if (value.empty()) throw ConfigError("workdir: must not be empty");
        config->workdir = value;
    } else if (name == "compile-timeout") {
        config->pipeline.compile_timeout = ParseSeconds(name, value);
    } else if (name == "execute-timeout") {
        config->pipeline.execute_timeout = ParseSeconds(name, value);
    } else if (name == "max-active-jobs") {
        config->max_active_jobs = ParsePositiveInt(name, value);
    } else if (name == "log-level") {
        config->log_level = ParseLogLevel(name, value);
    } else {
        throw ConfigError("unknown option --" + name);
    }
}

} // namespace

void ApplyEnvironment(const EnvLookup& env, ServerConfig* config) {
    static const std::pair<const char*, const char*> kVariables[] = {
        {"RUNBOX_ADDRESS", "address"},
        {"RUNBOX_WORKDIR", "workdir"},
        {"RUNBOX_COMPILE_TIMEOUT", "compile-timeout"},
        {"RUNBOX_EXECUTE_TIMEOUT", "execute-timeout"},
        {"RUNBOX_MAX_ACTIVE_JOBS", "max-active-jobs"},
        {"RUNBOX_LOG_LEVEL", "log-level"},
    };
    for (const auto& var : kVariables) {
        std::optional<std::string> value = env(var.first);
        if (!value) continue;
        try {
            ApplySetting(var.second, *value, config);
        } catch (const ConfigError& e) {
            throw ConfigError(std::string(var.first) + " (" + e.what() + ")");
        }
    }
}

void ApplyFlags(const std::vector<std::string>& args, ServerConfig* config) {
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            config->show_help = true;
            continue;
        }
        if (arg == "--no-probe") {
            config->probe_versions = false;
            continue;
        }
        if (arg.rfind("--", 0) != 0) {
            throw ConfigError("unexpected argument '" + arg + "'");
        }

        std::string name = arg.substr(2);
        std::string value;
        size_t eq = name.find('=');
        if (eq != std::string::npos) {
            value = name.substr(eq + 1);
            name.resize(eq);
        } else if (i + 1 < args.size()) {
            value = args[++i];
        } else {
            throw ConfigError("option --" + name + " needs a value");
        }
        ApplySetting(name, value, config);
    }
}

ServerConfig LoadServerConfig(int argc, char** argv) {
    ServerConfig config;
    ApplyEnvironment(
        [](const std::string& name) -> std::optional<std::string> {
            const char* value = std::getenv(name.c_str());
            if (!value) return std::nullopt;
            return std::string(value);
        },
        &config);
    ApplyFlags(std::vector<std::string>(argv + 1, argv + argc), &config);
    return config;
}

std::string Usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "  --address ADDR           listen address (default 0.0.0.0:50051)\n"
        << "  --workdir DIR            directory for job artifacts (default /tmp/runbox)\n"
        << "  --compile-timeout SECS   compile phase deadline (default 5)\n"
        << "  --execute-timeout SECS   execute phase deadline (default 10)\n"
        << "  --max-active-jobs N      concurrent jobs before rejecting (default 10)\n"
        << "  --log-level LEVEL        debug, info, warn or error (default info)\n"
        << "  --no-probe               skip toolchain version probing at startup\n"
        << "Each option may also be set with RUNBOX_<NAME> in the environment.\n";
    return out.str();
}

} // namespace runbox
