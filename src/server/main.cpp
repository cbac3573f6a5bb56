#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include <grpcpp/grpcpp.h>
#include "src/server/artifact_store.h"
#include "src/server/config.h"
#include "src/server/language.h"
#include "src/server/logger.h"
#include "src/server/pipeline.h"
#include "src/server/process.h"
#include "src/server/service.h"

using grpc::Server;
using grpc::ServerBuilder;
using runbox::ArtifactError;
using runbox::CodeRunnerServiceImpl;
using runbox::ConfigError;
using runbox::ExecutionPipeline;
using runbox::FileArtifactStore;
using runbox::LanguageRegistry;
using runbox::Logger;
using runbox::ProcessRunner;
using runbox::ServerConfig;

namespace {

constexpr std::chrono::seconds kProbeTimeout{5};

void RunServer(const ServerConfig& config) {
    ProcessRunner runner;

    auto definitions = LanguageRegistry::BuiltinDefinitions();
    if (config.probe_versions) {
        definitions = runbox::ProbeVersions(std::move(definitions), runner, kProbeTimeout);
    }
    LanguageRegistry registry(config.workdir, std::move(definitions));
    FileArtifactStore store(registry);
    ExecutionPipeline pipeline(registry, store, runner, config.pipeline);
    CodeRunnerServiceImpl service(pipeline, registry, config.max_active_jobs);

    ServerBuilder builder;
    builder.AddListeningPort(config.address, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);
    std::unique_ptr<Server> server(builder.BuildAndStart());
    if (!server) {
        Logger::Error("Failed to listen on ", config.address);
        return;
    }
    Logger::Info("Server listening on ", config.address, " (compile timeout ",
                 runbox::FormatSeconds(config.pipeline.compile_timeout), "s, execute timeout ",
                 runbox::FormatSeconds(config.pipeline.execute_timeout), "s)");
    server->Wait();
}

} // namespace

int main(int argc, char** argv) {
    ServerConfig config;
    try {
        config = runbox::LoadServerConfig(argc, argv);
    } catch (const ConfigError& e) {
        Logger::Error("Invalid configuration: ", e.what());
        std::cerr << runbox::Usage(argv[0]);
        return 2;
    }
    if (config.show_help) {
        std::cout << runbox::Usage(argv[0]);
        return 0;
    }
    Logger::SetLevel(config.log_level);

    try {
        RunServer(config);
    } catch (const ArtifactError& e) {
        Logger::Error(e.what());
        return 1;
    }
    return 0;
}
