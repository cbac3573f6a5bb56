#pragma once

#include <atomic>

#include <grpcpp/grpcpp.h>
#include "proto/runbox.grpc.pb.h"
#include "src/server/pipeline.h"

namespace runbox {

// Fills a RunResponse and picks the gRPC status for a pipeline result.
grpc::Status ToResponse(const ExecutionResult& result, RunResponse* response);

void ToDescription(const LanguageInfo& info, LanguageDescription* description);

class CodeRunnerServiceImpl final : public CodeRunner::CallbackService {
public:
    CodeRunnerServiceImpl(ExecutionPipeline& pipeline, const LanguageRegistry& registry,
                          int max_active_jobs);

    grpc::ServerUnaryReactor* Run(grpc::CallbackServerContext* context,
                                  const RunRequest* request,
                                  RunResponse* response) override;

    grpc::ServerUnaryReactor* ListLanguages(grpc::CallbackServerContext* context,
                                            const ListLanguagesRequest* request,
                                            ListLanguagesResponse* response) override;

    int active_jobs() const { return active_jobs_.load(); }

private:
    ExecutionPipeline& pipeline_;
    const LanguageRegistry& registry_;
    const int max_active_jobs_;
    std::atomic<int> active_jobs_;
};

} // namespace runbox
