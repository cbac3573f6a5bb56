#pragma once

#include "src/server/artifact_store.h"
#include "src/server/language.h"
#include "src/server/process.h"

#include <chrono>
#include <string>

namespace runbox {

struct PipelineConfig {
    std::chrono::milliseconds compile_timeout{5000};
    std::chrono::milliseconds execute_timeout{10000};
};

struct Job {
    std::string language;
    std::string code;
    std::string input;
};

// kInvalidRequest and kCompilationFailed are pipeline-level failures. A
// program that crashed, looped or wrote to stderr still yields kOk, with the
// details in `error`.
enum class PipelineStatus {
    kOk,
    kInvalidRequest,
    kCompilationFailed
};

const char* PipelineStatusName(PipelineStatus status);

struct ExecutionResult {
    PipelineStatus status = PipelineStatus::kOk;
    std::string output;
    std::string error;
    std::string language;
    LanguageInfo info;

    bool ok() const { return status == PipelineStatus::kOk; }
};

class ExecutionPipeline {
public:
    ExecutionPipeline(const LanguageRegistry& registry, ArtifactStore& store, Runner& runner,
                      PipelineConfig config = {});

    // Validates, materializes, compiles, runs and cleans up one job. Only an
    // ArtifactError from the store escapes; everything else is in the result.
    ExecutionResult Execute(const Job& job);

    const PipelineConfig& config() const { return config_; }

private:
    // Returns false and fills *result when compilation failed.
    bool Compile(const CommandSpec& spec, ExecutionResult* result);
    void RunProgram(const CommandSpec& spec, const Job& job, ExecutionResult* result);

    const LanguageRegistry& registry_;
    ArtifactStore& store_;
    Runner& runner_;
    PipelineConfig config_;
};

// "10", "2.5": a duration in seconds as shown to users.
std::string FormatSeconds(std::chrono::milliseconds duration);

} // namespace runbox
