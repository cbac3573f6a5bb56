#include "src/server/pipeline.h"
#include "src/server/logger.h"

#include <exception>
#include <sstream>
#include <utility>

namespace runbox {

namespace {

// Removes a job's artifacts when the pipeline leaves scope, whatever the path.
class ArtifactCleanup {
public:
    ArtifactCleanup(ArtifactStore& store, std::string job_id, std::string language,
                    std::string output_extension)
        : store_(store),
          job_id_(std::move(job_id)),
          language_(std::move(language)),
          output_extension_(std::move(output_extension)) {}

    ArtifactCleanup(const ArtifactCleanup&) = delete;
    ArtifactCleanup& operator=(const ArtifactCleanup&) = delete;

    ~ArtifactCleanup() {
        try {
            store_.Remove(job_id_, language_, output_extension_);
        } catch (const std::exception& e) {
            Logger::Warn("Cleanup of job ", job_id_, " failed: ", e.what());
        }
    }

private:
    ArtifactStore& store_;
    std::string job_id_;
    std::string language_;
    std::string output_extension_;
};

std::string JoinLanguages(const std::vector<std::string>& ids) {
    std::string joined;
    for (const auto& id : ids) {
        if (!joined.empty()) joined += ", ";
        joined += id;
    }
    return joined;
}

} // namespace

const char* PipelineStatusName(PipelineStatus status) {
    switch (status) {
        case PipelineStatus::kOk: return "ok";
        case PipelineStatus::kInvalidRequest: return "invalid request";
        case PipelineStatus::kCompilationFailed: return "compilation failed";
    }
    return "unknown";
}

std::string FormatSeconds(std::chrono::milliseconds duration) {
    std::ostringstream out;
    out << static_cast<double>(duration.count()) / 1000.0;
    return out.str();
}

ExecutionPipeline::ExecutionPipeline(const LanguageRegistry& registry, ArtifactStore& store,
                                     Runner& runner, PipelineConfig config)
    : registry_(registry), store_(store), runner_(runner), config_(config) {}

ExecutionResult ExecutionPipeline::Execute(const Job& job) {
    ExecutionResult result;
    result.language = job.language;

    if (job.code.empty()) {
        result.status = PipelineStatus::kInvalidRequest;
        result.error = "No Code found to execute.";
        result.info = registry_.Info(job.language);
        return result;
    }

    const LanguageDefinition* def = registry_.Find(job.language);
    if (!def) {
        result.status = PipelineStatus::kInvalidRequest;
        result.error = "Please enter a valid language. The languages currently supported are: " +
                       JoinLanguages(registry_.SupportedLanguages()) + ".";
        return result;
    }

    const std::string job_id = store_.Create(job.language, job.code);
    Logger::Info("Job ", job_id, " created for language ", job.language);

    {
        ArtifactCleanup cleanup(store_, job_id, job.language, def->output_extension);
        const CommandSpec spec = registry_.Resolve(job_id, job.language);

        if (!spec.compile_command || Compile(spec, &result)) {
            RunProgram(spec, job, &result);
        }
    }

    result.info = registry_.Info(job.language);
    Logger::Info("Job ", job_id, " finished: ", PipelineStatusName(result.status));
    return result;
}

bool ExecutionPipeline::Compile(const CommandSpec& spec, ExecutionResult* result) {
    ProcessOutcome outcome = runner_.Run(*spec.compile_command, spec.compilation_args,
                                         std::nullopt, config_.compile_timeout);
    if (outcome.ExitedCleanly()) {
        Logger::Debug("Compiled in ", outcome.duration.count(), "ms");
        return true;
    }

    result->status = PipelineStatus::kCompilationFailed;
    result->output.clear();
    if (outcome.spawn_error) {
        result->error = "Compilation error: " + *outcome.spawn_error;
    } else if (outcome.timed_out) {
        result->error = "Compilation timed out";
    } else if (!outcome.stderr_text.empty()) {
        result->error = outcome.stderr_text;
    } else if (!outcome.stdout_text.empty()) {
        result->error = outcome.stdout_text;
    } else {
        result->error = "Compilation failed";
    }
    return false;
}

void ExecutionPipeline::RunProgram(const CommandSpec& spec, const Job& job, ExecutionResult* result) {
    if (!spec.execute_command) {
        result->output.clear();
        result->error = "Executable not found";
        return;
    }

    ProcessOutcome outcome = runner_.Run(*spec.execute_command, spec.execution_args, job.input,
                                         config_.execute_timeout);
    if (outcome.spawn_error) {
        result->output.clear();
        result->error = "Runtime error: " + *outcome.spawn_error;
        return;
    }

    result->output = std::move(outcome.stdout_text);
    result->error = std::move(outcome.stderr_text);
    if (outcome.timed_out) {
        result->error += "\nExecution timed out after " + FormatSeconds(config_.execute_timeout) + " seconds";
    } else if (outcome.exit_signal) {
        result->error += "\nProcess terminated by signal: " + SignalName(*outcome.exit_signal);
    }
}

} // namespace runbox
