#include "src/server/service.h"
#include "src/server/logger.h"

#include <exception>
#include <mutex>
#include <thread>

using grpc::CallbackServerContext;
using grpc::ServerUnaryReactor;
using grpc::Status;
using grpc::StatusCode;

namespace runbox {

namespace {

// Runs one job on a worker thread; the thread is joined once gRPC is done
// with the call.
class RunReactor : public ServerUnaryReactor {
public:
    RunReactor(ExecutionPipeline& pipeline, const RunRequest* request, RunResponse* response,
               std::atomic<int>& counter)
        : counter_(counter) {
        std::lock_guard<std::mutex> lock(mutex_);
        worker_thread_ = std::thread([this, &pipeline, request, response]() {
            Job job{request->language(), request->code(), request->input()};
            Logger::Info("Starting execution for language: ", job.language);

            Status status;
            try {
                status = ToResponse(pipeline.Execute(job), response);
            } catch (const ArtifactError& e) {
                Logger::Error("Cannot materialize job: ", e.what());
                status = Status(StatusCode::INTERNAL, e.what());
            } catch (const std::exception& e) {
                Logger::Error("Job failed unexpectedly: ", e.what());
                status = Status(StatusCode::INTERNAL, "internal error");
            }
            Finish(status);
        });
    }

    void OnDone() override {
        Logger::Debug("RPC OnDone called.");
        std::thread worker;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            worker = std::move(worker_thread_);
        }
        if (worker.joinable()) {
            // gRPC may run OnDone inline from Finish on the worker itself.
            if (worker.get_id() == std::this_thread::get_id()) {
                worker.detach();
            } else {
                worker.join();
            }
        }
        counter_.fetch_sub(1);
        delete this;
    }

    void OnCancel() override {
        Logger::Warn("RPC cancelled by client; the job runs to its deadline.");
    }

private:
    std::mutex mutex_;
    std::thread worker_thread_;
    std::atomic<int>& counter_;
};

} // namespace

void ToDescription(const LanguageInfo& info, LanguageDescription* description) {
    description->set_id(info.id);
    description->set_name(info.name);
    description->set_toolchain(info.toolchain);
    description->set_version(info.version);
    description->set_compiled(info.compiled);
}

Status ToResponse(const ExecutionResult& result, RunResponse* response) {
    if (result.status == PipelineStatus::kInvalidRequest) {
        return Status(StatusCode::INVALID_ARGUMENT, result.error);
    }

    response->set_output(result.output);
    response->set_error(result.error);
    response->set_language(result.language);
    ToDescription(result.info, response->mutable_info());
    response->set_status(result.status == PipelineStatus::kCompilationFailed
                             ? RUN_STATUS_COMPILATION_FAILED
                             : RUN_STATUS_OK);
    return Status::OK;
}

CodeRunnerServiceImpl::CodeRunnerServiceImpl(ExecutionPipeline& pipeline,
                                             const LanguageRegistry& registry,
                                             int max_active_jobs)
    : pipeline_(pipeline), registry_(registry), max_active_jobs_(max_active_jobs), active_jobs_(0) {}

ServerUnaryReactor* CodeRunnerServiceImpl::Run(CallbackServerContext* context,
                                               const RunRequest* request,
                                               RunResponse* response) {
    int active = active_jobs_.fetch_add(1);
    Logger::Info("Received Run request. Active jobs: ", active + 1);

    if (active >= max_active_jobs_) {
        active_jobs_.fetch_sub(1);
        Logger::Warn("Too many active jobs. Rejecting request.");
        ServerUnaryReactor* reactor = context->DefaultReactor();
        reactor->Finish(Status(StatusCode::RESOURCE_EXHAUSTED, "Too many active jobs"));
        return reactor;
    }

    return new RunReactor(pipeline_, request, response, active_jobs_);
}

ServerUnaryReactor* CodeRunnerServiceImpl::ListLanguages(CallbackServerContext* context,
                                                         const ListLanguagesRequest* /*request*/,
                                                         ListLanguagesResponse* response) {
    for (const auto& id : registry_.SupportedLanguages()) {
        ToDescription(registry_.Info(id), response->add_languages());
    }
    ServerUnaryReactor* reactor = context->DefaultReactor();
    reactor->Finish(Status::OK);
    return reactor;
}

} // namespace runbox
