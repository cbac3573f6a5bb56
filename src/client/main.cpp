#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include "proto/runbox.grpc.pb.h"

using grpc::Channel;
using grpc::ClientContext;
using grpc::Status;
using runbox::CodeRunner;
using runbox::ListLanguagesRequest;
using runbox::ListLanguagesResponse;
using runbox::RunRequest;
using runbox::RunResponse;

namespace {

bool ReadFile(const std::string& path, std::string* content) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    *content = ss.str();
    return true;
}

int ListLanguages(CodeRunner::Stub& stub) {
    ClientContext context;
    ListLanguagesResponse response;
    Status status = stub.ListLanguages(&context, ListLanguagesRequest(), &response);
    if (!status.ok()) {
        std::cerr << "ListLanguages failed: " << status.error_message() << std::endl;
        return 1;
    }
    for (const auto& lang : response.languages()) {
        std::cout << lang.id() << "\t" << lang.name() << "\t"
                  << (lang.compiled() ? "compiled" : "interpreted") << "\t"
                  << lang.version() << std::endl;
    }
    return 0;
}

void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--server ADDR] --list\n"
              << "       " << program << " [--server ADDR] LANGUAGE SOURCE_FILE [INPUT_FILE]\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string server_address = "localhost:50051";
    bool list = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--server" && i + 1 < argc) {
            server_address = argv[++i];
        } else if (arg == "--list") {
            list = true;
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else {
            positional.push_back(arg);
        }
    }

    std::shared_ptr<Channel> channel =
        grpc::CreateChannel(server_address, grpc::InsecureChannelCredentials());
    std::unique_ptr<CodeRunner::Stub> stub = CodeRunner::NewStub(channel);

    if (list) {
        return ListLanguages(*stub);
    }
    if (positional.size() < 2 || positional.size() > 3) {
        PrintUsage(argv[0]);
        return 2;
    }

    RunRequest request;
    request.set_language(positional[0]);
    std::string content;
    if (!ReadFile(positional[1], &content)) {
        std::cerr << "Cannot read " << positional[1] << std::endl;
        return 2;
    }
    request.set_code(content);
    if (positional.size() == 3) {
        if (!ReadFile(positional[2], &content)) {
            std::cerr << "Cannot read " << positional[2] << std::endl;
            return 2;
        }
        request.set_input(content);
    }

    ClientContext context;
    RunResponse response;
    Status status = stub->Run(&context, request, &response);
    if (!status.ok()) {
        std::cerr << "Run failed (" << status.error_code() << "): " << status.error_message() << std::endl;
        return 1;
    }

    std::cout << response.output();
    if (!response.error().empty()) {
        std::cerr << response.error() << std::endl;
    }
    return response.status() == runbox::RUN_STATUS_OK ? 0 : 1;
}
