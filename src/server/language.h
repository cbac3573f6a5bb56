#pragma once

#include "src/server/process.h"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace runbox {

// Descriptive metadata attached to every response.
struct LanguageInfo {
    std::string id;
    std::string name;
    std::string toolchain;
    std::vector<std::string> version_command;
    std::string version;
    bool compiled = false;
};

// Resolved invocation for one job. Immutable once resolved.
struct CommandSpec {
    std::optional<std::string> compile_command;
    std::vector<std::string> compilation_args;
    std::optional<std::string> execute_command;
    std::vector<std::string> execution_args;
    std::string output_extension;
};

// Command templates are argv vectors; each element may contain the
// placeholders {source}, {output}, {dir} and {job}.
struct LanguageDefinition {
    std::string id;
    std::string source_extension;
    std::string output_extension;
    std::vector<std::string> compile;
    std::vector<std::string> execute;
    LanguageInfo info;
};

// Immutable language table, built once at startup and shared by all jobs.
class LanguageRegistry {
public:
    // Throws std::invalid_argument on duplicate or empty language ids.
    LanguageRegistry(std::string directory, std::vector<LanguageDefinition> definitions);

    static std::vector<LanguageDefinition> BuiltinDefinitions();

    const std::string& directory() const { return directory_; }
    const std::vector<std::string>& SupportedLanguages() const { return ids_; }
    bool IsSupported(const std::string& language) const;
    const LanguageDefinition* Find(const std::string& language) const;

    // Throws std::invalid_argument for an unsupported language.
    CommandSpec Resolve(const std::string& job_id, const std::string& language) const;

    // Empty metadata for an unsupported language.
    LanguageInfo Info(const std::string& language) const;

    std::string SourcePath(const std::string& job_id, const std::string& language) const;

private:
    std::string directory_;
    std::vector<std::string> ids_;
    std::map<std::string, LanguageDefinition> definitions_;
};

// Runs each definition's version command once and records the first line it
// prints. Failures leave the version empty.
std::vector<LanguageDefinition> ProbeVersions(std::vector<LanguageDefinition> definitions,
                                              Runner& runner,
                                              std::chrono::milliseconds timeout);

} // namespace runbox
