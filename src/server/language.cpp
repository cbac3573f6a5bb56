#include "src/server/language.h"
#include "src/server/logger.h"

#include <stdexcept>
#include <utility>

namespace runbox {

namespace {

void ReplaceAll(std::string* text, const std::string& placeholder, const std::string& value) {
    size_t pos = 0;
    while ((pos = text->find(placeholder, pos)) != std::string::npos) {
        text->replace(pos, placeholder.size(), value);
        pos += value.size();
    }
}

struct Substitution {
    std::string source;
    std::string output;
    std::string dir;
    std::string job;

    std::string Apply(std::string text) const {
        ReplaceAll(&text, "{source}", source);
        ReplaceAll(&text, "{output}", output);
        ReplaceAll(&text, "{dir}", dir);
        ReplaceAll(&text, "{job}", job);
        return text;
    }
};

// Splits a template into the command and its arguments.
void Expand(const std::vector<std::string>& tmpl, const Substitution& sub,
            std::optional<std::string>* command, std::vector<std::string>* args) {
    if (tmpl.empty()) return;
    *command = sub.Apply(tmpl.front());
    for (size_t i = 1; i < tmpl.size(); ++i) {
        args->push_back(sub.Apply(tmpl[i]));
    }
}

LanguageDefinition Define(std::string id, std::string source_ext, std::string output_ext,
                          std::vector<std::string> compile, std::vector<std::string> execute,
                          std::string name, std::string toolchain,
                          std::vector<std::string> version_command) {
    LanguageDefinition def;
    def.id = id;
    def.source_extension = std::move(source_ext);
    def.output_extension = std::move(output_ext);
    def.compile = std::move(compile);
    def.execute = std::move(execute);
    def.info.id = std::move(id);
    def.info.name = std::move(name);
    def.info.toolchain = std::move(toolchain);
    def.info.version_command = std::move(version_command);
    return def;
}

} // namespace

LanguageRegistry::LanguageRegistry(std::string directory, std::vector<LanguageDefinition> definitions)
    : directory_(std::move(directory)) {
    while (directory_.size() > 1 && directory_.back() == '/') {
        directory_.pop_back();
    }
    for (auto& def : definitions) {
        if (def.id.empty()) {
            throw std::invalid_argument("language definition without an id");
        }
        def.info.id = def.id;
        def.info.compiled = !def.compile.empty();
        std::string id = def.id;
        if (!definitions_.emplace(id, std::move(def)).second) {
            throw std::invalid_argument("duplicate language definition: " + id);
        }
        ids_.push_back(std::move(id));
    }
}

std::vector<LanguageDefinition> LanguageRegistry::BuiltinDefinitions() {
    return {
        Define("java", "java", "", {}, {"java", "{source}"},
               "Java", "OpenJDK", {"java", "--version"}),
        Define("py", "py", "", {}, {"python3", "{source}"},
               "Python 3", "CPython", {"python3", "--version"}),
        Define("cpp", "cpp", "out", {"g++", "{source}", "-o", "{output}"}, {"{output}"},
               "C++", "GCC", {"g++", "--version"}),
        Define("c", "c", "out", {"gcc", "{source}", "-o", "{output}"}, {"{output}"},
               "C", "GCC", {"gcc", "--version"}),
        Define("js", "js", "", {}, {"node", "{source}"},
               "JavaScript", "Node.js", {"node", "--version"}),
        Define("go", "go", "", {}, {"go", "run", "{source}"},
               "Go", "Go toolchain", {"go", "version"}),
        Define("cs", "cs", "exe", {"mcs", "-out:{output}", "{source}"}, {"mono", "{output}"},
               "C#", "Mono", {"mcs", "--version"}),
    };
}

bool LanguageRegistry::IsSupported(const std::string& language) const {
    return definitions_.count(language) != 0;
}

const LanguageDefinition* LanguageRegistry::Find(const std::string& language) const {
    auto it = definitions_.find(language);
    return it == definitions_.end() ? nullptr : &it->second;
}

std::string LanguageRegistry::SourcePath(const std::string& job_id, const std::string& language) const {
    const LanguageDefinition* def = Find(language);
    if (!def) {
        throw std::invalid_argument("unsupported language: " + language);
    }
    return directory_ + "/" + job_id + "." + def->source_extension;
}

CommandSpec LanguageRegistry::Resolve(const std::string& job_id, const std::string& language) const {
    const LanguageDefinition* def = Find(language);
    if (!def) {
        throw std::invalid_argument("unsupported language: " + language);
    }

    Substitution sub;
    sub.source = SourcePath(job_id, language);
    sub.output = def->output_extension.empty()
        ? directory_ + "/" + job_id
        : directory_ + "/" + job_id + "." + def->output_extension;
    sub.dir = directory_;
    sub.job = job_id;

    CommandSpec spec;
    Expand(def->compile, sub, &spec.compile_command, &spec.compilation_args);
    Expand(def->execute, sub, &spec.execute_command, &spec.execution_args);
    spec.output_extension = def->output_extension;
    return spec;
}

LanguageInfo LanguageRegistry::Info(const std::string& language) const {
    const LanguageDefinition* def = Find(language);
    return def ? def->info : LanguageInfo{};
}

std::vector<LanguageDefinition> ProbeVersions(std::vector<LanguageDefinition> definitions,
                                              Runner& runner,
                                              std::chrono::milliseconds timeout) {
    for (auto& def : definitions) {
        const auto& cmd = def.info.version_command;
        if (cmd.empty()) continue;

        ProcessOutcome outcome = runner.Run(
            cmd.front(), std::vector<std::string>(cmd.begin() + 1, cmd.end()), std::nullopt, timeout);
        if (!outcome.ExitedCleanly()) {
            Logger::Warn("Version probe for ", def.id, " failed",
                         outcome.spawn_error ? ": " + *outcome.spawn_error : std::string());
            continue;
        }

        // Some toolchains (older javac, python2) print the version on stderr.
        const std::string& text = outcome.stdout_text.empty() ? outcome.stderr_text : outcome.stdout_text;
        def.info.version = text.substr(0, text.find('\n'));
        Logger::Info("Language ", def.id, ": ", def.info.version);
    }
    return definitions;
}

} // namespace runbox
