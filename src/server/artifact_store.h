#pragma once

#include "src/server/language.h"

#include <atomic>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>

namespace runbox {

class ArtifactError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Persists submitted code and removes every artifact a job produced.
class ArtifactStore {
public:
    virtual ~ArtifactStore() = default;

    // Returns a fresh id, unique among jobs alive in this process.
    virtual std::string Create(const std::string& language, const std::string& code) = 0;

    // Deletes the source and, when output_extension is non-empty, the compiled
    // artifact. Idempotent; must not throw.
    virtual void Remove(const std::string& job_id, const std::string& language,
                        const std::string& output_extension) = 0;
};

// Stores artifacts as <dir>/<job_id>.<ext> in the registry's directory.
class FileArtifactStore : public ArtifactStore {
public:
    // Creates the directory if needed. Throws ArtifactError if that fails.
    explicit FileArtifactStore(const LanguageRegistry& registry);

    std::string Create(const std::string& language, const std::string& code) override;
    void Remove(const std::string& job_id, const std::string& language,
                const std::string& output_extension) override;

private:
    std::string NextId();

    const LanguageRegistry& registry_;
    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
    std::atomic<unsigned long long> sequence_{0};
};

} // namespace runbox
