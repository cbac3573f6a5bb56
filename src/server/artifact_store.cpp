#include "src/server/artifact_store.h"
#include "src/server/logger.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <unistd.h>

namespace runbox {

namespace fs = std::filesystem;

namespace {

constexpr int kMaxCreateAttempts = 8;

bool WriteAll(int fd, const std::string& content) {
    size_t written = 0;
    while (written < content.size()) {
        ssize_t bytes = write(fd, content.data() + written, content.size() - written);
        if (bytes < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(bytes);
    }
    return true;
}

void RemoveFile(const std::string& path) {
    std::error_code ec;
    if (fs::remove(path, ec)) {
        Logger::Debug("Removed artifact: ", path);
    } else if (ec) {
        Logger::Warn("Failed to remove artifact: ", path, " - ", ec.message());
    }
}

} // namespace

FileArtifactStore::FileArtifactStore(const LanguageRegistry& registry)
    : registry_(registry), rng_(std::random_device{}()) {
    std::error_code ec;
    fs::create_directories(registry_.directory(), ec);
    if (ec) {
        throw ArtifactError("cannot create artifact directory " + registry_.directory() + ": " + ec.message());
    }
    Logger::Info("Artifact directory: ", registry_.directory());
}

std::string FileArtifactStore::NextId() {
    unsigned long long random_part;
    {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        random_part = rng_();
    }
    char id[40];
    std::snprintf(id, sizeof(id), "%016llx%08llx", random_part,
                  sequence_.fetch_add(1) & 0xffffffffULL);
    return id;
}

std::string FileArtifactStore::Create(const std::string& language, const std::string& code) {
    for (int attempt = 0; attempt < kMaxCreateAttempts; ++attempt) {
        std::string job_id = NextId();
        std::string path = registry_.SourcePath(job_id, language);

        int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        if (fd == -1) {
            if (errno == EEXIST) continue;
            throw ArtifactError("cannot create " + path + ": " + strerror(errno));
        }

        bool ok = WriteAll(fd, code);
        int write_errno = errno;
        close(fd);
        if (!ok) {
            RemoveFile(path);
            throw ArtifactError("cannot write " + path + ": " + strerror(write_errno));
        }

        Logger::Debug("Created artifact ", path);
        return job_id;
    }
    throw ArtifactError("no free job id after " + std::to_string(kMaxCreateAttempts) + " attempts");
}

void FileArtifactStore::Remove(const std::string& job_id, const std::string& language,
                               const std::string& output_extension) {
    const LanguageDefinition* def = registry_.Find(language);
    if (!def) {
        Logger::Warn("Remove called for unknown language ", language, " (job ", job_id, ")");
        return;
    }
    RemoveFile(registry_.SourcePath(job_id, language));
    if (!output_extension.empty()) {
        RemoveFile(registry_.directory() + "/" + job_id + "." + output_extension);
    }
}

} // namespace runbox
