#pragma once

#include "transport.hpp"
#include "relaydrop/core/result.hpp"
#include "relaydrop/storage/manifest.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace relaydrop::core {
class Config;
}

namespace relaydrop::transfer {

struct EngineOptions {
    std::size_t max_parallel = 5;
    std::size_t min_parallel = 1;
    std::uint32_t max_retry_attempts = 3;
    std::chrono::milliseconds retry_base_delay{2000};

    static EngineOptions from_config(const core::Config& config);

    std::size_t worker_count() const;
};

// (completed, total). Invoked from worker threads, one call at a time.
using ProgressCallback = std::function<void(std::uint64_t, std::uint64_t)>;

struct DownloadReport {
    storage::Manifest manifest;
    std::vector<std::filesystem::path> files;
    std::uint64_t total_chunks = 0;
    std::uint64_t resumed_chunks = 0;
    std::uint64_t downloaded_chunks = 0;
};

class TransferEngine {
public:
    explicit TransferEngine(EngineOptions options = {});

    core::Result upload(ChunkSink& sink,
                        const std::string& transfer_id,
                        const storage::Manifest& manifest,
                        ProgressCallback on_progress = nullptr);

    // `output` is the destination file, or a directory to place it in; for a folder
    // it is the root the members are written under. Partially present files resume.
    // When `expected` is given, a source manifest that differs from it is refused
    // before anything is written.
    core::Result download(ChunkSource& source,
                          const std::string& transfer_id,
                          const std::filesystem::path& output,
                          DownloadReport& report,
                          ProgressCallback on_progress = nullptr,
                          const storage::Manifest* expected = nullptr);

    const EngineOptions& options() const { return options_; }

private:
    struct ChunkJob {
        storage::ChunkAddress address;
        std::filesystem::path path;
        const storage::ChunkInfo* info = nullptr;
    };

    class ProgressTracker;

    EngineOptions options_;

    core::Result run_jobs(const std::vector<ChunkJob>& jobs,
                          const std::function<core::Result(const ChunkJob&)>& work,
                          ProgressTracker& progress) const;

    core::Result with_retry(const std::string& what, const std::function<core::Result()>& operation) const;
};

} // namespace relaydrop::transfer
