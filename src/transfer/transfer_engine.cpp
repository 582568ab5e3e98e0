#include "relaydrop/transfer/transfer_engine.hpp"
#include "relaydrop/core/config.hpp"
#include "relaydrop/core/logger.hpp"
#include "relaydrop/storage/chunk_layout.hpp"
#include "relaydrop/storage/chunk_manager.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <algorithm>
#include <atomic>
#include <fstream>
#include <mutex>
#include <optional>
#include <thread>

namespace relaydrop::transfer {

using core::ErrorCode;
using core::Result;
using storage::ChunkManager;
using storage::FileManifest;
using storage::FolderManifest;
using storage::Manifest;

EngineOptions EngineOptions::from_config(const core::Config& config) {
    EngineOptions options;
    options.max_parallel = static_cast<std::size_t>(
        std::max(1, config.get_int("transfer.max_parallel", static_cast<int>(options.max_parallel))));
    options.min_parallel = static_cast<std::size_t>(
        std::max(1, config.get_int("transfer.min_parallel", static_cast<int>(options.min_parallel))));
    options.max_retry_attempts = static_cast<std::uint32_t>(
        std::max(1, config.get_int("transfer.max_retry_attempts", static_cast<int>(options.max_retry_attempts))));
    options.retry_base_delay = std::chrono::milliseconds(
        std::max(0, config.get_int("transfer.retry_delay_ms", static_cast<int>(options.retry_base_delay.count()))));
    return options;
}

std::size_t EngineOptions::worker_count() const {
    auto lower = std::max<std::size_t>(1, min_parallel);
    return std::max(lower, max_parallel);
}

class TransferEngine::ProgressTracker {
public:
    ProgressTracker(std::uint64_t total, std::uint64_t already_done, ProgressCallback callback)
        : total_(total), completed_(already_done), callback_(std::move(callback)) {}

    void advance() {
        std::lock_guard<std::mutex> lock(mutex_);
        ++completed_;
        if (!callback_) {
            return;
        }
        try {
            callback_(completed_, total_);
        } catch (const std::exception& e) {
            LOG_WARN("Progress callback threw at {}/{}: {}", completed_, total_, e.what());
        } catch (...) {
            LOG_WARN("Progress callback threw a non-standard exception at {}/{}", completed_, total_);
        }
    }

    std::uint64_t completed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return completed_;
    }

private:
    mutable std::mutex mutex_;
    std::uint64_t total_;
    std::uint64_t completed_;
    ProgressCallback callback_;
};

TransferEngine::TransferEngine(EngineOptions options)
    : options_(std::move(options)) {
}

Result TransferEngine::with_retry(const std::string& what, const std::function<Result()>& operation) const {
    const auto attempts = std::max<std::uint32_t>(1, options_.max_retry_attempts);

    Result last;
    for (std::uint32_t attempt = 1; attempt <= attempts; ++attempt) {
        last = operation();
        if (last.success() || !last.is_retryable()) {
            return last;
        }

        if (attempt < attempts) {
            auto delay = options_.retry_base_delay * attempt;
            LOG_WARN("{} failed (attempt {}/{}): {}; retrying in {}ms",
                     what, attempt, attempts, last.message, delay.count());
            std::this_thread::sleep_for(delay);
        }
    }

    LOG_ERROR("{} failed after {} attempts: {}", what, attempts, last.message);
    return Result(ErrorCode::EXHAUSTED,
                  what + " failed after " + std::to_string(attempts) + " attempts: " + last.message,
                  last.reason);
}

Result TransferEngine::run_jobs(const std::vector<ChunkJob>& jobs,
                                const std::function<Result(const ChunkJob&)>& work,
                                ProgressTracker& progress) const {
    if (jobs.empty()) {
        return Result();
    }

    std::atomic<bool> failed{false};
    std::mutex error_mutex;
    std::optional<Result> first_error;

    auto record_failure = [&](Result error) {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!first_error) {
            first_error = std::move(error);
        }
        failed = true;
    };

    boost::asio::thread_pool pool(std::min(options_.worker_count(), jobs.size()));
    for (const auto& job : jobs) {
        boost::asio::post(pool, [&, job_ptr = &job]() {
            if (failed) {
                return;
            }

            Result result;
            try {
                result = work(*job_ptr);
            } catch (const std::exception& e) {
                result = Result(ErrorCode::IO_FAILURE,
                                "Chunk " + std::to_string(job_ptr->address.global_id) + ": " + e.what());
            }

            if (result) {
                progress.advance();
            } else {
                record_failure(std::move(result));
            }
        });
    }
    pool.join();

    if (first_error) {
        return *first_error;
    }
    return Result();
}

Result TransferEngine::upload(ChunkSink& sink,
                              const std::string& transfer_id,
                              const Manifest& manifest,
                              ProgressCallback on_progress) {
    auto result = with_retry("Create transfer " + transfer_id,
                             [&] { return sink.create(transfer_id, manifest); });
    if (!result) {
        return result;
    }

    const auto layout = storage::flatten_chunk_layout(manifest);
    const bool folder = storage::is_folder(manifest);

    std::vector<ChunkJob> jobs;
    for (const auto& range : layout) {
        const FileManifest& file = folder
            ? std::get<FolderManifest>(manifest).files[range.file_index]
            : std::get<FileManifest>(manifest);

        for (std::uint64_t local = 0; local < range.chunk_count; ++local) {
            ChunkJob job;
            job.address.global_id = range.first_global_id + local;
            if (folder) {
                job.address.file_index = range.file_index;
            }
            job.address.local_id = local;
            job.path = file.file_path;
            job.info = &file.chunks[local];
            jobs.push_back(std::move(job));
        }
    }

    const auto total = jobs.size();
    LOG_INFO("Uploading {} ({} chunks) as transfer {}", storage::display_name(manifest), total, transfer_id);

    ChunkManager chunks(storage::chunk_size(manifest));
    ProgressTracker progress(total, 0, std::move(on_progress));

    result = run_jobs(jobs, [&](const ChunkJob& job) -> Result {
        std::vector<std::uint8_t> data;
        auto read = chunks.read_chunk(job.path, job.address.local_id, data);
        if (!read) {
            return read;
        }
        if (!chunks.verify_chunk(data, job.info->hash)) {
            return Result(ErrorCode::HASH_MISMATCH,
                          job.path.string() + " changed since its manifest was built (chunk " +
                          std::to_string(job.address.local_id) + ")");
        }

        return with_retry("Upload chunk " + std::to_string(job.address.global_id), [&]() -> Result {
            storage::StoredChunk stored;
            auto put = sink.put_chunk(transfer_id, job.address.global_id, data, stored);
            if (!put) {
                return put;
            }
            if (stored.hash != job.info->hash || stored.size != data.size()) {
                return Result(ErrorCode::NETWORK_FAILURE,
                              "Chunk " + std::to_string(job.address.global_id) + " corrupted in transit");
            }
            return Result();
        });
    }, progress);

    if (!result) {
        LOG_ERROR("Upload of transfer {} failed: {}", transfer_id, result.message);
        return result;
    }

    LOG_INFO("Upload of transfer {} complete", transfer_id);
    return Result();
}

namespace {

Result ensure_empty_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Result(ErrorCode::IO_FAILURE, "Cannot create " + path.parent_path().string() + ": " + ec.message());
        }
    }
    std::ofstream file(path, std::ios::binary | std::ios::app);
    if (!file.is_open()) {
        return Result(ErrorCode::IO_FAILURE, "Cannot create " + path.string());
    }
    return Result();
}

}

Result TransferEngine::download(ChunkSource& source,
                                const std::string& transfer_id,
                                const std::filesystem::path& output,
                                DownloadReport& report,
                                ProgressCallback on_progress,
                                const Manifest* expected) {
    Manifest manifest;
    auto result = with_retry("Fetch manifest of " + transfer_id,
                             [&] { return source.get_manifest(transfer_id, manifest); });
    if (!result) {
        return result;
    }

    result = std::visit([](const auto& m) { return storage::validate(m); }, manifest);
    if (!result) {
        LOG_ERROR("Rejecting manifest of transfer {}: {}", transfer_id, result.message);
        return result;
    }

    if (expected && manifest != *expected) {
        LOG_ERROR("Manifest of transfer {} differs from the expected {}",
                  transfer_id, storage::display_name(*expected));
        return Result(ErrorCode::INVALID_INPUT,
                      "Source manifest for " + transfer_id + " differs from the expected one");
    }

    const bool folder = storage::is_folder(manifest);
    std::vector<const FileManifest*> files;
    std::vector<std::filesystem::path> destinations;

    if (folder) {
        const auto& folder_manifest = std::get<FolderManifest>(manifest);
        for (const auto& file : folder_manifest.files) {
            if (!storage::is_safe_relative_path(file.relative_path)) {
                return Result(ErrorCode::INVALID_INPUT, "Unsafe path in manifest: " + file.relative_path);
            }
            files.push_back(&file);
            destinations.push_back(output / std::filesystem::path(file.relative_path));
        }
    } else {
        const auto& file = std::get<FileManifest>(manifest);
        if (!storage::is_safe_file_name(file.file_name)) {
            return Result(ErrorCode::INVALID_INPUT, "Unsafe file name in manifest: " + file.file_name);
        }
        std::error_code ec;
        auto destination = std::filesystem::is_directory(output, ec) ? output / file.file_name : output;
        files.push_back(&file);
        destinations.push_back(destination);
    }

    ChunkManager chunks(storage::chunk_size(manifest));
    const auto layout = storage::flatten_chunk_layout(manifest);

    std::vector<ChunkJob> jobs;
    std::uint64_t resumed = 0;
    for (const auto& range : layout) {
        const auto& file = *files[range.file_index];
        const auto& destination = destinations[range.file_index];

        if (range.chunk_count == 0) {
            result = ensure_empty_file(destination);
            if (!result) {
                return result;
            }
            continue;
        }

        auto missing = chunks.get_missing_chunks(destination, range.chunk_count);
        resumed += range.chunk_count - missing.size();

        for (auto local : missing) {
            ChunkJob job;
            job.address.global_id = range.first_global_id + local;
            if (folder) {
                job.address.file_index = range.file_index;
            }
            job.address.local_id = local;
            job.path = destination;
            job.info = &file.chunks[local];
            jobs.push_back(std::move(job));
        }
    }

    const auto total = storage::total_chunks(manifest);
    if (resumed > 0) {
        LOG_INFO("Resuming transfer {}: {}/{} chunks already present", transfer_id, resumed, total);
    } else {
        LOG_INFO("Downloading transfer {} ({}, {} chunks)", transfer_id, storage::display_name(manifest), total);
    }

    ProgressTracker progress(total, resumed, std::move(on_progress));

    result = run_jobs(jobs, [&](const ChunkJob& job) -> Result {
        std::vector<std::uint8_t> data;
        auto fetched = with_retry("Download chunk " + std::to_string(job.address.global_id), [&]() -> Result {
            auto get = source.get_chunk(transfer_id, job.address, data);
            if (!get) {
                return get;
            }
            if (!chunks.verify_chunk(data, job.info->hash)) {
                return Result(ErrorCode::NETWORK_FAILURE,
                              "Chunk " + std::to_string(job.address.global_id) + " failed verification");
            }
            return Result();
        });
        if (!fetched) {
            return fetched;
        }
        return chunks.write_chunk(job.path, job.address.local_id, data);
    }, progress);

    if (!result) {
        LOG_ERROR("Download of transfer {} failed: {}", transfer_id, result.message);
        return result;
    }

    std::vector<std::string> corrupt;
    for (std::size_t i = 0; i < files.size(); ++i) {
        if (!chunks.verify_file(destinations[i], files[i]->hash)) {
            corrupt.push_back(destinations[i].string());
        }
    }

    report.manifest = manifest;
    report.files = destinations;
    report.total_chunks = total;
    report.resumed_chunks = resumed;
    report.downloaded_chunks = jobs.size();

    if (!corrupt.empty()) {
        std::string names;
        for (const auto& name : corrupt) {
            names += names.empty() ? name : ", " + name;
        }
        LOG_ERROR("Integrity check failed for transfer {}: {}", transfer_id, names);
        return Result(ErrorCode::HASH_MISMATCH, "Integrity check failed: " + names);
    }

    LOG_INFO("Download of transfer {} complete ({} chunks fetched, {} resumed)",
             transfer_id, jobs.size(), resumed);
    return Result();
}

} // namespace relaydrop::transfer
