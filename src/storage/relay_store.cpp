#include "relaydrop/storage/relay_store.hpp"
#include "relaydrop/core/logger.hpp"
#include "relaydrop/core/utils.hpp"
#include "relaydrop/crypto/hash.hpp"
#include <algorithm>
#include <cstdio>
#include <fstream>

namespace relaydrop::storage {

using core::ErrorCode;
using core::NotFoundReason;
using core::Result;
using core::utils::FileUtils;
using core::utils::StringUtils;
using core::utils::TimeUtils;
using nlohmann::json;

namespace {

constexpr std::size_t MAX_TRANSFER_ID_LENGTH = 128;
constexpr const char* CHUNK_PREFIX = "chunk_";

}

RelayStore::RelayStore(std::filesystem::path root, std::chrono::seconds retention)
    : root_(std::move(root)), retention_(retention) {
}

RelayStore::RelayStore(const StorageConfig& config)
    : RelayStore(config.upload_directory, config.cleanup_after) {
}

Result RelayStore::initialize() {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        LOG_ERROR("Cannot create relay storage root {}: {}", root_.string(), ec.message());
        return Result(ErrorCode::IO_FAILURE, "Cannot create storage root: " + ec.message());
    }
    LOG_INFO("Relay storage at {} (retention {}h)", root_.string(),
             std::chrono::duration_cast<std::chrono::hours>(retention_).count());
    return Result();
}

bool RelayStore::is_valid_transfer_id(const std::string& transfer_id) {
    if (transfer_id.empty() || transfer_id.size() > MAX_TRANSFER_ID_LENGTH) {
        return false;
    }
    return std::all_of(transfer_id.begin(), transfer_id.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
               c == '-' || c == '_';
    });
}

std::string RelayStore::chunk_file_name(std::uint64_t chunk_id) {
    char name[32];
    std::snprintf(name, sizeof(name), "%s%06llu", CHUNK_PREFIX, static_cast<unsigned long long>(chunk_id));
    return name;
}

std::filesystem::path RelayStore::transfer_dir(const std::string& transfer_id) const {
    return root_ / transfer_id;
}

std::filesystem::path RelayStore::chunk_path(const std::string& transfer_id, std::uint64_t chunk_id) const {
    return transfer_dir(transfer_id) / CHUNKS_DIR / chunk_file_name(chunk_id);
}

Result RelayStore::check_transfer(const std::string& transfer_id) const {
    if (!is_valid_transfer_id(transfer_id)) {
        return Result(ErrorCode::INVALID_INPUT, "Invalid transfer id: " + transfer_id);
    }
    if (!FileUtils::exists(transfer_dir(transfer_id) / MANIFEST_FILE)) {
        return Result::not_found(NotFoundReason::TRANSFER_UNKNOWN, "Transfer not found: " + transfer_id);
    }
    return Result();
}

Result RelayStore::create(const std::string& transfer_id, const Manifest& manifest) {
    if (!is_valid_transfer_id(transfer_id)) {
        return Result(ErrorCode::INVALID_INPUT, "Invalid transfer id: " + transfer_id);
    }

    auto valid = std::visit([](const auto& m) { return validate(m); }, manifest);
    if (!valid) {
        return valid;
    }

    auto dir = transfer_dir(transfer_id);
    std::error_code ec;
    std::filesystem::create_directories(dir / CHUNKS_DIR, ec);
    if (ec) {
        LOG_ERROR("Cannot create storage for transfer {}: {}", transfer_id, ec.message());
        return Result(ErrorCode::IO_FAILURE, "Cannot create transfer storage: " + ec.message());
    }

    json record = {
        {"created_at_ms", TimeUtils::to_epoch_millis(TimeUtils::now())},
        {"manifest", to_json(manifest)}
    };

    if (!FileUtils::write_file_atomic(dir / MANIFEST_FILE, record.dump())) {
        LOG_ERROR("Cannot persist manifest for transfer {}", transfer_id);
        return Result(ErrorCode::IO_FAILURE, "Cannot write manifest for " + transfer_id);
    }

    LOG_INFO("Created transfer {} ({}, {} chunks)", transfer_id, display_name(manifest), total_chunks(manifest));
    return Result();
}

Result RelayStore::put_chunk(const std::string& transfer_id, std::uint64_t chunk_id,
                             const std::vector<std::uint8_t>& data, StoredChunk& stored) {
    Manifest manifest;
    std::int64_t created_at_ms = 0;
    auto result = load_record(transfer_id, manifest, created_at_ms);
    if (!result) {
        return result;
    }

    auto total = total_chunks(manifest);
    if (chunk_id >= total) {
        return Result(ErrorCode::INVALID_INPUT,
                      "Chunk " + std::to_string(chunk_id) + " out of range for " + std::to_string(total) + " chunks");
    }

    std::string_view content(reinterpret_cast<const char*>(data.data()), data.size());
    if (!FileUtils::write_file_atomic(chunk_path(transfer_id, chunk_id), content)) {
        LOG_ERROR("Cannot store chunk {} of transfer {}", chunk_id, transfer_id);
        return Result(ErrorCode::IO_FAILURE, "Cannot write chunk " + std::to_string(chunk_id));
    }

    stored.hash = crypto::hash_utils::hex_digest(data);
    stored.size = data.size();

    LOG_DEBUG("Stored chunk {} of transfer {} ({} bytes)", chunk_id, transfer_id, stored.size);
    return Result();
}

Result RelayStore::get_chunk(const std::string& transfer_id, std::uint64_t chunk_id,
                             std::vector<std::uint8_t>& data) const {
    auto result = check_transfer(transfer_id);
    if (!result) {
        return result;
    }

    auto path = chunk_path(transfer_id, chunk_id);
    if (!FileUtils::exists(path)) {
        return Result::not_found(NotFoundReason::CHUNK_PENDING,
                                 "Chunk " + std::to_string(chunk_id) + " not uploaded yet");
    }

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return Result(ErrorCode::IO_FAILURE, "Cannot open chunk " + std::to_string(chunk_id));
    }

    auto size = static_cast<std::size_t>(file.tellg());
    std::vector<std::uint8_t> buffer(size);
    file.seekg(0);
    file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(size));
    if (static_cast<std::size_t>(file.gcount()) != size) {
        LOG_ERROR("Short read of chunk {} of transfer {}", chunk_id, transfer_id);
        return Result(ErrorCode::IO_FAILURE, "Short read of chunk " + std::to_string(chunk_id));
    }

    data = std::move(buffer);
    return Result();
}

Result RelayStore::load_record(const std::string& transfer_id, Manifest& manifest,
                               std::int64_t& created_at_ms) const {
    auto result = check_transfer(transfer_id);
    if (!result) {
        return result;
    }

    auto content = FileUtils::read_file(transfer_dir(transfer_id) / MANIFEST_FILE);
    if (!content) {
        return Result(ErrorCode::IO_FAILURE, "Cannot read manifest of " + transfer_id);
    }

    json record;
    try {
        record = json::parse(*content);
        record.at("created_at_ms").get_to(created_at_ms);
    } catch (const json::exception& e) {
        LOG_ERROR("Corrupt manifest record for transfer {}: {}", transfer_id, e.what());
        return Result(ErrorCode::MANIFEST_CORRUPT, "Corrupt manifest record: " + std::string(e.what()));
    }

    if (!record.contains("manifest")) {
        return Result(ErrorCode::MANIFEST_CORRUPT, "Manifest record of " + transfer_id + " has no manifest");
    }

    result = from_json(record["manifest"], manifest);
    if (!result) {
        LOG_ERROR("Invalid stored manifest for transfer {}: {}", transfer_id, result.message);
        return Result(ErrorCode::MANIFEST_CORRUPT, result.message);
    }
    return Result();
}

Result RelayStore::get_manifest(const std::string& transfer_id, Manifest& manifest) const {
    std::int64_t created_at_ms = 0;
    return load_record(transfer_id, manifest, created_at_ms);
}

Result RelayStore::remove(const std::string& transfer_id) {
    if (!is_valid_transfer_id(transfer_id)) {
        return Result(ErrorCode::INVALID_INPUT, "Invalid transfer id: " + transfer_id);
    }

    auto dir = transfer_dir(transfer_id);
    if (!FileUtils::is_directory(dir)) {
        return Result::not_found(NotFoundReason::TRANSFER_UNKNOWN, "Transfer not found: " + transfer_id);
    }

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    if (ec) {
        LOG_ERROR("Cannot delete transfer {}: {}", transfer_id, ec.message());
        return Result(ErrorCode::IO_FAILURE, "Cannot delete transfer: " + ec.message());
    }

    LOG_INFO("Deleted transfer {}", transfer_id);
    return Result();
}

std::vector<std::uint64_t> RelayStore::scan_chunks(const std::string& transfer_id) const {
    std::vector<std::uint64_t> ids;

    std::error_code ec;
    std::filesystem::directory_iterator it(transfer_dir(transfer_id) / CHUNKS_DIR, ec);
    if (ec) {
        return ids;
    }

    const std::string_view prefix(CHUNK_PREFIX);
    for (const auto& entry : it) {
        auto name = entry.path().filename().string();
        if (name.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        // In-flight temporaries carry a suffix and fail the numeric parse.
        if (auto id = StringUtils::parse_uint64(std::string_view(name).substr(prefix.size()))) {
            ids.push_back(*id);
        }
    }

    std::sort(ids.begin(), ids.end());
    return ids;
}

Result RelayStore::status(const std::string& transfer_id, RelayStatus& status) const {
    Manifest manifest;
    std::int64_t created_at_ms = 0;
    auto result = load_record(transfer_id, manifest, created_at_ms);
    if (!result) {
        return result;
    }

    RelayStatus report;
    report.transfer_id = transfer_id;
    report.total_chunks = total_chunks(manifest);
    report.available_chunks = scan_chunks(transfer_id);
    report.uploaded_chunks = report.available_chunks.size();
    report.progress = report.total_chunks == 0
        ? 0.0
        : static_cast<double>(report.uploaded_chunks) / static_cast<double>(report.total_chunks) * 100.0;
    report.complete = report.uploaded_chunks == report.total_chunks;

    status = std::move(report);
    return Result();
}

Result RelayStore::sweep(std::vector<std::string>& removed) {
    return sweep(TimeUtils::now(), removed);
}

Result RelayStore::sweep(std::chrono::system_clock::time_point now, std::vector<std::string>& removed) {
    removed.clear();
    if (!FileUtils::is_directory(root_)) {
        return Result();
    }

    std::vector<std::string> candidates;
    try {
        for (const auto& entry : std::filesystem::directory_iterator(root_)) {
            if (entry.is_directory()) {
                candidates.push_back(entry.path().filename().string());
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        LOG_ERROR("Cannot scan relay storage {}: {}", root_.string(), e.what());
        return Result(ErrorCode::IO_FAILURE, std::string("Cannot scan storage: ") + e.what());
    }

    const auto cutoff = TimeUtils::to_epoch_millis(now) -
        std::chrono::duration_cast<std::chrono::milliseconds>(retention_).count();

    for (const auto& transfer_id : candidates) {
        Manifest manifest;
        std::int64_t created_at_ms = 0;
        auto result = load_record(transfer_id, manifest, created_at_ms);
        if (!result) {
            LOG_WARN("Sweep skipping {}: {}", transfer_id, result.message);
            continue;
        }

        if (created_at_ms >= cutoff) {
            continue;
        }

        std::error_code ec;
        std::filesystem::remove_all(transfer_dir(transfer_id), ec);
        if (ec) {
            LOG_ERROR("Sweep could not delete {}: {}", transfer_id, ec.message());
            continue;
        }
        removed.push_back(transfer_id);
    }

    if (!removed.empty()) {
        LOG_INFO("Sweep removed {} expired transfers", removed.size());
    }
    return Result();
}

}
