#include "relaydrop/storage/chunk_manager.hpp"
#include "relaydrop/core/logger.hpp"
#include "relaydrop/crypto/hash.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <limits>
#include <unistd.h>

namespace relaydrop::storage {

using core::ErrorCode;
using core::NotFoundReason;
using core::Result;

namespace {

class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    int release_and_close() {
        int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

private:
    int fd_;
};

}

ChunkManager::ChunkManager(std::uint64_t chunk_size)
    : chunk_size_(chunk_size == 0 ? DEFAULT_CHUNK_SIZE : chunk_size) {
}

ChunkManager::ChunkManager(const StorageConfig& config, TransferMode mode)
    : ChunkManager(config.chunk_size_for(mode)) {
}

Result ChunkManager::create_file_manifest(const std::filesystem::path& file_path,
                                          FileManifest& manifest) const {
    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec)) {
        return Result::not_found(NotFoundReason::FILE_MISSING, "File not found: " + file_path.string());
    }
    if (!std::filesystem::is_regular_file(file_path, ec)) {
        return Result(ErrorCode::INVALID_PATH, "Not a regular file: " + file_path.string());
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return Result(ErrorCode::IO_FAILURE, "Cannot open file: " + file_path.string());
    }

    crypto::Sha256Hasher file_hasher;
    auto result = file_hasher.initialize();
    if (!result) {
        return result;
    }

    FileManifest built;
    built.file_name = file_path.filename().string();
    built.file_path = file_path.string();
    built.chunk_size = chunk_size_;

    std::vector<std::uint8_t> buffer(chunk_size_);
    std::uint64_t chunk_id = 0;
    while (file.good()) {
        // A short read can only happen on the final chunk.
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(chunk_size_));
        auto bytes_read = static_cast<std::size_t>(file.gcount());
        if (bytes_read == 0) {
            break;
        }

        std::span<const std::uint8_t> chunk(buffer.data(), bytes_read);
        result = file_hasher.update(chunk);
        if (!result) {
            return result;
        }

        built.chunks.push_back({chunk_id++, crypto::hash_utils::hex_digest(chunk), bytes_read});
        built.size += bytes_read;
    }

    if (file.bad()) {
        LOG_ERROR("Read error while building manifest for {}", file_path.string());
        return Result(ErrorCode::IO_FAILURE, "Read error: " + file_path.string());
    }

    built.total_chunks = built.chunks.size();
    built.hash = crypto::hash_utils::hash_to_hex(file_hasher.finalize());

    LOG_DEBUG("Manifest for {}: {} bytes in {} chunks", built.file_name, built.size, built.total_chunks);
    manifest = std::move(built);
    return Result();
}

Result ChunkManager::create_folder_manifest(const std::filesystem::path& folder_path,
                                            FolderManifest& manifest) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(folder_path, ec)) {
        return Result(ErrorCode::INVALID_PATH, "Not a directory: " + folder_path.string());
    }

    std::vector<std::filesystem::path> file_paths;
    try {
        for (const auto& entry : std::filesystem::recursive_directory_iterator(folder_path)) {
            if (entry.is_regular_file()) {
                file_paths.push_back(entry.path());
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        return Result(ErrorCode::IO_FAILURE, std::string("Cannot enumerate folder: ") + e.what());
    }

    FolderManifest built;
    auto root = folder_path.lexically_normal();
    if (!root.has_filename()) {
        root = root.parent_path();
    }
    built.folder_name = root.filename().string();
    built.folder_path = folder_path.string();
    built.chunk_size = chunk_size_;

    for (const auto& path : file_paths) {
        FileManifest file;
        auto result = create_file_manifest(path, file);
        if (!result) {
            return result;
        }
        file.relative_path = path.lexically_relative(folder_path).generic_string();
        built.total_size += file.size;
        built.files.push_back(std::move(file));
    }

    std::sort(built.files.begin(), built.files.end(),
              [](const FileManifest& a, const FileManifest& b) { return a.relative_path < b.relative_path; });
    built.total_files = built.files.size();

    LOG_INFO("Folder manifest for {}: {} files, {} bytes", built.folder_name, built.total_files, built.total_size);
    manifest = std::move(built);
    return Result();
}

Result ChunkManager::create_manifest(const std::filesystem::path& path, Manifest& manifest) const {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        FolderManifest folder;
        auto result = create_folder_manifest(path, folder);
        if (result) {
            manifest = std::move(folder);
        }
        return result;
    }

    FileManifest file;
    auto result = create_file_manifest(path, file);
    if (result) {
        manifest = std::move(file);
    }
    return result;
}

Result ChunkManager::read_chunk(const std::filesystem::path& file_path,
                                std::uint64_t chunk_id,
                                std::vector<std::uint8_t>& chunk_data) const {
    if (chunk_id > std::numeric_limits<std::uint64_t>::max() / chunk_size_) {
        return Result(ErrorCode::INVALID_INPUT, "Chunk id out of range: " + std::to_string(chunk_id));
    }

    std::error_code ec;
    auto file_size = std::filesystem::file_size(file_path, ec);
    if (ec) {
        return Result(ErrorCode::IO_FAILURE, "Cannot stat " + file_path.string() + ": " + ec.message());
    }

    const std::uint64_t offset = chunk_id * chunk_size_;
    if (file_size < offset) {
        return Result(ErrorCode::IO_FAILURE,
                      "File " + file_path.string() + " is shorter than chunk " + std::to_string(chunk_id));
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return Result(ErrorCode::IO_FAILURE, "Cannot open file: " + file_path.string());
    }

    auto length = static_cast<std::size_t>(std::min<std::uint64_t>(chunk_size_, file_size - offset));
    std::vector<std::uint8_t> buffer(length);

    file.seekg(static_cast<std::streamoff>(offset));
    file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
    if (static_cast<std::size_t>(file.gcount()) != length) {
        return Result(ErrorCode::IO_FAILURE,
                      "Short read of chunk " + std::to_string(chunk_id) + " from " + file_path.string());
    }

    chunk_data = std::move(buffer);
    return Result();
}

Result ChunkManager::write_chunk(const std::filesystem::path& file_path,
                                 std::uint64_t chunk_id,
                                 const std::vector<std::uint8_t>& chunk_data) const {
    if (chunk_data.size() > chunk_size_) {
        return Result(ErrorCode::INVALID_INPUT,
                      "Chunk " + std::to_string(chunk_id) + " is larger than the chunk size");
    }
    if (chunk_id > static_cast<std::uint64_t>(std::numeric_limits<off_t>::max()) / chunk_size_) {
        return Result(ErrorCode::INVALID_INPUT, "Chunk id out of range: " + std::to_string(chunk_id));
    }

    std::error_code ec;
    if (file_path.has_parent_path()) {
        std::filesystem::create_directories(file_path.parent_path(), ec);
        if (ec) {
            return Result(ErrorCode::IO_FAILURE,
                          "Cannot create " + file_path.parent_path().string() + ": " + ec.message());
        }
    }

    // O_CREAT without O_TRUNC so concurrent writers never clobber each other's ranges.
    FileDescriptor fd(::open(file_path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644));
    if (!fd.valid()) {
        return Result(ErrorCode::IO_FAILURE,
                      "Cannot open " + file_path.string() + ": " + std::strerror(errno));
    }

    auto offset = static_cast<off_t>(chunk_id * chunk_size_);
    const auto* data = chunk_data.data();
    std::size_t remaining = chunk_data.size();
    while (remaining > 0) {
        ssize_t written = ::pwrite(fd.get(), data, remaining, offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Result(ErrorCode::IO_FAILURE,
                          "Write failed for chunk " + std::to_string(chunk_id) + ": " + std::strerror(errno));
        }
        data += written;
        offset += written;
        remaining -= static_cast<std::size_t>(written);
    }

    if (fd.release_and_close() != 0) {
        return Result(ErrorCode::IO_FAILURE, "Close failed for " + file_path.string() + ": " + std::strerror(errno));
    }

    return Result();
}

bool ChunkManager::verify_chunk(const std::vector<std::uint8_t>& chunk_data,
                                const std::string& expected_hash) const {
    return compute_chunk_hash(chunk_data) == expected_hash;
}

bool ChunkManager::verify_chunk(const std::filesystem::path& file_path,
                                std::uint64_t chunk_id,
                                const std::string& expected_hash) const {
    std::vector<std::uint8_t> chunk_data;
    if (!read_chunk(file_path, chunk_id, chunk_data)) {
        return false;
    }
    return verify_chunk(chunk_data, expected_hash);
}

bool ChunkManager::verify_file(const std::filesystem::path& file_path,
                               const std::string& expected_hash) const {
    crypto::Sha256Digest digest;
    if (!crypto::Sha256Hasher::hash_file(file_path, digest)) {
        return false;
    }
    return crypto::hash_utils::hash_to_hex(digest) == expected_hash;
}

std::vector<std::uint64_t> ChunkManager::get_missing_chunks(const std::filesystem::path& file_path,
                                                            std::uint64_t total_chunks) const {
    std::uint64_t downloaded_chunks = 0;

    std::error_code ec;
    auto file_size = std::filesystem::file_size(file_path, ec);
    if (!ec) {
        downloaded_chunks = file_size / chunk_size_;
    }

    std::vector<std::uint64_t> missing;
    for (std::uint64_t id = downloaded_chunks; id < total_chunks; ++id) {
        missing.push_back(id);
    }
    return missing;
}

std::string ChunkManager::compute_chunk_hash(const std::vector<std::uint8_t>& chunk_data) {
    return crypto::hash_utils::hex_digest(chunk_data);
}

}
