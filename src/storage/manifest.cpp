#include "relaydrop/storage/manifest.hpp"
#include <filesystem>

namespace relaydrop::storage {

using core::ErrorCode;
using core::Result;
using nlohmann::json;

namespace {

constexpr const char* KIND_FILE = "file";
constexpr const char* KIND_FOLDER = "folder";

FileManifest file_from_json(const json& j, bool folder_member) {
    FileManifest manifest;
    j.at("fileName").get_to(manifest.file_name);
    manifest.file_path = j.value("filePath", std::string());
    j.at("size").get_to(manifest.size);
    j.at("chunkSize").get_to(manifest.chunk_size);
    j.at("totalChunks").get_to(manifest.total_chunks);
    j.at("hash").get_to(manifest.hash);

    for (const auto& chunk : j.at("chunks")) {
        ChunkInfo info;
        chunk.at("id").get_to(info.id);
        chunk.at("hash").get_to(info.hash);
        chunk.at("size").get_to(info.size);
        manifest.chunks.push_back(std::move(info));
    }

    if (folder_member) {
        j.at("relativePath").get_to(manifest.relative_path);
    }
    return manifest;
}

}

std::uint64_t FolderManifest::total_chunks() const {
    std::uint64_t total = 0;
    for (const auto& file : files) {
        total += file.total_chunks;
    }
    return total;
}

std::uint64_t total_chunks(const Manifest& manifest) {
    if (const auto* file = std::get_if<FileManifest>(&manifest)) {
        return file->total_chunks;
    }
    return std::get<FolderManifest>(manifest).total_chunks();
}

std::uint64_t chunk_size(const Manifest& manifest) {
    return std::visit([](const auto& m) { return m.chunk_size; }, manifest);
}

const std::string& display_name(const Manifest& manifest) {
    if (const auto* file = std::get_if<FileManifest>(&manifest)) {
        return file->file_name;
    }
    return std::get<FolderManifest>(manifest).folder_name;
}

json to_json(const FileManifest& manifest) {
    json chunks = json::array();
    for (const auto& chunk : manifest.chunks) {
        chunks.push_back({{"id", chunk.id}, {"hash", chunk.hash}, {"size", chunk.size}});
    }

    json j = {
        {"kind", KIND_FILE},
        {"fileName", manifest.file_name},
        {"filePath", manifest.file_path},
        {"size", manifest.size},
        {"chunkSize", manifest.chunk_size},
        {"totalChunks", manifest.total_chunks},
        {"hash", manifest.hash},
        {"chunks", std::move(chunks)}
    };

    if (!manifest.relative_path.empty()) {
        j["relativePath"] = manifest.relative_path;
    }
    return j;
}

json to_json(const FolderManifest& manifest) {
    json files = json::array();
    for (const auto& file : manifest.files) {
        files.push_back(to_json(file));
    }

    return {
        {"kind", KIND_FOLDER},
        {"folderName", manifest.folder_name},
        {"folderPath", manifest.folder_path},
        {"totalSize", manifest.total_size},
        {"totalFiles", manifest.total_files},
        {"chunkSize", manifest.chunk_size},
        {"files", std::move(files)}
    };
}

json to_json(const Manifest& manifest) {
    return std::visit([](const auto& m) { return to_json(m); }, manifest);
}

Result from_json(const json& j, Manifest& manifest) {
    if (!j.is_object()) {
        return Result(ErrorCode::INVALID_INPUT, "Manifest must be a JSON object");
    }

    auto kind_it = j.find("kind");
    if (kind_it == j.end() || !kind_it->is_string()) {
        return Result(ErrorCode::INVALID_INPUT, "Manifest is missing its 'kind' discriminator");
    }

    try {
        const auto kind = kind_it->get<std::string>();
        if (kind == KIND_FILE) {
            auto file = file_from_json(j, false);
            auto result = validate(file);
            if (!result) {
                return result;
            }
            manifest = std::move(file);
            return Result();
        }

        if (kind == KIND_FOLDER) {
            FolderManifest folder;
            j.at("folderName").get_to(folder.folder_name);
            folder.folder_path = j.value("folderPath", std::string());
            j.at("totalSize").get_to(folder.total_size);
            j.at("totalFiles").get_to(folder.total_files);
            j.at("chunkSize").get_to(folder.chunk_size);
            for (const auto& file : j.at("files")) {
                folder.files.push_back(file_from_json(file, true));
            }

            auto result = validate(folder);
            if (!result) {
                return result;
            }
            manifest = std::move(folder);
            return Result();
        }

        return Result(ErrorCode::INVALID_INPUT, "Unknown manifest kind: " + kind);
    } catch (const json::exception& e) {
        return Result(ErrorCode::INVALID_INPUT, std::string("Malformed manifest: ") + e.what());
    }
}

Result validate(const FileManifest& manifest) {
    if (!is_safe_file_name(manifest.file_name)) {
        return Result(ErrorCode::INVALID_INPUT, "Unsafe file name: " + manifest.file_name);
    }

    if (manifest.chunk_size == 0) {
        return Result(ErrorCode::INVALID_INPUT, "Chunk size must be positive");
    }

    if (manifest.total_chunks != expected_chunk_count(manifest.size, manifest.chunk_size)) {
        return Result(ErrorCode::INVALID_INPUT,
                      "totalChunks does not match size/chunkSize for " + manifest.file_name);
    }

    if (manifest.chunks.size() != manifest.total_chunks) {
        return Result(ErrorCode::INVALID_INPUT, "Chunk list length differs from totalChunks");
    }

    std::uint64_t covered = 0;
    for (std::uint64_t i = 0; i < manifest.chunks.size(); ++i) {
        const auto& chunk = manifest.chunks[i];
        if (chunk.id != i) {
            return Result(ErrorCode::INVALID_INPUT, "Chunk ids must be contiguous from 0");
        }
        bool last = (i + 1 == manifest.chunks.size());
        if ((!last && chunk.size != manifest.chunk_size) || chunk.size == 0 ||
            chunk.size > manifest.chunk_size) {
            return Result(ErrorCode::INVALID_INPUT,
                          "Chunk " + std::to_string(i) + " has an invalid size");
        }
        covered += chunk.size;
    }

    if (covered != manifest.size) {
        return Result(ErrorCode::INVALID_INPUT, "Chunk sizes do not add up to the file size");
    }

    return Result();
}

Result validate(const FolderManifest& manifest) {
    if (manifest.chunk_size == 0) {
        return Result(ErrorCode::INVALID_INPUT, "Chunk size must be positive");
    }

    if (manifest.total_files != manifest.files.size()) {
        return Result(ErrorCode::INVALID_INPUT, "totalFiles differs from the file list length");
    }

    std::uint64_t total_size = 0;
    for (const auto& file : manifest.files) {
        if (file.chunk_size != manifest.chunk_size) {
            return Result(ErrorCode::INVALID_INPUT,
                          "File " + file.relative_path + " uses a different chunk size");
        }
        if (!is_safe_relative_path(file.relative_path)) {
            return Result(ErrorCode::INVALID_INPUT, "Unsafe relative path: " + file.relative_path);
        }
        auto result = validate(file);
        if (!result) {
            return result;
        }
        total_size += file.size;
    }

    if (total_size != manifest.total_size) {
        return Result(ErrorCode::INVALID_INPUT, "totalSize differs from the sum of file sizes");
    }

    return Result();
}

bool is_safe_relative_path(const std::string& relative) {
    if (relative.empty()) {
        return false;
    }

    std::filesystem::path path(relative);
    if (path.is_absolute() || path.has_root_name() || path.has_root_directory()) {
        return false;
    }

    for (const auto& part : path) {
        if (part == ".." || part == "." || part.empty()) {
            return false;
        }
    }
    return true;
}

bool is_safe_file_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
        return false;
    }

    std::filesystem::path path(name);
    return !path.has_root_name() && !path.has_root_directory();
}

}
