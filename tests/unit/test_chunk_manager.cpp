#include <gtest/gtest.h>
#include "relaydrop/storage/chunk_layout.hpp"
#include "relaydrop/storage/chunk_manager.hpp"
#include "relaydrop/storage/manifest.hpp"
#include "relaydrop/crypto/hash.hpp"
#include "relaydrop/crypto/random.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <random>

using namespace relaydrop::storage;
using relaydrop::core::ErrorCode;
using relaydrop::core::NotFoundReason;

class ChunkManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(relaydrop::crypto::SecureRandom::initialize());
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("relaydrop_chunks_" + relaydrop::crypto::SecureRandom::generate_hex(4));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    std::filesystem::path create_test_file(const std::string& relative, std::size_t size, unsigned seed = 42) {
        auto path = test_dir_ / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);

        // Deterministic content so hashes are reproducible.
        std::mt19937 rng(seed);
        std::uniform_int_distribution<int> dist(0, 255);
        for (std::size_t i = 0; i < size; ++i) {
            file.put(static_cast<char>(dist(rng)));
        }
        return path;
    }

    static std::vector<std::uint8_t> read_all(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        return std::vector<std::uint8_t>((std::istreambuf_iterator<char>(file)),
                                         std::istreambuf_iterator<char>());
    }

    std::filesystem::path test_dir_;
};

TEST_F(ChunkManagerTest, FileManifestSplitsIntoChunks) {
    ChunkManager chunks(1024);
    auto path = create_test_file("data.bin", 2500);

    FileManifest manifest;
    ASSERT_TRUE(chunks.create_file_manifest(path, manifest));

    EXPECT_EQ(manifest.file_name, "data.bin");
    EXPECT_EQ(manifest.size, 2500u);
    EXPECT_EQ(manifest.chunk_size, 1024u);
    EXPECT_EQ(manifest.total_chunks, 3u);
    ASSERT_EQ(manifest.chunks.size(), 3u);
    EXPECT_EQ(manifest.chunks[0].size, 1024u);
    EXPECT_EQ(manifest.chunks[2].size, 452u);
    EXPECT_TRUE(manifest.relative_path.empty());
    EXPECT_TRUE(validate(manifest));

    auto content = read_all(path);
    EXPECT_EQ(manifest.hash, relaydrop::crypto::hash_utils::hex_digest(content));

    std::vector<std::uint8_t> first(content.begin(), content.begin() + 1024);
    EXPECT_EQ(manifest.chunks[0].hash, ChunkManager::compute_chunk_hash(first));
}

TEST_F(ChunkManagerTest, EmptyFileHasNoChunks) {
    ChunkManager chunks(1024);
    auto path = create_test_file("empty.bin", 0);

    FileManifest manifest;
    ASSERT_TRUE(chunks.create_file_manifest(path, manifest));
    EXPECT_EQ(manifest.size, 0u);
    EXPECT_EQ(manifest.total_chunks, 0u);
    EXPECT_TRUE(manifest.chunks.empty());
    EXPECT_EQ(manifest.hash, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(ChunkManagerTest, ExactMultipleHasNoShortChunk) {
    ChunkManager chunks(1024);
    auto path = create_test_file("exact.bin", 4096);

    FileManifest manifest;
    ASSERT_TRUE(chunks.create_file_manifest(path, manifest));
    EXPECT_EQ(manifest.total_chunks, 4u);
    EXPECT_EQ(manifest.chunks.back().size, 1024u);
}

TEST_F(ChunkManagerTest, MissingAndNonRegularPaths) {
    ChunkManager chunks(1024);

    FileManifest manifest;
    auto result = chunks.create_file_manifest(test_dir_ / "nope.bin", manifest);
    EXPECT_EQ(result.error, ErrorCode::NOT_FOUND);
    EXPECT_EQ(result.reason, NotFoundReason::FILE_MISSING);

    result = chunks.create_file_manifest(test_dir_, manifest);
    EXPECT_EQ(result.error, ErrorCode::INVALID_PATH);

    FolderManifest folder;
    result = chunks.create_folder_manifest(create_test_file("plain.bin", 10), folder);
    EXPECT_EQ(result.error, ErrorCode::INVALID_PATH);
}

TEST_F(ChunkManagerTest, FolderManifestIsSortedAndRelative) {
    ChunkManager chunks(1024);
    create_test_file("album/b.bin", 1500, 1);
    create_test_file("album/a.bin", 100, 2);
    create_test_file("album/nested/c.bin", 3000, 3);
    create_test_file("album/nested/empty.bin", 0);

    FolderManifest manifest;
    ASSERT_TRUE(chunks.create_folder_manifest(test_dir_ / "album", manifest));

    EXPECT_EQ(manifest.folder_name, "album");
    EXPECT_EQ(manifest.total_files, 4u);
    EXPECT_EQ(manifest.total_size, 4600u);
    EXPECT_EQ(manifest.chunk_size, 1024u);
    ASSERT_EQ(manifest.files.size(), 4u);
    EXPECT_EQ(manifest.files[0].relative_path, "a.bin");
    EXPECT_EQ(manifest.files[1].relative_path, "b.bin");
    EXPECT_EQ(manifest.files[2].relative_path, "nested/c.bin");
    EXPECT_EQ(manifest.files[3].relative_path, "nested/empty.bin");
    EXPECT_EQ(manifest.total_chunks(), 1u + 2u + 3u + 0u);
    EXPECT_TRUE(validate(manifest));
}

TEST_F(ChunkManagerTest, FolderNameIgnoresTrailingSlash) {
    ChunkManager chunks(1024);
    create_test_file("docs/readme.txt", 10);

    FolderManifest manifest;
    ASSERT_TRUE(chunks.create_folder_manifest((test_dir_ / "docs").string() + "/", manifest));
    EXPECT_EQ(manifest.folder_name, "docs");
}

TEST_F(ChunkManagerTest, CreateManifestDispatchesOnKind) {
    ChunkManager chunks(1024);
    auto file = create_test_file("one/file.bin", 10);

    Manifest manifest;
    ASSERT_TRUE(chunks.create_manifest(file, manifest));
    EXPECT_FALSE(is_folder(manifest));
    EXPECT_EQ(display_name(manifest), "file.bin");

    ASSERT_TRUE(chunks.create_manifest(test_dir_ / "one", manifest));
    EXPECT_TRUE(is_folder(manifest));
    EXPECT_EQ(display_name(manifest), "one");
    EXPECT_EQ(total_chunks(manifest), 1u);
}

TEST_F(ChunkManagerTest, ReadChunkReturnsSlices) {
    ChunkManager chunks(1000);
    auto path = create_test_file("read.bin", 2500);
    auto content = read_all(path);

    std::vector<std::uint8_t> data;
    ASSERT_TRUE(chunks.read_chunk(path, 1, data));
    EXPECT_EQ(data, std::vector<std::uint8_t>(content.begin() + 1000, content.begin() + 2000));

    ASSERT_TRUE(chunks.read_chunk(path, 2, data));
    EXPECT_EQ(data.size(), 500u);

    EXPECT_EQ(chunks.read_chunk(path, 5, data).error, ErrorCode::IO_FAILURE);
    EXPECT_EQ(chunks.read_chunk(test_dir_ / "missing.bin", 0, data).error, ErrorCode::IO_FAILURE);
}

TEST_F(ChunkManagerTest, WriteChunkOutOfOrderReassembles) {
    ChunkManager chunks(1000);
    auto source = create_test_file("source.bin", 2500);
    auto target = test_dir_ / "out" / "deep" / "target.bin";

    for (std::uint64_t id : {2u, 0u, 1u}) {
        std::vector<std::uint8_t> data;
        ASSERT_TRUE(chunks.read_chunk(source, id, data));
        ASSERT_TRUE(chunks.write_chunk(target, id, data));
    }

    EXPECT_EQ(read_all(target), read_all(source));

    FileManifest manifest;
    ASSERT_TRUE(chunks.create_file_manifest(source, manifest));
    EXPECT_TRUE(chunks.verify_file(target, manifest.hash));
    EXPECT_TRUE(chunks.verify_chunk(target, 1, manifest.chunks[1].hash));
    EXPECT_FALSE(chunks.verify_chunk(target, 1, manifest.chunks[0].hash));
}

TEST_F(ChunkManagerTest, WriteChunkNeverTruncates) {
    ChunkManager chunks(4);
    auto target = test_dir_ / "partial.bin";

    ASSERT_TRUE(chunks.write_chunk(target, 1, {5, 6, 7, 8}));
    ASSERT_TRUE(chunks.write_chunk(target, 0, {1, 2, 3, 4}));

    EXPECT_EQ(read_all(target), (std::vector<std::uint8_t>{1, 2, 3, 4, 5, 6, 7, 8}));
}

TEST_F(ChunkManagerTest, WriteChunkRejectsOversizedData) {
    ChunkManager chunks(4);
    auto result = chunks.write_chunk(test_dir_ / "big.bin", 0, {1, 2, 3, 4, 5});
    EXPECT_EQ(result.error, ErrorCode::INVALID_INPUT);
}

TEST_F(ChunkManagerTest, VerifyFileFailsOnMismatchOrMissing) {
    ChunkManager chunks(1024);
    auto path = create_test_file("v.bin", 100);

    FileManifest manifest;
    ASSERT_TRUE(chunks.create_file_manifest(path, manifest));
    EXPECT_TRUE(chunks.verify_file(path, manifest.hash));
    EXPECT_FALSE(chunks.verify_file(path, std::string(64, '0')));
    EXPECT_FALSE(chunks.verify_file(test_dir_ / "gone.bin", manifest.hash));
}

TEST_F(ChunkManagerTest, MissingChunksFromFileLength) {
    ChunkManager chunks(1000);

    EXPECT_EQ(chunks.get_missing_chunks(test_dir_ / "absent.bin", 3),
              (std::vector<std::uint64_t>{0, 1, 2}));

    create_test_file("partial.bin", 1500);
    EXPECT_EQ(chunks.get_missing_chunks(test_dir_ / "partial.bin", 3),
              (std::vector<std::uint64_t>{1, 2}));

    create_test_file("whole.bin", 2500);
    EXPECT_EQ(chunks.get_missing_chunks(test_dir_ / "whole.bin", 3),
              (std::vector<std::uint64_t>{2}));

    create_test_file("full.bin", 3000);
    EXPECT_TRUE(chunks.get_missing_chunks(test_dir_ / "full.bin", 3).empty());
}

TEST_F(ChunkManagerTest, ChunkSizeFollowsTransferMode) {
    StorageConfig config;
    EXPECT_EQ(ChunkManager(config, TransferMode::LAN).get_chunk_size(), 2u * 1024 * 1024);
    EXPECT_EQ(ChunkManager(config, TransferMode::WEBRTC).get_chunk_size(), 512u * 1024);
    EXPECT_EQ(ChunkManager(config, TransferMode::RELAY).get_chunk_size(), 1024u * 1024);
    EXPECT_EQ(ChunkManager(0).get_chunk_size(), ChunkManager::DEFAULT_CHUNK_SIZE);

    EXPECT_EQ(parse_transfer_mode("LAN"), TransferMode::LAN);
    EXPECT_FALSE(parse_transfer_mode("carrier-pigeon").has_value());
}

class ManifestTest : public ::testing::Test {
protected:
    static FileManifest sample_file(const std::string& name, std::uint64_t size, std::uint64_t chunk_size) {
        FileManifest file;
        file.file_name = name;
        file.file_path = "/src/" + name;
        file.size = size;
        file.chunk_size = chunk_size;
        file.total_chunks = expected_chunk_count(size, chunk_size);
        file.hash = std::string(64, 'a');
        for (std::uint64_t i = 0; i < file.total_chunks; ++i) {
            auto remaining = size - i * chunk_size;
            file.chunks.push_back({i, std::string(64, 'b'), std::min(chunk_size, remaining)});
        }
        return file;
    }

    static FolderManifest sample_folder() {
        FolderManifest folder;
        folder.folder_name = "photos";
        folder.folder_path = "/src/photos";
        folder.chunk_size = 10;

        auto a = sample_file("a.jpg", 25, 10);
        a.relative_path = "a.jpg";
        auto empty = sample_file("empty.txt", 0, 10);
        empty.relative_path = "notes/empty.txt";
        auto b = sample_file("b.jpg", 10, 10);
        b.relative_path = "notes/b.jpg";

        folder.files = {a, empty, b};
        folder.total_files = 3;
        folder.total_size = 35;
        return folder;
    }
};

TEST_F(ManifestTest, JsonRoundTripKeepsKind) {
    Manifest file = sample_file("movie.mp4", 25, 10);
    Manifest decoded;
    ASSERT_TRUE(from_json(to_json(file), decoded));
    EXPECT_EQ(decoded, file);

    Manifest folder = sample_folder();
    auto json = to_json(folder);
    EXPECT_EQ(json["kind"], "folder");
    EXPECT_EQ(json["files"][1]["relativePath"], "notes/empty.txt");
    ASSERT_TRUE(from_json(json, decoded));
    EXPECT_EQ(decoded, folder);
}

TEST_F(ManifestTest, WireFieldNames) {
    auto json = to_json(sample_file("movie.mp4", 25, 10));
    EXPECT_EQ(json["kind"], "file");
    EXPECT_EQ(json["fileName"], "movie.mp4");
    EXPECT_EQ(json["chunkSize"], 10);
    EXPECT_EQ(json["totalChunks"], 3);
    EXPECT_EQ(json["chunks"][2]["size"], 5);
    EXPECT_FALSE(json.contains("relativePath"));
}

TEST_F(ManifestTest, RejectsInconsistentManifests) {
    Manifest decoded;

    EXPECT_EQ(from_json(nlohmann::json::array(), decoded).error, ErrorCode::INVALID_INPUT);

    auto json = to_json(sample_file("x", 25, 10));
    json.erase("kind");
    EXPECT_EQ(from_json(json, decoded).error, ErrorCode::INVALID_INPUT);

    json = to_json(sample_file("x", 25, 10));
    json["totalChunks"] = 4;
    EXPECT_EQ(from_json(json, decoded).error, ErrorCode::INVALID_INPUT);

    json = to_json(sample_file("x", 25, 10));
    json["chunks"][0]["size"] = 9;
    EXPECT_EQ(from_json(json, decoded).error, ErrorCode::INVALID_INPUT);

    json = to_json(sample_file("x", 25, 10));
    json["chunkSize"] = "ten";
    EXPECT_EQ(from_json(json, decoded).error, ErrorCode::INVALID_INPUT);

    json = to_json(Manifest(sample_folder()));
    json["totalSize"] = 34;
    EXPECT_EQ(from_json(json, decoded).error, ErrorCode::INVALID_INPUT);

    json = to_json(Manifest(sample_folder()));
    json["files"][0]["relativePath"] = "../escape.jpg";
    EXPECT_EQ(from_json(json, decoded).error, ErrorCode::INVALID_INPUT);
}

TEST_F(ManifestTest, SafeRelativePaths) {
    EXPECT_TRUE(is_safe_relative_path("a/b/c.txt"));
    EXPECT_FALSE(is_safe_relative_path(""));
    EXPECT_FALSE(is_safe_relative_path("/etc/passwd"));
    EXPECT_FALSE(is_safe_relative_path("a/../../b"));
    EXPECT_FALSE(is_safe_relative_path("./a"));
}

TEST_F(ManifestTest, RejectsUnsafeFileNames) {
    Manifest decoded;
    for (const auto* name : {"../escaped.bin", "/etc/passwd", "a/b.txt", "a\\b.txt", "..", ".", ""}) {
        auto json = to_json(sample_file("x", 25, 10));
        json["fileName"] = name;
        EXPECT_EQ(from_json(json, decoded).error, ErrorCode::INVALID_INPUT) << name;
    }

    auto json = to_json(Manifest(sample_folder()));
    json["files"][2]["fileName"] = "../b.jpg";
    EXPECT_EQ(from_json(json, decoded).error, ErrorCode::INVALID_INPUT);

    EXPECT_TRUE(is_safe_file_name("movie.mp4"));
    EXPECT_TRUE(is_safe_file_name("..hidden"));
    EXPECT_FALSE(is_safe_file_name("dir/movie.mp4"));
}

TEST_F(ManifestTest, FlattenedLayoutAssignsGlobalIds) {
    auto folder = sample_folder();
    auto layout = flatten_chunk_layout(folder);

    ASSERT_EQ(layout.size(), 3u);
    EXPECT_EQ(layout[0].first_global_id, 0u);
    EXPECT_EQ(layout[0].chunk_count, 3u);
    EXPECT_EQ(layout[1].first_global_id, 3u);
    EXPECT_EQ(layout[1].chunk_count, 0u);
    EXPECT_EQ(layout[2].first_global_id, 3u);
    EXPECT_EQ(layout[2].chunk_count, 1u);

    auto address = locate_chunk(layout, 3);
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->file_index, 2u);
    EXPECT_EQ(address->local_id, 0u);

    address = locate_chunk(layout, 2);
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->file_index, 0u);
    EXPECT_EQ(address->local_id, 2u);

    EXPECT_FALSE(locate_chunk(layout, 4).has_value());
}

TEST_F(ManifestTest, SingleFileLayout) {
    Manifest file = sample_file("one", 25, 10);
    auto layout = flatten_chunk_layout(file);
    ASSERT_EQ(layout.size(), 1u);
    EXPECT_EQ(layout[0].chunk_count, 3u);

    auto address = locate_chunk(layout, 1);
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->global_id, 1u);
    EXPECT_EQ(address->local_id, 1u);
}
