#include <gtest/gtest.h>
#include "relaydrop/network/http_client.hpp"
#include "relaydrop/network/lan_client.hpp"
#include "relaydrop/network/lan_server.hpp"
#include "relaydrop/network/relay_client.hpp"
#include "relaydrop/network/relay_service.hpp"
#include "relaydrop/storage/chunk_manager.hpp"
#include "relaydrop/transfer/transfer_engine.hpp"
#include "relaydrop/crypto/random.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>

using namespace relaydrop::network;
using namespace relaydrop::storage;
using relaydrop::core::ErrorCode;
using relaydrop::core::NotFoundReason;
using relaydrop::transfer::DownloadReport;
using relaydrop::transfer::EngineOptions;
using relaydrop::transfer::TransferEngine;

namespace {

constexpr std::uint64_t CHUNK = 4096;

void write_random_file(const std::filesystem::path& path, std::size_t size, unsigned seed) {
    std::filesystem::create_directories(path.parent_path());
    std::mt19937 rng(seed);
    std::ofstream file(path, std::ios::binary);
    for (std::size_t i = 0; i < size; ++i) {
        file.put(static_cast<char>(rng() & 0xFF));
    }
}

std::string read_all(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

HttpEndpoint local_endpoint(std::uint16_t port) {
    HttpEndpoint endpoint;
    EXPECT_TRUE(HttpEndpoint::parse("http://127.0.0.1:" + std::to_string(port), endpoint));
    return endpoint;
}

EngineOptions fast_options() {
    EngineOptions options;
    options.max_parallel = 3;
    options.retry_base_delay = std::chrono::milliseconds(5);
    return options;
}

}

TEST(HttpEndpointTest, ParsesUrlsAndHostPorts) {
    HttpEndpoint endpoint;
    ASSERT_TRUE(HttpEndpoint::parse("http://relay.local:8000/api/", endpoint));
    EXPECT_EQ(endpoint.host, "relay.local");
    EXPECT_EQ(endpoint.port, "8000");
    EXPECT_EQ(endpoint.base_path, "/api");

    ASSERT_TRUE(HttpEndpoint::parse("192.168.1.20:9000", endpoint));
    EXPECT_EQ(endpoint.host, "192.168.1.20");
    EXPECT_EQ(endpoint.port, "9000");
    EXPECT_EQ(endpoint.base_path, "");

    ASSERT_TRUE(HttpEndpoint::parse("example.org", endpoint));
    EXPECT_EQ(endpoint.port, "80");

    EXPECT_FALSE(HttpEndpoint::parse("https://secure.example", endpoint));
    EXPECT_FALSE(HttpEndpoint::parse("host:0", endpoint));
    EXPECT_FALSE(HttpEndpoint::parse("host:70000", endpoint));
    EXPECT_FALSE(HttpEndpoint::parse(":8000", endpoint));
}

class RelayIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(relaydrop::crypto::SecureRandom::initialize());
        root_ = std::filesystem::temp_directory_path() /
                ("relaydrop_relay_it_" + relaydrop::crypto::SecureRandom::generate_hex(4));
        store_ = std::make_unique<RelayStore>(root_ / "uploads", std::chrono::hours(24));
        service_ = std::make_unique<RelayService>(*store_, "127.0.0.1", 0);
        ASSERT_TRUE(service_->start());
        ASSERT_NE(service_->port(), 0);

        client_ = std::make_unique<RelayClient>(local_endpoint(service_->port()), std::chrono::seconds(10));
    }

    void TearDown() override {
        client_.reset();
        service_->stop();
        service_.reset();
        store_.reset();
        std::filesystem::remove_all(root_);
    }

    std::filesystem::path root_;
    std::unique_ptr<RelayStore> store_;
    std::unique_ptr<RelayService> service_;
    std::unique_ptr<RelayClient> client_;
};

TEST_F(RelayIntegrationTest, HealthCheck) {
    EXPECT_TRUE(client_->health());

    HttpClient http(local_endpoint(service_->port()));
    HttpResponse response;
    ASSERT_TRUE(http.get("/", response));
    auto body = nlohmann::json::parse(response.body());
    EXPECT_EQ(body["status"], "running");
    EXPECT_EQ(body["service"], "RelayDrop Relay Server");
}

TEST_F(RelayIntegrationTest, UploadAndDownloadThroughHttp) {
    auto source = root_ / "source" / "clip.mov";
    write_random_file(source, 5 * CHUNK + 17, 11);

    FileManifest manifest;
    ASSERT_TRUE(ChunkManager(CHUNK).create_file_manifest(source, manifest));

    TransferEngine engine(fast_options());
    ASSERT_TRUE(engine.upload(*client_, "clip", manifest));

    RelayStatus status;
    ASSERT_TRUE(client_->status("clip", status));
    EXPECT_EQ(status.total_chunks, 6u);
    EXPECT_EQ(status.uploaded_chunks, 6u);
    EXPECT_TRUE(status.complete);
    EXPECT_DOUBLE_EQ(status.progress, 100.0);

    DownloadReport report;
    auto destination = root_ / "received" / "clip.mov";
    ASSERT_TRUE(engine.download(*client_, "clip", destination, report));
    EXPECT_EQ(read_all(destination), read_all(source));
    EXPECT_EQ(report.downloaded_chunks, 6u);
}

TEST_F(RelayIntegrationTest, NotFoundReasonsSurviveTheWire) {
    std::vector<std::uint8_t> data;
    ChunkAddress address;

    auto result = client_->get_chunk("ghost", address, data);
    EXPECT_EQ(result.error, ErrorCode::NOT_FOUND);
    EXPECT_EQ(result.reason, NotFoundReason::TRANSFER_UNKNOWN);
    EXPECT_FALSE(result.is_retryable());

    auto source = root_ / "source" / "partial.bin";
    write_random_file(source, 3 * CHUNK, 12);
    FileManifest manifest;
    ASSERT_TRUE(ChunkManager(CHUNK).create_file_manifest(source, manifest));
    ASSERT_TRUE(client_->create("partial", manifest));

    address.global_id = 2;
    address.local_id = 2;
    result = client_->get_chunk("partial", address, data);
    EXPECT_EQ(result.error, ErrorCode::NOT_FOUND);
    EXPECT_EQ(result.reason, NotFoundReason::CHUNK_PENDING);
    EXPECT_TRUE(result.is_retryable());

    Manifest fetched;
    EXPECT_EQ(client_->get_manifest("ghost", fetched).reason, NotFoundReason::TRANSFER_UNKNOWN);
}

TEST_F(RelayIntegrationTest, RejectsMalformedRequests) {
    HttpClient http(local_endpoint(service_->port()));
    HttpResponse response;

    ASSERT_TRUE(http.post_json("/transfer/create", nlohmann::json{{"manifest", nlohmann::json::object()}}, response));
    EXPECT_EQ(response.result(), http::status::bad_request);
    EXPECT_EQ(result_from_response(response).error, ErrorCode::INVALID_INPUT);

    ASSERT_TRUE(http.post_binary("/transfer/x/chunk/abc", {1, 2, 3}, response));
    EXPECT_EQ(response.result(), http::status::bad_request);

    ASSERT_TRUE(http.get("/no/such/route", response));
    EXPECT_EQ(response.result(), http::status::not_found);
}

TEST_F(RelayIntegrationTest, CreateAcceptsStringManifest) {
    auto source = root_ / "source" / "notes.txt";
    write_random_file(source, 100, 13);
    FileManifest manifest;
    ASSERT_TRUE(ChunkManager(CHUNK).create_file_manifest(source, manifest));

    HttpClient http(local_endpoint(service_->port()));
    HttpResponse response;
    nlohmann::json body = {{"transfer_id", "notes"}, {"manifest", to_json(manifest).dump()}};
    ASSERT_TRUE(http.post_json("/transfer/create", body, response));
    ASSERT_EQ(response.result(), http::status::ok);

    auto reply = nlohmann::json::parse(response.body());
    EXPECT_EQ(reply["status"], "created");
    EXPECT_EQ(reply["total_chunks"], 1);
}

TEST_F(RelayIntegrationTest, DeleteAndCleanup) {
    auto source = root_ / "source" / "old.bin";
    write_random_file(source, CHUNK, 14);
    FileManifest manifest;
    ASSERT_TRUE(ChunkManager(CHUNK).create_file_manifest(source, manifest));

    ASSERT_TRUE(client_->create("keep", manifest));
    ASSERT_TRUE(client_->create("drop", manifest));

    ASSERT_TRUE(client_->remove("drop"));
    RelayStatus status;
    EXPECT_EQ(client_->status("drop", status).reason, NotFoundReason::TRANSFER_UNKNOWN);
    EXPECT_EQ(client_->remove("drop").error, ErrorCode::NOT_FOUND);

    std::vector<std::string> removed;
    ASSERT_TRUE(client_->cleanup(removed));
    EXPECT_TRUE(removed.empty());
    EXPECT_TRUE(client_->status("keep", status));
}

class LanIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(relaydrop::crypto::SecureRandom::initialize());
        root_ = std::filesystem::temp_directory_path() /
                ("relaydrop_lan_it_" + relaydrop::crypto::SecureRandom::generate_hex(4));
    }

    void TearDown() override {
        std::filesystem::remove_all(root_);
    }

    std::filesystem::path root_;
};

TEST_F(LanIntegrationTest, DownloadsFileDirectlyFromSender) {
    auto source = root_ / "share" / "slides.pdf";
    write_random_file(source, 7 * CHUNK + 5, 21);

    FileManifest manifest;
    ASSERT_TRUE(ChunkManager(CHUNK).create_file_manifest(source, manifest));

    LanServer server(manifest, "127.0.0.1", 0);
    ASSERT_TRUE(server.start());
    EXPECT_NE(server.advertised_url().find(":" + std::to_string(server.port())), std::string::npos);

    LanClient client(local_endpoint(server.port()), std::chrono::seconds(10));
    TransferEngine engine(fast_options());

    DownloadReport report;
    auto destination = root_ / "inbox" / "slides.pdf";
    ASSERT_TRUE(engine.download(client, "ignored", destination, report));
    EXPECT_EQ(read_all(destination), read_all(source));
    EXPECT_EQ(report.total_chunks, 8u);

    server.stop();
}

TEST_F(LanIntegrationTest, DownloadsFolderThroughGlobalAndLocalIds) {
    auto folder = root_ / "share" / "project";
    write_random_file(folder / "README.md", 300, 31);
    write_random_file(folder / "empty.txt", 0, 32);
    write_random_file(folder / "src" / "main.cpp", 3 * CHUNK, 33);

    FolderManifest manifest;
    ASSERT_TRUE(ChunkManager(CHUNK).create_folder_manifest(folder, manifest));

    LanServer server(manifest, "127.0.0.1", 0);
    ASSERT_TRUE(server.start());
    LanClient client(local_endpoint(server.port()), std::chrono::seconds(10));

    // Global id 1 is the first chunk of src/main.cpp, the third file.
    std::vector<std::uint8_t> by_global;
    std::vector<std::uint8_t> by_local;
    ASSERT_TRUE(client.download_chunk(1, by_global));
    ASSERT_TRUE(client.download_file_chunk(2, 0, by_local));
    EXPECT_EQ(by_global, by_local);
    EXPECT_EQ(by_global.size(), CHUNK);

    std::vector<std::uint8_t> missing;
    auto result = client.download_chunk(4, missing);
    EXPECT_EQ(result.error, ErrorCode::NOT_FOUND);
    EXPECT_FALSE(result.is_retryable());
    EXPECT_EQ(client.download_file_chunk(9, 0, missing).error, ErrorCode::NOT_FOUND);

    TransferEngine engine(fast_options());
    DownloadReport report;
    auto destination = root_ / "inbox" / "project";
    ASSERT_TRUE(engine.download(client, "ignored", destination, report));
    for (const auto* name : {"README.md", "empty.txt", "src/main.cpp"}) {
        EXPECT_EQ(read_all(destination / name), read_all(folder / name)) << name;
    }

    server.stop();
}

TEST_F(LanIntegrationTest, UnreachableSenderIsNetworkFailure) {
    LanClient client(local_endpoint(1), std::chrono::seconds(2));
    Manifest manifest;
    auto result = client.get_manifest("ignored", manifest);
    EXPECT_EQ(result.error, ErrorCode::NETWORK_FAILURE);
}
