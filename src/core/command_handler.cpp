#include "relaydrop/core/command_handler.hpp"
#include "relaydrop/core/config.hpp"
#include "relaydrop/core/logger.hpp"
#include "relaydrop/core/utils.hpp"
#include "relaydrop/crypto/random.hpp"
#include "relaydrop/network/lan_client.hpp"
#include "relaydrop/network/lan_server.hpp"
#include "relaydrop/network/relay_client.hpp"
#include "relaydrop/network/relay_service.hpp"
#include "relaydrop/network/signaling_client.hpp"
#include "relaydrop/network/signaling_server.hpp"
#include "relaydrop/storage/chunk_manager.hpp"
#include "relaydrop/storage/relay_store.hpp"
#include "relaydrop/storage/storage_config.hpp"
#include "relaydrop/transfer/transfer_engine.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <algorithm>
#include <csignal>
#include <iostream>
#include <memory>

namespace relaydrop::core {

namespace {

void wait_for_shutdown_signal() {
    boost::asio::io_context io_context;
    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            LOG_INFO("Received signal {}, shutting down", signal_number);
        }
    });
    io_context.run();
}

std::uint16_t port_from_config(const Config& config, const std::string& key, int fallback) {
    auto port = config.get_int(key, fallback);
    if (port < 0 || port > 65535) {
        LOG_WARN("Ignoring out of range {}={}", key, port);
        return static_cast<std::uint16_t>(fallback);
    }
    return static_cast<std::uint16_t>(port);
}

bool endpoint_from_config(const Config& config, const std::string& key, const std::string& fallback,
                          network::HttpEndpoint& endpoint) {
    auto url = config.get_string(key, fallback);
    if (!network::HttpEndpoint::parse(url, endpoint)) {
        LOG_ERROR("Invalid URL for {}: {}", key, url);
        return false;
    }
    return true;
}

std::chrono::seconds chunk_timeout(const Config& config) {
    return std::chrono::seconds(std::max(1, config.get_int("network.chunk_timeout_seconds", 60)));
}

transfer::ProgressCallback console_progress() {
    return [](std::uint64_t completed, std::uint64_t total) {
        auto percent = total == 0 ? 100.0 : static_cast<double>(completed) * 100.0 / static_cast<double>(total);
        std::cout << "\r  " << completed << "/" << total << " chunks ("
                  << static_cast<int>(percent) << "%)" << std::flush;
        if (completed == total) {
            std::cout << "\n";
        }
    };
}

}

CommandResult RelayCommandHandler::execute(const std::vector<std::string>&) {
    auto& config = Config::instance();

    auto storage_config = storage::StorageConfig::from_config(config);
    if (!storage_config.validate()) {
        return CommandResult::error("Invalid relay storage configuration");
    }

    storage::RelayStore store(storage_config);
    network::RelayService service(store,
                                  config.get_string("relay.host", "0.0.0.0"),
                                  port_from_config(config, "relay.port", 8000),
                                  storage_config.sweep_interval);
    if (!service.start()) {
        return CommandResult::error("Failed to start relay server");
    }

    std::cout << "Relay server listening on port " << service.port() << "\n";
    std::cout << "Upload directory: " << storage_config.upload_directory.string() << "\n";
    std::cout << "Press Ctrl+C to stop\n";

    wait_for_shutdown_signal();
    service.stop();
    return CommandResult::ok("Relay server stopped");
}

CommandResult SignalCommandHandler::execute(const std::vector<std::string>&) {
    auto& config = Config::instance();

    network::SignalingServer server(signaling::SignalingOptions::from_config(config),
                                    config.get_string("signaling.host", "0.0.0.0"),
                                    port_from_config(config, "signaling.port", 3000));
    if (!server.start()) {
        return CommandResult::error("Failed to start signaling server");
    }

    std::cout << "Signaling server listening on port " << server.port() << "\n";
    std::cout << "Press Ctrl+C to stop\n";

    wait_for_shutdown_signal();
    server.stop();
    return CommandResult::ok("Signaling server stopped");
}

CommandResult ManifestCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    auto& config = Config::instance();
    auto mode = storage::parse_transfer_mode(config.get_string("transfer.mode", "relay"));
    if (!mode) {
        return CommandResult::error("Unknown transfer mode: " + config.get_string("transfer.mode"));
    }

    storage::ChunkManager chunks(storage::StorageConfig::from_config(config), *mode);
    storage::Manifest manifest;
    auto result = chunks.create_manifest(utils::FileUtils::expand_home(args[1]), manifest);
    if (!result) {
        return CommandResult::from(result, "Cannot build manifest");
    }

    std::cout << storage::to_json(manifest).dump(2) << "\n";
    return CommandResult::ok();
}

CommandResult SendCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    auto& config = Config::instance();
    auto mode_name = config.get_string("transfer.mode", "relay");
    auto mode = storage::parse_transfer_mode(mode_name);
    if (!mode || *mode == storage::TransferMode::WEBRTC) {
        return CommandResult::error("send supports --mode relay or --mode lan, not " + mode_name);
    }

    network::HttpEndpoint signal_endpoint;
    if (!endpoint_from_config(config, "signaling.url", "http://127.0.0.1:3000", signal_endpoint)) {
        return CommandResult::error("Invalid signaling URL");
    }

    auto path = utils::FileUtils::expand_home(args[1]);
    std::cout << "Building manifest for " << path.string() << "...\n";

    storage::ChunkManager chunks(storage::StorageConfig::from_config(config), *mode);
    storage::Manifest manifest;
    auto result = chunks.create_manifest(path, manifest);
    if (!result) {
        return CommandResult::from(result, "Cannot build manifest");
    }

    const auto transfer_id = crypto::SecureRandom::generate_uuid();
    std::cout << "  " << storage::display_name(manifest) << ": "
              << storage::total_chunks(manifest) << " chunks of "
              << utils::StringUtils::format_bytes(storage::chunk_size(manifest)) << "\n";

    network::SignalingClient signaling(signal_endpoint,
        std::chrono::seconds(std::max(1, config.get_int("network.connection_timeout_seconds", 30))));
    signaling::PairCodeInfo pair;
    result = signaling.create_pair_code(transfer_id, storage::to_json(manifest), pair);
    if (!result) {
        return CommandResult::from(result, "Cannot obtain a pairing code");
    }

    std::cout << "\nPairing code: " << pair.pair_code << " (valid for " << pair.expires_in.count() << "s)\n";

    if (*mode == storage::TransferMode::LAN) {
        network::LanServer server(manifest, "0.0.0.0", port_from_config(config, "lan.port", 9000));
        if (!server.start()) {
            return CommandResult::error("Failed to start LAN server");
        }

        auto url = server.advertised_url();
        std::cout << "Serving on " << url << "\n";
        std::cout << "Receiver: relaydrop receive " << pair.pair_code << " <output> --lan "
                  << url.substr(std::string("http://").size()) << "\n";
        std::cout << "Press Ctrl+C to stop sharing\n";

        wait_for_shutdown_signal();
        server.stop();
        return CommandResult::ok("Stopped sharing");
    }

    network::HttpEndpoint relay_endpoint;
    if (!endpoint_from_config(config, "relay.url", "http://127.0.0.1:8000", relay_endpoint)) {
        return CommandResult::error("Invalid relay URL");
    }

    std::cout << "Receiver: relaydrop receive " << pair.pair_code << " <output>\n\n";
    std::cout << "Uploading to relay...\n";

    network::RelayClient relay(relay_endpoint, chunk_timeout(config));
    transfer::TransferEngine engine(transfer::EngineOptions::from_config(config));
    result = engine.upload(relay, transfer_id, manifest, console_progress());
    if (!result) {
        return CommandResult::from(result, "Upload failed");
    }

    std::cout << "Upload complete. Transfer id: " << transfer_id << "\n";
    return CommandResult::ok("Upload complete");
}

CommandResult ReceiveCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return CommandResult::error("Usage: " + get_usage());
    }

    auto& config = Config::instance();
    const auto& code = args[1];
    auto output = utils::FileUtils::expand_home(args[2]);

    network::HttpEndpoint signal_endpoint;
    if (!endpoint_from_config(config, "signaling.url", "http://127.0.0.1:3000", signal_endpoint)) {
        return CommandResult::error("Invalid signaling URL");
    }

    network::SignalingClient signaling(signal_endpoint,
        std::chrono::seconds(std::max(1, config.get_int("network.connection_timeout_seconds", 30))));
    signaling::PairCodeInfo pair;
    auto result = signaling.get_info(code, pair);
    if (!result) {
        return CommandResult::from(result, "Cannot resolve pairing code " + code);
    }

    storage::Manifest expected;
    result = storage::from_json(pair.manifest, expected);
    if (!result) {
        return CommandResult::from(result, "Pairing code carries an invalid manifest");
    }

    std::cout << "Receiving " << storage::display_name(expected) << " ("
              << storage::total_chunks(expected) << " chunks) into " << output.string() << "\n";

    std::unique_ptr<transfer::ChunkSource> source;
    auto lan_peer = config.get_string("lan.peer");
    if (!lan_peer.empty()) {
        network::HttpEndpoint lan_endpoint;
        if (!network::HttpEndpoint::parse(lan_peer, lan_endpoint)) {
            return CommandResult::error("Invalid --lan address: " + lan_peer);
        }
        source = std::make_unique<network::LanClient>(lan_endpoint, chunk_timeout(config));
    } else {
        network::HttpEndpoint relay_endpoint;
        if (!endpoint_from_config(config, "relay.url", "http://127.0.0.1:8000", relay_endpoint)) {
            return CommandResult::error("Invalid relay URL");
        }
        source = std::make_unique<network::RelayClient>(relay_endpoint, chunk_timeout(config));
    }

    transfer::TransferEngine engine(transfer::EngineOptions::from_config(config));
    transfer::DownloadReport report;
    result = engine.download(*source, pair.transfer_id, output, report, console_progress(), &expected);
    if (!result) {
        return CommandResult::from(result, "Download failed");
    }

    std::cout << "Received " << report.files.size() << " file(s), " << report.downloaded_chunks
              << " chunks downloaded, " << report.resumed_chunks << " already present. Verified.\n";
    for (const auto& file : report.files) {
        std::cout << "  " << file.string() << "\n";
    }
    return CommandResult::ok("Download complete");
}

}
