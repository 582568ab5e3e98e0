#pragma once

#include "relaydrop/core/result.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace relaydrop::core {
class Config;
}

namespace relaydrop::signaling {

enum class PeerRole {
    SENDER,
    RECEIVER
};

std::optional<PeerRole> parse_peer_role(const std::string& name);
const char* to_string(PeerRole role);
PeerRole opposite(PeerRole role);

enum class PairStatus {
    WAITING,
    PAIRED
};

const char* to_string(PairStatus status);

// One live, message-oriented connection of a peer. send() must not block on the
// network; it returns false once the connection can no longer deliver.
class PeerChannel {
public:
    virtual ~PeerChannel() = default;

    virtual bool send(const nlohmann::json& frame) = 0;
    virtual void close() = 0;
};

struct SignalingOptions {
    std::size_t code_length = 6;
    std::chrono::seconds code_ttl{3600};
    std::size_t max_code_attempts = 100;

    static SignalingOptions from_config(const core::Config& config);
};

struct PairCodeInfo {
    std::string pair_code;
    std::string transfer_id;
    nlohmann::json manifest;
    PairStatus status = PairStatus::WAITING;
    std::chrono::seconds expires_in{0};
};

struct HubStats {
    std::size_t active_pairs = 0;
    std::size_t total_pair_codes = 0;
    std::size_t active_connections = 0;
};

namespace frames {

nlohmann::json connected(PeerRole role, const std::string& pair_code);
nlohmann::json peer_connected(PeerRole peer_role, const nlohmann::json* manifest = nullptr);
nlohmann::json peer_disconnected(PeerRole peer_role);
nlohmann::json error(const std::string& message);

}

// Pairing codes and the rooms that match a sender with a receiver. Both tables sit
// behind one mutex; frames produced by an operation are sent only after it has been
// released, so a slow peer cannot stall unrelated rooms. Expired codes are purged
// lazily by issue_pair_code, get_info, connect and stats.
class SignalingHub {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFunction = std::function<Clock::time_point()>;

    explicit SignalingHub(SignalingOptions options = {}, ClockFunction clock = nullptr);

    core::Result issue_pair_code(const std::string& transfer_id, const nlohmann::json& manifest,
                                 PairCodeInfo& info);

    core::Result get_info(const std::string& code, PairCodeInfo& info);

    // On failure the channel has been sent an error frame and closed.
    core::Result connect(const std::string& code, const std::string& role,
                         const std::shared_ptr<PeerChannel>& channel);

    // Forwards `message` verbatim to the other role. When it is absent or its send
    // fails, the sending role gets a "Peer not connected" error frame.
    core::Result relay(const std::string& code, PeerRole role, const nlohmann::json& message);

    // No-op unless `channel` is still the one registered for this role.
    void disconnect(const std::string& code, PeerRole role, const std::shared_ptr<PeerChannel>& channel);

    HubStats stats();

    const SignalingOptions& options() const { return options_; }

private:
    struct PairEntry {
        std::string transfer_id;
        nlohmann::json manifest;
        Clock::time_point created_at;
        PairStatus status = PairStatus::WAITING;
    };

    struct Room {
        std::shared_ptr<PeerChannel> sender;
        std::shared_ptr<PeerChannel> receiver;

        std::shared_ptr<PeerChannel>& slot(PeerRole role) { return role == PeerRole::SENDER ? sender : receiver; }
        bool empty() const { return !sender && !receiver; }
        std::size_t size() const { return (sender ? 1 : 0) + (receiver ? 1 : 0); }
    };

    using Outbox = std::vector<std::pair<std::shared_ptr<PeerChannel>, nlohmann::json>>;

    SignalingOptions options_;
    ClockFunction clock_;

    std::mutex mutex_;
    std::unordered_map<std::string, PairEntry> codes_;
    std::unordered_map<std::string, Room> rooms_;

    // Caller holds mutex_. Channels of purged rooms are appended to `to_close`.
    void purge_expired_locked(Clock::time_point now, std::vector<std::shared_ptr<PeerChannel>>& to_close);
    bool is_expired(const PairEntry& entry, Clock::time_point now) const;
    std::chrono::seconds remaining(const PairEntry& entry, Clock::time_point now) const;

    static void deliver(const Outbox& outbox);
    static void close_all(const std::vector<std::shared_ptr<PeerChannel>>& channels);
};

}
