#include "relaydrop/signaling/signaling_hub.hpp"
#include "relaydrop/core/config.hpp"
#include "relaydrop/core/logger.hpp"
#include "relaydrop/crypto/random.hpp"
#include "relaydrop/storage/manifest.hpp"
#include <algorithm>

namespace relaydrop::signaling {

using core::ErrorCode;
using core::NotFoundReason;
using core::Result;
using nlohmann::json;

std::optional<PeerRole> parse_peer_role(const std::string& name) {
    if (name == "sender") return PeerRole::SENDER;
    if (name == "receiver") return PeerRole::RECEIVER;
    return std::nullopt;
}

const char* to_string(PeerRole role) {
    return role == PeerRole::SENDER ? "sender" : "receiver";
}

PeerRole opposite(PeerRole role) {
    return role == PeerRole::SENDER ? PeerRole::RECEIVER : PeerRole::SENDER;
}

const char* to_string(PairStatus status) {
    return status == PairStatus::PAIRED ? "paired" : "waiting";
}

SignalingOptions SignalingOptions::from_config(const core::Config& config) {
    SignalingOptions options;
    options.code_length = static_cast<std::size_t>(
        std::clamp(config.get_int("signaling.code_length", static_cast<int>(options.code_length)), 4, 12));
    options.code_ttl = std::chrono::seconds(
        std::max(1, config.get_int("signaling.code_ttl_seconds", static_cast<int>(options.code_ttl.count()))));
    return options;
}

namespace frames {

json connected(PeerRole role, const std::string& pair_code) {
    return {{"type", "connected"}, {"role", to_string(role)}, {"pair_code", pair_code}};
}

json peer_connected(PeerRole peer_role, const json* manifest) {
    json frame = {{"type", "peer_connected"}, {"peer_role", to_string(peer_role)}};
    if (manifest) {
        frame["manifest"] = *manifest;
    }
    return frame;
}

json peer_disconnected(PeerRole peer_role) {
    return {{"type", "peer_disconnected"}, {"peer_role", to_string(peer_role)}};
}

json error(const std::string& message) {
    return {{"type", "error"}, {"message", message}};
}

}

SignalingHub::SignalingHub(SignalingOptions options, ClockFunction clock)
    : options_(std::move(options))
    , clock_(clock ? std::move(clock) : ClockFunction([] { return Clock::now(); })) {
}

bool SignalingHub::is_expired(const PairEntry& entry, Clock::time_point now) const {
    return now - entry.created_at > options_.code_ttl;
}

std::chrono::seconds SignalingHub::remaining(const PairEntry& entry, Clock::time_point now) const {
    auto left = std::chrono::duration_cast<std::chrono::seconds>(options_.code_ttl - (now - entry.created_at));
    return std::max(left, std::chrono::seconds(0));
}

void SignalingHub::purge_expired_locked(Clock::time_point now,
                                        std::vector<std::shared_ptr<PeerChannel>>& to_close) {
    for (auto it = codes_.begin(); it != codes_.end();) {
        if (!is_expired(it->second, now)) {
            ++it;
            continue;
        }

        auto room = rooms_.find(it->first);
        if (room != rooms_.end()) {
            if (room->second.sender) to_close.push_back(room->second.sender);
            if (room->second.receiver) to_close.push_back(room->second.receiver);
            rooms_.erase(room);
        }
        LOG_DEBUG("Pair code {} expired", it->first);
        it = codes_.erase(it);
    }
}

void SignalingHub::deliver(const Outbox& outbox) {
    for (const auto& [channel, frame] : outbox) {
        if (!channel->send(frame)) {
            LOG_DEBUG("Dropped '{}' frame for a closed peer", frame.value("type", std::string("?")));
        }
    }
}

void SignalingHub::close_all(const std::vector<std::shared_ptr<PeerChannel>>& channels) {
    for (const auto& channel : channels) {
        channel->close();
    }
}

Result SignalingHub::issue_pair_code(const std::string& transfer_id, const json& manifest, PairCodeInfo& info) {
    if (transfer_id.empty()) {
        return Result(ErrorCode::INVALID_INPUT, "Transfer id is required");
    }

    storage::Manifest decoded;
    auto result = storage::from_json(manifest, decoded);
    if (!result) {
        return result;
    }

    std::vector<std::shared_ptr<PeerChannel>> to_close;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_();
        purge_expired_locked(now, to_close);

        std::optional<std::string> code;
        for (std::size_t attempt = 0; attempt < options_.max_code_attempts; ++attempt) {
            auto candidate = crypto::SecureRandom::generate_digits(options_.code_length);
            if (codes_.find(candidate) == codes_.end()) {
                code = std::move(candidate);
                break;
            }
        }

        if (!code) {
            LOG_ERROR("No free pair code after {} attempts ({} live codes)", options_.max_code_attempts, codes_.size());
            result = Result(ErrorCode::EXHAUSTED, "Could not allocate a pair code");
        } else {
            codes_[*code] = PairEntry{transfer_id, manifest, now, PairStatus::WAITING};

            info.pair_code = *code;
            info.transfer_id = transfer_id;
            info.manifest = manifest;
            info.status = PairStatus::WAITING;
            info.expires_in = options_.code_ttl;
            LOG_INFO("Issued pair code {} for transfer {}", *code, transfer_id);
        }
    }

    close_all(to_close);
    return result;
}

Result SignalingHub::get_info(const std::string& code, PairCodeInfo& info) {
    std::vector<std::shared_ptr<PeerChannel>> to_close;
    Result result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_();
        purge_expired_locked(now, to_close);

        auto it = codes_.find(code);
        if (it == codes_.end()) {
            result = Result::not_found(NotFoundReason::PAIR_CODE_UNKNOWN, "Pair code not found or expired");
        } else {
            info.pair_code = code;
            info.transfer_id = it->second.transfer_id;
            info.manifest = it->second.manifest;
            info.status = it->second.status;
            info.expires_in = remaining(it->second, now);
        }
    }

    close_all(to_close);
    return result;
}

Result SignalingHub::connect(const std::string& code, const std::string& role_name,
                             const std::shared_ptr<PeerChannel>& channel) {
    std::vector<std::shared_ptr<PeerChannel>> to_close;
    Outbox outbox;
    Result result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        purge_expired_locked(clock_(), to_close);

        auto role = parse_peer_role(role_name);
        auto entry = codes_.find(code);

        if (entry == codes_.end()) {
            outbox.emplace_back(channel, frames::error("Invalid or expired pair code"));
            to_close.push_back(channel);
            result = Result::not_found(NotFoundReason::PAIR_CODE_UNKNOWN, "Pair code not found or expired");
        } else if (!role) {
            outbox.emplace_back(channel, frames::error("Invalid role. Must be 'sender' or 'receiver'"));
            to_close.push_back(channel);
            result = Result(ErrorCode::INVALID_INPUT, "Unknown role: " + role_name);
        } else {
            auto& room = rooms_[code];
            auto& slot = room.slot(*role);
            if (slot && slot != channel) {
                LOG_INFO("Pair code {}: {} reconnected, replacing previous connection", code, role_name);
                to_close.push_back(slot);
            }
            slot = channel;

            outbox.emplace_back(channel, frames::connected(*role, code));

            if (room.sender && room.receiver) {
                entry->second.status = PairStatus::PAIRED;
                outbox.emplace_back(room.sender, frames::peer_connected(PeerRole::RECEIVER));
                outbox.emplace_back(room.receiver, frames::peer_connected(PeerRole::SENDER, &entry->second.manifest));
                LOG_INFO("Pair code {} paired", code);
            }
        }
    }

    // Frames go out before any close so an error frame reaches its peer first.
    deliver(outbox);
    close_all(to_close);
    return result;
}

Result SignalingHub::relay(const std::string& code, PeerRole role, const json& message) {
    std::shared_ptr<PeerChannel> self;
    std::shared_ptr<PeerChannel> peer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto room = rooms_.find(code);
        if (room != rooms_.end()) {
            self = room->second.slot(role);
            peer = room->second.slot(opposite(role));
        }
    }

    if (peer && peer->send(message)) {
        return Result();
    }

    if (self && !self->send(frames::error("Peer not connected"))) {
        LOG_DEBUG("Pair code {}: {} went away before its relay error was delivered", code, to_string(role));
    }
    return Result(ErrorCode::NOT_FOUND, "Peer not connected");
}

void SignalingHub::disconnect(const std::string& code, PeerRole role, const std::shared_ptr<PeerChannel>& channel) {
    Outbox outbox;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto room = rooms_.find(code);
        if (room == rooms_.end()) {
            return;
        }

        auto& slot = room->second.slot(role);
        if (slot != channel) {
            return;
        }
        slot.reset();

        if (auto& peer = room->second.slot(opposite(role))) {
            outbox.emplace_back(peer, frames::peer_disconnected(role));
        }
        if (room->second.empty()) {
            rooms_.erase(room);
        }
        LOG_INFO("Pair code {}: {} disconnected", code, to_string(role));
    }

    deliver(outbox);
}

HubStats SignalingHub::stats() {
    std::vector<std::shared_ptr<PeerChannel>> to_close;
    HubStats stats;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        purge_expired_locked(clock_(), to_close);

        stats.active_pairs = rooms_.size();
        stats.total_pair_codes = codes_.size();
        for (const auto& [code, room] : rooms_) {
            stats.active_connections += room.size();
        }
    }

    close_all(to_close);
    return stats;
}

}
