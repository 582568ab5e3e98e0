#include <gtest/gtest.h>
#include "relaydrop/signaling/signaling_hub.hpp"
#include "relaydrop/storage/manifest.hpp"
#include "relaydrop/crypto/random.hpp"
#include <algorithm>
#include <cctype>
#include <mutex>
#include <set>
#include <thread>

using namespace relaydrop::signaling;
using relaydrop::core::ErrorCode;
using relaydrop::core::NotFoundReason;
using nlohmann::json;

namespace {

class RecordingChannel : public PeerChannel {
public:
    bool send(const json& frame) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || fail_sends_) {
            return false;
        }
        frames_.push_back(frame);
        return true;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        ++close_calls_;
    }

    std::vector<json> frames() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return frames_;
    }

    std::vector<std::string> types() const {
        std::vector<std::string> names;
        for (const auto& frame : frames()) {
            names.push_back(frame.value("type", std::string()));
        }
        return names;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    void fail_sends() {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_sends_ = true;
    }

private:
    mutable std::mutex mutex_;
    std::vector<json> frames_;
    bool closed_ = false;
    bool fail_sends_ = false;
    int close_calls_ = 0;
};

json sample_manifest() {
    relaydrop::storage::FileManifest file;
    file.file_name = "holiday.mov";
    file.size = 10;
    file.chunk_size = 4;
    file.total_chunks = 3;
    file.hash = std::string(64, 'a');
    file.chunks = {{0, std::string(64, 'b'), 4}, {1, std::string(64, 'c'), 4}, {2, std::string(64, 'd'), 2}};
    return relaydrop::storage::to_json(relaydrop::storage::Manifest(file));
}

}

class SignalingHubTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(relaydrop::crypto::SecureRandom::initialize());
        now_ = SignalingHub::Clock::time_point{} + std::chrono::hours(1000);

        SignalingOptions options;
        options.code_ttl = std::chrono::seconds(3600);
        hub_ = std::make_unique<SignalingHub>(options, [this] { return now_; });
    }

    std::string issue(const std::string& transfer_id = "transfer-1") {
        PairCodeInfo info;
        auto result = hub_->issue_pair_code(transfer_id, sample_manifest(), info);
        EXPECT_TRUE(result) << result.message;
        return info.pair_code;
    }

    SignalingHub::Clock::time_point now_;
    std::unique_ptr<SignalingHub> hub_;
};

TEST_F(SignalingHubTest, IssuedCodeIsSixDigits) {
    PairCodeInfo info;
    ASSERT_TRUE(hub_->issue_pair_code("transfer-1", sample_manifest(), info));

    ASSERT_EQ(info.pair_code.size(), 6u);
    EXPECT_TRUE(std::all_of(info.pair_code.begin(), info.pair_code.end(),
                            [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }));
    EXPECT_EQ(info.transfer_id, "transfer-1");
    EXPECT_EQ(info.status, PairStatus::WAITING);
    EXPECT_EQ(info.expires_in, std::chrono::seconds(3600));
}

TEST_F(SignalingHubTest, LiveCodesAreUnique) {
    std::set<std::string> codes;
    for (int i = 0; i < 200; ++i) {
        codes.insert(issue("t" + std::to_string(i)));
    }
    EXPECT_EQ(codes.size(), 200u);
    EXPECT_EQ(hub_->stats().total_pair_codes, 200u);
}

TEST_F(SignalingHubTest, RejectsBadIssueRequests) {
    PairCodeInfo info;
    EXPECT_EQ(hub_->issue_pair_code("", sample_manifest(), info).error, ErrorCode::INVALID_INPUT);
    EXPECT_EQ(hub_->issue_pair_code("t", json{{"kind", "file"}}, info).error, ErrorCode::INVALID_INPUT);
    EXPECT_EQ(hub_->stats().total_pair_codes, 0u);
}

TEST_F(SignalingHubTest, CodeSpaceExhaustion) {
    SignalingOptions options;
    options.code_length = 1;
    options.max_code_attempts = 500;
    SignalingHub tiny(options, [this] { return now_; });

    PairCodeInfo info;
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(tiny.issue_pair_code("t" + std::to_string(i), sample_manifest(), info));
    }
    EXPECT_EQ(tiny.issue_pair_code("one-too-many", sample_manifest(), info).error, ErrorCode::EXHAUSTED);
}

TEST_F(SignalingHubTest, InfoTracksRemainingLifetime) {
    auto code = issue();

    now_ += std::chrono::seconds(600);
    PairCodeInfo info;
    ASSERT_TRUE(hub_->get_info(code, info));
    EXPECT_EQ(info.transfer_id, "transfer-1");
    EXPECT_EQ(info.manifest, sample_manifest());
    EXPECT_EQ(info.expires_in, std::chrono::seconds(3000));

    auto result = hub_->get_info("000000x", info);
    EXPECT_EQ(result.error, ErrorCode::NOT_FOUND);
    EXPECT_EQ(result.reason, NotFoundReason::PAIR_CODE_UNKNOWN);
}

TEST_F(SignalingHubTest, CodeExpiresAfterTtl) {
    auto code = issue();
    PairCodeInfo info;

    now_ += std::chrono::seconds(3600);
    EXPECT_TRUE(hub_->get_info(code, info));

    now_ += std::chrono::seconds(1);
    EXPECT_EQ(hub_->get_info(code, info).reason, NotFoundReason::PAIR_CODE_UNKNOWN);
    EXPECT_EQ(hub_->stats().total_pair_codes, 0u);
}

TEST_F(SignalingHubTest, PairingNotifiesBothSides) {
    auto code = issue();
    auto sender = std::make_shared<RecordingChannel>();
    auto receiver = std::make_shared<RecordingChannel>();

    ASSERT_TRUE(hub_->connect(code, "sender", sender));
    EXPECT_EQ(sender->types(), (std::vector<std::string>{"connected"}));
    EXPECT_EQ(sender->frames()[0]["role"], "sender");
    EXPECT_EQ(sender->frames()[0]["pair_code"], code);

    ASSERT_TRUE(hub_->connect(code, "receiver", receiver));
    EXPECT_EQ(sender->types(), (std::vector<std::string>{"connected", "peer_connected"}));
    EXPECT_EQ(sender->frames()[1]["peer_role"], "receiver");
    EXPECT_FALSE(sender->frames()[1].contains("manifest"));

    EXPECT_EQ(receiver->types(), (std::vector<std::string>{"connected", "peer_connected"}));
    EXPECT_EQ(receiver->frames()[1]["peer_role"], "sender");
    EXPECT_EQ(receiver->frames()[1]["manifest"], sample_manifest());

    PairCodeInfo info;
    ASSERT_TRUE(hub_->get_info(code, info));
    EXPECT_EQ(info.status, PairStatus::PAIRED);

    auto stats = hub_->stats();
    EXPECT_EQ(stats.active_pairs, 1u);
    EXPECT_EQ(stats.active_connections, 2u);
}

TEST_F(SignalingHubTest, ReceiverFirstAlsoPairs) {
    auto code = issue();
    auto sender = std::make_shared<RecordingChannel>();
    auto receiver = std::make_shared<RecordingChannel>();

    ASSERT_TRUE(hub_->connect(code, "receiver", receiver));
    ASSERT_TRUE(hub_->connect(code, "sender", sender));

    EXPECT_EQ(receiver->types(), (std::vector<std::string>{"connected", "peer_connected"}));
    EXPECT_TRUE(receiver->frames()[1].contains("manifest"));
}

TEST_F(SignalingHubTest, ConnectRejectsUnknownCodeThenBadRole) {
    auto stranger = std::make_shared<RecordingChannel>();
    auto result = hub_->connect("424242", "sender", stranger);
    EXPECT_EQ(result.reason, NotFoundReason::PAIR_CODE_UNKNOWN);
    ASSERT_EQ(stranger->types(), (std::vector<std::string>{"error"}));
    EXPECT_EQ(stranger->frames()[0]["message"], "Invalid or expired pair code");
    EXPECT_TRUE(stranger->closed());

    // An unknown code wins over an invalid role.
    auto both_wrong = std::make_shared<RecordingChannel>();
    hub_->connect("424242", "spectator", both_wrong);
    EXPECT_EQ(both_wrong->frames()[0]["message"], "Invalid or expired pair code");

    auto code = issue();
    auto spectator = std::make_shared<RecordingChannel>();
    result = hub_->connect(code, "spectator", spectator);
    EXPECT_EQ(result.error, ErrorCode::INVALID_INPUT);
    EXPECT_EQ(spectator->frames()[0]["message"], "Invalid role. Must be 'sender' or 'receiver'");
    EXPECT_TRUE(spectator->closed());
    EXPECT_EQ(hub_->stats().active_connections, 0u);
}

TEST_F(SignalingHubTest, RelayForwardsVerbatim) {
    auto code = issue();
    auto sender = std::make_shared<RecordingChannel>();
    auto receiver = std::make_shared<RecordingChannel>();
    ASSERT_TRUE(hub_->connect(code, "sender", sender));
    ASSERT_TRUE(hub_->connect(code, "receiver", receiver));

    json offer = {{"type", "offer"}, {"sdp", "v=0..."}, {"extra", {1, 2, 3}}};
    ASSERT_TRUE(hub_->relay(code, PeerRole::SENDER, offer));
    EXPECT_EQ(receiver->frames().back(), offer);

    json answer = {{"type", "answer"}, {"sdp", "v=0 answer"}};
    ASSERT_TRUE(hub_->relay(code, PeerRole::RECEIVER, answer));
    EXPECT_EQ(sender->frames().back(), answer);
}

TEST_F(SignalingHubTest, RelayWithoutPeerRepliesWithError) {
    auto code = issue();
    auto sender = std::make_shared<RecordingChannel>();
    ASSERT_TRUE(hub_->connect(code, "sender", sender));

    auto result = hub_->relay(code, PeerRole::SENDER, json{{"type", "ice-candidate"}});
    EXPECT_FALSE(result);
    EXPECT_EQ(sender->frames().back()["type"], "error");
    EXPECT_EQ(sender->frames().back()["message"], "Peer not connected");
}

TEST_F(SignalingHubTest, RelayToDeadPeerRepliesWithError) {
    auto code = issue();
    auto sender = std::make_shared<RecordingChannel>();
    auto receiver = std::make_shared<RecordingChannel>();
    ASSERT_TRUE(hub_->connect(code, "sender", sender));
    ASSERT_TRUE(hub_->connect(code, "receiver", receiver));

    receiver->fail_sends();
    EXPECT_FALSE(hub_->relay(code, PeerRole::SENDER, json{{"type", "offer"}}));
    EXPECT_EQ(sender->frames().back()["message"], "Peer not connected");
}

TEST_F(SignalingHubTest, DisconnectNotifiesPeerAndFreesRoom) {
    auto code = issue();
    auto sender = std::make_shared<RecordingChannel>();
    auto receiver = std::make_shared<RecordingChannel>();
    ASSERT_TRUE(hub_->connect(code, "sender", sender));
    ASSERT_TRUE(hub_->connect(code, "receiver", receiver));

    hub_->disconnect(code, PeerRole::RECEIVER, receiver);
    EXPECT_EQ(sender->frames().back()["type"], "peer_disconnected");
    EXPECT_EQ(sender->frames().back()["peer_role"], "receiver");
    EXPECT_EQ(hub_->stats().active_connections, 1u);

    hub_->disconnect(code, PeerRole::SENDER, sender);
    auto stats = hub_->stats();
    EXPECT_EQ(stats.active_pairs, 0u);
    EXPECT_EQ(stats.active_connections, 0u);

    // The code itself survives until it expires.
    PairCodeInfo info;
    EXPECT_TRUE(hub_->get_info(code, info));
}

TEST_F(SignalingHubTest, ReconnectReplacesAndClosesOldChannel) {
    auto code = issue();
    auto first = std::make_shared<RecordingChannel>();
    auto second = std::make_shared<RecordingChannel>();
    auto receiver = std::make_shared<RecordingChannel>();

    ASSERT_TRUE(hub_->connect(code, "sender", first));
    ASSERT_TRUE(hub_->connect(code, "sender", second));
    EXPECT_TRUE(first->closed());
    EXPECT_EQ(hub_->stats().active_connections, 1u);

    // The stale channel's disconnect must not evict its replacement.
    hub_->disconnect(code, PeerRole::SENDER, first);
    EXPECT_EQ(hub_->stats().active_connections, 1u);

    ASSERT_TRUE(hub_->connect(code, "receiver", receiver));
    ASSERT_TRUE(hub_->relay(code, PeerRole::RECEIVER, json{{"type", "answer"}}));
    EXPECT_EQ(second->frames().back()["type"], "answer");
}

TEST_F(SignalingHubTest, ExpiryClosesConnectedPeers) {
    auto code = issue();
    auto sender = std::make_shared<RecordingChannel>();
    ASSERT_TRUE(hub_->connect(code, "sender", sender));

    now_ += std::chrono::seconds(3601);
    auto stats = hub_->stats();
    EXPECT_EQ(stats.total_pair_codes, 0u);
    EXPECT_EQ(stats.active_pairs, 0u);
    EXPECT_TRUE(sender->closed());

    auto late = std::make_shared<RecordingChannel>();
    EXPECT_EQ(hub_->connect(code, "receiver", late).reason, NotFoundReason::PAIR_CODE_UNKNOWN);
}

TEST_F(SignalingHubTest, ConcurrentIssueAndConnect) {
    std::vector<std::thread> workers;
    std::mutex codes_mutex;
    std::set<std::string> codes;

    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&, t]() {
            for (int i = 0; i < 25; ++i) {
                PairCodeInfo info;
                if (!hub_->issue_pair_code("t" + std::to_string(t * 100 + i), sample_manifest(), info)) {
                    continue;
                }
                auto sender = std::make_shared<RecordingChannel>();
                auto receiver = std::make_shared<RecordingChannel>();
                hub_->connect(info.pair_code, "sender", sender);
                hub_->connect(info.pair_code, "receiver", receiver);
                hub_->relay(info.pair_code, PeerRole::SENDER, json{{"type", "offer"}});

                std::lock_guard<std::mutex> lock(codes_mutex);
                codes.insert(info.pair_code);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(codes.size(), 200u);
    auto stats = hub_->stats();
    EXPECT_EQ(stats.total_pair_codes, 200u);
    EXPECT_EQ(stats.active_connections, 400u);
}

TEST(PeerRoleTest, ParseAndOpposite) {
    EXPECT_EQ(parse_peer_role("sender"), PeerRole::SENDER);
    EXPECT_EQ(parse_peer_role("receiver"), PeerRole::RECEIVER);
    EXPECT_FALSE(parse_peer_role("Sender").has_value());
    EXPECT_EQ(opposite(PeerRole::SENDER), PeerRole::RECEIVER);
    EXPECT_STREQ(to_string(PairStatus::PAIRED), "paired");
}
