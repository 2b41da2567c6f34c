#pragma once

#include <raslink/transport/webrtc.hpp>

#include <rtc/rtc.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace raslink {

    namespace rtc_detail {

        inline std::optional<CandidateKind> to_candidate_kind(rtc::Candidate::Type type) {
            switch (type) {
            case rtc::Candidate::Type::Host:
                return CandidateKind::HOST;
            case rtc::Candidate::Type::ServerReflexive:
                return CandidateKind::SRFLX;
            case rtc::Candidate::Type::PeerReflexive:
                return CandidateKind::PRFLX;
            case rtc::Candidate::Type::Relayed:
                return CandidateKind::RELAY;
            default:
                return std::nullopt;
            }
        }

        inline std::optional<CandidateInfo> to_candidate_info(const rtc::Candidate &candidate) {
            auto kind = to_candidate_kind(candidate.type());
            auto address = candidate.address();
            auto port = candidate.port();
            if (!kind || !address || !port) {
                return std::nullopt;
            }
            return CandidateInfo{*kind, dp::String(address->c_str()), static_cast<dp::u16>(*port)};
        }

        /// State shared with libdatachannel callbacks, which may outlive the client object
        struct ChannelState {
            std::mutex mutex;
            std::condition_variable cv;
            bool gathered = false;
            bool open = false;
            bool failed = false;
            bool closed = false;
            std::deque<Message> inbox;
        };

    } // namespace rtc_detail

    // WebRtcClient on libdatachannel: one PeerConnection, one binary data channel
    class RtcPeerClient : public WebRtcClient {
      private:
        std::shared_ptr<rtc::PeerConnection> pc_;
        std::shared_ptr<rtc::DataChannel> channel_;
        std::shared_ptr<rtc_detail::ChannelState> state_;
        std::atomic<bool> closed_;

        static constexpr const char *CHANNEL_LABEL = "terminal";
        static constexpr dp::u32 CANCEL_POLL_MS = 100;

      public:
        explicit RtcPeerClient(const Config &config)
            : state_(std::make_shared<rtc_detail::ChannelState>()), closed_(false) {
            rtc::Configuration rtc_config;
            for (const auto &server : config.stun_servers) {
                rtc_config.iceServers.emplace_back(std::string(server.c_str()));
            }
            rtc_config.maxMessageSize = config.max_message_size;
            pc_ = std::make_shared<rtc::PeerConnection>(rtc_config);

            auto state = state_;
            pc_->onGatheringStateChange([state](rtc::PeerConnection::GatheringState gathering) {
                if (gathering == rtc::PeerConnection::GatheringState::Complete) {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    state->gathered = true;
                    state->cv.notify_all();
                }
            });
            pc_->onStateChange([state](rtc::PeerConnection::State pc_state) {
                echo::debug("webrtc: peer connection state ", static_cast<int>(pc_state));
                if (pc_state == rtc::PeerConnection::State::Failed || pc_state == rtc::PeerConnection::State::Closed ||
                    pc_state == rtc::PeerConnection::State::Disconnected) {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    state->failed = true;
                    state->cv.notify_all();
                }
            });
        }

        ~RtcPeerClient() override { close(); }

        RtcPeerClient(const RtcPeerClient &) = delete;
        RtcPeerClient &operator=(const RtcPeerClient &) = delete;

        dp::Res<dp::String> create_offer(dp::u32 timeout_ms) override {
            try {
                auto state = state_;
                channel_ = pc_->createDataChannel(CHANNEL_LABEL);
                channel_->onOpen([state]() {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    state->open = true;
                    state->cv.notify_all();
                });
                channel_->onClosed([state]() {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    state->open = false;
                    state->closed = true;
                    state->cv.notify_all();
                });
                channel_->onMessage([state](rtc::message_variant data) {
                    if (!std::holds_alternative<rtc::binary>(data)) {
                        echo::warn("webrtc: ignoring text message on data channel");
                        return;
                    }
                    const rtc::binary &bin = std::get<rtc::binary>(data);
                    const auto *bytes = reinterpret_cast<const dp::u8 *>(bin.data());
                    std::lock_guard<std::mutex> lock(state->mutex);
                    state->inbox.emplace_back(bytes, bytes + bin.size());
                    state->cv.notify_all();
                });
            } catch (const std::exception &e) {
                echo::error("webrtc: cannot create data channel: ", e.what());
                return dp::result::err(dp::Error::io_error(dp::String(e.what())));
            }

            // Non-trickle: the offer goes out once with every candidate in it
            {
                std::unique_lock<std::mutex> lock(state_->mutex);
                if (!state_->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                         [this] { return state_->gathered || state_->failed; })) {
                    echo::warn("webrtc: candidate gathering did not finish in ", timeout_ms, "ms");
                }
            }

            auto description = pc_->localDescription();
            if (!description) {
                return dp::result::err(dp::Error::io_error("no local description"));
            }
            return dp::result::ok(dp::String(std::string(*description).c_str()));
        }

        dp::Res<void> set_remote_answer(const dp::String &answer_sdp) override {
            try {
                pc_->setRemoteDescription(rtc::Description(std::string(answer_sdp.c_str()), "answer"));
            } catch (const std::exception &e) {
                echo::error("webrtc: bad answer: ", e.what());
                return dp::result::err(dp::Error::invalid_argument(dp::String(e.what())));
            }
            return dp::result::ok();
        }

        dp::Res<void> wait_for_data_channel(dp::u32 timeout_ms, const CancelToken &cancel) override {
            auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
            std::unique_lock<std::mutex> lock(state_->mutex);
            while (!state_->open) {
                if (state_->failed || state_->closed) {
                    return dp::result::err(dp::Error::io_error("ICE connection failed"));
                }
                if (cancel.is_cancelled()) {
                    return dp::result::err(dp::Error::not_found("cancelled"));
                }
                auto now = std::chrono::steady_clock::now();
                if (now >= deadline) {
                    return dp::result::err(dp::Error::timeout("data channel did not open"));
                }
                auto slice = std::min(deadline - now,
                                      std::chrono::steady_clock::duration(std::chrono::milliseconds(CANCEL_POLL_MS)));
                state_->cv.wait_for(lock, slice);
            }
            return dp::result::ok();
        }

        dp::Res<void> send(const Message &msg) override {
            if (!channel_ || closed_) {
                return dp::result::err(dp::Error::not_found("Transport is closed"));
            }
            try {
                const auto *bytes = reinterpret_cast<const std::byte *>(msg.data());
                if (!channel_->send(bytes, msg.size())) {
                    // Buffered by libdatachannel; delivery continues in the background
                    echo::trace("webrtc: send buffered (", msg.size(), " bytes)");
                }
            } catch (const std::exception &e) {
                echo::error("webrtc: send failed: ", e.what());
                return dp::result::err(dp::Error::not_found(dp::String(e.what())));
            }
            return dp::result::ok();
        }

        dp::Res<Message> recv(dp::u32 timeout_ms) override {
            std::unique_lock<std::mutex> lock(state_->mutex);
            bool ready = state_->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] {
                return !state_->inbox.empty() || state_->closed || state_->failed || closed_;
            });
            if (!state_->inbox.empty()) {
                Message msg = std::move(state_->inbox.front());
                state_->inbox.pop_front();
                return dp::result::ok(std::move(msg));
            }
            if (!ready) {
                return dp::result::err(dp::Error::timeout("Receive timeout"));
            }
            return dp::result::err(dp::Error::not_found("Transport is closed"));
        }

        std::optional<dp::Pair<CandidateInfo, CandidateInfo>> selected_candidate_pair() override {
            rtc::Candidate local;
            rtc::Candidate remote;
            if (!pc_ || !pc_->getSelectedCandidatePair(&local, &remote)) {
                return std::nullopt;
            }
            auto local_info = rtc_detail::to_candidate_info(local);
            auto remote_info = rtc_detail::to_candidate_info(remote);
            if (!local_info || !remote_info) {
                return std::nullopt;
            }
            return dp::Pair<CandidateInfo, CandidateInfo>(*local_info, *remote_info);
        }

        bool is_open() const override {
            if (closed_) {
                return false;
            }
            std::lock_guard<std::mutex> lock(state_->mutex);
            return state_->open;
        }

        void close() override {
            if (closed_.exchange(true)) {
                return;
            }
            echo::debug("webrtc: closing peer connection");
            if (channel_) {
                channel_->close();
            }
            if (pc_) {
                pc_->close();
            }
            {
                std::lock_guard<std::mutex> lock(state_->mutex);
                state_->closed = true;
            }
            state_->cv.notify_all();
        }
    };

    class RtcPeerClientFactory : public WebRtcClientFactory {
      public:
        dp::Res<std::unique_ptr<WebRtcClient>> create(const Config &config) override {
            try {
                return dp::result::ok(std::unique_ptr<WebRtcClient>(std::make_unique<RtcPeerClient>(config)));
            } catch (const std::exception &e) {
                echo::error("webrtc: cannot create peer connection: ", e.what());
                return dp::result::err(dp::Error::io_error(dp::String(e.what())));
            }
        }
    };

} // namespace raslink
