#pragma once

#include <raslink/config.hpp>
#include <raslink/connection/strategy.hpp>
#include <raslink/transport/webrtc.hpp>

namespace raslink {

    // Peer-to-peer data channel negotiated over the signaling channel
    // Always detectable; the fallback when nothing direct works
    class WebRtcStrategy : public ConnectionStrategy {
      private:
        std::shared_ptr<WebRtcClientFactory> factory_;
        Config config_;

        // Every failure path releases the native peer connection before returning
        static ConnectionResult fail(std::unique_ptr<WebRtcClient> &client, const dp::String &error, bool can_retry) {
            if (client) {
                client->close();
                client.reset();
            }
            echo::warn("webrtc connect failed: ", error.c_str());
            return ConnectFailed{error, can_retry};
        }

      public:
        static constexpr dp::i32 PRIORITY = 20;

        explicit WebRtcStrategy(std::shared_ptr<WebRtcClientFactory> factory, const Config &config = Config{})
            : factory_(std::move(factory)), config_(config) {}

        dp::String name() const override { return "WebRTC P2P"; }

        dp::i32 priority() const override { return PRIORITY; }

        DetectionResult detect() override {
            if (!factory_) {
                return DetectUnavailable{"WebRTC stack unavailable"};
            }
            return DetectAvailable{"Standard P2P connection"};
        }

        ConnectionResult connect(const ConnectionContext &context, const StepSink &on_step,
                                 const CancelToken &cancel) override {
            std::unique_ptr<WebRtcClient> client;

            if (!context.signaling) {
                return ConnectFailed{"No signaling channel", false};
            }
            if (!factory_) {
                return ConnectFailed{"WebRTC stack unavailable", false};
            }

            emit_step(on_step, StepKind::CONNECTING, "Creating offer", "Gathering ICE candidates");
            auto client_res = factory_->create(config_);
            if (client_res.is_err()) {
                return fail(client, client_res.error().message, true);
            }
            client = std::move(client_res.value());

            auto offer_res = client->create_offer(config_.webrtc_gathering_timeout_ms);
            if (offer_res.is_err()) {
                return fail(client, offer_res.error().message, true);
            }
            dp::String offer = offer_res.value();
            echo::debug("webrtc: offer has ", sdp::count_candidates(offer), " candidates");

            // Mesh addresses only route when this device is on the mesh too
            if (!context.local_on_mesh) {
                offer = sdp::filter_mesh_candidates(offer);
                echo::debug("webrtc: ", sdp::count_candidates(offer), " candidates after mesh filtering");
            }

            if (cancel.is_cancelled()) {
                return fail(client, "Cancelled", false);
            }

            emit_step(on_step, StepKind::CONNECTING, "Signaling", "Sending offer to daemon");
            auto answer_res = context.signaling->send_offer(offer, config_.signaling_timeout_ms);
            if (answer_res.is_err()) {
                echo::error("webrtc: no answer: ", answer_res.error().message.c_str());
                return fail(client, "No response from daemon", true);
            }

            if (cancel.is_cancelled()) {
                return fail(client, "Cancelled", false);
            }

            emit_step(on_step, StepKind::CONNECTING, "ICE negotiation", "Establishing peer connection");
            auto remote_res = client->set_remote_answer(answer_res.value());
            if (remote_res.is_err()) {
                return fail(client, remote_res.error().message, true);
            }

            // The data channel opens only after the DTLS handshake with the daemon's fingerprint
            emit_step(on_step, StepKind::AUTHENTICATING, "Securing", "Waiting for encrypted data channel");
            auto channel_res = client->wait_for_data_channel(config_.webrtc_data_channel_timeout_ms, cancel);
            if (channel_res.is_err()) {
                if (cancel.is_cancelled()) {
                    return fail(client, "Cancelled", false);
                }
                return fail(client, "ICE connection failed", true);
            }

            emit_step(on_step, StepKind::AUTHENTICATED, "Connected", "Data channel open");
            echo::info("webrtc connected");
            return ConnectSuccess{std::make_shared<WebRtcTransport>(std::move(client))};
        }
    };

} // namespace raslink
