#pragma once

#include <raslink/config.hpp>
#include <raslink/connection/strategy.hpp>
#include <raslink/transport/mesh.hpp>

#include <mutex>

namespace raslink {

    // Direct UDP to the daemon's mesh-VPN address
    class MeshStrategy : public ConnectionStrategy {
      private:
        std::shared_ptr<MeshDetector> detector_;
        std::shared_ptr<DatagramSocketFactory> socket_factory_;
        Config config_;

        std::mutex detected_mutex_;
        std::optional<MeshInfo> detected_;

      public:
        static constexpr dp::i32 PRIORITY = 10;

        MeshStrategy(std::shared_ptr<MeshDetector> detector, std::shared_ptr<DatagramSocketFactory> socket_factory,
                     const Config &config = Config{})
            : detector_(std::move(detector)), socket_factory_(std::move(socket_factory)), config_(config) {}

        dp::String name() const override { return "Tailscale Direct"; }

        dp::i32 priority() const override { return PRIORITY; }

        DetectionResult detect() override {
            std::optional<MeshInfo> info;
            if (detector_) {
                info = detector_->detect();
            }
            std::lock_guard<std::mutex> lock(detected_mutex_);
            detected_ = info;
            if (!info) {
                return DetectUnavailable{"Tailscale not connected"};
            }
            echo::debug("mesh detected, local ip ", info->local_ip.c_str());
            return DetectAvailable{info->local_ip};
        }

        ConnectionResult connect(const ConnectionContext &context, const StepSink &on_step,
                                 const CancelToken &cancel) override {
            {
                std::lock_guard<std::mutex> lock(detected_mutex_);
                if (!detected_) {
                    return ConnectFailed{"Tailscale not detected", false};
                }
            }

            emit_step(on_step, StepKind::CONNECTING, "Checking", "Looking for daemon Tailscale info");
            if (!context.mesh_ip || context.mesh_ip->empty()) {
                echo::info("daemon mesh address unknown");
                return ConnectFailed{"Daemon Tailscale IP unknown", false};
            }

            // Port 0 is not a listening port; treat it as unset
            dp::u16 port = config_.mesh_port;
            if (context.mesh_port && *context.mesh_port != 0) {
                port = *context.mesh_port;
            }
            UdpEndpoint remote{*context.mesh_ip, port};

            if (cancel.is_cancelled()) {
                return ConnectFailed{"Cancelled", false};
            }

            emit_step(on_step, StepKind::CONNECTING, "Connecting", dp::String("Direct connection to ") + remote.host);
            if (!socket_factory_) {
                return ConnectFailed{"No socket factory", false};
            }
            auto socket_res = socket_factory_->create();
            if (socket_res.is_err()) {
                return ConnectFailed{socket_res.error().message, false};
            }

            auto transport_res = MeshTransport::connect(std::move(socket_res.value()), remote, config_);
            if (transport_res.is_err()) {
                const dp::Error &error = transport_res.error();
                echo::warn("mesh connect failed: ", error.message.c_str());
                return ConnectFailed{error.message, is_timeout(error)};
            }
            auto transport = transport_res.value();

            if (cancel.is_cancelled()) {
                transport->close();
                return ConnectFailed{"Cancelled", false};
            }

            emit_step(on_step, StepKind::AUTHENTICATING, "Authenticating", "Verifying connection");
            auto auth_res = transport->authenticate(context.device_id, context.auth_token, config_.mesh_auth_timeout_ms);
            if (auth_res.is_err()) {
                // authenticate() already closed the transport
                return ConnectFailed{auth_res.error().message, false};
            }

            emit_step(on_step, StepKind::AUTHENTICATED, "Authenticated", remote.to_string());
            echo::info("mesh connection established with ", remote.to_string());
            return ConnectSuccess{transport};
        }
    };

} // namespace raslink
