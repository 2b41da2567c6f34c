#pragma once

#include <raslink/config.hpp>
#include <raslink/connection/strategy.hpp>
#include <raslink/transport/lan.hpp>

#include <functional>
#include <mutex>

namespace raslink {

    // WebSocket straight to the daemon on the local network
    class LanStrategy : public ConnectionStrategy {
      public:
        using Connector = std::function<dp::Res<TransportPtr>(const LanEndpoint &, const dp::String &device_id,
                                                              const Message &master_secret, const Config &)>;

      private:
        std::shared_ptr<LanDiscovery> discovery_;
        dp::String device_id_;
        Config config_;
        Connector connector_;

        std::mutex cache_mutex_;
        std::optional<LanEndpoint> cached_;

        static dp::Res<TransportPtr> connect_websocket(const LanEndpoint &endpoint, const dp::String &device_id,
                                                       const Message &master_secret, const Config &config) {
            auto res = LanTransport::connect(endpoint, device_id, master_secret, config);
            if (res.is_err()) {
                return dp::result::err(res.error());
            }
            return dp::result::ok(TransportPtr(res.value()));
        }

        std::optional<LanEndpoint> resolve_endpoint(const ConnectionContext &context, const StepSink &on_step) {
            {
                std::lock_guard<std::mutex> lock(cache_mutex_);
                if (cached_) {
                    return cached_;
                }
            }

            if (discovery_) {
                emit_step(on_step, StepKind::CONNECTING, "Discovering", "Looking for daemon on local network");
                auto found = discovery_->discover(device_id_, config_.lan_quick_discovery_timeout_ms);
                if (found) {
                    std::lock_guard<std::mutex> lock(cache_mutex_);
                    cached_ = found;
                    return found;
                }
            }

            if (context.daemon_host.empty()) {
                return std::nullopt;
            }
            dp::u16 port = context.daemon_port != 0 ? context.daemon_port : config_.lan_port;
            return LanEndpoint{context.daemon_host, port, dp::String()};
        }

      public:
        static constexpr dp::i32 PRIORITY = 5;

        LanStrategy(std::shared_ptr<LanDiscovery> discovery, const dp::String &device_id,
                    const Config &config = Config{}, Connector connector = &LanStrategy::connect_websocket)
            : discovery_(std::move(discovery)), device_id_(device_id), config_(config),
              connector_(std::move(connector)) {}

        dp::String name() const override { return "LAN Direct"; }

        dp::i32 priority() const override { return PRIORITY; }

        /// Available only once discovery has located the daemon
        /// A cached endpoint answers without another lookup; a failed dial clears it
        DetectionResult detect() override {
            if (!discovery_) {
                return DetectUnavailable{"Local network discovery unavailable"};
            }
            {
                std::lock_guard<std::mutex> lock(cache_mutex_);
                if (cached_) {
                    return DetectAvailable{cached_->to_string()};
                }
            }
            auto found = discovery_->discover(device_id_, config_.lan_discovery_timeout_ms);
            if (!found) {
                echo::debug("lan: daemon not found by discovery");
                return DetectUnavailable{"Daemon not on local network"};
            }
            echo::debug("lan: daemon discovered at ", found->to_string());
            std::lock_guard<std::mutex> lock(cache_mutex_);
            cached_ = found;
            return DetectAvailable{found->to_string()};
        }

        ConnectionResult connect(const ConnectionContext &context, const StepSink &on_step,
                                 const CancelToken &cancel) override {
            auto endpoint = resolve_endpoint(context, on_step);
            if (!endpoint) {
                return ConnectFailed{"Daemon LAN address unknown", false};
            }
            if (cancel.is_cancelled()) {
                return ConnectFailed{"Cancelled", false};
            }

            emit_step(on_step, StepKind::CONNECTING, "Connecting", dp::String("WebSocket to ") + endpoint->to_string());
            emit_step(on_step, StepKind::AUTHENTICATING, "Authenticating", "Verifying connection");

            auto transport_res = connector_(*endpoint, context.device_id, context.auth_token, config_);
            if (transport_res.is_err()) {
                echo::warn("lan connect failed: ", transport_res.error().message.c_str());
                // The daemon may have moved; rediscover next time
                std::lock_guard<std::mutex> lock(cache_mutex_);
                cached_.reset();
                return ConnectFailed{transport_res.error().message, false};
            }

            TransportPtr transport = transport_res.value();
            if (cancel.is_cancelled()) {
                transport->close();
                return ConnectFailed{"Cancelled", false};
            }

            emit_step(on_step, StepKind::AUTHENTICATED, "Authenticated", endpoint->to_string());
            echo::info("lan connection established with ", endpoint->to_string());
            return ConnectSuccess{transport};
        }

        /// Endpoint remembered from the last discovery, if any
        std::optional<LanEndpoint> cached_endpoint() {
            std::lock_guard<std::mutex> lock(cache_mutex_);
            return cached_;
        }
    };

} // namespace raslink
