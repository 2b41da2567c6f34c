#pragma once

#include <raslink/config.hpp>
#include <raslink/connection/progress.hpp>
#include <raslink/connection/strategy.hpp>
#include <raslink/transport/webrtc.hpp>

#include <algorithm>
#include <exception>

namespace raslink {

    /// Runs the strategies cheapest-first and hands back the first transport that works
    ///
    /// Every milestone goes to the caller's progress sink. Failing strategies never abort
    /// the run; when all of them fail the result is an empty optional after AllFailed.
    class Orchestrator {
      private:
        dp::Vector<StrategyPtr> strategies_;
        Config config_;
        std::shared_ptr<MeshHintStore> hint_store_;

        static void emit(const ProgressSink &sink, ConnectionProgress event) {
            if (sink) {
                sink(event);
            }
        }

        ConnectionContext exchange_capabilities(const ConnectionContext &context, const ProgressSink &sink) {
            if (!context.signaling) {
                emit(sink, progress::CapabilityExchangeFailed{"No signaling channel"});
                return context;
            }

            Capabilities ours;
            ours.supports_webrtc = true;
            ours.protocol_version = PROTOCOL_VERSION;

            auto res = context.signaling->exchange_capabilities(ours, config_.capability_exchange_timeout_ms);
            if (res.is_err()) {
                echo::warn("capability exchange failed: ", res.error().message.c_str());
                emit(sink, progress::CapabilityExchangeFailed{res.error().message});
                return context;
            }

            const Capabilities &theirs = res.value();
            echo::debug("daemon capabilities: mesh_ip=", theirs.mesh_ip ? theirs.mesh_ip->c_str() : "-",
                        " webrtc=", theirs.supports_webrtc, " protocol=", theirs.protocol_version);
            emit(sink, progress::DaemonCapabilities{theirs});
            return context.with_mesh_hint(theirs.mesh_ip, theirs.mesh_port);
        }

        // Remember the daemon's mesh address when WebRTC happened to route over the mesh.
        // Never throws: the connection stands whatever happens here.
        void cache_mesh_hint(const ConnectionContext &context, const TransportPtr &transport) noexcept {
            try {
                save_mesh_hint(context, transport);
            } catch (const std::exception &e) {
                echo::warn("failed to cache mesh hint: ", e.what());
            }
        }

        void save_mesh_hint(const ConnectionContext &context, const TransportPtr &transport) {
            if (!hint_store_ || !context.local_on_mesh || transport->type() != TransportType::WEBRTC) {
                return;
            }
            auto webrtc = std::dynamic_pointer_cast<WebRtcTransport>(transport);
            if (!webrtc) {
                return;
            }
            auto path = webrtc->connection_path();
            if (!path) {
                echo::debug("no selected candidate pair, skipping mesh hint");
                return;
            }
            if (!path->remote.is_mesh()) {
                return;
            }
            // The negotiated port is ephemeral; the daemon listens on the fixed mesh port
            auto res = hint_store_->save_mesh_hint(context.device_id, path->remote.address, config_.mesh_port);
            if (res.is_err()) {
                echo::warn("failed to cache mesh hint: ", res.error().message.c_str());
                return;
            }
            echo::info("cached mesh hint ", path->remote.address.c_str(), ":", config_.mesh_port);
        }

      public:
        explicit Orchestrator(dp::Vector<StrategyPtr> strategies, const Config &config = Config{},
                              std::shared_ptr<MeshHintStore> hint_store = nullptr)
            : strategies_(std::move(strategies)), config_(config), hint_store_(std::move(hint_store)) {
            std::stable_sort(strategies_.begin(), strategies_.end(),
                             [](const StrategyPtr &a, const StrategyPtr &b) { return a->priority() < b->priority(); });
        }

        const dp::Vector<StrategyPtr> &strategies() const { return strategies_; }

        std::optional<TransportPtr> connect(const ConnectionContext &context, const ProgressSink &sink) {
            CancelToken never;
            return connect(context, sink, never);
        }

        std::optional<TransportPtr> connect(const ConnectionContext &context, const ProgressSink &sink,
                                            const CancelToken &cancel) {
            auto started = steady_now_ms();
            echo::info("connecting to ", context.device_id.c_str(), " with ", strategies_.size(), " strategies");

            ConnectionContext enriched = exchange_capabilities(context, sink);

            dp::Vector<FailedAttempt> attempts;
            for (dp::usize i = 0; i < strategies_.size(); ++i) {
                if (cancel.is_cancelled()) {
                    echo::info("connection cancelled");
                    emit(sink, progress::Cancelled{});
                    return std::nullopt;
                }

                const auto &strategy = strategies_[i];
                dp::String name = strategy->name();
                bool has_next = i + 1 < strategies_.size();

                emit(sink, progress::Detecting{name});
                DetectionResult detection = DetectUnavailable{"detection failed"};
                try {
                    detection = strategy->detect();
                } catch (const std::exception &e) {
                    echo::error(name.c_str(), " detection threw: ", e.what());
                    detection = DetectUnavailable{dp::String("Detection error: ") + e.what()};
                }
                if (auto *unavailable = std::get_if<DetectUnavailable>(&detection)) {
                    echo::debug(name.c_str(), " unavailable: ", unavailable->reason.c_str());
                    emit(sink, progress::StrategyUnavailable{name, unavailable->reason});
                    continue;
                }
                emit(sink, progress::StrategyAvailable{name, std::get<DetectAvailable>(detection).info});

                StepSink on_step = [&sink, &name](const ConnectionStep &step) {
                    switch (step.kind) {
                    case StepKind::CONNECTING:
                        emit(sink, progress::Connecting{name, step.step, step.detail});
                        break;
                    case StepKind::AUTHENTICATING:
                        emit(sink, progress::Authenticating{name});
                        break;
                    case StepKind::AUTHENTICATED:
                        emit(sink, progress::Authenticated{name});
                        break;
                    }
                };

                auto attempt_started = steady_now_ms();
                ConnectionResult result = ConnectFailed{"connect failed", true};
                try {
                    result = strategy->connect(enriched, on_step, cancel);
                } catch (const std::exception &e) {
                    echo::error(name.c_str(), " connect threw: ", e.what());
                    result = ConnectFailed{dp::String("Unexpected error: ") + e.what(), true};
                }

                if (auto *success = std::get_if<ConnectSuccess>(&result)) {
                    auto elapsed = steady_now_ms() - started;
                    echo::info("connected via ", name.c_str(), " in ", elapsed, "ms");
                    cache_mesh_hint(enriched, success->transport);
                    emit(sink, progress::Connected{name, success->transport, elapsed});
                    return success->transport;
                }

                const auto &failed = std::get<ConnectFailed>(result);
                echo::warn(name.c_str(), " failed: ", failed.error.c_str());
                attempts.push_back(FailedAttempt{name, failed.error, steady_now_ms() - attempt_started});

                if (cancel.is_cancelled()) {
                    echo::info("connection cancelled");
                    emit(sink, progress::Cancelled{});
                    return std::nullopt;
                }
                emit(sink, progress::StrategyFailed{name, failed.error, has_next});
            }

            echo::error("all ", attempts.size(), " connection attempts failed");
            emit(sink, progress::AllFailed{attempts});
            return std::nullopt;
        }
    };

} // namespace raslink
