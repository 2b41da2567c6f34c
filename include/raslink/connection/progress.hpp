#pragma once

#include <raslink/connection/context.hpp>
#include <raslink/transport.hpp>

#include <functional>
#include <variant>

namespace raslink {

    /// A strategy that was tried and did not produce a transport
    struct FailedAttempt {
        dp::String strategy;
        dp::String error;
        dp::u64 duration_ms = 0;
    };

    /// Milestones reported while the orchestrator works through the strategies
    namespace progress {
        struct CapabilityExchangeFailed {
            dp::String reason;
        };
        struct DaemonCapabilities {
            Capabilities capabilities;
        };
        struct Detecting {
            dp::String strategy;
        };
        struct StrategyAvailable {
            dp::String strategy;
            dp::String info;
        };
        struct StrategyUnavailable {
            dp::String strategy;
            dp::String reason;
        };
        struct Connecting {
            dp::String strategy;
            dp::String step;
            dp::String detail;
        };
        struct Authenticating {
            dp::String strategy;
        };
        struct Authenticated {
            dp::String strategy;
        };
        struct Connected {
            dp::String strategy;
            TransportPtr transport;
            dp::u64 elapsed_ms = 0;
        };
        struct StrategyFailed {
            dp::String strategy;
            dp::String error;
            bool will_try_next = false;
        };
        struct AllFailed {
            dp::Vector<FailedAttempt> attempts;
        };
        struct Cancelled {};
    } // namespace progress

    using ConnectionProgress =
        std::variant<progress::CapabilityExchangeFailed, progress::DaemonCapabilities, progress::Detecting,
                     progress::StrategyAvailable, progress::StrategyUnavailable, progress::Connecting,
                     progress::Authenticating, progress::Authenticated, progress::Connected, progress::StrategyFailed,
                     progress::AllFailed, progress::Cancelled>;

    using ProgressSink = std::function<void(const ConnectionProgress &)>;

    /// Overall state of a connection attempt as seen by a UI
    enum class ConnectionState : dp::u8 { IDLE = 0, DETECTING = 1, CONNECTING = 2, CONNECTED = 3, FAILED = 4, CANCELLED = 5 };

    /// Fold one progress event into the overall state
    inline ConnectionState next_state(ConnectionState current, const ConnectionProgress &event) {
        if (std::holds_alternative<progress::Connected>(event)) {
            return ConnectionState::CONNECTED;
        }
        if (std::holds_alternative<progress::AllFailed>(event)) {
            return ConnectionState::FAILED;
        }
        if (std::holds_alternative<progress::Cancelled>(event)) {
            return ConnectionState::CANCELLED;
        }
        if (std::holds_alternative<progress::Detecting>(event) ||
            std::holds_alternative<progress::StrategyUnavailable>(event) ||
            std::holds_alternative<progress::StrategyFailed>(event)) {
            return ConnectionState::DETECTING;
        }
        if (std::holds_alternative<progress::StrategyAvailable>(event) ||
            std::holds_alternative<progress::Connecting>(event) ||
            std::holds_alternative<progress::Authenticating>(event) ||
            std::holds_alternative<progress::Authenticated>(event)) {
            return ConnectionState::CONNECTING;
        }
        return current;
    }

} // namespace raslink
