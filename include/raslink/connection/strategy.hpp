#pragma once

#include <raslink/connection/cancel.hpp>
#include <raslink/connection/context.hpp>
#include <raslink/transport.hpp>

#include <functional>
#include <variant>

namespace raslink {

    /// detect() outcomes
    struct DetectAvailable {
        dp::String info;
    };
    struct DetectUnavailable {
        dp::String reason;
    };
    using DetectionResult = std::variant<DetectAvailable, DetectUnavailable>;

    /// connect() outcomes
    /// can_retry=false only means "don't retry this strategy"; the next strategy still runs
    struct ConnectSuccess {
        TransportPtr transport;
    };
    struct ConnectFailed {
        dp::String error;
        bool can_retry = true;
    };
    using ConnectionResult = std::variant<ConnectSuccess, ConnectFailed>;

    inline bool is_available(const DetectionResult &result) {
        return std::holds_alternative<DetectAvailable>(result);
    }

    inline bool is_success(const ConnectionResult &result) { return std::holds_alternative<ConnectSuccess>(result); }

    /// Fine-grained step reported by a strategy while it connects
    enum class StepKind : dp::u8 { CONNECTING = 0, AUTHENTICATING = 1, AUTHENTICATED = 2 };

    struct ConnectionStep {
        StepKind kind;
        dp::String step;
        dp::String detail;
    };

    using StepSink = std::function<void(const ConnectionStep &)>;

    // One transport family
    class ConnectionStrategy {
      public:
        virtual ~ConnectionStrategy() = default;

        // Stable display name
        virtual dp::String name() const = 0;

        // Lower runs first
        virtual dp::i32 priority() const = 0;

        // Cheap, repeatable, bounded check that this family can work right now
        virtual DetectionResult detect() = 0;

        // Full establishment including authentication
        // Never throws; every failure becomes ConnectFailed
        virtual ConnectionResult connect(const ConnectionContext &context, const StepSink &on_step,
                                         const CancelToken &cancel) = 0;
    };

    using StrategyPtr = std::shared_ptr<ConnectionStrategy>;

    /// Helper for strategies: report a step if someone is listening
    inline void emit_step(const StepSink &on_step, StepKind kind, const dp::String &step, const dp::String &detail) {
        if (on_step) {
            on_step(ConnectionStep{kind, step, detail});
        }
    }

} // namespace raslink
