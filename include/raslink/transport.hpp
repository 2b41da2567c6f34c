#pragma once

#include <raslink/transport/stats.hpp>

#include <memory>

namespace raslink {

    /// Transport family
    enum class TransportType : dp::u8 { LAN_DIRECT = 0, MESH = 1, WEBRTC = 2 };

    inline const char *transport_type_name(TransportType type) {
        switch (type) {
        case TransportType::LAN_DIRECT:
            return "LAN Direct";
        case TransportType::MESH:
            return "Tailscale";
        case TransportType::WEBRTC:
            return "WebRTC";
        }
        return "Unknown";
    }

    // Abstract base class for an established, authenticated link to the daemon
    // Messages are ordered and keep their boundaries
    // A transport is handed out already connected; once closed it never reopens
    class Transport {
      public:
        virtual ~Transport() = default;

        // Send one message
        // not_found if the transport is closed
        virtual dp::Res<void> send(const Message &msg) = 0;

        // Receive one message, waiting at most timeout_ms
        // timeout error if nothing arrived (recoverable)
        // not_found once the transport is closed
        // invalid_argument for a malformed frame
        virtual dp::Res<Message> recv(dp::u32 timeout_ms) = 0;

        // Close and release resources, idempotent
        virtual void close() = 0;

        virtual bool is_connected() const = 0;

        virtual TransportType type() const = 0;

        virtual TransportStatsSnapshot stats() const = 0;
    };

    using TransportPtr = std::shared_ptr<Transport>;

} // namespace raslink
