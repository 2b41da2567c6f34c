#pragma once

#include <raslink/endpoint.hpp>
#include <raslink/version.hpp>

#include <memory>
#include <optional>

namespace raslink {

    /// What each side can do, swapped over signaling before any strategy runs
    struct Capabilities {
        std::optional<dp::String> mesh_ip;
        std::optional<dp::u16> mesh_port;
        bool supports_webrtc = true;
        bool supports_turn = false;
        dp::u32 protocol_version = PROTOCOL_VERSION;
    };

    // Out-of-band channel to the daemon (relayed, slow, always reachable)
    class SignalingChannel {
      public:
        virtual ~SignalingChannel() = default;

        // Send our capabilities, get the daemon's back
        virtual dp::Res<Capabilities> exchange_capabilities(const Capabilities &ours, dp::u32 timeout_ms) = 0;

        // Deliver an SDP offer, get the daemon's SDP answer back
        virtual dp::Res<dp::String> send_offer(const dp::String &offer_sdp, dp::u32 timeout_ms) = 0;
    };

    /// Everything one connection attempt needs to know about the paired daemon
    /// Immutable during an attempt; enriched only by copying
    struct ConnectionContext {
        dp::String device_id;
        dp::String daemon_host;
        dp::u16 daemon_port = 0;
        std::optional<dp::String> mesh_ip;
        std::optional<dp::u16> mesh_port;
        std::shared_ptr<SignalingChannel> signaling;
        Message auth_token; // 32-byte master secret from pairing
        bool local_on_mesh = false;

        /// Copy with the mesh address advertised by the daemon
        ConnectionContext with_mesh_hint(const std::optional<dp::String> &ip, const std::optional<dp::u16> &port) const {
            ConnectionContext copy = *this;
            if (ip && !ip->empty()) {
                copy.mesh_ip = ip;
            }
            if (port && *port != 0) {
                copy.mesh_port = port;
            }
            return copy;
        }
    };

    /// Local mesh-VPN presence
    struct MeshInfo {
        dp::String local_ip;
        dp::String interface_name;
    };

    // Reports whether this device is on the mesh VPN
    class MeshDetector {
      public:
        virtual ~MeshDetector() = default;
        virtual std::optional<MeshInfo> detect() = 0;
    };

    // DNS-SD lookup of the daemon on the local network
    class LanDiscovery {
      public:
        virtual ~LanDiscovery() = default;
        virtual std::optional<LanEndpoint> discover(const dp::String &device_id, dp::u32 timeout_ms) = 0;
    };

    // Persists the daemon's mesh address as a direct-connect hint for the next attempt
    class MeshHintStore {
      public:
        virtual ~MeshHintStore() = default;
        virtual dp::Res<void> save_mesh_hint(const dp::String &device_id, const dp::String &ip, dp::u16 port) = 0;
    };

} // namespace raslink
