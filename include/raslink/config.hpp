#pragma once

#include <raslink/common.hpp>

namespace raslink {

    /// Tunables for every layer of the client
    /// Defaults match what the daemon expects; tests shrink the timeouts
    struct Config {
        // Ports
        dp::u16 lan_port = 8765;  // Daemon WebSocket port
        dp::u16 mesh_port = 9876; // Daemon UDP port on the mesh VPN

        // Mesh handshake
        dp::u32 mesh_handshake_timeout_ms = 2000; // Per attempt
        dp::u32 mesh_handshake_attempts = 3;      // All on the same socket
        dp::u32 mesh_auth_timeout_ms = 5000;
        dp::u32 mesh_stale_handshake_budget = 3; // Stale replies skipped per recv() call

        // LAN direct
        dp::u32 lan_discovery_timeout_ms = 3000;
        dp::u32 lan_quick_discovery_timeout_ms = 1000; // Second look when the cache is empty
        dp::u32 lan_connect_timeout_ms = 5000;
        dp::u32 lan_auth_timeout_ms = 5000;

        // WebRTC
        dp::u32 webrtc_gathering_timeout_ms = 10000;
        dp::u32 webrtc_data_channel_timeout_ms = 30000;
        dp::u32 signaling_timeout_ms = 30000;
        dp::u32 capability_exchange_timeout_ms = 5000; // Best effort before any strategy runs
        dp::Vector<dp::String> stun_servers = {dp::String("stun:stun.l.google.com:19302")};

        // Session
        dp::u32 attach_timeout_ms = 10000;
        dp::u32 keepalive_interval_ms = 30000; // 0 disables keepalive pings
        dp::u32 receive_poll_ms = 100;         // Receiver loop wake-up to check for shutdown
        dp::u32 max_idle_ms = 90000;           // Unhealthy after this long without inbound traffic
        dp::usize max_message_size = 16 * 1024 * 1024;
    };

} // namespace raslink
