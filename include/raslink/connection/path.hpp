#pragma once

#include <raslink/endpoint.hpp>

namespace raslink {

    /// ICE candidate kinds
    enum class CandidateKind : dp::u8 { HOST = 0, SRFLX = 1, PRFLX = 2, RELAY = 3 };

    inline const char *candidate_kind_name(CandidateKind kind) {
        switch (kind) {
        case CandidateKind::HOST:
            return "host";
        case CandidateKind::SRFLX:
            return "srflx";
        case CandidateKind::PRFLX:
            return "prflx";
        case CandidateKind::RELAY:
            return "relay";
        }
        return "unknown";
    }

    /// One side of a negotiated ICE pair
    struct CandidateInfo {
        CandidateKind kind;
        dp::String address;
        dp::u16 port;

        bool is_host() const { return kind == CandidateKind::HOST; }
        bool is_relay() const { return kind == CandidateKind::RELAY; }
        bool is_mesh() const { return ipv4::is_mesh(address); }
        bool is_private() const { return ipv4::is_private(address); }

        dp::String to_string() const {
            return dp::String(candidate_kind_name(kind)) + " " + address + ":" + to_dp_string(port);
        }
    };

    /// Physical route a WebRTC connection ended up on
    enum class PathType : dp::u8 { LAN_DIRECT = 0, WEBRTC_DIRECT = 1, TAILSCALE = 2, RELAY = 3 };

    inline const char *path_type_label(PathType type) {
        switch (type) {
        case PathType::LAN_DIRECT:
            return "LAN Direct";
        case PathType::WEBRTC_DIRECT:
            return "WebRTC Direct";
        case PathType::TAILSCALE:
            return "Tailscale VPN";
        case PathType::RELAY:
            return "WebRTC Relay";
        }
        return "Unknown";
    }

    /// Local addressing is only revealed for paths that stay inside trusted networks
    inline bool show_local_ips(PathType type) { return type == PathType::LAN_DIRECT || type == PathType::TAILSCALE; }

    /// Precedence: relay, then mesh range, then host pair on one private /24, else direct
    inline PathType classify_path(const CandidateInfo &local, const CandidateInfo &remote) {
        if (local.is_relay() || remote.is_relay()) {
            return PathType::RELAY;
        }
        if (local.is_mesh() || remote.is_mesh()) {
            return PathType::TAILSCALE;
        }
        if (local.is_host() && remote.is_host() && local.is_private() && remote.is_private() &&
            ipv4::same_subnet(local.address, remote.address)) {
            return PathType::LAN_DIRECT;
        }
        return PathType::WEBRTC_DIRECT;
    }

    struct ConnectionPath {
        CandidateInfo local;
        CandidateInfo remote;
        PathType type;

        static ConnectionPath from(const CandidateInfo &local, const CandidateInfo &remote) {
            return ConnectionPath{local, remote, classify_path(local, remote)};
        }

        const char *label() const { return path_type_label(type); }

        bool show_local_ips() const { return raslink::show_local_ips(type); }
    };

} // namespace raslink
