#pragma once

#include <raslink/common.hpp>

#include <arpa/inet.h>
#include <optional>

namespace raslink {

    // UDP endpoint - host and port
    struct UdpEndpoint {
        dp::String host; // IP address or hostname
        dp::u16 port;

        inline dp::String to_string() const { return host + ":" + dp::String(std::to_string(port).c_str()); }
    };

    // LAN WebSocket endpoint as resolved by discovery
    struct LanEndpoint {
        dp::String host;
        dp::u16 port;
        dp::String interface_name; // Empty: use the default route

        inline dp::String to_string() const {
            dp::String out = host + ":" + dp::String(std::to_string(port).c_str());
            if (!interface_name.empty()) {
                out = out + " via " + interface_name;
            }
            return out;
        }
    };

    namespace ipv4 {

        // Parse a dotted-quad address into host-order octets
        inline std::optional<dp::Array<dp::u8, 4>> parse(const dp::String &address) {
            struct in_addr addr = {};
            if (address.empty() || ::inet_pton(AF_INET, address.c_str(), &addr) != 1) {
                return std::nullopt;
            }
            dp::u32 value = ntohl(addr.s_addr);
            return encode_u32_be(value);
        }

        // 100.64.0.0/10 (carrier-grade NAT range used by the mesh VPN)
        inline bool is_mesh(const dp::String &address) {
            auto octets = parse(address);
            if (!octets) {
                return false;
            }
            return (*octets)[0] == 100 && (*octets)[1] >= 64 && (*octets)[1] <= 127;
        }

        // 10/8, 172.16/12, 192.168/16
        inline bool is_private(const dp::String &address) {
            auto octets = parse(address);
            if (!octets) {
                return false;
            }
            const auto &o = *octets;
            if (o[0] == 10) {
                return true;
            }
            if (o[0] == 172 && o[1] >= 16 && o[1] <= 31) {
                return true;
            }
            return o[0] == 192 && o[1] == 168;
        }

        // Same /24 network
        inline bool same_subnet(const dp::String &a, const dp::String &b) {
            auto oa = parse(a);
            auto ob = parse(b);
            if (!oa || !ob) {
                return false;
            }
            return (*oa)[0] == (*ob)[0] && (*oa)[1] == (*ob)[1] && (*oa)[2] == (*ob)[2];
        }

    } // namespace ipv4

} // namespace raslink
