#include <raslink/datagram/udp.hpp>
#include <raslink/transport/mesh.hpp>

#include <cstdlib>
#include <string>

// Checks whether a daemon answers the mesh handshake, and optionally authenticates
// Usage: mesh_check <daemon_ip> [port] [device_id token_hex]

static bool parse_hex(const std::string &hex, raslink::Message &out) {
    if (hex.size() % 2 != 0) {
        return false;
    }
    out.clear();
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        char *end = nullptr;
        std::string pair = hex.substr(i, 2);
        long value = std::strtol(pair.c_str(), &end, 16);
        if (end != pair.c_str() + 2) {
            return false;
        }
        out.push_back(static_cast<dp::u8>(value));
    }
    return true;
}

int main(int argc, char **argv) {
    if (argc < 2) {
        echo::info("Usage: ", argv[0], " <daemon_ip> [port] [device_id token_hex]");
        return 1;
    }

    raslink::Config config;
    dp::u16 port = config.mesh_port;
    if (argc >= 3) {
        port = static_cast<dp::u16>(std::atoi(argv[2]));
    }
    raslink::UdpEndpoint daemon{argv[1], port};

    echo::info("Probing ", daemon.to_string(), " (", config.mesh_handshake_attempts, " attempts, ",
               config.mesh_handshake_timeout_ms, "ms each)");

    auto started = raslink::steady_now_ms();
    auto res = raslink::MeshTransport::connect(std::make_unique<raslink::UdpSocket>(), daemon, config);
    if (res.is_err()) {
        echo::error("Handshake failed: ", res.error().message.c_str());
        return 2;
    }
    auto transport = res.value();
    echo::info("Handshake answered in ", raslink::steady_now_ms() - started, "ms");

    if (argc >= 5) {
        raslink::Message token;
        if (!parse_hex(argv[4], token)) {
            echo::error("token must be hex");
            transport->close();
            return 1;
        }
        auto auth = transport->authenticate(argv[3], token, config.mesh_auth_timeout_ms);
        raslink::secure_zero(token);
        if (auth.is_err()) {
            echo::error("Authentication failed: ", auth.error().message.c_str());
            return 3;
        }
        echo::info("Authenticated as ", argv[3]);
    }

    transport->close();
    return 0;
}
