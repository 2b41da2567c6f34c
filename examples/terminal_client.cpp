#include <raslink/raslink.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

// Connects to a paired daemon over the cheapest working path and bridges one terminal
// session to stdin/stdout, a line at a time.
//
// Usage: terminal_client <device_id> <token_hex> <session_id> [options]
//   --lan <host[:port]>   daemon LAN address
//   --mesh <ip>           daemon mesh-VPN address
//   --local-mesh <ip>     this device's own mesh-VPN address (enables the mesh strategy)

namespace {

    // Collaborators backed by the command line instead of platform discovery
    class FixedMeshDetector : public raslink::MeshDetector {
      private:
        std::optional<raslink::MeshInfo> info_;

      public:
        explicit FixedMeshDetector(std::optional<raslink::MeshInfo> info) : info_(std::move(info)) {}
        std::optional<raslink::MeshInfo> detect() override { return info_; }
    };

    class FixedLanDiscovery : public raslink::LanDiscovery {
      private:
        std::optional<raslink::LanEndpoint> endpoint_;

      public:
        explicit FixedLanDiscovery(std::optional<raslink::LanEndpoint> endpoint) : endpoint_(std::move(endpoint)) {}
        std::optional<raslink::LanEndpoint> discover(const dp::String &, dp::u32) override { return endpoint_; }
    };

    bool parse_hex(const std::string &hex, raslink::Message &out) {
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

    std::optional<raslink::LanEndpoint> parse_lan(const std::string &arg, dp::u16 default_port) {
        auto colon = arg.rfind(':');
        if (colon == std::string::npos) {
            return raslink::LanEndpoint{arg.c_str(), default_port, dp::String()};
        }
        int port = std::atoi(arg.substr(colon + 1).c_str());
        if (port <= 0 || port > 65535) {
            return std::nullopt;
        }
        return raslink::LanEndpoint{arg.substr(0, colon).c_str(), static_cast<dp::u16>(port), dp::String()};
    }

    void report(const raslink::ConnectionProgress &event) {
        namespace p = raslink::progress;
        if (const auto *e = std::get_if<p::CapabilityExchangeFailed>(&event)) {
            echo::warn("capability exchange skipped: ", e->reason.c_str());
        } else if (const auto *e = std::get_if<p::StrategyUnavailable>(&event)) {
            echo::info(e->strategy.c_str(), ": unavailable (", e->reason.c_str(), ")");
        } else if (const auto *e = std::get_if<p::Connecting>(&event)) {
            echo::info(e->strategy.c_str(), ": ", e->step.c_str(), " - ", e->detail.c_str());
        } else if (const auto *e = std::get_if<p::StrategyFailed>(&event)) {
            echo::warn(e->strategy.c_str(), ": ", e->error.c_str(), e->will_try_next ? ", trying next" : "");
        } else if (const auto *e = std::get_if<p::Connected>(&event)) {
            echo::info("connected via ", e->strategy.c_str(), " in ", e->elapsed_ms, "ms");
        } else if (const auto *e = std::get_if<p::AllFailed>(&event)) {
            for (const auto &attempt : e->attempts) {
                echo::error(attempt.strategy.c_str(), " failed after ", attempt.duration_ms,
                            "ms: ", attempt.error.c_str());
            }
        }
    }

} // namespace

int main(int argc, char **argv) {
    if (argc < 4) {
        echo::info("Usage: ", argv[0], " <device_id> <token_hex> <session_id> [--lan host[:port]] [--mesh ip] ",
                   "[--local-mesh ip]");
        return 1;
    }

    raslink::Config config;
    raslink::ConnectionContext context;
    context.device_id = argv[1];
    if (!parse_hex(argv[2], context.auth_token) || context.auth_token.size() != 32) {
        echo::error("token must be 64 hex characters");
        return 1;
    }
    dp::String session_id = argv[3];

    std::optional<raslink::LanEndpoint> lan;
    std::optional<raslink::MeshInfo> local_mesh;
    for (int i = 4; i + 1 < argc; i += 2) {
        std::string flag = argv[i];
        std::string value = argv[i + 1];
        if (flag == "--lan") {
            lan = parse_lan(value, config.lan_port);
            if (!lan) {
                echo::error("bad --lan value: ", value.c_str());
                return 1;
            }
            context.daemon_host = lan->host;
            context.daemon_port = lan->port;
        } else if (flag == "--mesh") {
            context.mesh_ip = dp::String(value.c_str());
        } else if (flag == "--local-mesh") {
            local_mesh = raslink::MeshInfo{value.c_str(), dp::String()};
            context.local_on_mesh = true;
        } else {
            echo::error("unknown option: ", flag.c_str());
            return 1;
        }
    }

    dp::Vector<raslink::StrategyPtr> strategies;
    strategies.push_back(std::make_shared<raslink::LanStrategy>(std::make_shared<FixedLanDiscovery>(lan),
                                                                context.device_id, config));
    strategies.push_back(std::make_shared<raslink::MeshStrategy>(std::make_shared<FixedMeshDetector>(local_mesh),
                                                                 std::make_shared<raslink::UdpSocketFactory>(),
                                                                 config));
    strategies.push_back(std::make_shared<raslink::WebRtcStrategy>(std::make_shared<raslink::RtcPeerClientFactory>(),
                                                                   config));

    raslink::Orchestrator orchestrator(std::move(strategies), config);
    auto transport = orchestrator.connect(context, report);
    if (!transport) {
        raslink::secure_zero(context.auth_token);
        return 2;
    }

    raslink::ConnectionManager manager(context.auth_token, config);
    raslink::secure_zero(context.auth_token);
    raslink::TerminalSession terminal(manager, config);
    terminal.set_output_sink([](const raslink::Message &data, dp::u64) {
        std::cout.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        std::cout.flush();
    });

    auto attached = manager.attach_transport(*transport);
    if (attached.is_err()) {
        echo::error("cannot start session: ", attached.error().message.c_str());
        return 2;
    }

    auto res = terminal.attach(session_id);
    if (res.is_err()) {
        auto state = terminal.state();
        if (state.error) {
            echo::error(state.error->display_message().c_str());
        } else {
            echo::error("attach failed: ", res.error().message.c_str());
        }
        manager.disconnect();
        return 3;
    }

    std::string line;
    while (manager.is_connected() && std::getline(std::cin, line)) {
        auto sent = terminal.send_line(dp::String(line.c_str()));
        if (sent.is_err()) {
            echo::warn("input dropped: ", sent.error().message.c_str());
        }
        auto state = terminal.state();
        if (state.output_skipped) {
            echo::warn(state.output_skipped->display_text().c_str());
            terminal.clear_output_skipped();
        }
    }

    auto detached = terminal.detach();
    if (detached.is_err()) {
        echo::debug("detach: ", detached.error().message.c_str());
    }
    manager.disconnect();
    return 0;
}
