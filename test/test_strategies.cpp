#include "fakes.hpp"

#include <doctest/doctest.h>

#include <string>

namespace {

    bool contains(const dp::String &text, const char *needle) {
        return std::string(text.c_str()).find(needle) != std::string::npos;
    }

    raslink::Config fast_config() {
        raslink::Config config;
        config.mesh_handshake_timeout_ms = 20;
        config.mesh_auth_timeout_ms = 50;
        return config;
    }

    raslink::ConnectionContext base_context() {
        raslink::ConnectionContext context;
        context.device_id = "dev-1";
        context.auth_token = fakes::test_token();
        return context;
    }

    const raslink::ConnectFailed &failure(const raslink::ConnectionResult &result) {
        return std::get<raslink::ConnectFailed>(result);
    }

    struct StepLog {
        dp::Vector<raslink::ConnectionStep> steps;
        raslink::StepSink sink() {
            return [this](const raslink::ConnectionStep &step) { steps.push_back(step); };
        }
    };

} // namespace

TEST_CASE("MeshStrategy") {
    auto detector = std::make_shared<fakes::FakeMeshDetector>();
    auto sockets = std::make_shared<fakes::FakeSocketFactory>();
    raslink::MeshStrategy strategy(detector, sockets, fast_config());
    raslink::CancelToken cancel;
    StepLog log;

    CHECK(strategy.name() == "Tailscale Direct");
    CHECK(strategy.priority() == 10);

    SUBCASE("unavailable without the mesh") {
        auto detection = strategy.detect();
        REQUIRE_FALSE(raslink::is_available(detection));
        CHECK(std::get<raslink::DetectUnavailable>(detection).reason == "Tailscale not connected");

        auto result = strategy.connect(base_context(), log.sink(), cancel);
        REQUIRE_FALSE(raslink::is_success(result));
        CHECK(failure(result).error == "Tailscale not detected");
        CHECK_FALSE(failure(result).can_retry);
    }

    SUBCASE("with the mesh up") {
        detector->info = raslink::MeshInfo{"100.64.0.1", "tailscale0"};
        auto detection = strategy.detect();
        REQUIRE(raslink::is_available(detection));
        CHECK(std::get<raslink::DetectAvailable>(detection).info == "100.64.0.1");

        SUBCASE("daemon mesh address unknown") {
            auto result = strategy.connect(base_context(), log.sink(), cancel);
            REQUIRE_FALSE(raslink::is_success(result));
            CHECK(failure(result).error == "Daemon Tailscale IP unknown");
            CHECK_FALSE(failure(result).can_retry);
            CHECK(sockets->created == 0);
        }

        SUBCASE("connects and authenticates") {
            sockets->script->replies.push_back(fakes::handshake_reply());
            sockets->script->replies.push_back(fakes::auth_ok());
            auto context = base_context();
            context.mesh_ip = dp::String("100.64.0.2");
            context.mesh_port = dp::u16(0);

            auto result = strategy.connect(context, log.sink(), cancel);
            REQUIRE(raslink::is_success(result));
            auto transport = std::get<raslink::ConnectSuccess>(result).transport;
            CHECK(transport->type() == raslink::TransportType::MESH);

            // Port 0 falls back to the default daemon port
            CHECK(sockets->script->destinations[0].host == "100.64.0.2");
            CHECK(sockets->script->destinations[0].port == 9876);

            REQUIRE(log.steps.size() == 4);
            CHECK(log.steps[0].step == "Checking");
            CHECK(log.steps[1].step == "Connecting");
            CHECK(log.steps[2].kind == raslink::StepKind::AUTHENTICATING);
            CHECK(log.steps[3].kind == raslink::StepKind::AUTHENTICATED);
            transport->close();
        }

        SUBCASE("advertised port is used") {
            sockets->script->replies.push_back(fakes::handshake_reply());
            sockets->script->replies.push_back(fakes::auth_ok());
            auto context = base_context();
            context.mesh_ip = dp::String("100.64.0.2");
            context.mesh_port = dp::u16(7000);

            auto result = strategy.connect(context, log.sink(), cancel);
            REQUIRE(raslink::is_success(result));
            CHECK(sockets->script->destinations[0].port == 7000);
        }

        SUBCASE("handshake timeout is retryable") {
            auto context = base_context();
            context.mesh_ip = dp::String("100.64.0.2");

            auto result = strategy.connect(context, log.sink(), cancel);
            REQUIRE_FALSE(raslink::is_success(result));
            CHECK(failure(result).can_retry);
            CHECK(contains(failure(result).error, "daemon may not be listening"));
        }

        SUBCASE("rejected auth is not retryable") {
            sockets->script->replies.push_back(fakes::handshake_reply());
            sockets->script->replies.push_back(raslink::mesh::encode_frame(raslink::Message{0x00}));
            auto context = base_context();
            context.mesh_ip = dp::String("100.64.0.2");

            auto result = strategy.connect(context, log.sink(), cancel);
            REQUIRE_FALSE(raslink::is_success(result));
            CHECK_FALSE(failure(result).can_retry);
            CHECK(failure(result).error == "Authentication failed");
            CHECK(sockets->script->closed);
        }

        SUBCASE("cancelled before the handshake") {
            auto context = base_context();
            context.mesh_ip = dp::String("100.64.0.2");
            cancel.cancel();

            auto result = strategy.connect(context, log.sink(), cancel);
            REQUIRE_FALSE(raslink::is_success(result));
            CHECK(failure(result).error == "Cancelled");
            CHECK(sockets->created == 0);
        }
    }
}

TEST_CASE("LanStrategy") {
    auto discovery = std::make_shared<fakes::FakeLanDiscovery>();
    raslink::Config config;
    dp::Vector<raslink::LanEndpoint> dialed;
    bool connector_fails = false;

    raslink::LanStrategy::Connector connector = [&](const raslink::LanEndpoint &endpoint, const dp::String &,
                                                    const raslink::Message &,
                                                    const raslink::Config &) -> dp::Res<raslink::TransportPtr> {
        dialed.push_back(endpoint);
        if (connector_fails) {
            return dp::result::err(dp::Error::io_error("connection refused"));
        }
        auto queue = std::make_shared<fakes::Queue>();
        return dp::result::ok(raslink::TransportPtr(
            std::make_shared<fakes::MemoryTransport>(queue, queue, raslink::TransportType::LAN_DIRECT)));
    };

    raslink::LanStrategy strategy(discovery, "dev-1", config, connector);
    raslink::CancelToken cancel;
    StepLog log;

    CHECK(strategy.name() == "LAN Direct");
    CHECK(strategy.priority() == 5);

    SUBCASE("discovered endpoint is cached and dialed") {
        discovery->endpoint = raslink::LanEndpoint{"192.168.1.40", 8765, "wlan0"};
        auto detection = strategy.detect();
        REQUIRE(raslink::is_available(detection));
        CHECK(discovery->timeouts.size() == 1);
        CHECK(discovery->timeouts[0] == config.lan_discovery_timeout_ms);
        REQUIRE(strategy.cached_endpoint().has_value());

        auto result = strategy.connect(base_context(), log.sink(), cancel);
        REQUIRE(raslink::is_success(result));
        REQUIRE(dialed.size() == 1);
        CHECK(dialed[0].host == "192.168.1.40");
        CHECK(dialed[0].interface_name == "wlan0");
        // Cached: no second lookup during connect
        CHECK(discovery->timeouts.size() == 1);
    }

    SUBCASE("nothing discovered means unavailable") {
        auto detection = strategy.detect();
        REQUIRE_FALSE(raslink::is_available(detection));
        CHECK(std::get<raslink::DetectUnavailable>(detection).reason == "Daemon not on local network");
        CHECK_FALSE(strategy.cached_endpoint().has_value());
    }

    SUBCASE("a cached endpoint answers without another lookup") {
        discovery->endpoint = raslink::LanEndpoint{"192.168.1.40", 8765, ""};
        REQUIRE(raslink::is_available(strategy.detect()));
        discovery->endpoint.reset();

        auto again = strategy.detect();
        REQUIRE(raslink::is_available(again));
        CHECK(std::get<raslink::DetectAvailable>(again).info == "192.168.1.40:8765");
        CHECK(discovery->timeouts.size() == 1);
    }

    SUBCASE("quick rediscovery during connect") {
        strategy.detect();
        discovery->endpoint = raslink::LanEndpoint{"192.168.1.41", 8765, ""};

        auto result = strategy.connect(base_context(), log.sink(), cancel);
        REQUIRE(raslink::is_success(result));
        REQUIRE(discovery->timeouts.size() == 2);
        CHECK(discovery->timeouts[1] == config.lan_quick_discovery_timeout_ms);
        CHECK(dialed[0].host == "192.168.1.41");
        CHECK(log.steps[0].step == "Discovering");
    }

    SUBCASE("falls back to the paired host") {
        auto context = base_context();
        context.daemon_host = "192.168.1.50";

        auto result = strategy.connect(context, log.sink(), cancel);
        REQUIRE(raslink::is_success(result));
        REQUIRE(dialed.size() == 1);
        CHECK(dialed[0].host == "192.168.1.50");
        CHECK(dialed[0].port == 8765);
    }

    SUBCASE("no address at all") {
        auto result = strategy.connect(base_context(), log.sink(), cancel);
        REQUIRE_FALSE(raslink::is_success(result));
        CHECK(failure(result).error == "Daemon LAN address unknown");
        CHECK(dialed.empty());
    }

    SUBCASE("a failed dial forgets the cached endpoint") {
        discovery->endpoint = raslink::LanEndpoint{"192.168.1.40", 8765, ""};
        strategy.detect();
        connector_fails = true;

        auto result = strategy.connect(base_context(), log.sink(), cancel);
        REQUIRE_FALSE(raslink::is_success(result));
        CHECK(failure(result).error == "connection refused");
        CHECK_FALSE(failure(result).can_retry);
        CHECK_FALSE(strategy.cached_endpoint().has_value());
    }

    SUBCASE("without discovery") {
        raslink::LanStrategy bare(nullptr, "dev-1", config, connector);
        CHECK_FALSE(raslink::is_available(bare.detect()));
    }
}

TEST_CASE("SDP helpers") {
    fakes::WebRtcScript script;
    CHECK(raslink::sdp::count_candidates(script.offer) == 3);

    auto filtered = raslink::sdp::filter_mesh_candidates(script.offer);
    CHECK(raslink::sdp::count_candidates(filtered) == 2);
    CHECK_FALSE(contains(filtered, "100.101.102.103"));
    CHECK(contains(filtered, "192.168.1.20"));
    CHECK(contains(filtered, "v=0"));

    CHECK(raslink::sdp::candidate_address("a=candidate:1 1 udp 2122260223 10.0.0.1 5000 typ host") == "10.0.0.1");
    CHECK(raslink::sdp::candidate_address("a=candidate:1 1").empty());
}

TEST_CASE("WebRtcStrategy") {
    auto factory = std::make_shared<fakes::FakeWebRtcFactory>();
    auto signaling = std::make_shared<fakes::FakeSignaling>();
    raslink::WebRtcStrategy strategy(factory);
    raslink::CancelToken cancel;
    StepLog log;

    auto context = base_context();
    context.signaling = signaling;

    CHECK(strategy.name() == "WebRTC P2P");
    CHECK(strategy.priority() == 20);
    CHECK(raslink::is_available(strategy.detect()));

    SUBCASE("no signaling channel") {
        auto result = strategy.connect(base_context(), log.sink(), cancel);
        REQUIRE_FALSE(raslink::is_success(result));
        CHECK(failure(result).error == "No signaling channel");
    }

    SUBCASE("daemon never answers") {
        auto result = strategy.connect(context, log.sink(), cancel);
        REQUIRE_FALSE(raslink::is_success(result));
        CHECK(failure(result).error == "No response from daemon");
        CHECK(failure(result).can_retry);
        CHECK(factory->script->closes == 1);
    }

    SUBCASE("ICE never completes") {
        signaling->answer = dp::String("v=0\r\n");
        factory->script->channel_fails = true;

        auto result = strategy.connect(context, log.sink(), cancel);
        REQUIRE_FALSE(raslink::is_success(result));
        CHECK(failure(result).error == "ICE connection failed");
        CHECK(factory->script->closes == 1);
    }

    SUBCASE("mesh candidates are withheld off the mesh") {
        context.local_on_mesh = false;
        strategy.connect(context, log.sink(), cancel);
        REQUIRE(signaling->offers.size() == 1);
        CHECK(raslink::sdp::count_candidates(signaling->offers[0]) == 2);
        CHECK_FALSE(contains(signaling->offers[0], "100.101.102.103"));
    }

    SUBCASE("mesh candidates are kept on the mesh") {
        context.local_on_mesh = true;
        strategy.connect(context, log.sink(), cancel);
        REQUIRE(signaling->offers.size() == 1);
        CHECK(raslink::sdp::count_candidates(signaling->offers[0]) == 3);
    }

    SUBCASE("data channel opens") {
        signaling->answer = dp::String("v=0\r\nanswer\r\n");

        auto result = strategy.connect(context, log.sink(), cancel);
        REQUIRE(raslink::is_success(result));
        auto transport = std::get<raslink::ConnectSuccess>(result).transport;
        CHECK(transport->type() == raslink::TransportType::WEBRTC);
        CHECK(transport->is_connected());
        CHECK(factory->script->remote_answer == "v=0\r\nanswer\r\n");
        CHECK(factory->script->closes == 0);

        REQUIRE(log.steps.size() == 5);
        CHECK(log.steps[0].step == "Creating offer");
        CHECK(log.steps[1].step == "Signaling");
        CHECK(log.steps[2].step == "ICE negotiation");
        for (dp::usize i = 0; i < 3; ++i) {
            CHECK(log.steps[i].kind == raslink::StepKind::CONNECTING);
        }
        CHECK(log.steps[3].kind == raslink::StepKind::AUTHENTICATING);
        CHECK(log.steps[3].step == "Securing");
        CHECK(log.steps[4].kind == raslink::StepKind::AUTHENTICATED);

        transport->close();
        CHECK(factory->script->closes == 1);
    }

    SUBCASE("cancelled while waiting for the channel") {
        signaling->answer = dp::String("v=0\r\n");
        cancel.cancel();

        auto result = strategy.connect(context, log.sink(), cancel);
        REQUIRE_FALSE(raslink::is_success(result));
        CHECK(failure(result).error == "Cancelled");
        CHECK_FALSE(failure(result).can_retry);
        CHECK(factory->script->closes == 1);
    }

    SUBCASE("without a WebRTC stack") {
        raslink::WebRtcStrategy none(nullptr);
        CHECK_FALSE(raslink::is_available(none.detect()));
        auto result = none.connect(context, log.sink(), cancel);
        CHECK_FALSE(raslink::is_success(result));
    }
}
