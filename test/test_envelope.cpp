#include "fakes.hpp"

#include <doctest/doctest.h>

using namespace raslink;

TEST_CASE("Envelope header") {
    Message body = {0xDE, 0xAD};
    auto msg = envelope::encode_envelope(envelope::Kind::TerminalOutput, body, envelope::Flags::Partial);

    REQUIRE(msg.size() == envelope::HEADER_SIZE + 2);
    CHECK(msg[0] == ENVELOPE_VERSION);
    CHECK(msg[1] == 0x82);
    CHECK(msg[2] == 0x00);
    CHECK(msg[3] == 0x01);
    CHECK(decode_u32_be(msg.data() + 4) == 2);
    CHECK(msg[8] == 0xDE);

    auto env = envelope::decode_envelope(msg);
    REQUIRE(env.is_ok());
    CHECK(env.value().kind == envelope::Kind::TerminalOutput);
    CHECK(env.value().flags == envelope::Flags::Partial);
    CHECK(fakes::same_bytes(env.value().body, body));
}

TEST_CASE("Envelope decode errors") {
    SUBCASE("shorter than the header") {
        auto res = envelope::decode_envelope(Message{0x01, 0x82, 0x00});
        REQUIRE(res.is_err());
        CHECK(res.error().message == "envelope too short");
    }

    SUBCASE("unknown version") {
        auto msg = envelope::encode_envelope(envelope::Kind::Pong, Message(8, 0));
        msg[0] = 0x7F;
        auto res = envelope::decode_envelope(msg);
        REQUIRE(res.is_err());
        CHECK(res.error().message == "unsupported envelope version");
    }

    SUBCASE("declared length disagrees with the buffer") {
        auto msg = envelope::encode_envelope(envelope::Kind::Pong, Message(8, 0));
        msg.push_back(0x00);
        auto res = envelope::decode_envelope(msg);
        REQUIRE(res.is_err());
        CHECK(res.error().message == "envelope size mismatch");

        msg.pop_back();
        msg.pop_back();
        CHECK(envelope::decode_envelope(msg).is_err());
    }

    SUBCASE("body larger than allowed") {
        Message msg = {ENVELOPE_VERSION, 0x82, 0x00, 0x00, 0x7F, 0xFF, 0xFF, 0xFF};
        auto res = envelope::decode_envelope(msg);
        REQUIRE(res.is_err());
        CHECK(res.error().message == "envelope body too large");
    }
}

TEST_CASE("Command codec") {
    SUBCASE("attach carries resume position and size") {
        command::Attach attach{"abcdef123456", 42, 120, 40};
        auto decoded = envelope::decode_command(envelope::encode_command(attach));
        REQUIRE(decoded.is_ok());
        const auto *got = std::get_if<command::Attach>(&decoded.value());
        REQUIRE(got != nullptr);
        CHECK(got->session_id == "abcdef123456");
        CHECK(got->from_sequence == 42);
        CHECK(got->cols == 120);
        CHECK(got->rows == 40);
    }

    SUBCASE("special keys ride on the input kind with a flag") {
        command::SpecialKey key{"abcdef123456", "ArrowUp", envelope::Modifiers::Ctrl | envelope::Modifiers::Shift};
        auto msg = envelope::encode_command(key);
        CHECK(msg[1] == static_cast<dp::u8>(envelope::Kind::TerminalInput));
        CHECK((decode_u16_be(msg.data() + 2) & envelope::Flags::SpecialKey) != 0);

        auto decoded = envelope::decode_command(msg);
        REQUIRE(decoded.is_ok());
        const auto *got = std::get_if<command::SpecialKey>(&decoded.value());
        REQUIRE(got != nullptr);
        CHECK(got->key == "ArrowUp");
        CHECK(got->modifiers == 0x05);
    }

    SUBCASE("plain input keeps raw bytes") {
        command::Input input{"abcdef123456", Message{0x1B, 0x5B, 0x41}};
        auto decoded = envelope::decode_command(envelope::encode_command(input));
        REQUIRE(decoded.is_ok());
        const auto *got = std::get_if<command::Input>(&decoded.value());
        REQUIRE(got != nullptr);
        CHECK(fakes::same_bytes(got->data, input.data));
    }

    SUBCASE("connection ready has an empty body") {
        auto msg = envelope::encode_command(command::ConnectionReady{});
        CHECK(msg.size() == envelope::HEADER_SIZE);
        CHECK(msg[1] == 0x01);
    }

    SUBCASE("session command body is passed through untouched") {
        Message body = {0x93, 0x01, 0x02, 0x03};
        auto decoded = envelope::decode_command(envelope::encode_command(command::SessionCommand{body}));
        REQUIRE(decoded.is_ok());
        const auto *got = std::get_if<command::SessionCommand>(&decoded.value());
        REQUIRE(got != nullptr);
        CHECK(fakes::same_bytes(got->body, body));
    }

    SUBCASE("an event is not a command") {
        auto msg = envelope::encode_event(event::Pong{7});
        auto res = envelope::decode_command(msg);
        REQUIRE(res.is_err());
        CHECK(res.error().message == "unknown command kind");
    }

    SUBCASE("truncated body") {
        auto msg = envelope::encode_envelope(envelope::Kind::TerminalResize, Message{0x00, 0x00, 0x00, 0x05, 'a'});
        auto res = envelope::decode_command(msg);
        REQUIRE(res.is_err());
        CHECK(res.error().message == "truncated command body");
    }
}

TEST_CASE("Event codec") {
    SUBCASE("partial output") {
        event::Output output{"abcdef123456", 9, Message{'h', 'i'}, true};
        auto msg = envelope::encode_event(output);
        CHECK(msg[1] == 0x82);

        auto decoded = envelope::decode_event(msg);
        REQUIRE(decoded.is_ok());
        const auto *got = std::get_if<event::Output>(&decoded.value());
        REQUIRE(got != nullptr);
        CHECK(got->sequence == 9);
        CHECK(got->partial);
        CHECK(fakes::same_bytes(got->data, output.data));
    }

    SUBCASE("error event") {
        event::Error error{"abcdef123456", "SESSION_NOT_FOUND", "gone"};
        auto decoded = envelope::decode_event(envelope::encode_event(error));
        REQUIRE(decoded.is_ok());
        const auto *got = std::get_if<event::Error>(&decoded.value());
        REQUIRE(got != nullptr);
        CHECK(got->code == "SESSION_NOT_FOUND");
        CHECK(got->message == "gone");
    }

    SUBCASE("skipped range") {
        event::Skipped skipped{"abcdef123456", 10, 20, 4096};
        auto decoded = envelope::decode_event(envelope::encode_event(skipped));
        REQUIRE(decoded.is_ok());
        const auto *got = std::get_if<event::Skipped>(&decoded.value());
        REQUIRE(got != nullptr);
        CHECK(got->from_sequence == 10);
        CHECK(got->to_sequence == 20);
        CHECK(got->bytes_skipped == 4096);
    }

    SUBCASE("opaque session payloads") {
        Message body = {0x81, 0xA1, 0x78};
        auto state = envelope::decode_event(envelope::encode_event(event::InitialState{body}));
        REQUIRE(state.is_ok());
        const auto *got_state = std::get_if<event::InitialState>(&state.value());
        REQUIRE(got_state != nullptr);
        CHECK(fakes::same_bytes(got_state->body, body));

        auto session = envelope::decode_event(envelope::encode_event(event::SessionEvent{body}));
        REQUIRE(session.is_ok());
        CHECK(std::holds_alternative<event::SessionEvent>(session.value()));
    }

    SUBCASE("a command is not an event") {
        auto res = envelope::decode_event(envelope::encode_command(command::Ping{1}));
        CHECK(res.is_err());
    }

    SUBCASE("unknown kind") {
        auto msg = envelope::encode_envelope(static_cast<envelope::Kind>(0xEE), Message());
        CHECK(envelope::decode_event(msg).is_err());
        CHECK(std::string(envelope::kind_name(static_cast<envelope::Kind>(0xEE))) == "Unknown");
    }
}
