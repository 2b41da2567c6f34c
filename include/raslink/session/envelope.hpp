#pragma once

#include <raslink/common.hpp>
#include <raslink/version.hpp>

#include <variant>

namespace raslink {
    namespace envelope {

        /// Envelope kinds, commands flow client -> daemon and events daemon -> client
        enum class Kind : dp::u8 {
            ConnectionReady = 0x01,
            SessionCommand = 0x02,
            TerminalAttach = 0x10,
            TerminalDetach = 0x11,
            TerminalInput = 0x12,
            TerminalResize = 0x13,
            Ping = 0x20,
            UnpairRequest = 0x30,

            TerminalAttached = 0x80,
            TerminalDetached = 0x81,
            TerminalOutput = 0x82,
            TerminalError = 0x83,
            TerminalSkipped = 0x84,
            TerminalSnapshot = 0x85,
            Pong = 0xA0,
            SessionEvent = 0xB0,
            InitialState = 0xB1
        };

        /// Envelope flags (bitfield)
        namespace Flags {
            constexpr dp::u16 None = 0x0000;
            constexpr dp::u16 Partial = 0x0001;    // Output chunk continues in the next envelope
            constexpr dp::u16 SpecialKey = 0x0002; // Input carries a named key instead of raw bytes
        } // namespace Flags

        /// Key modifiers for special-key input (bitfield)
        namespace Modifiers {
            constexpr dp::u8 None = 0x00;
            constexpr dp::u8 Ctrl = 0x01;
            constexpr dp::u8 Alt = 0x02;
            constexpr dp::u8 Shift = 0x04;
            constexpr dp::u8 Meta = 0x08;
        } // namespace Modifiers

        /// Header: [version:1][kind:1][flags:2][length:4]
        constexpr dp::usize HEADER_SIZE = 8;
        constexpr dp::usize MAX_BODY_SIZE = 16 * 1024 * 1024;

        inline const char *kind_name(Kind kind) {
            switch (kind) {
            case Kind::ConnectionReady:
                return "ConnectionReady";
            case Kind::SessionCommand:
                return "SessionCommand";
            case Kind::TerminalAttach:
                return "TerminalAttach";
            case Kind::TerminalDetach:
                return "TerminalDetach";
            case Kind::TerminalInput:
                return "TerminalInput";
            case Kind::TerminalResize:
                return "TerminalResize";
            case Kind::Ping:
                return "Ping";
            case Kind::UnpairRequest:
                return "UnpairRequest";
            case Kind::TerminalAttached:
                return "TerminalAttached";
            case Kind::TerminalDetached:
                return "TerminalDetached";
            case Kind::TerminalOutput:
                return "TerminalOutput";
            case Kind::TerminalError:
                return "TerminalError";
            case Kind::TerminalSkipped:
                return "TerminalSkipped";
            case Kind::TerminalSnapshot:
                return "TerminalSnapshot";
            case Kind::Pong:
                return "Pong";
            case Kind::SessionEvent:
                return "SessionEvent";
            case Kind::InitialState:
                return "InitialState";
            }
            return "Unknown";
        }

        struct Envelope {
            dp::u8 version;
            Kind kind;
            dp::u16 flags;
            Message body;
        };

        inline Message encode_envelope(Kind kind, const Message &body, dp::u16 flags = Flags::None) {
            Message msg;
            msg.reserve(HEADER_SIZE + body.size());
            msg.push_back(ENVELOPE_VERSION);
            msg.push_back(static_cast<dp::u8>(kind));
            append_u16_be(msg, flags);
            append_u32_be(msg, static_cast<dp::u32>(body.size()));
            msg.insert(msg.end(), body.begin(), body.end());
            return msg;
        }

        inline dp::Res<Envelope> decode_envelope(const Message &msg) {
            if (msg.size() < HEADER_SIZE) {
                echo::error("envelope too short: ", msg.size());
                return dp::result::err(dp::Error::invalid_argument("envelope too short"));
            }
            dp::u8 version = msg[0];
            if (!is_envelope_version_supported(version)) {
                echo::error("unsupported envelope version: ", static_cast<int>(version));
                return dp::result::err(dp::Error::invalid_argument("unsupported envelope version"));
            }
            dp::u16 flags = decode_u16_be(msg.data() + 2);
            dp::u32 length = decode_u32_be(msg.data() + 4);
            if (length > MAX_BODY_SIZE) {
                return dp::result::err(dp::Error::invalid_argument("envelope body too large"));
            }
            if (msg.size() != HEADER_SIZE + length) {
                echo::error("envelope size mismatch: expected ", HEADER_SIZE + length, " got ", msg.size());
                return dp::result::err(dp::Error::invalid_argument("envelope size mismatch"));
            }
            Envelope env{version, static_cast<Kind>(msg[1]), flags, Message(msg.begin() + HEADER_SIZE, msg.end())};
            return dp::result::ok(std::move(env));
        }

        // Body fields: integers big-endian, strings and byte blobs as [u32 length][bytes]
        class BodyWriter {
          private:
            Message buf_;

          public:
            BodyWriter &u8(dp::u8 value) {
                buf_.push_back(value);
                return *this;
            }
            BodyWriter &u16(dp::u16 value) {
                append_u16_be(buf_, value);
                return *this;
            }
            BodyWriter &u64(dp::u64 value) {
                append_u64_be(buf_, value);
                return *this;
            }
            BodyWriter &bytes(const Message &value) {
                append_u32_be(buf_, static_cast<dp::u32>(value.size()));
                append_bytes(buf_, value.data(), value.size());
                return *this;
            }
            BodyWriter &str(const dp::String &value) {
                append_u32_be(buf_, static_cast<dp::u32>(value.size()));
                append_string(buf_, value);
                return *this;
            }

            Message take() { return std::move(buf_); }
        };

        /// Reads fields in order; any overrun latches the reader into a failed state
        class BodyReader {
          private:
            const Message &buf_;
            dp::usize pos_ = 0;
            bool failed_ = false;

            bool need(dp::usize count) {
                if (failed_ || buf_.size() - pos_ < count) {
                    failed_ = true;
                    return false;
                }
                return true;
            }

          public:
            explicit BodyReader(const Message &buf) : buf_(buf) {}

            dp::u8 u8() {
                if (!need(1)) {
                    return 0;
                }
                return buf_[pos_++];
            }

            dp::u16 u16() {
                if (!need(2)) {
                    return 0;
                }
                dp::u16 value = decode_u16_be(buf_.data() + pos_);
                pos_ += 2;
                return value;
            }

            dp::u64 u64() {
                if (!need(8)) {
                    return 0;
                }
                dp::u64 value = decode_u64_be(buf_.data() + pos_);
                pos_ += 8;
                return value;
            }

            Message bytes() {
                if (!need(4)) {
                    return Message();
                }
                dp::u32 length = decode_u32_be(buf_.data() + pos_);
                pos_ += 4;
                if (!need(length)) {
                    return Message();
                }
                Message out(buf_.begin() + pos_, buf_.begin() + pos_ + length);
                pos_ += length;
                return out;
            }

            dp::String str() { return bytes_to_string(bytes()); }

            bool failed() const { return failed_; }
        };

    } // namespace envelope

    // ============================================================================
    // Commands (client -> daemon)
    // ============================================================================

    namespace command {
        struct ConnectionReady {};
        struct SessionCommand {
            Message body;
        };
        struct Attach {
            dp::String session_id;
            dp::u64 from_sequence = 0;
            dp::u16 cols = 80;
            dp::u16 rows = 24;
        };
        struct Detach {
            dp::String session_id;
        };
        struct Input {
            dp::String session_id;
            Message data;
        };
        struct SpecialKey {
            dp::String session_id;
            dp::String key;
            dp::u8 modifiers = envelope::Modifiers::None;
        };
        struct Resize {
            dp::String session_id;
            dp::u16 cols = 80;
            dp::u16 rows = 24;
        };
        struct Ping {
            dp::u64 timestamp_ms = 0;
        };
        struct UnpairRequest {
            dp::String device_id;
        };
    } // namespace command

    using Command = std::variant<command::ConnectionReady, command::SessionCommand, command::Attach, command::Detach,
                                 command::Input, command::SpecialKey, command::Resize, command::Ping,
                                 command::UnpairRequest>;

    // ============================================================================
    // Events (daemon -> client)
    // ============================================================================

    namespace event {
        struct Attached {
            dp::String session_id;
            dp::u16 cols = 80;
            dp::u16 rows = 24;
            dp::u64 buffer_start_seq = 0;
            dp::u64 current_seq = 0;
        };
        struct Detached {
            dp::String session_id;
            dp::String reason;
        };
        struct Output {
            dp::String session_id;
            dp::u64 sequence = 0;
            Message data;
            bool partial = false;
        };
        struct Error {
            dp::String session_id;
            dp::String code;
            dp::String message;
        };
        struct Skipped {
            dp::String session_id;
            dp::u64 from_sequence = 0;
            dp::u64 to_sequence = 0;
            dp::u64 bytes_skipped = 0;
        };
        struct Snapshot {
            dp::String session_id;
            dp::u64 sequence = 0;
            Message data;
        };
        struct Pong {
            dp::u64 timestamp_ms = 0;
        };
        struct SessionEvent {
            Message body;
        };
        struct InitialState {
            Message body;
        };
    } // namespace event

    using Event = std::variant<event::Attached, event::Detached, event::Output, event::Error, event::Skipped,
                               event::Snapshot, event::Pong, event::SessionEvent, event::InitialState>;

    namespace envelope {

        inline Message encode_command(const Command &cmd) {
            BodyWriter w;
            if (std::holds_alternative<command::ConnectionReady>(cmd)) {
                return encode_envelope(Kind::ConnectionReady, Message());
            }
            if (const auto *c = std::get_if<command::SessionCommand>(&cmd)) {
                return encode_envelope(Kind::SessionCommand, c->body);
            }
            if (const auto *c = std::get_if<command::Attach>(&cmd)) {
                w.str(c->session_id).u64(c->from_sequence).u16(c->cols).u16(c->rows);
                return encode_envelope(Kind::TerminalAttach, w.take());
            }
            if (const auto *c = std::get_if<command::Detach>(&cmd)) {
                w.str(c->session_id);
                return encode_envelope(Kind::TerminalDetach, w.take());
            }
            if (const auto *c = std::get_if<command::Input>(&cmd)) {
                w.str(c->session_id).bytes(c->data);
                return encode_envelope(Kind::TerminalInput, w.take());
            }
            if (const auto *c = std::get_if<command::SpecialKey>(&cmd)) {
                w.str(c->session_id).str(c->key).u8(c->modifiers);
                return encode_envelope(Kind::TerminalInput, w.take(), Flags::SpecialKey);
            }
            if (const auto *c = std::get_if<command::Resize>(&cmd)) {
                w.str(c->session_id).u16(c->cols).u16(c->rows);
                return encode_envelope(Kind::TerminalResize, w.take());
            }
            if (const auto *c = std::get_if<command::Ping>(&cmd)) {
                w.u64(c->timestamp_ms);
                return encode_envelope(Kind::Ping, w.take());
            }
            const auto &c = std::get<command::UnpairRequest>(cmd);
            w.str(c.device_id);
            return encode_envelope(Kind::UnpairRequest, w.take());
        }

        inline dp::Res<Command> decode_command(const Message &msg) {
            auto env_res = decode_envelope(msg);
            if (env_res.is_err()) {
                return dp::result::err(env_res.error());
            }
            const Envelope &env = env_res.value();
            BodyReader r(env.body);
            Command cmd;
            switch (env.kind) {
            case Kind::ConnectionReady:
                cmd = command::ConnectionReady{};
                break;
            case Kind::SessionCommand:
                cmd = command::SessionCommand{env.body};
                break;
            case Kind::TerminalAttach: {
                command::Attach c;
                c.session_id = r.str();
                c.from_sequence = r.u64();
                c.cols = r.u16();
                c.rows = r.u16();
                cmd = c;
                break;
            }
            case Kind::TerminalDetach:
                cmd = command::Detach{r.str()};
                break;
            case Kind::TerminalInput:
                if (env.flags & Flags::SpecialKey) {
                    command::SpecialKey c;
                    c.session_id = r.str();
                    c.key = r.str();
                    c.modifiers = r.u8();
                    cmd = c;
                } else {
                    command::Input c;
                    c.session_id = r.str();
                    c.data = r.bytes();
                    cmd = c;
                }
                break;
            case Kind::TerminalResize: {
                command::Resize c;
                c.session_id = r.str();
                c.cols = r.u16();
                c.rows = r.u16();
                cmd = c;
                break;
            }
            case Kind::Ping:
                cmd = command::Ping{r.u64()};
                break;
            case Kind::UnpairRequest:
                cmd = command::UnpairRequest{r.str()};
                break;
            default:
                echo::error("not a command envelope: ", kind_name(env.kind));
                return dp::result::err(dp::Error::invalid_argument("unknown command kind"));
            }
            if (r.failed()) {
                echo::error("truncated ", kind_name(env.kind), " body");
                return dp::result::err(dp::Error::invalid_argument("truncated command body"));
            }
            return dp::result::ok(std::move(cmd));
        }

        inline Message encode_event(const Event &ev) {
            BodyWriter w;
            if (const auto *e = std::get_if<event::Attached>(&ev)) {
                w.str(e->session_id).u16(e->cols).u16(e->rows).u64(e->buffer_start_seq).u64(e->current_seq);
                return encode_envelope(Kind::TerminalAttached, w.take());
            }
            if (const auto *e = std::get_if<event::Detached>(&ev)) {
                w.str(e->session_id).str(e->reason);
                return encode_envelope(Kind::TerminalDetached, w.take());
            }
            if (const auto *e = std::get_if<event::Output>(&ev)) {
                w.str(e->session_id).u64(e->sequence).bytes(e->data);
                return encode_envelope(Kind::TerminalOutput, w.take(), e->partial ? Flags::Partial : Flags::None);
            }
            if (const auto *e = std::get_if<event::Error>(&ev)) {
                w.str(e->session_id).str(e->code).str(e->message);
                return encode_envelope(Kind::TerminalError, w.take());
            }
            if (const auto *e = std::get_if<event::Skipped>(&ev)) {
                w.str(e->session_id).u64(e->from_sequence).u64(e->to_sequence).u64(e->bytes_skipped);
                return encode_envelope(Kind::TerminalSkipped, w.take());
            }
            if (const auto *e = std::get_if<event::Snapshot>(&ev)) {
                w.str(e->session_id).u64(e->sequence).bytes(e->data);
                return encode_envelope(Kind::TerminalSnapshot, w.take());
            }
            if (const auto *e = std::get_if<event::Pong>(&ev)) {
                w.u64(e->timestamp_ms);
                return encode_envelope(Kind::Pong, w.take());
            }
            if (const auto *e = std::get_if<event::SessionEvent>(&ev)) {
                return encode_envelope(Kind::SessionEvent, e->body);
            }
            return encode_envelope(Kind::InitialState, std::get<event::InitialState>(ev).body);
        }

        inline dp::Res<Event> decode_event(const Message &msg) {
            auto env_res = decode_envelope(msg);
            if (env_res.is_err()) {
                return dp::result::err(env_res.error());
            }
            const Envelope &env = env_res.value();
            BodyReader r(env.body);
            Event ev;
            switch (env.kind) {
            case Kind::TerminalAttached: {
                event::Attached e;
                e.session_id = r.str();
                e.cols = r.u16();
                e.rows = r.u16();
                e.buffer_start_seq = r.u64();
                e.current_seq = r.u64();
                ev = e;
                break;
            }
            case Kind::TerminalDetached: {
                event::Detached e;
                e.session_id = r.str();
                e.reason = r.str();
                ev = e;
                break;
            }
            case Kind::TerminalOutput: {
                event::Output e;
                e.session_id = r.str();
                e.sequence = r.u64();
                e.data = r.bytes();
                e.partial = (env.flags & Flags::Partial) != 0;
                ev = e;
                break;
            }
            case Kind::TerminalError: {
                event::Error e;
                e.session_id = r.str();
                e.code = r.str();
                e.message = r.str();
                ev = e;
                break;
            }
            case Kind::TerminalSkipped: {
                event::Skipped e;
                e.session_id = r.str();
                e.from_sequence = r.u64();
                e.to_sequence = r.u64();
                e.bytes_skipped = r.u64();
                ev = e;
                break;
            }
            case Kind::TerminalSnapshot: {
                event::Snapshot e;
                e.session_id = r.str();
                e.sequence = r.u64();
                e.data = r.bytes();
                ev = e;
                break;
            }
            case Kind::Pong:
                ev = event::Pong{r.u64()};
                break;
            case Kind::SessionEvent:
                ev = event::SessionEvent{env.body};
                break;
            case Kind::InitialState:
                ev = event::InitialState{env.body};
                break;
            default:
                echo::error("not an event envelope: ", kind_name(env.kind));
                return dp::result::err(dp::Error::invalid_argument("unknown event kind"));
            }
            if (r.failed()) {
                echo::error("truncated ", kind_name(env.kind), " body");
                return dp::result::err(dp::Error::invalid_argument("truncated event body"));
            }
            return dp::result::ok(std::move(ev));
        }

    } // namespace envelope

} // namespace raslink
