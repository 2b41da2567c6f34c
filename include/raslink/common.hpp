#pragma once

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <openssl/crypto.h>

#include <chrono>
#include <cstring>
#include <string>

namespace raslink {

    // Message type - just a vector of bytes
    using Message = dp::Vector<dp::u8>;

    // Big-endian encoding for length-prefix framing
    inline dp::Array<dp::u8, 4> encode_u32_be(dp::u32 value) {
        dp::Array<dp::u8, 4> bytes;
        bytes[0] = static_cast<dp::u8>((value >> 24) & 0xFF);
        bytes[1] = static_cast<dp::u8>((value >> 16) & 0xFF);
        bytes[2] = static_cast<dp::u8>((value >> 8) & 0xFF);
        bytes[3] = static_cast<dp::u8>(value & 0xFF);
        return bytes;
    }

    // Big-endian decoding for length-prefix framing
    inline dp::u32 decode_u32_be(const dp::u8 *bytes) {
        return (static_cast<dp::u32>(bytes[0]) << 24) | (static_cast<dp::u32>(bytes[1]) << 16) |
               (static_cast<dp::u32>(bytes[2]) << 8) | static_cast<dp::u32>(bytes[3]);
    }

    inline dp::u16 decode_u16_be(const dp::u8 *bytes) {
        return static_cast<dp::u16>((static_cast<dp::u16>(bytes[0]) << 8) | static_cast<dp::u16>(bytes[1]));
    }

    inline dp::u64 decode_u64_be(const dp::u8 *bytes) {
        return (static_cast<dp::u64>(decode_u32_be(bytes)) << 32) | static_cast<dp::u64>(decode_u32_be(bytes + 4));
    }

    inline void append_u16_be(Message &buffer, dp::u16 value) {
        buffer.push_back(static_cast<dp::u8>((value >> 8) & 0xFF));
        buffer.push_back(static_cast<dp::u8>(value & 0xFF));
    }

    // Helper to encode u32 directly into a vector
    inline void append_u32_be(Message &buffer, dp::u32 value) {
        auto bytes = encode_u32_be(value);
        buffer.insert(buffer.end(), bytes.begin(), bytes.end());
    }

    inline void append_u64_be(Message &buffer, dp::u64 value) {
        append_u32_be(buffer, static_cast<dp::u32>(value >> 32));
        append_u32_be(buffer, static_cast<dp::u32>(value & 0xFFFFFFFFu));
    }

    inline void append_bytes(Message &buffer, const dp::u8 *data, dp::usize size) {
        buffer.insert(buffer.end(), data, data + size);
    }

    inline void append_string(Message &buffer, const dp::String &text) {
        buffer.insert(buffer.end(), text.begin(), text.end());
    }

    // UTF-8 bytes of a string (no terminator)
    inline Message to_bytes(const dp::String &text) { return Message(text.begin(), text.end()); }

    inline dp::String bytes_to_string(const Message &bytes) {
        return dp::String(reinterpret_cast<const char *>(bytes.data()), bytes.size());
    }

    inline dp::String to_dp_string(const std::string &text) { return dp::String(text.c_str()); }

    inline dp::String to_dp_string(dp::u64 value) { return dp::String(std::to_string(value).c_str()); }

    // Overwrite key material before releasing it
    inline void secure_zero(Message &bytes) {
        if (!bytes.empty()) {
            OPENSSL_cleanse(bytes.data(), bytes.size());
        }
    }

    // Monotonic milliseconds, used for elapsed-time bookkeeping
    inline dp::u64 steady_now_ms() {
        return static_cast<dp::u64>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                        std::chrono::steady_clock::now().time_since_epoch())
                                        .count());
    }

    // Wall-clock milliseconds since the unix epoch (ping timestamps)
    inline dp::u64 wall_now_ms() {
        return static_cast<dp::u64>(
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
                .count());
    }

    // ERROR CATEGORIZATION (shared by every transport):
    // - timeout: nothing arrived in time (expected, recoverable)
    // - not_found: transport closed or peer gone (fatal for this transport)
    // - invalid_argument: protocol violation or rejected input
    // - io_error: any other I/O or crypto failure
    inline bool is_timeout(const dp::Error &error) { return error.code == dp::Error::TIMEOUT; }

    inline bool is_closed(const dp::Error &error) { return error.code == dp::Error::not_found("").code; }

    inline bool is_protocol_error(const dp::Error &error) {
        return error.code == dp::Error::invalid_argument("").code;
    }

} // namespace raslink
