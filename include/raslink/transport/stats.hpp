#pragma once

#include <raslink/common.hpp>

#include <atomic>

namespace raslink {

    /// Plain copy of the counters, safe to hand out
    struct TransportStatsSnapshot {
        dp::u64 bytes_sent = 0;
        dp::u64 bytes_received = 0;
        dp::u64 messages_sent = 0;
        dp::u64 messages_received = 0;
        dp::u64 connected_at_ms = 0;  // Wall clock
        dp::u64 last_activity_ms = 0; // Wall clock, 0 if nothing moved yet
    };

    /// Live counters owned by a transport
    struct TransportStats {
        std::atomic<dp::u64> bytes_sent{0};
        std::atomic<dp::u64> bytes_received{0};
        std::atomic<dp::u64> messages_sent{0};
        std::atomic<dp::u64> messages_received{0};
        std::atomic<dp::u64> connected_at_ms{0};
        std::atomic<dp::u64> last_activity_ms{0};

        /// Mark the moment the transport became usable
        inline void mark_connected() { connected_at_ms = wall_now_ms(); }

        inline void record_sent(dp::usize bytes) {
            bytes_sent.fetch_add(bytes);
            messages_sent.fetch_add(1);
            last_activity_ms = wall_now_ms();
        }

        inline void record_received(dp::usize bytes) {
            bytes_received.fetch_add(bytes);
            messages_received.fetch_add(1);
            last_activity_ms = wall_now_ms();
        }

        inline TransportStatsSnapshot snapshot() const {
            TransportStatsSnapshot snap;
            snap.bytes_sent = bytes_sent.load();
            snap.bytes_received = bytes_received.load();
            snap.messages_sent = messages_sent.load();
            snap.messages_received = messages_received.load();
            snap.connected_at_ms = connected_at_ms.load();
            snap.last_activity_ms = last_activity_ms.load();
            return snap;
        }
    };

} // namespace raslink
