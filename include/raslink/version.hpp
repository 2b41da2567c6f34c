#pragma once

#include <datapod/datapod.hpp>

namespace raslink {

    /// Capability-exchange protocol version advertised to the daemon
    constexpr dp::u32 PROTOCOL_VERSION = 1;

    /// Envelope wire format version
    /// Format: [version:1][kind:1][flags:2][length:4][body:N]
    constexpr dp::u8 ENVELOPE_VERSION = 1;

    inline bool is_envelope_version_supported(dp::u8 version) { return version == ENVELOPE_VERSION; }

} // namespace raslink
