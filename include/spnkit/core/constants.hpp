#pragma once

#include "../pgn_defs.hpp"
#include "types.hpp"

namespace spnkit {

    // ─── Address constants (J1939-81) ────────────────────────────────────────────
    inline constexpr Address NULL_ADDRESS = 0xFE;
    inline constexpr Address BROADCAST_ADDRESS = 0xFF;

    // ─── Identifier layout ───────────────────────────────────────────────────────
    inline constexpr u32 CAN_ID_MASK = 0x1FFFFFFF;
    inline constexpr u8 PDU2_THRESHOLD = 240; // PF >= 240 is PDU2 (broadcast)

    // ─── Protocol limits ─────────────────────────────────────────────────────────
    inline constexpr u32 CAN_DATA_LENGTH = 8;
    inline constexpr u8 MAX_FIELD_BITS = 64;
    inline constexpr u32 REQUEST_DATA_LENGTH = 3;

} // namespace spnkit
