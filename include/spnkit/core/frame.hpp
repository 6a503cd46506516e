#pragma once

#include "constants.hpp"
#include "identifier.hpp"
#include "types.hpp"
#include <datapod/datapod.hpp>

namespace spnkit {

    // ─── CAN Frame (single, already-assembled 8-byte frame) ─────────────────────
    struct Frame {
        CanIdentifier id;
        dp::Array<u8, 8> data = {};
        u8 length = 8;

        constexpr Frame() = default;

        // Copies at most 8 bytes; unused bytes are filled with 0xFF
        static Frame from_raw(u32 can_id, const u8 *payload, usize len) noexcept {
            Frame f;
            f.id = parse_can_id(can_id);
            f.length = static_cast<u8>(len > CAN_DATA_LENGTH ? CAN_DATA_LENGTH : len);
            for (u8 i = 0; i < f.length; ++i) {
                f.data[i] = payload[i];
            }
            for (u8 i = f.length; i < 8; ++i) {
                f.data[i] = 0xFF;
            }
            return f;
        }

        constexpr u32 can_id() const noexcept { return id.raw(); }
        constexpr PGN pgn() const noexcept { return id.pgn(); }
        constexpr Address source() const noexcept { return id.source_address; }
        constexpr Address destination() const noexcept { return id.destination_address(); }
        constexpr Priority priority() const noexcept { return id.priority; }
        constexpr bool is_broadcast() const noexcept { return id.is_broadcast(); }
    };

} // namespace spnkit
