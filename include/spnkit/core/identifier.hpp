#pragma once

#include "constants.hpp"
#include "error.hpp"
#include "types.hpp"

namespace spnkit {

    // ─── CAN Identifier (29-bit extended ID) ────────────────────────────────────
    // Layout: [Priority:3][Reserved:1][DataPage:1][PDU Format:8][PDU Specific:8][Source:8]
    struct CanIdentifier {
        Priority priority = Priority::Default;
        bool reserved = false;
        bool data_page = false;
        u8 pdu_format = 0;
        u8 pdu_specific = 0;
        Address source_address = NULL_ADDRESS;

        constexpr bool is_pdu2() const noexcept { return pdu_format >= PDU2_THRESHOLD; }

        constexpr bool is_pdu1() const noexcept { return !is_pdu2(); }

        // PDU1 leaves PS out of the PGN (it carries the destination), PDU2 uses it as group extension
        constexpr PGN pgn() const noexcept {
            PGN base = (static_cast<u32>(data_page) << 16) | (static_cast<u32>(pdu_format) << 8);
            if (is_pdu1()) {
                return base;
            }
            return base | pdu_specific;
        }

        constexpr Address destination_address() const noexcept {
            if (is_pdu2()) {
                return BROADCAST_ADDRESS;
            }
            return pdu_specific;
        }

        constexpr bool is_broadcast() const noexcept {
            return is_pdu2() || destination_address() == BROADCAST_ADDRESS;
        }

        constexpr u32 raw() const noexcept {
            return (static_cast<u32>(priority) & 0x07) << 26 | static_cast<u32>(reserved) << 25 |
                   static_cast<u32>(data_page) << 24 | static_cast<u32>(pdu_format) << 16 |
                   static_cast<u32>(pdu_specific) << 8 | static_cast<u32>(source_address);
        }

        constexpr bool operator==(const CanIdentifier &other) const noexcept { return raw() == other.raw(); }
        constexpr bool operator!=(const CanIdentifier &other) const noexcept { return raw() != other.raw(); }
    };

    // ─── Parsing ─────────────────────────────────────────────────────────────────
    // Never fails. Bits 29-31 are discarded.
    constexpr CanIdentifier parse_can_id(u32 can_id) noexcept {
        CanIdentifier id;
        id.priority = static_cast<Priority>((can_id >> 26) & 0x07);
        id.reserved = (can_id >> 25) & 0x01;
        id.data_page = (can_id >> 24) & 0x01;
        id.pdu_format = static_cast<u8>((can_id >> 16) & 0xFF);
        id.pdu_specific = static_cast<u8>((can_id >> 8) & 0xFF);
        id.source_address = static_cast<Address>(can_id & 0xFF);
        return id;
    }

    // PGN only, without building the full record
    constexpr PGN extract_pgn(u32 can_id) noexcept {
        u8 pf = static_cast<u8>((can_id >> 16) & 0xFF);
        PGN pgn = (((can_id >> 24) & 0x01) << 16) | (static_cast<u32>(pf) << 8);
        if (pf >= PDU2_THRESHOLD) {
            pgn |= (can_id >> 8) & 0xFF;
        }
        return pgn;
    }

    constexpr Address extract_source_address(u32 can_id) noexcept { return static_cast<Address>(can_id & 0xFF); }

    constexpr bool is_valid_j1939_id(u32 can_id) noexcept { return can_id <= CAN_ID_MASK; }

    // ─── Building ────────────────────────────────────────────────────────────────
    // Each argument is masked to its field width: priority to 3 bits, data_page to 1 bit.
    // Out-of-range values are truncated silently; use build_can_id_checked to reject them.
    constexpr u32 build_can_id(u8 priority, u8 data_page, u8 pdu_format, u8 pdu_specific,
                               Address source_address) noexcept {
        return (static_cast<u32>(priority) & 0x07) << 26 | (static_cast<u32>(data_page) & 0x01) << 24 |
               static_cast<u32>(pdu_format) << 16 | static_cast<u32>(pdu_specific) << 8 |
               static_cast<u32>(source_address);
    }

    constexpr u32 build_can_id(const CanIdentifier &id) noexcept { return id.raw(); }

    inline Result<u32> build_can_id_checked(u8 priority, u8 data_page, u8 pdu_format, u8 pdu_specific,
                                            Address source_address) {
        if (priority > 7) {
            return Result<u32>::err(
                Error::invalid_field("priority out of range: " + dp::String(std::to_string(priority))));
        }
        if (data_page > 1) {
            return Result<u32>::err(
                Error::invalid_field("data page out of range: " + dp::String(std::to_string(data_page))));
        }
        return Result<u32>::ok(build_can_id(priority, data_page, pdu_format, pdu_specific, source_address));
    }

    // Builds from a PGN: PDU1 places the destination in PS, PDU2 keeps the PGN's low byte
    constexpr CanIdentifier encode_can_id(Priority prio, PGN pgn, Address src,
                                          Address dst = BROADCAST_ADDRESS) noexcept {
        CanIdentifier id;
        id.priority = prio;
        id.data_page = (pgn >> 16) & 0x01;
        id.pdu_format = static_cast<u8>((pgn >> 8) & 0xFF);
        id.pdu_specific = id.is_pdu2() ? static_cast<u8>(pgn & 0xFF) : dst;
        id.source_address = src;
        return id;
    }

} // namespace spnkit
