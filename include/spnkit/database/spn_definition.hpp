#pragma once

#include "../core/constants.hpp"
#include "../core/types.hpp"
#include "../util/bitfield.hpp"

namespace spnkit::database {

    // ─── SPN definition ──────────────────────────────────────────────────────────
    // Position is LSB-first: start_bit 0 is the least significant bit of start_byte.
    struct SpnDefinition {
        SPN spn = 0;
        const char *name = "";
        const char *unit = "";
        PGN pgn = 0;
        u8 start_byte = 0;
        u8 start_bit = 0;
        u8 length_bits = 0;
        f64 scale = 1.0;
        f64 offset = 0.0;
        u64 not_available_raw = 0;

        constexpr u16 end_bit() const noexcept {
            return static_cast<u16>(start_byte) * 8 + start_bit + length_bits;
        }

        constexpr bool is_valid() const noexcept {
            return length_bits >= 1 && length_bits <= MAX_FIELD_BITS && start_byte <= 7 && start_bit <= 7 &&
                   end_bit() <= CAN_DATA_LENGTH * 8;
        }

        constexpr bool is_not_available(u64 raw) const noexcept { return raw == not_available_raw; }
    };

    // Sentinel defaults to the all-ones pattern of the field length
    constexpr SpnDefinition make_spn(SPN spn, const char *name, PGN pgn, u8 start_byte, u8 start_bit, u8 length_bits,
                                     f64 scale, f64 offset, const char *unit) noexcept {
        SpnDefinition def;
        def.spn = spn;
        def.name = name;
        def.unit = unit;
        def.pgn = pgn;
        def.start_byte = start_byte;
        def.start_bit = start_bit;
        def.length_bits = length_bits;
        def.scale = scale;
        def.offset = offset;
        def.not_available_raw = bitfield::all_ones(length_bits);
        return def;
    }

    // Every entry well-formed and named, no SPN number repeated
    constexpr bool definitions_are_valid(const SpnDefinition *defs, usize count) noexcept {
        for (usize i = 0; i < count; ++i) {
            const SpnDefinition &def = defs[i];
            if (!def.is_valid() || def.name == nullptr || def.name[0] == '\0') {
                return false;
            }
            for (usize j = 0; j < i; ++j) {
                if (defs[j].spn == def.spn) {
                    return false;
                }
            }
        }
        return true;
    }

    // ─── Decoded value ───────────────────────────────────────────────────────────
    struct DecodedSpn {
        SPN spn = 0;
        const char *name = "";
        f64 value = 0.0;
        const char *unit = "";
        u64 raw_value = 0;

        bool operator==(const DecodedSpn &other) const noexcept {
            return spn == other.spn && value == other.value && raw_value == other.raw_value;
        }
        bool operator!=(const DecodedSpn &other) const noexcept { return !(*this == other); }
    };

} // namespace spnkit::database
namespace spnkit {
    using namespace database;
}
