#pragma once

#include "../core/constants.hpp"
#include "../core/types.hpp"
#include <datapod/datapod.hpp>

namespace spnkit {
    namespace util {

        // ─── Bit-level access helpers ────────────────────────────────────────────────
        namespace bitfield {

            // All-ones pattern of `length` bits; 0 for length 0, saturates at 64
            constexpr u64 all_ones(u8 length) noexcept {
                if (length == 0) {
                    return 0;
                }
                if (length >= 64) {
                    return ~static_cast<u64>(0);
                }
                return (static_cast<u64>(1) << length) - 1;
            }

            // Bytes a field touches, counted from its start byte
            constexpr usize bytes_spanned(u8 start_bit, u8 length) noexcept {
                return (static_cast<usize>(start_bit) + length + 7) / 8;
            }

            // Unsigned field of `length` bits starting at absolute bit start_byte*8 + start_bit.
            // Bytes are concatenated little-endian, bit 0 is the LSB of byte 0.
            inline dp::Optional<u64> extract_bits(const u8 *data, usize size, u8 start_byte, u8 start_bit,
                                                  u8 length) noexcept {
                if (length == 0 || length > MAX_FIELD_BITS) {
                    return dp::nullopt;
                }
                usize first = static_cast<usize>(start_byte) + start_bit / 8;
                u8 shift_in = start_bit % 8;
                usize span = bytes_spanned(shift_in, length);
                if (data == nullptr || first + span > size) {
                    return dp::nullopt;
                }

                u64 value = 0;
                for (usize i = 0; i < span; ++i) {
                    u64 byte = data[first + i];
                    isize shift = static_cast<isize>(i * 8) - shift_in;
                    if (shift < 0) {
                        value |= byte >> (-shift);
                    } else if (shift < 64) {
                        value |= byte << shift;
                    }
                }
                return value & all_ones(length);
            }

            // Little-endian 24-bit values, the width of a PGN on the wire
            inline u32 unpack_u24_le(const u8 *data) noexcept {
                return static_cast<u32>(data[0]) | (static_cast<u32>(data[1]) << 8) |
                       (static_cast<u32>(data[2]) << 16);
            }

            inline void pack_u24_le(u8 *data, u32 value) noexcept {
                data[0] = static_cast<u8>(value & 0xFF);
                data[1] = static_cast<u8>((value >> 8) & 0xFF);
                data[2] = static_cast<u8>((value >> 16) & 0xFF);
            }

        } // namespace bitfield
    } // namespace util
    using namespace util;
} // namespace spnkit
