#pragma once

#include "../core/types.hpp"
#include "../util/bitfield.hpp"
#include <datapod/datapod.hpp>

namespace spnkit {
    namespace util {

        // ─── Span-like view over frame payload ───────────────────────────────────────
        // Non-owning; the caller keeps the bytes alive for the duration of the call.
        class DataSpan {
            const u8 *data_ = nullptr;
            usize size_ = 0;

          public:
            constexpr DataSpan() = default;
            constexpr DataSpan(const u8 *data, usize size) : data_(data), size_(size) {}
            DataSpan(const dp::Vector<u8> &vec) : data_(vec.data()), size_(vec.size()) {}

            template <usize N> constexpr DataSpan(const dp::Array<u8, N> &arr) : data_(arr.data()), size_(N) {}
            template <usize N> constexpr DataSpan(const u8 (&arr)[N]) : data_(arr), size_(N) {}

            constexpr const u8 *data() const noexcept { return data_; }
            constexpr usize size() const noexcept { return size_; }
            constexpr bool empty() const noexcept { return size_ == 0; }

            constexpr DataSpan first(usize count) const noexcept {
                return DataSpan(data_, count > size_ ? size_ : count);
            }

            dp::Optional<u64> get_bits(u8 start_byte, u8 start_bit, u8 length) const noexcept {
                return bitfield::extract_bits(data_, size_, start_byte, start_bit, length);
            }

            // Iterator support
            constexpr const u8 *begin() const noexcept { return data_; }
            constexpr const u8 *end() const noexcept { return data_ + size_; }
        };

        // ─── Bit-field extraction over a payload view ────────────────────────────────
        inline dp::Optional<u64> extract_bits(DataSpan data, u8 start_byte, u8 start_bit, u8 length) noexcept {
            return data.get_bits(start_byte, start_bit, length);
        }

    } // namespace util
    using namespace util;
} // namespace spnkit
