#pragma once

#include "types.hpp"
#include <datapod/datapod.hpp>
#include <string>
#include <utility>

namespace spnkit {

    // ─── Error codes ─────────────────────────────────────────────────────────────
    enum class ErrorCode : u32 {
        Ok = 0,
        PayloadTooShort,
        NotAvailable,
        InvalidLength,
        InvalidField,
        InvalidDefinition,
        DuplicateSpn,
    };

    // ─── Error type ──────────────────────────────────────────────────────────────
    struct Error : dp::Error {
        ErrorCode code = ErrorCode::Ok;

        Error() = default;
        Error(ErrorCode c, dp::String msg = "") : dp::Error{static_cast<dp::u32>(c), std::move(msg)}, code(c) {}

        static Error payload_too_short(usize needed, usize got) noexcept {
            return Error(ErrorCode::PayloadTooShort, "payload too short: need " + dp::String(std::to_string(needed)) +
                                                         " bytes, got " + dp::String(std::to_string(got)));
        }
        static Error not_available(SPN spn) noexcept {
            return Error(ErrorCode::NotAvailable, "SPN " + dp::String(std::to_string(spn)) + " not available");
        }
        static Error invalid_length(u8 length_bits) noexcept {
            return Error(ErrorCode::InvalidLength,
                         "invalid bit length: " + dp::String(std::to_string(static_cast<u32>(length_bits))));
        }
        static Error invalid_field(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidField, std::move(msg));
        }
        static Error invalid_definition(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidDefinition, std::move(msg));
        }
        static Error duplicate_spn(SPN spn) noexcept {
            return Error(ErrorCode::DuplicateSpn, "duplicate SPN: " + dp::String(std::to_string(spn)));
        }
    };

    // ─── Result alias ────────────────────────────────────────────────────────────
    template <typename T> using Result = dp::Result<T, Error>;

} // namespace spnkit
