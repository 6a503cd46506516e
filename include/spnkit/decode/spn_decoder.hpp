#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../database/database.hpp"
#include "../database/spn_definition.hpp"
#include "../util/bitfield.hpp"
#include "../util/data_span.hpp"
#include <datapod/datapod.hpp>

namespace spnkit::decode {

    // ─── Scaling ─────────────────────────────────────────────────────────────────
    constexpr f64 scale_raw(u64 raw, const SpnDefinition &def) noexcept {
        return static_cast<f64>(raw) * def.scale + def.offset;
    }

    // ─── Single SPN decoding ─────────────────────────────────────────────────────
    // Empty when the payload does not cover the field or the source reports the
    // not-available pattern. The two cases are not told apart here.
    inline dp::Optional<DecodedSpn> decode_spn_full(DataSpan data, const SpnDefinition &def) {
        auto raw = extract_bits(data, def.start_byte, def.start_bit, def.length_bits);
        if (!raw.has_value() || def.is_not_available(*raw)) {
            return dp::nullopt;
        }
        DecodedSpn decoded;
        decoded.spn = def.spn;
        decoded.name = def.name;
        decoded.value = scale_raw(*raw, def);
        decoded.unit = def.unit;
        decoded.raw_value = *raw;
        return decoded;
    }

    inline dp::Optional<f64> decode_spn(DataSpan data, const SpnDefinition &def) {
        auto decoded = decode_spn_full(data, def);
        if (!decoded.has_value()) {
            return dp::nullopt;
        }
        return decoded->value;
    }

    // Same as decode_spn_full but reports why no value was produced
    inline Result<DecodedSpn> decode_spn_checked(DataSpan data, const SpnDefinition &def) {
        if (def.length_bits == 0 || def.length_bits > MAX_FIELD_BITS) {
            return Result<DecodedSpn>::err(Error::invalid_length(def.length_bits));
        }
        auto raw = extract_bits(data, def.start_byte, def.start_bit, def.length_bits);
        if (!raw.has_value()) {
            usize needed = static_cast<usize>(def.start_byte) + bitfield::bytes_spanned(def.start_bit, def.length_bits);
            return Result<DecodedSpn>::err(Error::payload_too_short(needed, data.size()));
        }
        if (def.is_not_available(*raw)) {
            return Result<DecodedSpn>::err(Error::not_available(def.spn));
        }
        DecodedSpn decoded;
        decoded.spn = def.spn;
        decoded.name = def.name;
        decoded.value = scale_raw(*raw, def);
        decoded.unit = def.unit;
        decoded.raw_value = *raw;
        return Result<DecodedSpn>::ok(decoded);
    }

    inline dp::Optional<f64> decode_spn_by_number(const Database &db, SPN spn, DataSpan data) {
        const SpnDefinition *def = db.find_spn(spn);
        if (def == nullptr) {
            return dp::nullopt;
        }
        return decode_spn(data, *def);
    }

    inline dp::Optional<f64> decode_spn_by_number(SPN spn, DataSpan data) {
        return decode_spn_by_number(Database::builtin(), spn, data);
    }

} // namespace spnkit::decode
namespace spnkit {
    using namespace decode;
}
