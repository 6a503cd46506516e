#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace spnkit::decode {

    // ─── Frame decoder configuration ─────────────────────────────────────────────
    // Defaults decode every frame from every source and keep whatever SPNs the
    // payload covers.
    struct DecoderConfig {
        dp::Optional<Address> source_filter;   // decode only frames from this source
        bool require_full_frame = false;       // drop payloads shorter than 8 bytes
        bool log_short_payloads = false;       // trace SPNs cut off by a short payload

        // Fluent API
        DecoderConfig &set_source_filter(Address sa) {
            source_filter = sa;
            return *this;
        }
        DecoderConfig &clear_source_filter() {
            source_filter = dp::nullopt;
            return *this;
        }
        DecoderConfig &set_require_full_frame(bool r) {
            require_full_frame = r;
            return *this;
        }
        DecoderConfig &set_log_short_payloads(bool l) {
            log_short_payloads = l;
            return *this;
        }
    };

    // The global address never appears as a source, so filtering on it would drop everything
    inline Result<void> validate_decoder_config(const DecoderConfig &config) {
        if (config.source_filter.has_value() && *config.source_filter == BROADCAST_ADDRESS) {
            echo::category("spnkit.config").warn("source filter set to the global address");
            return Result<void>::err(Error::invalid_field("source filter cannot be 0xFF"));
        }
        return {};
    }

} // namespace spnkit::decode
namespace spnkit {
    using namespace decode;
}
