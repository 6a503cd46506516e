#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/frame.hpp"
#include "../core/identifier.hpp"
#include "../core/types.hpp"
#include "../database/database.hpp"
#include "../util/data_span.hpp"
#include "decoder_config.hpp"
#include "spn_decoder.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <utility>

namespace spnkit::decode {

    // ─── Frame decoder ───────────────────────────────────────────────────────────
    // Resolves the PGN of a frame and decodes every SPN registered under it.
    // Refers to the database, which must outlive the decoder.
    // Stateless between calls: concurrent decode() calls on one instance are safe.
    class FrameDecoder {
        const Database *db_;
        DecoderConfig config_;

      public:
        // Takes the config as given; use create() to reject an invalid one
        explicit FrameDecoder(const Database &db = Database::builtin(), DecoderConfig config = {})
            : db_(&db), config_(config) {}

        static Result<FrameDecoder> create(const Database &db, DecoderConfig config) {
            auto valid = validate_decoder_config(config);
            if (valid.is_err()) {
                return Result<FrameDecoder>::err(valid.error());
            }
            return Result<FrameDecoder>::ok(FrameDecoder(db, config));
        }

        static Result<FrameDecoder> create(DecoderConfig config) { return create(Database::builtin(), config); }

        const Database &database() const noexcept { return *db_; }
        const DecoderConfig &config() const noexcept { return config_; }

        // Calls fn(const DecodedSpn &) for each SPN that has a value, in registration order.
        // Returns the number of SPNs reported.
        template <typename Fn> usize for_each_decoded(u32 can_id, DataSpan data, Fn &&fn) const {
            if (!accepts(can_id, data)) {
                return 0;
            }
            PGN pgn = extract_pgn(can_id);
            if (!db_->has_pgn(pgn)) {
                echo::category("spnkit.decoder").trace("no SPNs registered for pgn=", pgn);
                return 0;
            }

            usize count = 0;
            db_->for_each_in_pgn(pgn, [&](const SpnDefinition &def) {
                auto decoded = decode_spn_full(data, def);
                if (decoded.has_value()) {
                    fn(*decoded);
                    ++count;
                } else if (config_.log_short_payloads && def.end_bit() > data.size() * 8) {
                    echo::category("spnkit.decoder")
                        .trace("SPN ", def.spn, " cut off: pgn=", pgn, " len=", data.size());
                }
            });
            return count;
        }

        dp::Vector<DecodedSpn> decode(u32 can_id, DataSpan data) const {
            dp::Vector<DecodedSpn> result;
            for_each_decoded(can_id, data, [&result](const DecodedSpn &spn) { result.push_back(spn); });
            return result;
        }

        dp::Vector<DecodedSpn> decode(const Frame &frame) const {
            return decode(frame.can_id(), DataSpan(frame.data.data(), frame.length));
        }

      private:
        bool accepts(u32 can_id, DataSpan data) const noexcept {
            if (config_.source_filter.has_value() && extract_source_address(can_id) != *config_.source_filter) {
                return false;
            }
            if (config_.require_full_frame && data.size() < CAN_DATA_LENGTH) {
                return false;
            }
            return true;
        }
    };

    // ─── Decoding against the built-in database ──────────────────────────────────
    inline dp::Vector<DecodedSpn> decode_frame(const Database &db, u32 can_id, DataSpan data) {
        return FrameDecoder(db).decode(can_id, data);
    }

    inline dp::Vector<DecodedSpn> decode_frame(u32 can_id, DataSpan data) {
        return decode_frame(Database::builtin(), can_id, data);
    }

    template <typename Fn> usize decode_frame_each(u32 can_id, DataSpan data, Fn &&fn) {
        return FrameDecoder().for_each_decoded(can_id, data, std::forward<Fn>(fn));
    }

} // namespace spnkit::decode
namespace spnkit {
    using namespace decode;
}
