#pragma once

#include "../core/constants.hpp"
#include "../core/frame.hpp"
#include "../core/identifier.hpp"
#include "../core/types.hpp"
#include "../util/bitfield.hpp"
#include "../util/data_span.hpp"
#include <datapod/datapod.hpp>

namespace spnkit {
    namespace protocol {

        // ─── Request PGN frame (PGN 59904, J1939-21) ────────────────────────────────
        struct RequestFrame {
            u32 can_id = 0;
            dp::Array<u8, 3> data = {};

            Frame to_frame() const noexcept { return Frame::from_raw(can_id, data.data(), REQUEST_DATA_LENGTH); }
        };

        // Outgoing frame only; nothing waits for the response.
        // The requested PGN is always sent as 3 little-endian bytes.
        inline RequestFrame build_request_pgn(Address requester_sa, Address target_da, PGN requested_pgn,
                                              Priority prio = Priority::Default) noexcept {
            RequestFrame req;
            req.can_id = encode_can_id(prio, PGN_REQUEST, requester_sa, target_da).raw();
            bitfield::pack_u24_le(req.data.data(), requested_pgn);
            return req;
        }

        // PGN carried in the first three bytes of a received request
        inline dp::Optional<PGN> decode_requested_pgn(DataSpan data) noexcept {
            if (data.size() < REQUEST_DATA_LENGTH) {
                return dp::nullopt;
            }
            return bitfield::unpack_u24_le(data.data());
        }

    } // namespace protocol
    using namespace protocol;
} // namespace spnkit
