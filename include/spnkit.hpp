#pragma once

// ─── Core ────────────────────────────────────────────────────────────────────
#include "spnkit/core/constants.hpp"
#include "spnkit/core/error.hpp"
#include "spnkit/core/frame.hpp"
#include "spnkit/core/identifier.hpp"
#include "spnkit/core/types.hpp"
#include "spnkit/pgn_defs.hpp"

// ─── Utilities ───────────────────────────────────────────────────────────────
#include "spnkit/util/bitfield.hpp"
#include "spnkit/util/data_span.hpp"

// ─── SPN Database ────────────────────────────────────────────────────────────
#include "spnkit/database/database.hpp"
#include "spnkit/database/spn_definition.hpp"
#include "spnkit/database/spn_table.hpp"

// ─── Decoding ────────────────────────────────────────────────────────────────
#include "spnkit/decode/decoder_config.hpp"
#include "spnkit/decode/frame_decoder.hpp"
#include "spnkit/decode/spn_decoder.hpp"

// ─── Protocols ───────────────────────────────────────────────────────────────
#include "spnkit/protocol/request.hpp"
