#include <spnkit.hpp>
#include <echo/echo.hpp>

using namespace spnkit;

// Proprietary B message from an implement controller
static constexpr PGN PGN_HOPPER_STATUS = 0xFF20;

static const SpnDefinition HOPPER_SPNS[] = {
    make_spn(520192, "hopper_level", PGN_HOPPER_STATUS, 0, 0, 8, 0.4, 0.0, "%"),
    make_spn(520193, "seed_rate", PGN_HOPPER_STATUS, 1, 0, 16, 0.1, 0.0, "kg/ha"),
    make_spn(520194, "fan_on", PGN_HOPPER_STATUS, 3, 0, 2, 1.0, 0.0, ""),
};

int main() {
    echo::info("=== Custom SPN Table Demo ===");

    auto db_result = Database::create(HOPPER_SPNS);
    if (db_result.is_err()) {
        echo::error("Table rejected: ", db_result.error().message);
        return 1;
    }
    const Database &db = db_result.value();
    echo::info("Custom database: ", db.stats().spn_count, " SPNs");

    FrameDecoder decoder(db);
    // 80% full, 150.0 kg/ha, fan on
    u8 payload[] = {200, 0xDC, 0x05, 0x01, 0xFF, 0xFF, 0xFF, 0xFF};
    for (const auto &spn : decoder.decode(0x18FF2080, DataSpan(payload))) {
        echo::info("  ", spn.name, ": ", spn.value, " ", spn.unit);
    }

    // Checked decoding tells a missing value from a cut-off one
    u8 partial[] = {0xFF, 0xDC};
    for (const auto &def : db.definitions()) {
        auto r = decode_spn_checked(DataSpan(partial), def);
        if (r.is_ok()) {
            echo::info("  ", def.name, " = ", r.value().value);
        } else {
            echo::info("  ", def.name, ": ", r.error().message);
        }
    }

    // Duplicate SPN numbers are refused
    const SpnDefinition dup[] = {HOPPER_SPNS[0], HOPPER_SPNS[0]};
    auto dup_result = Database::create(dup);
    echo::info("\nDuplicate table accepted: ", dup_result.is_ok());

    return 0;
}
