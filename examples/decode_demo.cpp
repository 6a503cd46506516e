#include <spnkit.hpp>
#include <echo/echo.hpp>

using namespace spnkit;

namespace {
    void print_frame(const char *label, u32 can_id, DataSpan data) {
        auto id = parse_can_id(can_id);
        echo::info("\n", label, " (pgn=", id.pgn(), " sa=", static_cast<int>(id.source_address), ")");
        auto decoded = decode_frame(can_id, data);
        if (decoded.empty()) {
            echo::info("  nothing to report");
            return;
        }
        for (const auto &spn : decoded) {
            echo::info("  SPN ", spn.spn, " ", spn.name, ": ", spn.value, " ", spn.unit);
        }
    }
} // namespace

int main() {
    echo::info("=== J1939 Decode Demo ===");

    auto stats = database_stats();
    echo::info("Built-in database: ", stats.spn_count, " SPNs across ", stats.pgn_count, " PGNs");

    // Engine at 2500 rpm, every other EEC1 field zero
    u8 eec1[] = {0x00, 0x00, 0x00, 0x20, 0x4E, 0x00, 0x00, 0x00};
    print_frame("EEC1", 0x0CF00400, DataSpan(eec1));

    // Coolant 90 C and oil 17 C; the rest not available
    u8 et1[] = {130, 0xFF, 0x40, 0x24, 0xFF, 0xFF, 0xFF, 0xFF};
    print_frame("ET1", 0x18FEEE00, DataSpan(et1));

    // A short CCVS frame only covers its first bytes
    u8 ccvs[] = {0x00, 0x00, 0x32};
    print_frame("CCVS (3 bytes)", 0x18FEF100, DataSpan(ccvs));

    // Proprietary PGN: not in the table
    u8 prop[] = {1, 2, 3, 4, 5, 6, 7, 8};
    print_frame("Proprietary B", 0x18FF1234, DataSpan(prop));

    // Single SPN lookup
    if (auto speed = decode_spn_by_number(190, DataSpan(eec1))) {
        echo::info("\nEngine speed only: ", *speed, " rpm");
    }

    // Only frames from the engine (SA 0x00)
    FrameDecoder engine_only(Database::builtin(), DecoderConfig{}.set_source_filter(0x00));
    echo::info("\nFiltered decoder, SA 0x00: ", engine_only.decode(0x0CF00400, DataSpan(eec1)).size(), " SPNs");
    echo::info("Filtered decoder, SA 0x25: ", engine_only.decode(0x0CF00425, DataSpan(eec1)).size(), " SPNs");

    return 0;
}
