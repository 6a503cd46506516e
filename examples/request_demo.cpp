#include <spnkit.hpp>
#include <echo/echo.hpp>

using namespace spnkit;

int main() {
    echo::info("=== J1939 Request PGN Demo ===");

    // Ask the engine (0x00) for engine hours, from a diagnostic tool at the null address
    auto req = build_request_pgn(NULL_ADDRESS, 0x00, PGN_ENGINE_HOURS);
    echo::info("Request ID: ", req.can_id, " (0x18EA00FE)");
    echo::info("Payload: ", static_cast<int>(req.data[0]), " ", static_cast<int>(req.data[1]), " ",
               static_cast<int>(req.data[2]));

    auto id = parse_can_id(req.can_id);
    echo::info("  PGN: ", id.pgn(), "  priority: ", static_cast<int>(id.priority),
               "  dest: ", static_cast<int>(id.destination_address()));

    if (auto requested = decode_requested_pgn(DataSpan(req.data))) {
        echo::info("  Requested PGN: ", *requested);
        for (const auto *def : get_spns_for_pgn(*requested)) {
            echo::info("    expects SPN ", def->spn, " ", def->name);
        }
    }

    // Global request at a higher priority
    auto global = build_request_pgn(0xF9, BROADCAST_ADDRESS, PGN_VEHICLE_DISTANCE, Priority::Normal);
    echo::info("\nGlobal request ID: ", global.can_id);

    Frame f = global.to_frame();
    echo::info("  Frame length: ", static_cast<int>(f.length), " broadcast: ", f.is_broadcast());

    // Checked identifier builder rejects out-of-range fields
    auto bad = build_can_id_checked(9, 0, 0xEA, 0x00, 0xFE);
    if (bad.is_err()) {
        echo::warn("Rejected identifier: ", bad.error().message);
    }

    return 0;
}
