#pragma once

#include "core/types.hpp"

namespace spnkit {

    // ═════════════════════════════════════════════════════════════════════════════
    // PGN DEFINITIONS
    //
    // Every parameter group the built-in SPN table covers, plus the J1939-21
    // protocol PGNs the library builds frames for.
    // ═════════════════════════════════════════════════════════════════════════════

    // ─── Core Protocol (J1939-21) ────────────────────────────────────────────────
    inline constexpr PGN PGN_REQUEST = 0xEA00; // 59904

    // ─── Engine (J1939-71) ───────────────────────────────────────────────────────
    inline constexpr PGN PGN_EEC1 = 0xF004;                // 61444, 10-100ms
    inline constexpr PGN PGN_EEC2 = 0xF003;                // 61443, 50ms
    inline constexpr PGN PGN_EEC3 = 0xFEDF;                // 65247, 250ms
    inline constexpr PGN PGN_ET1 = 0xFEEE;                 // 65262, 1s
    inline constexpr PGN PGN_EFLP1 = 0xFEEF;               // 65263, 500ms
    inline constexpr PGN PGN_IC1 = 0xFEF6;                 // 65270, 500ms
    inline constexpr PGN PGN_ENGINE_HOURS = 0xFEE5;        // 65253, on request
    inline constexpr PGN PGN_FUEL_ECONOMY = 0xFEF2;        // 65266, 100ms
    inline constexpr PGN PGN_FUEL_CONSUMPTION = 0xFEE9;    // 65257, 1s
    inline constexpr PGN PGN_VEHICLE_HOURS = 0xFEC1;       // 65217, 1s

    // ─── Vehicle (J1939-71) ──────────────────────────────────────────────────────
    inline constexpr PGN PGN_VEP1 = 0xFEF7;                // 65271, 1s
    inline constexpr PGN PGN_AMBIENT_CONDITIONS = 0xFEF5;  // 65269, 1s
    inline constexpr PGN PGN_VEHICLE_DISTANCE = 0xFEE0;    // 65248, 1s
    inline constexpr PGN PGN_CCVS = 0xFEF1;                // 65265, 100ms

} // namespace spnkit
