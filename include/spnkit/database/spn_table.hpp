#pragma once

// ─── Built-in SPN table (SAE J1939-71) ───────────────────────────────────────
// Common engine and generator parameters. Entries are grouped by PGN and the
// order inside a group is the order the frame decoder reports them in.
//
// Total entries: 71
// ─────────────────────────────────────────────────────────────────────────────

#include "../pgn_defs.hpp"
#include "spn_definition.hpp"

namespace spnkit::database {

    inline constexpr SpnDefinition BUILTIN_SPN_TABLE[] = {
        // ─── Electronic Engine Controller 1 (EEC1), PGN 61444 ────────────────────────
        make_spn(899, "engine_torque_mode", PGN_EEC1, 0, 0, 4, 1.0, 0.0, ""),
        make_spn(4154, "actual_engine_retarder_percent", PGN_EEC1, 1, 0, 8, 1.0, -125.0, "%"),
        make_spn(512, "drivers_demand_engine_percent", PGN_EEC1, 1, 0, 8, 1.0, -125.0, "%"),
        make_spn(513, "actual_engine_percent_torque", PGN_EEC1, 2, 0, 8, 1.0, -125.0, "%"),
        make_spn(190, "engine_speed", PGN_EEC1, 3, 0, 16, 0.125, 0.0, "RPM"),
        make_spn(1483, "eec1_source_address", PGN_EEC1, 5, 0, 8, 1.0, 0.0, ""),
        make_spn(1675, "engine_starter_mode", PGN_EEC1, 6, 0, 4, 1.0, 0.0, ""),
        make_spn(2432, "engine_demand_percent_torque", PGN_EEC1, 7, 0, 8, 1.0, -125.0, "%"),

        // ─── Electronic Engine Controller 2 (EEC2), PGN 61443 ────────────────────────
        make_spn(558, "accelerator_pedal_1_low_switch", PGN_EEC2, 0, 0, 2, 1.0, 0.0, ""),
        make_spn(559, "accelerator_pedal_kickdown", PGN_EEC2, 0, 2, 2, 1.0, 0.0, ""),
        make_spn(1437, "road_speed_limit_status", PGN_EEC2, 0, 4, 2, 1.0, 0.0, ""),
        make_spn(2970, "accelerator_pedal_2_low_switch", PGN_EEC2, 0, 6, 2, 1.0, 0.0, ""),
        make_spn(91, "accelerator_pedal_position_1", PGN_EEC2, 1, 0, 8, 0.4, 0.0, "%"),
        make_spn(92, "percent_load_current_speed", PGN_EEC2, 2, 0, 8, 1.0, 0.0, "%"),
        make_spn(974, "remote_accelerator_position", PGN_EEC2, 3, 0, 8, 0.4, 0.0, "%"),
        make_spn(29, "accelerator_pedal_position_2", PGN_EEC2, 4, 0, 8, 0.4, 0.0, "%"),
        make_spn(2979, "vehicle_acceleration_rate_limit", PGN_EEC2, 5, 0, 8, 1.0, 0.0, ""),
        make_spn(5021, "momentary_engine_max_power_enable", PGN_EEC2, 6, 0, 2, 1.0, 0.0, ""),

        // ─── Electronic Engine Controller 3 (EEC3), PGN 65247 ────────────────────────
        make_spn(514, "nominal_friction_percent_torque", PGN_EEC3, 0, 0, 8, 1.0, -125.0, "%"),
        make_spn(515, "engine_desired_operating_speed", PGN_EEC3, 1, 0, 16, 0.125, 0.0, "RPM"),
        make_spn(519, "engine_operating_speed_asymmetry_adjust", PGN_EEC3, 3, 0, 8, 1.0, 0.0, ""),
        make_spn(2978, "estimated_engine_parasitic_losses", PGN_EEC3, 4, 0, 8, 1.0, -125.0, "%"),
        make_spn(6595, "aftertreatment_1_exhaust_gas_mass_flow", PGN_EEC3, 5, 0, 16, 0.2, 0.0, "kg/h"),

        // ─── Engine Temperature 1 (ET1), PGN 65262 ───────────────────────────────────
        make_spn(110, "engine_coolant_temperature", PGN_ET1, 0, 0, 8, 1.0, -40.0, "C"),
        make_spn(174, "fuel_temperature", PGN_ET1, 1, 0, 8, 1.0, -40.0, "C"),
        make_spn(175, "engine_oil_temperature_1", PGN_ET1, 2, 0, 16, 0.03125, -273.0, "C"),
        make_spn(176, "turbo_oil_temperature", PGN_ET1, 4, 0, 16, 0.03125, -273.0, "C"),
        make_spn(52, "engine_intercooler_temperature", PGN_ET1, 6, 0, 8, 1.0, -40.0, "C"),
        make_spn(1134, "engine_intercooler_thermostat_opening", PGN_ET1, 7, 0, 8, 0.4, 0.0, "%"),

        // ─── Engine Fluid Level/Pressure 1 (EFL/P1), PGN 65263 ───────────────────────
        make_spn(94, "fuel_delivery_pressure", PGN_EFLP1, 0, 0, 8, 4.0, 0.0, "kPa"),
        make_spn(22, "extended_crankcase_blowby_pressure", PGN_EFLP1, 1, 0, 8, 0.05, 0.0, "kPa"),
        make_spn(98, "engine_oil_level", PGN_EFLP1, 2, 0, 8, 0.4, 0.0, "%"),
        make_spn(100, "engine_oil_pressure", PGN_EFLP1, 3, 0, 8, 4.0, 0.0, "kPa"),
        make_spn(101, "crankcase_pressure", PGN_EFLP1, 4, 0, 16, 0.0078125, -250.0, "kPa"),
        make_spn(109, "coolant_pressure", PGN_EFLP1, 6, 0, 8, 2.0, 0.0, "kPa"),
        make_spn(111, "coolant_level", PGN_EFLP1, 7, 0, 8, 0.4, 0.0, "%"),

        // ─── Inlet/Exhaust Conditions 1 (IC1), PGN 65270 ─────────────────────────────
        make_spn(81, "particulate_trap_inlet_pressure", PGN_IC1, 0, 0, 8, 0.5, 0.0, "kPa"),
        make_spn(102, "boost_pressure", PGN_IC1, 1, 0, 8, 2.0, 0.0, "kPa"),
        make_spn(105, "intake_manifold_temperature", PGN_IC1, 2, 0, 8, 1.0, -40.0, "C"),
        make_spn(106, "air_inlet_pressure", PGN_IC1, 3, 0, 8, 2.0, 0.0, "kPa"),
        make_spn(107, "air_filter_differential_pressure", PGN_IC1, 4, 0, 8, 0.05, 0.0, "kPa"),
        make_spn(173, "exhaust_gas_temperature", PGN_IC1, 5, 0, 16, 0.03125, -273.0, "C"),
        make_spn(112, "coolant_filter_differential_pressure", PGN_IC1, 7, 0, 8, 0.5, 0.0, "kPa"),

        // ─── Vehicle Electrical Power 1 (VEP1), PGN 65271 ────────────────────────────
        make_spn(114, "net_battery_current", PGN_VEP1, 0, 0, 16, 1.0, -125.0, "A"),
        make_spn(115, "alternator_current", PGN_VEP1, 2, 0, 16, 1.0, 0.0, "A"),
        make_spn(168, "battery_potential", PGN_VEP1, 4, 0, 16, 0.05, 0.0, "V"),
        make_spn(158, "keyswitch_battery_potential", PGN_VEP1, 6, 0, 16, 0.05, 0.0, "V"),

        // ─── Ambient Conditions (AMB), PGN 65269 ─────────────────────────────────────
        make_spn(108, "barometric_pressure", PGN_AMBIENT_CONDITIONS, 0, 0, 8, 0.5, 0.0, "kPa"),
        make_spn(170, "cab_interior_temperature", PGN_AMBIENT_CONDITIONS, 1, 0, 16, 0.03125, -273.0, "C"),
        make_spn(171, "ambient_air_temperature", PGN_AMBIENT_CONDITIONS, 3, 0, 16, 0.03125, -273.0, "C"),
        make_spn(172, "air_inlet_temperature", PGN_AMBIENT_CONDITIONS, 5, 0, 8, 1.0, -40.0, "C"),
        make_spn(79, "road_surface_temperature", PGN_AMBIENT_CONDITIONS, 6, 0, 16, 0.03125, -273.0, "C"),

        // ─── Fuel Economy (LFE), PGN 65266 ───────────────────────────────────────────
        make_spn(183, "fuel_rate", PGN_FUEL_ECONOMY, 0, 0, 16, 0.05, 0.0, "L/h"),
        make_spn(184, "instantaneous_fuel_economy", PGN_FUEL_ECONOMY, 2, 0, 16, 0.001953125, 0.0, "km/L"),
        make_spn(185, "average_fuel_economy", PGN_FUEL_ECONOMY, 4, 0, 16, 0.001953125, 0.0, "km/L"),
        make_spn(51, "throttle_position", PGN_FUEL_ECONOMY, 6, 0, 8, 0.4, 0.0, "%"),

        // ─── Engine Hours, Revolutions (HOURS), PGN 65253 ────────────────────────────
        make_spn(247, "engine_total_hours_of_operation", PGN_ENGINE_HOURS, 0, 0, 32, 0.05, 0.0, "h"),
        make_spn(249, "engine_total_revolutions", PGN_ENGINE_HOURS, 4, 0, 32, 1000.0, 0.0, "r"),

        // ─── Fuel Consumption (LFC), PGN 65257 ───────────────────────────────────────
        make_spn(182, "engine_trip_fuel", PGN_FUEL_CONSUMPTION, 0, 0, 32, 0.5, 0.0, "L"),
        make_spn(250, "engine_total_fuel_used", PGN_FUEL_CONSUMPTION, 4, 0, 32, 0.5, 0.0, "L"),

        // ─── Vehicle Hours (VH), PGN 65217 ───────────────────────────────────────────
        make_spn(246, "engine_total_idle_hours", PGN_VEHICLE_HOURS, 0, 0, 32, 0.05, 0.0, "h"),
        make_spn(248, "engine_total_pto_hours", PGN_VEHICLE_HOURS, 4, 0, 32, 0.05, 0.0, "h"),

        // ─── Vehicle Distance (VD), PGN 65248 ────────────────────────────────────────
        make_spn(244, "trip_distance", PGN_VEHICLE_DISTANCE, 0, 0, 32, 0.125, 0.0, "km"),
        make_spn(245, "total_vehicle_distance", PGN_VEHICLE_DISTANCE, 4, 0, 32, 0.125, 0.0, "km"),

        // ─── Cruise Control/Vehicle Speed (CCVS), PGN 65265 ──────────────────────────
        make_spn(69, "two_speed_axle_switch", PGN_CCVS, 0, 0, 2, 1.0, 0.0, ""),
        make_spn(70, "parking_brake_switch", PGN_CCVS, 0, 2, 2, 1.0, 0.0, ""),
        make_spn(84, "wheel_based_vehicle_speed", PGN_CCVS, 1, 0, 16, 0.00390625, 0.0, "km/h"),
        make_spn(595, "cruise_control_active", PGN_CCVS, 3, 0, 2, 1.0, 0.0, ""),
        make_spn(596, "cruise_control_enable_switch", PGN_CCVS, 3, 2, 2, 1.0, 0.0, ""),
        make_spn(86, "cruise_control_set_speed", PGN_CCVS, 5, 0, 8, 1.0, 0.0, "km/h"),
        make_spn(976, "pto_state", PGN_CCVS, 6, 0, 5, 1.0, 0.0, ""),
    };

    inline constexpr usize BUILTIN_SPN_TABLE_SIZE = sizeof(BUILTIN_SPN_TABLE) / sizeof(BUILTIN_SPN_TABLE[0]);

    static_assert(definitions_are_valid(BUILTIN_SPN_TABLE, BUILTIN_SPN_TABLE_SIZE),
                  "BUILTIN_SPN_TABLE has a malformed, unnamed or duplicate entry");

} // namespace spnkit::database
