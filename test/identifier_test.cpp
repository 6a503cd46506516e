#include <doctest/doctest.h>
#include <spnkit/core/constants.hpp>
#include <spnkit/core/identifier.hpp>
#include <spnkit/core/types.hpp>

using namespace spnkit;

TEST_CASE("parse_can_id") {
    SUBCASE("EEC1 broadcast from engine") {
        auto id = parse_can_id(0x0CF00400);
        CHECK(id.priority == Priority::Normal);
        CHECK(!id.reserved);
        CHECK(!id.data_page);
        CHECK(id.pdu_format == 0xF0);
        CHECK(id.pdu_specific == 0x04);
        CHECK(id.source_address == 0x00);
        CHECK(id.pgn() == 61444);
        CHECK(id.is_pdu2());
        CHECK(id.destination_address() == BROADCAST_ADDRESS);
        CHECK(id.is_broadcast());
    }

    SUBCASE("ET1 at default priority") {
        auto id = parse_can_id(0x18FEEE00);
        CHECK(id.priority == Priority::Default);
        CHECK(id.pgn() == 65262);
        CHECK(id.source_address == 0x00);
    }

    SUBCASE("request is destination-specific") {
        auto id = parse_can_id(0x18EA00FE);
        CHECK(id.priority == Priority::Default);
        CHECK(id.pgn() == PGN_REQUEST);
        CHECK(id.pdu_specific == 0x00);
        CHECK(id.destination_address() == 0x00);
        CHECK(id.source_address == 0xFE);
        CHECK(id.is_pdu1());
        CHECK(!id.is_broadcast());
    }

    SUBCASE("PDU1 to global address is broadcast") {
        auto id = parse_can_id(0x18EAFFFE);
        CHECK(id.is_pdu1());
        CHECK(id.destination_address() == BROADCAST_ADDRESS);
        CHECK(id.is_broadcast());
    }

    SUBCASE("bits above 28 are discarded") {
        auto id = parse_can_id(0xE0000000u | 0x0CF00400u);
        CHECK(id == parse_can_id(0x0CF00400));
        CHECK(id.raw() == 0x0CF00400);
    }

    SUBCASE("reserved bit is carried but not part of the PGN") {
        auto id = parse_can_id(0x0EF00400);
        CHECK(id.reserved);
        CHECK(!id.data_page);
        CHECK(id.priority == Priority::Normal);
        CHECK(id.pgn() == 61444);
        CHECK(id.raw() == 0x0EF00400);
    }

    SUBCASE("data page extends the PGN") {
        auto id = parse_can_id(0x19FEF100);
        CHECK(id.data_page);
        CHECK(id.priority == Priority::Default);
        CHECK(id.pgn() == 0x1FEF1);
    }
}

TEST_CASE("PDU1/PDU2 boundary") {
    SUBCASE("PF 239 is PDU1") {
        auto id = parse_can_id(build_can_id(6, 0, 239, 0x42, 0x10));
        CHECK(id.is_pdu1());
        CHECK(id.pgn() == 0xEF00);
        CHECK(id.destination_address() == 0x42);
    }

    SUBCASE("PF 240 is PDU2") {
        auto id = parse_can_id(build_can_id(6, 0, 240, 0x42, 0x10));
        CHECK(id.is_pdu2());
        CHECK(id.pgn() == 0xF042);
        CHECK(id.destination_address() == BROADCAST_ADDRESS);
    }

    SUBCASE("extract_pgn agrees on both sides") {
        CHECK(extract_pgn(build_can_id(6, 0, 239, 0x42, 0x10)) == 0xEF00);
        CHECK(extract_pgn(build_can_id(6, 0, 240, 0x42, 0x10)) == 0xF042);
    }
}

TEST_CASE("build_can_id") {
    SUBCASE("packs fields") {
        CHECK(build_can_id(3, 0, 0xF0, 0x04, 0x00) == 0x0CF00400);
        CHECK(build_can_id(6, 0, 0xEA, 0x00, 0xFE) == 0x18EA00FE);
        CHECK(build_can_id(6, 1, 0xFE, 0xF1, 0x00) == 0x19FEF100);
    }

    SUBCASE("build then parse recovers every field") {
        const u8 priorities[] = {0, 3, 6, 7};
        const u8 formats[] = {0x00, 0xEA, 0xEF, 0xF0, 0xFE, 0xFF};
        for (u8 prio : priorities) {
            for (u8 page = 0; page <= 1; ++page) {
                for (u8 pf : formats) {
                    u32 raw = build_can_id(prio, page, pf, 0x5A, 0xA5);
                    auto id = parse_can_id(raw);
                    CHECK(static_cast<u8>(id.priority) == prio);
                    CHECK(id.data_page == (page == 1));
                    CHECK(id.pdu_format == pf);
                    CHECK(id.pdu_specific == 0x5A);
                    CHECK(id.source_address == 0xA5);
                    PGN expected = (static_cast<u32>(page) << 16) | (static_cast<u32>(pf) << 8);
                    if (pf >= 240) {
                        expected |= 0x5A;
                    }
                    CHECK(id.pgn() == expected);
                    CHECK(build_can_id(id) == raw);
                }
            }
        }
    }

    SUBCASE("out-of-range fields are masked") {
        CHECK(build_can_id(9, 3, 0xF0, 0x04, 0x00) == build_can_id(1, 1, 0xF0, 0x04, 0x00));
        CHECK(is_valid_j1939_id(build_can_id(0xFF, 0xFF, 0xFF, 0xFF, 0xFF)));
    }

    SUBCASE("checked variant rejects out-of-range fields") {
        auto bad_prio = build_can_id_checked(8, 0, 0xF0, 0x04, 0x00);
        REQUIRE(bad_prio.is_err());
        CHECK(bad_prio.error().code == ErrorCode::InvalidField);

        auto bad_page = build_can_id_checked(3, 2, 0xF0, 0x04, 0x00);
        REQUIRE(bad_page.is_err());
        CHECK(bad_page.error().code == ErrorCode::InvalidField);

        auto ok = build_can_id_checked(3, 0, 0xF0, 0x04, 0x00);
        REQUIRE(ok.is_ok());
        CHECK(ok.value() == 0x0CF00400);
    }
}

TEST_CASE("encode_can_id from PGN") {
    SUBCASE("PDU1 puts destination in PS") {
        auto id = encode_can_id(Priority::Default, PGN_REQUEST, 0xFE, 0x00);
        CHECK(id.raw() == 0x18EA00FE);
    }

    SUBCASE("PDU2 ignores destination") {
        auto id = encode_can_id(Priority::Normal, PGN_EEC1, 0x00, 0x25);
        CHECK(id.raw() == 0x0CF00400);
        CHECK(id.pgn() == PGN_EEC1);
    }
}

TEST_CASE("identifier helpers") {
    CHECK(extract_pgn(0x0CF00400) == 61444);
    CHECK(extract_pgn(0x18FEEE00) == 65262);
    CHECK(extract_pgn(0x18EA00FE) == 0xEA00);
    CHECK(extract_source_address(0x0CF00400) == 0x00);
    CHECK(extract_source_address(0x18EA00FE) == 0xFE);
    CHECK(is_valid_j1939_id(0x1FFFFFFF));
    CHECK(!is_valid_j1939_id(0x20000000));
}
