#include <doctest/doctest.h>
#include <spnkit/core/identifier.hpp>
#include <spnkit/protocol/request.hpp>

using namespace spnkit;

TEST_CASE("build_request_pgn") {
    SUBCASE("engine hours from the engine") {
        auto req = build_request_pgn(0xFE, 0x00, 65253);
        CHECK(req.can_id == 0x18EA00FE);
        CHECK(req.data[0] == 0xE5);
        CHECK(req.data[1] == 0xFE);
        CHECK(req.data[2] == 0x00);
    }

    SUBCASE("identifier fields") {
        auto id = parse_can_id(build_request_pgn(0x21, 0x17, PGN_ET1).can_id);
        CHECK(id.pgn() == PGN_REQUEST);
        CHECK(id.is_pdu1());
        CHECK(id.priority == Priority::Default);
        CHECK(id.destination_address() == 0x17);
        CHECK(id.source_address == 0x21);
    }

    SUBCASE("priority override") {
        auto req = build_request_pgn(0xFE, 0x00, 65253, Priority::Normal);
        CHECK(req.can_id == 0x0CEA00FE);
    }

    SUBCASE("global request") {
        auto req = build_request_pgn(0xFE, BROADCAST_ADDRESS, PGN_CCVS);
        CHECK(req.can_id == 0x18EAFFFE);
        CHECK(parse_can_id(req.can_id).is_broadcast());
    }

    SUBCASE("always three bytes") {
        auto small = build_request_pgn(0xFE, 0x00, 0x000001);
        CHECK(small.data[0] == 0x01);
        CHECK(small.data[1] == 0x00);
        CHECK(small.data[2] == 0x00);

        auto paged = build_request_pgn(0xFE, 0x00, 0x1FEF1);
        CHECK(paged.data[0] == 0xF1);
        CHECK(paged.data[1] == 0xFE);
        CHECK(paged.data[2] == 0x01);
    }
}

TEST_CASE("decode_requested_pgn") {
    auto req = build_request_pgn(0xFE, 0x00, 65253);

    SUBCASE("reads back the requested PGN") {
        auto pgn = decode_requested_pgn(DataSpan(req.data));
        REQUIRE(pgn.has_value());
        CHECK(*pgn == 65253);
    }

    SUBCASE("too short") {
        u8 data[] = {0xE5, 0xFE};
        CHECK(!decode_requested_pgn(DataSpan(data)).has_value());
    }
}

TEST_CASE("RequestFrame::to_frame") {
    auto f = build_request_pgn(0xFE, 0x00, 65253).to_frame();
    CHECK(f.length == 3);
    CHECK(f.pgn() == PGN_REQUEST);
    CHECK(f.source() == 0xFE);
    CHECK(f.destination() == 0x00);
    CHECK(f.data[0] == 0xE5);
    CHECK(f.data[2] == 0x00);
    CHECK(f.data[3] == 0xFF);
}
