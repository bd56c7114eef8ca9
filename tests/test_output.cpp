#include <doctest/doctest.h>
#include "output.hpp"
#include "blesniff/packet_builder.hpp"
#include "frames.hpp"

#include <string>

using namespace blesniff;
using namespace testframes;
using json = nlohmann::json;

TEST_CASE("from_hex accepts common spellings") {
    Bytes out;
    const Bytes expect = {0x02, 0x01, 0x06};

    for (const char* s : {"020106", "0x020106", "02 01 06", "02:01:06", "02-01-06",
                          "  02\t01 06\r\n", "0X02 01 06"}) {
        CAPTURE(s);
        REQUIRE(from_hex(s, out));
        CHECK(out == expect);
    }

    REQUIRE(from_hex("aBcD", out));
    CHECK(out == Bytes{0xAB, 0xCD});

    REQUIRE(from_hex("", out));
    CHECK(out.empty());
}

TEST_CASE("from_hex rejects odd digit counts and stray characters") {
    Bytes out;
    CHECK_FALSE(from_hex("021", out));
    CHECK_FALSE(from_hex("02 0g", out));
    CHECK_FALSE(from_hex("02,01", out));
}

TEST_CASE("output format names") {
    OutputFormat f = OutputFormat::pretty;
    CHECK(parse_format("json", f));
    CHECK(f == OutputFormat::json);
    CHECK(parse_format("raw", f));
    CHECK(f == OutputFormat::raw);
    CHECK_FALSE(parse_format("JSON", f));
    CHECK(f == OutputFormat::raw);
}

TEST_CASE("json rendering of a raw AdvData payload") {
    const Bytes p = {0x02, 0x01, 0x06, 0x09, 0x09, 't', 'e', 's', 't', 'n', 'a', 'm', 'e'};
    BlePacket pkt;
    REQUIRE(decode_raw(p, pkt) == DecodeStatus::ok);

    const json j = json::parse(format_packet(pkt, DecodeStatus::ok, p.data(), p.size(),
                                             OutputFormat::json, Ansi{}));
    CHECK(j["mac"] == "00:00:00:00:00:00");
    CHECK(j["flags"] == 6);
    CHECK(j["local_name"] == "testname");
    CHECK(j["tx_power"].is_null());
    CHECK(j["rssi"].is_null());
    CHECK(j["manufacturer_id"].is_null());
    CHECK(j["manufacturers"].empty());
    CHECK(j["raw_fields"].empty());
    CHECK(j["sniffer"].is_null());
    CHECK(j["ad_types"] == json::array({1, 9}));
    CHECK(j["status"] == "ok");
}

TEST_CASE("json rendering of a sniffer packet") {
    Bytes pdu = adva();
    append(pdu, {0x05, 0xFF, 0x4C, 0x00, 0x01, 0x02, 0x02, 0x03, 0xAA});
    const Bytes f = adv_frame(0x40 | ADV_TYPE_ADV_IND, pdu);

    BlePacket pkt;
    REQUIRE(decode_sniffer_packet(f.data(), f.size(), pkt) == DecodeStatus::ok);
    const json j = json::parse(format_packet(pkt, DecodeStatus::ok, f.data(), f.size(),
                                             OutputFormat::json, Ansi{}));

    CHECK(j["mac"] == "C0:11:22:33:44:55");
    CHECK(j["rssi"] == -60);
    CHECK(j["channel"] == 37);
    CHECK(j["manufacturer_id"] == 0x004C);
    CHECK(j["manufacturer_data"] == "0102");
    REQUIRE(j["manufacturers"].size() == 1);
    CHECK(j["manufacturers"][0]["data"] == "0102");
    REQUIRE(j["raw_fields"].size() == 1);
    CHECK(j["raw_fields"][0]["type"] == 3);
    CHECK(j["raw_fields"][0]["value"] == "aa");
    CHECK(j["sniffer"]["access_address"] == 0x8E89BED6u);
    CHECK(j["sniffer"]["tx_addr_random"] == true);
}

TEST_CASE("raw rendering prints the input bytes") {
    const Bytes p = {0x02, 0x01, 0x06};
    BlePacket pkt;
    REQUIRE(decode_raw(p, pkt) == DecodeStatus::ok);
    CHECK(format_packet(pkt, DecodeStatus::ok, p.data(), p.size(), OutputFormat::raw, Ansi{})
          == "020106");
}

TEST_CASE("pretty rendering appends a non-ok status") {
    const Bytes p = {0x02, 0x01, 0x06, 0x05, 0x09, 0x61, 0x62};
    BlePacket pkt;
    const DecodeStatus st = decode_raw(p, pkt);
    REQUIRE(st == DecodeStatus::truncated_field);

    CHECK(format_packet(pkt, st, p.data(), p.size(), OutputFormat::pretty, Ansi{})
          == "mac=00:00:00:00:00:00 flags=0x06 status=truncated_field");

    Ansi color;
    color.enabled = true;
    const std::string line = format_packet(pkt, st, p.data(), p.size(), OutputFormat::pretty, color);
    CHECK(line.find("\033[1m00:00:00:00:00:00\033[0m") != std::string::npos);
    CHECK(line.find("\033[31mstatus=truncated_field\033[0m") != std::string::npos);
}
