#include <doctest/doctest.h>
#include "blesniff/advertising.hpp"
#include "blesniff/packet_builder.hpp"

#include <string>
#include <vector>

using namespace blesniff;
using Bytes = std::vector<uint8_t>;

TEST_CASE("flags plus complete local name") {
    const Bytes p = {0x02, 0x01, 0x06, 0x09, 0x09, 0x74, 0x65, 0x73, 0x74, 0x6E, 0x61, 0x6D, 0x65};
    BlePacket pkt;
    REQUIRE(decode_raw(p, pkt) == DecodeStatus::ok);

    CHECK(pkt.flags == uint8_t{0x06});
    CHECK(pkt.local_name == std::string("testname"));
    CHECK_FALSE(pkt.tx_power.has_value());
    CHECK_FALSE(pkt.manufacturer_id.has_value());
    CHECK_FALSE(pkt.manufacturer_data.has_value());
    CHECK(pkt.manufacturers.empty());
    CHECK(pkt.raw_fields.empty());
    CHECK_FALSE(pkt.rssi.has_value());
    CHECK_FALSE(pkt.channel.has_value());
    CHECK(pkt.mac == MacAddress{});
    CHECK(pkt.ad_types == Bytes{0x01, 0x09});

    CHECK(pkt.le_general_discoverable());
    CHECK(pkt.br_edr_not_supported());
    CHECK_FALSE(pkt.le_limited_discoverable());
}

TEST_CASE("manufacturer specific data only") {
    const Bytes p = {0x05, 0xFF, 0x4C, 0x00, 0x01, 0x02};
    BlePacket pkt;
    REQUIRE(decode_raw(p, pkt) == DecodeStatus::ok);

    CHECK(pkt.manufacturer_id == uint16_t{0x004C});
    REQUIRE(pkt.manufacturer_data.has_value());
    CHECK(*pkt.manufacturer_data == Bytes{0x01, 0x02});
    CHECK_FALSE(pkt.flags.has_value());
    CHECK_FALSE(pkt.local_name.has_value());
}

TEST_CASE("truncated element keeps the fields decoded before it") {
    const Bytes p = {0x02, 0x01, 0x06, 0x05, 0x09, 0x61, 0x62};
    BlePacket pkt;
    const AdScanResult r = decode_advertising_data(p.data(), p.size(), pkt);

    CHECK(r.status == DecodeStatus::truncated_field);
    CHECK(r.consumed == 3);
    CHECK(r.elements == 1);
    CHECK(pkt.flags == uint8_t{0x06});
    CHECK_FALSE(pkt.local_name.has_value());

    BlePacket via_raw;
    CHECK(decode_raw(p, via_raw) == DecodeStatus::truncated_field);
    CHECK(via_raw == pkt);
}

TEST_CASE("consumed length covers the payload or stops at the first problem") {
    const std::vector<Bytes> payloads = {
        {},
        {0x02, 0x01, 0x06},
        {0x02, 0x01, 0x06, 0x02, 0x0A, 0x00, 0x03, 0x03, 0x0F, 0x18},
        {0x02, 0x01, 0x06, 0x00, 0x00, 0x00},
        {0x02, 0x01, 0x06, 0x10, 0x09},
        {0x01},
    };
    for (const auto& p : payloads) {
        BlePacket pkt;
        const AdScanResult r = decode_advertising_data(p.data(), p.size(), pkt);
        CHECK(r.consumed <= p.size());
        if (r.status == DecodeStatus::ok && !r.end_marker) CHECK(r.consumed == p.size());
    }
}

TEST_CASE("zero length byte ends the walk") {
    const Bytes p = {0x02, 0x01, 0x06, 0x00, 0x03, 0x09, 0x41, 0x42};
    BlePacket pkt;
    const AdScanResult r = decode_advertising_data(p.data(), p.size(), pkt);

    CHECK(r.status == DecodeStatus::ok);
    CHECK(r.end_marker);
    CHECK(r.consumed == 4);
    CHECK(r.elements == 1);
    CHECK_FALSE(pkt.local_name.has_value());   // after the marker: ignored
}

TEST_CASE("repeated elements: last scalar wins, every manufacturer is kept") {
    const Bytes p = {
        0x02, 0x01, 0x02,
        0x03, 0x09, 'A', 'A',
        0x04, 0xFF, 0x59, 0x00, 0xAA,
        0x02, 0x01, 0x1A,
        0x03, 0x09, 'B', 'B',
        0x04, 0xFF, 0x4C, 0x00, 0xBB,
    };
    BlePacket pkt;
    REQUIRE(decode_raw(p, pkt) == DecodeStatus::ok);

    CHECK(pkt.flags == uint8_t{0x1A});
    CHECK(pkt.local_name == std::string("BB"));
    CHECK(pkt.manufacturer_id == uint16_t{0x0059});
    CHECK(*pkt.manufacturer_data == Bytes{0xAA});
    REQUIRE(pkt.manufacturers.size() == 2);
    CHECK(pkt.manufacturers[1].company_id == 0x004C);
    CHECK(pkt.manufacturers[1].data == Bytes{0xBB});
    CHECK(pkt.ad_types == Bytes{0x01, 0x09, 0xFF, 0x01, 0x09, 0xFF});
}

TEST_CASE("unknown types go to raw_fields in order") {
    const Bytes p = {0x03, 0x03, 0x0F, 0x18, 0x02, 0x0A, 0x04, 0x05, 0x16, 0x0F, 0x18, 0x64, 0x00};
    BlePacket pkt;
    REQUIRE(decode_raw(p, pkt) == DecodeStatus::ok);

    CHECK(pkt.tx_power == int8_t{4});
    REQUIRE(pkt.raw_fields.size() == 2);
    CHECK(pkt.raw_fields[0].type == 0x03);
    CHECK(pkt.raw_fields[0].value == Bytes{0x0F, 0x18});
    CHECK(pkt.raw_fields[1].type == 0x16);
    CHECK(pkt.raw_fields[1].value == Bytes{0x0F, 0x18, 0x64, 0x00});
}

TEST_CASE("invalid UTF-8 in the name is repaired, not rejected") {
    const Bytes p = {0x04, 0x09, 'o', 0xC0, 'k'};
    BlePacket pkt;
    REQUIRE(decode_raw(p, pkt) == DecodeStatus::ok);
    CHECK(pkt.local_name == std::string("o\xEF\xBF\xBDk"));
}

TEST_CASE("decoding the same bytes twice gives equal packets") {
    const Bytes p = {0x02, 0x01, 0x06, 0x02, 0x0A, 0xF8, 0x05, 0xFF, 0x4C, 0x00, 0x10, 0x05,
                     0x03, 0x19, 0xC1, 0x03};
    BlePacket a, b;
    CHECK(decode_raw(p, a) == decode_raw(p, b));
    CHECK(a == b);

    b.tx_power = int8_t{0};
    CHECK(a != b);
}

TEST_CASE("values written as AD elements read back unchanged") {
    const std::string name = "Sensor-42";
    const int8_t tx = -20;
    const uint16_t company = 0x0590;
    const Bytes mdata = {0xDE, 0xAD, 0xBE, 0xEF};

    Bytes p = {0x02, AD_FLAGS, 0x05, 0x02, AD_TX_POWER_LEVEL, uint8_t(tx)};
    p.push_back(uint8_t(name.size() + 1));
    p.push_back(AD_COMPLETE_LOCAL_NAME);
    p.insert(p.end(), name.begin(), name.end());
    p.push_back(uint8_t(mdata.size() + 3));
    p.push_back(AD_MANUFACTURER_DATA);
    p.push_back(uint8_t(company & 0xFF));
    p.push_back(uint8_t(company >> 8));
    p.insert(p.end(), mdata.begin(), mdata.end());

    BlePacket pkt;
    REQUIRE(decode_raw(p, pkt) == DecodeStatus::ok);
    CHECK(pkt.flags == uint8_t{0x05});
    CHECK(pkt.tx_power == tx);
    CHECK(pkt.local_name == name);
    CHECK(pkt.manufacturer_id == company);
    CHECK(*pkt.manufacturer_data == mdata);
}
