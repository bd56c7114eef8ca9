#include <doctest/doctest.h>
#include "blesniff/packet_builder.hpp"
#include "blesniff/sniffer_protocol.hpp"
#include "frames.hpp"

#include <string>

using namespace blesniff;
using namespace testframes;

static const MacAddress ADV_MAC = {0xC0, 0x11, 0x22, 0x33, 0x44, 0x55};

TEST_CASE("ADV_IND frame: metadata plus AD elements") {
    Bytes pdu = adva();
    append(pdu, {0x02, 0x01, 0x06, 0x05, 0xFF, 0x4C, 0x00, 0x01, 0x02});
    const Bytes f = adv_frame(0x40 | ADV_TYPE_ADV_IND, pdu, 38, 60, 0x01 | (PHY_2M << 4));

    BlePacket pkt;
    REQUIRE(decode_sniffer_packet(f.data(), f.size(), pkt) == DecodeStatus::ok);

    CHECK(pkt.mac == ADV_MAC);
    CHECK(pkt.rssi == int16_t{-60});
    CHECK(pkt.channel == uint8_t{38});
    CHECK(pkt.flags == uint8_t{0x06});
    CHECK(pkt.manufacturer_id == uint16_t{0x004C});
    CHECK_FALSE(pkt.peer_mac.has_value());

    REQUIRE(pkt.sniffer.has_value());
    const SnifferHeader& h = *pkt.sniffer;
    CHECK(h.packet_id == EVENT_PACKET_ADV_PDU);
    CHECK(h.packet_counter == 0x0011);
    CHECK(h.crc_ok);
    CHECK(h.phy == PHY_2M);
    CHECK(h.event_counter == 0x1234);
    CHECK(h.timestamp_us == 0x12345678u);
    CHECK(h.access_address == 0x8E89BED6u);
    CHECK(h.pdu_type == ADV_TYPE_ADV_IND);
    CHECK(h.tx_addr_random);
    CHECK_FALSE(h.rx_addr_random);
}

TEST_CASE("SCAN_RSP and ADV_NONCONN_IND carry AdvData too") {
    for (uint8_t type : {uint8_t(ADV_TYPE_SCAN_RSP), uint8_t(ADV_TYPE_ADV_NONCONN_IND),
                         uint8_t(ADV_TYPE_ADV_SCAN_IND)}) {
        Bytes pdu = adva();
        append(pdu, {0x03, 0x09, 'h', 'i'});
        const Bytes f = adv_frame(type, pdu);

        BlePacket pkt;
        REQUIRE(decode_sniffer_packet(f.data(), f.size(), pkt) == DecodeStatus::ok);
        CHECK(pkt.mac == ADV_MAC);
        CHECK(pkt.local_name == std::string("hi"));
    }
}

TEST_CASE("address-only PDUs fill mac and peer_mac") {
    const Bytes other = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06};
    const MacAddress OTHER = {0x06, 0x05, 0x04, 0x03, 0x02, 0x01};
    BlePacket pkt;

    SUBCASE("ADV_DIRECT_IND: AdvA then TargetA") {
        Bytes pdu = adva();
        append(pdu, other);
        const Bytes f = adv_frame(ADV_TYPE_ADV_DIRECT_IND, pdu);
        REQUIRE(decode_sniffer_packet(f.data(), f.size(), pkt) == DecodeStatus::ok);
        CHECK(pkt.mac == ADV_MAC);
        CHECK(pkt.peer_mac == OTHER);
    }
    SUBCASE("SCAN_REQ: ScanA then AdvA") {
        Bytes pdu = other;
        append(pdu, adva());
        const Bytes f = adv_frame(ADV_TYPE_SCAN_REQ, pdu);
        REQUIRE(decode_sniffer_packet(f.data(), f.size(), pkt) == DecodeStatus::ok);
        CHECK(pkt.mac == ADV_MAC);
        CHECK(pkt.peer_mac == OTHER);
        CHECK(pkt.ad_types.empty());
    }
    SUBCASE("CONNECT_IND: InitA, AdvA, LLData") {
        Bytes pdu = other;
        append(pdu, adva());
        append(pdu, Bytes(22, 0x55));
        const Bytes f = adv_frame(ADV_TYPE_CONNECT_REQ, pdu);
        REQUIRE(decode_sniffer_packet(f.data(), f.size(), pkt) == DecodeStatus::ok);
        CHECK(pkt.mac == ADV_MAC);
        CHECK(pkt.peer_mac == OTHER);
    }
}

TEST_CASE("ADV_EXT_IND yields metadata only") {
    const Bytes f = adv_frame(ADV_TYPE_ADV_EXT_IND, {0x01, 0x00, 0x11});
    BlePacket pkt;
    REQUIRE(decode_sniffer_packet(f.data(), f.size(), pkt) == DecodeStatus::ok);
    CHECK(pkt.mac == MacAddress{});
    CHECK(pkt.rssi == int16_t{-60});
    CHECK(pkt.sniffer->pdu_type == ADV_TYPE_ADV_EXT_IND);
    CHECK(pkt.ad_types.empty());
}

TEST_CASE("frames that do not yield a packet") {
    BlePacket pkt;

    SUBCASE("control response") {
        const Bytes f = event_frame(PING_RESP, {0x39, 0x05});
        CHECK(decode_sniffer_packet(f.data(), f.size(), pkt) == DecodeStatus::not_advertising);
    }
    SUBCASE("data channel PDU") {
        Bytes f = adv_frame(0x00, adva());
        f[off::PACKET_ID] = EVENT_PACKET_DATA_PDU;
        CHECK(decode_sniffer_packet(f.data(), f.size(), pkt) == DecodeStatus::not_advertising);
    }
    SUBCASE("frame stops inside the sniffer header") {
        Bytes f = adv_frame(ADV_TYPE_ADV_IND, adva());
        f.resize(20);
        f[off::PAYLOAD_LEN] = uint8_t(f.size() - HEADER_LENGTH);
        CHECK(decode_sniffer_packet(f.data(), f.size(), pkt) == DecodeStatus::short_packet);
    }
    SUBCASE("AdvA cut short") {
        const Bytes f = adv_frame(ADV_TYPE_ADV_IND, {0x55, 0x44, 0x33});
        CHECK(decode_sniffer_packet(f.data(), f.size(), pkt) == DecodeStatus::short_packet);
    }
    SUBCASE("wrong header length byte") {
        Bytes f = adv_frame(ADV_TYPE_ADV_IND, adva());
        f[off::HEADER_LEN] = 5;
        CHECK(decode_sniffer_packet(f.data(), f.size(), pkt) == DecodeStatus::short_packet);
    }
    SUBCASE("reserved PDU type") {
        const Bytes f = adv_frame(0x08, adva());
        CHECK(decode_sniffer_packet(f.data(), f.size(), pkt) == DecodeStatus::unsupported_pdu);
    }
}

TEST_CASE("PDU length beyond the frame is reported as truncated") {
    BlePacket pkt;

    SUBCASE("cut between two AD elements") {
        Bytes pdu = adva();
        append(pdu, {0x02, 0x01, 0x06});
        Bytes f = adv_frame(ADV_TYPE_ADV_IND, pdu);
        f[off::PDU_LENGTH] = 14;

        const DecodeStatus st = decode_sniffer_packet(f.data(), f.size(), pkt);
        CHECK(st == DecodeStatus::truncated_field);
        CHECK(packet_usable(st));
        CHECK(pkt.mac == ADV_MAC);
        CHECK(pkt.flags == uint8_t{0x06});
    }
    SUBCASE("only AdvA present") {
        Bytes f = adv_frame(ADV_TYPE_ADV_IND, adva());
        f[off::PDU_LENGTH] = 37;
        CHECK(decode_sniffer_packet(f.data(), f.size(), pkt) == DecodeStatus::truncated_field);
        CHECK(pkt.mac == ADV_MAC);
    }
    SUBCASE("address-only PDU") {
        Bytes pdu = adva();
        append(pdu, adva());
        Bytes f = adv_frame(ADV_TYPE_ADV_DIRECT_IND, pdu);
        f[off::PDU_LENGTH] = 20;
        CHECK(decode_sniffer_packet(f.data(), f.size(), pkt) == DecodeStatus::truncated_field);
        CHECK(pkt.peer_mac == ADV_MAC);
    }
    SUBCASE("exact length stays ok") {
        Bytes pdu = adva();
        append(pdu, {0x02, 0x01, 0x06});
        const Bytes f = adv_frame(ADV_TYPE_ADV_IND, pdu);
        CHECK(decode_sniffer_packet(f.data(), f.size(), pkt) == DecodeStatus::ok);
    }
}

TEST_CASE("truncated AD element inside a frame is still delivered") {
    Bytes pdu = adva();
    append(pdu, {0x02, 0x01, 0x06, 0x09, 0x09, 'x'});
    const Bytes f = adv_frame(ADV_TYPE_ADV_IND, pdu);

    BlePacket pkt;
    const DecodeStatus st = decode_sniffer_packet(f.data(), f.size(), pkt);
    CHECK(st == DecodeStatus::truncated_field);
    CHECK(packet_usable(st));
    CHECK(pkt.mac == ADV_MAC);
    CHECK(pkt.flags == uint8_t{0x06});
}

TEST_CASE("decode_raw layouts") {
    BlePacket pkt;

    SUBCASE("address prefixed") {
        Bytes p = adva();
        append(p, {0x02, 0x0A, 0x08});
        REQUIRE(decode_raw(p, pkt, RawLayout::address_prefixed) == DecodeStatus::ok);
        CHECK(pkt.mac == ADV_MAC);
        CHECK(pkt.tx_power == int8_t{8});
    }
    SUBCASE("address prefixed, too short for the address") {
        CHECK(decode_raw(Bytes{0x01, 0x02}, pkt, RawLayout::address_prefixed)
              == DecodeStatus::short_packet);
    }
    SUBCASE("sniffer frame") {
        const Bytes f = adv_frame(ADV_TYPE_ADV_IND, adva());
        REQUIRE(decode_raw(f, pkt, RawLayout::sniffer_frame) == DecodeStatus::ok);
        CHECK(pkt.mac == ADV_MAC);
    }
}

TEST_CASE("build_packet merges metadata with AD elements") {
    PacketMeta meta;
    meta.mac = ADV_MAC;
    meta.rssi = int16_t{-71};
    meta.channel = uint8_t{39};
    const Bytes ad = {0x02, 0x01, 0x04};

    BlePacket pkt;
    REQUIRE(build_packet(meta, ad.data(), ad.size(), pkt) == DecodeStatus::ok);
    CHECK(pkt.mac == ADV_MAC);
    CHECK(pkt.rssi == int16_t{-71});
    CHECK(pkt.channel == uint8_t{39});
    CHECK(pkt.flags == uint8_t{0x04});
}

TEST_CASE("describe() prints one key=value line") {
    const Bytes p = {0x02, 0x01, 0x06, 0x09, 0x09, 0x74, 0x65, 0x73, 0x74, 0x6E, 0x61, 0x6D, 0x65,
                     0x05, 0xFF, 0x4C, 0x00, 0x01, 0x02, 0x02, 0x03, 0xAA};
    BlePacket pkt;
    REQUIRE(decode_raw(p, pkt) == DecodeStatus::ok);
    CHECK(describe(pkt) ==
          "mac=00:00:00:00:00:00 flags=0x06 name=testname mfg=0x004c:0102 ad3=aa");
    CHECK(mac_to_string(ADV_MAC) == "C0:11:22:33:44:55");
}

TEST_CASE("describe() keeps an advertised name on one line") {
    const std::string name = "x\nmac=FAKE a=b\\";
    Bytes p = {uint8_t(name.size() + 1), 0x09};
    p.insert(p.end(), name.begin(), name.end());

    BlePacket pkt;
    REQUIRE(decode_raw(p, pkt) == DecodeStatus::ok);
    REQUIRE(pkt.local_name == name);

    const std::string line = describe(pkt);
    CHECK(line.find('\n') == std::string::npos);
    CHECK(line == "mac=00:00:00:00:00:00 name=x\\x0amac\\x3dFAKE\\x20a\\x3db\\x5c");
}
