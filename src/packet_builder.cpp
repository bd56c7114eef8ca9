// ============================================================================
// packet_builder.cpp — implementation for packet_builder.hpp
// For API/overview see the matching .hpp. Frame offsets: sniffer_protocol.hpp.
// ============================================================================

#include "blesniff/packet_builder.hpp"
#include "blesniff/sniffer_protocol.hpp"

#include <algorithm>      // std::min

namespace blesniff {

// Little-endian readers. Callers have already bounds-checked.
static inline uint16_t rd_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (uint16_t(p[1]) << 8));
}

static inline uint32_t rd_u32(const uint8_t* p) {
    return  static_cast<uint32_t>(p[0])        |
           (static_cast<uint32_t>(p[1]) << 8)  |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

MacAddress mac_from_air(const uint8_t* p) {
    MacAddress m{};
    for (size_t i = 0; i < ADDR_LEN; ++i)
        m[ADDR_LEN - 1 - i] = p[i];       // first byte on air is least significant
    return m;
}

DecodeStatus build_packet(const PacketMeta& meta, const uint8_t* ad, size_t n, BlePacket& out) {
    out = BlePacket{};
    out.mac      = meta.mac;
    out.rssi     = meta.rssi;
    out.channel  = meta.channel;
    out.sniffer  = meta.sniffer;
    out.peer_mac = meta.peer_mac;

    if (n == 0) return DecodeStatus::ok;  // nothing advertised; still a valid packet
    return decode_advertising_data(ad, n, out).status;
}

DecodeStatus decode_raw(const uint8_t* p, size_t n, BlePacket& out, RawLayout layout) {
    switch (layout) {
        case RawLayout::ad_only:
            return build_packet(PacketMeta{}, p, n, out);

        case RawLayout::address_prefixed: {
            if (n < ADDR_LEN) { out = BlePacket{}; return DecodeStatus::short_packet; }
            PacketMeta meta;
            meta.mac = mac_from_air(p);
            return build_packet(meta, p + ADDR_LEN, n - ADDR_LEN, out);
        }

        case RawLayout::sniffer_frame:
            return decode_sniffer_packet(p, n, out);
    }
    out = BlePacket{};
    return DecodeStatus::short_packet;
}

bool parse_sniffer_header(const uint8_t* f, size_t n, SnifferHeader& h) {
    h = SnifferHeader{};
    if (n < off::PDU_LENGTH + 1) return false;

    h.protocol_version = f[off::PROTOVER];
    h.packet_counter   = rd_u16(f + off::COUNTER);
    h.packet_id        = f[off::PACKET_ID];

    const uint8_t flags = f[off::FLAGS];
    h.crc_ok = (flags & 0x01) != 0;
    h.phy    = (flags >> 4) & 0x07;
    if (h.packet_id == EVENT_PACKET_ADV_PDU) {
        h.aux_type         = (flags >> 1) & 0x03;
        h.address_resolved = (flags & 0x08) != 0;
    }

    h.event_counter  = rd_u16(f + off::EVENT_COUNTER);
    h.timestamp_us   = rd_u32(f + off::TIMESTAMP);
    h.access_address = rd_u32(f + off::ACCESS_ADDRESS);

    const uint8_t pdu = f[off::PDU_HEADER];
    h.pdu_type       = pdu & 0x0F;
    h.channel_select = (pdu >> 5) & 0x01;
    h.tx_addr_random = (pdu & 0x40) != 0;
    h.rx_addr_random = (pdu & 0x80) != 0;
    return true;
}

// ---------------------------------------------------------------------------
// decode_sniffer_packet()
// Phases:
//   1) validate the transport header and the event id,
//   2) parse sniffer metadata (channel, RSSI, PDU header, ...),
//   3) locate addresses by PDU type,
//   4) walk AD elements for the PDU types that carry AdvData.
// The PDU length byte is trusted only up to the end of the frame. When it claims
// more, the part that is there is decoded and the packet is marked truncated_field.
// ---------------------------------------------------------------------------
DecodeStatus decode_sniffer_packet(const uint8_t* f, size_t n, BlePacket& out) {
    out = BlePacket{};

    // 1) transport header
    if (n < HEADER_LENGTH || f[off::HEADER_LEN] != HEADER_LENGTH)
        return DecodeStatus::short_packet;
    const size_t frame_len = std::min(n, size_t(HEADER_LENGTH) + f[off::PAYLOAD_LEN]);

    if (f[off::PACKET_ID] != EVENT_PACKET_ADV_PDU)
        return DecodeStatus::not_advertising;
    if (frame_len < off::PDU_PAYLOAD)
        return DecodeStatus::short_packet;

    // 2) metadata
    PacketMeta meta;
    SnifferHeader h;
    parse_sniffer_header(f, frame_len, h);
    meta.channel = f[off::CHANNEL];
    meta.rssi    = static_cast<int16_t>(-static_cast<int16_t>(f[off::RSSI]));
    meta.sniffer = h;

    // 3) addresses
    const uint8_t* pdu     = f + off::PDU_PAYLOAD;
    const size_t   avail   = frame_len - off::PDU_PAYLOAD;
    const size_t   pdu_len = std::min<size_t>(f[off::PDU_LENGTH], avail);

    const bool clipped = f[off::PDU_LENGTH] > avail;

    DecodeStatus st = DecodeStatus::ok;
    switch (h.pdu_type) {
        case ADV_TYPE_ADV_IND:
        case ADV_TYPE_ADV_NONCONN_IND:
        case ADV_TYPE_ADV_SCAN_IND:
        case ADV_TYPE_SCAN_RSP:
            if (pdu_len < ADDR_LEN) return DecodeStatus::short_packet;
            meta.mac = mac_from_air(pdu);
            // 4) AdvData follows AdvA
            st = build_packet(meta, pdu + ADDR_LEN, pdu_len - ADDR_LEN, out);
            break;

        case ADV_TYPE_ADV_DIRECT_IND:           // AdvA, TargetA
            if (pdu_len < 2 * ADDR_LEN) return DecodeStatus::short_packet;
            meta.mac      = mac_from_air(pdu);
            meta.peer_mac = mac_from_air(pdu + ADDR_LEN);
            st = build_packet(meta, nullptr, 0, out);
            break;

        case ADV_TYPE_SCAN_REQ:                 // ScanA, AdvA
        case ADV_TYPE_CONNECT_REQ:              // InitA, AdvA, LLData
            if (pdu_len < 2 * ADDR_LEN) return DecodeStatus::short_packet;
            meta.peer_mac = mac_from_air(pdu);
            meta.mac      = mac_from_air(pdu + ADDR_LEN);
            st = build_packet(meta, nullptr, 0, out);
            break;

        case ADV_TYPE_ADV_EXT_IND:
            // Common extended header is not decoded; deliver the metadata.
            st = build_packet(meta, nullptr, 0, out);
            break;

        default:
            return DecodeStatus::unsupported_pdu;
    }

    if (clipped && st == DecodeStatus::ok) st = DecodeStatus::truncated_field;
    return st;
}

} // namespace blesniff
