// ============================================================================
// ble_packet.cpp — implementation for ble_packet.hpp
// Equality, MAC/hex formatting and the one-line describe() summary.
// ============================================================================

#include "blesniff/ble_packet.hpp"

#include <iomanip>        // std::setw, std::setfill, std::hex
#include <sstream>        // std::ostringstream for describe()

namespace blesniff {

bool operator==(const SnifferHeader& a, const SnifferHeader& b) {
    return a.protocol_version == b.protocol_version
        && a.packet_counter   == b.packet_counter
        && a.packet_id        == b.packet_id
        && a.crc_ok           == b.crc_ok
        && a.phy              == b.phy
        && a.aux_type         == b.aux_type
        && a.address_resolved == b.address_resolved
        && a.event_counter    == b.event_counter
        && a.timestamp_us     == b.timestamp_us
        && a.access_address   == b.access_address
        && a.pdu_type         == b.pdu_type
        && a.channel_select   == b.channel_select
        && a.tx_addr_random   == b.tx_addr_random
        && a.rx_addr_random   == b.rx_addr_random;
}

bool operator==(const ManufacturerData& a, const ManufacturerData& b) {
    return a.company_id == b.company_id && a.data == b.data;
}

bool operator==(const RawField& a, const RawField& b) {
    return a.type == b.type && a.value == b.value;
}

bool operator==(const BlePacket& a, const BlePacket& b) {
    return a.mac == b.mac
        && a.flags == b.flags
        && a.tx_power == b.tx_power
        && a.local_name == b.local_name
        && a.manufacturer_id == b.manufacturer_id
        && a.manufacturer_data == b.manufacturer_data
        && a.manufacturers == b.manufacturers
        && a.raw_fields == b.raw_fields
        && a.ad_types == b.ad_types
        && a.rssi == b.rssi
        && a.channel == b.channel
        && a.sniffer == b.sniffer
        && a.peer_mac == b.peer_mac;
}

std::string mac_to_string(const MacAddress& mac) {
    static const char* HEX = "0123456789ABCDEF";
    std::string s;
    s.reserve(17);
    for (size_t i = 0; i < mac.size(); ++i) {
        if (i) s.push_back(':');
        s.push_back(HEX[mac[i] >> 4]);
        s.push_back(HEX[mac[i] & 0x0F]);
    }
    return s;
}

std::string to_hex(const uint8_t* p, size_t n) {
    static const char* HEX = "0123456789abcdef";
    std::string s;
    s.reserve(n * 2);
    for (size_t i = 0; i < n; ++i) {
        s.push_back(HEX[p[i] >> 4]);
        s.push_back(HEX[p[i] & 0x0F]);
    }
    return s;
}

// ---------------------------------------------------------------------------
// Keep over-the-air text on one line and one token: control bytes, space, '='
// and '\\' become \xHH. UTF-8 sequences pass through unchanged.
// ---------------------------------------------------------------------------
static std::string escape_value(const std::string& in) {
    static const char* HEX = "0123456789abcdef";
    std::string out;
    out.reserve(in.size());
    for (char ch : in) {
        const auto c = static_cast<unsigned char>(ch);
        if (c < 0x20 || c == 0x7F || c == ' ' || c == '=' || c == '\\') {
            out += "\\x";
            out.push_back(HEX[c >> 4]);
            out.push_back(HEX[c & 0x0F]);
        } else {
            out.push_back(ch);
        }
    }
    return out;
}

// ============================================================================
// describe()
// ---------------------------------------------------------------------------
// Same spirit as a status line: key=value pairs, space separated, stable key
// names so shell scripts can grep/awk them. Optional fields are omitted when
// empty rather than printed as "none".
// ============================================================================
std::string describe(const BlePacket& pkt) {
    std::ostringstream os;

    os << "mac=" << mac_to_string(pkt.mac);
    if (pkt.rssi)    os << " rssi=" << *pkt.rssi;
    if (pkt.channel) os << " chan=" << unsigned(*pkt.channel);

    if (pkt.sniffer) {
        os << " pdu=" << unsigned(pkt.sniffer->pdu_type)
           << " crc=" << (pkt.sniffer->crc_ok ? "ok" : "bad");
    }
    if (pkt.peer_mac) os << " peer=" << mac_to_string(*pkt.peer_mac);

    if (pkt.flags) {
        os << " flags=0x" << std::hex << std::setw(2) << std::setfill('0')
           << unsigned(*pkt.flags) << std::dec;
    }
    if (pkt.tx_power)   os << " tx_power=" << int(*pkt.tx_power);
    if (pkt.local_name) os << " name=" << escape_value(*pkt.local_name);

    for (const auto& m : pkt.manufacturers) {
        os << " mfg=0x" << std::hex << std::setw(4) << std::setfill('0')
           << m.company_id << std::dec << ":" << to_hex(m.data);
    }
    for (const auto& r : pkt.raw_fields) {
        os << " ad" << unsigned(r.type) << "=" << to_hex(r.value);
    }
    return os.str();
}

} // namespace blesniff
