#pragma once
/**
 * @page bs-packet-builder blesniff Packet Record Builder
 * @file packet_builder.hpp
 * @brief Assemble BlePacket values from metadata plus an advertising-data slice.
 *
 * @details
 * ROLE
 * ----
 * The builder has no decoding logic of its own. It locates the pieces of a packet
 * (addresses, RSSI, channel, the AD slice), hands the AD slice to
 * decode_advertising_data() and merges the result with the metadata.
 *
 * ENTRY POINTS
 * ------------
 *   build_packet()          metadata + AD bytes -> BlePacket
 *   decode_raw()            raw-bytes path; caller picks the byte layout
 *   decode_sniffer_packet() one decoded sniffer frame (from the reassembler) -> BlePacket
 *
 * RETURN CONVENTION
 * -----------------
 * All three return a DecodeStatus and fill the caller's BlePacket:
 *   ok               packet complete
 *   truncated_field  packet usable; AD walk stopped at an element that ran past the end
 *   short_packet     frame too short for its declared layout; packet not usable
 *   not_advertising  frame is a sniffer event other than an advertising PDU
 *   unsupported_pdu  reserved advertising PDU type
 *
 * Use packet_usable() to decide whether to hand the packet on.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "blesniff/advertising.hpp"
#include "blesniff/ble_packet.hpp"

namespace blesniff {

/// Out-of-band facts about a packet that do not come from its AD elements.
struct PacketMeta {
    MacAddress                   mac{};
    std::optional<int16_t>       rssi;
    std::optional<uint8_t>       channel;
    std::optional<SnifferHeader> sniffer;
    std::optional<MacAddress>    peer_mac;
};

/// Byte layouts accepted by decode_raw().
enum class RawLayout : uint8_t {
    ad_only,           ///< bytes are exactly the AD elements
    address_prefixed,  ///< 6 address bytes (over-the-air order) then AD elements
    sniffer_frame      ///< one complete, already unescaped sniffer frame
};

/// True for statuses whose packet should be delivered (ok, truncated_field).
inline bool packet_usable(DecodeStatus s) {
    return s == DecodeStatus::ok || s == DecodeStatus::truncated_field;
}

/// Reverse an over-the-air (LSB first) address into display order.
MacAddress mac_from_air(const uint8_t* p);

/**
 * @brief Combine @p meta with the AD elements at [ad, ad + n).
 *
 * @p out is reset before filling.
 */
DecodeStatus build_packet(const PacketMeta& meta, const uint8_t* ad, size_t n, BlePacket& out);

/**
 * @brief Raw-bytes conversion. No hidden state: same input, same output.
 */
DecodeStatus decode_raw(const uint8_t* p, size_t n, BlePacket& out,
                        RawLayout layout = RawLayout::ad_only);

inline DecodeStatus decode_raw(const std::vector<uint8_t>& bytes, BlePacket& out,
                               RawLayout layout = RawLayout::ad_only) {
    return decode_raw(bytes.data(), bytes.size(), out, layout);
}

/**
 * @brief Decode one unescaped sniffer frame (see sniffer_protocol.hpp for the layout).
 *
 * Advertising PDU types handled:
 *   ADV_IND, ADV_NONCONN_IND, ADV_SCAN_IND, SCAN_RSP  AdvA + AD elements
 *   ADV_DIRECT_IND                                    AdvA + TargetA (peer_mac)
 *   SCAN_REQ                                          ScanA (peer_mac) + AdvA
 *   CONNECT_IND                                       InitA (peer_mac) + AdvA
 *   ADV_EXT_IND                                       metadata only, mac left zero
 *
 * A PDU length byte that claims more bytes than the frame holds gives
 * truncated_field; whatever the frame does hold is still decoded.
 */
DecodeStatus decode_sniffer_packet(const uint8_t* frame, size_t n, BlePacket& out);

/**
 * @brief Parse only the sniffer header fields (offsets 0..21) of a frame.
 *
 * @return false if the frame is shorter than the fixed header.
 */
bool parse_sniffer_header(const uint8_t* frame, size_t n, SnifferHeader& out);

} // namespace blesniff
