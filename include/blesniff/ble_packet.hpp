#pragma once
/**
 * @page bs-ble-packet blesniff BlePacket
 * @file ble_packet.hpp
 * @brief Public result type: one decoded BLE advertising packet plus sniffer metadata.
 *
 * @details
 * A BlePacket is built once per received packet by the record builder
 * (packet_builder.hpp) and handed to the caller by value. Nothing in the library keeps
 * a reference to it afterwards.
 *
 * FIELD ACCOUNTING
 * ----------------
 * Every AD element found in the payload shows up exactly once:
 *   - Flags, Tx Power, Complete Local Name  -> the matching optional (last one wins)
 *   - Manufacturer Specific Data            -> one entry in `manufacturers` (all kept);
 *                                              the first also fills manufacturer_id/_data
 *   - anything else                         -> `raw_fields`, in encounter order
 * `ad_types` lists the type code of every element in the order seen.
 *
 * MAC ORDER
 * ---------
 * Addresses travel least significant octet first. `mac` is stored the way people write
 * it: mac[0] is the most significant octet, so mac_to_string() prints it left to right.
 */

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "blesniff/ad_field.hpp"

namespace blesniff {

using MacAddress = std::array<uint8_t, 6>;

/**
 * @brief Per-packet metadata reported by the nRF sniffer firmware.
 *
 * Offsets refer to the decoded UART frame (see sniffer_protocol.hpp).
 */
struct SnifferHeader {
    uint8_t  protocol_version = 0;   ///< UART protocol version (frame byte 2)
    uint16_t packet_counter   = 0;   ///< firmware packet counter
    uint8_t  packet_id        = 0;   ///< event id, e.g. EVENT_PACKET_ADV_PDU
    bool     crc_ok           = false;
    uint8_t  phy              = 0;   ///< PHY_1M / PHY_2M / PHY_CODED
    uint8_t  aux_type         = 0;   ///< advertising events: AUX_ADV_IND ... AUX_SCAN_RSP
    bool     address_resolved = false;
    uint16_t event_counter    = 0;
    uint32_t timestamp_us     = 0;   ///< delta time / timestamp in microseconds
    uint32_t access_address   = 0;
    uint8_t  pdu_type         = 0;   ///< ADV_TYPE_*
    uint8_t  channel_select   = 0;   ///< ChSel bit
    bool     tx_addr_random   = false;
    bool     rx_addr_random   = false;
};

bool operator==(const SnifferHeader& a, const SnifferHeader& b);
inline bool operator!=(const SnifferHeader& a, const SnifferHeader& b) { return !(a == b); }

bool operator==(const ManufacturerData& a, const ManufacturerData& b);
bool operator==(const RawField& a, const RawField& b);

/**
 * @struct BlePacket
 * @brief One decoded advertising packet.
 */
struct BlePacket {
    MacAddress mac{};                                   ///< advertiser address, display order

    std::optional<uint8_t>              flags;
    std::optional<int8_t>               tx_power;
    std::optional<std::string>          local_name;
    std::optional<uint16_t>             manufacturer_id;    ///< first Manufacturer Specific Data
    std::optional<std::vector<uint8_t>> manufacturer_data;  ///< first Manufacturer Specific Data
    std::vector<ManufacturerData>       manufacturers;      ///< every occurrence, in order
    std::vector<RawField>               raw_fields;         ///< undecoded AD types, in order
    std::vector<uint8_t>                ad_types;           ///< every AD type seen, in order

    std::optional<int16_t>       rssi;      ///< dBm
    std::optional<uint8_t>       channel;   ///< BLE channel index
    std::optional<SnifferHeader>  sniffer;  ///< present when decoded from a sniffer frame
    std::optional<MacAddress>    peer_mac;  ///< ScanA / InitA / TargetA when the PDU has one

    // AD Flags bits (Core Spec Supplement, part A, 1.3). False when flags is empty.
    bool le_limited_discoverable() const { return flags && (*flags & 0x01); }
    bool le_general_discoverable() const { return flags && (*flags & 0x02); }
    bool br_edr_not_supported() const    { return flags && (*flags & 0x04); }
    bool simultaneous_controller() const { return flags && (*flags & 0x08); }
    bool simultaneous_host() const       { return flags && (*flags & 0x10); }
};

bool operator==(const BlePacket& a, const BlePacket& b);
inline bool operator!=(const BlePacket& a, const BlePacket& b) { return !(a == b); }

/// "AA:BB:CC:DD:EE:FF", uppercase hex.
std::string mac_to_string(const MacAddress& mac);

/// Lowercase hex without separators, e.g. "4c000102".
std::string to_hex(const uint8_t* p, size_t n);
inline std::string to_hex(const std::vector<uint8_t>& v) { return to_hex(v.data(), v.size()); }

/**
 * @brief One-line, grep-friendly summary.
 *
 * Output example:
 *   "mac=C0:11:22:33:44:55 rssi=-60 chan=37 flags=0x06 name=testname mfg=0x004c:0102"
 *
 * Unknown AD types are printed as "ad<type>=<hex>". In the name, control bytes,
 * space, '=' and backslash are written as \xHH so the line stays one token per key.
 */
std::string describe(const BlePacket& pkt);

} // namespace blesniff
