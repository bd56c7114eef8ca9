#pragma once
/**
 * @file sniffer_protocol.hpp
 * @brief Constants of the nRF Sniffer for Bluetooth LE UART protocol and the BLE
 *        link-layer advertising PDUs it reports.
 *
 * @details
 * Decoded frame layout (after SLIP unescaping):
 *
 * | Offset | Size | Field                                                  |
 * |--------|------|--------------------------------------------------------|
 * | 0      | 1    | header length, always HEADER_LENGTH (6)                |
 * | 1      | 1    | payload length (bytes after the 6-byte header)         |
 * | 2      | 1    | protocol version                                       |
 * | 3      | 2    | packet counter, little endian                          |
 * | 5      | 1    | packet id (EVENT_PACKET_ADV_PDU, PING_RESP, ...)       |
 * | 6      | 1    | packet-header length (10)                              |
 * | 7      | 1    | flags: CRC ok, aux type / direction, PHY               |
 * | 8      | 1    | channel index                                          |
 * | 9      | 1    | RSSI magnitude; RSSI = -value dBm                      |
 * | 10     | 2    | event counter                                          |
 * | 12     | 4    | timestamp / delta time, microseconds                   |
 * | 16     | 4    | access address                                         |
 * | 20     | 1    | PDU header: type[3:0], ChSel[5], TxAdd[6], RxAdd[7]    |
 * | 21     | 1    | PDU length                                             |
 * | 22     | 1    | padding byte inserted by the firmware                  |
 * | 23     | ...  | PDU payload (AdvA first, least significant octet first)|
 *
 * Reference: Nordic "nRF Sniffer UART protocol" and Bluetooth Core v5.4 Vol 6 Part B §2.
 */

#include <cstddef>
#include <cstdint>

namespace blesniff {

// ---- frame header ----
static constexpr uint8_t HEADER_LENGTH     = 6;
static constexpr size_t  MAX_PAYLOAD_LEN   = 255;
static constexpr size_t  MAX_FRAME_LEN     = HEADER_LENGTH + MAX_PAYLOAD_LEN;

static constexpr uint8_t PROTOVER_V1 = 1;
static constexpr uint8_t PROTOVER_V2 = 2;
static constexpr uint8_t PROTOVER_V3 = 3;

// ---- packet ids ----
enum : uint8_t {
    REQ_FOLLOW                = 0x00,
    EVENT_FOLLOW              = 0x01,
    EVENT_PACKET_ADV_PDU      = 0x02,
    EVENT_CONNECT             = 0x05,
    EVENT_PACKET_DATA_PDU     = 0x06,
    REQ_SCAN_CONT             = 0x07,
    EVENT_DISCONNECT          = 0x09,
    SET_TEMPORARY_KEY         = 0x0C,
    PING_REQ                  = 0x0D,
    PING_RESP                 = 0x0E,
    SWITCH_BAUD_RATE_REQ      = 0x13,
    SWITCH_BAUD_RATE_RESP     = 0x14,
    SET_ADV_CHANNEL_HOP_SEQ   = 0x17,
    SET_PRIVATE_KEY           = 0x18,
    SET_LEGACY_LONG_TERM_KEY  = 0x19,
    SET_SC_LONG_TERM_KEY      = 0x1A,
    REQ_VERSION               = 0x1B,
    RESP_VERSION              = 0x1C,
    REQ_TIMESTAMP             = 0x1D,
    RESP_TIMESTAMP            = 0x1E,
    SET_IDENTITY_RESOLVING_KEY= 0x1F,
    GO_IDLE                   = 0xFE
};

// ---- advertising PDU types (PDU header bits 3:0) ----
enum : uint8_t {
    ADV_TYPE_ADV_IND         = 0x0,
    ADV_TYPE_ADV_DIRECT_IND  = 0x1,
    ADV_TYPE_ADV_NONCONN_IND = 0x2,
    ADV_TYPE_SCAN_REQ        = 0x3,
    ADV_TYPE_SCAN_RSP        = 0x4,
    ADV_TYPE_CONNECT_REQ     = 0x5,
    ADV_TYPE_ADV_SCAN_IND    = 0x6,
    ADV_TYPE_ADV_EXT_IND     = 0x7
};

// ---- PHY (flags bits 6:4) ----
enum : uint8_t { PHY_1M = 0, PHY_2M = 1, PHY_CODED = 2 };

// ---- aux type (advertising flags bits 2:1) ----
enum : uint8_t { AUX_ADV_IND = 0, AUX_CHAIN_IND = 1, AUX_SYNC_IND = 2, AUX_SCAN_RSP = 3 };

// ---- byte offsets inside a decoded frame ----
namespace off {
static constexpr size_t HEADER_LEN     = 0;
static constexpr size_t PAYLOAD_LEN    = 1;
static constexpr size_t PROTOVER       = 2;
static constexpr size_t COUNTER        = 3;
static constexpr size_t PACKET_ID      = 5;
static constexpr size_t PKT_HEADER_LEN = 6;
static constexpr size_t FLAGS          = 7;
static constexpr size_t CHANNEL        = 8;
static constexpr size_t RSSI           = 9;
static constexpr size_t EVENT_COUNTER  = 10;
static constexpr size_t TIMESTAMP      = 12;
static constexpr size_t ACCESS_ADDRESS = 16;
static constexpr size_t PDU_HEADER     = 20;
static constexpr size_t PDU_LENGTH     = 21;
static constexpr size_t PDU_PAYLOAD    = 23;   // after the firmware padding byte
} // namespace off

static constexpr size_t ADDR_LEN = 6;

} // namespace blesniff
