#pragma once
/**
 * @page bs-ad-field blesniff AD Field Decoder
 * @file ad_field.hpp
 * @brief Decode one Advertising Data element (length, type, value) into a typed field.
 *
 * @details
 * OVERVIEW
 * --------
 * BLE advertising payloads are a flat run of AD structures:
 *
 *   [len][type][value ... (len-1 bytes)] [len][type][value ...] ...
 *
 * The length byte counts the type byte plus the value. This header decodes ONE such
 * element. The payload walker (advertising.hpp) calls it repeatedly.
 *
 * SUPPORTED TYPES
 * ---------------
 *   0x01  Flags                       -> one byte
 *   0x09  Complete Local Name         -> UTF-8 text, invalid sequences replaced by U+FFFD
 *   0x0A  Tx Power Level              -> signed byte (dBm)
 *   0xFF  Manufacturer Specific Data  -> u16 company id (little endian) + remaining bytes
 *
 * Every other type code comes back as an opaque (type, value) pair. A known type whose
 * value is too short to decode (e.g. Flags with no value byte) is also returned opaque,
 * so nothing that was on the air is lost.
 *
 * ERRORS
 * ------
 * - Declared length larger than the bytes left: DecodeStatus::truncated_field.
 * - Length byte of zero: not an error. It is the end-of-data padding some sniffer
 *   firmware appends; the element kind is FieldKind::end_of_data and one byte is consumed.
 *
 * The decoder is a pure function of its input: no allocation outside the returned
 * field, no globals, no logging.
 */

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace blesniff {

/**
 * @name AD type codes (Bluetooth Assigned Numbers, "Common Data Types")
 * @{
 */
enum : uint8_t {
    AD_FLAGS                = 0x01,  /**< Flags. */
    AD_COMPLETE_LOCAL_NAME  = 0x09,  /**< Complete Local Name (UTF-8). */
    AD_TX_POWER_LEVEL       = 0x0A,  /**< Tx Power Level, signed dBm. */
    AD_MANUFACTURER_DATA    = 0xFF   /**< Manufacturer Specific Data. */
};
/** @} */

/// Outcome codes shared by the field, payload and packet decoders.
enum class DecodeStatus : uint8_t {
    ok = 0,
    truncated_field,   ///< AD length byte points past the end of the payload
    short_packet,      ///< sniffer frame too short for the layout it claims
    not_advertising,   ///< well-formed frame that is not an advertising PDU event
    unsupported_pdu    ///< advertising PDU type without a decodable AdvA/AdvData layout
};

/// Stable lowercase token for logs ("ok", "truncated_field", ...).
const char* to_string(DecodeStatus s);

/// What a decoded element turned out to be.
enum class FieldKind : uint8_t {
    flags,
    tx_power,
    local_name,
    manufacturer,
    opaque,
    end_of_data
};

/**
 * @brief Transient view of one TLV element. Does not own its bytes.
 *
 * `value` points into the caller's buffer and is `length - 1` bytes long.
 */
struct AdvertisingField {
    uint8_t        length  = 0;        ///< raw length byte (type + value)
    uint8_t        ad_type = 0;        ///< AD type code
    const uint8_t* value   = nullptr;  ///< first value byte (may be null when value_len == 0)
    size_t         value_len = 0;      ///< length - 1
};

/// One Manufacturer Specific Data occurrence.
struct ManufacturerData {
    uint16_t             company_id = 0;
    std::vector<uint8_t> data;
};

/// AD element kept verbatim because its type is not decoded.
struct RawField {
    uint8_t              type = 0;
    std::vector<uint8_t> value;
};

/**
 * @brief Fully decoded element. Only the member matching `kind` is meaningful.
 */
struct DecodedField {
    FieldKind        kind = FieldKind::opaque;
    uint8_t          ad_type = 0;
    uint8_t          flags = 0;
    int8_t           tx_power = 0;
    std::string      local_name;
    ManufacturerData manufacturer;
    RawField         raw;
};

/**
 * @brief Split the element at @p p into its length/type/value parts without decoding.
 *
 * @param p         first byte of the element (the length byte)
 * @param n         bytes available from @p p
 * @param out       receives the view
 * @param consumed  receives 1 + length on success (1 for a zero length byte)
 * @return DecodeStatus::ok or DecodeStatus::truncated_field. A zero length byte is ok
 *         with out.length == 0.
 */
DecodeStatus split_ad_field(const uint8_t* p, size_t n, AdvertisingField& out, size_t& consumed);

/**
 * @brief Decode one AD element into a typed field.
 *
 * @param p         first byte of the element (the length byte)
 * @param n         bytes available from @p p
 * @param out       receives the decoded field
 * @param consumed  bytes this element occupies (1 + length byte), set on ok
 * @return DecodeStatus::ok or DecodeStatus::truncated_field
 */
DecodeStatus decode_ad_field(const uint8_t* p, size_t n, DecodedField& out, size_t& consumed);

/**
 * @brief Convert bytes to UTF-8, replacing every malformed sequence with U+FFFD.
 *
 * Overlong encodings, surrogates (U+D800..U+DFFF), code points above U+10FFFF and
 * truncated multi-byte sequences are all treated as malformed.
 */
std::string utf8_lossy(const uint8_t* p, size_t n);

} // namespace blesniff
