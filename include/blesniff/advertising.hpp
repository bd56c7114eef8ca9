#pragma once
/**
 * @file advertising.hpp
 * @brief Walk the AD elements of one advertising payload and fold them into a BlePacket.
 *
 * @details
 * The walker starts at offset 0 and advances by each element's consumed length until:
 *   - the payload is exhausted (status ok),
 *   - a zero length byte is found (status ok; end-of-data padding), or
 *   - an element claims more bytes than remain (status truncated_field).
 *
 * In the truncated case every element decoded before the bad one stays in the packet.
 * The walker never reads outside [p, p + n).
 */

#include <cstddef>
#include <cstdint>

#include "blesniff/ble_packet.hpp"

namespace blesniff {

/// Result of one payload walk.
struct AdScanResult {
    DecodeStatus status   = DecodeStatus::ok;
    size_t       consumed = 0;   ///< bytes accounted for by decoded elements (and the end marker)
    size_t       elements = 0;   ///< AD elements decoded (end marker not counted)
    bool         end_marker = false;  ///< stopped on a zero length byte
};

/**
 * @brief Decode the advertising-data bytes of one packet into @p pkt.
 *
 * Only the AD-derived members of @p pkt are touched (flags, tx_power, local_name,
 * manufacturer_*, manufacturers, raw_fields, ad_types). Metadata is left alone so the
 * record builder can fill it before or after.
 */
AdScanResult decode_advertising_data(const uint8_t* p, size_t n, BlePacket& pkt);

/// Fold one decoded element into @p pkt. Exposed for the walker and for tests.
void apply_field(const DecodedField& f, BlePacket& pkt);

} // namespace blesniff
