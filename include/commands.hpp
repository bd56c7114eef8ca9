#pragma once
/**
 * @page bs-commands blesniff Sniffer Commands
 * @file commands.hpp
 * @brief Request builders and control-event decoding for the nRF sniffer firmware.
 *
 * @details
 * PURPOSE
 * -------
 * The decoder core only listens. To make the firmware start reporting advertisements
 * the host has to ask: a REQ_SCAN_CONT puts the sniffer in continuous scan mode, a
 * SET_TEMPORARY_KEY clears any pairing key left from an earlier session. This layer
 * builds those requests and turns the non-packet replies (PING_RESP, RESP_VERSION,
 * RESP_TIMESTAMP) into one-line summaries.
 *
 * WIRE FORMAT
 * -----------
 * A request body uses the same 6-byte header the firmware uses for its events:
 *
 *   [HEADER_LENGTH=6][payload_len][PROTOVER_V1][counter lo][counter hi][id][payload...]
 *
 * and is then framed with slip::encode(). Every builder returns the framed bytes,
 * ready for write_bytes().
 *
 * RELATIONSHIP TO OTHER FILES
 * ---------------------------
 * - blesniff/slip.hpp: framing and escapes.
 * - blesniff/sniffer_protocol.hpp: packet ids and offsets.
 * - serial_io.hpp: writes the bytes, reads the replies.
 * - sniffer_registry.hpp: probes devices with make_req_version() + parse_version().
 *
 * EXAMPLE FLOW
 * ------------
 *   write_bytes(fd, make_scan_request({true, false, false}, 0));
 *   write_bytes(fd, make_temporary_key({}, 1));
 *   ... run_stream() over the same fd ...
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace blesniff {

/// Options carried by REQ_SCAN_CONT.
struct ScanOptions {
    bool scan_rsp = false;   ///< also report SCAN_RSP packets (bit 0)
    bool aux      = false;   ///< follow AUX_* extended advertising packets (bit 1)
    bool coded    = false;   ///< scan on the Coded PHY (bit 2)
};

/// 128-bit temporary key, all zero by default.
using TemporaryKey = std::array<uint8_t, 16>;

/**
 * @brief Build and frame a request with an arbitrary id and payload.
 *
 * Payloads longer than 255 bytes are clipped; the length byte is one octet.
 */
std::vector<uint8_t> make_request(uint8_t id, const uint8_t* payload, size_t n, uint16_t counter);

/// REQ_SCAN_CONT: start continuous scanning with @p opt.
std::vector<uint8_t> make_scan_request(const ScanOptions& opt, uint16_t counter);

/// SET_TEMPORARY_KEY with a 16-byte key.
std::vector<uint8_t> make_temporary_key(const TemporaryKey& tk, uint16_t counter);

/// SET_ADV_CHANNEL_HOP_SEQ: channels to hop through, e.g. {37, 38, 39}.
std::vector<uint8_t> make_hop_sequence(const std::vector<uint8_t>& channels, uint16_t counter);

/// PING_REQ; the firmware answers PING_RESP with its firmware id.
std::vector<uint8_t> make_ping(uint16_t counter);

/// REQ_VERSION; answered by RESP_VERSION carrying a version string.
std::vector<uint8_t> make_req_version(uint16_t counter);

/// REQ_TIMESTAMP; answered by RESP_TIMESTAMP.
std::vector<uint8_t> make_req_timestamp(uint16_t counter);

/// GO_IDLE: stop scanning/following.
std::vector<uint8_t> make_go_idle(uint16_t counter);

/**
 * @brief Extract the version string from a RESP_VERSION frame.
 *
 * @param frame  unescaped frame from the reassembler
 * @return false if @p frame is not a RESP_VERSION event
 */
bool parse_version(const std::vector<uint8_t>& frame, std::string& version);

/**
 * @brief Summarize a non-packet frame on one line.
 *
 * Output examples:
 *   "event=ping_resp fw=0x0539"
 *   "event=version version=4.1.1"
 *   "event=timestamp ts=1234567"
 *   "event=data_pdu counter=17"
 *   "event=id_0x14 counter=3 len=4"
 */
std::string describe_event(const std::vector<uint8_t>& frame);

} // namespace blesniff
