#include "commands.hpp"   // Our own header: request builders and event decoding

#include "blesniff/slip.hpp"              // slip::encode for the outbound frame
#include "blesniff/sniffer_protocol.hpp"  // packet ids, header layout

#include <algorithm>      // std::min: clip payloads to the one-byte length field
#include <sstream>        // std::ostringstream: assemble describe_event() lines
#include <iomanip>        // std::setw, std::setfill, std::hex


namespace blesniff {
// ============================================================================
// Low-level helpers
// ============================================================================

// ---------------------------------------------------------------------------
// Start a new request body.
// Layout: [6][0][PROTOVER_V1][counter lo][counter hi][id]
// Byte [1] is a payload-length placeholder filled by finalize().
// ---------------------------------------------------------------------------
static inline std::vector<uint8_t> header(uint8_t id, uint16_t counter) {
    std::vector<uint8_t> b;
    b.reserve(32);
    b.push_back(HEADER_LENGTH);                     // header length
    b.push_back(0);                                 // payload length (filled later)
    b.push_back(PROTOVER_V1);                       // requests use protocol v1
    b.push_back(static_cast<uint8_t>(counter & 0xFF));
    b.push_back(static_cast<uint8_t>(counter >> 8));
    b.push_back(id);
    return b;
}

// ---------------------------------------------------------------------------
// Backfill the payload length at [1], then SLIP-frame the body.
// ---------------------------------------------------------------------------
static inline std::vector<uint8_t> finalize(std::vector<uint8_t>& b) {
    b[off::PAYLOAD_LEN] = static_cast<uint8_t>(b.size() - HEADER_LENGTH);
    std::vector<uint8_t> framed;
    slip::encode(b.data(), b.size(), framed);
    return framed;
}

static inline uint16_t rd_u16(const std::vector<uint8_t>& f, size_t at) {
    return static_cast<uint16_t>(f[at] | (uint16_t(f[at + 1]) << 8));
}

// ============================================================================
// Builders
// ============================================================================

std::vector<uint8_t> make_request(uint8_t id, const uint8_t* payload, size_t n, uint16_t counter) {
    auto b = header(id, counter);
    const size_t len = std::min(n, MAX_PAYLOAD_LEN);   // one-byte length field
    if (len) b.insert(b.end(), payload, payload + len);
    return finalize(b);
}


// Continuous scan. Flags byte: bit0 scan responses, bit1 aux, bit2 coded PHY.
std::vector<uint8_t> make_scan_request(const ScanOptions& opt, uint16_t counter) {
    uint8_t flags = 0;
    if (opt.scan_rsp) flags |= 1 << 0;
    if (opt.aux)      flags |= 1 << 1;
    if (opt.coded)    flags |= 1 << 2;
    return make_request(REQ_SCAN_CONT, &flags, 1, counter);
}


std::vector<uint8_t> make_temporary_key(const TemporaryKey& tk, uint16_t counter) {
    return make_request(SET_TEMPORARY_KEY, tk.data(), tk.size(), counter);
}


std::vector<uint8_t> make_hop_sequence(const std::vector<uint8_t>& channels, uint16_t counter) {
    // Firmware expects: [count][ch...]
    std::vector<uint8_t> p;
    p.push_back(static_cast<uint8_t>(channels.size()));
    p.insert(p.end(), channels.begin(), channels.end());
    return make_request(SET_ADV_CHANNEL_HOP_SEQ, p.data(), p.size(), counter);
}


std::vector<uint8_t> make_ping(uint16_t counter) {
    return make_request(PING_REQ, nullptr, 0, counter);
}


std::vector<uint8_t> make_req_version(uint16_t counter) {
    return make_request(REQ_VERSION, nullptr, 0, counter);
}


std::vector<uint8_t> make_req_timestamp(uint16_t counter) {
    return make_request(REQ_TIMESTAMP, nullptr, 0, counter);
}


std::vector<uint8_t> make_go_idle(uint16_t counter) {
    return make_request(GO_IDLE, nullptr, 0, counter);
}

// ============================================================================
// Event decoding
// ============================================================================

bool parse_version(const std::vector<uint8_t>& f, std::string& version) {
    if (f.size() < HEADER_LENGTH || f[off::PACKET_ID] != RESP_VERSION)
        return false;

    // Version string may be NUL padded; stop at the first NUL.
    const size_t end = std::min(f.size(), size_t(HEADER_LENGTH) + f[off::PAYLOAD_LEN]);
    version.clear();
    for (size_t i = HEADER_LENGTH; i < end && f[i] != 0; ++i)
        version.push_back(static_cast<char>(f[i]));
    return true;
}

// ============================================================================
// describe_event()
// ---------------------------------------------------------------------------
// One line per non-packet frame. Stable keys for scripts; unknown ids fall
// back to "event=id_0x.." with the payload length.
// ============================================================================
std::string describe_event(const std::vector<uint8_t>& f) {
    std::ostringstream os;

    if (f.size() < HEADER_LENGTH) {
        os << "event=error reason=short_frame";
        return os.str();
    }

    const uint8_t  id      = f[off::PACKET_ID];
    const uint16_t counter = rd_u16(f, off::COUNTER);
    const size_t   plen    = f.size() - HEADER_LENGTH;

    switch (id) {
        case PING_RESP:
            os << "event=ping_resp";
            if (plen >= 2) {
                os << " fw=0x" << std::hex << std::setw(4) << std::setfill('0')
                   << rd_u16(f, HEADER_LENGTH) << std::dec;
            }
            break;

        case RESP_VERSION: {
            std::string v;
            parse_version(f, v);
            os << "event=version version=" << v;
            break;
        }

        case RESP_TIMESTAMP:
            os << "event=timestamp";
            if (plen >= 4) {
                const uint32_t ts =  uint32_t(f[6]) | (uint32_t(f[7]) << 8) |
                                    (uint32_t(f[8]) << 16) | (uint32_t(f[9]) << 24);
                os << " ts=" << ts;
            }
            break;

        case EVENT_PACKET_DATA_PDU:
            os << "event=data_pdu counter=" << counter;
            break;

        case EVENT_PACKET_ADV_PDU:
            os << "event=adv_pdu counter=" << counter;
            break;

        case EVENT_CONNECT:    os << "event=connect";    break;
        case EVENT_DISCONNECT: os << "event=disconnect"; break;
        case EVENT_FOLLOW:     os << "event=follow";     break;

        default:
            os << "event=id_0x" << std::hex << std::setw(2) << std::setfill('0')
               << unsigned(id) << std::dec
               << " counter=" << counter << " len=" << plen;
            break;
    }
    return os.str();
}

} // namespace blesniff
