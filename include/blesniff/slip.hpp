#pragma once

/**
 * @page bs-slip blesniff Sniffer SLIP Framing
 * @file slip.hpp
 * @brief SLIP-style framing used by the nRF Sniffer for Bluetooth LE UART protocol.
 *
 * @details
 * OVERVIEW
 * --------
 * The sniffer firmware wraps every packet it reports (and every request it accepts)
 * between two sentinel bytes and escapes sentinel collisions inside the body. It is the
 * same idea as RFC 1055 SLIP with different byte values and a "+1" escape rule:
 *
 *   START     (0xAB) begins a frame.
 *   END       (0xBC) ends a frame.
 *   ESC       (0xCD) introduces an escaped byte.
 *   ESC_START (0xAC) stands in for START inside a frame.
 *   ESC_END   (0xBD) stands in for END inside a frame.
 *   ESC_ESC   (0xCE) stands in for ESC inside a frame.
 *
 * Unlike classic SLIP there are distinct start and end markers, so a reader can tell
 * "frame starts here" from "frame ends here" and resynchronize on either.
 *
 * Encoding rules:
 *   - Emit START, then each body byte, then END.
 *   - A body byte equal to START, END or ESC is sent as ESC, byte + 1.
 *
 * Decoding is stateful and lives in the frame reassembler (reassembler.hpp), which
 * also checks the length fields carried inside the frame.
 *
 * EXAMPLE
 * -------
 * @code
 *   std::vector<uint8_t> out;
 *   const uint8_t body[] = {0x06, 0x00, 0x01, 0xAB};
 *   blesniff::slip::encode(body, sizeof(body), out);
 *   // out: AB 06 00 01 CD AC BC
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <vector>

namespace blesniff {
namespace slip {

/**
 * @name Sentinel and escape codes
 * @{
 */
static constexpr uint8_t START     = 0xAB;       ///< frame start marker
static constexpr uint8_t END       = 0xBC;       ///< frame end marker
static constexpr uint8_t ESC       = 0xCD;       ///< escape introducer
static constexpr uint8_t ESC_START = START + 1;  ///< ESC, ESC_START => START
static constexpr uint8_t ESC_END   = END + 1;    ///< ESC, ESC_END   => END
static constexpr uint8_t ESC_ESC   = ESC + 1;    ///< ESC, ESC_ESC   => ESC
/** @} */

/// True for the three bytes that must be escaped inside a frame.
inline bool needs_escape(uint8_t b) {
    return b == START || b == END || b == ESC;
}

/**
 * @brief Append one body byte to @p out, escaping it when needed.
 */
inline void put(uint8_t b, std::vector<uint8_t>& out) {
    if (needs_escape(b)) {
        out.push_back(ESC);                       // introduce escape
        out.push_back(static_cast<uint8_t>(b + 1)); // escaped form is value + 1
    } else {
        out.push_back(b);                         // ordinary byte passes through
    }
}

/**
 * @brief Translate the byte following ESC back to its literal value.
 *
 * @param code  byte received after ESC
 * @param out   literal byte on success
 * @return false when @p code is not one of ESC_START / ESC_END / ESC_ESC
 */
inline bool unescape(uint8_t code, uint8_t& out) {
    if      (code == ESC_START) out = START;
    else if (code == ESC_END)   out = END;
    else if (code == ESC_ESC)   out = ESC;
    else return false;
    return true;
}

/**
 * @brief Encode a raw body into a single frame.
 *
 * @param in  first body byte
 * @param n   body length
 * @param out destination; cleared first. Reserves the worst case (2*n + 2).
 */
inline void encode(const uint8_t* in, size_t n, std::vector<uint8_t>& out) {
    out.clear();
    out.reserve(n * 2 + 2);

    out.push_back(START);
    for (size_t i = 0; i < n; ++i) put(in[i], out);
    out.push_back(END);
}

} // namespace slip
} // namespace blesniff
