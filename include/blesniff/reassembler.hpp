#pragma once
/**
 * @page bs-reassembler blesniff Serial Frame Reassembler
 * @file reassembler.hpp
 * @brief Turn an unbounded, arbitrarily chunked sniffer byte stream into complete frames.
 *
 * @details
 * OVERVIEW
 * --------
 * Serial reads return whatever the driver has: half a frame, three frames and a bit,
 * a single byte, boot chatter. The reassembler accepts those chunks in order and
 * returns every complete, length-consistent frame it can finish, plus one error record
 * per frame it had to throw away.
 *
 * STATE MACHINE
 * -------------
 *   Seeking       no frame open; bytes are skipped until slip::START
 *   Accumulating  START seen; bytes are unescaped and buffered. Once the first two
 *                 body bytes are in, the header length must equal HEADER_LENGTH and
 *                 the declared size (6 + payload length) must not exceed max_frame().
 *   Emitting      slip::END seen with exactly the declared byte count buffered; the
 *                 frame is handed out and the machine returns to Seeking
 *
 * Resynchronization (Accumulating -> Seeking, frame dropped, error recorded):
 *   - header length byte != 6                         bad_header_length
 *   - declared size above max_frame()                 length_out_of_range
 *   - ESC not followed by an escape code              bad_escape
 *   - END before the declared size was reached        truncated
 *   - more bytes than declared before END             overrun
 *   - raw START inside a frame                        truncated, and a new frame
 *                                                     starts at that START
 *
 * GUARANTEES
 * ----------
 * - Every input byte is examined exactly once, so each feed() finishes in time
 *   proportional to its input.
 * - The frame buffer is an etl::vector with capacity MAX_FRAME_LEN. Noise outside a
 *   frame is never stored, and a frame is dropped before it could exceed its declared
 *   size, so memory stays bounded whatever the stream contains.
 * - Fragmentation does not matter: feeding N frames in one chunk or one byte at a time
 *   yields the same N frames.
 *
 * EXAMPLE
 * -------
 * @code
 *   blesniff::FrameReassembler rs;
 *   uint8_t buf[256];
 *   size_t got = read_some(buf, sizeof(buf));
 *   auto step = rs.feed(buf, got);
 *   for (const auto& frame : step.frames) handle(frame);
 *   for (const auto& err : step.errors) count(err);
 * @endcode
 *
 * Not thread-safe. Use one instance per byte source.
 */

#include <cstddef>
#include <cstdint>
#include <vector>

#include "etl/vector.h"

#include "blesniff/sniffer_protocol.hpp"

namespace blesniff {

/// Reassembler states.
enum class ReassemblerState : uint8_t {
    seeking,
    accumulating,
    emitting
};

/// Why a frame was dropped.
enum class FrameErrorKind : uint8_t {
    bad_header_length,
    length_out_of_range,
    bad_escape,
    truncated,
    overrun
};

/// Stable lowercase token ("bad_escape", ...).
const char* to_string(FrameErrorKind k);

/// One dropped frame.
struct FrameError {
    FrameErrorKind kind;
    size_t         discarded;   ///< unescaped bytes thrown away with the frame
};

/// One complete, unescaped frame (header included).
using Frame = std::vector<uint8_t>;

/// Output of one feed() call.
struct FeedResult {
    std::vector<Frame>      frames;
    std::vector<FrameError> errors;
};

/// Running totals since construction or the last reset().
struct ReassemblerStats {
    uint64_t bytes_in      = 0;   ///< every byte fed
    uint64_t noise_bytes   = 0;   ///< bytes skipped while seeking
    uint64_t frames        = 0;   ///< frames emitted
    uint64_t frame_errors  = 0;   ///< frames dropped
};

class FrameReassembler {
public:
    /// Buffer capacity: the largest frame the protocol can declare.
    static constexpr size_t CAPACITY = MAX_FRAME_LEN;

    /**
     * @param max_frame  largest declared frame size accepted (header included);
     *                   clamped to [HEADER_LENGTH, CAPACITY].
     */
    explicit FrameReassembler(size_t max_frame = CAPACITY);

    /**
     * @brief Process @p n newly delivered bytes.
     *
     * State carries over between calls; a frame split across reads completes on the
     * call that delivers its END.
     */
    FeedResult feed(const uint8_t* data, size_t n);

    FeedResult feed(const std::vector<uint8_t>& chunk) { return feed(chunk.data(), chunk.size()); }

    /// Drop any partial frame and return to Seeking. Statistics are kept.
    void reset();

    ReassemblerState state() const { return state_; }
    size_t buffered() const { return buf_.size(); }
    size_t max_frame() const { return max_frame_; }
    const ReassemblerStats& stats() const { return stats_; }

private:
    void push(uint8_t b, FeedResult& out);
    void store(uint8_t b, FeedResult& out);
    void drop(FrameErrorKind kind, FeedResult& out);
    void begin_frame();

    etl::vector<uint8_t, CAPACITY> buf_;
    ReassemblerState state_ = ReassemblerState::seeking;
    bool   esc_ = false;        ///< previous byte was slip::ESC
    size_t declared_ = 0;       ///< expected frame size; 0 until the header is known
    size_t max_frame_;
    ReassemblerStats stats_;
};

} // namespace blesniff
