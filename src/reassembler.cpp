// ============================================================================
// reassembler.cpp — implementation for reassembler.hpp
// For the state machine and guarantees see the matching .hpp.
// ============================================================================

#include "blesniff/reassembler.hpp"
#include "blesniff/slip.hpp"

#include <algorithm>      // std::min, std::max

namespace blesniff {

const char* to_string(FrameErrorKind k) {
    switch (k) {
        case FrameErrorKind::bad_header_length:   return "bad_header_length";
        case FrameErrorKind::length_out_of_range: return "length_out_of_range";
        case FrameErrorKind::bad_escape:          return "bad_escape";
        case FrameErrorKind::truncated:           return "truncated";
        case FrameErrorKind::overrun:             return "overrun";
    }
    return "unknown";
}

FrameReassembler::FrameReassembler(size_t max_frame)
: max_frame_(std::max<size_t>(HEADER_LENGTH, std::min(max_frame, CAPACITY))) {
}

void FrameReassembler::reset() {
    buf_.clear();
    esc_ = false;
    declared_ = 0;
    state_ = ReassemblerState::seeking;
}

FeedResult FrameReassembler::feed(const uint8_t* data, size_t n) {
    FeedResult out;
    for (size_t i = 0; i < n; ++i) push(data[i], out);   // each byte exactly once
    stats_.bytes_in += n;
    return out;
}

// ---------------------------------------------------------------------------
// begin_frame()
// A START marker opens a fresh frame. Nothing before it is kept.
// ---------------------------------------------------------------------------
void FrameReassembler::begin_frame() {
    buf_.clear();
    esc_ = false;
    declared_ = 0;
    state_ = ReassemblerState::accumulating;
}

// ---------------------------------------------------------------------------
// drop()
// Record an error for the frame in progress and go back to Seeking.
// ---------------------------------------------------------------------------
void FrameReassembler::drop(FrameErrorKind kind, FeedResult& out) {
    out.errors.push_back({kind, buf_.size()});
    ++stats_.frame_errors;
    reset();
}

// ---------------------------------------------------------------------------
// push()
// Per-byte transition. START and END keep their meaning everywhere because
// the sender escapes them inside a frame; seeing one raw is always a boundary.
// ---------------------------------------------------------------------------
void FrameReassembler::push(uint8_t b, FeedResult& out) {
    if (state_ == ReassemblerState::seeking) {
        if (b == slip::START) begin_frame();
        else ++stats_.noise_bytes;             // boot chatter, line noise, half frames
        return;
    }

    // Accumulating
    if (b == slip::START) {
        // Previous frame never closed. Report it and restart on this marker.
        drop(FrameErrorKind::truncated, out);
        begin_frame();
        return;
    }

    if (b == slip::END) {
        if (esc_) {                            // ESC with nothing to escape
            drop(FrameErrorKind::bad_escape, out);
            return;
        }
        if (declared_ == 0 || buf_.size() != declared_) {
            drop(FrameErrorKind::truncated, out);
            return;
        }
        state_ = ReassemblerState::emitting;
        out.frames.emplace_back(buf_.begin(), buf_.end());
        ++stats_.frames;
        reset();                               // back to Seeking, buffer empty
        return;
    }

    if (esc_) {
        esc_ = false;
        uint8_t lit = 0;
        if (!slip::unescape(b, lit)) {
            drop(FrameErrorKind::bad_escape, out);
            return;
        }
        store(lit, out);
        return;
    }

    if (b == slip::ESC) {
        esc_ = true;                           // resolve on the next byte
        return;
    }

    store(b, out);
}

// ---------------------------------------------------------------------------
// store()
// Append one unescaped body byte and validate the header as soon as both
// length bytes are present.
// ---------------------------------------------------------------------------
void FrameReassembler::store(uint8_t b, FeedResult& out) {
    if ((declared_ != 0 && buf_.size() >= declared_) || buf_.full()) {
        drop(FrameErrorKind::overrun, out);    // END missing after the declared size
        return;
    }
    buf_.push_back(b);

    if (buf_.size() == 2) {
        if (buf_[off::HEADER_LEN] != HEADER_LENGTH) {
            drop(FrameErrorKind::bad_header_length, out);
            return;
        }
        const size_t declared = size_t(HEADER_LENGTH) + buf_[off::PAYLOAD_LEN];
        if (declared > max_frame_) {
            drop(FrameErrorKind::length_out_of_range, out);
            return;
        }
        declared_ = declared;
    }
}

} // namespace blesniff
