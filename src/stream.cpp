// ============================================================================
// stream.cpp — implementation for stream.hpp
// ============================================================================

#include "blesniff/stream.hpp"

#include <algorithm>      // std::min
#include <cstring>        // std::memcpy

namespace blesniff {

const char* to_string(StreamStatus s) {
    switch (s) {
        case StreamStatus::end_of_stream: return "end_of_stream";
        case StreamStatus::stopped:       return "stopped";
        case StreamStatus::io_error:      return "io_error";
    }
    return "unknown";
}

ReadStatus BufferSource::read(uint8_t* out, size_t cap, size_t& got) {
    got = 0;
    if (pos_ >= bytes_.size()) return ReadStatus::end_of_stream;

    got = std::min({cap, chunk_, bytes_.size() - pos_});
    std::memcpy(out, bytes_.data() + pos_, got);
    pos_ += got;
    return ReadStatus::ok;
}

static inline bool stop_requested(const std::atomic<bool>* stop) {
    return stop && stop->load(std::memory_order_relaxed);
}

bool dispatch(const FeedResult& step, PacketSink& sink, StreamStats& stats,
              const std::atomic<bool>* stop) {
    for (const auto& err : step.errors) {
        ++stats.frame_errors;
        sink.on_frame_error(err);
    }

    for (const auto& frame : step.frames) {
        if (stop_requested(stop)) return false;      // cooperative cancel between packets
        ++stats.frames;

        BlePacket pkt;
        const DecodeStatus st = decode_sniffer_packet(frame.data(), frame.size(), pkt);

        if (packet_usable(st)) {
            ++stats.packets;
            if (st == DecodeStatus::truncated_field) ++stats.truncated_packets;
            sink.on_packet(pkt, st, frame);
        } else {
            if (st == DecodeStatus::short_packet) ++stats.short_packets;
            else                                  ++stats.other_frames;
            sink.on_event(frame, st);
        }
    }
    return true;
}

// ---------------------------------------------------------------------------
// run_stream()
// One read -> one feed -> dispatch. The reassembler lives on this stack
// frame, so two concurrent run_stream() calls never share state.
// ---------------------------------------------------------------------------
StreamResult run_stream(ByteSource& src, PacketSink& sink,
                        const std::atomic<bool>* stop, size_t max_frame) {
    StreamResult res;
    FrameReassembler rs(max_frame);
    uint8_t buf[STREAM_READ_CHUNK];

    while (true) {
        if (stop_requested(stop)) { res.status = StreamStatus::stopped; break; }

        size_t got = 0;
        const ReadStatus rd = src.read(buf, sizeof(buf), got);
        ++res.stats.reads;

        if (rd == ReadStatus::error) {
            res.status = StreamStatus::io_error;
            res.error  = src.last_error();
            if (res.error.empty()) res.error = "read_failed";
            break;
        }
        if (rd == ReadStatus::end_of_stream) {
            res.status = StreamStatus::end_of_stream;
            break;
        }
        if (rd == ReadStatus::no_data || got == 0) continue;

        res.stats.bytes_in += got;
        if (!dispatch(rs.feed(buf, got), sink, res.stats, stop)) {
            res.status = StreamStatus::stopped;
            break;
        }
    }
    return res;
}

} // namespace blesniff
