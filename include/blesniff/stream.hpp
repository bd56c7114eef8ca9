#pragma once
/**
 * @page bs-stream blesniff Stream Driver
 * @file stream.hpp
 * @brief Continuous-stream entry point: byte source -> reassembler -> packets -> sink.
 *
 * @details
 * PURPOSE
 * -------
 * run_stream() is the loop a capture thread runs. It blocks in ByteSource::read(),
 * feeds what arrives into a FrameReassembler, decodes every complete frame with
 * decode_sniffer_packet() and reports the outcome to a PacketSink, one packet at a
 * time, in stream order.
 *
 * TERMINATION
 * -----------
 *   end_of_stream  the source reported end of data
 *   stopped        the caller's stop flag was set (checked between reads and packets)
 *   io_error       the source failed; fatal, reason in StreamResult::error
 *
 * Per-frame problems never end the loop: malformed frames go to
 * PacketSink::on_frame_error(), packets whose AD walk hit a truncated element are
 * delivered with DecodeStatus::truncated_field, frames that are not advertising
 * packets go to PacketSink::on_event().
 *
 * SCHEDULING
 * ----------
 * Nothing here spawns threads or keeps global state. For several sniffers, run one
 * run_stream() per source on its own thread; each call owns its reassembler.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "blesniff/ble_packet.hpp"
#include "blesniff/packet_builder.hpp"
#include "blesniff/reassembler.hpp"

namespace blesniff {

/// Outcome of one ByteSource::read().
enum class ReadStatus : uint8_t {
    ok,             ///< got > 0 bytes
    no_data,        ///< nothing yet (timeout); try again
    end_of_stream,  ///< source exhausted
    error           ///< source failed
};

/**
 * @brief Anything that yields bytes: a serial port, a file, a test buffer.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// Read up to @p cap bytes into @p out; @p got receives the count.
    virtual ReadStatus read(uint8_t* out, size_t cap, size_t& got) = 0;

    /// Short identifier for logs.
    virtual const char* name() const = 0;

    /// Reason for the last ReadStatus::error; empty if none.
    virtual std::string last_error() const { return {}; }
};

/**
 * @brief Receiver of stream results. Default handlers ignore the call.
 */
class PacketSink {
public:
    virtual ~PacketSink() = default;

    /// A decoded packet; @p status is ok or truncated_field. @p frame is the
    /// unescaped frame it came from.
    virtual void on_packet(const BlePacket& pkt, DecodeStatus status, const Frame& frame) = 0;

    /// A frame dropped by the reassembler.
    virtual void on_frame_error(const FrameError& err) { (void)err; }

    /// A complete frame that did not yield a packet (control response, data PDU,
    /// unsupported PDU, or too short for its layout), with the decode status.
    virtual void on_event(const Frame& frame, DecodeStatus status) { (void)frame; (void)status; }
};

/// PacketSink built from std::function callbacks. Empty callbacks are skipped.
class CallbackSink : public PacketSink {
public:
    std::function<void(const BlePacket&, DecodeStatus, const Frame&)> packet;
    std::function<void(const FrameError&)>              frame_error;
    std::function<void(const Frame&, DecodeStatus)>     event;

    void on_packet(const BlePacket& pkt, DecodeStatus status, const Frame& frame) override {
        if (packet) packet(pkt, status, frame);
    }
    void on_frame_error(const FrameError& err) override {
        if (frame_error) frame_error(err);
    }
    void on_event(const Frame& frame, DecodeStatus status) override {
        if (event) event(frame, status);
    }
};

/**
 * @brief In-memory source delivering a fixed buffer in chunks of @p chunk bytes.
 *
 * Used by the offline decoder and by tests to reproduce any read fragmentation.
 */
class BufferSource : public ByteSource {
public:
    explicit BufferSource(std::vector<uint8_t> bytes, size_t chunk = 1024)
    : bytes_(std::move(bytes)), chunk_(chunk ? chunk : 1) {}

    ReadStatus read(uint8_t* out, size_t cap, size_t& got) override;
    const char* name() const override { return "buffer"; }

private:
    std::vector<uint8_t> bytes_;
    size_t chunk_;
    size_t pos_ = 0;
};

enum class StreamStatus : uint8_t { end_of_stream, stopped, io_error };

/// Stable lowercase token ("end_of_stream", ...).
const char* to_string(StreamStatus s);

struct StreamStats {
    uint64_t reads             = 0;
    uint64_t bytes_in          = 0;
    uint64_t frames            = 0;   ///< complete frames out of the reassembler
    uint64_t frame_errors      = 0;   ///< frames dropped by the reassembler
    uint64_t packets           = 0;   ///< packets delivered (all statuses)
    uint64_t truncated_packets = 0;   ///< delivered with truncated_field
    uint64_t short_packets     = 0;   ///< frames too short for their PDU layout
    uint64_t other_frames      = 0;   ///< not_advertising / unsupported_pdu
};

struct StreamResult {
    StreamStatus status = StreamStatus::end_of_stream;
    StreamStats  stats;
    std::string  error;    ///< set for io_error
};

/// Size of the scratch buffer run_stream() reads into.
static constexpr size_t STREAM_READ_CHUNK = 1024;

/**
 * @brief Decode the frames and errors of one reassembler step and report them.
 *
 * @return false if @p stop was set while reporting (remaining frames are skipped).
 */
bool dispatch(const FeedResult& step, PacketSink& sink, StreamStats& stats,
              const std::atomic<bool>* stop = nullptr);

/**
 * @brief Run the capture loop until end of stream, I/O error or @p stop.
 *
 * @param src        byte source, read until it ends or fails
 * @param sink       receives packets, frame errors and other events
 * @param stop       optional cooperative stop flag
 * @param max_frame  largest frame accepted by the reassembler
 */
StreamResult run_stream(ByteSource& src, PacketSink& sink,
                        const std::atomic<bool>* stop = nullptr,
                        size_t max_frame = MAX_FRAME_LEN);

} // namespace blesniff
