/**
 * @page bs-serial-io-hdr blesniff Serial I/O API (Header)
 * @file serial_io.hpp
 * @brief Open the sniffer's Linux TTY in raw mode and move bytes in and out of it.
 *
 * @details
 * PURPOSE
 * -------
 * The nRF sniffer shows up as a USB CDC ACM or FTDI tty. This header declares the
 * small surface the host needs to talk to it: open at the right baud, write request
 * frames, read whatever arrived within a timeout. Framing and decoding happen above
 * this layer (FrameReassembler, run_stream).
 *
 * ROLE IN BLESNIFF
 * ----------------
 * - blesniff::open_serial: acquire a file descriptor, set raw 8N1, absorb boot chatter.
 * - blesniff::write_bytes: write one already-framed request (see commands.hpp).
 * - blesniff::read_chunk: poll and read up to N bytes; no framing.
 * - blesniff::close_serial: close the descriptor.
 *
 * HOW IT FITS TOGETHER
 * --------------------
 *   open_serial() -> write_bytes(make_scan_request()) -> SerialByteSource -> run_stream()
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Device selection: prefer /dev/serial/by-id/... for stable paths; see sniffer_registry.hpp.
 * - Permissions: the runtime user needs the dialout group.
 * - Baud: firmware 3.x and 4.x talk at 460800. Older 1.x/2.x firmware uses 1000000.
 *
 * LIMITATIONS AND TRADE-OFFS
 * --------------------------
 * - Baud table: only the rates listed in open_serial() are mapped; others are rejected.
 * - Atomic writes: write_bytes does not loop on a partial write, it returns false.
 *   Sniffer requests are under 40 bytes, well inside any driver buffer.
 * - Concurrency: one fd per thread.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "blesniff/stream.hpp"   // ReadStatus

namespace blesniff {

/// Default link speed of current nRF sniffer firmware.
static constexpr int DEFAULT_BAUD = 460800;

/// True if open_serial() knows how to set @p baud.
bool baud_supported(int baud);

/**
 * @brief Open a Linux TTY device, configure it for raw I/O, and return its file descriptor.
 *
 * What it does:
 *   - Opens the device with O_RDWR | O_NOCTTY | O_NONBLOCK.
 *   - Puts the port into raw 8N1 mode, no flow control.
 *   - Sets the baud rate (9600..1000000, see baud_supported()).
 *   - Waits @p boot_delay_ms, then flushes whatever the board printed while resetting.
 *
 * @param dev            e.g. "/dev/serial/by-id/usb-SEGGER_J-Link_..." or "/dev/ttyACM0"
 * @param baud           link speed; default 460800
 * @param boot_delay_ms  sleep after open before first I/O
 * @param err            on failure receives a reason token ("open_failed:<errno text>",
 *                       "bad_baud", "termios_failed")
 *
 * @return fd (>= 0) on success, -1 on failure.
 */
int open_serial(const std::string& dev, int baud, int boot_delay_ms, std::string& err);

/**
 * @brief Write one framed request.
 *
 * @return true if all bytes were written in one call.
 */
bool write_bytes(int fd, const std::vector<uint8_t>& bytes);

/**
 * @brief Wait up to @p timeout_ms for input and read up to @p cap bytes.
 *
 * @return ok (got > 0), no_data (timeout or EAGAIN/EINTR), end_of_stream (device
 *         hung up, e.g. unplugged), error (poll/read failed; @p err set).
 */
ReadStatus read_chunk(int fd, uint8_t* out, size_t cap, int timeout_ms,
                      size_t& got, std::string& err);

/// Close @p fd if it is >= 0.
void close_serial(int fd);

} // namespace blesniff
