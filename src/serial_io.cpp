// ============================================================================
// serial_io.cpp — implementation for serial_io.hpp
// For API/overview see the matching .hpp.
// ============================================================================

/**
 * @file serial_io.cpp
 */

#include "serial_io.hpp"   // open_serial(), write_bytes(), read_chunk(), close_serial()

// POSIX / termios headers for low-level serial port handling
#include <fcntl.h>         // ::open flags (O_RDWR, O_NOCTTY, etc.)
#include <unistd.h>        // ::read, ::write, ::close, usleep
#include <termios.h>       // termios struct + raw mode helpers
#include <poll.h>          // poll(2) for timeout-based reads
#include <cerrno>          // errno, EAGAIN, EINTR
#include <cstring>         // std::strerror

namespace blesniff {

// ---------------------------------------------------------------------------
// to_speed()
// Map an integer baud to its termios constant. Returns false if unknown.
// ---------------------------------------------------------------------------
static bool to_speed(int baud, speed_t& sp) {
    switch (baud) {
        case 9600:    sp = B9600;    return true;
        case 19200:   sp = B19200;   return true;
        case 38400:   sp = B38400;   return true;
        case 57600:   sp = B57600;   return true;
        case 115200:  sp = B115200;  return true;
        case 230400:  sp = B230400;  return true;
#ifdef B460800
        case 460800:  sp = B460800;  return true;
#endif
#ifdef B921600
        case 921600:  sp = B921600;  return true;
#endif
#ifdef B1000000
        case 1000000: sp = B1000000; return true;
#endif
        default: return false;
    }
}

bool baud_supported(int baud) {
    speed_t sp;
    return to_speed(baud, sp);
}

// ---------------------------------------------------------------------------
// set_raw()
// Raw 8N1, no flow control, VMIN=VTIME=0 (poll() handles timing).
// ---------------------------------------------------------------------------
static bool set_raw(int fd, speed_t baud) {
    termios tio{};
    if (tcgetattr(fd, &tio) != 0) return false;

    cfmakeraw(&tio);
    cfsetispeed(&tio, baud);
    cfsetospeed(&tio, baud);

    tio.c_cflag |= (CLOCAL | CREAD);              // ignore modem ctrl, enable read
    tio.c_cflag &= ~CRTSCTS;                      // sniffer firmware does not use RTS/CTS
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSANOW, &tio) != 0) return false;
    tcflush(fd, TCIOFLUSH);
    return true;
}


int open_serial(const std::string& dev, int baud, int boot_delay_ms, std::string& err) {
    speed_t sp;
    if (!to_speed(baud, sp)) { err = "bad_baud"; return -1; }

    int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) {
        err = std::string("open_failed:") + std::strerror(errno);
        return -1;
    }

    if (!set_raw(fd, sp)) {
        err = "termios_failed";
        ::close(fd);
        return -1;
    }

    if (boot_delay_ms > 0) usleep(boot_delay_ms * 1000);  // USB-serial auto-reset
    tcflush(fd, TCIOFLUSH);                               // drop reboot chatter
    return fd;
}


bool write_bytes(int fd, const std::vector<uint8_t>& bytes) {
    if (fd < 0 || bytes.empty()) return false;
    return ::write(fd, bytes.data(), bytes.size()) == (ssize_t)bytes.size();
}


// ---------------------------------------------------------------------------
// read_chunk()
// One poll() + one read(). Large reads; the reassembler does the framing.
// ---------------------------------------------------------------------------
ReadStatus read_chunk(int fd, uint8_t* out, size_t cap, int timeout_ms,
                      size_t& got, std::string& err) {
    got = 0;
    if (fd < 0 || cap == 0) { err = "bad_fd"; return ReadStatus::error; }

    pollfd pfd{fd, POLLIN, 0};
    int pr = ::poll(&pfd, 1, timeout_ms);
    if (pr == 0) return ReadStatus::no_data;                  // timeout
    if (pr < 0) {
        if (errno == EINTR) return ReadStatus::no_data;       // signal; caller checks stop
        err = std::string("poll_failed:") + std::strerror(errno);
        return ReadStatus::error;
    }

    if (pfd.revents & POLLIN) {
        ssize_t n = ::read(fd, out, cap);
        if (n > 0) { got = static_cast<size_t>(n); return ReadStatus::ok; }
        if (n == 0) return ReadStatus::end_of_stream;
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
            return ReadStatus::no_data;
        err = std::string("read_failed:") + std::strerror(errno);
        return ReadStatus::error;
    }

    if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) {
        if (pfd.revents & POLLHUP) return ReadStatus::end_of_stream;   // unplugged
        err = "device_error";
        return ReadStatus::error;
    }
    return ReadStatus::no_data;
}


void close_serial(int fd) {
    if (fd >= 0) ::close(fd);
}

} // namespace blesniff
