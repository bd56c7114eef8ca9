#pragma once
/**
 * @file serial_source.hpp
 * @brief ByteSource over an open sniffer tty (header-only, Linux).
 *
 * Depends on: serial_io.hpp for poll/read. Owns the fd once constructed.
 */

#if !defined(__linux__)
#  error "serial_source.hpp is Linux-only."
#endif

#include "serial_io.hpp"
#include "blesniff/stream.hpp"

#include <string>
#include <utility>

namespace blesniff {

class SerialByteSource : public ByteSource {
public:
  /// Take ownership of @p fd (from open_serial()). @p timeout_ms bounds each read.
  SerialByteSource(int fd, std::string dev_path, int timeout_ms = 200)
  : fd_(fd), dev_path_(std::move(dev_path)), timeout_ms_(timeout_ms) {}

  ~SerialByteSource() override { close(); }

  SerialByteSource(const SerialByteSource&) = delete;
  SerialByteSource& operator=(const SerialByteSource&) = delete;

  ReadStatus read(uint8_t* out, std::size_t cap, std::size_t& got) override {
    return read_chunk(fd_, out, cap, timeout_ms_, got, err_);
  }

  const char* name() const override { return "serial"; }
  std::string last_error() const override { return err_; }

  int fd() const { return fd_; }
  const std::string& path() const { return dev_path_; }

  void close() {
    if (fd_ >= 0) { close_serial(fd_); fd_ = -1; }
  }

private:
  int fd_{-1};
  std::string dev_path_;
  int timeout_ms_{200};
  std::string err_;
};

} // namespace blesniff
