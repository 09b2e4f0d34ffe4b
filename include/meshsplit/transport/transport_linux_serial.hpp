#pragma once
/**
 * @file transport_linux_serial.hpp
 * @brief Linux USB/tty transport (header-only, termios; non-blocking).
 *
 * Each chunk goes out as exactly one SLIP frame, so the node on the other end
 * of the cable hands exactly one chunk to its radio per frame.
 *
 * Depends on: unistd.h, fcntl.h, termios.h, poll.h. STL only for std::string
 * and std::vector (Linux-only path).
 */

#if !defined(__linux__)
#  error "transport_linux_serial.hpp is Linux-only."
#endif

#include "meshsplit/slip.hpp"
#include "meshsplit/transport/transport_base.hpp"
#include <string>
#include <vector>
#include <unistd.h>
#include <fcntl.h>
#include <termios.h>
#include <poll.h>
#include <cerrno>

namespace meshsplit::transport {

struct SerialConfig : public Config {
  std::string path;   // e.g. /dev/serial/by-id/usb-...
  int baud{115200};
};

class LinuxSerial : public ITransport {
public:
  explicit LinuxSerial(const std::string& dev_path = {}, int baud=115200)
  : dev_path_(dev_path), baud_(baud) {}

  ~LinuxSerial() override { end(); }

  LinuxSerial(const LinuxSerial&) = delete;
  LinuxSerial& operator=(const LinuxSerial&) = delete;

  bool begin(const Config& cfg) override {
    // We control the call sites; treat cfg as SerialConfig.
    const auto& sc = static_cast<const SerialConfig&>(cfg);

    if (!sc.path.empty()) dev_path_ = sc.path;
    baud_ = sc.baud;
    mtu_  = sc.mtu;

    if (dev_path_.empty()) return false;

    end();
    fd_ = ::open(dev_path_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) return false;

    termios tio{};
    if (::tcgetattr(fd_, &tio) != 0) { end(); return false; }
    ::cfmakeraw(&tio);

    speed_t sp = B115200;
    switch (baud_) {
      case 9600:   sp = B9600; break;
      case 19200:  sp = B19200; break;
      case 38400:  sp = B38400; break;
      case 57600:  sp = B57600; break;
      case 115200: sp = B115200; break;
#ifdef B230400
      case 230400: sp = B230400; break;
#endif
      default:     sp = B115200; break;
    }

    ::cfsetispeed(&tio, sp);
    ::cfsetospeed(&tio, sp);
    tio.c_cflag |= CLOCAL | CREAD; // enable receiver, ignore modem ctrl

    if (::tcsetattr(fd_, TCSANOW, &tio) != 0) { end(); return false; }
    ::tcflush(fd_, TCIOFLUSH);     // drop boot chatter from the node
    return true;
  }

  void end() override {
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
  }

  void poll() override { /* nothing: non-blocking fd */ }

  TxResult send(const uint8_t* data, std::size_t len) override {
    if (fd_ < 0 || !data) return TxResult::Error;
    if (len > mtu_) return TxResult::Error;

    slip::encode(data, len, frame_);

    // Busy only if nothing of the frame has left yet; once started, the frame
    // is finished (briefly waiting for POLLOUT) so frames never interleave.
    std::size_t off = 0;
    while (off < frame_.size()) {
      ssize_t w = ::write(fd_, frame_.data() + off, frame_.size() - off);
      if (w > 0) { off += static_cast<std::size_t>(w); continue; }
      if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        if (off == 0) return TxResult::Busy;
        pollfd pfd{fd_, POLLOUT, 0};
        if (::poll(&pfd, 1, kDrainTimeoutMs) <= 0) return TxResult::Error;
        continue;
      }
      if (w < 0 && errno == EINTR) continue;
      return TxResult::Error;
    }
    return TxResult::Ok;
  }

  const char* name() const override { return "linux-serial"; }
  std::size_t mtu() const override { return mtu_; }

private:
  static constexpr int kDrainTimeoutMs = 200;

  int fd_{-1};
  std::string dev_path_;
  int baud_{115200};
  std::size_t mtu_{230};
  std::vector<uint8_t> frame_;
};

} // namespace meshsplit::transport
