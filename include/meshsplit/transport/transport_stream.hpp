#pragma once
/**
 * @file transport_stream.hpp
 * @brief Line-oriented transport over a std::ostream (stdout, files, tests).
 *
 * Writes each chunk followed by '\n'. Useful for piping chunks into another
 * program that owns the real link, and for dry runs of the dispatcher.
 */

#include "meshsplit/transport/transport_base.hpp"
#include <ostream>

namespace meshsplit::transport {

class StreamTransport : public ITransport {
public:
  explicit StreamTransport(std::ostream& os) : os_(os) {}

  bool begin(const Config& cfg) override {
    mtu_ = cfg.mtu;
    return static_cast<bool>(os_);
  }

  void end() override { os_.flush(); }

  void poll() override {}

  TxResult send(const uint8_t* data, std::size_t len) override {
    if (!data && len) return TxResult::Error;
    if (len > mtu_) return TxResult::Error;
    os_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
    os_.put('\n');
    os_.flush();
    return os_ ? TxResult::Ok : TxResult::Error;
  }

  const char* name() const override { return "stream"; }
  std::size_t mtu() const override { return mtu_; }

private:
  std::ostream& os_;
  std::size_t mtu_{230};
};

} // namespace meshsplit::transport
