#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal, splitter-agnostic send interface for MeshSplit transports.
 *
 * Header-only on purpose for easy embedding. No STL in the embedded path.
 *
 * The splitter never talks to a radio or an API itself. Whatever carries the
 * chunks (a serial-attached LoRa node, a stream, a test double) implements
 * this trait and is driven by the Dispatcher one chunk at a time.
 */

#include <cstddef>
#include <cstdint>

namespace meshsplit::transport {

// Return codes kept simple for embedded sanity.
enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };

struct Config {
  // Extend per-transport via a derived config (see SerialConfig).
  uint16_t mtu{230};   // largest chunk the link accepts, marker included
};

/**
 * @brief Transport trait every sender can rely on.
 *
 * Contract:
 *  - begin(cfg) initializes hardware/port; false if the link is unusable.
 *  - poll() does non-blocking service work.
 *  - send(buf,len) transmits one whole chunk; never blocks for long.
 *    Busy means "not now, offer the same chunk later"; Error is final.
 *    A chunk longer than mtu() is an Error.
 *  - name() is a short identifier for logs/diagnostics.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual bool        begin(const Config& cfg) = 0;
  virtual void        end() = 0;
  virtual void        poll() = 0;
  virtual TxResult    send(const uint8_t* data, std::size_t len) = 0;
  virtual const char* name() const = 0;
  virtual std::size_t mtu() const = 0;
};

} // namespace meshsplit::transport
