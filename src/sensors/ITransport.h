#pragma once
#include <cstdint>
#include <string>
#include "config/config.h"

// Payload between STX and ETX, markers stripped.
struct RawFrame {
  uint64_t monotonic_ts_ns{0};  // receipt time of the ETX byte
  std::string payload;
};

enum class TransportError {
  Ok,
  Unreachable,  // refused, unroutable or unresolvable
  Timeout,      // connect or liveness deadline exceeded
  Closed,       // peer closed the stream
  Cancelled,    // cancel() was requested
  Overflow,     // telegram exceeded max_frame_bytes; stream desynchronised
};

enum class ConnectionState {
  Disconnected,
  Connecting,
  Connected,
  Failed,
};

const char* to_string(TransportError e);
const char* to_string(ConnectionState s);

// Byte-level channel to one sensor. Blocking calls run on the acquisition
// worker only; cancel() may be called from any thread. No internal retry.
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual TransportError connect(const SensorConfig& cfg) = 0;
  virtual TransportError readFrame(RawFrame& out) = 0;
  virtual void cancel() = 0;
  virtual void close() = 0;
  virtual ConnectionState state() const = 0;
  virtual std::string lastError() const { return {}; }
};
