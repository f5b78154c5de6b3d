#include "ITransport.h"

const char* to_string(TransportError e) {
  switch (e) {
    case TransportError::Ok:          return "ok";
    case TransportError::Unreachable: return "unreachable";
    case TransportError::Timeout:     return "timeout";
    case TransportError::Closed:      return "closed";
    case TransportError::Cancelled:   return "cancelled";
    case TransportError::Overflow:    return "overflow";
  }
  return "unknown";
}

const char* to_string(ConnectionState s) {
  switch (s) {
    case ConnectionState::Disconnected: return "disconnected";
    case ConnectionState::Connecting:   return "connecting";
    case ConnectionState::Connected:    return "connected";
    case ConnectionState::Failed:       return "failed";
  }
  return "unknown";
}
