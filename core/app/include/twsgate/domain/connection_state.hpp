#pragma once

namespace twsgate {
namespace domain {

enum class ConnectionState {
  Disconnected,
  Connecting,
  Connected,
  Error,  // Fatal code or dropped socket; the supervisor will reconnect
};

inline const char* toString(ConnectionState state) {
  switch (state) {
    case ConnectionState::Disconnected: return "Disconnected";
    case ConnectionState::Connecting:   return "Connecting";
    case ConnectionState::Connected:    return "Connected";
    case ConnectionState::Error:        return "Error";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace twsgate
