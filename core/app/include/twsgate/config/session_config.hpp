#pragma once

#include "twsgate/domain/types.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

namespace twsgate {

// Raised for unreadable JSON, wrongly typed keys and out-of-range values.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct SessionConfig {
  // gateway
  std::string host{"127.0.0.1"};
  int port{4002};
  int client_id{1};
  std::string account;
  std::string trading_mode{"paper"};

  // timeouts
  std::chrono::seconds connect_timeout{30};
  std::chrono::seconds request_timeout{30};
  std::chrono::milliseconds snapshot_quiet{1500};

  // supervisor
  bool supervisor_enabled{true};
  std::chrono::milliseconds supervisor_interval{5000};

  domain::RequestId request_id_base{10000};

  // ipc
  bool ipc_enabled{true};
  std::string cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string pub_endpoint{"tcp://127.0.0.1:5557"};
};

// -----------------------------------------------------------------------------
// loadSessionConfig(path)
// -----------------------------------------------------------------------------
// @brief  Reads the JSON file at `path`, applies IB_* environment overrides
//         and validates the result.
//
// @details
// A missing file is not an error: every key has a default. A file that
// exists but does not parse is. Overrides, applied after the file:
//
//   IB_HOST  IB_PORT  IB_CLIENT_ID  IB_ACCOUNT  IB_TRADING_MODE
//
// @throws ConfigError
// -----------------------------------------------------------------------------
SessionConfig loadSessionConfig(const std::string& path);

// Parses a JSON document (no environment overrides). Throws ConfigError.
SessionConfig parseSessionConfig(const std::string& json_text);

// Throws ConfigError on the first invalid field.
void validateSessionConfig(const SessionConfig& config);

}  // namespace twsgate
