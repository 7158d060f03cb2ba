#include "twsgate/config/session_config.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace twsgate {

namespace {

template <typename T>
void read(const nlohmann::json& section, const char* key, T& out) {
  if (section.contains(key)) {
    out = section.at(key).get<T>();
  }
}

const nlohmann::json& sectionOf(const nlohmann::json& root, const char* name) {
  static const nlohmann::json kEmpty = nlohmann::json::object();
  if (!root.contains(name)) {
    return kEmpty;
  }
  const auto& section = root.at(name);
  if (!section.is_object()) {
    throw ConfigError(std::string("config: '") + name +
                      "' must be an object");
  }
  return section;
}

int parseIntEnv(const char* name, const char* text) {
  errno = 0;
  char* end = nullptr;
  const long value = std::strtol(text, &end, 10);
  if (end == text || *end != '\0' || errno == ERANGE) {
    throw ConfigError(std::string(name) + "='" + text +
                      "' is not an integer");
  }
  return static_cast<int>(value);
}

void applyEnvironment(SessionConfig& config) {
  if (const char* v = std::getenv("IB_HOST")) {
    config.host = v;
  }
  if (const char* v = std::getenv("IB_PORT")) {
    config.port = parseIntEnv("IB_PORT", v);
  }
  if (const char* v = std::getenv("IB_CLIENT_ID")) {
    config.client_id = parseIntEnv("IB_CLIENT_ID", v);
  }
  if (const char* v = std::getenv("IB_ACCOUNT")) {
    config.account = v;
  }
  if (const char* v = std::getenv("IB_TRADING_MODE")) {
    config.trading_mode = v;
  }
}

}  // namespace

SessionConfig parseSessionConfig(const std::string& json_text) {
  SessionConfig config;

  try {
    const auto root = nlohmann::json::parse(json_text);
    if (!root.is_object()) {
      throw ConfigError("config: top level must be an object");
    }

    const auto& gateway = sectionOf(root, "gateway");
    read(gateway, "host", config.host);
    read(gateway, "port", config.port);
    read(gateway, "client_id", config.client_id);
    read(gateway, "account", config.account);
    read(gateway, "trading_mode", config.trading_mode);

    const auto& timeouts = sectionOf(root, "timeouts");
    if (timeouts.contains("connect_s")) {
      config.connect_timeout =
          std::chrono::seconds(timeouts.at("connect_s").get<int>());
    }
    if (timeouts.contains("request_s")) {
      config.request_timeout =
          std::chrono::seconds(timeouts.at("request_s").get<int>());
    }
    if (timeouts.contains("snapshot_quiet_ms")) {
      config.snapshot_quiet = std::chrono::milliseconds(
          timeouts.at("snapshot_quiet_ms").get<int>());
    }

    const auto& supervisor = sectionOf(root, "supervisor");
    read(supervisor, "enabled", config.supervisor_enabled);
    if (supervisor.contains("interval_ms")) {
      config.supervisor_interval = std::chrono::milliseconds(
          supervisor.at("interval_ms").get<int>());
    }

    read(root, "request_id_base", config.request_id_base);

    const auto& ipc = sectionOf(root, "ipc");
    read(ipc, "enabled", config.ipc_enabled);
    read(ipc, "cmd_endpoint", config.cmd_endpoint);
    read(ipc, "pub_endpoint", config.pub_endpoint);
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("config: ") + e.what());
  }

  return config;
}

void validateSessionConfig(const SessionConfig& config) {
  if (config.host.empty()) {
    throw ConfigError("config: gateway.host must not be empty");
  }
  if (config.port < 1 || config.port > 65535) {
    throw ConfigError("config: gateway.port " + std::to_string(config.port) +
                      " outside 1..65535");
  }
  if (config.client_id < 0) {
    throw ConfigError("config: gateway.client_id must be >= 0");
  }
  if (config.trading_mode != "paper" && config.trading_mode != "live") {
    throw ConfigError("config: gateway.trading_mode must be 'paper' or "
                      "'live', got '" + config.trading_mode + "'");
  }
  if (config.connect_timeout.count() <= 0 ||
      config.request_timeout.count() <= 0 ||
      config.snapshot_quiet.count() <= 0) {
    throw ConfigError("config: timeouts must be positive");
  }
  if (config.supervisor_interval.count() <= 0) {
    throw ConfigError("config: supervisor.interval_ms must be positive");
  }
  if (config.request_id_base < 0) {
    throw ConfigError("config: request_id_base must be >= 0");
  }
}

SessionConfig loadSessionConfig(const std::string& path) {
  SessionConfig config;

  std::ifstream in(path);
  if (in) {
    std::stringstream buffer;
    buffer << in.rdbuf();
    config = parseSessionConfig(buffer.str());
    std::cout << "[SessionConfig] loaded " << path << "\n";
  } else {
    std::cout << "[SessionConfig] " << path
              << " not found, using defaults.\n";
  }

  applyEnvironment(config);
  validateSessionConfig(config);
  return config;
}

}  // namespace twsgate
