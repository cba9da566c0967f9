#include "evcore/config/loop_config.hpp"
#include "evcore/errors/dispatch_error.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace evcore {

namespace {

// Reads `key` into `out` when present. get<T>() throws
// nlohmann::json::type_error on a type mismatch; the caller converts it.
template <typename T>
void readOptional(const nlohmann::json& json, const char* key, T& out) {
  auto it = json.find(key);
  if (it != json.end()) {
    out = it->template get<T>();
  }
}

void requireNonNegative(const char* key, std::int64_t value) {
  if (value < 0) {
    throw DispatchError(ErrorKind::ConfigError,
                        std::string(key) + " must be >= 0, got " +
                            std::to_string(value));
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// parseLoopConfig(): JSON object → LoopConfig
// -----------------------------------------------------------------------------
LoopConfig parseLoopConfig(const std::string& json_text) {
  LoopConfig config;

  try {
    auto json = nlohmann::json::parse(json_text);
    if (!json.is_object()) {
      throw DispatchError(ErrorKind::ConfigError,
                          "top-level JSON value must be an object");
    }

    readOptional(json, "scenario", config.scenario);
    readOptional(json, "trace_deliveries", config.trace_deliveries);
    readOptional(json, "idle_slice_ms", config.idle_slice_ms);
    readOptional(json, "control_endpoint", config.control_endpoint);
    readOptional(json, "slow_timer_ms", config.slow_timer_ms);
    readOptional(json, "fast_timer_ms", config.fast_timer_ms);
    readOptional(json, "run_for_ms", config.run_for_ms);
  } catch (const nlohmann::json::exception& e) {
    throw DispatchError(ErrorKind::ConfigError, e.what());
  }

  if (config.idle_slice_ms <= 0) {
    throw DispatchError(ErrorKind::ConfigError,
                        "idle_slice_ms must be > 0, got " +
                            std::to_string(config.idle_slice_ms));
  }
  requireNonNegative("slow_timer_ms", config.slow_timer_ms);
  requireNonNegative("fast_timer_ms", config.fast_timer_ms);
  requireNonNegative("run_for_ms", config.run_for_ms);

  return config;
}

// -----------------------------------------------------------------------------
// loadLoopConfig(): file → parseLoopConfig
// -----------------------------------------------------------------------------
LoopConfig loadLoopConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw DispatchError(ErrorKind::ConfigError,
                        "cannot open config file '" + path + "'");
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return parseLoopConfig(buffer.str());
}

}  // namespace evcore
