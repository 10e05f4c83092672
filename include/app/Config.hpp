#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include "data/GenerationApi.hpp"
#include "util/TomlReader.hpp"

namespace windwatch::app {

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct AppConfig {
  data::ApiEndpoints endpoints;
  std::string api_key;     // empty: no x-api-key header
  long timeout_s{30};
  std::string source;      // file the values came from, or "defaults"
};

inline constexpr int kMaxPageSize = 20000;
inline constexpr long kMaxTimeoutS = 600;

// Looks up NAME, then the same name with the WINDWATCH_/windwatch_ prefix case flipped.
// Empty values count as unset.
[[nodiscard]] const char* getenv_compat(const char* name);
[[nodiscard]] int getenv_int(const char* name, int defv);

// $XDG_CONFIG_HOME/windwatch/config.toml, else ~/.config/windwatch/config.toml; empty if neither is set.
[[nodiscard]] std::string config_file_path();

// TOML value, then environment, then default; numeric values clamped to their ranges.
[[nodiscard]] AppConfig resolve_config(const util::TomlReader& toml);

// Reads `explicit_path` (must exist) or the default path (may be missing) and resolves.
// Throws ConfigError for a missing explicit file.
[[nodiscard]] AppConfig load_config(const std::optional<std::string>& explicit_path);

} // namespace windwatch::app
