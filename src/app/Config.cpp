#include "app/Config.hpp"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <filesystem>

namespace windwatch::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("WINDWATCH_", 0) == 0) {
    alt = std::string("windwatch_") + n.substr(10);
  } else if (n.rfind("windwatch_", 0) == 0) {
    alt = std::string("WINDWATCH_") + n.substr(10);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) { return defv; }
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/windwatch/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/windwatch/config.toml";
  return {};
}

static std::string pick_string(const util::TomlReader& toml, const char* key,
                               const char* env, const std::string& defv) {
  if (toml.has("api", key)) return toml.get_string("api", key);
  if (const char* v = getenv_compat(env)) return v;
  return defv;
}

static int pick_int(const util::TomlReader& toml, const char* key, const char* env, int defv) {
  if (toml.has("api", key)) return toml.get_int("api", key, defv);
  return getenv_int(env, defv);
}

AppConfig resolve_config(const util::TomlReader& toml) {
  AppConfig cfg;
  auto& ep = cfg.endpoints;
  ep.base_url = pick_string(toml, "base_url", "WINDWATCH_BASE_URL", ep.base_url);
  ep.dataset = pick_int(toml, "dataset", "WINDWATCH_DATASET", ep.dataset);
  ep.page_size = std::clamp(pick_int(toml, "page_size", "WINDWATCH_PAGE_SIZE", ep.page_size),
                            1, kMaxPageSize);
  cfg.timeout_s = std::clamp<long>(pick_int(toml, "timeout_s", "WINDWATCH_TIMEOUT_S",
                                            static_cast<int>(cfg.timeout_s)),
                                   1, kMaxTimeoutS);

  if (toml.has("api", "api_key")) {
    cfg.api_key = toml.get_string("api", "api_key");
  } else if (const char* k = std::getenv("OPENDATA_API_KEY"); k && *k) {
    cfg.api_key = k;
  } else if (const char* k2 = getenv_compat("WINDWATCH_API_KEY")) {
    cfg.api_key = k2;
  }
  return cfg;
}

AppConfig load_config(const std::optional<std::string>& explicit_path) {
  util::TomlReader toml;
  std::string source = "defaults";

  if (explicit_path) {
    if (!toml.load(*explicit_path)) {
      throw ConfigError("cannot read config file '" + *explicit_path + "'");
    }
    source = *explicit_path;
  } else {
    std::string path = config_file_path();
    std::error_code ec;
    if (!path.empty() && std::filesystem::exists(path, ec)) {
      if (toml.load(path)) {
        source = path;
      } else {
        std::fprintf(stderr, "windwatch: Config: cannot read %s, using defaults\n", path.c_str());
      }
    }
  }

  AppConfig cfg = resolve_config(toml);
  cfg.source = source;
  std::fprintf(stderr, "windwatch: Config: %s (dataset %d, page size %d, timeout %lds, api key %s)\n",
               cfg.source.c_str(), cfg.endpoints.dataset, cfg.endpoints.page_size,
               cfg.timeout_s, cfg.api_key.empty() ? "unset" : "set");
  return cfg;
}

} // namespace windwatch::app
