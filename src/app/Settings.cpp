#include "app/Settings.hpp"
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string_view>

namespace blocksort::app {

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/blocksort/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/blocksort/config.toml";
  return {};
}

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("BLOCKSORT_", 0) == 0) {
    alt = std::string("blocksort_") + n.substr(10);
  } else if (n.rfind("blocksort_", 0) == 0) {
    alt = std::string("BLOCKSORT_") + n.substr(10);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

// Resolve one size field from TOML -> env -> compiled default, rejecting
// anything outside [1, max].
static size_t resolve_size(const util::TomlReader* toml, const char* key,
                           const char* env_name, size_t def, long long max) {
  auto accept = [&](std::optional<long long> v, const char* origin, const std::string& raw) -> std::optional<size_t> {
    if (v && *v >= 1 && *v <= max) return static_cast<size_t>(*v);
    std::fprintf(stderr, "blocksort: config: %s %s = '%s' rejected (want 1..%lld), using %zu\n",
                 origin, key, raw.c_str(), max, def);
    return std::nullopt;
  };

  if (toml && toml->has("sort", key)) {
    std::string raw = toml->get_string("sort", key);
    auto v = accept(toml->get_integer("sort", key), "[sort]", raw);
    return v ? *v : def;
  }
  if (const char* env = getenv_compat(env_name)) {
    auto v = accept(util::parse_integer(env), env_name, env);
    return v ? *v : def;
  }
  return def;
}

core::BlockSortConfig resolve_settings(const util::TomlReader* toml) {
  const core::BlockSortConfig defaults{};
  core::BlockSortConfig c{};
  c.cache_line_bytes = resolve_size(toml, "cache_line_bytes", "BLOCKSORT_CACHE_LINE_BYTES",
                                    defaults.cache_line_bytes, kMaxCacheLineBytes);
  c.element_size = resolve_size(toml, "element_size", "BLOCKSORT_ELEMENT_SIZE",
                                defaults.element_size, kMaxElementSize);
  c.min_block = resolve_size(toml, "min_block", "BLOCKSORT_MIN_BLOCK",
                             defaults.min_block, LLONG_MAX);
  return c;
}

core::BlockSortConfig load_settings(const std::string& path, bool required) {
  if (path.empty()) return resolve_settings(nullptr);
  util::TomlReader toml;
  if (!toml.load(path)) {
    if (required) std::fprintf(stderr, "blocksort: config: cannot read %s\n", path.c_str());
    return resolve_settings(nullptr);
  }
  return resolve_settings(&toml);
}

} // namespace blocksort::app
