#pragma once

#include <string>
#include "core/BlockSortConfig.hpp"
#include "util/TomlReader.hpp"

namespace blocksort::app {

// Upper bounds accepted for config values; anything outside falls back to
// the compiled default.
constexpr long long kMaxCacheLineBytes = 4096;
constexpr long long kMaxElementSize = 1024;

// $XDG_CONFIG_HOME/blocksort/config.toml, else ~/.config/blocksort/config.toml,
// else empty.
std::string config_file_path();

// getenv that also accepts the lowercase "blocksort_" spelling.
const char* getenv_compat(const char* name);

// Resolves each [sort] field as TOML -> environment -> default.
// toml may be null (environment and defaults only).
core::BlockSortConfig resolve_settings(const util::TomlReader* toml);

// Loads path (if non-empty) and resolves. A missing file is only reported
// when 'required' is set; resolution then continues without it.
core::BlockSortConfig load_settings(const std::string& path, bool required = false);

} // namespace blocksort::app
