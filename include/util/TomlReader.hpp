#pragma once

#include <cctype>
#include <charconv>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blocksort::util {

// Whole-string decimal integer with an optional leading sign. nullopt on
// empty input, trailing characters or overflow.
inline std::optional<long long> parse_integer(std::string_view s) {
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return std::nullopt;
  long long out = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

// Minimal reader for the flat TOML subset used by blocksort config files:
// [section] headers, key = value pairs, "double" or 'single' quoted strings,
// and # comments (full-line or trailing an unquoted value).
class TomlReader {
public:
  bool load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return false;
    sections_.clear();
    current_section_.clear();
    std::string line;
    while (std::getline(in, line)) parse_line(line);
    return true;
  }

  // Same grammar as load(), from an in-memory document.
  void parse(std::string_view text) {
    sections_.clear();
    current_section_.clear();
    while (!text.empty()) {
      auto nl = text.find('\n');
      parse_line(text.substr(0, nl));
      if (nl == std::string_view::npos) break;
      text.remove_prefix(nl + 1);
    }
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                        const std::string& def = "") const {
    const auto* s = find_section(section);
    return s ? s->get(key, def) : def;
  }

  // nullopt when the key is missing or the value is not a whole integer
  [[nodiscard]] std::optional<long long> get_integer(std::string_view section,
                                                     std::string_view key) const {
    const auto* s = find_section(section);
    if (!s || !s->has(key)) return std::nullopt;
    return parse_integer(s->get(key, ""));
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    auto v = get_integer(section, key);
    return v ? static_cast<int>(*v) : def;
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto val = s->get(key, "");
    if (val == "true" || val == "True" || val == "TRUE" || val == "1") return true;
    if (val == "false" || val == "False" || val == "FALSE" || val == "0") return false;
    return def;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    const auto* s = find_section(section);
    return s && s->has(key);
  }

private:
  struct Section {
    std::vector<std::pair<std::string, std::string>> entries;

    [[nodiscard]] std::string get(std::string_view key, const std::string& def) const {
      for (const auto& [k, v] : entries)
        if (k == key) return v;
      return def;
    }

    void set(const std::string& key, const std::string& val) {
      for (auto& [k, v] : entries) {
        if (k == key) { v = val; return; }
      }
      entries.emplace_back(key, val);
    }

    [[nodiscard]] bool has(std::string_view key) const {
      for (const auto& [k, v] : entries)
        if (k == key) return true;
      return false;
    }
  };

  std::vector<std::pair<std::string, Section>> sections_;
  std::string current_section_;

  void parse_line(std::string_view raw) {
    auto sv = trim(raw);
    if (sv.empty() || sv[0] == '#') return;
    if (sv.front() == '[') {
      auto close = sv.find(']');
      if (close == std::string_view::npos) return;
      current_section_ = std::string(trim(sv.substr(1, close - 1)));
      ensure_section(current_section_);
      return;
    }
    auto eq = sv.find('=');
    if (eq == std::string_view::npos) return;
    std::string key(trim(sv.substr(0, eq)));
    if (key.empty()) return;
    ensure_section(current_section_).set(key, parse_value(trim(sv.substr(eq + 1))));
  }

  static std::string parse_value(std::string_view v) {
    if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
      auto close = v.find(v.front(), 1);
      if (close != std::string_view::npos) return std::string(v.substr(1, close - 1));
      return std::string(v.substr(1));
    }
    auto hash = v.find('#');
    if (hash != std::string_view::npos) v = trim(v.substr(0, hash));
    return std::string(v);
  }

  Section& ensure_section(const std::string& name) {
    for (auto& [n, s] : sections_)
      if (n == name) return s;
    sections_.emplace_back(name, Section{});
    return sections_.back().second;
  }

  [[nodiscard]] const Section* find_section(std::string_view name) const {
    for (const auto& [n, s] : sections_)
      if (n == name) return &s;
    return nullptr;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }
};

} // namespace blocksort::util
