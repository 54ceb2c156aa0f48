#pragma once

#include <cctype>
#include <charconv>
#include <fstream>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <system_error>

namespace gpuwatch::util {

// Reads the flat TOML subset gpuwatch's config uses: [section] headers,
// key = value lines, '#' comments, single or double quoted strings.
// Keys before the first header belong to section "". A repeated key keeps
// the last value. Arrays and inline tables are not supported.
class TomlReader {
public:
  bool load(const std::string& path) {
    values_.clear();
    std::ifstream in(path);
    if (!in) return false;
    std::string section;
    for (std::string raw; std::getline(in, raw);) {
      std::string_view line = trim(raw);
      if (line.empty() || line.front() == '#') continue;
      if (line.front() == '[') {
        if (auto end = line.find(']'); end != std::string_view::npos) {
          section = std::string(trim(line.substr(1, end - 1)));
          values_[section];
        }
        continue;
      }
      auto eq = line.find('=');
      if (eq == std::string_view::npos) continue;
      auto key = trim(line.substr(0, eq));
      if (key.empty()) continue;
      values_[section][std::string(key)] = unquote(trim(line.substr(eq + 1)));
    }
    return true;
  }

  [[nodiscard]] bool has(std::string_view sec, std::string_view key) const {
    return lookup(sec, key) != nullptr;
  }

  [[nodiscard]] std::string get_string(std::string_view sec, std::string_view key,
                                       const std::string& def = "") const {
    const std::string* v = lookup(sec, key);
    return v ? *v : def;
  }

  // Whole value must be an integer; anything else yields def.
  [[nodiscard]] int get_int(std::string_view sec, std::string_view key, int def = 0) const {
    const std::string* v = lookup(sec, key);
    if (!v || v->empty()) return def;
    int n = 0;
    const char* last = v->data() + v->size();
    auto [ptr, ec] = std::from_chars(v->data(), last, n);
    return (ec == std::errc{} && ptr == last) ? n : def;
  }

  [[nodiscard]] bool get_bool(std::string_view sec, std::string_view key, bool def = false) const {
    const std::string* v = lookup(sec, key);
    if (!v) return def;
    if (*v == "true" || *v == "True" || *v == "TRUE" || *v == "1") return true;
    if (*v == "false" || *v == "False" || *v == "FALSE" || *v == "0") return false;
    return def;
  }

private:
  using Table = std::map<std::string, std::string, std::less<>>;
  std::map<std::string, Table, std::less<>> values_;

  [[nodiscard]] const std::string* lookup(std::string_view sec, std::string_view key) const {
    auto s = values_.find(sec);
    if (s == values_.end()) return nullptr;
    auto k = s->second.find(key);
    return k == s->second.end() ? nullptr : &k->second;
  }

  // Quoted values end at the closing quote; bare values at a '#'.
  static std::string unquote(std::string_view v) {
    if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
      auto close = v.find(v.front(), 1);
      return std::string(close == std::string_view::npos ? v.substr(1) : v.substr(1, close - 1));
    }
    if (auto hash = v.find('#'); hash != std::string_view::npos) v = trim(v.substr(0, hash));
    return std::string(v);
  }

  static std::string_view trim(std::string_view sv) {
    std::size_t b = 0, e = sv.size();
    while (b < e && std::isspace(static_cast<unsigned char>(sv[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(sv[e - 1]))) --e;
    return sv.substr(b, e - b);
  }
};

} // namespace gpuwatch::util
