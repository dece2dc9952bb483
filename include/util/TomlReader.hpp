#pragma once

#include <cctype>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace zfscheck::util {

// Reader for the flat TOML subset used by the check configuration:
// [section] headers, key = value pairs, basic ("...") and literal ('...')
// strings, integers, booleans, single-line string arrays and '#' comments.
class TomlReader {
public:
  bool load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::stringstream buf;
    buf << in.rdbuf();
    parse(buf.str());
    return true;
  }

  void parse(std::string_view text) {
    sections_.clear();
    std::string current_section;
    size_t pos = 0;
    while (pos <= text.size()) {
      size_t nl = text.find('\n', pos);
      auto raw = text.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
      pos = (nl == std::string_view::npos) ? text.size() + 1 : nl + 1;

      auto sv = trim(strip_comment(raw));
      if (sv.empty()) continue;
      if (sv.front() == '[' && sv.back() == ']') {
        current_section = std::string(trim(sv.substr(1, sv.size() - 2)));
        ensure_section(current_section);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) continue;
      std::string key(trim(sv.substr(0, eq)));
      std::string val(trim(sv.substr(eq + 1)));
      ensure_section(current_section).set(key, val);
    }
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                       const std::string& def = "") const {
    const auto* s = find_section(section);
    if (!s || !s->has(key)) return def;
    return unquote(s->get(key, def));
  }

  [[nodiscard]] int64_t get_int(std::string_view section, std::string_view key, int64_t def = 0) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto val = s->get(key, "");
    if (val.empty()) return def;
    int64_t v = 0;
    auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), v);
    if (ec != std::errc{} || ptr != val.data() + val.size()) return def;
    return v;
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto val = s->get(key, "");
    if (val.empty()) return def;
    if (val == "true" || val == "True" || val == "TRUE" || val == "1") return true;
    if (val == "false" || val == "False" || val == "FALSE" || val == "0") return false;
    return def;
  }

  // ["a", "b"] -> {a, b}. A bare string becomes a one-element list.
  [[nodiscard]] std::vector<std::string> get_list(std::string_view section, std::string_view key) const {
    std::vector<std::string> out;
    const auto* s = find_section(section);
    if (!s || !s->has(key)) return out;
    auto val = s->get(key, "");
    std::string_view sv(val);
    if (sv.size() >= 2 && sv.front() == '[' && sv.back() == ']') {
      sv = sv.substr(1, sv.size() - 2);
      size_t start = 0;
      while (start <= sv.size()) {
        size_t comma = find_unquoted(sv, ',', start);
        auto item = trim(sv.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start));
        if (!item.empty()) out.push_back(unquote(std::string(item)));
        if (comma == std::string_view::npos) break;
        start = comma + 1;
      }
      return out;
    }
    if (!val.empty()) out.push_back(unquote(val));
    return out;
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

  static size_t find_unquoted(std::string_view sv, char c, size_t from = 0) {
    char quote = 0;
    for (size_t i = from; i < sv.size(); ++i) {
      if (quote) {
        if (quote == '"' && sv[i] == '\\') ++i;
        else if (sv[i] == quote) quote = 0;
      } else if (sv[i] == '"' || sv[i] == '\'') {
        quote = sv[i];
      } else if (sv[i] == c) {
        return i;
      }
    }
    return std::string_view::npos;
  }

  // '#' outside of quotes starts a comment
  static std::string_view strip_comment(std::string_view sv) {
    auto hash = find_unquoted(sv, '#');
    return hash == std::string_view::npos ? sv : sv.substr(0, hash);
  }

  // 'literal' is taken verbatim; "basic" resolves \\ \" \n \t escapes.
  static std::string unquote(const std::string& val) {
    if (val.size() >= 2 && val.front() == '\'' && val.back() == '\'')
      return val.substr(1, val.size() - 2);
    if (val.size() < 2 || val.front() != '"' || val.back() != '"') return val;
    std::string out;
    out.reserve(val.size() - 2);
    for (size_t i = 1; i + 1 < val.size(); ++i) {
      char c = val[i];
      if (c != '\\' || i + 2 >= val.size()) { out += c; continue; }
      switch (val[++i]) {
        case 'n': out += '\n'; break;
        case 't': out += '\t'; break;
        case '"': out += '"'; break;
        case '\\': out += '\\'; break;
        default: out += '\\'; out += val[i]; break;
      }
    }
    return out;
  }
};

} // namespace zfscheck::util
