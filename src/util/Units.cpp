#include "util/Units.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>

namespace zfscheck::util {

static constexpr std::string_view kUnits = "KMGTPEZY";

static std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
  return sv;
}

auto parse_size(std::string_view text) -> std::optional<uint64_t> {
  auto sv = trim(text);
  if (sv.empty()) return std::nullopt;
  if (sv.back() == 'B' || sv.back() == 'b') sv.remove_suffix(1);
  if (sv.empty()) return std::nullopt;

  int exponent = 0;
  char last = static_cast<char>(std::toupper(static_cast<unsigned char>(sv.back())));
  if (auto pos = kUnits.find(last); pos != std::string_view::npos) {
    exponent = static_cast<int>(pos) + 1;
    sv.remove_suffix(1);
  }
  if (sv.empty()) return std::nullopt;

  double value = 0.0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
  if (ec != std::errc{} || ptr != sv.data() + sv.size() || value < 0.0) return std::nullopt;
  double bytes = value * std::pow(1024.0, exponent);
  if (bytes >= 18446744073709551615.0) return std::nullopt;
  return static_cast<uint64_t>(bytes);
}

static std::optional<int64_t> to_int(std::string_view sv) {
  int64_t v = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
  if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
  return v;
}

// hh:mm:ss
static std::optional<int64_t> parse_clock(std::string_view sv) {
  int64_t total = 0;
  int fields = 0;
  while (!sv.empty()) {
    auto colon = sv.find(':');
    auto part = sv.substr(0, colon);
    auto v = to_int(part);
    if (!v) return std::nullopt;
    total = total * 60 + *v;
    ++fields;
    if (colon == std::string_view::npos) break;
    sv.remove_prefix(colon + 1);
  }
  if (fields < 2 || fields > 3) return std::nullopt;
  return total;
}

// 3h12m, 1d2h, 45s
static std::optional<int64_t> parse_units(std::string_view sv) {
  int64_t total = 0;
  size_t i = 0;
  bool any = false;
  while (i < sv.size()) {
    size_t start = i;
    while (i < sv.size() && std::isdigit(static_cast<unsigned char>(sv[i]))) ++i;
    if (start == i || i >= sv.size()) return std::nullopt;
    auto v = to_int(sv.substr(start, i - start));
    if (!v) return std::nullopt;
    switch (sv[i]) {
      case 'd': total += *v * 86400; break;
      case 'h': total += *v * 3600; break;
      case 'm': total += *v * 60; break;
      case 's': total += *v; break;
      default: return std::nullopt;
    }
    ++i;
    any = true;
  }
  if (!any) return std::nullopt;
  return total;
}

auto parse_duration(std::string_view text) -> std::optional<int64_t> {
  auto sv = trim(text);
  if (sv.empty()) return std::nullopt;

  int64_t days = 0;
  if (auto pos = sv.find(" days "); pos != std::string_view::npos) {
    auto d = to_int(trim(sv.substr(0, pos)));
    if (!d) return std::nullopt;
    days = *d;
    sv = trim(sv.substr(pos + 6));
  }
  std::optional<int64_t> rest = (sv.find(':') != std::string_view::npos) ? parse_clock(sv) : parse_units(sv);
  if (!rest) return std::nullopt;
  return days * 86400 + *rest;
}

auto human_bytes(uint64_t bytes) -> std::string {
  if (bytes < 1024) return std::to_string(bytes) + "B";
  double v = static_cast<double>(bytes);
  size_t idx = 0;
  while (v >= 1024.0 && idx < kUnits.size()) { v /= 1024.0; ++idx; }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f%c", v, kUnits[idx - 1]);
  return buf;
}

auto format_duration(int64_t seconds) -> std::string {
  if (seconds < 0) seconds = 0;
  int64_t days = seconds / 86400;
  int64_t rem = seconds % 86400;
  char buf[48];
  if (days > 0) {
    std::snprintf(buf, sizeof(buf), "%lldd %02lld:%02lld:%02lld", static_cast<long long>(days),
                  static_cast<long long>(rem / 3600), static_cast<long long>((rem / 60) % 60),
                  static_cast<long long>(rem % 60));
  } else {
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld", static_cast<long long>(rem / 3600),
                  static_cast<long long>((rem / 60) % 60), static_cast<long long>(rem % 60));
  }
  return buf;
}

} // namespace zfscheck::util
