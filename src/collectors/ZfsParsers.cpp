#include "collectors/ZfsParsers.hpp"
#include "util/Debug.hpp"
#include "util/Units.hpp"

#include <algorithm>
#include <charconv>
#include <cstdio>
#include <ctime>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace zfscheck::collectors {

static std::string_view trim(std::string_view sv) {
  auto issp = [](unsigned char c){ return c==' '||c=='\t'||c=='\r'||c=='\n'; };
  while (!sv.empty() && issp(sv.front())) sv.remove_prefix(1);
  while (!sv.empty() && issp(sv.back())) sv.remove_suffix(1);
  return sv;
}

template <typename T>
static std::optional<T> to_number(std::string_view sv) {
  T v{};
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
  if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
  return v;
}

size_t parse_snapshot_list(std::string_view text, std::vector<model::SnapshotRecord>& out) {
  size_t added = 0;
  std::istringstream ss{std::string(text)};
  std::string line;
  while (std::getline(ss, line)) {
    auto sv = trim(line);
    if (sv.empty()) continue;
    auto sep = sv.find('\t');
    if (sep == std::string_view::npos) sep = sv.find_last_of(' ');
    if (sep == std::string_view::npos) continue;
    auto name = trim(sv.substr(0, sep));
    auto creation = to_number<int64_t>(trim(sv.substr(sep + 1)));
    auto at = name.find('@');
    if (!creation || at == std::string_view::npos || at == 0) {
      if (util::debug_enabled())
        std::fprintf(stderr, "zfscheck: ZfsParsers: skipping snapshot line '%s'\n", line.c_str());
      continue;
    }
    out.push_back(model::SnapshotRecord{std::string(name.substr(0, at)), std::string(name.substr(at + 1)), *creation});
    ++added;
  }
  return added;
}

std::vector<std::string> parse_name_list(std::string_view text) {
  std::vector<std::string> out;
  std::istringstream ss{std::string(text)};
  std::string line;
  while (std::getline(ss, line)) {
    auto sv = trim(line);
    if (!sv.empty()) out.emplace_back(sv);
  }
  return out;
}

std::optional<int64_t> parse_zpool_time(std::string_view text) {
  std::string s(trim(text));
  std::tm tm{};
  const char* end = ::strptime(s.c_str(), "%a %b %d %H:%M:%S %Y", &tm);
  if (!end) return std::nullopt;
  tm.tm_isdst = -1;
  std::time_t t = std::mktime(&tm);
  if (t == static_cast<std::time_t>(-1)) return std::nullopt;
  return static_cast<int64_t>(t);
}

// Joins the "scan:" line and its continuation lines into one string.
static std::string scan_section(std::string_view text) {
  static const std::regex header(R"(^\s*[a-z]+:)");
  std::istringstream ss{std::string(text)};
  std::string line, section;
  bool in = false;
  while (std::getline(ss, line)) {
    if (!in) {
      auto pos = line.find("scan:");
      if (pos != std::string::npos && std::regex_search(line, header)) {
        in = true;
        section = std::string(trim(std::string_view(line).substr(pos + 5)));
      }
      continue;
    }
    if (std::regex_search(line, header)) break;
    auto sv = trim(line);
    if (sv.empty()) continue;
    section += ' ';
    section += sv;
  }
  return section;
}

static const char* kDate = R"((\w{3} \w{3} +\d{1,2} \d{1,2}:\d{2}:\d{2} \d{4}))";

model::ScanState parse_scan_status(std::string_view text, int64_t now) {
  std::string section = scan_section(text);
  if (section.empty()) return model::ScanNone{};

  static const std::regex completed_re(std::string(R"((scrub repaired|resilvered) (\S+) in (.+?) with (\d+) errors on )") + kDate);
  static const std::regex running_re(std::string(R"((scrub|resilver) (?:in progress|paused) since )") + kDate);
  static const std::regex percent_re(R"(([\d.]+)% done)");
  static const std::regex togo_re(R"((\d+ days \d+:\d+:\d+|\d+:\d+:\d+|[\dhms]+) to go)");
  static const std::regex repaired_re(R"((\S+) (?:repaired|resilvered),)");

  std::smatch m;
  if (std::regex_search(section, m, completed_re)) {
    model::ScanCompleted c{};
    c.repaired_bytes = util::parse_size(m[2].str()).value_or(0);
    c.duration_seconds = util::parse_duration(m[3].str()).value_or(0);
    c.error_count = to_number<uint64_t>(m[4].str()).value_or(0);
    auto finished = parse_zpool_time(m[5].str());
    if (!finished) throw std::runtime_error("cannot parse scan completion time '" + m[5].str() + "'");
    c.seconds_since_completion = std::max<int64_t>(0, now - *finished);
    if (m[1].str() == "resilvered") return model::ResilverCompleted{c};
    return model::ScrubCompleted{c};
  }

  if (std::regex_search(section, m, running_re)) {
    model::ScanRunning r{};
    r.resilver = (m[1].str() == "resilver");
    auto started = parse_zpool_time(m[2].str());
    if (!started) throw std::runtime_error("cannot parse scan start time '" + m[2].str() + "'");
    r.elapsed_seconds = std::max<int64_t>(0, now - *started);
    if (std::regex_search(section, m, percent_re)) r.percent_done = to_number<double>(m[1].str()).value_or(0.0);
    if (std::regex_search(section, m, togo_re)) r.seconds_remaining = util::parse_duration(m[1].str()).value_or(0);
    if (std::regex_search(section, m, repaired_re)) r.repaired_bytes = util::parse_size(m[1].str()).value_or(0);
    return r;
  }

  if (util::debug_enabled())
    std::fprintf(stderr, "zfscheck: ZfsParsers: no scan history in '%s'\n", section.c_str());
  return model::ScanNone{};
}

} // namespace zfscheck::collectors
