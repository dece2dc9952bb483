#include "app/CheckRunner.hpp"
#include "app/Config.hpp"
#include "app/LineRenderer.hpp"
#include "collectors/ZfsSnapshotCollector.hpp"
#include "collectors/ZpoolScrubCollector.hpp"
#include "util/Debug.hpp"

#include <charconv>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

static constexpr const char* kVersion = "1.0.0";

static void usage(std::ostream& os) {
  os << "Usage: zfscheck <snapshots|scrub> [--config PATH] [--pool NAME]... [--label LABEL] [--now EPOCH]\n";
  os << "Notes: one status line per dataset (snapshots) or pool (scrub) on stdout.\n";
  os << "       Settings resolve config file -> ZFSCHECK_* environment -> defaults.\n";
}

static bool parse_epoch(std::string_view s, int64_t& out) {
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc{} && ptr == s.data() + s.size();
}

int main(int argc, char** argv) {
  std::string mode;
  std::string config_path;
  std::string label;
  std::vector<std::string> pools;
  int64_t now = 0;
  bool have_now = false;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) config_path = argv[++i];
    else if (a == "--pool" && i + 1 < argc) pools.emplace_back(argv[++i]);
    else if (a == "--label" && i + 1 < argc) label = argv[++i];
    else if (a == "--now" && i + 1 < argc) {
      if (!parse_epoch(argv[++i], now)) {
        std::cout << zfscheck::app::render_failure("zfscheck", std::string("invalid --now value ") + argv[i]) << "\n";
        return zfscheck::app::kExitUnknown;
      }
      have_now = true;
    }
    else if (a == "-h" || a == "--help") { usage(std::cout); return 0; }
    else if (a == "--version") { std::cout << "zfscheck " << kVersion << "\n"; return 0; }
    else if (mode.empty() && (a == "snapshots" || a == "scrub")) mode = a;
    else {
      std::fprintf(stderr, "zfscheck: unknown argument '%s'\n", a.c_str());
      usage(std::cerr);
      std::cout << zfscheck::app::render_failure("zfscheck", "invalid arguments") << "\n";
      return zfscheck::app::kExitUnknown;
    }
  }
  if (mode.empty()) {
    usage(std::cerr);
    std::cout << zfscheck::app::render_failure("zfscheck", "no check selected") << "\n";
    return zfscheck::app::kExitUnknown;
  }

  zfscheck::app::Config cfg;
  std::string error;
  if (!zfscheck::app::load_config(config_path, cfg, error)) {
    std::fprintf(stderr, "zfscheck: Config: %s\n", error.c_str());
    const auto& fallback = (mode == "scrub") ? cfg.scrub.label : cfg.snapshot.label;
    std::cout << zfscheck::app::render_failure(label.empty() ? fallback : label, error) << "\n";
    return zfscheck::app::kExitUnknown;
  }
  zfscheck::util::set_debug(cfg.debug);

  if (!have_now) {
    now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
  }

  if (mode == "scrub") {
    if (!label.empty()) cfg.scrub.label = label;
    if (!pools.empty()) cfg.scrub.pools = pools;
    zfscheck::collectors::ZpoolScrubCollector source;
    return zfscheck::app::run_scrub_check(cfg.scrub, source, now, std::cout);
  }

  if (!label.empty()) cfg.snapshot.label = label;
  if (!pools.empty()) cfg.snapshot.pools = pools;
  zfscheck::collectors::ZfsSnapshotCollector source;
  return zfscheck::app::run_snapshot_check(cfg.snapshot, source, now, std::cout);
}
