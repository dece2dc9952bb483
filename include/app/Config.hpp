#pragma once

#include "app/Thresholds.hpp"
#include <string>
#include <vector>

namespace zfscheck::app {

struct SnapshotCheckConfig {
  std::string label{"zfs_snapshot"};
  std::vector<std::string> pools;     // empty: all pools
  SnapshotThresholds thresholds;
};

struct ScrubCheckConfig {
  std::string label{"zfs_scrub"};
  std::vector<std::string> pools;     // empty: all pools
  ScrubThresholds thresholds;
};

struct Config {
  bool debug{false};
  SnapshotCheckConfig snapshot;
  ScrubCheckConfig scrub;
};

// Default location: $ZFSCHECK_CONFIG, $XDG_CONFIG_HOME/zfscheck/config.toml,
// then ~/.config/zfscheck/config.toml. Empty if none can be derived.
std::string config_file_path();

// Resolves every setting TOML -> environment -> compiled default.
// With an empty 'explicit_path' the default location is used and a missing
// file just means defaults. An explicit path that cannot be read fails.
bool load_config(const std::string& explicit_path, Config& out, std::string& error);

// Environment helpers (ZFSCHECK_X and zfscheck_X are equivalent)
const char* getenv_compat(const char* name);
int64_t getenv_int(const char* name, int64_t defv);
std::vector<std::string> split_list(const std::string& s);

} // namespace zfscheck::app
