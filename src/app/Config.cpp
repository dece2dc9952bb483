#include "app/Config.hpp"
#include "util/TomlReader.hpp"

#include <charconv>
#include <cstdlib>

namespace zfscheck::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("ZFSCHECK_", 0) == 0) {
    alt = std::string("zfscheck_") + n.substr(9);
  } else if (n.rfind("zfscheck_", 0) == 0) {
    alt = std::string("ZFSCHECK_") + n.substr(9);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int64_t getenv_int(const char* name, int64_t defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  std::string_view sv(v);
  int64_t out = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
  if (ec != std::errc{} || ptr != sv.data() + sv.size()) return defv;
  return out;
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

// Comma and/or whitespace separated
std::vector<std::string> split_list(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',' || c == ' ' || c == '\t') {
      if (!cur.empty()) { out.push_back(cur); cur.clear(); }
    } else {
      cur += c;
    }
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

std::string config_file_path() {
  if (const char* p = getenv_compat("ZFSCHECK_CONFIG")) return std::string(p);
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/zfscheck/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/zfscheck/config.toml";
  return {};
}

static int64_t resolve_int(const util::TomlReader& toml, bool have_toml,
                           const char* section, const char* key,
                           const char* env_name, int64_t def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

static bool resolve_bool(const util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

static std::string resolve_string(const util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

static std::vector<std::string> resolve_list(const util::TomlReader& toml, bool have_toml,
                                             const char* section, const char* key,
                                             const char* env_name) {
  if (have_toml && toml.has(section, key))
    return toml.get_list(section, key);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return split_list(v);
  }
  return {};
}

bool load_config(const std::string& explicit_path, Config& c, std::string& error) {
  util::TomlReader toml;
  bool have_toml = false;
  if (!explicit_path.empty()) {
    if (!toml.load(explicit_path)) {
      error = "cannot read configuration " + explicit_path;
      return false;
    }
    have_toml = true;
  } else {
    auto path = config_file_path();
    have_toml = !path.empty() && toml.load(path);
  }

  // --- [general] ---
  c.debug = resolve_bool(toml, have_toml, "general", "debug", "ZFSCHECK_DEBUG", false);

  // --- [snapshot] ---
  auto& sn = c.snapshot;
  auto& st = sn.thresholds;
  sn.label              = resolve_string(toml, have_toml, "snapshot", "label",     "ZFSCHECK_SNAPSHOT_LABEL", sn.label);
  sn.pools              = resolve_list(toml, have_toml,   "snapshot", "pools",     "ZFSCHECK_SNAPSHOT_POOLS");
  st.important          = resolve_list(toml, have_toml,   "snapshot", "important", "ZFSCHECK_SNAPSHOT_IMPORTANT");
  st.snapshot_filter    = resolve_string(toml, have_toml, "snapshot", "filter",    "ZFSCHECK_SNAPSHOT_FILTER", "");
  st.ignore_pattern     = resolve_string(toml, have_toml, "snapshot", "ignore",    "ZFSCHECK_SNAPSHOT_IGNORE", "");
  st.newest_warn_minutes = resolve_int(toml, have_toml, "snapshot", "newest_warn_minutes", "ZFSCHECK_NEWEST_WARN_MINUTES", st.newest_warn_minutes);
  st.newest_crit_minutes = resolve_int(toml, have_toml, "snapshot", "newest_crit_minutes", "ZFSCHECK_NEWEST_CRIT_MINUTES", st.newest_crit_minutes);
  st.oldest_warn_days    = resolve_int(toml, have_toml, "snapshot", "oldest_warn_days",    "ZFSCHECK_OLDEST_WARN_DAYS",    st.oldest_warn_days);
  st.oldest_crit_days    = resolve_int(toml, have_toml, "snapshot", "oldest_crit_days",    "ZFSCHECK_OLDEST_CRIT_DAYS",    st.oldest_crit_days);
  st.count_warn          = resolve_int(toml, have_toml, "snapshot", "count_warn",          "ZFSCHECK_COUNT_WARN",          st.count_warn);
  st.count_crit          = resolve_int(toml, have_toml, "snapshot", "count_crit",          "ZFSCHECK_COUNT_CRIT",          st.count_crit);

  // --- [scrub] ---
  auto& sc = c.scrub;
  auto& ct = sc.thresholds;
  sc.label                = resolve_string(toml, have_toml, "scrub", "label", "ZFSCHECK_SCRUB_LABEL", sc.label);
  sc.pools                = resolve_list(toml, have_toml,   "scrub", "pools", "ZFSCHECK_SCRUB_POOLS");
  ct.runtime_warn_seconds = resolve_int(toml, have_toml, "scrub", "runtime_warn_seconds", "ZFSCHECK_RUNTIME_WARN_SECONDS", ct.runtime_warn_seconds);
  ct.runtime_crit_seconds = resolve_int(toml, have_toml, "scrub", "runtime_crit_seconds", "ZFSCHECK_RUNTIME_CRIT_SECONDS", ct.runtime_crit_seconds);
  ct.last_run_warn_days   = resolve_int(toml, have_toml, "scrub", "last_run_warn_days",   "ZFSCHECK_LAST_RUN_WARN_DAYS",   ct.last_run_warn_days);
  ct.last_run_crit_days   = resolve_int(toml, have_toml, "scrub", "last_run_crit_days",   "ZFSCHECK_LAST_RUN_CRIT_DAYS",   ct.last_run_crit_days);

  return true;
}

} // namespace zfscheck::app
