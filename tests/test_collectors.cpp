#include "minitest.hpp"
#include "app/CheckRunner.hpp"
#include "collectors/ZfsParsers.hpp"
#include "collectors/ZfsSnapshotCollector.hpp"
#include "collectors/ZpoolScrubCollector.hpp"
#include "util/Command.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>
#include <sys/stat.h>

namespace fs = std::filesystem;

static fs::path mock_tool(const char* name, const std::string& body) {
  auto root = fs::temp_directory_path() / fs::path("zfscheck_test_tools_") / fs::path(std::to_string(::getpid()));
  fs::create_directories(root);
  auto script = root / name;
  {
    std::ofstream out(script);
    out << "#!/bin/sh\n" << body;
  }
  ::chmod(script.c_str(), 0755);
  return script;
}

// Simulate `zfs list` for snapshots and usedbysnapshots
TEST(zfs_collector_lists_snapshots) {
  auto script = mock_tool("zfs",
    "if [ \"$5\" = \"snapshot\" ]; then\n"
    "  if [ \"$8\" = \"-r\" ]; then printf '%s@only\\t100\\n' \"$9\"; exit 0; fi\n"
    "  printf 'tank/data@a\\t1699990000\\ntank/data@b\\t1699999000\\ngarbage\\n'\n"
    "  exit 0\n"
    "fi\n"
    "if [ \"$4\" = \"usedbysnapshots\" ]; then\n"
    "  case \"$5\" in tank/data) echo '1.5K' ;; *) exit 1 ;; esac\n"
    "  exit 0\n"
    "fi\n"
    "exit 2\n");
  ::setenv("ZFSCHECK_ZFS_PATH", script.c_str(), 1);

  zfscheck::collectors::ZfsSnapshotCollector c;
  std::vector<zfscheck::model::SnapshotRecord> records;
  ASSERT_TRUE(c.list({}, records));
  ASSERT_EQ(records.size(), 2u);
  ASSERT_EQ(records[1].snapshot, std::string("b"));
  ASSERT_EQ(records[1].creation, 1699999000);

  records.clear();
  ASSERT_TRUE(c.list({"rpool"}, records));
  ASSERT_EQ(records.size(), 1u);
  ASSERT_EQ(records[0].dataset, std::string("rpool"));

  uint64_t used = 0;
  ASSERT_TRUE(c.used_bytes("tank/data", used));
  ASSERT_EQ(used, 1536u);
  ASSERT_TRUE(!c.used_bytes("tank/none", used));
  ASSERT_CONTAINS(c.last_error(), "tank/none");
  ::unsetenv("ZFSCHECK_ZFS_PATH");
}

TEST(zfs_collector_reports_failed_listing) {
  auto script = mock_tool("zfs-broken", "exit 1\n");
  ::setenv("ZFSCHECK_ZFS_PATH", script.c_str(), 1);
  zfscheck::collectors::ZfsSnapshotCollector c;
  std::vector<zfscheck::model::SnapshotRecord> records;
  ASSERT_TRUE(!c.list({}, records));
  ASSERT_EQ(c.last_error(), std::string("zfs list failed (exit 1)"));
  ::unsetenv("ZFSCHECK_ZFS_PATH");
}

// Simulate `zpool list` and `zpool status` and run the scrub check end to end
TEST(zpool_collector_scrub_check) {
  auto script = mock_tool("zpool",
    "case \"$1\" in\n"
    "  list) printf 'tank\\nrpool\\n' ;;\n"
    "  status)\n"
    "    case \"$2\" in\n"
    "      tank) printf '  pool: tank\\n state: ONLINE\\n  scan: scrub repaired 0B in 00:05:09 with 0 errors on Sun Oct 13 00:29:13 2024\\nconfig:\\n' ;;\n"
    "      rpool) printf '  pool: rpool\\n state: ONLINE\\n  scan: none requested\\nconfig:\\n' ;;\n"
    "      *) exit 1 ;;\n"
    "    esac ;;\n"
    "  *) exit 1 ;;\n"
    "esac\n");
  ::setenv("ZFSCHECK_ZPOOL_PATH", script.c_str(), 1);

  zfscheck::collectors::ZpoolScrubCollector c;
  std::vector<std::string> pools;
  ASSERT_TRUE(c.pools(pools));
  ASSERT_EQ(pools, (std::vector<std::string>{"tank", "rpool"}));

  int64_t finished = zfscheck::collectors::parse_zpool_time("Sun Oct 13 00:29:13 2024").value();
  int64_t now = finished + 45 * 86400 + 10;
  zfscheck::model::ScrubFacts facts;
  ASSERT_TRUE(!c.status("missing", now, facts));
  ASSERT_CONTAINS(c.last_error(), "missing");

  zfscheck::app::ScrubCheckConfig cfg;
  std::ostringstream out;
  ASSERT_EQ(zfscheck::app::run_scrub_check(cfg, c, now, out), zfscheck::app::kExitOk);
  ASSERT_EQ(out.str(),
            std::string("1 zfs_scrub:rpool - no scrubbing information.\n"
                        "0 zfs_scrub:tank last_run=3888010;5184000;7776000|runtime=309|errors=0|repaired=0 "
                        "last scrub finished 45 days ago, took 00:05:09, repaired 0B, 0 errors\n"));
  ::unsetenv("ZFSCHECK_ZPOOL_PATH");
}

TEST(missing_tool_is_reported) {
  ::setenv("ZFSCHECK_ZPOOL_PATH", "/nonexistent/zpool", 1);
  zfscheck::collectors::ZpoolScrubCollector c;
  std::vector<std::string> pools;
  ASSERT_TRUE(!c.pools(pools));
  ::unsetenv("ZFSCHECK_ZPOOL_PATH");
}

TEST(shell_quote_escapes_single_quotes) {
  ASSERT_EQ(zfscheck::util::shell_quote("tank/it's"), std::string("'tank/it'\\''s'"));
}
