#include "util/Debug.hpp"

#include <atomic>

namespace zfscheck::util {

static std::atomic<bool> g_debug{false};

void set_debug(bool on) { g_debug.store(on); }

bool debug_enabled() { return g_debug.load(); }

} // namespace zfscheck::util
