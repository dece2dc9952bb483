// Process-wide switch for diagnostic output on stderr
#pragma once

namespace zfscheck::util {

void set_debug(bool on);

[[nodiscard]] bool debug_enabled();

} // namespace zfscheck::util
