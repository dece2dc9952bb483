#pragma once
#include "model/CheckResult.hpp"
#include <string>
#include <string_view>

namespace zfscheck::app {

// "<sev> <label>:<entity> <name>=<v>;<w>;<c>|... <message>" without trailing newline.
[[nodiscard]] std::string render_line(const model::AggregateResult& r);

// Process-level diagnostic: "3 <label> - <message>".
[[nodiscard]] std::string render_failure(std::string_view label, std::string_view message);

} // namespace zfscheck::app
