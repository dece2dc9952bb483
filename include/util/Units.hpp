// Size and duration conversions shared by the zfs/zpool parsers and messages
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace zfscheck::util {

// "12.3G" -> 12.3 * 1024^3. Unit letters K M G T P E Z Y, optional trailing 'B'.
// A bare number (or "0B") is bytes. Returns std::nullopt on malformed input.
auto parse_size(std::string_view text) -> std::optional<uint64_t>;

// zpool duration forms: "01:02:03", "1 days 01:02:03", "3h12m", "45s".
auto parse_duration(std::string_view text) -> std::optional<int64_t>;

// 1536 -> "1.5K"; values below 1K print as plain bytes ("512B").
auto human_bytes(uint64_t bytes) -> std::string;

// 3723 -> "01:02:03"; durations of a day or more get a "Nd " prefix.
auto format_duration(int64_t seconds) -> std::string;

} // namespace zfscheck::util
