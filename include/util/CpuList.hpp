// Kernel cpulist notation ("0-3,8,10-11") <-> sorted core set
#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace lasso::util {

// Parse a cpulist. Whitespace around items is ignored; an empty string yields
// an empty set. Returns std::nullopt on malformed input or reversed ranges.
[[nodiscard]] std::optional<std::set<int>> parse_cpulist(std::string_view text);

// Format as the shortest cpulist ("0-3,5"). Empty set -> "".
[[nodiscard]] std::string format_cpulist(const std::set<int>& cpus);

} // namespace lasso::util
