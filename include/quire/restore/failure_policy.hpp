#pragma once

#include <quire/schema/enum_string.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace quire::restore {

/// What a restore does after one workspace fails.
///
/// `abort` stops at the first failure; workspaces committed before it stay
/// committed. `best_effort` records the failure and moves on.
enum class failure_policy : uint8_t { abort = 0, best_effort = 1 };

inline constexpr auto kFailurePolicyMappings = std::array{
    std::pair<std::string_view, failure_policy>{"abort", failure_policy::abort},
    std::pair<std::string_view, failure_policy>{"best_effort",
                                                failure_policy::best_effort},
};

inline constexpr std::string_view to_string(const failure_policy value) {
  return quire::schema::to_string(value, kFailurePolicyMappings)
      .value_or("unknown");
}

inline constexpr std::optional<failure_policy> failure_policy_from_string(
    const std::string_view value) {
  return quire::schema::from_string(value, kFailurePolicyMappings);
}

}  // namespace quire::restore
