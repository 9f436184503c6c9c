#pragma once

#include "jobmaster/scheduler/task.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace jobmaster {

namespace detail {

constexpr std::array<std::string_view, 9> kFrequencyNames = {
    "continuous",       "every_minute",     "every_5_minutes",
    "every_15_minutes", "every_30_minutes", "hourly",
    "daily",            "weekly",           "monthly",
};

constexpr std::array<std::string_view, 4> kPriorityNames = {
    "low",
    "normal",
    "high",
    "critical",
};

constexpr std::array<std::string_view, 6> kExecutionStatusNames = {
    "pending", "running", "retrying", "completed", "failed", "cancelled",
};

constexpr std::array<std::string_view, 2> kTriggerKindNames = {
    "scheduled",
    "manual",
};

constexpr std::array<std::string_view, 3> kTrendNames = {
    "stable",
    "improving",
    "degrading",
};

template <typename Enum, std::size_t N>
[[nodiscard]] constexpr auto name_of(const std::array<std::string_view, N>& names,
                                     Enum value) noexcept -> std::string_view {
  auto idx = static_cast<std::size_t>(std::to_underlying(value));
  return idx < N ? names[idx] : std::string_view{"unknown"};
}

template <typename Enum, std::size_t N>
[[nodiscard]] constexpr auto parse_name(
    const std::array<std::string_view, N>& names, std::string_view name) noexcept
    -> std::optional<Enum> {
  auto it = std::ranges::find(names, name);
  if (it == names.end())
    return std::nullopt;
  return static_cast<Enum>(std::ranges::distance(names.begin(), it));
}

}  // namespace detail

[[nodiscard]] constexpr auto frequency_name(Frequency f) noexcept
    -> std::string_view {
  return detail::name_of(detail::kFrequencyNames, f);
}

[[nodiscard]] constexpr auto parse_frequency(std::string_view name) noexcept
    -> std::optional<Frequency> {
  return detail::parse_name<Frequency>(detail::kFrequencyNames, name);
}

[[nodiscard]] constexpr auto priority_name(Priority p) noexcept
    -> std::string_view {
  return detail::name_of(detail::kPriorityNames, p);
}

[[nodiscard]] constexpr auto parse_priority(std::string_view name) noexcept
    -> std::optional<Priority> {
  return detail::parse_name<Priority>(detail::kPriorityNames, name);
}

[[nodiscard]] constexpr auto execution_status_name(ExecutionStatus s) noexcept
    -> std::string_view {
  return detail::name_of(detail::kExecutionStatusNames, s);
}

[[nodiscard]] constexpr auto trigger_kind_name(TriggerKind t) noexcept
    -> std::string_view {
  return detail::name_of(detail::kTriggerKindNames, t);
}

[[nodiscard]] constexpr auto trend_name(PerformanceTrend t) noexcept
    -> std::string_view {
  return detail::name_of(detail::kTrendNames, t);
}

}  // namespace jobmaster
