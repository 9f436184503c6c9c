#pragma once

#include <compare>
#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <random>
#include <string>
#include <string_view>

namespace jobmaster {

struct TaskTag {};
struct ExecutionTag {};

// Phantom-typed string id; keeps task ids and execution ids from mixing.
template <typename Tag>
class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  TypedId() = default;

  [[nodiscard]] auto value() const -> std::string_view { return value_; }
  [[nodiscard]] auto str() const -> const std::string& { return value_; }

  [[nodiscard]] explicit operator std::string_view() const { return value_; }

  [[nodiscard]] auto empty() const -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId& lhs,
                                        const TypedId& rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId& lhs, const TypedId& rhs)
      -> bool = default;

private:
  std::string value_;
};

using TaskId = TypedId<TaskTag>;
using ExecutionId = TypedId<ExecutionTag>;

inline auto generate_execution_id() -> ExecutionId {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  thread_local std::uniform_int_distribution<std::uint64_t> dis;

  std::uint64_t a = dis(gen);
  std::uint64_t b = dis(gen);

  return ExecutionId{std::format(
      "{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
      static_cast<std::uint32_t>(a >> 32), static_cast<std::uint16_t>(a >> 16),
      static_cast<std::uint16_t>(a), static_cast<std::uint16_t>(b >> 48),
      b & 0xFFFFFFFFFFFFULL)};
}

template <typename Tag>
inline auto operator<<(std::ostream& os, const TypedId<Tag>& id)
    -> std::ostream& {
  return os << id.value();
}

}  // namespace jobmaster

template <typename Tag>
struct std::hash<jobmaster::TypedId<Tag>> {
  auto operator()(const jobmaster::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<jobmaster::TypedId<Tag>> : std::formatter<std::string_view> {
  auto format(const jobmaster::TypedId<Tag>& id, auto& ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
