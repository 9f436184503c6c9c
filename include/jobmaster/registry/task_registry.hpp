#pragma once

#include "jobmaster/core/error.hpp"
#include "jobmaster/scheduler/task.hpp"

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace jobmaster {

// Owns the registered task definitions. Definitions are immutable once
// added; only the enabled flag changes afterwards.
class TaskRegistry {
public:
  TaskRegistry() = default;
  ~TaskRegistry() = default;

  TaskRegistry(const TaskRegistry&) = delete;
  auto operator=(const TaskRegistry&) -> TaskRegistry& = delete;

  // Fails with InvalidArgument (empty id), AlreadyExists, InvalidHandler or
  // UnknownDependency. Dependencies must be registered first, which also
  // keeps the dependency graph acyclic.
  [[nodiscard]] auto add(TaskDefinition def) -> Result<void>;

  [[nodiscard]] auto get(const TaskId& id) const
      -> std::optional<TaskDefinition>;
  [[nodiscard]] auto contains(const TaskId& id) const -> bool;
  [[nodiscard]] auto set_enabled(const TaskId& id, bool enabled)
      -> Result<void>;

  // Position in registration order, used as the dispatch tie-break.
  [[nodiscard]] auto order_of(const TaskId& id) const
      -> std::optional<std::uint64_t>;

  // All definitions in registration order.
  [[nodiscard]] auto list() const -> std::vector<TaskDefinition>;

  [[nodiscard]] auto size() const -> std::size_t;
  [[nodiscard]] auto enabled_count() const -> std::size_t;

private:
  struct Entry {
    TaskDefinition def;
    std::uint64_t order{0};
  };

  [[nodiscard]] auto validate(const TaskDefinition& def) const -> Result<void>;

  mutable std::shared_mutex mu_;
  std::unordered_map<TaskId, Entry> tasks_;
  std::vector<TaskId> order_;
};

}  // namespace jobmaster
