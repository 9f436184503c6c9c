#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace jobmaster {

class CancellationToken;

// Owner side of a cancellation flag. Tokens observe it and can block on it,
// so a handler sleeping between units of work wakes as soon as the executor
// gives up on it (deadline or shutdown).
class CancellationSource {
public:
  CancellationSource() : state_(std::make_shared<State>()) {
  }

  [[nodiscard]] auto token() const noexcept -> CancellationToken;

  auto cancel() noexcept -> void {
    {
      std::lock_guard lock(state_->mu);
      state_->cancelled = true;
    }
    state_->cv.notify_all();
  }

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    std::lock_guard lock(state_->mu);
    return state_->cancelled;
  }

private:
  struct State {
    mutable std::mutex mu;
    std::condition_variable cv;
    bool cancelled{false};
  };
  std::shared_ptr<State> state_;

  friend class CancellationToken;
};

class CancellationToken {
public:
  CancellationToken() = default;

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    if (!state_)
      return false;
    std::lock_guard lock(state_->mu);
    return state_->cancelled;
  }

  [[nodiscard]] explicit operator bool() const noexcept {
    return !is_cancelled();
  }

  // Sleeps for `d` unless cancelled first. Returns true when cancelled.
  template <typename Rep, typename Period>
  auto wait_for(std::chrono::duration<Rep, Period> d) const -> bool {
    if (!state_) {
      std::this_thread::sleep_for(d);
      return false;
    }
    std::unique_lock lock(state_->mu);
    return state_->cv.wait_for(lock, d, [this] { return state_->cancelled; });
  }

  [[nodiscard]] static auto none() noexcept -> CancellationToken {
    return {};
  }

private:
  explicit CancellationToken(std::shared_ptr<CancellationSource::State> state)
      : state_(std::move(state)) {
  }

  std::shared_ptr<CancellationSource::State> state_;

  friend class CancellationSource;
};

inline auto CancellationSource::token() const noexcept -> CancellationToken {
  return CancellationToken{state_};
}

}  // namespace jobmaster
