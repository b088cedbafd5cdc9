#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <thread>

/**
 * @brief Deadline-bounded polling with exponential backoff
 *
 * Replaces open-ended "sleep and check again" loops. The predicate is
 * evaluated at least once; the wait between evaluations starts at
 * initial_backoff, doubles, and is capped at max_backoff and at the time
 * left before the deadline.
 */
struct BoundedRetry {
  std::chrono::milliseconds timeout{5000};
  std::chrono::milliseconds initial_backoff{50};
  std::chrono::milliseconds max_backoff{500};

  /**
   * @brief Poll until predicate returns true or the deadline passes
   * @return true if the predicate succeeded before the deadline
   */
  bool waitUntil(const std::function<bool()> &predicate) const {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto backoff = initial_backoff;

    while (true) {
      if (predicate()) {
        return true;
      }

      auto now = std::chrono::steady_clock::now();
      if (now >= deadline) {
        return false;
      }

      auto remaining =
          std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
      std::this_thread::sleep_for(std::min(backoff, remaining));
      backoff = std::min(backoff * 2, max_backoff);
    }
  }
};
