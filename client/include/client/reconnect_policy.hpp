#pragma once

#include <chrono>

namespace quizsync::client {

// Bounded linear backoff for relay reconnects. Attempts count from 1.
struct ReconnectPolicy {
  static constexpr int kMaxAttempts = 5;
  static constexpr std::chrono::milliseconds kBaseDelay{2000};

  int max_attempts{kMaxAttempts};
  std::chrono::milliseconds base_delay{kBaseDelay};

  // `attempts_made` is the number of attempts already started.
  bool should_retry(int attempts_made) const { return attempts_made < max_attempts; }

  std::chrono::milliseconds delay_for(int attempt) const {
    return attempt <= 0 ? std::chrono::milliseconds(0) : base_delay * attempt;
  }
};

}  // namespace quizsync::client
