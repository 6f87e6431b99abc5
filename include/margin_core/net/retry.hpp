#pragma once

#include <chrono>
#include <functional>
#include <iostream>
#include <string>
#include <thread>

namespace margin_core {

// Rate limiting or timeout reported by a remote provider. Retried with
// backoff; surfaces to the caller once attempts are exhausted.
class TransientProviderError : public std::exception {
 public:
  explicit TransientProviderError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct RetryPolicy {
  int max_attempts = 3;
  std::chrono::milliseconds base_delay{1000};
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline void sleep_for(std::chrono::milliseconds delay) {
  std::this_thread::sleep_for(delay);
}

// Runs fn, retrying on TransientProviderError. The delay before retry n
// (0-based) is base_delay * 2^n. Other exceptions propagate immediately.
template <typename Fn>
auto with_retry(const RetryPolicy& policy, const Sleeper& sleeper, Fn&& fn) -> decltype(fn()) {
  const int max_attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;
  for (int attempt = 0;; ++attempt) {
    try {
      return fn();
    } catch (const TransientProviderError& e) {
      if (attempt + 1 >= max_attempts) {
        throw;
      }
      auto delay = policy.base_delay * (1LL << attempt);
      std::cerr << "[Retry] attempt " << (attempt + 1) << "/" << max_attempts
                << " failed (" << e.what() << "), retrying in " << delay.count() << "ms"
                << std::endl;
      sleeper(delay);
    }
  }
}

}  // namespace margin_core
