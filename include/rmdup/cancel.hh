#pragma once

#include <atomic>
#include <stdexcept>

namespace rmdup {

inline namespace detail_v1 {

/**
 * @brief thrown by the detection stages once a stop has been requested
 */
class cancelled_error : public std::runtime_error {
 public:
  cancelled_error() : std::runtime_error("operation cancelled") {}
};

inline bool stop_requested(const std::atomic<bool> *stop) noexcept {
  return stop != nullptr && stop->load(std::memory_order_relaxed);
}

inline void throw_if_stopped(const std::atomic<bool> *stop) {
  if (stop_requested(stop)) {
    throw cancelled_error();
  }
}

}  // namespace detail_v1

}  // namespace rmdup
