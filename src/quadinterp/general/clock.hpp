#pragma once

#include <chrono>

namespace quadinterp {
namespace general {

/**
 * @brief Wall-clock stopwatch used for per-stage timings
 */
class Clock {
 public:
  Clock() : started_(std::chrono::steady_clock::now()) {}

  void start() { started_ = std::chrono::steady_clock::now(); }

  /**
   * @brief Elapsed time since the last start()
   * @return milliseconds
   */
  double stop() const {
    std::chrono::duration<double, std::milli> elapsed =
        std::chrono::steady_clock::now() - started_;
    return elapsed.count();
  }

 private:
  std::chrono::steady_clock::time_point started_;
};

}  // namespace general
}  // namespace quadinterp
