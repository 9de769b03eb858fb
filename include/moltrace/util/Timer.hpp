#pragma once

#include <chrono>

namespace moltrace {

// Wall-clock seconds since construction or the last restart().
class Stopwatch {
public:
  using clock = std::chrono::steady_clock;

  Stopwatch() : start_(clock::now()) {}

  void restart() { start_ = clock::now(); }

  double seconds() const {
    return std::chrono::duration<double>(clock::now() - start_).count();
  }

private:
  clock::time_point start_;
};

// Adds the time spent in the enclosing scope to one profile field.
class StageTimer {
public:
  explicit StageTimer(double& total) : total_(total) {}
  ~StageTimer() { total_ += watch_.seconds(); }

  StageTimer(const StageTimer&) = delete;
  StageTimer& operator=(const StageTimer&) = delete;

private:
  double& total_;
  Stopwatch watch_;
};

} // namespace moltrace
