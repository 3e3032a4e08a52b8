#ifndef PROFTREE_TIMER_HPP
#define PROFTREE_TIMER_HPP

#include <chrono>
#include <functional>
#include <string>

namespace proftree {

/**
 * @brief One start/stop interval on the build's clock
 *
 * Each stop() hands the elapsed milliseconds of that interval to the completion callback.
 * Starting a running timer or stopping a stopped one throws ProfilerError.
 */
class Timer
{
public:
  using Callback = std::function<void(double)>;

  Timer(std::string tId, Callback tOnStopped);

  Timer(const Timer&) = delete;
  Timer&
  operator=(const Timer&) = delete;

  void
  start();

  void
  stop();

  [[nodiscard]] bool
  isRunning() const
  {
    return _running;
  }

  [[nodiscard]] const std::string&
  id() const
  {
    return _id;
  }

private:
  std::string _id;
  Callback _onStopped;
  bool _running = false;
  std::chrono::nanoseconds _start{};
};

/**
 * @brief Timer that sums any number of start/stop segments
 *
 * Call start() and stop() around each segment, then totalMs() for the sum.
 */
class AccumulatingTimer
{
public:
  explicit AccumulatingTimer(std::string tId);

  void
  start();

  void
  stop();

  [[nodiscard]] double
  totalMs() const
  {
    return _totalMs;
  }

  [[nodiscard]] bool
  isRunning() const
  {
    return _running;
  }

  [[nodiscard]] const std::string&
  id() const
  {
    return _id;
  }

private:
  std::string _id;
  bool _running = false;
  double _totalMs = 0;
  std::chrono::nanoseconds _start{};
};

} // namespace proftree

#endif // PROFTREE_TIMER_HPP
