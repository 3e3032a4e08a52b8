#ifndef PROFTREE_LOGICAL_THREAD_HPP
#define PROFTREE_LOGICAL_THREAD_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "call_path.hpp"

namespace proftree {

class Timer;

/**
 * @brief Profiler state of one independent execution context
 *
 * Holds the live call path and the stack of running timers. Never shared between
 * contexts, so nothing here is synchronized.
 *
 * Every OS thread has a default instance. Schedulers that multiplex several tasks on one
 * OS thread give each task its own LogicalThread and make it current with an Activation
 * while the task runs.
 */
class LogicalThread
{
public:
  LogicalThread() = default;

  LogicalThread(const LogicalThread&) = delete;
  LogicalThread&
  operator=(const LogicalThread&) = delete;

  void
  push(std::string tName);

  // Throws ProfilerError on an empty path
  void
  pop();

  [[nodiscard]] const CallPath&
  currentPath() const
  {
    return _path;
  }

  [[nodiscard]] std::size_t
  depth() const
  {
    return _path.size();
  }

  void
  pushTimer(Timer* tTimer);

  // Throws ProfilerError when no timer is active
  Timer*
  popTimer();

  // Pops the top timer and throws ProfilerError unless it is tExpected
  void
  popTimer(const Timer& tExpected);

  [[nodiscard]] std::size_t
  activeTimers() const
  {
    return _timers.size();
  }

  // The activated context of the calling OS thread, or its default one
  static LogicalThread&
  current();

  // True while an Activation is in effect on the calling OS thread
  [[nodiscard]] static bool
  hasActive();

  // RAII: makes a context current on the calling OS thread, restores the previous one on exit
  class Activation
  {
  public:
    explicit Activation(LogicalThread& tThread);
    ~Activation();

    Activation(const Activation&) = delete;
    Activation&
    operator=(const Activation&) = delete;

  private:
    LogicalThread* _previous;
  };

private:
  CallPath _path;
  std::vector<Timer*> _timers;
};

} // namespace proftree

#endif // PROFTREE_LOGICAL_THREAD_HPP
