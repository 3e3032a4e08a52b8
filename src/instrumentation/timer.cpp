#include "timer.hpp"

#include <utility>

#include "clock.hpp"
#include "errors.hpp"

namespace proftree {

Timer::Timer(std::string tId, Callback tOnStopped) : _id(std::move(tId)), _onStopped(std::move(tOnStopped)) {}

void
Timer::start()
{
  if (_running)
  {
    throw ProfilerError("can't start a running timer: " + _id);
  }
  _start = clock::now();
  _running = true;
}

void
Timer::stop()
{
  if (!_running)
  {
    throw ProfilerError("can't stop a stopped timer: " + _id);
  }
  double durationMs = clock::toMs(clock::now() - _start);
  _running = false;
  if (_onStopped)
  {
    _onStopped(durationMs);
  }
}

AccumulatingTimer::AccumulatingTimer(std::string tId) : _id(std::move(tId)) {}

void
AccumulatingTimer::start()
{
  if (_running)
  {
    throw ProfilerError("can't start a running timer: " + _id);
  }
  _start = clock::now();
  _running = true;
}

void
AccumulatingTimer::stop()
{
  if (!_running)
  {
    throw ProfilerError("can't stop a stopped timer: " + _id);
  }
  _totalMs += clock::toMs(clock::now() - _start);
  _running = false;
}

} // namespace proftree
