#include "logical_thread.hpp"

#include <utility>

#include "errors.hpp"
#include "timer.hpp"

namespace proftree {

namespace {

LogicalThread*&
activeThread()
{
  thread_local LogicalThread* active = nullptr;
  return active;
}

LogicalThread&
defaultThread()
{
  thread_local LogicalThread state;
  return state;
}

} // namespace

void
LogicalThread::push(std::string tName)
{
  _path.push_back(std::move(tName));
}

void
LogicalThread::pop()
{
  if (_path.empty())
  {
    throw ProfilerError("can't pop an empty call path");
  }
  _path.pop_back();
}

void
LogicalThread::pushTimer(Timer* tTimer)
{
  _timers.push_back(tTimer);
}

Timer*
LogicalThread::popTimer()
{
  if (_timers.empty())
  {
    throw ProfilerError("no active timer to pop");
  }
  Timer* top = _timers.back();
  _timers.pop_back();
  return top;
}

void
LogicalThread::popTimer(const Timer& tExpected)
{
  Timer* popped = popTimer();
  if (popped != &tExpected)
  {
    throw ProfilerError("unexpected timer at top of stack: " + popped->id() + "; expected: " + tExpected.id());
  }
}

LogicalThread&
LogicalThread::current()
{
  LogicalThread* active = activeThread();
  return active != nullptr ? *active : defaultThread();
}

bool
LogicalThread::hasActive()
{
  return activeThread() != nullptr;
}

LogicalThread::Activation::Activation(LogicalThread& tThread) : _previous(activeThread())
{
  activeThread() = &tThread;
}

LogicalThread::Activation::~Activation()
{
  activeThread() = _previous;
}

} // namespace proftree
