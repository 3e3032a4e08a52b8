#include "profiler.hpp"

#include <exception>

namespace proftree {

ScopedBucket::ScopedBucket(Session& tSession, std::string tName)
{
  if (!kEnableProfiling || !tSession.enabled() || !tSession.running())
  {
    return;
  }

  LogicalThread& thread = LogicalThread::current();

  // The callback keeps the path as it is now; the live path keeps changing
  CallPath path = thread.currentPath();
  path.push_back(tName);
  std::string id = toString(path);
  _timer.emplace(std::move(id),
                 [&tSession, path = std::move(path)](double tDurationMs)
                 {
                   tSession.increase(path, tDurationMs);
                 });

  thread.push(std::move(tName));
  try
  {
    thread.pushTimer(&*_timer);
  }
  catch (...)
  {
    thread.pop();
    throw;
  }
  _thread = &thread;
  _timer->start();
}

ScopedBucket::~ScopedBucket()
{
  if (_thread == nullptr)
  {
    return;
  }

  try
  {
    _timer->stop();
    _thread->popTimer(*_timer);
    _thread->pop();
  }
  catch (const std::exception& e)
  {
    fatal(e.what());
  }
}

namespace detail {

ReportOnExit::~ReportOnExit()
{
  try
  {
    _session.report();
  }
  catch (const std::exception& e)
  {
    fatal(std::string("report failed: ") + e.what());
  }
}

} // namespace detail

} // namespace proftree
