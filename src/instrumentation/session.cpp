#include "session.hpp"


#include "errors.hpp"

namespace proftree {

Session::Session(Config tConfig) : _config(tConfig) {}

Session&
Session::instance()
{
  static Session instance(Config::fromEnvironment());
  return instance;
}

void
Session::start()
{
  std::lock_guard<std::mutex> lock(_stateMutex);
  if (_running.load(std::memory_order_acquire))
  {
    throw ProfilerError("Already running");
  }
  _table.clear();
  _running.store(true, std::memory_order_release);
}

std::string
Session::stop()
{
  BufferSink buffer;
  report(buffer);
  return buffer.str();
}

void
Session::report(ReportSink& tSink)
{
  {
    std::lock_guard<std::mutex> lock(_stateMutex);
    if (!_running.load(std::memory_order_acquire))
    {
      throw ProfilerError("not running");
    }
    _running.store(false, std::memory_order_release);
  }

  if (!_config.enabled)
    return;
  render(tSink);
}

void
Session::report()
{
  StreamSink console;
  report(console);
}

void
Session::render(ReportSink& tSink) const
{
  ReportTree tree(_table.snapshot());
  ReportRenderer(tree, _config.filterMs, tSink).print();
}

void
Session::increase(const CallPath& tPath, double tMs)
{
  if (!_config.enabled)
    return;
  if (tPath.empty())
  {
    throw ProfilerError("can't account time to an empty call path");
  }
  _table.increase(tPath, tMs);
}

void
Session::increase(std::string_view tName, double tMs)
{
  increase(CallPath{std::string(tName)}, tMs);
}

} // namespace proftree
