#ifndef PROFTREE_SESSION_HPP
#define PROFTREE_SESSION_HPP

#include <atomic>
#include <mutex>
#include <string>
#include <string_view>

#include "bucket_table.hpp"
#include "call_path.hpp"
#include "config.hpp"
#include "report.hpp"

namespace proftree {

/**
 * @brief One profiling session: Idle -> start() -> Running -> stop()/report() -> Idle
 *
 * Owns the accumulation table. Wrapped functions only measure while the session is
 * running; outside of it they call straight through.
 */
class Session
{
public:
  explicit Session(Config tConfig);

  Session(const Session&) = delete;
  Session&
  operator=(const Session&) = delete;

  /**
   * @brief Process-wide session, configured from PROFTREE_PROFILE on first use
   */
  static Session&
  instance();

  [[nodiscard]] bool
  enabled() const
  {
    return _config.enabled;
  }

  [[nodiscard]] double
  filterMs() const
  {
    return _config.filterMs;
  }

  [[nodiscard]] bool
  running() const
  {
    return _running.load(std::memory_order_acquire);
  }

  [[nodiscard]] const BucketTable&
  table() const
  {
    return _table;
  }

  /**
   * @brief Clear the table and begin measuring
   * @throws ProfilerError if already running
   */
  void
  start();

  /**
   * @brief End the session and return the report text instead of printing it
   * @throws ProfilerError if not running
   */
  std::string
  stop();

  /**
   * @brief End the session and print the report
   * @param tSink Destination of the report lines
   * @throws ProfilerError if not running
   *
   * Nothing is printed when profiling is disabled.
   */
  void
  report(ReportSink& tSink);

  // report() to the console
  void
  report();

  /**
   * @brief Print the report of the current table without changing the session state
   */
  void
  render(ReportSink& tSink) const;

  /**
   * @brief Manually account time to a call path
   *
   * No-op when profiling is disabled. Throws ProfilerError for an empty path.
   */
  void
  increase(const CallPath& tPath, double tMs);

  // increase() for the single-element path {tName}
  void
  increase(std::string_view tName, double tMs);

private:
  Config _config;
  std::mutex _stateMutex;
  std::atomic<bool> _running{false};
  BucketTable _table;
};

} // namespace proftree

#endif // PROFTREE_SESSION_HPP
