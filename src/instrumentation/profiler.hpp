#ifndef PROFTREE_PROFILER_HPP
#define PROFTREE_PROFILER_HPP

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "config.hpp"
#include "errors.hpp"
#include "logical_thread.hpp"
#include "session.hpp"
#include "timer.hpp"

namespace proftree {

// RAII bucket: pushes a name on the current logical thread and times the scope.
// Inactive (no bookkeeping at all) unless the session is enabled and running.
class ScopedBucket
{
public:
  ScopedBucket(Session& tSession, std::string tName);
  explicit ScopedBucket(std::string tName) : ScopedBucket(Session::instance(), std::move(tName)) {}
  ~ScopedBucket();

  // Disable copy/move to prevent unintended behavior
  ScopedBucket(const ScopedBucket&) = delete;
  ScopedBucket&
  operator=(const ScopedBucket&) = delete;
  ScopedBucket(ScopedBucket&&) = delete;
  ScopedBucket&
  operator=(ScopedBucket&&) = delete;

  [[nodiscard]] bool
  active() const
  {
    return _thread != nullptr;
  }

private:
  // Context the name was pushed on; the scope may end while another one is current
  LogicalThread* _thread = nullptr;
  std::optional<Timer> _timer;
};

namespace detail {

// Bucket name storage: string literals become std::string, naming callables stay as they are
template<typename N>
using name_source_t = std::conditional_t<std::is_convertible_v<N, std::string>, std::string, std::decay_t<N>>;

template<typename N, typename... Args>
std::string
resolveName(const N& tName, const Args&... tArgs)
{
  if constexpr (std::is_invocable_v<const N&, const Args&...>)
  {
    return std::string(std::invoke(tName, tArgs...));
  }
  else
  {
    static_assert(std::is_convertible_v<const N&, std::string>,
                  "bucket name must be a string or callable with the wrapped function's arguments");
    return std::string(tName);
  }
}

} // namespace detail

/**
 * @brief A function wrapped for profiling
 *
 * Calling it has the calling convention of the wrapped callable (member function pointers
 * included, the receiver being the first argument). The bucket name is either fixed or
 * computed per call by a naming function that receives the same arguments.
 */
template<typename F, typename N>
class Profiled
{
public:
  Profiled(Session& tSession, N tName, F tFn) :
    _session(&tSession), _name(std::move(tName)), _fn(std::move(tFn)), _enabled(tSession.enabled())
  {
  }

  template<typename... Args>
  decltype(auto)
  operator()(Args&&... tArgs)
  {
    if (!_enabled || !_session->running())
      return std::invoke(_fn, std::forward<Args>(tArgs)...);

    ScopedBucket bucket(*_session, detail::resolveName(_name, tArgs...));
    return std::invoke(_fn, std::forward<Args>(tArgs)...);
  }

  template<typename... Args>
  decltype(auto)
  operator()(Args&&... tArgs) const
  {
    if (!_enabled || !_session->running())
      return std::invoke(_fn, std::forward<Args>(tArgs)...);

    ScopedBucket bucket(*_session, detail::resolveName(_name, tArgs...));
    return std::invoke(_fn, std::forward<Args>(tArgs)...);
  }

private:
  Session* _session;
  N _name;
  F _fn;
  bool _enabled;
};

/**
 * @brief Wrap a function so each call inside a running session is timed under tName
 *
 * With profiling compiled out the function itself is returned.
 */
template<typename N, typename F>
auto
wrap(Session& tSession, N&& tName, F&& tFn)
{
  using Fn = std::decay_t<F>;
  using Name = detail::name_source_t<N>;
  if constexpr (!kEnableProfiling)
  {
    return Fn(std::forward<F>(tFn));
  }
  else
  {
    return Profiled<Fn, Name>(tSession, Name(std::forward<N>(tName)), Fn(std::forward<F>(tFn)));
  }
}

template<typename N, typename F>
auto
wrap(N&& tName, F&& tFn)
{
  return wrap(Session::instance(), std::forward<N>(tName), std::forward<F>(tFn));
}

/**
 * @brief Profile an inline block: wrap tFn and call it immediately with no arguments
 */
template<typename N, typename F>
decltype(auto)
time(Session& tSession, N&& tName, F&& tFn)
{
  return wrap(tSession, std::forward<N>(tName), std::forward<F>(tFn))();
}

template<typename N, typename F>
decltype(auto)
time(N&& tName, F&& tFn)
{
  return time(Session::instance(), std::forward<N>(tName), std::forward<F>(tFn));
}

namespace detail {

// Prints the report when run() leaves, also when the profiled block throws
class ReportOnExit
{
public:
  explicit ReportOnExit(Session& tSession) : _session(tSession) {}
  ~ReportOnExit();

  ReportOnExit(const ReportOnExit&) = delete;
  ReportOnExit&
  operator=(const ReportOnExit&) = delete;

private:
  Session& _session;
};

} // namespace detail

/**
 * @brief start(), time(tName, tFn), then report() on the way out
 * @return Whatever tFn returns; its exceptions propagate after the report is printed
 */
template<typename N, typename F>
decltype(auto)
run(Session& tSession, N&& tName, F&& tFn)
{
  tSession.start();
  detail::ReportOnExit reportGuard(tSession);
  return time(tSession, std::forward<N>(tName), std::forward<F>(tFn));
}

template<typename N, typename F>
decltype(auto)
run(N&& tName, F&& tFn)
{
  return run(Session::instance(), std::forward<N>(tName), std::forward<F>(tFn));
}

// Process-wide session shortcuts
inline void
start()
{
  Session::instance().start();
}

inline std::string
stop()
{
  return Session::instance().stop();
}

inline void
increase(const CallPath& tPath, double tMs)
{
  Session::instance().increase(tPath, tMs);
}

inline void
increase(std::string_view tName, double tMs)
{
  Session::instance().increase(tName, tMs);
}

} // namespace proftree

// --- USER MACROS ---
#define PROFTREE_CONCAT_IMPL(x, y) x##y
#define PROFTREE_CONCAT(x, y)      PROFTREE_CONCAT_IMPL(x, y)
#define PROFTREE_UNIQUE_VAR(base)  PROFTREE_CONCAT(base, __LINE__)

// Conditional profiling macros based on CMake configuration
#if !defined(PROFTREE_PROFILING_ENABLED) || PROFTREE_PROFILING_ENABLED
  #define PROFTREE_SCOPE(name) proftree::ScopedBucket PROFTREE_UNIQUE_VAR(proftree_scope_)(name)
  #define PROFTREE_FUNCTION()  PROFTREE_SCOPE(__func__)
#else
  // Profiling disabled - compile to no-ops
  #define PROFTREE_SCOPE(name)                                                                                         \
    do                                                                                                                 \
    {}                                                                                                                 \
    while (0)
  #define PROFTREE_FUNCTION()                                                                                          \
    do                                                                                                                 \
    {}                                                                                                                 \
    while (0)
#endif

#endif // PROFTREE_PROFILER_HPP
