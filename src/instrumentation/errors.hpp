#ifndef PROFTREE_ERRORS_HPP
#define PROFTREE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace proftree {

/**
 * @brief Raised on misuse of the instrumentation
 *
 * Double start/stop of a timer, starting a session that is already running, stopping one
 * that is idle, or popping an empty call path. These are integration bugs, not conditions
 * user code is expected to recover from.
 */
class ProfilerError : public std::logic_error
{
public:
  using std::logic_error::logic_error;
};

/**
 * @brief Report an invariant violation found during scope-exit cleanup and abort
 *
 * Used where throwing is not an option (destructors).
 */
[[noreturn]] void
fatal(const std::string& tMessage);

} // namespace proftree

#endif // PROFTREE_ERRORS_HPP
