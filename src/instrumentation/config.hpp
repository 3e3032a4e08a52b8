#ifndef PROFTREE_CONFIG_HPP
#define PROFTREE_CONFIG_HPP

namespace proftree {

// Profiling control: Compile-time control via CMake
#ifdef PROFTREE_PROFILING_ENABLED
  #if PROFTREE_PROFILING_ENABLED
// CMake ON: wrappers measure when the run-time switch is set
inline constexpr bool kEnableProfiling = true;
  #else
// CMake OFF: wrappers are pass-through (zero overhead)
inline constexpr bool kEnableProfiling = false;
  #endif
#else
inline constexpr bool kEnableProfiling = true;
#endif

/**
 * @brief Run-time profiler settings
 *
 * Read once from the environment for the process-wide session; fixed afterwards.
 */
struct Config
{
  static constexpr const char* kEnvVar = "PROFTREE_PROFILE";
  static constexpr double kDefaultFilterMs = 10.0;

  bool enabled = false;
  // Report entries below this many milliseconds are omitted
  double filterMs = kDefaultFilterMs;

  /**
   * @brief Interpret a value of the PROFTREE_PROFILE variable
   * @param tValue Raw value, nullptr when unset
   *
   * Any non-empty value enables profiling. A positive numeric value is also the filter
   * threshold (truncated to whole milliseconds); anything else keeps the default.
   */
  static Config
  parse(const char* tValue);

  static Config
  fromEnvironment();
};

} // namespace proftree

#endif // PROFTREE_CONFIG_HPP
