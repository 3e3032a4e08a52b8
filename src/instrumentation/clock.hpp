#ifndef PROFTREE_CLOCK_HPP
#define PROFTREE_CLOCK_HPP

#include <chrono>

// Platform-specific includes for CPU time
#if defined(__linux__) || defined(__APPLE__)
  #include <ctime>
#elif defined(_WIN32)
  #include <windows.h>
#endif

namespace proftree::clock {

// Clock selection: compile-time control via CMake. One build never mixes the two sources.
#ifdef PROFTREE_CPU_TIME_ENABLED
  #if PROFTREE_CPU_TIME_ENABLED
inline constexpr bool kCpuTime = true;
  #else
inline constexpr bool kCpuTime = false;
  #endif
#else
inline constexpr bool kCpuTime = false;
#endif

// Label used for the grand total line of the leaf report
inline constexpr const char* kMeasuredLabel = kCpuTime ? "Measured CPU" : "Measured time";

// --- Platform specific time getters ---
inline std::chrono::nanoseconds
getProcessCpuTime()
{
#if defined(__linux__) || defined(__APPLE__)
  timespec ts{};
  if (clock_gettime(CLOCK_PROCESS_CPUTIME_ID, &ts) == 0)
  {
    return std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
  }
#elif defined(_WIN32)
  FILETIME createTime, exitTime, kernelTime, userTime;
  if (GetProcessTimes(GetCurrentProcess(), &createTime, &exitTime, &kernelTime, &userTime))
  {
    ULARGE_INTEGER kernel, user;
    kernel.LowPart = kernelTime.dwLowDateTime;
    kernel.HighPart = kernelTime.dwHighDateTime;
    user.LowPart = userTime.dwLowDateTime;
    user.HighPart = userTime.dwHighDateTime;
    return std::chrono::nanoseconds((kernel.QuadPart + user.QuadPart) * 100);
  }
#endif
  return std::chrono::nanoseconds(0);
}

inline std::chrono::nanoseconds
getWallTime()
{
  return std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now().time_since_epoch());
}

// Current reading of the build's time source
inline std::chrono::nanoseconds
now()
{
  if constexpr (kCpuTime)
  {
    return getProcessCpuTime();
  }
  else
  {
    return getWallTime();
  }
}

inline double
toMs(std::chrono::nanoseconds tDuration)
{
  return static_cast<double>(tDuration.count()) / 1e6;
}

} // namespace proftree::clock

#endif // PROFTREE_CLOCK_HPP
