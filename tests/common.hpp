#pragma once

#include <functional>
#include <string>

#if defined(__unix__) || defined(__APPLE__)
#define PROFTREE_TEST_HAS_FORK 1
#include <csignal>
#include <sys/wait.h>
#include <unistd.h>
#endif

#include "instrumentation/clock.hpp"
#include "instrumentation/config.hpp"
#include "instrumentation/report.hpp"

#include <doctest/doctest.h>

namespace proftree::test
{
  inline Config
  enabledConfig(double tFilterMs = Config::kDefaultFilterMs)
  {
    Config config;
    config.enabled = true;
    config.filterMs = tFilterMs;
    return config;
  }

  // Busy-wait on the build's own clock so CPU-time builds advance too
  inline void
  spinFor(double tMs)
  {
    auto start = clock::now();
    while (clock::toMs(clock::now() - start) < tMs)
    {
    }
  }

  inline std::string
  measuredLine(const std::string& tTotal)
  {
    return std::string("| ") + clock::kMeasuredLabel + ": " + tTotal;
  }

  inline double
  childrenTime(const ReportTree& tTree, const CallPath& tParent)
  {
    double sum = 0;
    for (const auto& child : tTree.children(tParent))
    {
      sum += tTree.time(child);
    }
    return sum;
  }

#ifdef PROFTREE_TEST_HAS_FORK
  // Runs tFn in a forked child; true when the child was killed by SIGABRT
  inline bool
  abortsInChild(const std::function<void()>& tFn)
  {
    pid_t pid = fork();
    if (pid == 0)
    {
      tFn();
      _exit(0);
    }
    int status = 0;
    if (pid < 0 || waitpid(pid, &status, 0) != pid)
      return false;
    return WIFSIGNALED(status) && WTERMSIG(status) == SIGABRT;
  }
#endif
}
