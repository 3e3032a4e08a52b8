#include "instrumentation/errors.hpp"
#include "instrumentation/timer.hpp"

#include "common.hpp"

namespace proftree
{
  TEST_SUITE("timer")
  {
    TEST_CASE("stop hands the elapsed time to the callback")
    {
      double reported = -1;
      Timer timer("compile", [&](double tMs) { reported = tMs; });

      timer.start();
      CHECK(timer.isRunning());
      test::spinFor(2.0);
      timer.stop();

      CHECK(!timer.isRunning());
      CHECK(reported >= 2.0);
    }

    TEST_CASE("each segment is reported separately")
    {
      int calls = 0;
      Timer timer("segments", [&](double) { ++calls; });

      timer.start();
      timer.stop();
      timer.start();
      timer.stop();

      CHECK(calls == 2);
    }

    TEST_CASE("starting a running timer throws")
    {
      Timer timer("parse", nullptr);
      timer.start();
      CHECK_THROWS_AS(timer.start(), ProfilerError);
      CHECK_THROWS_WITH(timer.start(), "can't start a running timer: parse");
      CHECK(timer.isRunning());
    }

    TEST_CASE("stopping a stopped timer throws")
    {
      Timer timer("parse", nullptr);
      CHECK_THROWS_WITH(timer.stop(), "can't stop a stopped timer: parse");

      timer.start();
      timer.stop();
      CHECK_THROWS_AS(timer.stop(), ProfilerError);
    }
  }

  TEST_SUITE("accumulating timer")
  {
    TEST_CASE("segments add up")
    {
      AccumulatingTimer timer("bundle");
      CHECK(timer.totalMs() == 0.0);

      timer.start();
      test::spinFor(1.0);
      timer.stop();
      double first = timer.totalMs();
      CHECK(first >= 1.0);

      timer.start();
      test::spinFor(1.0);
      timer.stop();
      CHECK(timer.totalMs() >= first + 1.0);
    }

    TEST_CASE("misuse throws")
    {
      AccumulatingTimer timer("bundle");
      CHECK_THROWS_AS(timer.stop(), ProfilerError);
      timer.start();
      CHECK_THROWS_WITH(timer.start(), "can't start a running timer: bundle");
    }
  }
}
