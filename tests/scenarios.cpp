#include <string>
#include <vector>

#include "instrumentation/profiler.hpp"

#include "common.hpp"

namespace proftree
{
  namespace
  {
    std::vector<std::string>
    splitLines(const std::string& tText)
    {
      std::vector<std::string> lines;
      std::string::size_type start = 0;
      while (true)
      {
        auto end = tText.find('\n', start);
        lines.push_back(tText.substr(start, end - start));
        if (end == std::string::npos)
          break;
        start = end + 1;
      }
      return lines;
    }
  }

  TEST_SUITE("scenarios")
  {
    TEST_CASE("simple nesting")
    {
      // A (150 ms of its own) calls B (150 ms), A runs again for 300 ms without B, B runs alone for 100 ms.
      // B completes first, so its path is recorded before A's.
      Session session(test::enabledConfig());
      session.start();
      session.increase(CallPath{"A", "B"}, 150);
      session.increase(CallPath{"A"}, 300);
      session.increase(CallPath{"A"}, 200);
      session.increase(CallPath{"B"}, 100);

      std::vector<std::string> expected{
        "| ",
        "| A: 500.0",
        "|     B: 150.0",
        "|     other A: 350.0",
        "| B: 100.0",
        "| ",
        "| other A: 350.0",
        "| B: 250.0",
        test::measuredLine("600.0"),
      };
      CHECK(splitLines(session.stop()) == expected);
    }

    TEST_CASE("simple nesting with real timers")
    {
      Session session(test::enabledConfig(0));
      auto b = wrap(session, "B", [](double tMs) { test::spinFor(tMs); });
      auto a = wrap(session, "A",
                    [&](double tSelfMs, bool tCallB)
                    {
                      if (tCallB)
                        b(15.0);
                      test::spinFor(tSelfMs);
                    });

      session.start();
      a(15.0, true);
      a(30.0, false);
      b(10.0);

      ReportTree tree(session.table().snapshot());
      session.stop();

      CHECK(tree.topLevel() == std::vector<CallPath>{CallPath{"A"}, CallPath{"B"}});
      CHECK(tree.children(CallPath{"A"}) == std::vector<CallPath>{CallPath{"A", "B"}, CallPath{"A", "other A"}});
      CHECK(tree.time(CallPath{"A", "B"}) >= 15.0);
      CHECK(tree.time(CallPath{"A", "other A"}) >= 45.0);
      CHECK(tree.time(CallPath{"B"}) >= 10.0);
      CHECK(tree.time(CallPath{"A"}) == doctest::Approx(test::childrenTime(tree, CallPath{"A"})));

      // Leaf total equals session total
      BufferSink sink;
      double leafTotal = ReportRenderer(tree, 0, sink).printLeafTotals();
      CHECK(leafTotal == doctest::Approx(tree.time(CallPath{"A"}) + tree.time(CallPath{"B"})));
    }

    TEST_CASE("threshold filter")
    {
      Session session(test::enabledConfig(10));
      session.start();
      session.increase("tiny", 2.0);
      session.increase("tiny", 3.0);
      session.increase("big", 50.0);

      std::string report;
      CHECK_NOTHROW(report = session.stop());
      CHECK(report.find("tiny") == std::string::npos);
      CHECK(report.find("| big: 50.0") != std::string::npos);
      CHECK(report.find(test::measuredLine("50.0")) != std::string::npos);
    }

    TEST_CASE("same bucket name under different parents")
    {
      Session session(test::enabledConfig());
      session.start();
      session.increase(CallPath{"compile a", "parse"}, 20);
      session.increase(CallPath{"compile a"}, 50);
      session.increase(CallPath{"compile b", "parse"}, 30);
      session.increase(CallPath{"compile b"}, 45);

      std::vector<std::string> expected{
        "| ",
        "| compile a: 50.0",
        "|     parse: 20.0",
        "|     other compile a: 30.0",
        "| compile b: 45.0",
        "|     parse: 30.0",
        "|     other compile b: 15.0",
        "| ",
        "| parse: 50.0",
        "| other compile a: 30.0",
        "| other compile b: 15.0",
        test::measuredLine("95.0"),
      };
      CHECK(splitLines(session.stop()) == expected);
    }

    TEST_CASE("same bucket name under different parents with wrapped calls")
    {
      Session session(test::enabledConfig(0));
      auto parse = wrap(session, "parse", [] {});
      auto compileA = wrap(session, "compile a", [&] { parse(); });
      auto compileB = wrap(session, "compile b",
                           [&]
                           {
                             parse();
                             parse();
                           });

      session.start();
      compileA();
      compileB();
      ReportTree tree(session.table().snapshot());
      session.stop();

      auto totals = tree.leafTotals();
      int parseEntries = 0;
      double parseTotal = 0;
      for (const auto& total : totals)
      {
        if (total.name == "parse")
        {
          ++parseEntries;
          parseTotal = total.totalMs;
        }
      }
      CHECK(parseEntries == 1);
      CHECK(parseTotal ==
            doctest::Approx(tree.time(CallPath{"compile a", "parse"}) + tree.time(CallPath{"compile b", "parse"})));
    }
  }
}
