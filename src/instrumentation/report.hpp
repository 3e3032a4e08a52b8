#ifndef PROFTREE_REPORT_HPP
#define PROFTREE_REPORT_HPP

#include <cstddef>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

#include "bucket_table.hpp"
#include "call_path.hpp"

namespace proftree {

// Destination of report lines
class ReportSink
{
public:
  virtual ~ReportSink() = default;

  virtual void
  writeLine(const std::string& tLine) = 0;
};

// Writes each line to a std::ostream (console by default)
class StreamSink : public ReportSink
{
public:
  explicit StreamSink(std::ostream& tOs = std::cout) : _os(&tOs) {}

  void
  writeLine(const std::string& tLine) override;

private:
  std::ostream* _os;
};

// Keeps lines in memory for callers that want the report as a string
class BufferSink : public ReportSink
{
public:
  void
  writeLine(const std::string& tLine) override
  {
    _lines.push_back(tLine);
  }

  [[nodiscard]] const std::vector<std::string>&
  lines() const
  {
    return _lines;
  }

  // Lines joined with '\n'
  [[nodiscard]] std::string
  str() const;

  void
  clear()
  {
    _lines.clear();
  }

private:
  std::vector<std::string> _lines;
};

/**
 * @brief Call tree rebuilt from a flat table snapshot
 *
 * A path is a child of another iff it extends it by exactly one name. Every path that has
 * children gets a synthetic "other <name>" child holding the parent time its measured
 * children do not account for (not clamped, it can be negative). The injection happens
 * once, on construction.
 */
class ReportTree
{
public:
  struct LeafTotal
  {
    std::string name;
    double totalMs = 0;
  };

  explicit ReportTree(const std::vector<BucketTable::Entry>& tSnapshot);

  // All paths, recorded ones first (in recorded order), then injected "other" paths
  [[nodiscard]] const std::vector<CallPath>&
  paths() const
  {
    return _paths;
  }

  // Time of a path including injected ones, 0.0 if unknown
  [[nodiscard]] double
  time(const CallPath& tPath) const;

  [[nodiscard]] bool
  contains(const CallPath& tPath) const
  {
    return _index.count(tPath) != 0;
  }

  [[nodiscard]] std::vector<CallPath>
  children(const CallPath& tPath) const;

  [[nodiscard]] bool
  hasChildren(const CallPath& tPath) const;

  [[nodiscard]] bool
  isLeaf(const CallPath& tPath) const
  {
    return !hasChildren(tPath);
  }

  // Depth-1 paths, the roots of the forest
  [[nodiscard]] std::vector<CallPath>
  topLevel() const;

  [[nodiscard]] std::vector<CallPath>
  leaves() const;

  // Leaf time grouped by terminal name, largest first (ties keep first-seen order)
  [[nodiscard]] std::vector<LeafTotal>
  leafTotals() const;

  static CallPath
  otherPath(const CallPath& tParent);

private:
  struct Node
  {
    double totalMs = 0;
    std::vector<std::size_t> children;
  };

  std::size_t
  add(const CallPath& tPath, double tMs);

  std::vector<CallPath> _paths;
  std::vector<Node> _nodes;
  std::unordered_map<CallPath, std::size_t, CallPathHash> _index;
};

/**
 * @brief Prints the hierarchical and leaf views of a ReportTree
 *
 * Lines below the filter threshold are omitted from both views. In the hierarchy a
 * suppressed parent still has its children checked against the threshold on their own.
 */
class ReportRenderer
{
public:
  static constexpr const char* kPrefix = "| ";

  ReportRenderer(const ReportTree& tTree, double tFilterMs, ReportSink& tSink);

  // Blank line, hierarchy, blank line, leaf totals
  void
  print();

  void
  printHierarchy();

  // Prints the leaf view and returns the grand total of the printed lines
  double
  printLeafTotals();

  static std::string
  formatMs(double tMs);

private:
  void
  line(int tLevel, const std::string& tText);

  void
  reportOn(int tLevel, const CallPath& tPath);

  const ReportTree& _tree;
  double _filterMs;
  ReportSink& _sink;
};

} // namespace proftree

#endif // PROFTREE_REPORT_HPP
