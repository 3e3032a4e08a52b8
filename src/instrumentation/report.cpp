#include "report.hpp"

#include <algorithm>
#include <iomanip>
#include <iterator>
#include <sstream>

#include "clock.hpp"

namespace proftree {

void
StreamSink::writeLine(const std::string& tLine)
{
  (*_os) << tLine << '\n';
}

std::string
BufferSink::str() const
{
  std::string out;
  for (std::size_t i = 0; i < _lines.size(); ++i)
  {
    if (i > 0)
      out += '\n';
    out += _lines[i];
  }
  return out;
}

// --- ReportTree ---

ReportTree::ReportTree(const std::vector<BucketTable::Entry>& tSnapshot)
{
  for (const auto& entry : tSnapshot)
  {
    if (!entry.path.empty() && !contains(entry.path))
      add(entry.path, entry.totalMs);
  }

  // 1. Link each recorded path to its parent, preserving recorded order
  for (std::size_t i = 0; i < _paths.size(); ++i)
  {
    const CallPath& path = _paths[i];
    if (path.size() < 2)
      continue;
    CallPath parent(path.begin(), path.end() - 1);
    auto it = _index.find(parent);
    if (it != _index.end())
    {
      _nodes[it->second].children.push_back(i);
    }
  }

  // 2. Inject "other" for every recorded parent. Child sums use recorded times only.
  const std::size_t recordedCount = _paths.size();
  std::vector<double> recordedMs;
  recordedMs.reserve(recordedCount);
  for (const auto& node : _nodes)
  {
    recordedMs.push_back(node.totalMs);
  }

  for (std::size_t i = 0; i < recordedCount; ++i)
  {
    if (_nodes[i].children.empty())
      continue;

    CallPath other = otherPath(_paths[i]);
    auto it = _index.find(other);

    // A recorded bucket with the synthetic name is merged into "other", not counted as a sibling
    double childrenMs = 0;
    for (std::size_t child : _nodes[i].children)
    {
      if (it == _index.end() || child != it->second)
        childrenMs += recordedMs[child];
    }
    double otherMs = _nodes[i].totalMs - childrenMs;

    if (it != _index.end())
    {
      // A recorded bucket already has this name; the computed value replaces its time
      _nodes[it->second].totalMs = otherMs;
    }
    else
    {
      std::size_t index = add(other, otherMs);
      _nodes[i].children.push_back(index);
    }
  }
}

std::size_t
ReportTree::add(const CallPath& tPath, double tMs)
{
  std::size_t index = _paths.size();
  _index.emplace(tPath, index);
  _paths.push_back(tPath);
  Node node;
  node.totalMs = tMs;
  _nodes.push_back(std::move(node));
  return index;
}

double
ReportTree::time(const CallPath& tPath) const
{
  auto it = _index.find(tPath);
  return it != _index.end() ? _nodes[it->second].totalMs : 0.0;
}

std::vector<CallPath>
ReportTree::children(const CallPath& tPath) const
{
  std::vector<CallPath> result;
  auto it = _index.find(tPath);
  if (it == _index.end())
    return result;
  for (std::size_t child : _nodes[it->second].children)
  {
    result.push_back(_paths[child]);
  }
  return result;
}

bool
ReportTree::hasChildren(const CallPath& tPath) const
{
  auto it = _index.find(tPath);
  return it != _index.end() && !_nodes[it->second].children.empty();
}

std::vector<CallPath>
ReportTree::topLevel() const
{
  std::vector<CallPath> result;
  std::copy_if(_paths.begin(), _paths.end(), std::back_inserter(result),
               [](const CallPath& tPath)
               {
                 return tPath.size() == 1;
               });
  return result;
}

std::vector<CallPath>
ReportTree::leaves() const
{
  std::vector<CallPath> result;
  for (std::size_t i = 0; i < _paths.size(); ++i)
  {
    if (_nodes[i].children.empty())
      result.push_back(_paths[i]);
  }
  return result;
}

std::vector<ReportTree::LeafTotal>
ReportTree::leafTotals() const
{
  std::vector<LeafTotal> totals;
  std::unordered_map<std::string, std::size_t> byName;

  for (std::size_t i = 0; i < _paths.size(); ++i)
  {
    if (!_nodes[i].children.empty())
      continue;

    const std::string& name = _paths[i].back();
    auto it = byName.find(name);
    if (it == byName.end())
    {
      it = byName.emplace(name, totals.size()).first;
      totals.push_back(LeafTotal{name, 0.0});
    }
    totals[it->second].totalMs += _nodes[i].totalMs;
  }

  std::stable_sort(totals.begin(), totals.end(),
                   [](const LeafTotal& tA, const LeafTotal& tB)
                   {
                     return tA.totalMs > tB.totalMs;
                   });
  return totals;
}

CallPath
ReportTree::otherPath(const CallPath& tParent)
{
  CallPath other = tParent;
  other.push_back("other " + tParent.back());
  return other;
}

// --- ReportRenderer ---

ReportRenderer::ReportRenderer(const ReportTree& tTree, double tFilterMs, ReportSink& tSink) :
  _tree(tTree), _filterMs(tFilterMs), _sink(tSink)
{
}

void
ReportRenderer::print()
{
  line(0, "");
  printHierarchy();
  line(0, "");
  printLeafTotals();
}

void
ReportRenderer::printHierarchy()
{
  for (const auto& path : _tree.topLevel())
  {
    reportOn(0, path);
  }
}

double
ReportRenderer::printLeafTotals()
{
  double grandTotal = 0;
  for (const auto& total : _tree.leafTotals())
  {
    if (total.totalMs < _filterMs)
      continue;
    line(0, total.name + ": " + formatMs(total.totalMs));
    grandTotal += total.totalMs;
  }
  line(0, std::string(clock::kMeasuredLabel) + ": " + formatMs(grandTotal));
  return grandTotal;
}

std::string
ReportRenderer::formatMs(double tMs)
{
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(1) << tMs;
  return ss.str();
}

void
ReportRenderer::line(int tLevel, const std::string& tText)
{
  _sink.writeLine(kPrefix + std::string(static_cast<std::size_t>(tLevel) * 4, ' ') + tText);
}

void
ReportRenderer::reportOn(int tLevel, const CallPath& tPath)
{
  double ms = _tree.time(tPath);
  if (!_tree.hasChildren(tPath))
  {
    if (ms >= _filterMs)
      line(tLevel, tPath.back() + ": " + formatMs(ms));
    return;
  }

  if (ms >= _filterMs)
    line(tLevel, tPath.back() + ": " + formatMs(ms));
  for (const auto& child : _tree.children(tPath))
  {
    reportOn(tLevel + 1, child);
  }
}

} // namespace proftree
