#include "bucket_table.hpp"

namespace proftree {

void
BucketTable::increase(const CallPath& tPath, double tMs)
{
  std::lock_guard<std::mutex> lock(_mutex);

  auto it = _index.find(tPath);
  if (it == _index.end())
  {
    _entries.push_back(Entry{tPath, 0.0});
    try
    {
      it = _index.emplace(tPath, _entries.size() - 1).first;
    }
    catch (...)
    {
      _entries.pop_back();
      throw;
    }
  }
  _entries[it->second].totalMs += tMs;
}

std::vector<BucketTable::Entry>
BucketTable::snapshot() const
{
  std::lock_guard<std::mutex> lock(_mutex);
  return _entries;
}

double
BucketTable::get(const CallPath& tPath) const
{
  std::lock_guard<std::mutex> lock(_mutex);
  auto it = _index.find(tPath);
  return it != _index.end() ? _entries[it->second].totalMs : 0.0;
}

bool
BucketTable::contains(const CallPath& tPath) const
{
  std::lock_guard<std::mutex> lock(_mutex);
  return _index.count(tPath) != 0;
}

std::size_t
BucketTable::size() const
{
  std::lock_guard<std::mutex> lock(_mutex);
  return _entries.size();
}

void
BucketTable::clear()
{
  std::lock_guard<std::mutex> lock(_mutex);
  _entries.clear();
  _index.clear();
}

} // namespace proftree
