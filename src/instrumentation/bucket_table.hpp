#ifndef PROFTREE_BUCKET_TABLE_HPP
#define PROFTREE_BUCKET_TABLE_HPP

#include <cstddef>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "call_path.hpp"

namespace proftree {

/**
 * @brief Cumulative milliseconds per call path
 *
 * Shared by every thread of a session. Increments are serialized, so concurrent increases
 * of the same path never lose an update. Paths keep the order in which they were first
 * recorded.
 */
class BucketTable
{
public:
  /**
   * @brief Accumulated time of one exact call path
   */
  struct Entry
  {
    CallPath path;
    double totalMs = 0;
  };

  BucketTable() = default;

  BucketTable(const BucketTable&) = delete;
  BucketTable&
  operator=(const BucketTable&) = delete;

  /**
   * @brief Add time to a path, creating it at zero if absent
   * @param tPath Full call path
   * @param tMs Milliseconds to add
   */
  void
  increase(const CallPath& tPath, double tMs);

  /**
   * @brief Copy of all entries, in first-recorded order
   */
  [[nodiscard]] std::vector<Entry>
  snapshot() const;

  /**
   * @brief Accumulated time of a path
   * @return Milliseconds, 0.0 if the path was never recorded
   */
  [[nodiscard]] double
  get(const CallPath& tPath) const;

  [[nodiscard]] bool
  contains(const CallPath& tPath) const;

  [[nodiscard]] std::size_t
  size() const;

  /**
   * @brief Drop all entries
   */
  void
  clear();

private:
  mutable std::mutex _mutex;
  std::vector<Entry> _entries;
  std::unordered_map<CallPath, std::size_t, CallPathHash> _index;
};

} // namespace proftree

#endif // PROFTREE_BUCKET_TABLE_HPP
