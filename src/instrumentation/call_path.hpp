#ifndef PROFTREE_CALL_PATH_HPP
#define PROFTREE_CALL_PATH_HPP

#include <algorithm>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace proftree {

// Bucket names from the profiling root down to the current bucket. Compared by value.
using CallPath = std::vector<std::string>;

struct CallPathHash
{
  std::size_t
  operator()(const CallPath& tPath) const noexcept
  {
    std::size_t seed = tPath.size();
    for (const auto& name : tPath)
    {
      seed ^= std::hash<std::string>{}(name) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }
    return seed;
  }
};

// True iff tChild is tParent plus exactly one trailing name
inline bool
isChild(const CallPath& tParent, const CallPath& tChild)
{
  return tChild.size() == tParent.size() + 1 && std::equal(tParent.begin(), tParent.end(), tChild.begin());
}

// "build client : compile js : read source files"
inline std::string
toString(const CallPath& tPath)
{
  std::string out;
  for (std::size_t i = 0; i < tPath.size(); ++i)
  {
    if (i > 0)
      out += " : ";
    out += tPath[i];
  }
  return out;
}

} // namespace proftree

#endif // PROFTREE_CALL_PATH_HPP
