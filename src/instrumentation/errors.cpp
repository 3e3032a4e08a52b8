#include "errors.hpp"

#include <cstdlib>
#include <iostream>

namespace proftree {

void
fatal(const std::string& tMessage)
{
  std::cerr << "[proftree] fatal: " << tMessage << std::endl;
  std::abort();
}

} // namespace proftree
