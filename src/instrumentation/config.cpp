#include "config.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>

namespace proftree {

namespace {

bool
isBlank(const char* tText)
{
  for (; *tText != '\0'; ++tText)
  {
    if (!std::isspace(static_cast<unsigned char>(*tText)))
      return false;
  }
  return true;
}

} // namespace

Config
Config::parse(const char* tValue)
{
  Config config;
  if (tValue == nullptr || *tValue == '\0')
    return config;

  config.enabled = true;

  char* end = nullptr;
  double value = std::strtod(tValue, &end);
  if (end == tValue || !isBlank(end) || !std::isfinite(value))
    return config;

  // Negative filters would print every line including negative "other" entries; keep the default
  value = std::trunc(value);
  if (value > 0)
    config.filterMs = value;
  return config;
}

Config
Config::fromEnvironment()
{
  return parse(std::getenv(kEnvVar));
}

} // namespace proftree
