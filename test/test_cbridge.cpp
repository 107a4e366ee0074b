#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "logger.hpp"

// Keep test output readable: only warnings and worse unless asked.
[[maybe_unused]] static const bool quiet_logs = [] {
  cbridge::logger::set_level(cbridge::logger::level::warning);
  return true;
}();
