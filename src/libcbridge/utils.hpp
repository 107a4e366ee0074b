#pragma once

#include <cxxabi.h>
#include <fmt/format.h>

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cbridge::utils {
template <typename Exception = std::runtime_error, typename... Args>
[[noreturn]] void throwf(
    fmt::format_string<Args...> format_str, Args&&... args) {
  throw Exception(fmt::format(format_str, std::forward<Args>(args)...));
}

// Demangle C++ symbols using __cxa_demangle
inline std::string demangle_symbol(std::string_view mangled) {
  int status = 0;
  std::string result{mangled};
  char* demangled =
      abi::__cxa_demangle(result.c_str(), nullptr, nullptr, &status);
  if (status == 0 && demangled) {
    result = demangled;
    std::free(demangled);  // NOLINT
  }
  return result;
}

// Last n bytes of s, for log lines and transcript tails.
inline std::string tail(std::string_view s, std::size_t n) {
  if (s.size() <= n) return std::string{s};
  return std::string{s.substr(s.size() - n)};
}

inline std::string trim(std::string_view s) {
  auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string_view::npos) return {};
  auto e = s.find_last_not_of(" \t\r\n");
  return std::string{s.substr(b, e - b + 1)};
}

}  // namespace cbridge::utils
