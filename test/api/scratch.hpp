#pragma once

#include <stdlib.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

// A fresh directory under the system temp dir, removed on destruction.
struct scratch_dir {
  fs::path path;

  scratch_dir() {
    std::string tmpl = (fs::temp_directory_path() / "cbridge-XXXXXX").string();
    if (!::mkdtemp(tmpl.data()))
      throw std::runtime_error{"mkdtemp failed"};
    path = tmpl;
  }

  scratch_dir(const scratch_dir&) = delete;
  scratch_dir(scratch_dir&&) = delete;
  scratch_dir& operator=(const scratch_dir&) = delete;
  scratch_dir& operator=(scratch_dir&&) = delete;
  ~scratch_dir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
};

inline std::string slurp(const fs::path& p) {
  std::ifstream f{p, std::ios::binary};
  return {std::istreambuf_iterator<char>{f}, std::istreambuf_iterator<char>{}};
}

inline void spit(const fs::path& p, const std::string& content) {
  fs::create_directories(p.parent_path());
  std::ofstream f{p, std::ios::binary};
  f << content;
}
