#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace vcsflow {
namespace io {
  void ensure_dir(const std::filesystem::path& p);
  std::optional<std::string> read_file(const std::filesystem::path& p);

  // write to "<p>.tmp" then rename over p
  void write_file(const std::filesystem::path& p, const std::string& data);
}
} // namespace vcsflow
