#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace vcsflow {

struct Config {
  std::string git_binary = "git";
  long timeout_ms = 0; // 0: no deadline
  bool serialize_per_repo = true;

  std::string log_level = "info";
  std::filesystem::path log_file;
  std::uintmax_t log_rotate_max_bytes = 5 * 1024 * 1024;
  std::size_t log_rotate_files = 3;

  bool create_backups = true;
  std::filesystem::path backup_dir = default_backup_dir();

  std::size_t diff_cap = 10000;
  std::size_t preview_cap = 5000;

  static Config from_env();

  // <temp dir>/vcsflow/backups; /tmp when TMPDIR is unusable.
  static std::filesystem::path default_backup_dir();
};

void setup_logging(const Config &cfg);

} // namespace vcsflow
