#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace vcsflow {

struct WriteOutcome {
  std::filesystem::path path;
  std::optional<std::filesystem::path> backup;
};

// Writes content on behalf of conflict resolution; the only place this
// library touches working-tree files itself.
class FileMutator {
public:
  virtual ~FileMutator() = default;
  virtual WriteOutcome write_resolved_content(const std::filesystem::path &path,
                                              const std::string &content) = 0;
};

class BackupFileWriter : public FileMutator {
public:
  BackupFileWriter(std::filesystem::path backup_dir, bool create_backups)
      : backup_dir_(std::move(backup_dir)), create_backups_(create_backups) {}

  WriteOutcome write_resolved_content(const std::filesystem::path &path,
                                      const std::string &content) override;

private:
  std::filesystem::path backup_copy(const std::filesystem::path &src);

  std::filesystem::path backup_dir_;
  bool create_backups_;
};

} // namespace vcsflow
