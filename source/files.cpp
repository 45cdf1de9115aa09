#include <vcsflow/files.hpp>
#include <vcsflow/io.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <ctime>

namespace fs = std::filesystem;

namespace vcsflow {

static std::string stamp_now() {
  using namespace std::chrono;
  auto now = system_clock::now();
  auto t = system_clock::to_time_t(now);
  auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[32];
  strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
  return fmt::format("{}_{:03d}", buf, static_cast<int>(ms));
}

fs::path BackupFileWriter::backup_copy(const fs::path &src) {
  io::ensure_dir(backup_dir_);
  fs::path dst = backup_dir_ / fmt::format("{}.{}.bak", src.filename().string(),
                                           stamp_now());
  for (int i = 1; fs::exists(dst); ++i)
    dst = backup_dir_ / fmt::format("{}.{}_{}.bak", src.filename().string(),
                                    stamp_now(), i);
  fs::copy_file(src, dst, fs::copy_options::overwrite_existing);
  return dst;
}

WriteOutcome BackupFileWriter::write_resolved_content(const fs::path &path,
                                                      const std::string &content) {
  WriteOutcome res{fs::absolute(path), std::nullopt};
  if (create_backups_ && fs::is_regular_file(res.path)) {
    res.backup = backup_copy(res.path);
    spdlog::debug("[files] backup {} -> {}", res.path.string(),
                  res.backup->string());
  }
  io::write_file(res.path, content);
  spdlog::info("[files] wrote {} ({} bytes)", res.path.string(), content.size());
  return res;
}

} // namespace vcsflow
