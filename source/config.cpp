#include <vcsflow/config.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <vector>

namespace vcsflow {

namespace {

template <typename T> void env_number(const char *name, T &dst) {
  const char *e = std::getenv(name);
  if (!e || !*e)
    return;
  try {
    size_t pos = 0;
    long long v = std::stoll(e, &pos);
    if (pos != std::string(e).size() || v < 0)
      throw std::invalid_argument(e);
    dst = static_cast<T>(v);
  } catch (const std::exception &) {
    spdlog::warn("[config] ignoring {}='{}': not a non-negative integer", name,
                 e);
  }
}

void env_flag(const char *name, bool &dst) {
  const char *e = std::getenv(name);
  if (!e || !*e)
    return;
  std::string v(e);
  if (v == "1" || v == "true" || v == "yes" || v == "on")
    dst = true;
  else if (v == "0" || v == "false" || v == "no" || v == "off")
    dst = false;
  else
    spdlog::warn("[config] ignoring {}='{}': expected a boolean", name, v);
}

} // namespace

std::filesystem::path Config::default_backup_dir() {
  std::error_code ec;
  auto tmp = std::filesystem::temp_directory_path(ec);
  if (ec)
    tmp = "/tmp";
  return tmp / "vcsflow" / "backups";
}

Config Config::from_env() {
  Config cfg;
  if (const char *e = std::getenv("VCSFLOW_GIT"); e && *e)
    cfg.git_binary = e;
  env_number("VCSFLOW_TIMEOUT_MS", cfg.timeout_ms);
  env_flag("VCSFLOW_SERIALIZE", cfg.serialize_per_repo);
  if (const char *e = std::getenv("VCSFLOW_LOG_LEVEL"); e && *e)
    cfg.log_level = e;
  if (const char *e = std::getenv("VCSFLOW_LOG_FILE"); e && *e)
    cfg.log_file = e;
  constexpr std::uintmax_t mib = 1024 * 1024;
  std::uintmax_t mb = cfg.log_rotate_max_bytes / mib;
  env_number("VCSFLOW_LOG_MAX_MB", mb);
  if (mb > std::numeric_limits<std::size_t>::max() / mib)
    spdlog::warn("[config] ignoring VCSFLOW_LOG_MAX_MB={}: too large", mb);
  else
    cfg.log_rotate_max_bytes = mb * mib;
  env_number("VCSFLOW_LOG_FILES", cfg.log_rotate_files);
  env_flag("VCSFLOW_BACKUPS", cfg.create_backups);
  if (const char *e = std::getenv("VCSFLOW_BACKUP_DIR"); e && *e)
    cfg.backup_dir = e;
  return cfg;
}

// Logs go to stderr; stdout carries the JSON result.
void setup_logging(const Config &cfg) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!cfg.log_file.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          cfg.log_file.string(), static_cast<size_t>(cfg.log_rotate_max_bytes),
          cfg.log_rotate_files));
    } catch (const spdlog::spdlog_ex &ex) {
      spdlog::warn("[config] cannot open log file {}: {}",
                   cfg.log_file.string(), ex.what());
    }
  }
  auto logger =
      std::make_shared<spdlog::logger>("vcsflow", sinks.begin(), sinks.end());
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto lvl = spdlog::level::from_str(cfg.log_level);
  if (lvl == spdlog::level::off && cfg.log_level != "off") {
    spdlog::warn("[config] unknown log level '{}', using info", cfg.log_level);
    lvl = spdlog::level::info;
  }
  spdlog::set_level(lvl);
}

} // namespace vcsflow
