#include <vcsflow/io.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace vcsflow {
namespace io {

void ensure_dir(const fs::path &p) {
  if (!p.empty() && !fs::exists(p))
    fs::create_directories(p);
}

std::optional<std::string> read_file(const fs::path &p) {
  std::ifstream in(p, std::ios::binary);
  if (!in)
    return std::nullopt;
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_file(const fs::path &p, const std::string &data) {
  ensure_dir(p.parent_path());
  fs::path tmp = p;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out)
      throw std::runtime_error("open: " + tmp.string());
    out << data;
    out.flush();
    if (!out)
      throw std::runtime_error("write: " + tmp.string());
  }
  std::error_code ec;
  fs::rename(tmp, p, ec);
  if (ec) {
    fs::remove(tmp, ec);
    throw std::runtime_error("rename: " + p.string());
  }
}

} // namespace io
} // namespace vcsflow
