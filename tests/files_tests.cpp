#include <catch2/catch_all.hpp>
#include <vcsflow/files.hpp>
#include <vcsflow/io.hpp>

#include <filesystem>
#include <fstream>

using namespace vcsflow;
namespace fs = std::filesystem;

static fs::path mkd(const char* name){
  auto d = fs::temp_directory_path() / (std::string("vcsflow_files_")+name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

TEST_CASE("resolved content replaces the file and keeps a backup") {
  auto d = mkd("backup");
  auto target = d / "work" / "a.txt";
  io::write_file(target, "<<<<<<< HEAD\nx\n=======\ny\n>>>>>>> b\n");

  BackupFileWriter w(d / "bak", true);
  auto res = w.write_resolved_content(target, "merged\n");

  REQUIRE(*io::read_file(target) == "merged\n");
  REQUIRE(res.backup.has_value());
  REQUIRE(fs::exists(*res.backup));
  REQUIRE(io::read_file(*res.backup)->find("<<<<<<<") == 0);
  REQUIRE_FALSE(fs::exists(target.string() + ".tmp"));
}

TEST_CASE("backups can be switched off") {
  auto d = mkd("nobackup");
  auto target = d / "a.txt";
  io::write_file(target, "old");

  BackupFileWriter w(d / "bak", false);
  auto res = w.write_resolved_content(target, "new");
  REQUIRE_FALSE(res.backup.has_value());
  REQUIRE_FALSE(fs::exists(d / "bak"));
  REQUIRE(*io::read_file(target) == "new");
}

TEST_CASE("two writes in a row keep distinct backups") {
  auto d = mkd("twice");
  auto target = d / "a.txt";
  io::write_file(target, "v1");
  BackupFileWriter w(d / "bak", true);
  auto r1 = w.write_resolved_content(target, "v2");
  auto r2 = w.write_resolved_content(target, "v3");
  REQUIRE(*r1.backup != *r2.backup);
  REQUIRE(*io::read_file(*r1.backup) == "v1");
  REQUIRE(*io::read_file(*r2.backup) == "v2");
}

TEST_CASE("read_file on a missing path") {
  REQUIRE_FALSE(io::read_file("/nonexistent/vcsflow/file").has_value());
}
