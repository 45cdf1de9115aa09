#pragma once
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vcsflow {

// Interfaces of the services that sit next to the VCS workflows. Only the
// boundary lives here; implementations are supplied by the embedding process.

struct SearchOptions {
  std::string file_pattern;
  bool case_sensitive = false;
  bool use_regex = false;
  int max_results = 50;
  std::vector<std::string> exclude_folders;
};

struct SearchMatch {
  std::filesystem::path file;
  int line = 0;
  std::string line_content;
  std::string matched_text;
};

class SearchService {
public:
  virtual ~SearchService() = default;
  virtual std::vector<SearchMatch> search(const std::filesystem::path &root,
                                          const std::string &query,
                                          const SearchOptions &options) = 0;
};

struct SymbolLocation {
  std::string name;
  std::string kind;
  std::filesystem::path file;
  int line = 0;
};

struct ProjectDependency {
  std::string project_name;
  std::filesystem::path project_path;
  std::vector<std::string> project_references;
  std::vector<std::pair<std::string, std::string>> package_references;
};

class AnalysisBackend {
public:
  virtual ~AnalysisBackend() = default;
  virtual void load(const std::filesystem::path &solution) = 0;
  virtual void unload() = 0;
  virtual std::vector<SymbolLocation> find_symbols(const std::string &name) = 0;
  virtual std::vector<SymbolLocation> find_references(const std::string &name) = 0;
  virtual std::vector<ProjectDependency> dependencies() = 0;
};

// Explicit handle over one loaded workspace. Loads are serialized; queries
// on an unloaded session throw ValidationError.
class AnalysisSession {
public:
  explicit AnalysisSession(std::unique_ptr<AnalysisBackend> backend);
  ~AnalysisSession();

  AnalysisSession(const AnalysisSession &) = delete;
  AnalysisSession &operator=(const AnalysisSession &) = delete;

  void load(const std::filesystem::path &solution);
  void unload();

  bool is_loaded() const;
  std::optional<std::filesystem::path> loaded_path() const;

  std::vector<SymbolLocation> find_symbols(const std::string &name);
  std::vector<SymbolLocation> find_references(const std::string &name);
  std::vector<ProjectDependency> dependencies();

private:
  void require_loaded() const;

  std::unique_ptr<AnalysisBackend> backend_;
  mutable std::mutex mu_;
  std::optional<std::filesystem::path> loaded_;
};

} // namespace vcsflow
