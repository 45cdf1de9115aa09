#include <vcsflow/errors.hpp>
#include <vcsflow/session.hpp>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace vcsflow {

AnalysisSession::AnalysisSession(std::unique_ptr<AnalysisBackend> backend)
    : backend_(std::move(backend)) {
  if (!backend_)
    throw ValidationError("analysis backend is required");
}

AnalysisSession::~AnalysisSession() {
  std::lock_guard<std::mutex> lk(mu_);
  if (!loaded_)
    return;
  try {
    backend_->unload();
  } catch (const std::exception &e) {
    spdlog::warn("[session] unload on destroy failed: {}", e.what());
  }
}

void AnalysisSession::load(const fs::path &solution) {
  std::lock_guard<std::mutex> lk(mu_);
  if (loaded_) {
    spdlog::info("[session] replacing {}", loaded_->string());
    backend_->unload();
    loaded_.reset();
  }
  spdlog::info("[session] loading {}", solution.string());
  backend_->load(solution);
  loaded_ = solution;
}

void AnalysisSession::unload() {
  std::lock_guard<std::mutex> lk(mu_);
  if (!loaded_)
    return;
  backend_->unload();
  spdlog::info("[session] unloaded {}", loaded_->string());
  loaded_.reset();
}

bool AnalysisSession::is_loaded() const {
  std::lock_guard<std::mutex> lk(mu_);
  return loaded_.has_value();
}

std::optional<fs::path> AnalysisSession::loaded_path() const {
  std::lock_guard<std::mutex> lk(mu_);
  return loaded_;
}

void AnalysisSession::require_loaded() const {
  if (!loaded_)
    throw ValidationError("no solution loaded; call load() first");
}

std::vector<SymbolLocation> AnalysisSession::find_symbols(const std::string &name) {
  std::lock_guard<std::mutex> lk(mu_);
  require_loaded();
  return backend_->find_symbols(name);
}

std::vector<SymbolLocation>
AnalysisSession::find_references(const std::string &name) {
  std::lock_guard<std::mutex> lk(mu_);
  require_loaded();
  return backend_->find_references(name);
}

std::vector<ProjectDependency> AnalysisSession::dependencies() {
  std::lock_guard<std::mutex> lk(mu_);
  require_loaded();
  return backend_->dependencies();
}

} // namespace vcsflow
