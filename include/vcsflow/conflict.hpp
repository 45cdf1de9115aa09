#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace vcsflow {

struct ConflictSection {
  std::string ours;
  std::string theirs;
  std::size_t offset{0}; // bytes into the file content
  std::size_t length{0};
};

struct ConflictFile {
  std::string path; // relative to the repository root
  std::vector<ConflictSection> sections;
  std::string preview;
};

// Extracts every "<<<<<<< / ======= / >>>>>>>" region. Unterminated regions
// are dropped; no markers yields an empty vector.
std::vector<ConflictSection> parse_conflict_sections(std::string_view content);

// Keeps at most `cap` bytes of `content` and appends `notice` when anything
// was cut. The cut never splits a UTF-8 sequence.
std::string truncate_text(const std::string &content, std::size_t cap,
                          std::string_view notice);

// Caps `content` at `cap` bytes with a truncation notice.
std::string make_preview(const std::string &content, std::size_t cap);

} // namespace vcsflow
