#include <vcsflow/conflict.hpp>
#include <vcsflow/runner.hpp>

namespace vcsflow {

namespace {

enum class State { Outside, Ours, Base, Theirs };

struct Line {
  std::size_t begin;
  std::size_t end; // excluding '\n'
  std::string_view text;
};

bool has_prefix(std::string_view s, std::string_view p) {
  return s.size() >= p.size() && s.substr(0, p.size()) == p;
}

std::string_view strip_cr(std::string_view s) {
  if (!s.empty() && s.back() == '\r')
    s.remove_suffix(1);
  return s;
}

} // namespace

std::vector<ConflictSection> parse_conflict_sections(std::string_view content) {
  std::vector<ConflictSection> out;

  State state = State::Outside;
  std::size_t region_begin = 0;
  std::size_t ours_begin = 0, ours_end = 0;
  std::size_t theirs_begin = 0;

  std::size_t pos = 0;
  while (pos < content.size()) {
    std::size_t nl = content.find('\n', pos);
    Line ln{pos, nl == std::string_view::npos ? content.size() : nl, {}};
    ln.text = strip_cr(content.substr(ln.begin, ln.end - ln.begin));
    const std::size_t next = nl == std::string_view::npos ? content.size() : nl + 1;

    switch (state) {
    case State::Outside:
      if (has_prefix(ln.text, "<<<<<<<")) {
        state = State::Ours;
        region_begin = ln.begin;
        ours_begin = next;
      }
      break;
    case State::Ours:
      if (has_prefix(ln.text, "<<<<<<<")) {
        // nested start: restart the region here
        region_begin = ln.begin;
        ours_begin = next;
      } else if (has_prefix(ln.text, "|||||||")) {
        ours_end = ln.begin;
        state = State::Base;
      } else if (ln.text == "=======") {
        ours_end = ln.begin;
        theirs_begin = next;
        state = State::Theirs;
      }
      break;
    case State::Base:
      if (ln.text == "=======") {
        theirs_begin = next;
        state = State::Theirs;
      }
      break;
    case State::Theirs:
      if (has_prefix(ln.text, ">>>>>>>")) {
        ConflictSection sec;
        sec.ours = trim(std::string(content.substr(ours_begin, ours_end - ours_begin)));
        sec.theirs = trim(std::string(content.substr(theirs_begin, ln.begin - theirs_begin)));
        sec.offset = region_begin;
        sec.length = ln.end - region_begin;
        out.push_back(std::move(sec));
        state = State::Outside;
      }
      break;
    }
    pos = next;
  }
  return out;
}

std::string truncate_text(const std::string &content, std::size_t cap,
                          std::string_view notice) {
  if (content.size() <= cap)
    return content;
  std::size_t cut = cap;
  // back off continuation bytes (10xxxxxx) so the lead byte goes too
  while (cut > 0 && (static_cast<unsigned char>(content[cut]) & 0xC0) == 0x80)
    --cut;
  std::string out = content.substr(0, cut);
  out += notice;
  return out;
}

std::string make_preview(const std::string &content, std::size_t cap) {
  return truncate_text(content, cap, "\n... (truncated)");
}

} // namespace vcsflow
