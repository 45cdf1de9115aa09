#include <vcsflow/format.hpp>

#include <fmt/format.h>

namespace vcsflow {

const char *to_string(ErrorKind k) {
  switch (k) {
  case ErrorKind::None:
    return "None";
  case ErrorKind::Invocation:
    return "Invocation";
  case ErrorKind::Command:
    return "Command";
  case ErrorKind::Conflict:
    return "Conflict";
  case ErrorKind::Precondition:
    return "Precondition";
  case ErrorKind::Cancelled:
    return "Cancelled";
  case ErrorKind::Timeout:
    return "Timeout";
  case ErrorKind::Fault:
    return "Fault";
  }
  return "Fault";
}

std::string json_escape(std::string_view s) {
  std::string o;
  o.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
    case '"':
      o += "\\\"";
      break;
    case '\\':
      o += "\\\\";
      break;
    case '\b':
      o += "\\b";
      break;
    case '\f':
      o += "\\f";
      break;
    case '\n':
      o += "\\n";
      break;
    case '\r':
      o += "\\r";
      break;
    case '\t':
      o += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20)
        o += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
      else
        o += c;
    }
  }
  return o;
}

// ------------------------ JsonWriter ------------------------

void JsonWriter::before_value() {
  if (after_key_) {
    after_key_ = false;
    return;
  }
  if (first_.empty())
    return;
  if (!first_.back())
    out_ += ',';
  first_.back() = false;
  out_ += '\n';
  out_.append(first_.size() * 2, ' ');
}

void JsonWriter::close(char c) {
  bool empty = first_.back();
  first_.pop_back();
  if (!empty) {
    out_ += '\n';
    out_.append(first_.size() * 2, ' ');
  }
  out_ += c;
}

void JsonWriter::begin_object() {
  before_value();
  out_ += '{';
  first_.push_back(true);
}

void JsonWriter::end_object() { close('}'); }

void JsonWriter::begin_array() {
  before_value();
  out_ += '[';
  first_.push_back(true);
}

void JsonWriter::end_array() { close(']'); }

void JsonWriter::key(std::string_view k) {
  before_value();
  out_ += '"';
  out_ += json_escape(k);
  out_ += "\": ";
  after_key_ = true;
}

void JsonWriter::value(std::string_view v) {
  before_value();
  out_ += '"';
  out_ += json_escape(v);
  out_ += '"';
}

void JsonWriter::value(bool v) {
  before_value();
  out_ += v ? "true" : "false";
}

void JsonWriter::value(long long v) {
  before_value();
  out_ += std::to_string(v);
}

void JsonWriter::null() {
  before_value();
  out_ += "null";
}

// ------------------------ results ------------------------

namespace {

void count(JsonWriter &w, std::string_view k, std::size_t n) {
  w.key(k);
  w.value(static_cast<long long>(n));
}

void strings(JsonWriter &w, std::string_view k,
             const std::vector<std::string> &v) {
  w.key(k);
  w.begin_array();
  for (auto &s : v)
    w.value(s);
  w.end_array();
}

void head(JsonWriter &w, const Envelope &e) {
  w.begin_object();
  w.field("Success", e.success);
  if (e.kind != ErrorKind::None)
    w.field("Kind", to_string(e.kind));
  if (!e.message.empty())
    w.field("Message", e.message);
}

std::string tail(JsonWriter &w, const Envelope &e) {
  if (!e.output.empty())
    w.field("Output", e.output);
  if (!e.errors.empty())
    w.field("Errors", e.errors);
  w.end_object();
  return w.str() + "\n";
}

void files(JsonWriter &w, std::string_view k,
           const std::vector<FileStatus> &v) {
  w.key(k);
  w.begin_array();
  for (auto &f : v) {
    w.begin_object();
    w.field("Path", f.path);
    w.field("Status", to_string(f.kind));
    w.end_object();
  }
  w.end_array();
}

} // namespace

std::string to_json(const RawResult &r) {
  JsonWriter w;
  head(w, r);
  return tail(w, r);
}

std::string to_json(const StatusResult &r) {
  JsonWriter w;
  head(w, r);
  if (r.success) {
    const auto &s = r.status;
    w.key("Status");
    w.begin_object();
    w.field("Branch", s.branch);
    w.key("Upstream");
    if (s.upstream)
      w.value(*s.upstream);
    else
      w.null();
    w.field("Ahead", static_cast<long long>(s.ahead));
    w.field("Behind", static_cast<long long>(s.behind));
    w.field("IsClean", s.is_clean());
    files(w, "Staged", s.staged);
    files(w, "Unstaged", s.unstaged);
    strings(w, "Untracked", s.untracked);
    strings(w, "Conflicted", s.conflicted);
    w.field("RawStatus", s.raw_status);
    w.end_object();
  }
  return tail(w, r);
}

std::string to_json(const CommitResult &r) {
  JsonWriter w;
  head(w, r);
  if (r.success) {
    w.field("CommitHash", r.commit_hash);
    w.field("ShortHash", r.short_hash);
  }
  return tail(w, r);
}

std::string to_json(const StagedResult &r) {
  JsonWriter w;
  head(w, r);
  strings(w, "StagedFiles", r.staged_files);
  return tail(w, r);
}

std::string to_json(const BranchList &r) {
  JsonWriter w;
  head(w, r);
  w.field("CurrentBranch", r.current_branch);
  w.key("Branches");
  w.begin_array();
  for (auto &b : r.branches) {
    w.begin_object();
    w.field("Name", b.name);
    w.field("IsCurrent", b.is_current);
    w.field("IsRemote", b.is_remote);
    w.end_object();
  }
  w.end_array();
  return tail(w, r);
}

std::string to_json(const CheckoutResult &r) {
  JsonWriter w;
  head(w, r);
  w.field("CurrentBranch", r.current_branch);
  return tail(w, r);
}

std::string to_json(const ConflictReport &r) {
  JsonWriter w;
  head(w, r);
  w.field("HasConflicts", !r.conflicted_files.empty());
  strings(w, "ConflictedFiles", r.conflicted_files);
  if (!r.suggestion.empty())
    w.field("Suggestion", r.suggestion);
  return tail(w, r);
}

std::string to_json(const AbortedReport &r) {
  JsonWriter w;
  head(w, r);
  w.field("HadConflicts", r.had_conflicts);
  return tail(w, r);
}

std::string to_json(const ConflictDetails &r) {
  JsonWriter w;
  head(w, r);
  w.field("HasConflicts", r.has_conflicts);
  if (r.has_conflicts) {
    count(w, "ConflictCount", r.conflict_count);
    w.key("Conflicts");
    w.begin_array();
    for (auto &f : r.conflicts) {
      w.begin_object();
      w.field("File", f.path);
      count(w, "SectionCount", f.sections.size());
      w.key("Sections");
      w.begin_array();
      for (auto &s : f.sections) {
        w.begin_object();
        w.field("Ours", s.ours);
        w.field("Theirs", s.theirs);
        count(w, "StartIndex", s.offset);
        count(w, "Length", s.length);
        w.end_object();
      }
      w.end_array();
      w.field("FullContent", f.preview);
      w.end_object();
    }
    w.end_array();
    w.field("Suggestion", r.suggestion);
  }
  return tail(w, r);
}

std::string to_json(const CommitList &r) {
  JsonWriter w;
  head(w, r);
  count(w, "CommitCount", r.commits.size());
  w.key("Commits");
  w.begin_array();
  for (auto &c : r.commits) {
    w.begin_object();
    w.field("Hash", c.hash);
    w.field("ShortHash", c.short_hash);
    w.field("Author", c.author);
    w.field("Email", c.email);
    w.field("Date", c.date);
    w.field("Message", c.message);
    w.end_object();
  }
  w.end_array();
  return tail(w, r);
}

std::string to_json(const LineList &r) {
  JsonWriter w;
  head(w, r);
  count(w, "CommitCount", r.lines.size());
  strings(w, "Commits", r.lines);
  return tail(w, r);
}

std::string to_json(const DiffResult &r) {
  JsonWriter w;
  head(w, r);
  w.field("Diff", r.diff);
  w.field("Stats", r.stats);
  return tail(w, r);
}

std::string to_json(const NameList &r) {
  JsonWriter w;
  head(w, r);
  count(w, "FileCount", r.files.size());
  strings(w, "ChangedFiles", r.files);
  return tail(w, r);
}

std::string to_json(const RemoteList &r) {
  JsonWriter w;
  head(w, r);
  w.key("Remotes");
  w.begin_array();
  for (auto &e : r.remotes) {
    w.begin_object();
    w.field("Name", e.name);
    w.field("Url", e.url);
    w.field("Type", to_string(e.direction));
    w.end_object();
  }
  w.end_array();
  return tail(w, r);
}

std::string to_json(const StashList &r) {
  JsonWriter w;
  head(w, r);
  count(w, "StashCount", r.stashes.size());
  w.key("Stashes");
  w.begin_array();
  for (auto &s : r.stashes) {
    w.begin_object();
    w.field("Ref", s.ref);
    w.field("Branch", s.branch);
    w.field("Message", s.message);
    w.end_object();
  }
  w.end_array();
  return tail(w, r);
}

} // namespace vcsflow
