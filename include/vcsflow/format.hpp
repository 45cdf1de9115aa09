#pragma once
#include "result.hpp"

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace vcsflow {

// Minimal indented JSON emitter. Keys and values are written in call order.
class JsonWriter {
public:
  void begin_object();
  void end_object();
  void begin_array();
  void end_array();

  void key(std::string_view k);
  void value(std::string_view v);
  void value(const char *v) { value(std::string_view(v)); }
  void value(bool v);
  void value(long long v);
  void null();

  template <typename T> void field(std::string_view k, const T &v) {
    key(k);
    value(v);
  }

  const std::string &str() const { return out_; }

private:
  void before_value();
  void close(char c);

  std::string out_;
  std::vector<bool> first_;
  bool after_key_{false};
};

std::string json_escape(std::string_view s);

std::string to_json(const RawResult &r);
std::string to_json(const StatusResult &r);
std::string to_json(const CommitResult &r);
std::string to_json(const StagedResult &r);
std::string to_json(const BranchList &r);
std::string to_json(const CheckoutResult &r);
std::string to_json(const ConflictReport &r);
std::string to_json(const AbortedReport &r);
std::string to_json(const ConflictDetails &r);
std::string to_json(const CommitList &r);
std::string to_json(const LineList &r);
std::string to_json(const DiffResult &r);
std::string to_json(const NameList &r);
std::string to_json(const RemoteList &r);
std::string to_json(const StashList &r);

template <typename... Ts> std::string to_json(const std::variant<Ts...> &v) {
  return std::visit([](const auto &r) { return to_json(r); }, v);
}

} // namespace vcsflow
