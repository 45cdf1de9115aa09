#pragma once
#include <stdexcept>
#include <string>

namespace vcsflow {

struct Error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// binary missing, cwd missing, fork/pipe failure
struct SpawnError : Error {
  using Error::Error;
};

struct CancelledError : Error {
  CancelledError() : Error("operation cancelled") {}
};

struct TimeoutError : Error {
  using Error::Error;
};

struct ValidationError : Error {
  using Error::Error;
};

} // namespace vcsflow
