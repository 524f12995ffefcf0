#pragma once

#include <string>
#include <utility>

namespace sk1p::engine {

// engine error codes for structured results
enum class error_code {
  ok,
  invalid_argument,
  invalid_pattern,
  pattern_too_large,
  not_found,
  multiple_matches,
  io_error,
  internal_error
};

// status holds an error code and a human-readable message
struct status {
  error_code code = error_code::ok;
  std::string message;

  bool ok() const noexcept { return code == error_code::ok; }
};

inline status ok_status() { return {}; }

inline status make_status(error_code code, std::string message) { return status{code, std::move(message)}; }

// result carries a value and a status; value is default-initialized on errors
template <typename T> struct result {
  T value{};
  status status_info{};

  bool ok() const noexcept { return status_info.ok(); }
};

template <typename T> inline result<T> ok_result(T value) { return result<T>{std::move(value), ok_status()}; }

template <typename T> inline result<T> error_result(error_code code, std::string message) {
  return result<T>{T{}, make_status(code, std::move(message))};
}

inline const char* error_code_name(error_code code) noexcept {
  switch (code) {
  case error_code::ok:
    return "ok";
  case error_code::invalid_argument:
    return "invalid_argument";
  case error_code::invalid_pattern:
    return "invalid_pattern";
  case error_code::pattern_too_large:
    return "pattern_too_large";
  case error_code::not_found:
    return "not_found";
  case error_code::multiple_matches:
    return "multiple_matches";
  case error_code::io_error:
    return "io_error";
  case error_code::internal_error:
    return "internal_error";
  }
  return "unknown";
}

} // namespace sk1p::engine
