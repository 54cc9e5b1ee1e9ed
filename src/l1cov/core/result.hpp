#pragma once

#include <string>
#include <utility>

namespace l1cov {

// error codes for structured results
enum class error_code {
  ok,
  invalid_argument,
  configuration_error,
  session_already_active,
  session_closed,
  session_not_started,
  unknown_file,
  unknown_formatter,
  io_error,
  internal_error
};

inline constexpr const char* error_code_name(error_code code) {
  switch (code) {
  case error_code::ok:
    return "ok";
  case error_code::invalid_argument:
    return "invalid_argument";
  case error_code::configuration_error:
    return "configuration_error";
  case error_code::session_already_active:
    return "session_already_active";
  case error_code::session_closed:
    return "session_closed";
  case error_code::session_not_started:
    return "session_not_started";
  case error_code::unknown_file:
    return "unknown_file";
  case error_code::unknown_formatter:
    return "unknown_formatter";
  case error_code::io_error:
    return "io_error";
  case error_code::internal_error:
  default:
    return "internal_error";
  }
}

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

template <typename T> inline result<T> error_result(status failure) { return result<T>{T{}, std::move(failure)}; }

} // namespace l1cov
