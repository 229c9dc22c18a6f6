#pragma once

#include <warden/schema/error_code.hpp>

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace warden::schema {

/// Result envelope returned by every component operation.
///
/// `value` may be set alongside a failure code when the caller needs a
/// reference to what was recorded (for example the id of a rejected job).
template <typename T>
struct outcome final {
  error_code_t code{error_code_t::ok};
  std::string log;
  std::optional<T> value;

  bool ok() const { return code == error_code_t::ok; }
};

using status_t = outcome<std::monostate>;

template <typename T>
outcome<T> make_ok(T value) {
  return outcome<T>{.code = error_code_t::ok,
                    .log = {},
                    .value = std::move(value)};
}

inline status_t make_ok() {
  return status_t{.code = error_code_t::ok, .log = {}, .value = std::monostate{}};
}

template <typename T>
outcome<T> make_error(const error_code_t code, std::string log) {
  return outcome<T>{.code = code, .log = std::move(log), .value = std::nullopt};
}

}  // namespace warden::schema
