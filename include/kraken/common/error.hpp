#pragma once

#include <kraken/schema/error_code.hpp>

#include <stdexcept>
#include <string>
#include <string_view>

namespace kraken::common {

/// Raised by every account-core operation that must abort the enclosing
/// transaction. The execution engine is the only place that catches it.
class abort_error final : public std::runtime_error {
 public:
  abort_error(const kraken::schema::error_code code, const std::string& message)
      : std::runtime_error{message}, code_{code} {}

  kraken::schema::error_code code() const noexcept { return code_; }

 private:
  kraken::schema::error_code code_;
};

[[noreturn]] inline void fail(const kraken::schema::error_code code,
                               const std::string_view message) {
  throw abort_error{code, std::string{message}};
}

inline void ensure(const bool condition,
                   const kraken::schema::error_code code,
                   const std::string_view message) {
  if (!condition) {
    fail(code, message);
  }
}

}  // namespace kraken::common
