#pragma once

#include <expected>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace agency {

// Zero is reserved so a default-constructed std::error_code never compares
// equal to one of these.
enum class Error : int {
  FileNotFound = 1,
  FileOpenFailed,
  IoError,
  ParseError,
  InvalidArgument,
  ValidationError,
  CircularDependency,
  SecurityViolation,
  CacheMiss,
  DatabaseError,
  DatabaseOpenFailed,
  DatabaseQueryFailed,
};

class ErrorCategory : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "agency";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    switch (static_cast<Error>(ev)) {
      case Error::FileNotFound: return "file not found";
      case Error::FileOpenFailed: return "failed to open file";
      case Error::IoError: return "i/o error";
      case Error::ParseError: return "parse error";
      case Error::InvalidArgument: return "invalid argument";
      case Error::ValidationError: return "validation error";
      case Error::CircularDependency: return "circular dependency";
      case Error::SecurityViolation: return "security violation";
      case Error::CacheMiss: return "cache miss";
      case Error::DatabaseError: return "database error";
      case Error::DatabaseOpenFailed: return "failed to open database";
      case Error::DatabaseQueryFailed: return "database query failed";
    }
    return "unknown error";
  }
};

inline auto error_category() -> const ErrorCategory& {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
using Result = std::expected<T, std::error_code>;

template <typename T>
[[nodiscard]] constexpr auto ok(T&& value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> {
  return {};
}

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

}  // namespace agency

template <>
struct std::is_error_code_enum<agency::Error> : std::true_type {};
