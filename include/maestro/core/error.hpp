#pragma once

#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace maestro {

enum class Error : int {
  Success,
  FileNotFound,
  ParseError,
  InvalidArgument,
  NotFound,
  AlreadyExists,
  InvalidPlan,
  CycleDetected,
  Cancelled,
};

[[nodiscard]] constexpr auto error_message(Error e) noexcept
    -> std::string_view {
  switch (e) {
    case Error::Success: return "success";
    case Error::FileNotFound: return "file not found";
    case Error::ParseError: return "parse error";
    case Error::InvalidArgument: return "invalid argument";
    case Error::NotFound: return "not found";
    case Error::AlreadyExists: return "already exists";
    case Error::InvalidPlan: return "plan has unknown or cyclic dependencies";
    case Error::CycleDetected: return "dependency cycle";
    case Error::Cancelled: return "cancelled";
  }
  return "unknown error";
}

class ErrorCategory : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "maestro";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    return std::string{error_message(static_cast<Error>(ev))};
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

// Transparent lookup for string-keyed maps.
struct StringHash {
  using is_transparent = void;

  [[nodiscard]] auto operator()(std::string_view sv) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(sv);
  }
};

using StringEqual = std::equal_to<>;

}  // namespace maestro

template <>
struct std::is_error_code_enum<maestro::Error> : std::true_type {};
