#pragma once

/**
 * @file result.hpp
 * @brief Value-or-error return type used by all fallible operations
 *
 * Codec failures are reported through Result rather than exceptions. An error
 * carries a human readable message and an ErrorCode so callers (and tests)
 * can tell failure kinds apart without parsing text.
 */

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace RetroPak {

/**
 * @brief Failure categories reported by the codec
 */
enum class ErrorCode {
  Unknown = 0,
  MalformedHeader,     // Not enough bytes for a fixed header or record
  TruncatedPayload,    // Declared offset/size range exceeds the buffer
  MissingTerminator,   // Name or string sentinel not found
  UnknownIdentifier,   // Asset ID, language tag or name not present
  IndexOutOfRange,     // Edit or accessor index outside the sequence
  DuplicateIdentifier, // Asset ID already present
  InvalidFourCC,       // Tag is not exactly four characters
  StringCountMismatch, // String table count differs from the STRG header
  AssetTypeMismatch,   // Typed lookup found another payload type
  InvalidConfig        // Configuration value cannot be applied
};

[[nodiscard]] inline const char* errorCodeToString(ErrorCode code) {
  switch (code) {
  case ErrorCode::Unknown:
    return "Unknown";
  case ErrorCode::MalformedHeader:
    return "MalformedHeader";
  case ErrorCode::TruncatedPayload:
    return "TruncatedPayload";
  case ErrorCode::MissingTerminator:
    return "MissingTerminator";
  case ErrorCode::UnknownIdentifier:
    return "UnknownIdentifier";
  case ErrorCode::IndexOutOfRange:
    return "IndexOutOfRange";
  case ErrorCode::DuplicateIdentifier:
    return "DuplicateIdentifier";
  case ErrorCode::InvalidFourCC:
    return "InvalidFourCC";
  case ErrorCode::StringCountMismatch:
    return "StringCountMismatch";
  case ErrorCode::AssetTypeMismatch:
    return "AssetTypeMismatch";
  case ErrorCode::InvalidConfig:
    return "InvalidConfig";
  }
  return "Unknown";
}

struct Error {
  ErrorCode code = ErrorCode::Unknown;
  std::string message;
};

template <typename T> class Result {
public:
  static Result ok(T value) { return Result(std::move(value)); }

  static Result error(std::string message) {
    return Result(Error{ErrorCode::Unknown, std::move(message)});
  }

  static Result error(ErrorCode code, std::string message) {
    return Result(Error{code, std::move(message)});
  }

  static Result error(Error err) { return Result(std::move(err)); }

  [[nodiscard]] bool isOk() const { return std::holds_alternative<T>(m_data); }
  [[nodiscard]] bool isError() const { return !isOk(); }

  [[nodiscard]] T& value() & { return std::get<T>(m_data); }
  [[nodiscard]] const T& value() const& { return std::get<T>(m_data); }
  [[nodiscard]] T&& value() && { return std::get<T>(std::move(m_data)); }

  [[nodiscard]] T valueOr(T fallback) const& {
    return isOk() ? std::get<T>(m_data) : std::move(fallback);
  }

  [[nodiscard]] const std::string& error() const { return std::get<Error>(m_data).message; }
  [[nodiscard]] ErrorCode errorCode() const { return std::get<Error>(m_data).code; }
  [[nodiscard]] const Error& errorInfo() const { return std::get<Error>(m_data); }

private:
  explicit Result(T value) : m_data(std::move(value)) {}
  explicit Result(Error err) : m_data(std::move(err)) {}

  std::variant<T, Error> m_data;
};

template <> class Result<void> {
public:
  static Result ok() { return Result(); }

  static Result error(std::string message) {
    return Result(Error{ErrorCode::Unknown, std::move(message)});
  }

  static Result error(ErrorCode code, std::string message) {
    return Result(Error{code, std::move(message)});
  }

  static Result error(Error err) { return Result(std::move(err)); }

  [[nodiscard]] bool isOk() const { return !m_error.has_value(); }
  [[nodiscard]] bool isError() const { return m_error.has_value(); }

  [[nodiscard]] const std::string& error() const { return m_error->message; }
  [[nodiscard]] ErrorCode errorCode() const { return m_error->code; }
  [[nodiscard]] const Error& errorInfo() const { return *m_error; }

private:
  Result() = default;
  explicit Result(Error err) : m_error(std::move(err)) {}

  std::optional<Error> m_error;
};

} // namespace RetroPak
