#pragma once

#include <cstdint>
#include <expected>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tabula {

enum class ErrorKind : std::uint8_t {
    FileNotFound,
    ExtensionMismatch,
    ReadError,
    FieldNotFound,
    RowNotFound,
    ColumnNotFound,
    CellNotFound,
};

/// Stable name of an error kind, e.g. "RowNotFound".
[[nodiscard]] auto to_string(ErrorKind kind) noexcept -> std::string_view;

/// Failure reported by a load or a query.
struct Error {
    ErrorKind kind = ErrorKind::ReadError;
    std::string message;

    /// "<kind>: <message>"
    [[nodiscard]] auto format() const -> std::string;
};

template <typename T>
using Result = std::expected<T, Error>;

/// Thrown by constructors that load a file, where no Result can be returned.
class LoadException : public std::runtime_error {
   public:
    explicit LoadException(Error error);

    [[nodiscard]] auto error() const noexcept -> const Error& { return error_; }
    [[nodiscard]] auto kind() const noexcept -> ErrorKind { return error_.kind; }

   private:
    Error error_;
};

}  // namespace tabula
