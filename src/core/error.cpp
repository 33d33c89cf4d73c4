#include <tabula/core/error.hpp>

#include <fmt/core.h>

#include <utility>

namespace tabula {

auto to_string(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::FileNotFound:
            return "FileNotFound";
        case ErrorKind::ExtensionMismatch:
            return "ExtensionMismatch";
        case ErrorKind::ReadError:
            return "ReadError";
        case ErrorKind::FieldNotFound:
            return "FieldNotFound";
        case ErrorKind::RowNotFound:
            return "RowNotFound";
        case ErrorKind::ColumnNotFound:
            return "ColumnNotFound";
        case ErrorKind::CellNotFound:
            return "CellNotFound";
    }
    return "Unknown";
}

auto Error::format() const -> std::string {
    return fmt::format("{}: {}", to_string(kind), message);
}

LoadException::LoadException(Error error)
    : std::runtime_error(error.format()), error_(std::move(error)) {}

}  // namespace tabula
