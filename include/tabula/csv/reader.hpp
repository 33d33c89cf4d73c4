#pragma once

#include <tabula/core/table.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace tabula::csv {

/// Delimiter tried first during auto-detection.
inline constexpr char kPrimaryDelimiter = ';';
/// Delimiter used when the primary attempt is abandoned.
inline constexpr char kFallbackDelimiter = ',';

/// Rows produced by auto-detection, with the delimiter that produced them.
struct DetectedTable {
    Table rows;
    char delimiter = kFallbackDelimiter;
};

/// Split a buffer into records on `delimiter`.
///
/// RFC 4180 quoting applies: a field may be wrapped in double quotes, `""`
/// inside a quoted field is a literal quote, and line breaks inside a quoted
/// field belong to the field.  Fields are not trimmed.  Every record is kept
/// whatever its field count.  `text` is consumed by the reader.
[[nodiscard]] auto read_rows(std::string text, char delimiter) -> Table;

/// Index of the first row whose length differs from the first row's, or
/// nullopt when all rows share one length.
[[nodiscard]] auto first_width_mismatch(const Table& rows) -> std::optional<std::size_t>;

/// Split a buffer with an unknown delimiter.
///
/// Tries `;` first and keeps the result when every record has the first
/// record's field count.  A mismatch, or a buffer that yields no records at
/// all, discards the attempt and re-reads the whole buffer on `,`, keeping
/// every record unconditionally.  Only the `;` attempt copies `text`.
[[nodiscard]] auto read_rows_detect(std::string text) -> DetectedTable;

}  // namespace tabula::csv
