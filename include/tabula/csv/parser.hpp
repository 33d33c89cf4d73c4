#pragma once

#include <tabula/core/error.hpp>
#include <tabula/core/table.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tabula::csv {

/// Loads a delimited text file into memory and answers queries against it.
///
/// Rows and columns are addressed by 1-based numbers.  Zero and negative
/// numbers are never an error of their own: they are simply not found.
///
/// Usage:
///   tabula::csv::CsvParser parser;
///   if (auto loaded = parser.load_file("data/prices.csv"); !loaded) {
///       fmt::print("{}\n", loaded.error().format());
///   }
///   auto cell = parser.get_cell(2, 3);
class CsvParser {
   public:
    /// Extension (uppercased, without the dot) a loadable path must carry.
    static constexpr std::string_view kFileExtension = "CSV";

    CsvParser() = default;

    /// Construct and load `path` immediately.
    /// Throws LoadException when the load fails.
    explicit CsvParser(std::string_view path);

    /// Non-throwing counterpart of the loading constructor.
    [[nodiscard]] static auto from_file(std::string_view path,
                                        std::optional<char> delimiter = std::nullopt)
        -> Result<CsvParser>;

    /// Use `delimiter` for every later load instead of auto-detection.
    void set_delimiter(char delimiter) noexcept { delimiter_ = delimiter; }

    /// Go back to auto-detection for later loads.
    void clear_delimiter() noexcept { delimiter_.reset(); }

    /// The configured delimiter, if any.
    [[nodiscard]] auto delimiter() const noexcept -> std::optional<char> { return delimiter_; }

    /// The delimiter the last successful load split on.
    [[nodiscard]] auto detected_delimiter() const noexcept -> std::optional<char> {
        return detected_delimiter_;
    }

    /// Load a CSV file, replacing the current table.
    ///
    /// Fails with ExtensionMismatch when the path does not end in `.csv`
    /// (any case), FileNotFound when it names no regular file, and ReadError
    /// when the file cannot be opened or read.  On failure the current table
    /// is left as it was.
    [[nodiscard]] auto load_file(std::string_view path) -> Result<void>;

    [[nodiscard]] auto get_field() const -> Result<Table>;
    [[nodiscard]] auto get_row(std::int64_t row_num) const -> Result<Row>;

    /// Cells at `col_num` of every row long enough to have one.
    [[nodiscard]] auto get_column(std::int64_t col_num) const -> Result<Column>;

    [[nodiscard]] auto get_cell(std::int64_t row_num, std::int64_t col_num) const
        -> Result<Cell>;

    /// True once a load has completed, even one that read no rows.
    [[nodiscard]] auto is_field_exists() const noexcept -> bool { return table_.has_value(); }

    [[nodiscard]] auto is_row_exists(std::int64_t row_num) const noexcept -> bool;

    /// True when any row reaches `col_num`.  On a ragged table this holds
    /// even if most rows are shorter.
    [[nodiscard]] auto is_column_exists(std::int64_t col_num) const noexcept -> bool;

    /// True when row `row_num` exists and itself reaches `col_num`.
    [[nodiscard]] auto is_cell_exists(std::int64_t row_num, std::int64_t col_num) const noexcept
        -> bool;

    /// Number of rows loaded (0 before any load).
    [[nodiscard]] auto row_count() const noexcept -> std::size_t;

    /// Length of the widest row (0 before any load).
    [[nodiscard]] auto column_count() const noexcept -> std::size_t;

   private:
    std::optional<Table> table_;
    std::optional<char> delimiter_;
    std::optional<char> detected_delimiter_;
};

}  // namespace tabula::csv
