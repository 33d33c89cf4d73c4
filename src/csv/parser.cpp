#include <tabula/csv/parser.hpp>
#include <tabula/csv/reader.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <utility>

namespace tabula::csv {

namespace {

/// Text after the last '.' of the file name, uppercased.  Empty when there is none.
auto upper_extension(std::string_view path) -> std::string {
    const std::string name = std::filesystem::path(path).filename().string();
    const auto dot = name.rfind('.');
    if (dot == std::string::npos) {
        return {};
    }
    std::string ext = name.substr(dot + 1);
    std::ranges::transform(ext, ext.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return ext;
}

/// Zero-based index for a 1-based row or column number.
auto to_index(std::int64_t number) noexcept -> std::optional<std::size_t> {
    if (number < 1) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(number - 1);
}

auto read_error(std::string_view path, std::string_view reason) -> Error {
    spdlog::debug("cannot read {}: {}", path, reason);
    return Error{
        .kind = ErrorKind::ReadError,
        .message = fmt::format("Error reading the file in {}", path),
    };
}

auto read_file(const std::filesystem::path& file, std::string_view path) -> Result<std::string> {
    std::ifstream input(file, std::ios::binary);
    if (!input) {
        return std::unexpected(read_error(path, "cannot open"));
    }
    std::string text(std::istreambuf_iterator<char>{input}, {});
    if (input.bad()) {
        return std::unexpected(read_error(path, "I/O error"));
    }
    return text;
}

}  // namespace

CsvParser::CsvParser(std::string_view path) {
    if (auto loaded = load_file(path); !loaded) {
        throw LoadException(std::move(loaded.error()));
    }
}

auto CsvParser::from_file(std::string_view path, std::optional<char> delimiter)
    -> Result<CsvParser> {
    CsvParser parser;
    parser.delimiter_ = delimiter;
    if (auto loaded = parser.load_file(path); !loaded) {
        return std::unexpected(std::move(loaded.error()));
    }
    return parser;
}

auto CsvParser::load_file(std::string_view path) -> Result<void> {
    const std::string found = upper_extension(path);
    if (found != kFileExtension) {
        return std::unexpected(Error{
            .kind = ErrorKind::ExtensionMismatch,
            .message = fmt::format("File extension {} doesn't match with {}", found,
                                   kFileExtension),
        });
    }

    const std::filesystem::path file{path};
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
        return std::unexpected(Error{
            .kind = ErrorKind::FileNotFound,
            .message = fmt::format("File {} doesn't exist", path),
        });
    }

    auto text = read_file(file, path);
    if (!text) {
        return std::unexpected(std::move(text.error()));
    }
    spdlog::debug("read {} bytes from {}", text->size(), path);

    DetectedTable parsed;
    try {
        if (delimiter_.has_value()) {
            parsed = DetectedTable{.rows = read_rows(std::move(*text), *delimiter_),
                                   .delimiter = *delimiter_};
        } else {
            parsed = read_rows_detect(std::move(*text));
        }
    } catch (const std::exception& e) {
        return std::unexpected(read_error(path, e.what()));
    }

    spdlog::debug("loaded {} rows from {} split on '{}'", parsed.rows.size(), path,
                  parsed.delimiter);
    table_ = std::move(parsed.rows);
    detected_delimiter_ = parsed.delimiter;
    return {};
}

auto CsvParser::get_field() const -> Result<Table> {
    if (!is_field_exists()) {
        return std::unexpected(Error{
            .kind = ErrorKind::FieldNotFound,
            .message = "Field is not set",
        });
    }
    return *table_;
}

auto CsvParser::get_row(std::int64_t row_num) const -> Result<Row> {
    if (!is_row_exists(row_num)) {
        return std::unexpected(Error{
            .kind = ErrorKind::RowNotFound,
            .message = fmt::format("Row {} doesn't exist", row_num),
        });
    }
    return (*table_)[*to_index(row_num)];
}

auto CsvParser::get_column(std::int64_t col_num) const -> Result<Column> {
    if (!is_column_exists(col_num)) {
        return std::unexpected(Error{
            .kind = ErrorKind::ColumnNotFound,
            .message = fmt::format("Column {} doesn't exist", col_num),
        });
    }
    const std::size_t col = *to_index(col_num);
    Column cells;
    cells.reserve(table_->size());
    for (const auto& row : *table_) {
        // Short rows of a ragged table have nothing at this position.
        if (col < row.size()) {
            cells.push_back(row[col]);
        }
    }
    if (cells.size() != table_->size()) {
        spdlog::debug("column {}: skipped {} rows shorter than {} fields", col_num,
                      table_->size() - cells.size(), col_num);
    }
    return cells;
}

auto CsvParser::get_cell(std::int64_t row_num, std::int64_t col_num) const -> Result<Cell> {
    if (!is_cell_exists(row_num, col_num)) {
        return std::unexpected(Error{
            .kind = ErrorKind::CellNotFound,
            .message = fmt::format("Cell {},{} doesn't exist", row_num, col_num),
        });
    }
    return (*table_)[*to_index(row_num)][*to_index(col_num)];
}

auto CsvParser::is_row_exists(std::int64_t row_num) const noexcept -> bool {
    const auto row = to_index(row_num);
    return table_.has_value() && row.has_value() && *row < table_->size();
}

auto CsvParser::is_column_exists(std::int64_t col_num) const noexcept -> bool {
    const auto col = to_index(col_num);
    if (!table_.has_value() || !col.has_value()) {
        return false;
    }
    return std::ranges::any_of(*table_, [&](const Row& row) { return *col < row.size(); });
}

auto CsvParser::is_cell_exists(std::int64_t row_num, std::int64_t col_num) const noexcept
    -> bool {
    if (!is_row_exists(row_num)) {
        return false;
    }
    const auto col = to_index(col_num);
    return col.has_value() && *col < (*table_)[*to_index(row_num)].size();
}

auto CsvParser::row_count() const noexcept -> std::size_t {
    return table_.has_value() ? table_->size() : 0;
}

auto CsvParser::column_count() const noexcept -> std::size_t {
    if (!table_.has_value()) {
        return 0;
    }
    std::size_t widest = 0;
    for (const auto& row : *table_) {
        widest = std::max(widest, row.size());
    }
    return widest;
}

}  // namespace tabula::csv
