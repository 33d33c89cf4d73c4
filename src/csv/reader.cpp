#include <tabula/csv/reader.hpp>

#include <rapidcsv.h>
#include <spdlog/spdlog.h>

#include <sstream>
#include <string>
#include <utility>

namespace tabula::csv {

auto read_rows(std::string text, char delimiter) -> Table {
    std::istringstream stream{std::move(text)};
    rapidcsv::Document doc(stream,
                           rapidcsv::LabelParams(-1, -1),  // no header row, no row-name column
                           rapidcsv::SeparatorParams(delimiter, /*pTrim=*/false,
                                                     rapidcsv::sPlatformHasCR,
                                                     /*pQuotedLinebreaks=*/true));

    Table rows;
    const std::size_t count = doc.GetRowCount();
    rows.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        rows.push_back(doc.GetRow<std::string>(i));
    }
    return rows;
}

auto first_width_mismatch(const Table& rows) -> std::optional<std::size_t> {
    if (rows.empty()) {
        return std::nullopt;
    }
    const std::size_t width = rows.front().size();
    for (std::size_t i = 1; i < rows.size(); ++i) {
        if (rows[i].size() != width) {
            return i;
        }
    }
    return std::nullopt;
}

auto read_rows_detect(std::string text) -> DetectedTable {
    auto rows = read_rows(text, kPrimaryDelimiter);
    if (!rows.empty()) {
        const auto mismatch = first_width_mismatch(rows);
        if (!mismatch.has_value()) {
            return DetectedTable{.rows = std::move(rows), .delimiter = kPrimaryDelimiter};
        }
        spdlog::debug("record {} has {} fields on '{}' but record 1 has {}; retrying with '{}'",
                      *mismatch + 1, rows[*mismatch].size(), kPrimaryDelimiter,
                      rows.front().size(), kFallbackDelimiter);
    } else {
        spdlog::debug("no records on '{}'; retrying with '{}'", kPrimaryDelimiter,
                      kFallbackDelimiter);
    }
    return DetectedTable{.rows = read_rows(std::move(text), kFallbackDelimiter),
                         .delimiter = kFallbackDelimiter};
}

}  // namespace tabula::csv
