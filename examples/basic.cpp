#include <tabula/tabula.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <string_view>

auto main(int argc, char** argv) -> int {
    if (argc < 2) {
        fmt::print(stderr, "usage: {} <file.csv> [delimiter] [--verbose]\n", argv[0]);
        return 1;
    }

    tabula::csv::CsvParser parser;
    spdlog::set_level(spdlog::level::info);
    for (int i = 2; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        if (arg == "--verbose") {
            spdlog::set_level(spdlog::level::debug);
        } else if (arg.size() == 1) {
            parser.set_delimiter(arg.front());
        }
    }

    if (auto loaded = parser.load_file(argv[1]); !loaded) {
        fmt::print(stderr, "{}\n", loaded.error().format());
        return 1;
    }

    fmt::print("=== {} ===\n", argv[1]);
    fmt::print("rows: {}, widest row: {}, split on '{}'\n", parser.row_count(),
               parser.column_count(), parser.detected_delimiter().value_or(','));

    // First row, if any
    if (auto first = parser.get_row(1)) {
        fmt::print("row 1:");
        for (const auto& cell : *first) {
            fmt::print(" [{}]", cell);
        }
        fmt::print("\n");
    } else {
        fmt::print("{}\n", first.error().format());
    }

    if (auto column = parser.get_column(1)) {
        fmt::print("column 1 has {} cells\n", column->size());
    }

    auto cell = parser.get_cell(2, 2);
    if (cell) {
        fmt::print("cell 2,2: {}\n", *cell);
    } else {
        fmt::print("{}\n", cell.error().format());
    }

    return 0;
}
