#pragma once

#include <string>
#include <vector>

namespace tabula {

/// A raw, untyped cell value.
using Cell = std::string;

/// One record of the source file, in field order.
using Row = std::vector<Cell>;

/// The cells found at one position across rows.
using Column = std::vector<Cell>;

/// Rows in file order.  Rows are not required to share a length: a ragged
/// table is a legal state after a comma fallback or an explicit delimiter.
using Table = std::vector<Row>;

}  // namespace tabula
