#pragma once

/// Convenience umbrella header for the tabula library.

#include <tabula/core/error.hpp>
#include <tabula/core/table.hpp>
#include <tabula/csv/parser.hpp>
#include <tabula/csv/reader.hpp>
