#pragma once

#include <shroud/runtime/table.hpp>

#include <expected>
#include <string>
#include <string_view>

namespace shroud::io {

/// Multi-sheet JSON workbook:
///
///   {"sheets": [{"name": "Employees",
///                "columns": ["id", "name"],
///                "rows": [[1, "Alice"], [2, null]]}]}
///
/// Sheet order is kept. `null` cells are nulls; column types are inferred
/// from the cell values the same way transformed columns are.
[[nodiscard]] auto read_workbook(std::string_view path)
    -> std::expected<runtime::Dataset, std::string>;

[[nodiscard]] auto parse_workbook(std::string_view json)
    -> std::expected<runtime::Dataset, std::string>;

[[nodiscard]] auto write_workbook(const runtime::Dataset& dataset, std::string_view path)
    -> std::expected<void, std::string>;

[[nodiscard]] auto workbook_to_json(const runtime::Dataset& dataset) -> std::string;

}  // namespace shroud::io
