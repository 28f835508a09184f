#pragma once

#include <shroud/runtime/table.hpp>

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

namespace shroud::io {

/// RFC 4180 reader (quoted fields, embedded separators and quotes).
///
/// The first row is the header. Each column becomes int64 when every
/// non-empty field is an integer, double when every one is numeric, and
/// string otherwise. Empty fields are nulls.
[[nodiscard]] auto read_csv(std::string_view path, char separator = ',')
    -> std::expected<runtime::Table, std::string>;

/// Write `table` with a header row; nulls become empty fields. Returns the
/// number of data rows written.
[[nodiscard]] auto write_csv(const runtime::Table& table, std::string_view path,
                             char separator = ',') -> std::expected<std::size_t, std::string>;

}  // namespace shroud::io
