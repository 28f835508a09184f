#pragma once

#include <shroud/core/column.hpp>
#include <shroud/core/time.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace shroud::runtime {

enum class ScalarKind : std::uint8_t {
    Int,
    Double,
    String,
    Date,
};

using ColumnValue =
    std::variant<Column<std::int64_t>, Column<double>, Column<std::string>, Column<Date>>;
using ScalarValue = std::variant<std::int64_t, double, std::string, Date>;

struct ColumnEntry {
    std::string name;
    std::shared_ptr<ColumnValue> column;
    // Validity bitmap: true = valid (not null), false = null.
    // nullopt means every row is valid.
    std::optional<std::vector<bool>> validity;
};

/// Returns true if row `row` of `entry` is null.
[[nodiscard]] inline auto is_null(const ColumnEntry& entry, std::size_t row) -> bool {
    return entry.validity.has_value() && !(*entry.validity)[row];
}

/// One sheet: an ordered set of equally long, named columns.
///
/// Columns are held through shared pointers, so copying a Table is cheap
/// and add_column() reseats the pointer instead of writing through it.
/// A copy can therefore be edited without touching the table it came from.
struct Table {
    std::vector<ColumnEntry> columns;
    std::unordered_map<std::string, std::size_t> index;

    void add_column(std::string name, ColumnValue column);
    /// Add a column with an explicit validity bitmap (true = valid, false = null).
    void add_column(std::string name, ColumnValue column, std::vector<bool> validity);
    /// Insert or replace a whole entry, keeping the position of a replaced column.
    void put_entry(ColumnEntry entry);
    /// Drop a column; returns false when no such column exists.
    auto remove_column(const std::string& name) -> bool;
    [[nodiscard]] auto find(const std::string& name) -> ColumnValue*;
    [[nodiscard]] auto find(const std::string& name) const -> const ColumnValue*;
    [[nodiscard]] auto find_entry(const std::string& name) const -> const ColumnEntry*;
    [[nodiscard]] auto column_names() const -> std::vector<std::string>;
    [[nodiscard]] auto rows() const noexcept -> std::size_t;
};

struct Sheet {
    std::string name;
    Table table;
};

/// Ordered collection of named sheets. Insertion order is preserved.
class Dataset {
   public:
    Dataset() = default;

    /// Append a sheet, or replace the table of an existing sheet in place.
    void add_sheet(std::string name, Table table);

    [[nodiscard]] auto find(std::string_view name) const -> const Table*;
    [[nodiscard]] auto sheet_names() const -> std::vector<std::string>;
    [[nodiscard]] auto sheets() const noexcept -> const std::vector<Sheet>& { return sheets_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return sheets_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return sheets_.empty(); }

    [[nodiscard]] auto begin() const noexcept { return sheets_.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return sheets_.cend(); }

   private:
    std::vector<Sheet> sheets_;
};

[[nodiscard]] auto column_size(const ColumnValue& column) -> std::size_t;

[[nodiscard]] auto column_kind(const ColumnValue& column) -> ScalarKind;

[[nodiscard]] auto scalar_kind(const ScalarValue& value) -> ScalarKind;

/// Value at `row` of `column` (the null bitmap is not consulted).
[[nodiscard]] auto scalar_at(const ColumnValue& column, std::size_t row) -> ScalarValue;

/// Canonical text form of a cell value.
///
/// This is the coercion every method falls back to for input it does not
/// understand, and the text that hash-derived methods digest. Integral
/// doubles keep a trailing `.0` so they stay distinguishable from integers.
[[nodiscard]] auto format_scalar(const ScalarValue& value) -> std::string;

/// Build a column from per-row results.
///
/// Homogeneous results keep their type, a mix of integers and doubles widens
/// to double, and any other mix becomes a string column of format_scalar().
/// Rows flagged null in `validity` are ignored when choosing the type.
[[nodiscard]] auto column_from_scalars(const std::vector<ScalarValue>& values,
                                       const std::optional<std::vector<bool>>& validity)
    -> ColumnValue;

}  // namespace shroud::runtime
