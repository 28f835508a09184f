#include <shroud/runtime/table.hpp>

#include <fmt/core.h>

#include <cmath>
#include <stdexcept>
#include <type_traits>

namespace shroud::runtime {

namespace {

void rebuild_index(Table& table) {
    table.index.clear();
    for (std::size_t i = 0; i < table.columns.size(); ++i) {
        table.index[table.columns[i].name] = i;
    }
}

}  // namespace

void Table::add_column(std::string name, ColumnValue column) {
    put_entry(ColumnEntry{.name = std::move(name),
                          .column = std::make_shared<ColumnValue>(std::move(column)),
                          .validity = std::nullopt});
}

void Table::add_column(std::string name, ColumnValue column, std::vector<bool> validity) {
    if (validity.size() != column_size(column)) {
        throw std::invalid_argument("validity bitmap length does not match column length: " +
                                    name);
    }
    put_entry(ColumnEntry{.name = std::move(name),
                          .column = std::make_shared<ColumnValue>(std::move(column)),
                          .validity = std::move(validity)});
}

void Table::put_entry(ColumnEntry entry) {
    if (auto it = index.find(entry.name); it != index.end()) {
        // Reseat the shared_ptr rather than mutating shared data (copy-on-write).
        columns[it->second] = std::move(entry);
        return;
    }
    std::size_t pos = columns.size();
    columns.push_back(std::move(entry));
    index[columns.back().name] = pos;
}

auto Table::remove_column(const std::string& name) -> bool {
    auto it = index.find(name);
    if (it == index.end()) {
        return false;
    }
    columns.erase(columns.begin() + static_cast<std::ptrdiff_t>(it->second));
    rebuild_index(*this);
    return true;
}

auto Table::find(const std::string& name) -> ColumnValue* {
    if (auto it = index.find(name); it != index.end()) {
        return columns[it->second].column.get();
    }
    return nullptr;
}

auto Table::find(const std::string& name) const -> const ColumnValue* {
    if (auto it = index.find(name); it != index.end()) {
        return columns[it->second].column.get();
    }
    return nullptr;
}

auto Table::find_entry(const std::string& name) const -> const ColumnEntry* {
    if (auto it = index.find(name); it != index.end()) {
        return &columns[it->second];
    }
    return nullptr;
}

auto Table::column_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& entry : columns) {
        names.push_back(entry.name);
    }
    return names;
}

auto Table::rows() const noexcept -> std::size_t {
    if (columns.empty()) {
        return 0;
    }
    return column_size(*columns.front().column);
}

void Dataset::add_sheet(std::string name, Table table) {
    for (auto& sheet : sheets_) {
        if (sheet.name == name) {
            sheet.table = std::move(table);
            return;
        }
    }
    sheets_.push_back(Sheet{.name = std::move(name), .table = std::move(table)});
}

auto Dataset::find(std::string_view name) const -> const Table* {
    for (const auto& sheet : sheets_) {
        if (sheet.name == name) {
            return &sheet.table;
        }
    }
    return nullptr;
}

auto Dataset::sheet_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(sheets_.size());
    for (const auto& sheet : sheets_) {
        names.push_back(sheet.name);
    }
    return names;
}

auto column_size(const ColumnValue& column) -> std::size_t {
    return std::visit([](const auto& col) { return col.size(); }, column);
}

auto column_kind(const ColumnValue& column) -> ScalarKind {
    return std::visit(
        [](const auto& col) -> ScalarKind {
            using T = typename std::decay_t<decltype(col)>::value_type;
            if constexpr (std::is_same_v<T, std::int64_t>) {
                return ScalarKind::Int;
            } else if constexpr (std::is_same_v<T, double>) {
                return ScalarKind::Double;
            } else if constexpr (std::is_same_v<T, std::string>) {
                return ScalarKind::String;
            } else {
                return ScalarKind::Date;
            }
        },
        column);
}

auto scalar_kind(const ScalarValue& value) -> ScalarKind {
    return static_cast<ScalarKind>(value.index());
}

auto scalar_at(const ColumnValue& column, std::size_t row) -> ScalarValue {
    return std::visit([row](const auto& col) -> ScalarValue { return col[row]; }, column);
}

auto format_scalar(const ScalarValue& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return fmt::format("{}", v);
            } else if constexpr (std::is_same_v<T, double>) {
                if (std::isfinite(v) && v == std::trunc(v) && std::fabs(v) < 1e16) {
                    return fmt::format("{:.1f}", v);
                }
                return fmt::format("{}", v);
            } else {
                return format_date(v);
            }
        },
        value);
}

auto column_from_scalars(const std::vector<ScalarValue>& values,
                         const std::optional<std::vector<bool>>& validity) -> ColumnValue {
    auto valid = [&](std::size_t row) {
        return !validity.has_value() || (*validity)[row];
    };

    bool seen = false;
    bool mixed = false;
    bool numeric_only = true;
    ScalarKind kind = ScalarKind::String;
    for (std::size_t row = 0; row < values.size(); ++row) {
        if (!valid(row)) {
            continue;
        }
        auto k = scalar_kind(values[row]);
        if (k != ScalarKind::Int && k != ScalarKind::Double) {
            numeric_only = false;
        }
        if (!seen) {
            kind = k;
            seen = true;
        } else if (k != kind) {
            mixed = true;
        }
    }
    if (mixed) {
        kind = numeric_only ? ScalarKind::Double : ScalarKind::String;
    }

    switch (kind) {
        case ScalarKind::Int: {
            Column<std::int64_t> col;
            col.reserve(values.size());
            for (std::size_t row = 0; row < values.size(); ++row) {
                col.push_back(valid(row) ? std::get<std::int64_t>(values[row]) : 0);
            }
            return col;
        }
        case ScalarKind::Double: {
            Column<double> col;
            col.reserve(values.size());
            for (std::size_t row = 0; row < values.size(); ++row) {
                if (!valid(row)) {
                    col.push_back(0.0);
                } else if (const auto* i = std::get_if<std::int64_t>(&values[row])) {
                    col.push_back(static_cast<double>(*i));
                } else {
                    col.push_back(std::get<double>(values[row]));
                }
            }
            return col;
        }
        case ScalarKind::Date: {
            Column<Date> col;
            col.reserve(values.size());
            for (std::size_t row = 0; row < values.size(); ++row) {
                col.push_back(valid(row) ? std::get<Date>(values[row]) : Date{});
            }
            return col;
        }
        case ScalarKind::String:
            break;
    }
    Column<std::string> col;
    col.reserve(values.size());
    for (std::size_t row = 0; row < values.size(); ++row) {
        col.push_back(valid(row) ? format_scalar(values[row]) : std::string{});
    }
    return col;
}

}  // namespace shroud::runtime
