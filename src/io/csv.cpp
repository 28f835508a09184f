#include <shroud/io/csv.hpp>

#include <rapidcsv.h>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <vector>

namespace shroud::io {

namespace {

auto csv_try_int(const std::string& text, std::int64_t& out) -> bool {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, out);
    return result.ec == std::errc() && result.ptr == end;
}

auto csv_try_double(const std::string& text, double& out) -> bool {
    char* end_ptr = nullptr;
    out = std::strtod(text.c_str(), &end_ptr);
    return end_ptr != text.c_str() && *end_ptr == '\0';
}

auto build_column(std::vector<std::string> vals)
    -> std::pair<runtime::ColumnValue, std::vector<bool>> {
    std::vector<bool> validity(vals.size(), true);
    bool any_valid = false;
    bool all_int = true;
    bool all_double = true;
    for (std::size_t i = 0; i < vals.size(); ++i) {
        if (vals[i].empty()) {
            validity[i] = false;
            continue;
        }
        any_valid = true;
        std::int64_t iv{};
        double dv{};
        if (all_int && !csv_try_int(vals[i], iv)) {
            all_int = false;
        }
        if (!all_int && all_double && !csv_try_double(vals[i], dv)) {
            all_double = false;
        }
    }

    if (any_valid && all_int) {
        Column<std::int64_t> col;
        col.reserve(vals.size());
        for (std::size_t i = 0; i < vals.size(); ++i) {
            std::int64_t iv{};
            if (validity[i]) {
                csv_try_int(vals[i], iv);
            }
            col.push_back(iv);
        }
        return {std::move(col), std::move(validity)};
    }
    if (any_valid && all_double) {
        Column<double> col;
        col.reserve(vals.size());
        for (std::size_t i = 0; i < vals.size(); ++i) {
            double dv{};
            if (validity[i]) {
                csv_try_double(vals[i], dv);
            }
            col.push_back(dv);
        }
        return {std::move(col), std::move(validity)};
    }
    return {Column<std::string>(std::move(vals)), std::move(validity)};
}

}  // namespace

auto read_csv(std::string_view path, char separator)
    -> std::expected<runtime::Table, std::string> {
    const std::string file{path};
    if (!std::filesystem::exists(file)) {
        return std::unexpected("failed to open csv: " + file);
    }
    try {
        rapidcsv::Document doc(file,
                               rapidcsv::LabelParams(0, -1),  // row 0 = header, no row-index column
                               rapidcsv::SeparatorParams(separator));

        runtime::Table table;
        for (const auto& name : doc.GetColumnNames()) {
            auto [column, validity] = build_column(doc.GetColumn<std::string>(name));
            const bool has_nulls = std::find(validity.begin(), validity.end(), false) !=
                                   validity.end();
            if (has_nulls) {
                table.add_column(name, std::move(column), std::move(validity));
            } else {
                table.add_column(name, std::move(column));
            }
        }
        if (table.columns.empty()) {
            return std::unexpected("csv has no headers: " + file);
        }
        return table;
    } catch (const std::exception& e) {
        return std::unexpected("failed to read csv " + file + ": " + e.what());
    }
}

auto write_csv(const runtime::Table& table, std::string_view path, char separator)
    -> std::expected<std::size_t, std::string> {
    const std::string file{path};
    try {
        rapidcsv::Document doc("", rapidcsv::LabelParams(0, -1),
                               rapidcsv::SeparatorParams(separator));
        const std::size_t rows = table.rows();
        for (std::size_t c = 0; c < table.columns.size(); ++c) {
            doc.SetColumnName(c, table.columns[c].name);
        }
        for (std::size_t c = 0; c < table.columns.size(); ++c) {
            const auto& entry = table.columns[c];
            std::vector<std::string> cells;
            cells.reserve(rows);
            for (std::size_t row = 0; row < rows; ++row) {
                if (runtime::is_null(entry, row)) {
                    cells.emplace_back();
                } else {
                    cells.push_back(runtime::format_scalar(runtime::scalar_at(*entry.column, row)));
                }
            }
            doc.SetColumn<std::string>(c, cells);
        }
        doc.Save(file);
        return rows;
    } catch (const std::exception& e) {
        return std::unexpected("failed to write csv " + file + ": " + e.what());
    }
}

}  // namespace shroud::io
