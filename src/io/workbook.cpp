#include <shroud/io/workbook.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <optional>
#include <type_traits>
#include <variant>
#include <vector>

namespace shroud::io {

namespace {

using Json = nlohmann::ordered_json;

auto cell_to_scalar(const Json& cell) -> runtime::ScalarValue {
    if (cell.is_number_integer()) {
        return cell.get<std::int64_t>();
    }
    if (cell.is_number()) {
        return cell.get<double>();
    }
    if (cell.is_string()) {
        return cell.get<std::string>();
    }
    return cell.dump();
}

auto scalar_to_cell(const runtime::ScalarValue& value) -> Json {
    return std::visit(
        [](const auto& v) -> Json {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Date>) {
                return format_date(v);
            } else {
                return v;
            }
        },
        value);
}

auto parse_sheet(const Json& sheet, std::size_t position)
    -> std::expected<runtime::Sheet, std::string> {
    const auto where = "sheet #" + std::to_string(position);
    if (!sheet.is_object()) {
        return std::unexpected(where + ": expected an object");
    }
    auto name = sheet.find("name");
    auto columns = sheet.find("columns");
    if (name == sheet.end() || !name->is_string()) {
        return std::unexpected(where + ": missing string 'name'");
    }
    if (columns == sheet.end() || !columns->is_array()) {
        return std::unexpected(where + ": missing array 'columns'");
    }
    const std::size_t width = columns->size();

    std::vector<std::vector<runtime::ScalarValue>> cells(width);
    std::vector<std::vector<bool>> validity(width);
    if (auto rows = sheet.find("rows"); rows != sheet.end() && !rows->is_null()) {
        if (!rows->is_array()) {
            return std::unexpected(where + ": 'rows' must be an array");
        }
        for (const auto& row : *rows) {
            if (!row.is_array() || row.size() != width) {
                return std::unexpected(where + ": row has wrong number of cells");
            }
            for (std::size_t c = 0; c < width; ++c) {
                const bool valid = !row[c].is_null();
                validity[c].push_back(valid);
                cells[c].push_back(valid ? cell_to_scalar(row[c]) : runtime::ScalarValue{});
            }
        }
    }

    runtime::Sheet out{.name = name->get<std::string>(), .table = {}};
    for (std::size_t c = 0; c < width; ++c) {
        if (!(*columns)[c].is_string()) {
            return std::unexpected(where + ": column names must be strings");
        }
        auto column_name = (*columns)[c].get<std::string>();
        if (out.table.find_entry(column_name) != nullptr) {
            return std::unexpected(where + ": duplicate column '" + column_name + "'");
        }
        std::optional<std::vector<bool>> bitmap;
        if (std::find(validity[c].begin(), validity[c].end(), false) != validity[c].end()) {
            bitmap = validity[c];
        }
        auto column = runtime::column_from_scalars(cells[c], bitmap);
        if (bitmap) {
            out.table.add_column(std::move(column_name), std::move(column), std::move(*bitmap));
        } else {
            out.table.add_column(std::move(column_name), std::move(column));
        }
    }
    return out;
}

}  // namespace

auto parse_workbook(std::string_view json) -> std::expected<runtime::Dataset, std::string> {
    Json root;
    try {
        root = Json::parse(json);
    } catch (const Json::parse_error& e) {
        return std::unexpected(std::string("invalid workbook: ") + e.what());
    }
    auto sheets = root.find("sheets");
    if (!root.is_object() || sheets == root.end() || !sheets->is_array()) {
        return std::unexpected("invalid workbook: expected {\"sheets\": [...]}");
    }
    runtime::Dataset dataset;
    for (std::size_t i = 0; i < sheets->size(); ++i) {
        auto sheet = parse_sheet((*sheets)[i], i);
        if (!sheet) {
            return std::unexpected("invalid workbook: " + sheet.error());
        }
        if (dataset.find(sheet->name) != nullptr) {
            return std::unexpected("invalid workbook: duplicate sheet '" + sheet->name + "'");
        }
        dataset.add_sheet(std::move(sheet->name), std::move(sheet->table));
    }
    return dataset;
}

auto read_workbook(std::string_view path) -> std::expected<runtime::Dataset, std::string> {
    std::ifstream input{std::string(path)};
    if (!input) {
        return std::unexpected("failed to open workbook: " + std::string(path));
    }
    std::string text(std::istreambuf_iterator<char>{input}, {});
    return parse_workbook(text);
}

auto workbook_to_json(const runtime::Dataset& dataset) -> std::string {
    Json sheets = Json::array();
    for (const auto& sheet : dataset) {
        const auto& table = sheet.table;
        Json rows = Json::array();
        for (std::size_t row = 0; row < table.rows(); ++row) {
            Json cells = Json::array();
            for (const auto& entry : table.columns) {
                if (runtime::is_null(entry, row)) {
                    cells.push_back(nullptr);
                } else {
                    cells.push_back(scalar_to_cell(runtime::scalar_at(*entry.column, row)));
                }
            }
            rows.push_back(std::move(cells));
        }
        sheets.push_back(Json{{"name", sheet.name},
                              {"columns", table.column_names()},
                              {"rows", std::move(rows)}});
    }
    // Non-UTF-8 bytes from Latin-1 sources become U+FFFD instead of failing the write.
    return Json{{"sheets", std::move(sheets)}}.dump(2, ' ', false,
                                                    Json::error_handler_t::replace);
}

auto write_workbook(const runtime::Dataset& dataset, std::string_view path)
    -> std::expected<void, std::string> {
    std::ofstream out{std::string(path)};
    if (!out) {
        return std::unexpected("failed to open workbook for writing: " + std::string(path));
    }
    out << workbook_to_json(dataset) << '\n';
    if (!out) {
        return std::unexpected("failed to write workbook: " + std::string(path));
    }
    return {};
}

}  // namespace shroud::io
