#include <shroud/io/csv.hpp>
#include <shroud/io/dataset_io.hpp>
#include <shroud/io/workbook.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace shroud::io {

namespace {

auto lowercase(std::string_view text) -> std::string {
    std::string out(text);
    std::ranges::transform(out, out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

auto separator_of(DataFormat format) -> char {
    return format == DataFormat::Tsv ? '\t' : ',';
}

}  // namespace

auto data_format_name(DataFormat format) noexcept -> std::string_view {
    switch (format) {
        case DataFormat::Csv:
            return "csv";
        case DataFormat::Tsv:
            return "tsv";
        case DataFormat::Workbook:
            return "workbook";
    }
    return "csv";
}

auto parse_data_format(std::string_view name) -> std::optional<DataFormat> {
    const auto key = lowercase(name);
    if (key == "csv") {
        return DataFormat::Csv;
    }
    if (key == "tsv") {
        return DataFormat::Tsv;
    }
    if (key == "json" || key == "workbook") {
        return DataFormat::Workbook;
    }
    return std::nullopt;
}

auto format_from_path(std::string_view path) -> std::optional<DataFormat> {
    auto ext = lowercase(std::filesystem::path(path).extension().string());
    if (ext.empty()) {
        return std::nullopt;
    }
    return parse_data_format(std::string_view(ext).substr(1));
}

auto load_dataset(std::string_view path, const std::optional<std::string>& selected_sheet)
    -> std::expected<runtime::Dataset, std::string> {
    const std::string file{path};
    if (!std::filesystem::exists(file)) {
        return std::unexpected("input file not found: " + file);
    }
    auto format = format_from_path(path);
    if (!format) {
        return std::unexpected("unsupported input format: " + file);
    }

    runtime::Dataset dataset;
    if (*format == DataFormat::Workbook) {
        auto workbook = read_workbook(path);
        if (!workbook) {
            return std::unexpected(workbook.error());
        }
        dataset = std::move(*workbook);
    } else {
        auto table = read_csv(path, separator_of(*format));
        if (!table) {
            return std::unexpected(table.error());
        }
        dataset.add_sheet("Sheet1", std::move(*table));
    }
    spdlog::debug("loaded {} sheet(s) from {}", dataset.size(), file);

    if (!selected_sheet) {
        return dataset;
    }
    const auto* table = dataset.find(*selected_sheet);
    if (table == nullptr) {
        return std::unexpected("sheet '" + *selected_sheet + "' not found in " + file);
    }
    runtime::Dataset selected;
    selected.add_sheet(*selected_sheet, *table);
    return selected;
}

auto save_dataset(const runtime::Dataset& dataset, std::string_view path,
                  std::optional<DataFormat> format) -> std::expected<void, std::string> {
    if (!format) {
        format = format_from_path(path);
    }
    if (!format) {
        return std::unexpected("unsupported output format: " + std::string(path));
    }
    if (*format == DataFormat::Workbook) {
        return write_workbook(dataset, path);
    }
    if (dataset.empty()) {
        return std::unexpected("nothing to write: dataset has no sheets");
    }
    if (dataset.size() > 1) {
        spdlog::warn("{} output holds one sheet; writing '{}' and dropping {} other(s)",
                     data_format_name(*format), dataset.sheets().front().name,
                     dataset.size() - 1);
    }
    auto written = write_csv(dataset.sheets().front().table, path, separator_of(*format));
    if (!written) {
        return std::unexpected(written.error());
    }
    return {};
}

}  // namespace shroud::io
