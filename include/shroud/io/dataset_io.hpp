#pragma once

#include <shroud/runtime/table.hpp>

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace shroud::io {

enum class DataFormat : std::uint8_t {
    Csv,
    Tsv,
    /// Multi-sheet JSON workbook, see workbook.hpp.
    Workbook,
};

[[nodiscard]] auto data_format_name(DataFormat format) noexcept -> std::string_view;

/// Accepts `csv`, `tsv`, `json` and `workbook`.
[[nodiscard]] auto parse_data_format(std::string_view name) -> std::optional<DataFormat>;

/// Format implied by the file extension (case-insensitive); nullopt when unknown.
[[nodiscard]] auto format_from_path(std::string_view path) -> std::optional<DataFormat>;

/// Load a file as a dataset.
///
/// Delimited files become a single sheet named "Sheet1". When
/// `selected_sheet` is set only that sheet is kept; naming a sheet the file
/// does not have is an error.
[[nodiscard]] auto load_dataset(std::string_view path,
                                const std::optional<std::string>& selected_sheet = std::nullopt)
    -> std::expected<runtime::Dataset, std::string>;

/// Save a dataset. Delimited formats hold one table, so only the first
/// sheet is written. The format defaults to the one implied by `path`.
[[nodiscard]] auto save_dataset(const runtime::Dataset& dataset, std::string_view path,
                                std::optional<DataFormat> format = std::nullopt)
    -> std::expected<void, std::string>;

}  // namespace shroud::io
