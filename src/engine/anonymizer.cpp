#include <shroud/engine/anonymizer.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <optional>
#include <thread>

namespace shroud::engine {

auto skipped_columns(const std::vector<SheetReport>& sheets) -> std::vector<std::string> {
    std::vector<std::string> out;
    for (const auto& sheet : sheets) {
        for (const auto& column : sheet.columns) {
            if (column.outcome == ColumnOutcome::Skipped) {
                out.push_back(sheet.sheet + "." + column.column);
            }
        }
    }
    return out;
}

auto DatasetResult::fully_anonymized() const noexcept -> bool {
    return std::ranges::none_of(sheets, [](const SheetReport& sheet) {
        return std::ranges::any_of(sheet.columns, [](const ColumnReport& column) {
            return column.outcome == ColumnOutcome::Skipped;
        });
    });
}

auto DatasetResult::skipped_columns() const -> std::vector<std::string> {
    return engine::skipped_columns(sheets);
}

Anonymizer::Anonymizer(std::string salt, EngineOptions options)
    : hasher_(std::move(salt)), options_(options) {}

auto Anonymizer::anonymize_table(const runtime::Table& table, const ColumnConfig& columns,
                                 std::string_view sheet) -> SheetResult {
    TransformContext context{.hasher = hasher_, .rng = rng_, .sheet = sheet};
    return apply_column_config(table, columns, context);
}

auto Anonymizer::anonymize(const runtime::Dataset& dataset, const MaskingConfig& config)
    -> DatasetResult {
    for (const auto& name : config.sheet_names()) {
        if (dataset.find(name) == nullptr) {
            spdlog::debug("config names sheet '{}' which is not in the dataset", name);
        }
    }

    const auto& sheets = dataset.sheets();
    std::vector<std::optional<SheetResult>> results(sheets.size());
    std::vector<std::exception_ptr> errors(sheets.size());

    auto process = [&](std::size_t i) {
        const auto& sheet = sheets[i];
        const auto* columns = config.find(sheet.name);
        if (columns == nullptr) {
            spdlog::debug("[{}] no rules, passing through {} rows", sheet.name,
                          sheet.table.rows());
            return;
        }
        try {
            results[i] = anonymize_table(sheet.table, *columns, sheet.name);
        } catch (...) {
            errors[i] = std::current_exception();
        }
    };

    const std::size_t workers = std::min(std::max<std::size_t>(options_.threads, 1), sheets.size());
    if (workers <= 1) {
        for (std::size_t i = 0; i < sheets.size(); ++i) {
            process(i);
        }
    } else {
        std::atomic<std::size_t> next{0};
        std::vector<std::jthread> pool;
        pool.reserve(workers);
        for (std::size_t w = 0; w < workers; ++w) {
            pool.emplace_back([&] {
                for (std::size_t i = next++; i < sheets.size(); i = next++) {
                    process(i);
                }
            });
        }
    }

    DatasetResult out;
    out.sheets.reserve(sheets.size());
    for (std::size_t i = 0; i < sheets.size(); ++i) {
        if (errors[i]) {
            std::rethrow_exception(errors[i]);
        }
        const auto& sheet = sheets[i];
        SheetReport report{.sheet = sheet.name, .configured = false, .rows = 0, .columns = {}};
        if (results[i].has_value()) {
            report.configured = true;
            report.columns = std::move(results[i]->columns);
            out.dataset.add_sheet(sheet.name, std::move(results[i]->table));
        } else {
            out.dataset.add_sheet(sheet.name, sheet.table);
        }
        report.rows = sheet.table.rows();
        out.sheets.push_back(std::move(report));
    }
    return out;
}

}  // namespace shroud::engine
