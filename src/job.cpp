#include <shroud/job.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace shroud {

auto JobReport::skipped_columns() const -> std::vector<std::string> {
    return engine::skipped_columns(sheets);
}

auto JobReport::total_rows() const noexcept -> std::size_t {
    std::size_t rows = 0;
    for (const auto& sheet : sheets) {
        rows += sheet.rows;
    }
    return rows;
}

auto run_anonymization_job(const JobRequest& request) -> std::expected<JobReport, std::string> {
    auto config = engine::parse_masking_config(request.masking_config_json, request.config);
    if (!config) {
        return std::unexpected(config.error().format());
    }

    auto output_format = request.output_format;
    if (!output_format) {
        output_format = io::format_from_path(request.output_path);
        if (!output_format) {
            return std::unexpected("unsupported output format: " + request.output_path);
        }
    }

    auto dataset = io::load_dataset(request.input_path, request.selected_sheet);
    if (!dataset) {
        return std::unexpected(dataset.error());
    }
    spdlog::info("anonymizing {} ({} sheet(s), {} configured)", request.input_path,
                 dataset->size(), config->size());

    engine::Anonymizer anonymizer(request.salt, request.engine);
    auto result = anonymizer.anonymize(*dataset, *config);

    if (auto saved = io::save_dataset(result.dataset, request.output_path, output_format);
        !saved) {
        return std::unexpected(saved.error());
    }

    auto quality = engine::verify_anonymization_quality(*dataset, result);
    JobReport report{.input_path = request.input_path,
                     .output_path = request.output_path,
                     .sheets = std::move(result.sheets),
                     .fully_anonymized = true,
                     .quality = std::move(quality)};
    report.fully_anonymized = report.skipped_columns().empty();
    spdlog::info("wrote {} ({} rows, privacy score {:.2f})", request.output_path,
                 report.total_rows(), report.quality.privacy_score);
    if (!report.fully_anonymized) {
        spdlog::warn("{} column(s) were left unmodified; output is not fully anonymized",
                     report.skipped_columns().size());
    }
    for (const auto& recommendation : report.quality.recommendations) {
        spdlog::warn("{}", recommendation);
    }
    return report;
}

auto report_to_json(const JobReport& report) -> std::string {
    using Json = nlohmann::ordered_json;
    Json sheets = Json::array();
    for (const auto& sheet : report.sheets) {
        Json columns = Json::array();
        for (const auto& column : sheet.columns) {
            Json entry{{"column", column.column},
                       {"method", engine::method_kind_name(column.method)},
                       {"outcome", engine::column_outcome_name(column.outcome)}};
            if (column.requested != engine::method_kind_name(column.method)) {
                entry["requested"] = column.requested;
            }
            if (!column.reason.empty()) {
                entry["reason"] = column.reason;
            }
            columns.push_back(std::move(entry));
        }
        sheets.push_back(Json{{"sheet", sheet.sheet},
                              {"configured", sheet.configured},
                              {"rows", sheet.rows},
                              {"columns", std::move(columns)}});
    }
    Json exposed = Json::array();
    for (const auto& column : report.quality.exposed) {
        Json names = Json::array();
        for (auto pattern : column.patterns) {
            names.push_back(engine::sensitive_pattern_name(pattern));
        }
        exposed.push_back(Json{{"sheet", column.sheet},
                               {"column", column.column},
                               {"patterns", std::move(names)},
                               {"cells", column.cells}});
    }
    Json quality{{"retained_ratio", report.quality.retained_ratio},
                 {"privacy_score", report.quality.privacy_score},
                 {"rows_consistent", report.quality.rows_consistent},
                 {"exposed", std::move(exposed)},
                 {"recommendations", report.quality.recommendations}};
    Json root{{"input", report.input_path},
              {"output", report.output_path},
              {"fully_anonymized", report.fully_anonymized},
              {"skipped", report.skipped_columns()},
              {"sheets", std::move(sheets)},
              {"quality", std::move(quality)}};
    return root.dump(2, ' ', false, Json::error_handler_t::replace);
}

}  // namespace shroud
