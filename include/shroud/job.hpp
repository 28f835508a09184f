#pragma once

#include <shroud/engine/anonymizer.hpp>
#include <shroud/engine/config.hpp>
#include <shroud/engine/quality.hpp>
#include <shroud/io/dataset_io.hpp>

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace shroud {

/// Everything needed to anonymize one file into another.
struct JobRequest {
    std::string input_path;
    std::string output_path;
    /// Defaults to the format implied by output_path.
    std::optional<io::DataFormat> output_format;
    /// Serialized MaskingConfig.
    std::string masking_config_json;
    /// Restrict the job to one sheet of the input.
    std::optional<std::string> selected_sheet;
    std::string salt = std::string(engine::kDefaultSalt);
    engine::EngineOptions engine;
    engine::ConfigParseOptions config;
};

struct JobReport {
    std::string input_path;
    std::string output_path;
    std::vector<engine::SheetReport> sheets;
    bool fully_anonymized = true;
    engine::QualityReport quality;

    [[nodiscard]] auto skipped_columns() const -> std::vector<std::string>;
    [[nodiscard]] auto total_rows() const noexcept -> std::size_t;
};

/// Parse the config, load the input, anonymize it and write the output.
///
/// Configuration and load errors are reported before anything is
/// transformed; nothing is written unless anonymization ran. Per-column
/// failures do not fail the job, they show up in the report.
[[nodiscard]] auto run_anonymization_job(const JobRequest& request)
    -> std::expected<JobReport, std::string>;

/// JSON rendering of a report, one object per sheet and column, followed
/// by the quality check.
[[nodiscard]] auto report_to_json(const JobReport& report) -> std::string;

}  // namespace shroud
