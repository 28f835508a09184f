#include <shroud/engine/quality.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <array>
#include <regex>
#include <unordered_set>
#include <utility>

namespace shroud::engine {

namespace {

using PatternTable = std::array<std::pair<SensitivePattern, std::regex>, 7>;

auto patterns() -> const PatternTable& {
    static const PatternTable table = {{
        {SensitivePattern::Ssn, std::regex(R"(\b\d{3}-\d{2}-\d{4}\b)", std::regex::icase)},
        {SensitivePattern::Phone,
         std::regex(R"(\b\(?[2-9]\d{2}\)?[-.\s]?\d{3}[-.\s]?\d{4}\b)", std::regex::icase)},
        {SensitivePattern::Email,
         std::regex(R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)", std::regex::icase)},
        {SensitivePattern::CreditCard,
         std::regex(R"(\b\d{4}[-\s]?\d{4}[-\s]?\d{4}[-\s]?\d{4}\b)", std::regex::icase)},
        {SensitivePattern::IpAddress,
         std::regex(R"(\b\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}\b)", std::regex::icase)},
        {SensitivePattern::Date,
         std::regex(R"(\b\d{1,2}[/-]\d{1,2}[/-]\d{2,4}\b)", std::regex::icase)},
        {SensitivePattern::PotentialId, std::regex(R"(\b[A-Z]\d{8,12}\b)", std::regex::icase)},
    }};
    return table;
}

using ValueSet = std::unordered_set<std::string>;

auto distinct_values(const runtime::ColumnEntry& entry) -> ValueSet {
    ValueSet values;
    const auto n = runtime::column_size(*entry.column);
    for (std::size_t row = 0; row < n; ++row) {
        if (!runtime::is_null(entry, row)) {
            values.insert(runtime::format_scalar(runtime::scalar_at(*entry.column, row)));
        }
    }
    return values;
}

// Cells of `output` that also occur in `input` and match a pattern.
auto scan_column(const runtime::ColumnEntry& output, const ValueSet& input) -> ExposedColumn {
    ExposedColumn exposed;
    const auto n = runtime::column_size(*output.column);
    for (std::size_t row = 0; row < n; ++row) {
        if (runtime::is_null(output, row)) {
            continue;
        }
        const auto text = runtime::format_scalar(runtime::scalar_at(*output.column, row));
        if (!input.contains(text)) {
            continue;
        }
        const auto found = detect_sensitive_patterns(text);
        if (found.empty()) {
            continue;
        }
        ++exposed.cells;
        for (auto pattern : found) {
            if (std::ranges::find(exposed.patterns, pattern) == exposed.patterns.end()) {
                exposed.patterns.push_back(pattern);
            }
        }
    }
    std::ranges::sort(exposed.patterns);
    return exposed;
}

}  // namespace

auto sensitive_pattern_name(SensitivePattern pattern) noexcept -> std::string_view {
    switch (pattern) {
        case SensitivePattern::Ssn:
            return "ssn";
        case SensitivePattern::Phone:
            return "phone";
        case SensitivePattern::Email:
            return "email";
        case SensitivePattern::CreditCard:
            return "credit_card";
        case SensitivePattern::IpAddress:
            return "ip_address";
        case SensitivePattern::Date:
            return "date";
        case SensitivePattern::PotentialId:
            return "potential_id";
    }
    return "unknown";
}

auto detect_sensitive_patterns(std::string_view text) -> std::vector<SensitivePattern> {
    std::vector<SensitivePattern> found;
    for (const auto& [pattern, regex] : patterns()) {
        if (std::regex_search(text.begin(), text.end(), regex)) {
            found.push_back(pattern);
        }
    }
    return found;
}

auto check_row_consistency(std::size_t original_rows, std::size_t anonymized_rows) noexcept
    -> bool {
    return original_rows == anonymized_rows;
}

auto verify_anonymization_quality(const runtime::Dataset& original, const DatasetResult& result)
    -> QualityReport {
    QualityReport report;
    std::size_t total = 0;
    std::size_t retained = 0;

    for (const auto& sheet : original) {
        const auto* output = result.dataset.find(sheet.name);
        if (output == nullptr ||
            !check_row_consistency(sheet.table.rows(), output->rows())) {
            report.rows_consistent = false;
            report.recommendations.push_back(
                fmt::format("sheet '{}' changed row count; check the output for dropped rows",
                            sheet.name));
        }
        for (const auto& entry : sheet.table.columns) {
            const auto input = distinct_values(entry);
            total += input.size();
            const auto* out_entry = output != nullptr ? output->find_entry(entry.name) : nullptr;
            if (out_entry == nullptr) {
                continue;
            }
            const auto kept = distinct_values(*out_entry);
            retained += static_cast<std::size_t>(std::ranges::count_if(
                input, [&](const std::string& value) { return kept.contains(value); }));

            auto exposed = scan_column(*out_entry, input);
            if (exposed.cells == 0) {
                continue;
            }
            exposed.sheet = sheet.name;
            exposed.column = entry.name;
            std::vector<std::string_view> names;
            for (auto pattern : exposed.patterns) {
                names.push_back(sensitive_pattern_name(pattern));
            }
            report.recommendations.push_back(
                fmt::format("{}.{}: {} left in clear text; consider stronger anonymization",
                            sheet.name, entry.name, fmt::join(names, ", ")));
            report.exposed.push_back(std::move(exposed));
        }
    }

    report.retained_ratio =
        total == 0 ? 0.0 : static_cast<double>(retained) / static_cast<double>(total);
    report.privacy_score = 1.0 - report.retained_ratio;
    if (!report.exposed.empty()) {
        report.privacy_score *= 0.8;
    }
    return report;
}

}  // namespace shroud::engine
