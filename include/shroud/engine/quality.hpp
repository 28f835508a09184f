#pragma once

#include <shroud/engine/anonymizer.hpp>
#include <shroud/runtime/table.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace shroud::engine {

/// Kinds of identifying text the scanner recognises.
enum class SensitivePattern : std::uint8_t {
    Ssn,
    Phone,
    Email,
    CreditCard,
    IpAddress,
    Date,
    PotentialId,
};

[[nodiscard]] auto sensitive_pattern_name(SensitivePattern pattern) noexcept -> std::string_view;

/// Every pattern kind found in `text`, in enum order. Matching is
/// case-insensitive.
[[nodiscard]] auto detect_sensitive_patterns(std::string_view text)
    -> std::vector<SensitivePattern>;

/// An output column holding input values that still look identifying.
struct ExposedColumn {
    std::string sheet;
    std::string column;
    std::vector<SensitivePattern> patterns;
    /// Output cells that matched.
    std::size_t cells = 0;
};

/// Post-run check of an anonymized dataset against its input.
struct QualityReport {
    /// Share of distinct input values (per sheet and column) that survive
    /// verbatim in the same output column.
    double retained_ratio = 0.0;
    /// 1 - retained_ratio, scaled by 0.8 when any column is exposed.
    double privacy_score = 1.0;
    /// Every sheet kept its row count.
    bool rows_consistent = true;
    std::vector<ExposedColumn> exposed;
    std::vector<std::string> recommendations;
};

[[nodiscard]] auto check_row_consistency(std::size_t original_rows,
                                         std::size_t anonymized_rows) noexcept -> bool;

/// Compare `result` with the dataset it was produced from.
///
/// A cell counts as exposed only when it matches a sensitive pattern and
/// the same text occurs in that column of the input. Format-preserving
/// methods (phone, SSN, email) emit new values that look sensitive on
/// purpose and are not reported.
[[nodiscard]] auto verify_anonymization_quality(const runtime::Dataset& original,
                                                const DatasetResult& result) -> QualityReport;

}  // namespace shroud::engine
