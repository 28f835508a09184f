#pragma once

#include <shroud/crypto/secure_random.hpp>
#include <shroud/engine/config.hpp>
#include <shroud/engine/methods.hpp>
#include <shroud/runtime/table.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace shroud::engine {

/// What happened to one configured column.
enum class ColumnOutcome : std::uint8_t {
    /// The method ran and its output replaced the column.
    Applied,
    /// The method failed; the column was left unmodified and is NOT anonymized.
    Skipped,
    /// The column was dropped from the output.
    Removed,
    /// The config names a column the sheet does not have.
    Missing,
};

[[nodiscard]] auto column_outcome_name(ColumnOutcome outcome) noexcept -> std::string_view;

struct ColumnReport {
    std::string column;
    MethodKind method = MethodKind::None;
    std::string requested;
    ColumnOutcome outcome = ColumnOutcome::Applied;
    /// Error text for Skipped columns, empty otherwise.
    std::string reason;
};

struct SheetResult {
    runtime::Table table;
    std::vector<ColumnReport> columns;
};

/// Everything a transformation may draw on besides the column itself.
struct TransformContext {
    const Hasher& hasher;
    crypto::SecureRandom& rng;
    std::string_view sheet = "Sheet1";
};

/// Apply one method to one column. Throws on failure; `remove` is not a
/// value transformation and is rejected here.
[[nodiscard]] auto transform_column(const runtime::ColumnEntry& entry, const MethodSpec& spec,
                                    const TransformContext& context) -> runtime::ColumnEntry;

/// Apply every rule of `columns` to a copy of `table`.
///
/// Columns without a rule are copied unchanged. A rule that throws leaves its
/// column as it was and is reported as Skipped; the remaining rules still run.
[[nodiscard]] auto apply_column_config(const runtime::Table& table, const ColumnConfig& columns,
                                       const TransformContext& context) -> SheetResult;

}  // namespace shroud::engine
