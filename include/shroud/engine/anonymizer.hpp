#pragma once

#include <shroud/crypto/secure_random.hpp>
#include <shroud/engine/config.hpp>
#include <shroud/engine/dispatcher.hpp>
#include <shroud/engine/methods.hpp>
#include <shroud/runtime/table.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace shroud::engine {

inline constexpr std::string_view kDefaultSalt = "default_salt";

struct EngineOptions {
    /// Maximum number of sheets anonymized concurrently; 0 or 1 is sequential.
    std::size_t threads = 1;
};

struct SheetReport {
    std::string sheet;
    /// False when the config had no rules for this sheet.
    bool configured = false;
    std::size_t rows = 0;
    std::vector<ColumnReport> columns;
};

/// `sheet.column` for every Skipped column, in report order.
[[nodiscard]] auto skipped_columns(const std::vector<SheetReport>& sheets)
    -> std::vector<std::string>;

struct DatasetResult {
    runtime::Dataset dataset;
    std::vector<SheetReport> sheets;

    /// True when no configured column was left unmodified by a failure.
    /// Output with any skipped column must not be treated as anonymized.
    [[nodiscard]] auto fully_anonymized() const noexcept -> bool;

    /// `sheet.column` for every Skipped column.
    [[nodiscard]] auto skipped_columns() const -> std::vector<std::string>;
};

/// The anonymization engine: one salt, one secure random source.
///
/// Inputs are never modified; every call produces a new table or dataset.
class Anonymizer {
   public:
    explicit Anonymizer(std::string salt = std::string(kDefaultSalt), EngineOptions options = {});

    [[nodiscard]] auto hasher() const noexcept -> const Hasher& { return hasher_; }
    [[nodiscard]] auto random() noexcept -> crypto::SecureRandom& { return rng_; }
    [[nodiscard]] auto options() const noexcept -> const EngineOptions& { return options_; }

    [[nodiscard]] auto anonymize_table(const runtime::Table& table, const ColumnConfig& columns,
                                       std::string_view sheet = "Sheet1") -> SheetResult;

    /// Anonymize every sheet of `dataset` that `config` has rules for.
    ///
    /// The output has the same sheets in the same order with the same row
    /// counts; only removed columns disappear.
    [[nodiscard]] auto anonymize(const runtime::Dataset& dataset, const MaskingConfig& config)
        -> DatasetResult;

   private:
    Hasher hasher_;
    crypto::SecureRandom rng_;
    EngineOptions options_;
};

}  // namespace shroud::engine
