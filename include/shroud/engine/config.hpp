#pragma once

#include <shroud/engine/methods.hpp>

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace shroud::engine {

/// Closed set of column transformations.
enum class MethodKind : std::uint8_t {
    None,
    Hash,
    Mask,
    Pseudonymize,
    Substitute,
    Shuffle,
    Perturb,
    GeneralizeNumeric,
    GeneralizeDate,
    AnonymizeEmail,
    AnonymizePhone,
    AnonymizeSsn,
    KAnonymity,
    DifferentialPrivacy,
    Remove,
};

[[nodiscard]] auto method_kind_name(MethodKind kind) noexcept -> std::string_view;
[[nodiscard]] auto parse_method_kind(std::string_view name) -> std::optional<MethodKind>;

/// True for methods that need the whole column before producing any value.
[[nodiscard]] auto is_aggregate(MethodKind kind) noexcept -> bool;

struct NoOptions {};

using MethodOptions =
    std::variant<NoOptions, HashOptions, MaskOptions, PseudonymizeOptions, SubstituteOptions,
                 PerturbOptions, GeneralizeNumericOptions, GeneralizeDateOptions,
                 KAnonymityOptions, DifferentialPrivacyOptions>;

/// Defaults for the privacy parameters that deployments commonly tune.
struct EngineDefaults {
    std::int64_t k = 5;
    double epsilon = 1.0;

    /// Read SHROUD_DEFAULT_K and SHROUD_DEFAULT_EPSILON; invalid values are
    /// logged and ignored.
    [[nodiscard]] static auto from_env() -> EngineDefaults;
};

/// A column's resolved transformation.
struct MethodSpec {
    MethodKind kind = MethodKind::Hash;
    MethodOptions options;
    /// Method name as written in the config. Differs from
    /// method_kind_name(kind) when an unknown name fell back to hash.
    std::string requested;

    /// Spec for `kind` with every option at its default.
    [[nodiscard]] static auto with_defaults(MethodKind kind, const EngineDefaults& defaults = {})
        -> MethodSpec;
};

struct ColumnRule {
    std::string column;
    MethodSpec spec;
};

/// Per-sheet rules in config order.
using ColumnConfig = std::vector<ColumnRule>;

/// Sheet name -> column rules. Sheets without rules pass through untouched.
class MaskingConfig {
   public:
    MaskingConfig() = default;

    /// Add or replace the rules of a sheet.
    void set_sheet(std::string sheet, ColumnConfig columns);

    [[nodiscard]] auto find(std::string_view sheet) const -> const ColumnConfig*;
    [[nodiscard]] auto sheet_names() const -> std::vector<std::string>;
    [[nodiscard]] auto size() const noexcept -> std::size_t { return sheets_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return sheets_.empty(); }

   private:
    std::vector<std::pair<std::string, ColumnConfig>> sheets_;
};

struct ConfigParseOptions {
    /// Reject unknown method names instead of treating them as `hash`.
    bool strict_methods = false;
    EngineDefaults defaults;
};

/// Configuration error with the dotted path of the offending entry.
struct ConfigError {
    std::string message;
    std::string path;

    [[nodiscard]] auto format() const -> std::string;
};

using ConfigResult = std::expected<MaskingConfig, ConfigError>;

/// Parse the JSON wire format: `{sheet: {column: "method" | {"method": ..., "options": {...}}}}`.
[[nodiscard]] auto parse_masking_config(std::string_view json,
                                        const ConfigParseOptions& options = {}) -> ConfigResult;

/// Parse the rules of a single sheet: `{column: "method" | {...}}`.
[[nodiscard]] auto parse_column_config(std::string_view json,
                                       const ConfigParseOptions& options = {})
    -> std::expected<ColumnConfig, ConfigError>;

}  // namespace shroud::engine
