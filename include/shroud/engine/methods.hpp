#pragma once

#include <shroud/crypto/digest.hpp>
#include <shroud/crypto/secure_random.hpp>
#include <shroud/runtime/table.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shroud::engine {

using runtime::ScalarValue;

// ─── Method options ───────────────────────────────────────────────────────────
//  Resolved once from the masking config; every field carries the default the
//  method uses when the option is omitted.

struct HashOptions {
    crypto::HashAlgorithm algorithm = crypto::HashAlgorithm::Sha256;
};

struct MaskOptions {
    std::string mask_char = "*";
    bool preserve_length = true;
};

struct PseudonymizeOptions {
    std::string prefix = "ID";
};

struct GeneralizeNumericOptions {
    std::int64_t bin_size = 10;
};

enum class DateGranularity : std::uint8_t {
    Year,
    Month,
    Quarter,
};

struct GeneralizeDateOptions {
    DateGranularity granularity = DateGranularity::Month;
};

struct SubstituteOptions {
    /// Explicit candidates; takes precedence over `type` when non-empty.
    std::vector<std::string> list;
    /// Built-in category name (names, companies, cities, domains, countries).
    std::string type = "generic";
};

enum class PerturbKind : std::uint8_t {
    Uniform,
    Gaussian,
    Percentage,
};

struct PerturbOptions {
    PerturbKind kind = PerturbKind::Uniform;
    /// Noise half-width (uniform) or standard deviation (gaussian).
    /// Defaults to 10% of the magnitude of each value.
    std::optional<double> range;
    double percentage = 10.0;
    bool non_negative = false;
};

struct KAnonymityOptions {
    std::int64_t k = 5;
};

struct DifferentialPrivacyOptions {
    double epsilon = 1.0;
};

inline constexpr std::string_view kRedacted = "[REDACTED]";
inline constexpr std::string_view kPlaceholderEmail = "anonymous@example.com";

[[nodiscard]] auto date_granularity_name(DateGranularity granularity) noexcept -> std::string_view;
[[nodiscard]] auto parse_date_granularity(std::string_view name) -> std::optional<DateGranularity>;
[[nodiscard]] auto perturb_kind_name(PerturbKind kind) noexcept -> std::string_view;
/// Unknown names fall back to uniform noise.
[[nodiscard]] auto parse_perturb_kind(std::string_view name) noexcept -> PerturbKind;

// ─── Deterministic, salt-free methods ─────────────────────────────────────────

[[nodiscard]] auto mask_value(const ScalarValue& value, const MaskOptions& options) -> std::string;

/// Bin a number into `"start-end"` with `end - start + 1 == bin_size`.
///
/// Strings are returned unchanged. Throws std::out_of_range for NaN,
/// infinities and bins that do not fit in 64 bits.
[[nodiscard]] auto generalize_numeric(const ScalarValue& value, std::int64_t bin_size)
    -> std::string;

/// Parse a date in one of the accepted layouts, tried in this order:
/// `YYYY-MM-DD`, `MM/DD/YYYY`, `DD/MM/YYYY`, `YYYY-MM-DD HH:MM:SS`
/// (also with a `T` separator). Ambiguous slash dates resolve as US dates.
[[nodiscard]] auto parse_date(std::string_view text) -> std::optional<Date>;

/// Reduce a date to `YYYY`, `YYYY-MM` or `YYYY-Qn`. Unparseable input is
/// returned unchanged.
[[nodiscard]] auto generalize_date(const ScalarValue& value, DateGranularity granularity)
    -> std::string;

/// Fixed candidate list for a substitution category, or nullptr.
[[nodiscard]] auto substitution_candidates(std::string_view category)
    -> const std::vector<std::string>*;

// ─── Salted, hash-derived methods ─────────────────────────────────────────────

/// Hash-derived methods, all keyed by one salt.
///
/// For a fixed salt every method here is a pure function of its input, so
/// equal values map to equal outputs across columns and sheets.
class Hasher {
   public:
    explicit Hasher(std::string salt) : salt_(std::move(salt)) {}

    [[nodiscard]] auto salt() const noexcept -> const std::string& { return salt_; }

    /// Hex digest of `text + salt`.
    [[nodiscard]] auto hash(std::string_view text,
                            crypto::HashAlgorithm algorithm = crypto::HashAlgorithm::Sha256) const
        -> std::string;

    [[nodiscard]] auto hash_value(const ScalarValue& value, const HashOptions& options) const
        -> std::string;

    /// `prefix + "_" + first 8 hex digits of the sha256 hash`.
    [[nodiscard]] auto pseudonymize(const ScalarValue& value,
                                    const PseudonymizeOptions& options) const -> std::string;

    [[nodiscard]] auto anonymize_email(const ScalarValue& value) const -> std::string;

    /// Replace every digit, keeping all other characters in place. Inputs with
    /// fewer than seven digits are returned unchanged.
    [[nodiscard]] auto anonymize_phone(const ScalarValue& value) const -> std::string;

    [[nodiscard]] auto anonymize_ssn(const ScalarValue& value) const -> std::string;

   private:
    std::string salt_;
};

// ─── Randomized methods ───────────────────────────────────────────────────────

[[nodiscard]] auto substitute_value(const SubstituteOptions& options, crypto::SecureRandom& rng)
    -> std::string;

/// Add noise to a number; integers stay integers (truncated). Non-numeric
/// values are returned unchanged.
[[nodiscard]] auto perturb_value(const ScalarValue& value, const PerturbOptions& options,
                                 crypto::SecureRandom& rng) -> ScalarValue;

/// Add zero-mean Gaussian noise with standard deviation `1 / epsilon`.
///
/// Sensitivity is fixed at 1. This blurs individual values; it does not
/// give a formal (epsilon, delta) guarantee. Integers are rounded to nearest.
[[nodiscard]] auto add_privacy_noise(const ScalarValue& value,
                                     const DifferentialPrivacyOptions& options,
                                     crypto::SecureRandom& rng) -> ScalarValue;

}  // namespace shroud::engine
