#include <shroud/engine/methods.hpp>

#include <fmt/core.h>

#include <array>
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <unordered_map>

namespace shroud::engine {

namespace {

constexpr std::array<std::string_view, 3> kPublicEmailDomains = {
    "gmail.com",
    "yahoo.com",
    "outlook.com",
};

// Date layouts in priority order. Y = 4-digit year, m/d/H/M/S = 1-2 digits,
// anything else must match literally.
constexpr std::array<std::string_view, 5> kDateLayouts = {
    "Y-m-d", "m/d/Y", "d/m/Y", "Y-m-d H:M:S", "Y-m-dTH:M:S",
};

auto is_digit(char ch) -> bool {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

auto read_number(std::string_view text, std::size_t& pos, std::size_t min_digits,
                 std::size_t max_digits, std::int32_t& out) -> bool {
    std::size_t count = 0;
    out = 0;
    while (pos < text.size() && count < max_digits && is_digit(text[pos])) {
        out = out * 10 + (text[pos] - '0');
        ++pos;
        ++count;
    }
    return count >= min_digits;
}

auto parse_with_layout(std::string_view text, std::string_view layout) -> std::optional<Date> {
    std::int32_t year = -1;
    std::int32_t month = -1;
    std::int32_t day = -1;
    std::int32_t hour = 0;
    std::int32_t minute = 0;
    std::int32_t second = 0;
    std::size_t pos = 0;
    for (char token : layout) {
        bool ok = true;
        switch (token) {
            case 'Y':
                ok = read_number(text, pos, 4, 4, year);
                break;
            case 'm':
                ok = read_number(text, pos, 1, 2, month);
                break;
            case 'd':
                ok = read_number(text, pos, 1, 2, day);
                break;
            case 'H':
                ok = read_number(text, pos, 1, 2, hour);
                break;
            case 'M':
                ok = read_number(text, pos, 1, 2, minute);
                break;
            case 'S':
                ok = read_number(text, pos, 1, 2, second);
                break;
            default:
                ok = pos < text.size() && text[pos] == token;
                ++pos;
                break;
        }
        if (!ok) {
            return std::nullopt;
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || hour > 23 || minute > 59 || second > 61) {
        return std::nullopt;
    }
    const auto umonth = static_cast<std::uint32_t>(month);
    if (day < 1 || static_cast<std::uint32_t>(day) > days_in_month(year, umonth)) {
        return std::nullopt;
    }
    return make_date(year, umonth, static_cast<std::uint32_t>(day));
}

auto to_int_checked(double value) -> std::int64_t {
    // 2^63 is exactly representable; anything at or beyond it does not fit.
    constexpr double kLimit = 9223372036854775808.0;
    if (!std::isfinite(value) || value >= kLimit || value < -kLimit) {
        throw std::out_of_range(fmt::format("value {} does not fit in a 64-bit integer", value));
    }
    return static_cast<std::int64_t>(value);
}

auto count_digits(std::string_view text) -> std::size_t {
    std::size_t n = 0;
    for (char ch : text) {
        if (is_digit(ch)) {
            ++n;
        }
    }
    return n;
}

auto hex_pair_value(std::string_view hex, std::size_t pos) -> int {
    auto nibble = [](char ch) -> int {
        return ch <= '9' ? ch - '0' : ch - 'a' + 10;
    };
    return nibble(hex[pos]) * 16 + nibble(hex[pos + 1]);
}

auto matches_dashed_ssn(std::string_view text) -> bool {
    // Prefix match: DDD-DD-DDDD
    if (text.size() < 11) {
        return false;
    }
    for (std::size_t i = 0; i < 11; ++i) {
        const bool want_dash = i == 3 || i == 6;
        if (want_dash ? text[i] != '-' : !is_digit(text[i])) {
            return false;
        }
    }
    return true;
}

auto matches_raw_ssn(std::string_view text) -> bool {
    if (text.size() < 9) {
        return false;
    }
    for (std::size_t i = 0; i < 9; ++i) {
        if (!is_digit(text[i])) {
            return false;
        }
    }
    return true;
}

// Strings are taken as-is and integers by their decimal form; anything else
// is not an identifier these methods know how to rewrite.
auto identifier_text(const ScalarValue& value) -> std::optional<std::string> {
    if (const auto* s = std::get_if<std::string>(&value)) {
        return *s;
    }
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return fmt::format("{}", *i);
    }
    return std::nullopt;
}

}  // namespace

auto date_granularity_name(DateGranularity granularity) noexcept -> std::string_view {
    switch (granularity) {
        case DateGranularity::Year:
            return "year";
        case DateGranularity::Month:
            return "month";
        case DateGranularity::Quarter:
            return "quarter";
    }
    return "unknown";
}

auto parse_date_granularity(std::string_view name) -> std::optional<DateGranularity> {
    if (name == "year") {
        return DateGranularity::Year;
    }
    if (name == "month") {
        return DateGranularity::Month;
    }
    if (name == "quarter") {
        return DateGranularity::Quarter;
    }
    return std::nullopt;
}

auto perturb_kind_name(PerturbKind kind) noexcept -> std::string_view {
    switch (kind) {
        case PerturbKind::Uniform:
            return "uniform";
        case PerturbKind::Gaussian:
            return "gaussian";
        case PerturbKind::Percentage:
            return "percentage";
    }
    return "unknown";
}

auto parse_perturb_kind(std::string_view name) noexcept -> PerturbKind {
    if (name == "gaussian") {
        return PerturbKind::Gaussian;
    }
    if (name == "percentage") {
        return PerturbKind::Percentage;
    }
    return PerturbKind::Uniform;
}

auto mask_value(const ScalarValue& value, const MaskOptions& options) -> std::string {
    const auto text = runtime::format_scalar(value);
    auto repeat = [&](std::size_t count) {
        std::string out;
        out.reserve(count * options.mask_char.size());
        for (std::size_t i = 0; i < count; ++i) {
            out.append(options.mask_char);
        }
        return out;
    };
    // Byte offsets of each UTF-8 lead byte; counts are in characters.
    std::vector<std::size_t> starts;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (i == 0 || (static_cast<unsigned char>(text[i]) & 0xC0U) != 0x80U) {
            starts.push_back(i);
        }
    }
    const auto count = starts.size();
    if (options.preserve_length || count <= 2) {
        return repeat(count);
    }
    return text.substr(0, starts[1]) + repeat(count - 2) + text.substr(starts.back());
}

auto generalize_numeric(const ScalarValue& value, std::int64_t bin_size) -> std::string {
    if (bin_size <= 0) {
        throw std::invalid_argument("bin_size must be positive");
    }
    std::int64_t number = 0;
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        number = *i;
    } else if (const auto* d = std::get_if<double>(&value)) {
        number = to_int_checked(std::floor(*d));
    } else {
        return runtime::format_scalar(value);
    }

    std::int64_t quotient = number / bin_size;
    if (number % bin_size != 0 && number < 0) {
        --quotient;
    }
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
    if (quotient > kMax / bin_size || quotient < kMin / bin_size) {
        throw std::out_of_range(fmt::format("bin for {} overflows 64-bit range", number));
    }
    const std::int64_t start = quotient * bin_size;
    if (start > kMax - (bin_size - 1)) {
        throw std::out_of_range(fmt::format("bin for {} overflows 64-bit range", number));
    }
    return fmt::format("{}-{}", start, start + (bin_size - 1));
}

auto parse_date(std::string_view text) -> std::optional<Date> {
    for (auto layout : kDateLayouts) {
        if (auto date = parse_with_layout(text, layout)) {
            return date;
        }
    }
    return std::nullopt;
}

auto generalize_date(const ScalarValue& value, DateGranularity granularity) -> std::string {
    std::optional<Date> date;
    if (const auto* d = std::get_if<Date>(&value)) {
        date = *d;
    } else if (const auto* s = std::get_if<std::string>(&value)) {
        date = parse_date(*s);
    }
    if (!date) {
        return runtime::format_scalar(value);
    }

    const auto civil = civil_from_date(*date);
    switch (granularity) {
        case DateGranularity::Year:
            return fmt::format("{}", civil.year);
        case DateGranularity::Month:
            return fmt::format("{}-{:02}", civil.year, civil.month);
        case DateGranularity::Quarter:
            return fmt::format("{}-Q{}", civil.year, (civil.month - 1) / 3 + 1);
    }
    return runtime::format_scalar(value);
}

auto substitution_candidates(std::string_view category) -> const std::vector<std::string>* {
    static const std::unordered_map<std::string_view, std::vector<std::string>> kCategories = {
        {"names",
         {"John Doe", "Jane Smith", "Robert Johnson", "Emily Davis", "Michael Brown",
          "Sarah Wilson", "David Miller", "Lisa Garcia", "Chris Martinez", "Anna Taylor"}},
        {"companies",
         {"Acme Corp", "Beta Inc", "Gamma LLC", "Delta Ltd", "Alpha Systems", "Omega Solutions",
          "Phoenix Group", "Titan Industries", "Nova Corp", "Prime Tech"}},
        {"cities",
         {"Springfield", "Franklin", "Georgetown", "Madison", "Riverside", "Arlington",
          "Fairview", "Greenville", "Oakland", "Clayton"}},
        {"domains",
         {"example.com", "testdomain.org", "sample.net", "placeholder.co", "anonymous.info",
          "generic.com", "standard.org", "default.net"}},
        {"countries", {"Country A", "Country B", "Country C", "Country D", "Country E"}},
    };
    if (auto it = kCategories.find(category); it != kCategories.end()) {
        return &it->second;
    }
    return nullptr;
}

auto Hasher::hash(std::string_view text, crypto::HashAlgorithm algorithm) const -> std::string {
    std::string input;
    input.reserve(text.size() + salt_.size());
    input.append(text);
    input.append(salt_);
    return crypto::hex_digest(algorithm, input);
}

auto Hasher::hash_value(const ScalarValue& value, const HashOptions& options) const
    -> std::string {
    return hash(runtime::format_scalar(value), options.algorithm);
}

auto Hasher::pseudonymize(const ScalarValue& value, const PseudonymizeOptions& options) const
    -> std::string {
    return options.prefix + "_" + hash(runtime::format_scalar(value)).substr(0, 8);
}

auto Hasher::anonymize_email(const ScalarValue& value) const -> std::string {
    const auto* email = std::get_if<std::string>(&value);
    if (email == nullptr || email->find('@') == std::string::npos) {
        return runtime::format_scalar(value);
    }

    try {
        const auto at = email->find('@');
        const std::string local = email->substr(0, at);
        std::string domain = email->substr(at + 1);

        const std::string anon_local = "user" + hash(local).substr(0, 8);

        bool is_public = false;
        for (auto candidate : kPublicEmailDomains) {
            is_public = is_public || domain == candidate;
        }
        if (!is_public) {
            if (auto dot = domain.rfind('.'); dot != std::string::npos) {
                const std::string tld = domain.substr(dot + 1);
                domain = "company" + hash(domain).substr(0, 6) + "." + tld;
            }
        }
        return anon_local + "@" + domain;
    } catch (const std::runtime_error&) {
        return std::string(kPlaceholderEmail);
    }
}

auto Hasher::anonymize_phone(const ScalarValue& value) const -> std::string {
    auto phone = identifier_text(value);
    if (!phone) {
        return runtime::format_scalar(value);
    }
    const std::size_t digits = count_digits(*phone);
    if (digits < 7) {
        return *phone;
    }

    // Two hex characters per replacement digit; chain digests for long inputs.
    std::string hex = hash(*phone);
    while (hex.size() < digits * 2) {
        hex += hash(hex);
    }

    std::string result = *phone;
    std::size_t digit_index = 0;
    for (auto& ch : result) {
        if (is_digit(ch)) {
            ch = static_cast<char>('0' + hex_pair_value(hex, digit_index * 2) % 10);
            ++digit_index;
        }
    }
    return result;
}

auto Hasher::anonymize_ssn(const ScalarValue& value) const -> std::string {
    auto ssn = identifier_text(value);
    if (!ssn) {
        return runtime::format_scalar(value);
    }

    const std::string hex = hash(*ssn);
    std::string numeric;
    numeric.reserve(9);
    for (std::size_t i = 0; i < 9; ++i) {
        numeric.push_back(static_cast<char>('0' + static_cast<unsigned char>(hex[i]) % 10));
    }

    if (!matches_dashed_ssn(*ssn) && matches_raw_ssn(*ssn)) {
        return numeric;
    }
    return numeric.substr(0, 3) + "-" + numeric.substr(3, 2) + "-" + numeric.substr(5, 4);
}

auto substitute_value(const SubstituteOptions& options, crypto::SecureRandom& rng)
    -> std::string {
    if (!options.list.empty()) {
        return rng.pick(options.list);
    }
    if (const auto* candidates = substitution_candidates(options.type)) {
        return rng.pick(*candidates);
    }
    return std::string(kRedacted);
}

auto perturb_value(const ScalarValue& value, const PerturbOptions& options,
                   crypto::SecureRandom& rng) -> ScalarValue {
    double number = 0.0;
    const bool is_int = std::holds_alternative<std::int64_t>(value);
    if (is_int) {
        number = static_cast<double>(std::get<std::int64_t>(value));
    } else if (const auto* d = std::get_if<double>(&value)) {
        number = *d;
    } else {
        return value;
    }

    const double range = options.range.value_or(std::fabs(number) * 0.1);
    double noise = 0.0;
    switch (options.kind) {
        case PerturbKind::Uniform:
            noise = rng.uniform_real(-range, range);
            break;
        case PerturbKind::Gaussian:
            noise = rng.gaussian(0.0, range);
            break;
        case PerturbKind::Percentage: {
            const double fraction = options.percentage / 100.0;
            noise = rng.uniform_real(-fraction, fraction) * number;
            break;
        }
    }

    double result = number + noise;
    if (options.non_negative && result < 0.0) {
        result = std::fabs(result);
    }
    if (is_int) {
        return to_int_checked(std::trunc(result));
    }
    return result;
}

auto add_privacy_noise(const ScalarValue& value, const DifferentialPrivacyOptions& options,
                       crypto::SecureRandom& rng) -> ScalarValue {
    if (!(options.epsilon > 0.0)) {
        throw std::invalid_argument("epsilon must be positive");
    }
    constexpr double kSensitivity = 1.0;
    const double scale = kSensitivity / options.epsilon;

    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return to_int_checked(std::round(static_cast<double>(*i) + rng.gaussian(0.0, scale)));
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return *d + rng.gaussian(0.0, scale);
    }
    return value;
}

}  // namespace shroud::engine
