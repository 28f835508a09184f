#include <shroud/engine/config.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace shroud::engine {

namespace {

using Json = nlohmann::ordered_json;

struct MethodName {
    std::string_view name;
    MethodKind kind;
};

constexpr std::array<MethodName, 15> kMethodNames = {{
    {"none", MethodKind::None},
    {"hash", MethodKind::Hash},
    {"mask", MethodKind::Mask},
    {"pseudonymize", MethodKind::Pseudonymize},
    {"substitute", MethodKind::Substitute},
    {"shuffle", MethodKind::Shuffle},
    {"perturb", MethodKind::Perturb},
    {"generalize_numeric", MethodKind::GeneralizeNumeric},
    {"generalize_date", MethodKind::GeneralizeDate},
    {"anonymize_email", MethodKind::AnonymizeEmail},
    {"anonymize_phone", MethodKind::AnonymizePhone},
    {"anonymize_ssn", MethodKind::AnonymizeSsn},
    {"k_anonymity", MethodKind::KAnonymity},
    {"differential_privacy", MethodKind::DifferentialPrivacy},
    {"remove", MethodKind::Remove},
}};

auto join_path(const std::string& base, std::string_view key) -> std::string {
    if (base.empty()) {
        return std::string(key);
    }
    return base + "." + std::string(key);
}

auto json_type_name(const Json& value) -> std::string {
    return value.type_name();
}

auto wrong_type(const std::string& path, std::string_view expected, const Json& got)
    -> std::unexpected<ConfigError> {
    return std::unexpected(ConfigError{
        .message = "expected " + std::string(expected) + ", got " + json_type_name(got),
        .path = path});
}

auto invalid_value(const std::string& path, std::string message) -> std::unexpected<ConfigError> {
    return std::unexpected(ConfigError{.message = std::move(message), .path = path});
}

// Option readers: a missing key leaves `out` at its default.

auto read_int(const Json& options, const std::string& key, const std::string& path,
              std::int64_t& out) -> std::expected<void, ConfigError> {
    auto it = options.find(key);
    if (it == options.end()) {
        return {};
    }
    const auto full = join_path(path, key);
    if (it->is_number_integer()) {
        out = it->get<std::int64_t>();
        return {};
    }
    if (it->is_number_float()) {
        const double value = it->get<double>();
        if (std::isfinite(value) && value == std::trunc(value) && std::fabs(value) < 9.0e18) {
            out = static_cast<std::int64_t>(value);
            return {};
        }
    }
    return wrong_type(full, "integer", *it);
}

auto read_double(const Json& options, const std::string& key, const std::string& path,
                 double& out) -> std::expected<void, ConfigError> {
    auto it = options.find(key);
    if (it == options.end()) {
        return {};
    }
    if (!it->is_number()) {
        return wrong_type(join_path(path, key), "number", *it);
    }
    out = it->get<double>();
    return {};
}

auto read_bool(const Json& options, const std::string& key, const std::string& path, bool& out)
    -> std::expected<void, ConfigError> {
    auto it = options.find(key);
    if (it == options.end()) {
        return {};
    }
    if (!it->is_boolean()) {
        return wrong_type(join_path(path, key), "boolean", *it);
    }
    out = it->get<bool>();
    return {};
}

auto read_string(const Json& options, const std::string& key, const std::string& path,
                 std::string& out) -> std::expected<void, ConfigError> {
    auto it = options.find(key);
    if (it == options.end()) {
        return {};
    }
    if (!it->is_string()) {
        return wrong_type(join_path(path, key), "string", *it);
    }
    out = it->get<std::string>();
    return {};
}

auto read_string_list(const Json& options, const std::string& key, const std::string& path,
                      std::vector<std::string>& out) -> std::expected<void, ConfigError> {
    auto it = options.find(key);
    if (it == options.end() || it->is_null()) {
        return {};
    }
    const auto full = join_path(path, key);
    if (!it->is_array()) {
        return wrong_type(full, "array", *it);
    }
    out.clear();
    for (const auto& item : *it) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        } else if (item.is_number() || item.is_boolean()) {
            out.push_back(item.dump());
        } else {
            return wrong_type(full + "[]", "string", item);
        }
    }
    return {};
}

auto parse_options(MethodKind kind, const Json& options, const std::string& path,
                   const EngineDefaults& defaults) -> std::expected<MethodOptions, ConfigError> {
    switch (kind) {
        case MethodKind::Hash: {
            HashOptions out;
            std::string algorithm{crypto::hash_algorithm_name(out.algorithm)};
            if (auto r = read_string(options, "algorithm", path, algorithm); !r) {
                return std::unexpected(r.error());
            }
            auto parsed = crypto::parse_hash_algorithm(algorithm);
            if (!parsed) {
                return invalid_value(join_path(path, "algorithm"), parsed.error());
            }
            out.algorithm = *parsed;
            return out;
        }
        case MethodKind::Mask: {
            MaskOptions out;
            if (auto r = read_string(options, "mask_char", path, out.mask_char); !r) {
                return std::unexpected(r.error());
            }
            if (out.mask_char.empty()) {
                return invalid_value(join_path(path, "mask_char"), "mask_char must not be empty");
            }
            if (auto r = read_bool(options, "preserve_length", path, out.preserve_length); !r) {
                return std::unexpected(r.error());
            }
            return out;
        }
        case MethodKind::Pseudonymize: {
            PseudonymizeOptions out;
            if (auto r = read_string(options, "prefix", path, out.prefix); !r) {
                return std::unexpected(r.error());
            }
            return out;
        }
        case MethodKind::Substitute: {
            SubstituteOptions out;
            if (auto r = read_string_list(options, "list", path, out.list); !r) {
                return std::unexpected(r.error());
            }
            if (auto r = read_string(options, "type", path, out.type); !r) {
                return std::unexpected(r.error());
            }
            return out;
        }
        case MethodKind::Perturb: {
            PerturbOptions out;
            std::string type{perturb_kind_name(out.kind)};
            if (auto r = read_string(options, "type", path, type); !r) {
                return std::unexpected(r.error());
            }
            out.kind = parse_perturb_kind(type);
            if (options.contains("range")) {
                double range = 0.0;
                if (auto r = read_double(options, "range", path, range); !r) {
                    return std::unexpected(r.error());
                }
                if (range < 0.0) {
                    return invalid_value(join_path(path, "range"), "range must not be negative");
                }
                out.range = range;
            }
            if (auto r = read_double(options, "percentage", path, out.percentage); !r) {
                return std::unexpected(r.error());
            }
            if (auto r = read_bool(options, "non_negative", path, out.non_negative); !r) {
                return std::unexpected(r.error());
            }
            return out;
        }
        case MethodKind::GeneralizeNumeric: {
            GeneralizeNumericOptions out;
            if (auto r = read_int(options, "bin_size", path, out.bin_size); !r) {
                return std::unexpected(r.error());
            }
            if (out.bin_size <= 0) {
                return invalid_value(join_path(path, "bin_size"), "bin_size must be positive");
            }
            return out;
        }
        case MethodKind::GeneralizeDate: {
            GeneralizeDateOptions out;
            std::string granularity{date_granularity_name(out.granularity)};
            if (auto r = read_string(options, "granularity", path, granularity); !r) {
                return std::unexpected(r.error());
            }
            auto parsed = parse_date_granularity(granularity);
            if (!parsed) {
                return invalid_value(join_path(path, "granularity"),
                                     "unknown date granularity: " + granularity);
            }
            out.granularity = *parsed;
            return out;
        }
        case MethodKind::KAnonymity: {
            KAnonymityOptions out{.k = defaults.k};
            if (auto r = read_int(options, "k", path, out.k); !r) {
                return std::unexpected(r.error());
            }
            if (out.k < 1) {
                return invalid_value(join_path(path, "k"), "k must be at least 1");
            }
            return out;
        }
        case MethodKind::DifferentialPrivacy: {
            DifferentialPrivacyOptions out{.epsilon = defaults.epsilon};
            if (auto r = read_double(options, "epsilon", path, out.epsilon); !r) {
                return std::unexpected(r.error());
            }
            if (!(out.epsilon > 0.0)) {
                return invalid_value(join_path(path, "epsilon"), "epsilon must be positive");
            }
            return out;
        }
        case MethodKind::None:
        case MethodKind::Shuffle:
        case MethodKind::AnonymizeEmail:
        case MethodKind::AnonymizePhone:
        case MethodKind::AnonymizeSsn:
        case MethodKind::Remove:
            break;
    }
    return NoOptions{};
}

auto parse_method_spec(const Json& value, const std::string& path,
                       const ConfigParseOptions& config)
    -> std::expected<MethodSpec, ConfigError> {
    std::string name = "hash";
    const Json empty_options = Json::object();
    const Json* options = &empty_options;

    if (value.is_string()) {
        name = value.get<std::string>();
    } else if (value.is_object()) {
        if (auto r = read_string(value, "method", path, name); !r) {
            return std::unexpected(r.error());
        }
        if (auto it = value.find("options"); it != value.end() && !it->is_null()) {
            if (!it->is_object()) {
                return wrong_type(join_path(path, "options"), "object", *it);
            }
            options = &*it;
        }
    } else {
        return wrong_type(path, "method name or object", value);
    }

    auto kind = parse_method_kind(name);
    if (!kind) {
        if (config.strict_methods) {
            return invalid_value(path, "unknown anonymization method '" + name + "'");
        }
        spdlog::debug("column '{}': unknown method '{}', falling back to hash", path, name);
        auto spec = MethodSpec::with_defaults(MethodKind::Hash, config.defaults);
        spec.requested = std::move(name);
        return spec;
    }

    auto parsed =
        parse_options(*kind, *options, join_path(path, "options"), config.defaults);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    return MethodSpec{.kind = *kind, .options = std::move(*parsed), .requested = std::move(name)};
}

auto parse_columns(const Json& sheet, const std::string& path, const ConfigParseOptions& options)
    -> std::expected<ColumnConfig, ConfigError> {
    if (!sheet.is_object()) {
        return wrong_type(path, "object of column rules", sheet);
    }
    ColumnConfig columns;
    columns.reserve(sheet.size());
    for (const auto& [column, value] : sheet.items()) {
        auto spec = parse_method_spec(value, join_path(path, column), options);
        if (!spec) {
            return std::unexpected(spec.error());
        }
        columns.push_back(ColumnRule{.column = column, .spec = std::move(*spec)});
    }
    return columns;
}

auto parse_json(std::string_view text) -> std::expected<Json, ConfigError> {
    try {
        return Json::parse(text);
    } catch (const Json::parse_error& e) {
        return std::unexpected(ConfigError{.message = e.what(), .path = {}});
    }
}

auto parse_env_int(const char* text) -> std::optional<std::int64_t> {
    std::string_view view{text};
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(view.data(), view.data() + view.size(), value);
    if (ec != std::errc() || ptr != view.data() + view.size()) {
        return std::nullopt;
    }
    return value;
}

auto parse_env_double(const char* text) -> std::optional<double> {
    char* end = nullptr;
    const double value = std::strtod(text, &end);
    if (end == text || *end != '\0' || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

auto method_kind_name(MethodKind kind) noexcept -> std::string_view {
    for (const auto& entry : kMethodNames) {
        if (entry.kind == kind) {
            return entry.name;
        }
    }
    return "unknown";
}

auto parse_method_kind(std::string_view name) -> std::optional<MethodKind> {
    for (const auto& entry : kMethodNames) {
        if (entry.name == name) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

auto is_aggregate(MethodKind kind) noexcept -> bool {
    return kind == MethodKind::Shuffle || kind == MethodKind::KAnonymity;
}

auto EngineDefaults::from_env() -> EngineDefaults {
    EngineDefaults defaults;
    if (const char* env = std::getenv("SHROUD_DEFAULT_K")) {
        auto k = parse_env_int(env);
        if (k && *k >= 1) {
            defaults.k = *k;
        } else {
            spdlog::warn("ignoring SHROUD_DEFAULT_K='{}': expected an integer >= 1", env);
        }
    }
    if (const char* env = std::getenv("SHROUD_DEFAULT_EPSILON")) {
        auto epsilon = parse_env_double(env);
        if (epsilon && *epsilon > 0.0) {
            defaults.epsilon = *epsilon;
        } else {
            spdlog::warn("ignoring SHROUD_DEFAULT_EPSILON='{}': expected a positive number", env);
        }
    }
    return defaults;
}

auto MethodSpec::with_defaults(MethodKind kind, const EngineDefaults& defaults) -> MethodSpec {
    auto options = parse_options(kind, Json::object(), {}, defaults);
    return MethodSpec{.kind = kind,
                      .options = options ? std::move(*options) : MethodOptions{NoOptions{}},
                      .requested = std::string(method_kind_name(kind))};
}

void MaskingConfig::set_sheet(std::string sheet, ColumnConfig columns) {
    for (auto& entry : sheets_) {
        if (entry.first == sheet) {
            entry.second = std::move(columns);
            return;
        }
    }
    sheets_.emplace_back(std::move(sheet), std::move(columns));
}

auto MaskingConfig::find(std::string_view sheet) const -> const ColumnConfig* {
    for (const auto& entry : sheets_) {
        if (entry.first == sheet) {
            return &entry.second;
        }
    }
    return nullptr;
}

auto MaskingConfig::sheet_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(sheets_.size());
    for (const auto& entry : sheets_) {
        names.push_back(entry.first);
    }
    return names;
}

auto ConfigError::format() const -> std::string {
    if (path.empty()) {
        return "invalid masking config: " + message;
    }
    return "invalid masking config at '" + path + "': " + message;
}

auto parse_masking_config(std::string_view json, const ConfigParseOptions& options)
    -> ConfigResult {
    auto root = parse_json(json);
    if (!root) {
        return std::unexpected(root.error());
    }
    if (!root->is_object()) {
        return wrong_type({}, "object of sheets", *root);
    }
    MaskingConfig config;
    for (const auto& [sheet, columns] : root->items()) {
        auto parsed = parse_columns(columns, sheet, options);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        config.set_sheet(sheet, std::move(*parsed));
    }
    return config;
}

auto parse_column_config(std::string_view json, const ConfigParseOptions& options)
    -> std::expected<ColumnConfig, ConfigError> {
    auto root = parse_json(json);
    if (!root) {
        return std::unexpected(root.error());
    }
    return parse_columns(*root, {}, options);
}

}  // namespace shroud::engine
