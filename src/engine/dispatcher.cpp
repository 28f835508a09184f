#include <shroud/engine/dispatcher.hpp>

#include <shroud/engine/aggregate.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <stdexcept>
#include <type_traits>

namespace shroud::engine {

namespace {

// Run `func` on every non-null cell; nulls stay null.
template <typename F>
auto map_cells(const runtime::ColumnEntry& entry, F&& func) -> runtime::ColumnEntry {
    const std::size_t n = runtime::column_size(*entry.column);
    std::vector<ScalarValue> values;
    values.reserve(n);
    for (std::size_t row = 0; row < n; ++row) {
        if (runtime::is_null(entry, row)) {
            values.emplace_back(std::string{});
            continue;
        }
        values.emplace_back(func(runtime::scalar_at(*entry.column, row)));
    }
    return runtime::ColumnEntry{
        .name = entry.name,
        .column = std::make_shared<runtime::ColumnValue>(
            runtime::column_from_scalars(values, entry.validity)),
        .validity = entry.validity};
}

template <typename Options>
auto options_of(const MethodSpec& spec) -> const Options& {
    const auto* options = std::get_if<Options>(&spec.options);
    if (options == nullptr) {
        throw std::logic_error("options do not match method " +
                               std::string(method_kind_name(spec.kind)));
    }
    return *options;
}

}  // namespace

auto column_outcome_name(ColumnOutcome outcome) noexcept -> std::string_view {
    switch (outcome) {
        case ColumnOutcome::Applied:
            return "applied";
        case ColumnOutcome::Skipped:
            return "skipped";
        case ColumnOutcome::Removed:
            return "removed";
        case ColumnOutcome::Missing:
            return "missing";
    }
    return "unknown";
}

auto transform_column(const runtime::ColumnEntry& entry, const MethodSpec& spec,
                      const TransformContext& context) -> runtime::ColumnEntry {
    const auto& hasher = context.hasher;
    auto& rng = context.rng;

    switch (spec.kind) {
        case MethodKind::None:
            return entry;
        case MethodKind::Hash: {
            const auto& options = options_of<HashOptions>(spec);
            return map_cells(entry, [&](const ScalarValue& v) -> ScalarValue {
                return hasher.hash_value(v, options);
            });
        }
        case MethodKind::Mask: {
            const auto& options = options_of<MaskOptions>(spec);
            return map_cells(entry, [&](const ScalarValue& v) -> ScalarValue {
                return mask_value(v, options);
            });
        }
        case MethodKind::Pseudonymize: {
            const auto& options = options_of<PseudonymizeOptions>(spec);
            return map_cells(entry, [&](const ScalarValue& v) -> ScalarValue {
                return hasher.pseudonymize(v, options);
            });
        }
        case MethodKind::Substitute: {
            const auto& options = options_of<SubstituteOptions>(spec);
            return map_cells(entry, [&](const ScalarValue&) -> ScalarValue {
                return substitute_value(options, rng);
            });
        }
        case MethodKind::Shuffle:
            return shuffle_column(entry, rng);
        case MethodKind::Perturb: {
            const auto& options = options_of<PerturbOptions>(spec);
            return map_cells(
                entry, [&](const ScalarValue& v) { return perturb_value(v, options, rng); });
        }
        case MethodKind::GeneralizeNumeric: {
            const auto& options = options_of<GeneralizeNumericOptions>(spec);
            return map_cells(entry, [&](const ScalarValue& v) -> ScalarValue {
                return generalize_numeric(v, options.bin_size);
            });
        }
        case MethodKind::GeneralizeDate: {
            const auto& options = options_of<GeneralizeDateOptions>(spec);
            return map_cells(entry, [&](const ScalarValue& v) -> ScalarValue {
                return generalize_date(v, options.granularity);
            });
        }
        case MethodKind::AnonymizeEmail:
            return map_cells(entry, [&](const ScalarValue& v) -> ScalarValue {
                return hasher.anonymize_email(v);
            });
        case MethodKind::AnonymizePhone:
            return map_cells(entry, [&](const ScalarValue& v) -> ScalarValue {
                return hasher.anonymize_phone(v);
            });
        case MethodKind::AnonymizeSsn:
            return map_cells(entry, [&](const ScalarValue& v) -> ScalarValue {
                return hasher.anonymize_ssn(v);
            });
        case MethodKind::KAnonymity:
            return k_anonymity_suppress(entry, options_of<KAnonymityOptions>(spec).k);
        case MethodKind::DifferentialPrivacy: {
            const auto& options = options_of<DifferentialPrivacyOptions>(spec);
            return map_cells(
                entry, [&](const ScalarValue& v) { return add_privacy_noise(v, options, rng); });
        }
        case MethodKind::Remove:
            break;
    }
    throw std::logic_error("method " + std::string(method_kind_name(spec.kind)) +
                           " is not a value transformation");
}

auto apply_column_config(const runtime::Table& table, const ColumnConfig& columns,
                         const TransformContext& context) -> SheetResult {
    SheetResult result{.table = table, .columns = {}};
    result.columns.reserve(columns.size());

    for (const auto& rule : columns) {
        ColumnReport report{.column = rule.column,
                            .method = rule.spec.kind,
                            .requested = rule.spec.requested,
                            .outcome = ColumnOutcome::Applied,
                            .reason = {}};

        const auto* entry = result.table.find_entry(rule.column);
        if (entry == nullptr) {
            spdlog::debug("[{}] column '{}' not present, rule '{}' ignored", context.sheet,
                          rule.column, rule.spec.requested);
            report.outcome = ColumnOutcome::Missing;
            result.columns.push_back(std::move(report));
            continue;
        }

        if (rule.spec.kind == MethodKind::Remove) {
            result.table.remove_column(rule.column);
            report.outcome = ColumnOutcome::Removed;
            spdlog::debug("[{}] column '{}' removed", context.sheet, rule.column);
            result.columns.push_back(std::move(report));
            continue;
        }

        try {
            result.table.put_entry(transform_column(*entry, rule.spec, context));
            spdlog::debug("[{}] column '{}' anonymized with {} ({})", context.sheet, rule.column,
                          method_kind_name(rule.spec.kind),
                          is_aggregate(rule.spec.kind) ? "whole column" : "per cell");
        } catch (const std::exception& e) {
            spdlog::warn("[{}] error processing column '{}' with method '{}': {}; column left "
                         "unmodified",
                         context.sheet, rule.column, rule.spec.requested, e.what());
            report.outcome = ColumnOutcome::Skipped;
            report.reason = e.what();
        }
        result.columns.push_back(std::move(report));
    }
    return result;
}

}  // namespace shroud::engine
