#include <shroud/engine/aggregate.hpp>

#include <numeric>
#include <stdexcept>
#include <utility>
#include <vector>

namespace shroud::engine {

auto shuffle_column(const runtime::ColumnEntry& entry, crypto::SecureRandom& rng)
    -> runtime::ColumnEntry {
    const std::size_t n = runtime::column_size(*entry.column);
    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), std::size_t{0});
    for (std::size_t i = n; i > 1; --i) {
        std::swap(order[i - 1], order[rng.uniform_index(i)]);
    }

    runtime::ColumnEntry out{.name = entry.name, .column = nullptr, .validity = std::nullopt};
    out.column = std::make_shared<runtime::ColumnValue>(std::visit(
        [&](const auto& col) -> runtime::ColumnValue { return col.take(order); }, *entry.column));
    if (entry.validity.has_value()) {
        std::vector<bool> validity(n);
        for (std::size_t row = 0; row < n; ++row) {
            validity[row] = (*entry.validity)[order[row]];
        }
        out.validity = std::move(validity);
    }
    return out;
}

auto value_frequencies(const runtime::ColumnEntry& entry)
    -> std::unordered_map<std::string, std::size_t> {
    std::unordered_map<std::string, std::size_t> counts;
    const std::size_t n = runtime::column_size(*entry.column);
    for (std::size_t row = 0; row < n; ++row) {
        if (runtime::is_null(entry, row)) {
            continue;
        }
        ++counts[runtime::format_scalar(runtime::scalar_at(*entry.column, row))];
    }
    return counts;
}

auto k_anonymity_suppress(const runtime::ColumnEntry& entry, std::int64_t k)
    -> runtime::ColumnEntry {
    if (k < 1) {
        throw std::invalid_argument("k must be at least 1");
    }
    const auto counts = value_frequencies(entry);
    const auto threshold = static_cast<std::size_t>(k);

    bool any_rare = false;
    for (const auto& [value, count] : counts) {
        any_rare = any_rare || count < threshold;
    }
    if (!any_rare) {
        return entry;
    }

    const std::size_t n = runtime::column_size(*entry.column);
    Column<std::string> out;
    out.reserve(n);
    for (std::size_t row = 0; row < n; ++row) {
        if (runtime::is_null(entry, row)) {
            out.push_back(std::string{});
            continue;
        }
        auto text = runtime::format_scalar(runtime::scalar_at(*entry.column, row));
        if (counts.at(text) < threshold) {
            out.push_back(std::string(kSuppressed));
        } else {
            out.push_back(std::move(text));
        }
    }
    return runtime::ColumnEntry{.name = entry.name,
                                .column = std::make_shared<runtime::ColumnValue>(std::move(out)),
                                .validity = entry.validity};
}

}  // namespace shroud::engine
