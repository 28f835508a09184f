#pragma once

#include <shroud/crypto/secure_random.hpp>
#include <shroud/runtime/table.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>

namespace shroud::engine {

inline constexpr std::string_view kSuppressed = "[SUPPRESSED]";

/// Uniformly random permutation of a whole column (Fisher-Yates).
///
/// The multiset of values, nulls included, is preserved exactly; only the
/// row each value sits on changes.
[[nodiscard]] auto shuffle_column(const runtime::ColumnEntry& entry, crypto::SecureRandom& rng)
    -> runtime::ColumnEntry;

/// Occurrence count of every distinct non-null value, keyed by its
/// canonical text form.
[[nodiscard]] auto value_frequencies(const runtime::ColumnEntry& entry)
    -> std::unordered_map<std::string, std::size_t>;

/// Replace every occurrence of a value seen fewer than `k` times with
/// kSuppressed. Nulls are neither counted nor replaced.
///
/// The column becomes a string column as soon as one value is suppressed;
/// otherwise it is returned with its original type.
[[nodiscard]] auto k_anonymity_suppress(const runtime::ColumnEntry& entry, std::int64_t k)
    -> runtime::ColumnEntry;

}  // namespace shroud::engine
