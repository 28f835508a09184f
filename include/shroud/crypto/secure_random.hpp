#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string>
#include <vector>

namespace shroud::crypto {

/// Cryptographically secure random source backed by OpenSSL's RAND_bytes.
///
/// Satisfies UniformRandomBitGenerator, so it can drive the <random>
/// distributions directly. It keeps no state of its own, so one instance
/// can be shared by every worker thread.
class SecureRandom {
   public:
    using result_type = std::uint64_t;

    SecureRandom() = default;

    [[nodiscard]] static constexpr auto min() noexcept -> result_type { return 0; }
    [[nodiscard]] static constexpr auto max() noexcept -> result_type {
        return std::numeric_limits<result_type>::max();
    }

    /// Throws std::runtime_error when the OpenSSL generator fails.
    auto operator()() -> result_type;

    void fill(std::span<unsigned char> out);

    /// Uniform integer in [0, bound). `bound` must be non-zero.
    [[nodiscard]] auto uniform_index(std::size_t bound) -> std::size_t;

    /// Uniform real in [lo, hi); the bounds may be given in either order.
    [[nodiscard]] auto uniform_real(double lo, double hi) -> double;

    /// Normal variate; a non-positive `stddev` yields `mean` exactly.
    [[nodiscard]] auto gaussian(double mean, double stddev) -> double;

    template <typename T>
    [[nodiscard]] auto pick(const std::vector<T>& items) -> const T& {
        return items[uniform_index(items.size())];
    }
};

/// Random alphanumeric salt of `length` characters.
[[nodiscard]] auto generate_salt(SecureRandom& rng, std::size_t length = 32) -> std::string;

}  // namespace shroud::crypto
