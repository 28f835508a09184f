#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace shroud::crypto {

enum class HashAlgorithm : std::uint8_t {
    Sha256,
    Sha512,
    Md5,
};

/// Resolve `sha256`, `sha512` or `md5` (case-sensitive).
[[nodiscard]] auto parse_hash_algorithm(std::string_view name)
    -> std::expected<HashAlgorithm, std::string>;

[[nodiscard]] auto hash_algorithm_name(HashAlgorithm algorithm) noexcept -> std::string_view;

/// Length in characters of the hex digest produced by `algorithm`.
[[nodiscard]] auto hex_digest_length(HashAlgorithm algorithm) noexcept -> std::size_t;

/// Lowercase hex digest of `data`. Throws std::runtime_error if OpenSSL fails.
[[nodiscard]] auto hex_digest(HashAlgorithm algorithm, std::string_view data) -> std::string;

}  // namespace shroud::crypto
