#include <shroud/crypto/secure_random.hpp>

#include <openssl/err.h>
#include <openssl/rand.h>

#include <array>
#include <cstring>
#include <random>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace shroud::crypto {

void SecureRandom::fill(std::span<unsigned char> out) {
    if (out.empty()) {
        return;
    }
    if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed with OpenSSL error " +
                                 std::to_string(ERR_get_error()));
    }
}

auto SecureRandom::operator()() -> result_type {
    std::array<unsigned char, sizeof(result_type)> buffer{};
    fill(buffer);
    result_type value = 0;
    std::memcpy(&value, buffer.data(), sizeof(value));
    return value;
}

auto SecureRandom::uniform_index(std::size_t bound) -> std::size_t {
    if (bound == 0) {
        throw std::invalid_argument("uniform_index: bound must be non-zero");
    }
    std::uniform_int_distribution<std::size_t> dist(0, bound - 1);
    return dist(*this);
}

auto SecureRandom::uniform_real(double lo, double hi) -> double {
    if (hi < lo) {
        std::swap(lo, hi);
    }
    if (lo == hi) {
        return lo;
    }
    // 53 random mantissa bits give a uniform value in [0, 1).
    const double unit = static_cast<double>((*this)() >> 11) * 0x1.0p-53;
    return lo + (hi - lo) * unit;
}

auto SecureRandom::gaussian(double mean, double stddev) -> double {
    if (!(stddev > 0.0)) {
        return mean;
    }
    std::normal_distribution<double> dist(mean, stddev);
    return dist(*this);
}

auto generate_salt(SecureRandom& rng, std::size_t length) -> std::string {
    static constexpr std::string_view kAlphabet =
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    std::string salt;
    salt.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        salt.push_back(kAlphabet[rng.uniform_index(kAlphabet.size())]);
    }
    return salt;
}

}  // namespace shroud::crypto
