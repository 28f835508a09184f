#include <shroud/crypto/digest.hpp>

#include <openssl/err.h>
#include <openssl/evp.h>

#include <array>
#include <memory>
#include <stdexcept>

namespace shroud::crypto {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

auto evp_md(HashAlgorithm algorithm) -> const EVP_MD* {
    switch (algorithm) {
        case HashAlgorithm::Sha256:
            return EVP_sha256();
        case HashAlgorithm::Sha512:
            return EVP_sha512();
        case HashAlgorithm::Md5:
            return EVP_md5();
    }
    return nullptr;
}

[[noreturn]] void throw_openssl_error(const char* what) {
    unsigned long err = ERR_get_error();
    std::array<char, 256> buffer{};
    ERR_error_string_n(err, buffer.data(), buffer.size());
    throw std::runtime_error(std::string(what) + ": " + buffer.data());
}

}  // namespace

auto parse_hash_algorithm(std::string_view name) -> std::expected<HashAlgorithm, std::string> {
    if (name == "sha256") {
        return HashAlgorithm::Sha256;
    }
    if (name == "sha512") {
        return HashAlgorithm::Sha512;
    }
    if (name == "md5") {
        return HashAlgorithm::Md5;
    }
    return std::unexpected("unsupported hash algorithm: " + std::string(name));
}

auto hash_algorithm_name(HashAlgorithm algorithm) noexcept -> std::string_view {
    switch (algorithm) {
        case HashAlgorithm::Sha256:
            return "sha256";
        case HashAlgorithm::Sha512:
            return "sha512";
        case HashAlgorithm::Md5:
            return "md5";
    }
    return "unknown";
}

auto hex_digest_length(HashAlgorithm algorithm) noexcept -> std::size_t {
    switch (algorithm) {
        case HashAlgorithm::Sha256:
            return 64;
        case HashAlgorithm::Sha512:
            return 128;
        case HashAlgorithm::Md5:
            return 32;
    }
    return 0;
}

auto hex_digest(HashAlgorithm algorithm, std::string_view data) -> std::string {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx{EVP_MD_CTX_new()};
    if (ctx == nullptr) {
        throw_openssl_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), evp_md(algorithm), nullptr) != 1) {
        throw_openssl_error("EVP_DigestInit_ex failed");
    }
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw_openssl_error("EVP_DigestUpdate failed");
    }
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
        throw_openssl_error("EVP_DigestFinal_ex failed");
    }

    static constexpr std::string_view kHex = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<std::size_t>(length) * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out.push_back(kHex[digest[i] >> 4]);
        out.push_back(kHex[digest[i] & 0x0f]);
    }
    return out;
}

}  // namespace shroud::crypto
