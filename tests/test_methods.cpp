#include <shroud/engine/methods.hpp>

#include <catch2/catch_test_macros.hpp>
#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <iterator>
#include <limits>
#include <string>

using namespace shroud::engine;
using shroud::crypto::HashAlgorithm;
using shroud::crypto::SecureRandom;

namespace {

auto digits_of(const std::string& text) -> std::string {
    std::string out;
    std::ranges::copy_if(text, std::back_inserter(out),
                         [](unsigned char c) { return std::isdigit(c) != 0; });
    return out;
}

// True when `out` has the same length as `in` and every non-digit of `in`
// sits unchanged at the same position.
auto same_shape(const std::string& in, const std::string& out) -> bool {
    if (in.size() != out.size()) {
        return false;
    }
    for (std::size_t i = 0; i < in.size(); ++i) {
        const bool in_digit = std::isdigit(static_cast<unsigned char>(in[i])) != 0;
        const bool out_digit = std::isdigit(static_cast<unsigned char>(out[i])) != 0;
        if (in_digit != out_digit || (!in_digit && in[i] != out[i])) {
            return false;
        }
    }
    return true;
}

auto parse_bin(const std::string& bin) -> std::pair<std::int64_t, std::int64_t> {
    // "start-end" where either bound may be negative
    const auto dash = bin.find('-', 1);
    std::int64_t start = 0;
    std::int64_t end = 0;
    std::from_chars(bin.data(), bin.data() + dash, start);
    std::from_chars(bin.data() + dash + 1, bin.data() + bin.size(), end);
    return {start, end};
}

}  // namespace

// ─── hash / pseudonymize ─────────────────────────────────────────────────────

TEST_CASE("hash is a salted deterministic hex digest", "[methods][hash]") {
    Hasher hasher("default_salt");

    auto first = hasher.hash_value(std::string("alice@example.com"), {});
    auto second = hasher.hash_value(std::string("alice@example.com"), {});
    REQUIRE(first == second);
    REQUIRE(first.size() == 64);
    REQUIRE(std::ranges::all_of(first, [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    }));

    REQUIRE(hasher.hash_value(std::string("Alice"), {}) ==
            "ebafa936a6eb871d4640c1d4b4ab14934c0a9b977598f1cc35480c344d79eb17");
    REQUIRE(hasher.hash_value(std::string("Bob"), {}) != first);
}

TEST_CASE("hash depends on salt and algorithm", "[methods][hash]") {
    Hasher a("salt-a");
    Hasher b("salt-b");
    REQUIRE(a.hash("value") != b.hash("value"));
    REQUIRE(a.hash_value(std::string("value"), {.algorithm = HashAlgorithm::Md5}).size() == 32);
    REQUIRE(a.hash_value(std::string("value"), {.algorithm = HashAlgorithm::Sha512}).size() ==
            128);
}

TEST_CASE("hash coerces numbers through their text form", "[methods][hash]") {
    Hasher hasher("s");
    REQUIRE(hasher.hash_value(std::int64_t{42}, {}) == hasher.hash("42"));
    REQUIRE(hasher.hash_value(42.0, {}) == hasher.hash("42.0"));
}

TEST_CASE("pseudonymize prefixes eight hex digits", "[methods][pseudonymize]") {
    Hasher hasher("default_salt");
    REQUIRE(hasher.pseudonymize(std::string("Alice"), {}) == "ID_ebafa936");
    REQUIRE(hasher.pseudonymize(std::string("Alice"), {.prefix = "EMP"}) == "EMP_ebafa936");
    REQUIRE(hasher.pseudonymize(std::string("Alice"), {}) ==
            hasher.pseudonymize(std::string("Alice"), {}));
}

// ─── mask ────────────────────────────────────────────────────────────────────

TEST_CASE("mask replaces characters", "[methods][mask]") {
    REQUIRE(mask_value(std::string("secret"), {}) == "******");
    REQUIRE(mask_value(std::string("secret"), {.mask_char = "#", .preserve_length = true}) ==
            "######");
    REQUIRE(mask_value(std::string("secret"), {.mask_char = "*", .preserve_length = false}) ==
            "s****t");
    REQUIRE(mask_value(std::string("ab"), {.mask_char = "*", .preserve_length = false}) == "**");
    REQUIRE(mask_value(std::int64_t{12345}, {}) == "*****");
    REQUIRE(mask_value(std::string(""), {}).empty());
}

TEST_CASE("mask counts characters, not bytes", "[methods][mask]") {
    const MaskOptions keep_length{.mask_char = "*", .preserve_length = true};
    const MaskOptions keep_ends{.mask_char = "*", .preserve_length = false};
    REQUIRE(mask_value(std::string("Zo\xc3\xab"), keep_length) == "***");
    REQUIRE(mask_value(std::string("Zo\xc3\xab"), keep_ends) == "Z*\xc3\xab");
    // 王小明
    const std::string name = "\xe7\x8e\x8b\xe5\xb0\x8f\xe6\x98\x8e";
    REQUIRE(mask_value(name, keep_length) == "***");
    REQUIRE(mask_value(name, keep_ends) == "\xe7\x8e\x8b*\xe6\x98\x8e");
    REQUIRE(mask_value(std::string("\xc3\xa9t\xc3\xa9"), {.mask_char = "\xe2\x80\xa2"}) ==
            "\xe2\x80\xa2\xe2\x80\xa2\xe2\x80\xa2");
}

// ─── generalize_numeric ──────────────────────────────────────────────────────

TEST_CASE("generalize_numeric bins integers", "[methods][generalize]") {
    REQUIRE(generalize_numeric(std::int64_t{25}, 10) == "20-29");
    REQUIRE(generalize_numeric(std::int64_t{23}, 5) == "20-24");
    REQUIRE(generalize_numeric(std::int64_t{0}, 10) == "0-9");
    REQUIRE(generalize_numeric(std::int64_t{-5}, 10) == "-10--1");
}

TEST_CASE("generalize_numeric bins contain their value", "[methods][generalize]") {
    for (std::int64_t bin : {1, 3, 7, 10, 100}) {
        for (std::int64_t v = -250; v <= 250; v += 13) {
            auto [start, end] = parse_bin(generalize_numeric(v, bin));
            REQUIRE(start <= v);
            REQUIRE(v <= end);
            REQUIRE(end - start + 1 == bin);
        }
    }
}

TEST_CASE("generalize_numeric floors doubles", "[methods][generalize]") {
    REQUIRE(generalize_numeric(25.7, 10) == "20-29");
    REQUIRE(generalize_numeric(-0.5, 10) == "-10--1");
}

TEST_CASE("generalize_numeric edge cases", "[methods][generalize]") {
    REQUIRE(generalize_numeric(std::string("n/a"), 10) == "n/a");
    REQUIRE_THROWS_AS(generalize_numeric(std::numeric_limits<double>::quiet_NaN(), 10),
                      std::out_of_range);
    REQUIRE_THROWS_AS(generalize_numeric(std::numeric_limits<std::int64_t>::max(), 10),
                      std::out_of_range);
    REQUIRE_THROWS_AS(generalize_numeric(std::int64_t{5}, 0), std::invalid_argument);
}

TEST_CASE("generalize_numeric at the 64-bit limits", "[methods][generalize]") {
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
    REQUIRE(generalize_numeric(kMax, 1) == fmt::format("{}-{}", kMax, kMax));
    REQUIRE(generalize_numeric(kMin, 1) == fmt::format("{}-{}", kMin, kMin));
    REQUIRE(generalize_numeric(kMin, 2) == fmt::format("{}-{}", kMin, kMin + 1));
    REQUIRE_THROWS_AS(generalize_numeric(kMin, 10), std::out_of_range);
    REQUIRE_THROWS_AS(generalize_numeric(kMax - 3, 10), std::out_of_range);
    REQUIRE(generalize_numeric(std::int64_t{-9223372036854775800}, 10) ==
            "-9223372036854775800--9223372036854775791");
}

// ─── generalize_date ─────────────────────────────────────────────────────────

TEST_CASE("generalize_date coarsens ISO dates", "[methods][generalize]") {
    const std::string date = "2023-05-15";
    REQUIRE(generalize_date(date, DateGranularity::Quarter) == "2023-Q2");
    REQUIRE(generalize_date(date, DateGranularity::Month) == "2023-05");
    REQUIRE(generalize_date(date, DateGranularity::Year) == "2023");
}

TEST_CASE("generalize_date granularities nest", "[methods][generalize]") {
    for (const std::string date : {"2021-01-31", "2022-06-30", "2020-11-02", "1999-12-31"}) {
        const auto year = generalize_date(date, DateGranularity::Year);
        const auto month = generalize_date(date, DateGranularity::Month);
        const auto quarter = generalize_date(date, DateGranularity::Quarter);
        REQUIRE(month.starts_with(year + "-"));
        REQUIRE(quarter.starts_with(year + "-Q"));
    }
}

TEST_CASE("generalize_date accepts the other layouts", "[methods][generalize]") {
    REQUIRE(generalize_date(std::string("05/15/2023"), DateGranularity::Month) == "2023-05");
    REQUIRE(generalize_date(std::string("15/05/2023"), DateGranularity::Month) == "2023-05");
    REQUIRE(generalize_date(std::string("2023-05-15 10:30:00"), DateGranularity::Year) ==
            "2023");
    REQUIRE(generalize_date(std::string("2023-05-15T10:30:00"), DateGranularity::Quarter) ==
            "2023-Q2");
    REQUIRE(generalize_date(shroud::make_date(2020, 12, 1), DateGranularity::Quarter) ==
            "2020-Q4");
}

TEST_CASE("generalize_date resolves ambiguous slash dates as US", "[methods][generalize]") {
    REQUIRE(generalize_date(std::string("03/04/2023"), DateGranularity::Month) == "2023-03");
}

TEST_CASE("generalize_date passes through unparseable input", "[methods][generalize]") {
    REQUIRE(generalize_date(std::string("not a date"), DateGranularity::Year) == "not a date");
    REQUIRE(generalize_date(std::string("2023-02-30"), DateGranularity::Year) == "2023-02-30");
    REQUIRE(generalize_date(std::int64_t{20230515}, DateGranularity::Year) == "20230515");
}

// ─── email / phone / ssn ─────────────────────────────────────────────────────

TEST_CASE("anonymize_email", "[methods][email]") {
    Hasher hasher("default_salt");

    SECTION("public domains are kept") {
        REQUIRE(hasher.anonymize_email(std::string("jane@gmail.com")) ==
                "user9bac1ebb@gmail.com");
    }

    SECTION("private domains are replaced but keep their TLD") {
        REQUIRE(hasher.anonymize_email(std::string("john.doe@acme.io")) ==
                "user3d0c0209@companyfeb88c.io");
    }

    SECTION("values without @ are returned as-is") {
        REQUIRE(hasher.anonymize_email(std::string("not-an-email")) == "not-an-email");
        REQUIRE(hasher.anonymize_email(std::int64_t{7}) == "7");
    }

    SECTION("domains without a dot are kept") {
        auto out = hasher.anonymize_email(std::string("root@localhost"));
        REQUIRE(out.starts_with("user"));
        REQUIRE(out.ends_with("@localhost"));
    }
}

TEST_CASE("anonymize_phone preserves the format", "[methods][phone]") {
    Hasher hasher("default_salt");
    const std::string phone = "(555) 123-4567";

    auto out = hasher.anonymize_phone(phone);
    REQUIRE(out == "(757) 660-0810");
    REQUIRE(same_shape(phone, out));
    REQUIRE(digits_of(out) != digits_of(phone));
    REQUIRE(hasher.anonymize_phone(phone) == out);

    for (const std::string input :
         {"+1-202-555-0143", "555.123.4567", "0044 20 7946 0958", "1234567"}) {
        REQUIRE(same_shape(input, hasher.anonymize_phone(input)));
    }
}

TEST_CASE("anonymize_phone handles short and long inputs", "[methods][phone]") {
    Hasher hasher("default_salt");
    REQUIRE(hasher.anonymize_phone(std::string("12-34")) == "12-34");

    const std::string long_number(40, '9');
    auto out = hasher.anonymize_phone(long_number);
    REQUIRE(same_shape(long_number, out));

    auto numeric = hasher.anonymize_phone(std::int64_t{5551234567});
    REQUIRE(numeric == hasher.anonymize_phone(std::string("5551234567")));
}

TEST_CASE("anonymize_ssn", "[methods][ssn]") {
    Hasher hasher("default_salt");

    REQUIRE(hasher.anonymize_ssn(std::string("123-45-6789")) == "171-51-0444");
    REQUIRE(hasher.anonymize_ssn(std::string("123456789")) == "411137875");
    REQUIRE(hasher.anonymize_ssn(std::int64_t{123456789}) == "411137875");

    SECTION("dashed input keeps its shape") {
        for (const std::string ssn : {"000-00-0000", "987-65-4321", "555-12-3456"}) {
            REQUIRE(same_shape(ssn, hasher.anonymize_ssn(ssn)));
        }
    }

    SECTION("other input gets the dashed layout") {
        auto out = hasher.anonymize_ssn(std::string("unknown"));
        REQUIRE(out.size() == 11);
        REQUIRE(out[3] == '-');
        REQUIRE(out[6] == '-');
    }
}

// ─── randomized methods ──────────────────────────────────────────────────────

TEST_CASE("substitute draws from the configured candidates", "[methods][substitute]") {
    SecureRandom rng;

    SubstituteOptions explicit_list{.list = {"x", "y"}, .type = "names"};
    for (int i = 0; i < 50; ++i) {
        auto v = substitute_value(explicit_list, rng);
        REQUIRE((v == "x" || v == "y"));
    }

    const auto* names = substitution_candidates("names");
    REQUIRE(names != nullptr);
    REQUIRE(names->size() == 10);
    SubstituteOptions by_type{.list = {}, .type = "names"};
    for (int i = 0; i < 50; ++i) {
        REQUIRE(std::ranges::find(*names, substitute_value(by_type, rng)) != names->end());
    }

    REQUIRE(substitute_value({.list = {}, .type = "planets"}, rng) == kRedacted);
    REQUIRE(substitution_candidates("planets") == nullptr);
}

TEST_CASE("perturb keeps noise within range", "[methods][perturb]") {
    SecureRandom rng;

    PerturbOptions uniform{.kind = PerturbKind::Uniform, .range = 5.0};
    for (int i = 0; i < 200; ++i) {
        auto v = std::get<double>(perturb_value(100.0, uniform, rng));
        REQUIRE(v >= 95.0);
        REQUIRE(v <= 105.0);
    }

    PerturbOptions pct{.kind = PerturbKind::Percentage, .percentage = 10.0};
    for (int i = 0; i < 200; ++i) {
        auto v = std::get<double>(perturb_value(200.0, pct, rng));
        REQUIRE(v >= 180.0);
        REQUIRE(v <= 220.0);
    }
}

TEST_CASE("perturb preserves value kinds", "[methods][perturb]") {
    SecureRandom rng;

    auto as_int = perturb_value(std::int64_t{1000}, {}, rng);
    REQUIRE(std::holds_alternative<std::int64_t>(as_int));
    REQUIRE(std::get<std::int64_t>(as_int) >= 900);
    REQUIRE(std::get<std::int64_t>(as_int) <= 1100);

    REQUIRE(std::get<std::string>(perturb_value(std::string("abc"), {}, rng)) == "abc");

    PerturbOptions clamp{.kind = PerturbKind::Uniform, .range = 50.0, .non_negative = true};
    for (int i = 0; i < 100; ++i) {
        REQUIRE(std::get<double>(perturb_value(1.0, clamp, rng)) >= 0.0);
    }

    PerturbOptions gaussian{.kind = PerturbKind::Gaussian, .range = 0.0};
    REQUIRE(std::get<double>(perturb_value(7.5, gaussian, rng)) == 7.5);
}

TEST_CASE("parse_perturb_kind falls back to uniform", "[methods][perturb]") {
    REQUIRE(parse_perturb_kind("gaussian") == PerturbKind::Gaussian);
    REQUIRE(parse_perturb_kind("percentage") == PerturbKind::Percentage);
    REQUIRE(parse_perturb_kind("laplace") == PerturbKind::Uniform);
}

TEST_CASE("differential privacy noise", "[methods][dp]") {
    SecureRandom rng;

    auto noisy = add_privacy_noise(std::int64_t{50}, {.epsilon = 1.0}, rng);
    REQUIRE(std::holds_alternative<std::int64_t>(noisy));

    // With a large epsilon the noise is tiny.
    auto precise = std::get<double>(add_privacy_noise(10.0, {.epsilon = 1e9}, rng));
    REQUIRE(std::fabs(precise - 10.0) < 1e-3);

    REQUIRE(std::get<std::string>(add_privacy_noise(std::string("x"), {}, rng)) == "x");
    REQUIRE_THROWS_AS(add_privacy_noise(1.0, {.epsilon = 0.0}, rng), std::invalid_argument);
}
