#include <shroud/engine/quality.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>
#include <vector>

using namespace shroud::engine;
using shroud::Column;
using shroud::runtime::Dataset;
using shroud::runtime::Table;

namespace {

auto has(const std::vector<SensitivePattern>& found, SensitivePattern pattern) -> bool {
    return std::ranges::find(found, pattern) != found.end();
}

auto people() -> Dataset {
    Table table;
    table.add_column("name", Column<std::string>{"Alice", "Bob"});
    table.add_column("email", Column<std::string>{"alice@example.com", "bob@example.com"});
    table.add_column("note", Column<std::string>{"ok", "fine"});
    Dataset dataset;
    dataset.add_sheet("People", table);
    return dataset;
}

auto run(const Dataset& dataset, const char* config_json) -> DatasetResult {
    auto parsed = parse_masking_config(config_json);
    REQUIRE(parsed.has_value());
    Anonymizer anonymizer("quality-salt");
    return anonymizer.anonymize(dataset, *parsed);
}

}  // namespace

// ─── pattern detection ───────────────────────────────────────────────────────

TEST_CASE("Sensitive patterns are recognised", "[quality][patterns]") {
    REQUIRE(detect_sensitive_patterns("123-45-6789") ==
            std::vector<SensitivePattern>{SensitivePattern::Ssn});
    REQUIRE(detect_sensitive_patterns("alice@example.com") ==
            std::vector<SensitivePattern>{SensitivePattern::Email});
    REQUIRE(detect_sensitive_patterns("10.0.0.1") ==
            std::vector<SensitivePattern>{SensitivePattern::IpAddress});
    REQUIRE(detect_sensitive_patterns("A12345678") ==
            std::vector<SensitivePattern>{SensitivePattern::PotentialId});
    REQUIRE(has(detect_sensitive_patterns("call (555) 123-4567 today"), SensitivePattern::Phone));
    REQUIRE(has(detect_sensitive_patterns("4111 1111 1111 1111"), SensitivePattern::CreditCard));
    REQUIRE(has(detect_sensitive_patterns("born 01/02/1990"), SensitivePattern::Date));
}

TEST_CASE("Pattern matching ignores case", "[quality][patterns]") {
    REQUIRE(has(detect_sensitive_patterns("a12345678"), SensitivePattern::PotentialId));
    REQUIRE(has(detect_sensitive_patterns("BOB@EXAMPLE.COM"), SensitivePattern::Email));
}

TEST_CASE("Plain text has no sensitive patterns", "[quality][patterns]") {
    REQUIRE(detect_sensitive_patterns("hello world").empty());
    REQUIRE(detect_sensitive_patterns("").empty());
    REQUIRE(detect_sensitive_patterns("2023-Q2").empty());
}

TEST_CASE("Pattern names", "[quality][patterns]") {
    REQUIRE(sensitive_pattern_name(SensitivePattern::Ssn) == "ssn");
    REQUIRE(sensitive_pattern_name(SensitivePattern::CreditCard) == "credit_card");
    REQUIRE(sensitive_pattern_name(SensitivePattern::IpAddress) == "ip_address");
    REQUIRE(sensitive_pattern_name(SensitivePattern::PotentialId) == "potential_id");
}

// ─── dataset checks ──────────────────────────────────────────────────────────

TEST_CASE("Row consistency compares counts", "[quality]") {
    REQUIRE(check_row_consistency(3, 3));
    REQUIRE_FALSE(check_row_consistency(3, 2));
    REQUIRE(check_row_consistency(0, 0));
}

TEST_CASE("Anonymized columns lower the retained ratio", "[quality]") {
    const auto dataset = people();
    auto result =
        run(dataset, R"({"People": {"name": "pseudonymize", "email": "anonymize_email"}})");

    auto quality = verify_anonymization_quality(dataset, result);
    REQUIRE(quality.rows_consistent);
    REQUIRE(quality.exposed.empty());
    REQUIRE(quality.recommendations.empty());
    // Only the two unconfigured notes survive out of six distinct values.
    REQUIRE(quality.retained_ratio == Catch::Approx(2.0 / 6.0));
    REQUIRE(quality.privacy_score == Catch::Approx(1.0 - 2.0 / 6.0));
}

TEST_CASE("Untouched identifying columns are reported", "[quality]") {
    const auto dataset = people();
    auto result = run(dataset, R"({"People": {"name": "pseudonymize"}})");

    auto quality = verify_anonymization_quality(dataset, result);
    REQUIRE(quality.exposed.size() == 1);
    REQUIRE(quality.exposed[0].sheet == "People");
    REQUIRE(quality.exposed[0].column == "email");
    REQUIRE(quality.exposed[0].patterns == std::vector<SensitivePattern>{SensitivePattern::Email});
    REQUIRE(quality.exposed[0].cells == 2);
    REQUIRE(quality.recommendations.size() == 1);
    REQUIRE(quality.retained_ratio == Catch::Approx(4.0 / 6.0));
    REQUIRE(quality.privacy_score == Catch::Approx((1.0 - 4.0 / 6.0) * 0.8));
}

TEST_CASE("Format-preserving output is not reported", "[quality]") {
    Table table;
    table.add_column("phone", Column<std::string>{"555-123-4567", "(212) 555-0199"});
    table.add_column("ssn", Column<std::string>{"123-45-6789", "987-65-4321"});
    Dataset dataset;
    dataset.add_sheet("Contacts", table);

    auto result =
        run(dataset, R"({"Contacts": {"phone": "anonymize_phone", "ssn": "anonymize_ssn"}})");
    auto quality = verify_anonymization_quality(dataset, result);
    REQUIRE(quality.exposed.empty());
    REQUIRE(quality.privacy_score == Catch::Approx(1.0));
}

TEST_CASE("Shuffled identifiers are still exposed", "[quality]") {
    Table table;
    table.add_column("ssn", Column<std::string>{"123-45-6789", "987-65-4321", "555-12-3456"});
    Dataset dataset;
    dataset.add_sheet("Data", table);

    auto result = run(dataset, R"({"Data": {"ssn": "shuffle"}})");
    auto quality = verify_anonymization_quality(dataset, result);
    REQUIRE(quality.exposed.size() == 1);
    REQUIRE(quality.exposed[0].patterns == std::vector<SensitivePattern>{SensitivePattern::Ssn});
    REQUIRE(quality.exposed[0].cells == 3);
    REQUIRE(quality.retained_ratio == Catch::Approx(1.0));
}

TEST_CASE("Removed columns retain nothing", "[quality]") {
    const auto dataset = people();
    auto result = run(dataset, R"({"People": {"email": "remove"}})");

    auto quality = verify_anonymization_quality(dataset, result);
    REQUIRE(quality.exposed.empty());
    REQUIRE(quality.retained_ratio == Catch::Approx(4.0 / 6.0));
}

TEST_CASE("Changed row counts are inconsistent", "[quality]") {
    const auto dataset = people();
    Table shorter;
    shorter.add_column("name", Column<std::string>{"x"});
    DatasetResult result;
    result.dataset.add_sheet("People", shorter);

    auto quality = verify_anonymization_quality(dataset, result);
    REQUIRE_FALSE(quality.rows_consistent);
    REQUIRE_FALSE(quality.recommendations.empty());
}

TEST_CASE("Empty datasets score as fully private", "[quality]") {
    Dataset dataset;
    DatasetResult result;
    auto quality = verify_anonymization_quality(dataset, result);
    REQUIRE(quality.rows_consistent);
    REQUIRE(quality.retained_ratio == 0.0);
    REQUIRE(quality.privacy_score == 1.0);
}
