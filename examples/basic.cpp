#include <shroud/shroud.hpp>

#include <fmt/core.h>

#include <string>
#include <vector>

auto main() -> int {
    using namespace shroud;

    // A small employee sheet
    runtime::Table employees;
    employees.add_column("name", Column<std::string>{"Alice Smith", "Bob Jones", "Carol White"});
    employees.add_column("email", Column<std::string>{"alice@gmail.com", "bob@acme.io",
                                                      "carol@outlook.com"});
    employees.add_column("age", Column<std::int64_t>{34, 41, 29});
    employees.add_column("ssn", Column<std::string>{"123-45-6789", "987-65-4321", "555-12-3456"});

    runtime::Dataset dataset;
    dataset.add_sheet("Employees", employees);

    auto config = engine::parse_masking_config(R"({
        "Employees": {
            "name": "pseudonymize",
            "email": "anonymize_email",
            "age": {"method": "generalize_numeric", "options": {"bin_size": 10}},
            "ssn": "anonymize_ssn"
        }
    })");
    if (!config) {
        fmt::print(stderr, "config error: {}\n", config.error().format());
        return 1;
    }

    engine::Anonymizer anonymizer("example_salt");
    auto result = anonymizer.anonymize(dataset, *config);

    fmt::print("=== Anonymized employees ===\n");
    const auto* table = result.dataset.find("Employees");
    const auto names = table->column_names();
    for (const auto& name : names) {
        fmt::print("{:<24}", name);
    }
    fmt::print("\n");
    for (std::size_t row = 0; row < table->rows(); ++row) {
        for (const auto& name : names) {
            const auto* column = table->find(name);
            fmt::print("{:<24}", runtime::format_scalar(runtime::scalar_at(*column, row)));
        }
        fmt::print("\n");
    }

    fmt::print("\nfully anonymized: {}\n", result.fully_anonymized());
    return 0;
}
