#include <shroud/crypto/secure_random.hpp>
#include <shroud/engine/config.hpp>
#include <shroud/io/dataset_io.hpp>
#include <shroud/job.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitPartial = 2;

auto read_file(const std::string& path) -> std::optional<std::string> {
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    return std::string(std::istreambuf_iterator<char>{in}, {});
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"shroud: anonymize tabular datasets"};

    std::string input_path;
    std::string output_path;
    std::string config_path;
    std::string config_json;
    std::string sheet;
    std::string format_name;
    std::string salt;
    std::string report_path;
    bool random_salt = false;
    bool strict = false;
    bool allow_partial = false;
    bool verbose = false;
    std::size_t threads = 1;

    app.add_option("input", input_path, "Input file (.csv, .tsv or .json workbook)")->required();
    app.add_option("-o,--output", output_path, "Output file")->required();
    auto* config_file_opt =
        app.add_option("-c,--config", config_path, "Masking config file (JSON)");
    auto* config_json_opt =
        app.add_option("--config-json", config_json, "Masking config as JSON text");
    config_file_opt->excludes(config_json_opt);
    app.add_option("--sheet", sheet, "Only anonymize this sheet of the input");
    app.add_option("--format", format_name, "Output format: csv, tsv or json")
        ->check(CLI::IsMember({"csv", "tsv", "json", "workbook"}));
    auto* salt_opt = app.add_option("--salt", salt,
                                    "Salt for hash-derived methods. "
                                    "Defaults to the SHROUD_SALT environment variable.");
    app.add_flag("--random-salt", random_salt, "Generate a one-off secure salt")
        ->excludes(salt_opt);
    app.add_flag("--strict", strict, "Reject unknown method names");
    app.add_option("--threads", threads, "Sheets anonymized concurrently")
        ->check(CLI::PositiveNumber);
    app.add_option("--report", report_path, "Write a JSON report of every column");
    app.add_flag("--allow-partial", allow_partial,
                 "Exit 0 even if some columns could not be anonymized");
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    shroud::JobRequest request;
    request.input_path = input_path;
    request.output_path = output_path;

    if (!config_path.empty()) {
        auto text = read_file(config_path);
        if (!text) {
            spdlog::error("failed to read config: {}", config_path);
            return kExitFailure;
        }
        request.masking_config_json = std::move(*text);
    } else if (!config_json.empty()) {
        request.masking_config_json = config_json;
    } else {
        spdlog::error("a masking config is required (-c or --config-json)");
        return kExitFailure;
    }

    if (!format_name.empty()) {
        request.output_format = shroud::io::parse_data_format(format_name);
    }
    if (!sheet.empty()) {
        request.selected_sheet = sheet;
    }

    // --salt, then SHROUD_SALT, then --random-salt, then the built-in default.
    if (salt.empty()) {
        const char* env = std::getenv("SHROUD_SALT");
        if (env != nullptr && *env != '\0') {
            salt = env;
        }
    }
    if (salt.empty() && random_salt) {
        shroud::crypto::SecureRandom rng;
        salt = shroud::crypto::generate_salt(rng);
        spdlog::info("using a random salt; hashed values will not match other runs");
    }
    if (salt.empty()) {
        spdlog::warn("no salt given; using the built-in default");
        salt = std::string(shroud::engine::kDefaultSalt);
    }
    request.salt = std::move(salt);

    request.engine.threads = threads;
    request.config.strict_methods = strict;
    request.config.defaults = shroud::engine::EngineDefaults::from_env();

    auto report = shroud::run_anonymization_job(request);
    if (!report) {
        spdlog::error("{}", report.error());
        return kExitFailure;
    }

    if (!report_path.empty()) {
        std::ofstream out(report_path);
        if (!out) {
            spdlog::error("failed to write report: {}", report_path);
            return kExitFailure;
        }
        out << shroud::report_to_json(*report) << '\n';
    }

    if (!report->fully_anonymized) {
        for (const auto& column : report->skipped_columns()) {
            spdlog::warn("not anonymized: {}", column);
        }
        if (!allow_partial) {
            fmt::print(stderr, "output written but NOT fully anonymized; do not release it\n");
            return kExitPartial;
        }
    }
    return 0;
}
