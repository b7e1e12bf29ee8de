/**
 * @file main.cpp
 * @brief OSS-Sensor CLI entry point
 *
 * Commands:
 *   diff      - Run the evidence pipeline and write an evidence bundle
 *   score     - Score an evidence bundle
 *   report    - Render a triage report from a bundle and its score
 *   version   - Show version information
 */

#include "ossensor/bundle.hpp"
#include "ossensor/canonical_json.hpp"
#include "ossensor/common.hpp"
#include "ossensor/config.hpp"
#include "ossensor/pipeline.hpp"
#include "ossensor/report/triage.hpp"
#include "ossensor/require_cpp23.hpp"
#include "ossensor/schema_validate.hpp"
#include "ossensor/scoring.hpp"
#include "ossensor/version.hpp"

#include <charconv>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {

void print_version()
{
    fmt::print("ossensor {} ({})\n", ossensor::kVersion, ossensor::kBuildId);
    fmt::print("  ruleset:       {}\n", ossensor::kRulesetVersion);
    fmt::print("  bundle schema: {}\n", ossensor::kBundleSchemaVersion);
    fmt::print("  score schema:  {}\n", ossensor::kScoreSchemaVersion);
}

void print_help()
{
    fmt::print(R"(OSS-Sensor - evidence pipeline for security-relevant changes between builds

Usage: ossensor <command> [options]

Commands:
  diff        Extract and correlate evidence, write an evidence bundle
  score       Score an evidence bundle
  report      Render a triage report from a bundle and its score
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'ossensor <command> --help' for command-specific options.
)");
}

void print_diff_help()
{
    fmt::print(R"(Usage: ossensor diff [options]

Run the evidence pipeline for one (build_from, build_to, component) triple

Options:
  --build-from ID           Label of the older build (required)
  --build-to ID             Label of the newer build (required)
  --component NAME          Component name (required)
  --source-from DIR         Source tree of the older build
  --source-to DIR           Source tree of the newer build
  --binary-from FILE        Binary artifact of the older build
  --binary-to FILE          Binary artifact of the newer build
  --log PATH                Log file or directory of the newer build
  --config FILE             Analysis configuration (config.v1)
  --jobs N, -j N            Number of parallel extraction jobs (default: 1)
  --output FILE, -o         Output file (default: evidence_bundle.json)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --verbose                 Debug logging
  --quiet                   Warnings and errors only
  --help, -h                Show this help

Output:
  evidence_bundle.json
)");
}

void print_score_help()
{
    fmt::print(R"(Usage: ossensor score [options]

Score an evidence bundle with the built-in rule set

Options:
  --bundle FILE             Evidence bundle (required)
  --config FILE             Analysis configuration (config.v1) with rule weights
  --output FILE, -o         Output file (default: score_result.json)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --verbose                 Debug logging
  --quiet                   Warnings and errors only
  --help, -h                Show this help

Output:
  score_result.json
)");
}

void print_report_help()
{
    fmt::print(R"(Usage: ossensor report [options]

Render a triage report. Every citation must resolve in the bundle.

Options:
  --bundle FILE             Evidence bundle (required)
  --score FILE              Score result of that bundle (required)
  --enrichment FILE         Enrichment document to check and attach
  --format text|json        Output format (default: text)
  --output FILE, -o         Output file (default: stdout)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --verbose                 Debug logging
  --quiet                   Warnings and errors only
  --help, -h                Show this help
)");
}

enum class LogLevel { kDefault, kVerbose, kQuiet };

struct DiffOptions
{
    ossensor::pipeline::DiffRequest request;
    std::optional<std::string> config_path;
    std::size_t jobs;
    std::string output;
    std::string schema_dir;
    LogLevel log_level;
    bool show_help;
};

struct ScoreOptions
{
    std::string bundle;
    std::optional<std::string> config_path;
    std::string output;
    std::string schema_dir;
    LogLevel log_level;
    bool show_help;
};

struct ReportOptions
{
    std::string bundle;
    std::string score;
    std::optional<std::string> enrichment;
    ossensor::report::TriageFormat format;
    std::optional<std::string> output;
    std::string schema_dir;
    LogLevel log_level;
    bool show_help;
};

void configure_logging(LogLevel level)
{
    // stdout may carry report output; logs go to stderr
    auto logger = spdlog::stderr_color_mt("ossensor");
    spdlog::set_default_logger(logger);
    switch (level) {
        case LogLevel::kVerbose:
            spdlog::set_level(spdlog::level::debug);
            break;
        case LogLevel::kQuiet:
            spdlog::set_level(spdlog::level::warn);
            break;
        case LogLevel::kDefault:
            spdlog::set_level(spdlog::level::info);
            break;
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
}

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> ossensor::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(ossensor::Error::make(
            "MissingArgument", std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] ossensor::Result<std::size_t> parse_jobs_value(std::string_view value)
{
    std::size_t parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end || parsed == 0) {
        return std::unexpected(
            ossensor::Error::make("InvalidArgument", std::string("Invalid --jobs value: ") + std::string(value)));
    }
    return parsed;
}

[[nodiscard]] ossensor::Result<ossensor::report::TriageFormat> parse_format_value(std::string_view value)
{
    if (value == "text") {
        return ossensor::report::TriageFormat::kText;
    }
    if (value == "json") {
        return ossensor::report::TriageFormat::kJson;
    }
    return std::unexpected(
        ossensor::Error::make("InvalidArgument", std::string("Invalid --format value: ") + std::string(value)));
}

/// Options every command shares; returns true when arg was consumed
[[nodiscard]] bool set_common_flag(std::string_view arg, LogLevel& level, bool& show_help)
{
    if (arg == "--help" || arg == "-h") {
        show_help = true;
        return true;
    }
    if (arg == "--verbose") {
        level = LogLevel::kVerbose;
        return true;
    }
    if (arg == "--quiet") {
        level = LogLevel::kQuiet;
        return true;
    }
    return false;
}

[[nodiscard]] auto set_diff_option(std::string_view arg,
                                   // CLI parsing signature is stable.
                                   // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
                                   std::span<char*> args,
                                   std::size_t idx,
                                   DiffOptions& options) -> ossensor::Result<bool>
{
    auto& request = options.request;
    const auto assign_path = [&](std::optional<std::filesystem::path>& target) -> ossensor::Result<bool> {
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        target = std::filesystem::path(*value);
        return true;
    };
    const auto assign_string = [&](std::string& target) -> ossensor::Result<bool> {
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        target = *value;
        return true;
    };

    if (arg == "--build-from") {
        return assign_string(request.build_from);
    }
    if (arg == "--build-to") {
        return assign_string(request.build_to);
    }
    if (arg == "--component") {
        return assign_string(request.component);
    }
    if (arg == "--source-from") {
        return assign_path(request.source_from);
    }
    if (arg == "--source-to") {
        return assign_path(request.source_to);
    }
    if (arg == "--binary-from") {
        return assign_path(request.binary_from);
    }
    if (arg == "--binary-to") {
        return assign_path(request.binary_to);
    }
    if (arg == "--log") {
        return assign_path(request.log_to);
    }
    if (arg == "--output" || arg == "-o") {
        return assign_string(options.output);
    }
    if (arg == "--schema-dir") {
        return assign_string(options.schema_dir);
    }
    if (arg == "--config") {
        std::string value;
        auto assigned = assign_string(value);
        if (assigned) {
            options.config_path = value;
        }
        return assigned;
    }
    if (arg == "--jobs" || arg == "-j") {
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        auto parsed = parse_jobs_value(*value);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        options.jobs = *parsed;
        return true;
    }
    return false;
}

[[nodiscard]] ossensor::Result<DiffOptions> parse_diff_args(std::span<char*> args)
{
    DiffOptions options{.request = {},
                        .config_path = std::nullopt,
                        .jobs = 1,
                        .output = "evidence_bundle.json",
                        .schema_dir = "schemas",
                        .log_level = LogLevel::kDefault,
                        .show_help = false};
    for (std::size_t idx = 0; idx < args.size(); ++idx) {
        if (args[idx] == nullptr) {
            continue;
        }
        std::string_view arg(args[idx]);
        if (set_common_flag(arg, options.log_level, options.show_help)) {
            continue;
        }
        auto handled = set_diff_option(arg, args, idx, options);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (!*handled) {
            return std::unexpected(
                ossensor::Error::make("InvalidArgument", "Unknown option for diff: " + std::string(arg)));
        }
        ++idx;  // every diff option takes a value
    }
    return options;
}

[[nodiscard]] ossensor::Result<ScoreOptions> parse_score_args(std::span<char*> args)
{
    ScoreOptions options{.bundle = std::string{},
                         .config_path = std::nullopt,
                         .output = "score_result.json",
                         .schema_dir = "schemas",
                         .log_level = LogLevel::kDefault,
                         .show_help = false};
    for (std::size_t idx = 0; idx < args.size(); ++idx) {
        if (args[idx] == nullptr) {
            continue;
        }
        std::string_view arg(args[idx]);
        if (set_common_flag(arg, options.log_level, options.show_help)) {
            continue;
        }
        if (arg != "--bundle" && arg != "--config" && arg != "--output" && arg != "-o" && arg != "--schema-dir") {
            return std::unexpected(
                ossensor::Error::make("InvalidArgument", "Unknown option for score: " + std::string(arg)));
        }
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        if (arg == "--bundle") {
            options.bundle = *value;
        } else if (arg == "--config") {
            options.config_path = *value;
        } else if (arg == "--schema-dir") {
            options.schema_dir = *value;
        } else {
            options.output = *value;
        }
        ++idx;
    }
    return options;
}

[[nodiscard]] ossensor::Result<ReportOptions> parse_report_args(std::span<char*> args)
{
    ReportOptions options{.bundle = std::string{},
                          .score = std::string{},
                          .enrichment = std::nullopt,
                          .format = ossensor::report::TriageFormat::kText,
                          .output = std::nullopt,
                          .schema_dir = "schemas",
                          .log_level = LogLevel::kDefault,
                          .show_help = false};
    for (std::size_t idx = 0; idx < args.size(); ++idx) {
        if (args[idx] == nullptr) {
            continue;
        }
        std::string_view arg(args[idx]);
        if (set_common_flag(arg, options.log_level, options.show_help)) {
            continue;
        }
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        if (arg == "--bundle") {
            options.bundle = *value;
        } else if (arg == "--score") {
            options.score = *value;
        } else if (arg == "--enrichment") {
            options.enrichment = *value;
        } else if (arg == "--format") {
            auto format = parse_format_value(*value);
            if (!format) {
                return std::unexpected(format.error());
            }
            options.format = *format;
        } else if (arg == "--output" || arg == "-o") {
            options.output = *value;
        } else if (arg == "--schema-dir") {
            options.schema_dir = *value;
        } else {
            return std::unexpected(
                ossensor::Error::make("InvalidArgument", "Unknown option for report: " + std::string(arg)));
        }
        ++idx;
    }
    return options;
}

[[nodiscard]] ossensor::Result<ossensor::config::AnalysisConfig>
load_config_option(const std::optional<std::string>& config_path, const std::string& schema_dir)
{
    if (!config_path) {
        return ossensor::config::AnalysisConfig{};
    }
    return ossensor::config::load_config(*config_path, schema_dir);
}

/// Validate against the schema, then write canonically
[[nodiscard]] ossensor::VoidResult write_validated(const std::filesystem::path& path,
                                                   const nlohmann::json& payload,
                                                   const std::string& schema_dir,
                                                   std::string_view schema_version)
{
    if (auto valid = ossensor::common::validate_json_version(payload, schema_dir, schema_version); !valid) {
        return std::unexpected(valid.error());
    }
    return ossensor::canonical::write_canonical_json_file(path, payload);
}

[[nodiscard]] int run_diff(const DiffOptions& options)
{
    auto config = load_config_option(options.config_path, options.schema_dir);
    if (!config) {
        fmt::print(stderr, "Error: {}\n", config.error().message);
        return 1;
    }
    const ossensor::pipeline::DiffRunner runner(std::move(*config), options.jobs);
    auto bundle = runner.run(options.request);
    if (!bundle) {
        fmt::print(stderr, "Error: diff failed: {}\n", bundle.error().message);
        return 1;
    }
    if (auto written =
            write_validated(options.output, bundle->to_json(), options.schema_dir, ossensor::kBundleSchemaVersion);
        !written) {
        fmt::print(stderr, "Error: failed to write bundle: {}\n", written.error().message);
        return 1;
    }

    fmt::print("[diff] {}\n", bundle->diff_id());
    fmt::print("  hunks:    {} ({} features, {} skipped files)\n",
               bundle->diff_hunks().size(),
               bundle->source_features().size(),
               bundle->source_skips().size());
    for (const auto* set : {&bundle->binary_features_from(), &bundle->binary_features_to()}) {
        if (set->has_value()) {
            fmt::print("  binary:   {} [{}] {} symbols, {} strings\n",
                       (*set)->artifact_id,
                       ossensor::evidence::to_string((*set)->status),
                       (*set)->symbols.size(),
                       (*set)->strings.size());
        }
    }
    fmt::print("  logs:     {} templates, {} binary matches\n",
               bundle->log_templates().size(),
               bundle->log_to_binary_matches().size());
    fmt::print("  output:   {}\n", options.output);
    return 0;
}

[[nodiscard]] int run_score(const ScoreOptions& options)
{
    auto config = load_config_option(options.config_path, options.schema_dir);
    if (!config) {
        fmt::print(stderr, "Error: {}\n", config.error().message);
        return 1;
    }
    auto bundle = ossensor::bundle::read_bundle_file(options.bundle, options.schema_dir);
    if (!bundle) {
        fmt::print(stderr, "Error: failed to load bundle: {}\n", bundle.error().message);
        return 1;
    }
    const ossensor::scoring::ScoringEngine engine(config->weights);
    auto score = engine.score(*bundle);
    if (!score) {
        fmt::print(stderr, "Error: scoring failed: {}\n", score.error().message);
        return 1;
    }
    if (auto written = write_validated(
            options.output, ossensor::scoring::to_json(*score), options.schema_dir, ossensor::kScoreSchemaVersion);
        !written) {
        fmt::print(stderr, "Error: failed to write score: {}\n", written.error().message);
        return 1;
    }
    fmt::print("[score] {}: {} ({} reasons)\n", score->diff_id, score->total_score, score->reasons.size());
    fmt::print("  output: {}\n", options.output);
    return 0;
}

[[nodiscard]] int run_report(const ReportOptions& options)
{
    auto bundle = ossensor::bundle::read_bundle_file(options.bundle, options.schema_dir);
    if (!bundle) {
        fmt::print(stderr, "Error: failed to load bundle: {}\n", bundle.error().message);
        return 1;
    }
    auto score_doc = ossensor::common::read_json_file(options.score);
    if (!score_doc) {
        fmt::print(stderr, "Error: {}\n", score_doc.error().message);
        return 1;
    }
    if (auto valid = ossensor::common::validate_json_version(*score_doc, options.schema_dir,
                                                             ossensor::kScoreSchemaVersion);
        !valid) {
        fmt::print(stderr, "Error: score result failed schema validation: {}\n", valid.error().message);
        return 1;
    }
    auto score = ossensor::scoring::score_result_from_json(*score_doc);
    if (!score) {
        fmt::print(stderr, "Error: {}\n", score.error().message);
        return 1;
    }

    auto report = ossensor::report::build_triage_report(*bundle, *score);
    if (!report) {
        fmt::print(stderr, "Error: report failed: {}\n", report.error().message);
        return 1;
    }
    if (options.enrichment) {
        auto enrichment = ossensor::common::read_json_file(*options.enrichment);
        if (!enrichment) {
            fmt::print(stderr, "Error: {}\n", enrichment.error().message);
            return 1;
        }
        if (auto attached = ossensor::report::attach_enrichment(*report, *bundle, std::move(*enrichment));
            !attached) {
            fmt::print(stderr, "Error: enrichment rejected: {}\n", attached.error().message);
            return 1;
        }
    }

    if (options.output) {
        if (auto written = ossensor::report::write_triage_report(
                *report, *score, options.format, *options.output, options.schema_dir);
            !written) {
            fmt::print(stderr, "Error: failed to write report: {}\n", written.error().message);
            return 1;
        }
        fmt::print("[report] {}\n", report->summary);
        fmt::print("  output: {}\n", *options.output);
        return 0;
    }

    if (options.format == ossensor::report::TriageFormat::kJson) {
        const auto j = ossensor::report::to_json(*report);
        if (auto valid = ossensor::common::validate_json_version(j, options.schema_dir,
                                                                 ossensor::kTriageSchemaVersion);
            !valid) {
            fmt::print(stderr, "Error: {}\n", valid.error().message);
            return 1;
        }
        auto canonical = ossensor::canonical::canonicalize(j);
        if (!canonical) {
            fmt::print(stderr, "Error: {}\n", canonical.error().message);
            return 1;
        }
        fmt::print("{}\n", *canonical);
        return 0;
    }
    for (const auto& line : ossensor::report::render_text(*report, *score)) {
        fmt::print("{}\n", line);
    }
    return 0;
}

int cmd_diff(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_diff_args(args);
    if (!options) {
        fmt::print(stderr, "Error: {}\n", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_diff_help();
        return 0;
    }
    const auto& request = options->request;
    if (request.build_from.empty() || request.build_to.empty() || request.component.empty()) {
        fmt::print(stderr, "Error: --build-from, --build-to and --component are required\n");
        print_diff_help();
        return 1;
    }
    configure_logging(options->log_level);
    return run_diff(*options);
}

int cmd_score(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_score_args(args);
    if (!options) {
        fmt::print(stderr, "Error: {}\n", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_score_help();
        return 0;
    }
    if (options->bundle.empty()) {
        fmt::print(stderr, "Error: --bundle is required\n");
        print_score_help();
        return 1;
    }
    configure_logging(options->log_level);
    return run_score(*options);
}

int cmd_report(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_report_args(args);
    if (!options) {
        fmt::print(stderr, "Error: {}\n", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_report_help();
        return 0;
    }
    if (options->bundle.empty() || options->score.empty()) {
        fmt::print(stderr, "Error: --bundle and --score are required\n");
        print_report_help();
        return 1;
    }
    configure_logging(options->log_level);
    return run_report(*options);
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return 0;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return 0;
        }

        int sub_argc = argc - 2;
        char** sub_argv = argv + 2;

        if (cmd == "diff") {
            return cmd_diff(sub_argc, sub_argv);
        }
        if (cmd == "score") {
            return cmd_score(sub_argc, sub_argv);
        }
        if (cmd == "report") {
            return cmd_report(sub_argc, sub_argv);
        }

        fmt::print(stderr, "Unknown command: {}\n", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        try {
            fmt::print(stderr, "Error: {}\n", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    } catch (...) {
        try {
            fmt::print(stderr, "Error: unknown exception\n");
        } catch (...) {
            std::terminate();
        }
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
