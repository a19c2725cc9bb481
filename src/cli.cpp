#include "tare/cli.hpp"

#include "tare/errors.hpp"
#include "tare/format.hpp"

#include "internal/io.hpp"
#include "internal/types.hpp"

#include <CLI/CLI.hpp>
#include <glaze/glaze.hpp>

#include <cstdint>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

using namespace tare::literals;

namespace tare::cli {

    namespace fs = std::filesystem;

    namespace detail {

        static void print_patterns(std::ostream& os, std::string_view key, const std::vector<std::string>& values) {
            os << key << '=' << utils::join_with_separator(values, ",") << '\n';
        }

        static std::string path_or_none(const std::optional<fs::path>& path) {
            return path ? path->string() : std::string{"<none>"};
        }

        template <typename T>
        static T read_json_file(const fs::path& path) {
            T value{};
            auto json = internal::read_text_file(path);
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(value, json);
            if (ec) {
                throw std::runtime_error(
                        "failed to parse json file {}: {}"_format(path.string(), glz::format_error(ec, json)));
            }
            return value;
        }

        static void validate_supported_schema_version(int schema_version, const fs::path& path) {
            constexpr int supported_schema_version = 1;
            if (schema_version > supported_schema_version) {
                throw std::runtime_error(
                        "unsupported schema_version in {}: {} > {}"_format(
                                path.string(), schema_version, supported_schema_version));
            }
        }

        static void print_event(const run_event& event, std::ostream& os) {
            auto name = event.spec != nullptr ? event.spec->qualified_name() : std::string{"<run>"};
            switch (event.kind) {
                case run_event_kind::started:
                    os << "[" << event.worker << "] started " << name << '\n';
                    break;
                case run_event_kind::trial: {
                    const auto& s = *event.sample;
                    os << "[{}] {} trial {} ({}): "_format(event.worker, name, s.trial, s.assignment);
                    if (s.succeeded) {
                        os << s.elapsed.count() << "ns reads=" << s.reads << " writes=" << s.writes
                           << " proof_size=" << s.proof_size << '\n';
                    }
                    else {
                        os << "failed: " << s.failure.value_or("unknown failure") << '\n';
                    }
                    break;
                }
                case run_event_kind::finished:
                    os << "[" << event.worker << "] finished " << name << '\n';
                    break;
                case run_event_kind::failed:
                    os << "[" << event.worker << "] failed " << name << ": " << to_string(event.failure->kind) << ": "
                       << event.failure->message << '\n';
                    break;
                case run_event_kind::skipped:
                    os << "skipped " << name << '\n';
                    break;
            }
        }

    }  // namespace detail

    void apply_config_file(const fs::path& path, run_config& cfg) {
        auto data = detail::read_json_file<internal::persisted_config>(path);
        detail::validate_supported_schema_version(data.schema_version, path);

        if (data.modules) {
            cfg.modules = *data.modules;
        }
        if (data.operations) {
            cfg.operations = *data.operations;
        }
        cfg.include_extra = data.extra.value_or(cfg.include_extra);
        cfg.trials.steps = data.steps.value_or(cfg.trials.steps);
        cfg.trials.repeats = data.repeats.value_or(cfg.trials.repeats);
        cfg.trials.lowest_range_only = data.lowest_range_only.value_or(cfg.trials.lowest_range_only);
        cfg.trials.highest_range_only = data.highest_range_only.value_or(cfg.trials.highest_range_only);
        cfg.collector.max_discard_fraction = data.max_discard_fraction.value_or(cfg.collector.max_discard_fraction);
        if (data.trial_timeout_ms) {
            cfg.adapter.timeout = std::chrono::milliseconds{*data.trial_timeout_ms};
        }
        cfg.adapter.verify = data.verify.value_or(cfg.adapter.verify);
        cfg.jobs = data.jobs.value_or(cfg.jobs);
        if (data.analysis && !try_parse_analysis_choice(*data.analysis, cfg.analysis.method)) {
            throw benchmark_error{
                    error_kind::invalid_configuration,
                    "invalid analysis in {}: {}"_format(path.string(), *data.analysis)};
        }
        cfg.analysis.trim_fraction = data.trim_fraction.value_or(cfg.analysis.trim_fraction);
        if (data.negative_slopes && !try_parse_negative_slope_policy(*data.negative_slopes, cfg.render.negative_slopes)) {
            throw benchmark_error{
                    error_kind::invalid_configuration,
                    "invalid negative_slopes in {}: {}"_format(path.string(), *data.negative_slopes)};
        }
        cfg.render.ticks_per_nanosecond = data.ticks_per_nanosecond.value_or(cfg.render.ticks_per_nanosecond);
        if (data.output) {
            cfg.output_path = *data.output;
        }
        if (data.header) {
            cfg.header_file = *data.header;
        }
        if (data.template_file) {
            cfg.template_file = *data.template_file;
        }
        if (data.raw) {
            cfg.raw_path = *data.raw;
        }
        if (data.json) {
            cfg.json_path = *data.json;
        }
        cfg.config_file = path;
    }

    void print_config(const run_config& cfg, std::ostream& os) {
        detail::print_patterns(os, "modules", cfg.modules);
        detail::print_patterns(os, "operations", cfg.operations);
        os << "extra=" << (cfg.include_extra ? "true" : "false") << '\n';
        os << "steps=" << cfg.trials.steps << '\n';
        os << "repeats=" << cfg.trials.repeats << '\n';
        os << "lowest_range_only=" << (cfg.trials.lowest_range_only ? "true" : "false") << '\n';
        os << "highest_range_only=" << (cfg.trials.highest_range_only ? "true" : "false") << '\n';
        os << "max_discard_fraction=" << cfg.collector.max_discard_fraction << '\n';
        os << "trial_timeout_ms=" << cfg.adapter.timeout.count() << '\n';
        os << "verify=" << (cfg.adapter.verify ? "true" : "false") << '\n';
        os << "jobs=" << cfg.jobs << '\n';
        os << "analysis=" << to_string(cfg.analysis.method) << '\n';
        os << "trim_fraction=" << cfg.analysis.trim_fraction << '\n';
        os << "negative_slopes=" << to_string(cfg.render.negative_slopes) << '\n';
        os << "ticks_per_nanosecond=" << cfg.render.ticks_per_nanosecond << '\n';
        os << "output=" << detail::path_or_none(cfg.output_path) << '\n';
        os << "header=" << detail::path_or_none(cfg.header_file) << '\n';
        os << "template=" << detail::path_or_none(cfg.template_file) << '\n';
        os << "raw=" << detail::path_or_none(cfg.raw_path) << '\n';
        os << "json=" << detail::path_or_none(cfg.json_path) << '\n';
        os << "config=" << detail::path_or_none(cfg.config_file) << '\n';
    }

    void print_operations(const std::vector<operation_spec>& operations, std::ostream& os) {
        for (const auto& spec : operations) {
            os << spec.qualified_name();
            if (spec.extra) {
                os << " (extra)";
            }
            for (const auto& c : spec.components) {
                os << ' ' << c.name << '=' << c.min << "..=" << c.max;
            }
            os << '\n';
        }
    }

    void print_report(const run_report& report, std::ostream& os) {
        for (const auto& outcome : report.outcomes) {
            os << outcome.spec.qualified_name() << ' ' << to_string(outcome.status);
            if (outcome.result) {
                os << " samples=" << outcome.result->sample_count << " discarded=" << outcome.result->discarded_count;
                if (const auto* time = outcome.result->model_for(metric::time)) {
                    os << " time_base_ns=" << time->base;
                    for (const auto& s : time->per_component) {
                        os << ' ' << s.name << "_ns=" << s.slope;
                    }
                    os << " r2=" << time->r_squared;
                }
            }
            if (outcome.failure) {
                os << ": " << to_string(outcome.failure->kind) << ": " << outcome.failure->message;
                if (outcome.failure->assignment) {
                    os << " (at {})"_format(*outcome.failure->assignment);
                }
            }
            os << '\n';
        }
        os << report.count(outcome_status::succeeded) << " succeeded, " << report.count(outcome_status::failed)
           << " failed, " << report.count(outcome_status::skipped) << " skipped";
        if (report.cancelled) {
            os << " (cancelled)";
        }
        os << '\n';
    }

    std::optional<int> parse_cli(int argc, char** argv, run_config& cfg) {
        CLI::App app{"tare: benchmark runtime operations and generate their cost models"};

        bool show_version = false;
        std::vector<std::string> modules_arg{cfg.modules};
        std::vector<std::string> operations_arg{cfg.operations};
        uint32_t steps_arg{cfg.trials.steps};
        uint32_t repeats_arg{cfg.trials.repeats};
        bool lowest_arg = false;
        bool highest_arg = false;
        bool extra_arg = false;
        bool verify_arg = false;
        unsigned jobs_arg{cfg.jobs};
        int64_t timeout_arg{cfg.adapter.timeout.count()};
        double max_discard_arg{cfg.collector.max_discard_fraction};
        double trim_arg{cfg.analysis.trim_fraction};
        std::string analysis_arg{std::string{to_string(cfg.analysis.method)}};
        std::string negative_arg{std::string{to_string(cfg.render.negative_slopes)}};
        double ticks_arg{cfg.render.ticks_per_nanosecond};
        std::string output_arg{};
        std::string header_arg{};
        std::string template_arg{};
        std::string raw_arg{};
        std::string json_arg{};
        std::string config_arg{};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("-p,--module", modules_arg, "Module patterns to benchmark; `*` matches anything")
                ->delimiter(',');
        app.add_option("-e,--operation", operations_arg, "Operation patterns within the selected modules")
                ->delimiter(',');
        app.add_option("-s,--steps", steps_arg, "Sampled points per component range");
        app.add_option("-r,--repeat", repeats_arg, "Trials per sampled point");
        app.add_flag("--lowest-range-only", lowest_arg, "Pin components not being swept at their minimum");
        app.add_flag("--highest-range-only", highest_arg, "Pin components not being swept at their maximum");
        app.add_flag("--extra", extra_arg, "Include operations marked as extra");
        app.add_flag("--verify", verify_arg, "Run each operation's verification after every trial");
        app.add_option("-j,--jobs", jobs_arg, "Operations benchmarked concurrently");
        app.add_option("--timeout-ms", timeout_arg, "Wall-time budget per trial in milliseconds");
        app.add_option("--max-discard", max_discard_arg, "Largest tolerated fraction of failed trials");
        app.add_option("--trim", trim_arg, "Fraction of per-point medians trimmed from each end");
        app.add_option("--analysis", analysis_arg, "Fitting method: least_squares|median_slopes");
        app.add_option("--negative-slopes", negative_arg, "Negative coefficient policy: keep|clamp");
        app.add_option("--ticks-per-ns", ticks_arg, "Accounting ticks per measured nanosecond");
        app.add_option("-o,--output", output_arg, "Generated source directory, or file for one module");
        app.add_option("--header", header_arg, "File prepended to every generated unit");
        app.add_option("--template", template_arg, "Mustache template for generated units");
        app.add_option("--raw", raw_arg, "Write all samples as JSON");
        app.add_option("--json", json_arg, "Write operation results as JSON");
        app.add_option("--config", config_arg, "JSON file pre-populating these options");
        app.add_flag("--list", cfg.list_only, "List the selected operations and exit");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Suppress progress output");
        app.add_flag("--verbose", cfg.verbose, "Print every trial");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (show_version) {
            std::cout << "tare " << version << '\n';
            return std::optional<int>{0};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }

        if (!config_arg.empty()) {
            try {
                apply_config_file(config_arg, cfg);
            } catch (const std::exception& e) {
                std::cerr << "invalid --config: " << e.what() << '\n';
                return std::optional<int>{2};
            }
        }

        auto given = [&app](std::string_view name) { return app.count(std::string{name}) > 0U; };

        if (given("--module")) {
            cfg.modules = modules_arg;
        }
        if (given("--operation")) {
            cfg.operations = operations_arg;
        }
        if (given("--steps")) {
            cfg.trials.steps = steps_arg;
        }
        if (given("--repeat")) {
            cfg.trials.repeats = repeats_arg;
        }
        cfg.trials.lowest_range_only = cfg.trials.lowest_range_only || lowest_arg;
        cfg.trials.highest_range_only = cfg.trials.highest_range_only || highest_arg;
        cfg.include_extra = cfg.include_extra || extra_arg;
        cfg.adapter.verify = cfg.adapter.verify || verify_arg;
        if (given("--jobs")) {
            cfg.jobs = jobs_arg;
        }
        if (given("--timeout-ms")) {
            cfg.adapter.timeout = std::chrono::milliseconds{timeout_arg};
        }
        if (given("--max-discard")) {
            cfg.collector.max_discard_fraction = max_discard_arg;
        }
        if (given("--trim")) {
            cfg.analysis.trim_fraction = trim_arg;
        }
        if (given("--analysis") && !try_parse_analysis_choice(analysis_arg, cfg.analysis.method)) {
            std::cerr << "invalid --analysis value: " << analysis_arg << " (expected least_squares|median_slopes)\n";
            return std::optional<int>{2};
        }
        if (given("--negative-slopes") && !try_parse_negative_slope_policy(negative_arg, cfg.render.negative_slopes)) {
            std::cerr << "invalid --negative-slopes value: " << negative_arg << " (expected keep|clamp)\n";
            return std::optional<int>{2};
        }
        if (given("--ticks-per-ns")) {
            cfg.render.ticks_per_nanosecond = ticks_arg;
        }
        if (!output_arg.empty()) {
            cfg.output_path = output_arg;
        }
        if (!header_arg.empty()) {
            cfg.header_file = header_arg;
        }
        if (!template_arg.empty()) {
            cfg.template_file = template_arg;
        }
        if (!raw_arg.empty()) {
            cfg.raw_path = raw_arg;
        }
        if (!json_arg.empty()) {
            cfg.json_path = json_arg;
        }

        try {
            validate(cfg);
        } catch (const benchmark_error& e) {
            std::cerr << "invalid configuration: " << e.detail() << '\n';
            return std::optional<int>{2};
        }

        if (cfg.print_config) {
            print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

    int execute(
            int argc,
            char** argv,
            const std::vector<operation_spec>& operations,
            const sandbox_factory& factory,
            std::stop_token stop) {
        run_config cfg{};
        if (auto cli_result = parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        if (cfg.list_only) {
            print_operations(select_operations(operations, cfg), std::cout);
            return 0;
        }

        std::mutex progress_mutex{};
        auto ctx = run_context{.operations = operations, .config = cfg, .factory = factory};
        if (!cfg.quiet) {
            ctx.observer = [&progress_mutex, verbose = cfg.verbose](const run_event& event) {
                if (event.kind == run_event_kind::trial && !verbose) {
                    return;
                }
                std::lock_guard lock{progress_mutex};
                detail::print_event(event, std::cerr);
            };
        }

        auto report = run(ctx, stop);

        for (const auto& path : write_outputs(report, cfg)) {
            if (!cfg.quiet) {
                std::cerr << "wrote " << path.string() << '\n';
            }
        }
        if (!cfg.quiet) {
            print_report(report, std::cout);
        }
        else {
            for (const auto& outcome : report.outcomes) {
                if (outcome.failure) {
                    std::cerr << "failed " << outcome.spec.qualified_name() << ": " << outcome.failure->message << '\n';
                }
            }
        }

        if (report.cancelled) {
            return 130;
        }
        return report.count(outcome_status::failed) > 0U ? 1 : 0;
    }

}  // namespace tare::cli
