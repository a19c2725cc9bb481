#include "utils.hpp"

namespace tare::test {

    TEST_CASE("002: parse_cli accepts run options", "[002][cli]") {
        run_config cfg{};
        std::vector<std::string> args{
                "tare",
                "--module",
                "kv,balances",
                "-e",
                "insert_*",
                "--steps",
                "4",
                "--repeat",
                "3",
                "--highest-range-only",
                "--extra",
                "--verify",
                "--jobs",
                "2",
                "--timeout-ms",
                "500",
                "--max-discard",
                "0.25",
                "--trim",
                "0.1",
                "--analysis",
                "median_slopes",
                "--negative-slopes",
                "clamp",
                "--ticks-per-ns",
                "1",
                "--output",
                "/tmp/tare_tests/weights",
                "--raw",
                "/tmp/tare_tests/raw.json",
                "--json",
                "/tmp/tare_tests/results.json",
                "--quiet"};
        auto argv = detail::to_argv(args);

        auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
        CHECK(!result);
        CHECK(cfg.modules == std::vector<std::string>{"kv", "balances"});
        CHECK(cfg.operations == std::vector<std::string>{"insert_*"});
        CHECK(cfg.trials.steps == 4U);
        CHECK(cfg.trials.repeats == 3U);
        CHECK(cfg.trials.highest_range_only);
        CHECK_FALSE(cfg.trials.lowest_range_only);
        CHECK(cfg.include_extra);
        CHECK(cfg.adapter.verify);
        CHECK(cfg.jobs == 2U);
        CHECK(cfg.adapter.timeout == std::chrono::milliseconds{500});
        CHECK(cfg.collector.max_discard_fraction == 0.25);
        CHECK(cfg.analysis.trim_fraction == 0.1);
        CHECK(cfg.analysis.method == analysis_choice::median_slopes);
        CHECK(cfg.render.negative_slopes == negative_slope_policy::clamp);
        CHECK(cfg.render.ticks_per_nanosecond == 1.0);
        REQUIRE(cfg.output_path);
        CHECK(*cfg.output_path == "/tmp/tare_tests/weights");
        REQUIRE(cfg.raw_path);
        CHECK(*cfg.raw_path == "/tmp/tare_tests/raw.json");
        REQUIRE(cfg.json_path);
        CHECK(*cfg.json_path == "/tmp/tare_tests/results.json");
        CHECK(cfg.quiet);
    }

    TEST_CASE("002: parse_cli keeps defaults without options", "[002][cli]") {
        run_config cfg{};
        std::vector<std::string> args{"tare"};
        auto argv = detail::to_argv(args);

        CHECK(!cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg));
        CHECK(cfg.modules == std::vector<std::string>{"*"});
        CHECK(cfg.operations == std::vector<std::string>{"*"});
        CHECK(cfg.trials == trial_config{});
        CHECK_FALSE(cfg.output_path);
    }

    TEST_CASE("002: parse_cli rejects invalid usage", "[002][cli]") {
        auto exit_code = [](std::vector<std::string> args) {
            run_config cfg{};
            auto argv = detail::to_argv(args);
            return cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
        };

        CHECK(exit_code({"tare", "--quiet", "--verbose"}) == std::optional<int>{2});
        CHECK(exit_code({"tare", "--analysis", "ridge"}) == std::optional<int>{2});
        CHECK(exit_code({"tare", "--negative-slopes", "drop"}) == std::optional<int>{2});
        CHECK(exit_code({"tare", "--steps", "0"}) == std::optional<int>{2});
        CHECK(exit_code({"tare", "--lowest-range-only", "--highest-range-only"}) == std::optional<int>{2});
        CHECK(exit_code({"tare", "--trim", "0.75"}) == std::optional<int>{2});
        CHECK(exit_code({"tare", "--config", "/nonexistent/tare/config.json"}) == std::optional<int>{2});

        auto unknown = exit_code({"tare", "--no-such-flag"});
        REQUIRE(unknown);
        CHECK(*unknown != 0);

        CHECK(exit_code({"tare", "--version"}) == std::optional<int>{0});
    }

    TEST_CASE("002: config file pre-populates options and flags override it", "[002][cli]") {
        detail::temp_dir temp{"tare_cli_config"};
        auto path = temp.path / "tare.json";
        detail::write_text_file(
                path,
                R"({"schema_version":1,"modules":["kv"],"steps":7,"repeats":2,"analysis":"median_slopes",)"
                R"("trim_fraction":0.2,"output":"out","template":"unit.mustache","future_key":true})");

        run_config cfg{};
        std::vector<std::string> args{"tare", "--config", path.string(), "--repeat", "5"};
        auto argv = detail::to_argv(args);

        CHECK(!cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg));
        CHECK(cfg.modules == std::vector<std::string>{"kv"});
        CHECK(cfg.trials.steps == 7U);
        CHECK(cfg.trials.repeats == 5U);
        CHECK(cfg.analysis.method == analysis_choice::median_slopes);
        CHECK(cfg.analysis.trim_fraction == 0.2);
        REQUIRE(cfg.output_path);
        CHECK(*cfg.output_path == "out");
        REQUIRE(cfg.template_file);
        CHECK(*cfg.template_file == "unit.mustache");
        REQUIRE(cfg.config_file);
        CHECK(*cfg.config_file == path);
    }

    TEST_CASE("002: config file with a newer schema is rejected", "[002][cli]") {
        detail::temp_dir temp{"tare_cli_schema"};
        auto path = temp.path / "tare.json";
        detail::write_text_file(path, R"({"schema_version":9,"steps":3})");

        run_config cfg{};
        CHECK_THROWS_WITH(cli::apply_config_file(path, cfg), ContainsSubstring("unsupported schema_version"));
        CHECK(cfg.trials.steps == 50U);
    }

    TEST_CASE("002: print_config lists the resolved settings", "[002][cli]") {
        run_config cfg{};
        cfg.trials.steps = 9U;
        cfg.output_path = "weights";

        std::ostringstream os{};
        cli::print_config(cfg, os);
        auto text = os.str();
        CHECK_THAT(text, ContainsSubstring("steps=9\n"));
        CHECK_THAT(text, ContainsSubstring("modules=*\n"));
        CHECK_THAT(text, ContainsSubstring("analysis=least_squares\n"));
        CHECK_THAT(text, ContainsSubstring("output=weights\n"));
        CHECK_THAT(text, ContainsSubstring("raw=<none>\n"));
        CHECK_THAT(text, ContainsSubstring("template=<none>\n"));
    }

}  // namespace tare::test
