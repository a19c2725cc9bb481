#include "utils.hpp"

#include "modules.hpp"

#include <atomic>
#include <set>

namespace tare::test {

    namespace detail {
        static run_config quick_config() {
            run_config cfg{};
            cfg.trials = trial_config{.steps = 2U, .repeats = 3U};
            return cfg;
        }

        struct foreign_fault {
            int code;
        };

        // Sandbox of an engine that reports faults with its own exception type
        class faulting_sandbox final : public sandbox {
          public:
            void prepare(const operation_spec&, const component_assignment&) override {}
            void invoke(std::stop_token) override { throw foreign_fault{42}; }
            storage_counters counters() const override { return {}; }
            void reset() override {}
        };
    }  // namespace detail

    TEST_CASE("009: end to end fit of a single-component operation", "[009][runner]") {
        auto ctx = run_context{
                .operations = {one_component_spec("kv", "insert")},
                .config = detail::quick_config(),
                .factory = make_scripted_factory(linear_script(10.0, {{"n", 2.0}}))};

        auto report = run(ctx);
        REQUIRE(report.outcomes.size() == 1U);
        const auto& outcome = report.outcomes.front();
        CHECK(outcome.status == outcome_status::succeeded);
        CHECK_FALSE(report.cancelled);
        REQUIRE(outcome.result);

        const auto& result = *outcome.result;
        CHECK(result.sample_count == 6U);
        CHECK(result.discarded_count == 0U);
        const auto* time = result.model_for(metric::time);
        REQUIRE(time);
        CHECK_THAT(time->base, WithinAbs(10.0, 1e-9));
        CHECK_THAT(time->slope_of("n").value_or(0.0), WithinAbs(2.0, 1e-9));

        REQUIRE(outcome.samples);
        CHECK(outcome.samples->samples.size() == 6U);
    }

    TEST_CASE("009: a failing operation does not stop its siblings", "[009][runner]") {
        auto script = [](const operation_spec& spec, const component_assignment&, size_t trial) {
            return scripted_outcome{.elapsed = std::chrono::nanoseconds{100}, .fail = spec.name == "flaky" && trial % 2U == 0U};
        };

        for (unsigned jobs : {1U, 3U}) {
            auto cfg = detail::quick_config();
            cfg.jobs = jobs;
            auto ctx = run_context{
                    .operations = {one_component_spec("kv", "flaky"), one_component_spec("kv", "steady")},
                    .config = cfg,
                    .factory = make_scripted_factory(script)};

            auto report = run(ctx);
            REQUIRE(report.outcomes.size() == 2U);

            const auto& flaky = report.outcomes[0];
            CHECK(flaky.spec.name == "flaky");
            CHECK(flaky.status == outcome_status::failed);
            CHECK_FALSE(flaky.result);
            REQUIRE(flaky.failure);
            CHECK(flaky.failure->kind == error_kind::excessive_discard_rate);
            REQUIRE(flaky.failure->assignment);
            CHECK(*flaky.failure->assignment == assign({{"n", 0U}}));
            REQUIRE(flaky.samples);
            CHECK(flaky.samples->discarded_count() == 3U);

            const auto& steady = report.outcomes[1];
            CHECK(steady.status == outcome_status::succeeded);
            REQUIRE(steady.result);
            CHECK(steady.result->discarded_count == 0U);

            CHECK(report.count(outcome_status::succeeded) == 1U);
            CHECK(report.count(outcome_status::failed) == 1U);
            CHECK(report.results().size() == 1U);
            CHECK(report.sample_sets().size() == 2U);
        }
    }

    TEST_CASE("009: selection applies patterns and the extra filter", "[009][runner]") {
        std::vector<operation_spec> declared{
                one_component_spec("kv", "insert_many"),
                one_component_spec("kv", "clear_prefix"),
                {.module = "kv", .name = "compact", .extra = true},
                {.module = "system", .name = "noop"}};

        auto names = [](const std::vector<operation_spec>& specs) {
            std::vector<std::string> out{};
            for (const auto& s : specs) {
                out.push_back(s.qualified_name());
            }
            return out;
        };

        run_config cfg{};
        CHECK(names(select_operations(declared, cfg)) ==
              std::vector<std::string>{"kv::insert_many", "kv::clear_prefix", "system::noop"});

        cfg.include_extra = true;
        CHECK(select_operations(declared, cfg).size() == 4U);

        cfg.modules = {"kv"};
        cfg.operations = {"*_many", "compact"};
        CHECK(names(select_operations(declared, cfg)) == std::vector<std::string>{"kv::insert_many", "kv::compact"});

        cfg.modules = {"nope"};
        CHECK_THROWS_AS(select_operations(declared, cfg), benchmark_error);

        cfg.modules = {"kv"};
        cfg.operations = {"missing"};
        CHECK_THROWS_AS(select_operations(declared, cfg), benchmark_error);

        declared.push_back(one_component_spec("kv", "insert_many"));
        cfg.operations = {"*"};
        try {
            select_operations(declared, cfg);
            FAIL("expected invalid_declaration");
        } catch (const benchmark_error& e) {
            CHECK(e.kind() == error_kind::invalid_declaration);
        }
    }

    TEST_CASE("009: run-level errors abort before any trial", "[009][runner]") {
        std::atomic<size_t> trials{0U};
        auto script = [&trials](const operation_spec&, const component_assignment&, size_t) {
            ++trials;
            return scripted_outcome{.elapsed = std::chrono::nanoseconds{1}};
        };

        auto ctx = run_context{
                .operations = {one_component_spec(), {.module = "m", .name = "broken", .components = {{"x", 9U, 1U}}}},
                .config = detail::quick_config(),
                .factory = make_scripted_factory(script)};
        CHECK_THROWS_AS(run(ctx), benchmark_error);

        ctx.operations.pop_back();
        ctx.config.trials.steps = 0U;
        CHECK_THROWS_AS(run(ctx), benchmark_error);
        CHECK(trials.load() == 0U);
    }

    TEST_CASE("009: non-standard exceptions from a sandbox reach the caller unchanged", "[009][runner]") {
        auto cfg = detail::quick_config();
        cfg.jobs = 2U;
        auto ctx = run_context{
                .operations = {one_component_spec("m", "a"), one_component_spec("m", "b")},
                .config = cfg,
                .factory = []() -> std::unique_ptr<sandbox> { return std::make_unique<detail::faulting_sandbox>(); }};

        try {
            run(ctx);
            FAIL("expected the sandbox fault to propagate");
        } catch (const detail::foreign_fault& fault) {
            CHECK(fault.code == 42);
        }
    }

    TEST_CASE("009: a stop request skips operations not yet dispatched", "[009][runner]") {
        std::stop_source stop{};
        auto cfg = detail::quick_config();
        std::vector<operation_spec> operations{};
        for (auto name : {"a", "b", "c", "d"}) {
            operations.push_back(one_component_spec("m", name));
        }

        std::vector<run_event_kind> events{};
        auto ctx = run_context{
                .operations = operations,
                .config = cfg,
                .factory = make_scripted_factory(linear_script(5.0, {})),
                .observer =
                        [&](const run_event& event) {
                            events.push_back(event.kind);
                            if (event.kind == run_event_kind::finished && event.spec->name == "a") {
                                stop.request_stop();
                            }
                        }};

        auto report = run(ctx, stop.get_token());
        CHECK(report.cancelled);
        REQUIRE(report.outcomes.size() == 4U);
        CHECK(report.outcomes[0].status == outcome_status::succeeded);
        CHECK(report.count(outcome_status::skipped) == 3U);
        CHECK(std::ranges::count(events, run_event_kind::skipped) == 3);
        CHECK(std::ranges::count(events, run_event_kind::trial) == 6);
    }

    TEST_CASE("009: outputs are written per module and as json", "[009][runner]") {
        detail::temp_dir temp{"tare_runner_outputs"};
        auto cfg = detail::quick_config();
        cfg.output_path = temp.path;
        cfg.raw_path = temp.path / "raw" / "samples.json";
        cfg.json_path = temp.path / "results.json";

        auto header = temp.path / "header.txt";
        detail::write_text_file(header, "// SPDX-License-Identifier: Apache-2.0\n");
        cfg.header_file = header;

        auto ctx = run_context{
                .operations = {one_component_spec("kv", "insert"), {.module = "system", .name = "noop"}},
                .config = cfg,
                .factory = make_scripted_factory(linear_script(10.0, {{"n", 2.0}}))};
        auto report = run(ctx);
        auto written = write_outputs(report, cfg);

        std::set<std::filesystem::path> paths{written.begin(), written.end()};
        CHECK(paths.contains(temp.path / "kv_weights.hpp"));
        CHECK(paths.contains(temp.path / "system_weights.hpp"));
        CHECK(paths.contains(*cfg.raw_path));
        CHECK(paths.contains(*cfg.json_path));

        auto kv = detail::read_text_file(temp.path / "kv_weights.hpp");
        CHECK(kv.starts_with("// SPDX-License-Identifier: Apache-2.0\n\n"));
        CHECK_THAT(kv, ContainsSubstring("namespace kv::weights {"));
        CHECK_THAT(kv, ContainsSubstring("{.ref_time = 10000,"));
        CHECK_THAT(kv, ContainsSubstring("{.slope = {.ref_time = 2000,"));

        auto results = deserialize_results(detail::read_text_file(*cfg.json_path));
        CHECK(results == report.results());
        auto samples = deserialize_samples(detail::read_text_file(*cfg.raw_path));
        CHECK(samples == report.sample_sets());

        auto rerun = run(ctx);
        CHECK(render_modules(rerun.results(), cfg.render, render_metadata{.trials = cfg.trials}) ==
              render_modules(report.results(), cfg.render, render_metadata{.trials = cfg.trials}));
    }

    TEST_CASE("009: a file output path accepts a single module only", "[009][runner]") {
        detail::temp_dir temp{"tare_runner_file"};
        auto cfg = detail::quick_config();
        cfg.output_path = temp.path / "weights.hpp";

        auto single = run_context{
                .operations = {one_component_spec("kv", "insert")},
                .config = cfg,
                .factory = make_scripted_factory(linear_script(10.0, {{"n", 2.0}}))};
        auto written = write_outputs(run(single), cfg);
        REQUIRE(written.size() == 1U);
        CHECK(written.front() == temp.path / "weights.hpp");
        CHECK_THAT(detail::read_text_file(written.front()), ContainsSubstring("insert(std::uint64_t n)"));

        auto many = single;
        many.operations.push_back({.module = "system", .name = "noop"});
        CHECK_THROWS_AS(write_outputs(run(many), cfg), benchmark_error);
    }

    TEST_CASE("009: bundled runtime modules benchmark end to end", "[009][runner][demo]") {
        registry ops{};
        demo::register_modules(ops);
        REQUIRE_NOTHROW(ops.validate());

        auto cfg = detail::quick_config();
        cfg.modules = {"kv", "balances"};
        cfg.adapter.verify = true;
        cfg.jobs = 2U;
        auto ctx = run_context{
                .operations = ops.specs(),
                .config = cfg,
                .factory = make_memory_sandbox_factory(ops, demo::genesis(), demo::whitelisted_keys())};

        auto report = run(ctx);
        CHECK(report.count(outcome_status::failed) == 0U);
        for (const auto& outcome : report.outcomes) {
            INFO(outcome.spec.qualified_name());
            CHECK(outcome.status == outcome_status::succeeded);
            CHECK(outcome.spec.module != "system");
            CHECK_FALSE(outcome.spec.extra);
        }

        auto find = [&](std::string_view name) -> const operation_result& {
            auto it = std::ranges::find_if(report.outcomes, [&](const auto& o) { return o.spec.name == name; });
            REQUIRE(it != report.outcomes.end());
            REQUIRE(it->result);
            return *it->result;
        };

        const auto& insert = find("insert_many");
        CHECK_THAT(insert.model_for(metric::writes)->slope_of("n").value_or(0.0), WithinAbs(1.0, 1e-9));
        CHECK_THAT(insert.model_for(metric::reads)->base, WithinAbs(0.0, 1e-9));

        const auto& read_write = find("read_write");
        CHECK_THAT(read_write.model_for(metric::reads)->slope_of("r").value_or(0.0), WithinAbs(1.0, 1e-9));
        CHECK_THAT(read_write.model_for(metric::writes)->slope_of("w").value_or(0.0), WithinAbs(1.0, 1e-9));
        CHECK_THAT(read_write.model_for(metric::proof_size)->slope_of("r").value_or(0.0), WithinAbs(48.0, 1e-9));

        const auto& transfer = find("transfer");
        CHECK_THAT(transfer.model_for(metric::reads)->base, WithinAbs(2.0, 1e-9));
        CHECK_THAT(transfer.model_for(metric::writes)->base, WithinAbs(2.0, 1e-9));
    }

    TEST_CASE("009: execute maps outcomes to exit codes", "[009][cli]") {
        auto declared = std::vector<operation_spec>{one_component_spec("kv", "insert")};
        auto factory = make_scripted_factory(linear_script(10.0, {{"n", 2.0}}));

        auto exit_code = [&](std::vector<std::string> args) {
            auto argv = detail::to_argv(args);
            return cli::execute(static_cast<int>(argv.size()), argv.data(), declared, factory);
        };

        CHECK(exit_code({"tare", "--steps", "2", "--repeat", "2", "--quiet"}) == 0);
        CHECK(exit_code({"tare", "--list"}) == 0);
        CHECK(exit_code({"tare", "--steps", "0"}) == 2);

        auto failing = make_scripted_factory([](const operation_spec&, const component_assignment&, size_t) {
            return scripted_outcome{.fail = true};
        });
        std::vector<std::string> args{"tare", "--steps", "2", "--repeat", "2", "--quiet"};
        auto argv = detail::to_argv(args);
        CHECK(cli::execute(static_cast<int>(argv.size()), argv.data(), declared, failing) == 1);

        std::stop_source cancelled{};
        cancelled.request_stop();
        CHECK(cli::execute(static_cast<int>(argv.size()), argv.data(), declared, factory, cancelled.get_token()) == 130);
    }

}  // namespace tare::test
