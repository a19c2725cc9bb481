#include "tare/runner.hpp"

#include "tare/analysis.hpp"
#include "tare/collector.hpp"
#include "tare/format.hpp"
#include "tare/planner.hpp"
#include "tare/registry.hpp"
#include "tare/render.hpp"
#include "tare/serialize.hpp"

#include "internal/io.hpp"
#include "internal/pool.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <numeric>
#include <set>
#include <stdexcept>

using namespace tare::literals;

namespace tare {

    namespace fs = std::filesystem;

    std::vector<operation_result> run_report::results() const {
        std::vector<operation_result> out{};
        for (const auto& outcome : outcomes) {
            if (outcome.status == outcome_status::succeeded && outcome.result) {
                out.push_back(*outcome.result);
            }
        }
        return out;
    }

    std::vector<sample_set> run_report::sample_sets() const {
        std::vector<sample_set> out{};
        for (const auto& outcome : outcomes) {
            if (outcome.samples) {
                out.push_back(*outcome.samples);
            }
        }
        return out;
    }

    size_t run_report::count(outcome_status status) const {
        return static_cast<size_t>(
                std::ranges::count_if(outcomes, [status](const auto& o) { return o.status == status; }));
    }

    namespace detail {

        static bool matches_any(const std::vector<std::string>& patterns, std::string_view text) {
            return std::ranges::any_of(patterns, [text](const auto& p) { return utils::wildcard_match(p, text); });
        }

        static void notify(const run_context& ctx, const run_event& event) {
            if (ctx.observer) {
                ctx.observer(event);
            }
        }

        static void benchmark_operation(
                const run_context& ctx,
                size_t worker,
                operation_outcome& outcome,
                execution_adapter& adapter,
                std::stop_token stop) {
            const auto& cfg = ctx.config;
            notify(ctx, {.kind = run_event_kind::started, .worker = worker, .spec = &outcome.spec});

            auto observer = sample_observer{};
            if (ctx.observer) {
                observer = [&](const raw_sample& sample) {
                    notify(ctx,
                           {.kind = run_event_kind::trial, .worker = worker, .spec = &outcome.spec, .sample = &sample});
                };
            }

            auto planned = sweep_planner{outcome.spec, cfg.trials}.size();
            outcome.samples = gather_samples(outcome.spec, cfg.trials, adapter, observer, stop);
            if (outcome.samples->samples.size() < planned) {
                debug_log("abandoning partially sampled ", outcome.spec.qualified_name());
                outcome.status = outcome_status::skipped;
                return;
            }

            try {
                check_sample_set(*outcome.samples, cfg.collector);
                outcome.result = analyze_operation(*outcome.samples, cfg.analysis);
                outcome.status = outcome_status::succeeded;
                notify(ctx, {.kind = run_event_kind::finished, .worker = worker, .spec = &outcome.spec});
            } catch (const benchmark_error& e) {
                if (!is_operation_level(e.kind())) {
                    throw;
                }
                outcome.status = outcome_status::failed;
                outcome.failure = failure_record{.kind = e.kind(), .message = e.detail(), .assignment = e.assignment()};
                debug_log(e.what());
                notify(ctx,
                       {.kind = run_event_kind::failed,
                        .worker = worker,
                        .spec = &outcome.spec,
                        .failure = &*outcome.failure});
            }
        }

    }  // namespace detail

    std::vector<operation_spec> select_operations(const std::vector<operation_spec>& declared, const run_config& cfg) {
        std::set<std::string, std::less<>> seen{};
        for (const auto& spec : declared) {
            validate_declaration(spec);
            if (!seen.insert(spec.qualified_name()).second) {
                throw benchmark_error{
                        error_kind::invalid_declaration, "operation declared more than once", spec.module, spec.name};
            }
        }

        for (const auto& pattern : cfg.modules) {
            auto found = std::ranges::any_of(
                    declared, [&pattern](const auto& spec) { return utils::wildcard_match(pattern, spec.module); });
            if (!found) {
                throw benchmark_error{
                        error_kind::invalid_configuration, "module pattern '{}' matches no module"_format(pattern)};
            }
        }

        std::vector<operation_spec> selected{};
        for (const auto& spec : declared) {
            if (spec.extra && !cfg.include_extra) {
                continue;
            }
            if (detail::matches_any(cfg.modules, spec.module) && detail::matches_any(cfg.operations, spec.name)) {
                selected.push_back(spec);
            }
        }

        if (selected.empty()) {
            throw benchmark_error{
                    error_kind::invalid_configuration,
                    "no operation matches modules [{}] and operations [{}]"_format(
                            utils::join_with_separator(cfg.modules, ", "),
                            utils::join_with_separator(cfg.operations, ", "))};
        }
        return selected;
    }

    run_report run(const run_context& ctx, std::stop_token stop) {
        validate(ctx.config);
        if (!ctx.factory) {
            throw std::invalid_argument("run requires a sandbox factory");
        }

        auto selected = select_operations(ctx.operations, ctx.config);

        auto report = run_report{};
        report.outcomes.reserve(selected.size());
        for (auto& spec : selected) {
            report.outcomes.push_back(operation_outcome{.spec = std::move(spec)});
        }

        std::vector<size_t> order(report.outcomes.size());
        std::iota(order.begin(), order.end(), size_t{0});
        internal::dispatch_queue<size_t> queue{std::move(order)};

        std::stop_source run_stop{};
        std::stop_callback forward_stop{stop, [&run_stop]() { run_stop.request_stop(); }};

        std::mutex error_mutex{};
        std::exception_ptr run_error{};
        auto abort_run = [&](std::exception_ptr error) {
            {
                std::lock_guard lock{error_mutex};
                if (!run_error) {
                    run_error = std::move(error);
                }
            }
            run_stop.request_stop();
        };

        auto workers = std::min<size_t>(ctx.config.jobs, report.outcomes.size());
        debug_log("benchmarking ", report.outcomes.size(), " operations on ", workers, " workers");

        // every outcome slot is written by exactly one worker
        internal::run_workers(workers, run_stop.get_token(), [&](size_t worker, std::stop_token token) {
            std::optional<execution_adapter> adapter{};
            while (auto index = queue.pop(token)) {
                auto& outcome = report.outcomes[*index];
                try {
                    if (!adapter) {
                        adapter.emplace(ctx.factory, ctx.config.adapter);
                    }
                    detail::benchmark_operation(ctx, worker, outcome, *adapter, token);
                } catch (const std::exception& e) {
                    debug_log("run aborted by ", outcome.spec.qualified_name(), ": ", e.what());
                    abort_run(std::current_exception());
                } catch (...) {
                    debug_log("run aborted by ", outcome.spec.qualified_name(), ": non-standard exception");
                    abort_run(std::current_exception());
                }
            }
            if (adapter && adapter->abandoned_count() > 0U) {
                debug_log("worker ", worker, " abandoned ", adapter->abandoned_count(), " timed out trials");
            }
        });

        if (run_error) {
            std::rethrow_exception(run_error);
        }

        report.cancelled = stop.stop_requested();
        for (const auto& outcome : report.outcomes) {
            if (outcome.status == outcome_status::skipped) {
                detail::notify(ctx, {.kind = run_event_kind::skipped, .spec = &outcome.spec});
            }
        }
        return report;
    }

    std::vector<fs::path> write_outputs(const run_report& report, const run_config& cfg) {
        std::vector<fs::path> written{};
        auto results = report.results();

        if (cfg.output_path) {
            auto render = cfg.render;
            if (cfg.header_file && !render.header_text) {
                render.header_text = internal::read_text_file(*cfg.header_file);
            }
            if (cfg.template_file && !render.template_text) {
                render.template_text = internal::read_text_file(*cfg.template_file);
            }
            auto units = render_modules(results, render, render_metadata{.trials = cfg.trials, .analysis = cfg.analysis});

            const auto& out = *cfg.output_path;
            std::error_code ec{};
            if (fs::is_directory(out, ec)) {
                for (const auto& unit : units) {
                    auto path = out / "{}_weights.hpp"_format(unit.module);
                    internal::write_text_file(path, unit.text);
                    written.push_back(std::move(path));
                }
            }
            else if (units.size() > 1U) {
                throw benchmark_error{
                        error_kind::invalid_configuration,
                        "{} modules produced results but {} is not a directory"_format(units.size(), out.string())};
            }
            else if (units.size() == 1U) {
                internal::write_text_file(out, units.front().text);
                written.push_back(out);
            }
            else {
                debug_log("no operation succeeded; nothing rendered to ", out.string());
            }
        }

        if (cfg.raw_path) {
            internal::write_text_file(*cfg.raw_path, serialize_samples(report.sample_sets()));
            written.push_back(*cfg.raw_path);
        }
        if (cfg.json_path) {
            internal::write_text_file(*cfg.json_path, serialize_results(results));
            written.push_back(*cfg.json_path);
        }
        return written;
    }

}  // namespace tare
