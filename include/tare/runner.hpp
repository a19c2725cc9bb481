#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "sandbox.hpp"
#include "types.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace tare {

    enum class outcome_status : uint8_t { succeeded, failed, skipped };

    inline constexpr std::string_view to_string(outcome_status status) {
        switch (status) {
            case outcome_status::succeeded:
                return "succeeded"sv;
            case outcome_status::failed:
                return "failed"sv;
            case outcome_status::skipped:
                return "skipped"sv;
        }
        return "skipped"sv;
    }

    struct failure_record {
        error_kind kind{error_kind::trial_execution_failure};
        std::string message{};
        std::optional<component_assignment> assignment{};
    };

    struct operation_outcome {
        operation_spec spec{};
        outcome_status status{outcome_status::skipped};
        std::optional<operation_result> result{};
        std::optional<sample_set> samples{};
        std::optional<failure_record> failure{};
    };

    struct run_report {
        std::vector<operation_outcome> outcomes{};
        bool cancelled{false};

        std::vector<operation_result> results() const;
        std::vector<sample_set> sample_sets() const;
        size_t count(outcome_status status) const;
    };

    enum class run_event_kind : uint8_t { started, trial, finished, failed, skipped };

    struct run_event {
        run_event_kind kind{run_event_kind::started};
        size_t worker{};
        const operation_spec* spec{nullptr};
        const raw_sample* sample{nullptr};
        const failure_record* failure{nullptr};
    };

    // Called from worker threads; must tolerate concurrent calls when jobs > 1
    using run_observer = std::function<void(const run_event&)>;

    /*
     * Everything one run needs, passed explicitly so independent runs can coexist in a process.
     * `operations` are the declarations to choose from; `config` selects among them.
     */
    struct run_context {
        std::vector<operation_spec> operations{};
        run_config config{};
        sandbox_factory factory{};
        run_observer observer{};
    };

    /*
     * Validates declarations and applies the module/operation patterns and the extra filter,
     * keeping declaration order. Throws benchmark_error{invalid_declaration} for a malformed
     * declaration and benchmark_error{invalid_configuration} when a pattern selects nothing.
     */
    std::vector<operation_spec> select_operations(const std::vector<operation_spec>& declared, const run_config& cfg);

    /*
     * Benchmarks every selected operation on a pool of `cfg.jobs` workers. Each worker owns one
     * execution_adapter (and so one sandbox) and runs its operation's trials in order. Operation-level
     * errors become failed outcomes and siblings continue; run-level errors are rethrown after all
     * workers stop. Once `stop` is requested no further operations are dispatched and the remainder
     * is reported as skipped.
     */
    run_report run(const run_context& ctx, std::stop_token stop = {});

    /*
     * Writes the generated units for all succeeded operations to `cfg.output_path`, and the raw
     * samples / results JSON when requested. Returns the paths written.
     */
    std::vector<std::filesystem::path> write_outputs(const run_report& report, const run_config& cfg);

}  // namespace tare
