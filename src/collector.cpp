#include "tare/collector.hpp"

#include "tare/errors.hpp"
#include "tare/format.hpp"

#include <optional>

using namespace tare::literals;

namespace tare {

    sample_set gather_samples(
            const operation_spec& spec,
            const trial_config& trials,
            execution_adapter& adapter,
            const sample_observer& observer,
            std::stop_token stop) {
        auto planner = sweep_planner{spec, trials};

        auto set = sample_set{.operation = spec};
        set.samples.reserve(planner.size());

        for (auto trial : planner) {
            if (stop.stop_requested()) {
                debug_log("stop requested after ", set.samples.size(), " trials of ", spec.qualified_name());
                break;
            }
            auto sample = adapter.execute(spec, trial.assignment);
            sample.trial = trial.index;
            if (!sample.succeeded) {
                debug_log("trial ", trial.index, " of ", spec.qualified_name(), " failed: ", sample.failure.value_or(""));
            }
            if (observer) {
                observer(sample);
            }
            set.samples.push_back(std::move(sample));
        }
        return set;
    }

    void check_sample_set(const sample_set& set, const collector_config& config) {
        const auto& spec = set.operation;
        auto total = set.samples.size();
        auto discarded = set.discarded_count();

        std::optional<component_assignment> first_failed{};
        std::optional<std::string> first_reason{};
        for (const auto& s : set.samples) {
            if (!s.succeeded) {
                first_failed = s.assignment;
                first_reason = s.failure;
                break;
            }
        }

        if (total == 0U) {
            throw benchmark_error{error_kind::empty_sample_set, "no trials were planned", spec.module, spec.name};
        }

        auto fraction = static_cast<double>(discarded) / static_cast<double>(total);
        if (fraction > config.max_discard_fraction) {
            throw benchmark_error{
                    error_kind::excessive_discard_rate,
                    "{} of {} trials failed ({:.1f}% > {:.1f}% allowed); first failure: {}"_format(
                            discarded,
                            total,
                            fraction * 100.0,
                            config.max_discard_fraction * 100.0,
                            first_reason.value_or("unknown")),
                    spec.module,
                    spec.name,
                    first_failed};
        }

        if (discarded == total) {
            throw benchmark_error{
                    error_kind::empty_sample_set,
                    "all {} trials failed; first failure: {}"_format(total, first_reason.value_or("unknown")),
                    spec.module,
                    spec.name,
                    first_failed};
        }
    }

    sample_set collect_samples(
            const operation_spec& spec,
            const trial_config& trials,
            execution_adapter& adapter,
            const collector_config& config,
            const sample_observer& observer) {
        auto set = gather_samples(spec, trials, adapter, observer);
        check_sample_set(set, config);
        return set;
    }

}  // namespace tare
