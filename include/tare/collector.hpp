#pragma once

#include "planner.hpp"
#include "sandbox.hpp"
#include "types.hpp"

#include <functional>
#include <stop_token>

namespace tare {

    using sample_observer = std::function<void(const raw_sample&)>;

    /*
     * Runs every planned trial in order and returns all samples, failed ones included. Once `stop` is
     * requested no further trial starts and the samples gathered so far are returned.
     */
    sample_set gather_samples(
            const operation_spec& spec,
            const trial_config& trials,
            execution_adapter& adapter,
            const sample_observer& observer = {},
            std::stop_token stop = {});

    /*
     * Throws benchmark_error with
     *   - empty_sample_set when no trial was planned or none succeeded
     *   - excessive_discard_rate when failed / total > max_discard_fraction
     * The error carries the assignment of the first failed trial.
     */
    void check_sample_set(const sample_set& set, const collector_config& config);

    // gather_samples followed by check_sample_set
    sample_set collect_samples(
            const operation_spec& spec,
            const trial_config& trials,
            execution_adapter& adapter,
            const collector_config& config = {},
            const sample_observer& observer = {});

}  // namespace tare
