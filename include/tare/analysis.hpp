#pragma once

#include "config.hpp"
#include "types.hpp"

#include <cstddef>
#include <vector>

namespace tare {

    // Median of one metric over the repeats of one distinct assignment
    struct data_point {
        component_assignment assignment{};
        std::vector<double> x{};
        double y{};
        size_t repeats{};
    };

    // Successful samples grouped by distinct assignment, ordered by assignment
    std::vector<data_point> group_medians(const sample_set& samples, metric kind);

    /*
     * Fits `base + sum(slope_c * value_c)` for one metric.
     *
     * least_squares: ordinary least squares over the per-assignment medians, optionally trimming the
     * highest and lowest `trim_fraction` of medians first. median_slopes: per component, the median of
     * slopes between points that differ only in that component; base is the median intercept.
     *
     * Coefficients are left as fitted. Negative ones set the matching model_flag.
     *
     * Throws benchmark_error with
     *   - empty_sample_set when no sample succeeded
     *   - underdetermined_model when there are fewer distinct assignments than free parameters, or a
     *     component does not vary independently of the others
     */
    cost_model analyze(const sample_set& samples, metric kind, const analysis_config& config = {});

    // One model per metric plus the sample accounting of `samples`
    operation_result analyze_operation(const sample_set& samples, const analysis_config& config = {});

}  // namespace tare
