#pragma once

#include "config.hpp"
#include "types.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tare {

    // Sweep and fit settings echoed into the generated comment header
    struct render_metadata {
        trial_config trials{};
        analysis_config analysis{};
    };

    struct rendered_unit {
        std::string module{};
        std::string text{};
    };

    /*
     * Converts a fitted coefficient to accounting units: scale, drop noise below 1e-6 units, then
     * round up so the generated model never under-estimates what was measured. Under
     * negative_slope_policy::clamp negative values become zero.
     */
    int64_t quantize(double value, double scale, negative_slope_policy policy);

    /*
     * Renders one C++ header for `module` from its operation results. Operations are emitted in name
     * order and components in declaration order; the text contains no timestamps, so equal inputs give
     * byte-identical output.
     *
     * The unit is a mustache template, `config.template_text` when set, else the built-in layout.
     * Values are emitted unescaped. Unit variables: header, module, version, steps, repeats,
     * lowest_range_only, highest_range_only, analysis, trim_fraction, negative_slopes,
     * ticks_per_nanosecond and the `operations` list. Each operation has name, ranges, parameters,
     * sample_count, discarded_count, r_squared, has_flags, flags, base, has_components and a
     * `components` list of {name, min, max, slope}. Coefficients are C++ designated initializers.
     *
     * Throws benchmark_error{rendering_inconsistency} when a result belongs to another module, lacks a
     * model for any metric, or its coefficients do not match its declared components, and
     * benchmark_error{invalid_configuration} for a malformed template.
     */
    std::string render_module(
            std::string_view module,
            const std::vector<operation_result>& results,
            const render_config& config = {},
            const render_metadata& metadata = {});

    // One unit per module present in `results`, ordered by module name
    std::vector<rendered_unit> render_modules(
            const std::vector<operation_result>& results,
            const render_config& config = {},
            const render_metadata& metadata = {});

}  // namespace tare
