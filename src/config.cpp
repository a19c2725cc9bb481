#include "tare/config.hpp"

#include "tare/errors.hpp"
#include "tare/format.hpp"

using namespace tare::literals;

namespace tare {

    namespace detail {

        [[noreturn]] static void invalid(std::string message) {
            throw benchmark_error{error_kind::invalid_configuration, std::move(message)};
        }

    }  // namespace detail

    void validate(const run_config& cfg) {
        if (cfg.trials.steps == 0U) {
            detail::invalid("steps must be at least 1");
        }
        if (cfg.trials.repeats == 0U) {
            detail::invalid("repeats must be at least 1");
        }
        if (cfg.trials.lowest_range_only && cfg.trials.highest_range_only) {
            detail::invalid("lowest_range_only and highest_range_only are mutually exclusive");
        }
        if (!(cfg.collector.max_discard_fraction >= 0.0 && cfg.collector.max_discard_fraction <= 1.0)) {
            detail::invalid("max_discard_fraction must be within [0, 1], got {}"_format(cfg.collector.max_discard_fraction));
        }
        if (cfg.adapter.timeout.count() <= 0) {
            detail::invalid("trial timeout must be positive, got {}ms"_format(cfg.adapter.timeout.count()));
        }
        if (cfg.jobs == 0U) {
            detail::invalid("jobs must be at least 1");
        }
        if (!(cfg.analysis.trim_fraction >= 0.0 && cfg.analysis.trim_fraction < 0.5)) {
            detail::invalid("trim_fraction must be within [0, 0.5), got {}"_format(cfg.analysis.trim_fraction));
        }
        if (!(cfg.render.ticks_per_nanosecond > 0.0)) {
            detail::invalid("ticks_per_nanosecond must be positive, got {}"_format(cfg.render.ticks_per_nanosecond));
        }
        if (cfg.modules.empty() || cfg.operations.empty()) {
            detail::invalid("at least one module and one operation pattern are required");
        }
    }

}  // namespace tare
