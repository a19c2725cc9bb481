#include "tare/planner.hpp"

#include "tare/errors.hpp"
#include "tare/format.hpp"

#include <utility>

using namespace tare::literals;

namespace tare {

    sweep_planner::sweep_planner(operation_spec spec, trial_config config)
        : spec_{std::move(spec)}, config_{config} {
        if (config_.steps == 0U || config_.repeats == 0U) {
            throw benchmark_error{
                    error_kind::invalid_configuration,
                    "steps and repeats must be at least 1 (steps={}, repeats={})"_format(
                            config_.steps, config_.repeats),
                    spec_.module,
                    spec_.name};
        }
        if (config_.lowest_range_only && config_.highest_range_only) {
            throw benchmark_error{
                    error_kind::invalid_configuration,
                    "lowest_range_only and highest_range_only are mutually exclusive",
                    spec_.module,
                    spec_.name};
        }
        for (const auto& c : spec_.components) {
            if (c.min > c.max) {
                throw benchmark_error{
                        error_kind::invalid_declaration,
                        "component {} has min {} > max {}"_format(c.name, c.min, c.max),
                        spec_.module,
                        spec_.name};
            }
        }
    }

    size_t sweep_planner::size() const {
        if (spec_.components.empty()) {
            return config_.repeats;
        }
        return spec_.components.size() * config_.steps * config_.repeats;
    }

    uint32_t sweep_planner::value_at(size_t component, uint32_t step) const {
        const auto& c = spec_.components.at(component);
        if (config_.steps == 1U) {
            return c.min;
        }
        auto span = static_cast<uint64_t>(c.max) - c.min;
        return c.min + static_cast<uint32_t>(span * step / (config_.steps - 1U));
    }

    uint32_t sweep_planner::pinned_value(size_t component) const {
        const auto& c = spec_.components[component];
        return config_.highest_range_only ? c.max : c.min;
    }

    planned_trial sweep_planner::at(size_t index) const {
        auto trial = planned_trial{.index = index};
        if (spec_.components.empty()) {
            return trial;
        }

        auto per_component = static_cast<size_t>(config_.steps) * config_.repeats;
        trial.swept_component = index / per_component;
        trial.step = static_cast<uint32_t>((index % per_component) / config_.repeats);

        trial.assignment.values.reserve(spec_.components.size());
        for (size_t i = 0U; i < spec_.components.size(); ++i) {
            auto value = i == trial.swept_component ? value_at(i, trial.step) : pinned_value(i);
            trial.assignment.values.push_back(component_value{spec_.components[i].name, value});
        }
        return trial;
    }

}  // namespace tare
