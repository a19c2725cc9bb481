#include "tare/render.hpp"

#include "tare/errors.hpp"
#include "tare/format.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>

#include <kainjow/mustache.hpp>

using namespace tare::literals;

namespace tare {

    namespace mustache = kainjow::mustache;

    namespace detail {

        [[noreturn]] static void inconsistent(const operation_result& result, std::string message) {
            throw benchmark_error{
                    error_kind::rendering_inconsistency, std::move(message), result.spec.module, result.spec.name};
        }

        static void check_result(std::string_view module, const operation_result& result) {
            auto fail = [&](std::string message) { inconsistent(result, std::move(message)); };

            if (result.spec.module != module) {
                fail("result belongs to module {}, not {}"_format(result.spec.module, module));
            }
            for (auto m : all_metrics) {
                const auto* model = result.model_for(m);
                if (!model) {
                    inconsistent(result, "missing {} model"_format(to_string(m)));
                }
                if (model->per_component.size() != result.spec.components.size()) {
                    fail("{} model has {} coefficients for {} components"_format(
                            to_string(m), model->per_component.size(), result.spec.components.size()));
                }
                if (!std::isfinite(model->base)) {
                    fail("{} base is not finite"_format(to_string(m)));
                }
                for (size_t c = 0U; c < result.spec.components.size(); ++c) {
                    const auto& slope = model->per_component[c];
                    if (slope.name != result.spec.components[c].name) {
                        fail("{} model coefficient {} does not match component {}"_format(
                                to_string(m), slope.name, result.spec.components[c].name));
                    }
                    if (!std::isfinite(slope.slope)) {
                        fail("{} slope for {} is not finite"_format(to_string(m), slope.name));
                    }
                }
            }
        }

        static double scale_for(metric m, const render_config& config) {
            return m == metric::time ? config.ticks_per_nanosecond : 1.0;
        }

        struct coefficients {
            int64_t ref_time{};
            int64_t proof_size{};
            int64_t reads{};
            int64_t writes{};
        };

        static coefficients base_coefficients(const operation_result& result, const render_config& config) {
            auto q = [&](metric m) {
                return quantize(result.model_for(m)->base, scale_for(m, config), config.negative_slopes);
            };
            return {q(metric::time), q(metric::proof_size), q(metric::reads), q(metric::writes)};
        }

        static coefficients slope_coefficients(
                const operation_result& result, size_t component, const render_config& config) {
            auto q = [&](metric m) {
                return quantize(
                        result.model_for(m)->per_component[component].slope,
                        scale_for(m, config),
                        config.negative_slopes);
            };
            return {q(metric::time), q(metric::proof_size), q(metric::reads), q(metric::writes)};
        }

        static std::string coefficients_literal(const coefficients& c) {
            return "{{.ref_time = {}, .proof_size = {}, .reads = {}, .writes = {}}}"_format(
                    c.ref_time, c.proof_size, c.reads, c.writes);
        }

        // Standalone section tags are dropped together with their line
        static constexpr auto default_template = R"mustache({{header}}// Cost models for the `{{module}}` module.
//
// Generated by tare {{version}}. Do not edit by hand.
// steps: {{steps}}, repeats: {{repeats}}, lowest_range_only: {{lowest_range_only}}, highest_range_only: {{highest_range_only}}
// analysis: {{analysis}}, trim_fraction: {{trim_fraction}}
// negative coefficients: {{negative_slopes}}
// ref_time: {{ticks_per_nanosecond}} ticks per nanosecond

#pragma once

#include <tare/weight.hpp>

#include <cstdint>

namespace {{module}}::weights {
{{#operations}}

    // {{name}}({{ranges}})
    // samples: {{sample_count}}, discarded: {{discarded_count}}
    // r_squared: {{r_squared}}
    {{#has_flags}}
    // flags: {{flags}}
    {{/has_flags}}
    inline constexpr tare::weight {{name}}({{parameters}}) {
    {{^has_components}}
        return tare::evaluate({{base}});
    {{/has_components}}
    {{#has_components}}
        return tare::evaluate(
                {{base}},
                {
                {{#components}}
                        {.slope = {{slope}}, .value = {{name}}},
                {{/components}}
                });
    {{/has_components}}
    }
{{/operations}}

}  // namespace {{module}}::weights
)mustache"sv;

        static std::string header_block(const render_config& config) {
            if (!config.header_text || config.header_text->empty()) {
                return {};
            }
            auto block = *config.header_text;
            if (block.back() != '\n') {
                block.push_back('\n');
            }
            block.push_back('\n');
            return block;
        }

        static mustache::data operation_data(const operation_result& result, const render_config& config) {
            const auto& spec = result.spec;

            std::vector<std::string> ranges{};
            std::vector<std::string> params{};
            mustache::data components{mustache::data::type::list};
            for (size_t c = 0U; c < spec.components.size(); ++c) {
                const auto& component = spec.components[c];
                ranges.push_back("{}: {}..={}"_format(component.name, component.min, component.max));
                params.push_back("std::uint64_t {}"_format(component.name));

                mustache::data entry{};
                entry.set("name", component.name);
                entry.set("min", std::to_string(component.min));
                entry.set("max", std::to_string(component.max));
                entry.set("slope", coefficients_literal(slope_coefficients(result, c, config)));
                components.push_back(entry);
            }

            std::vector<std::string> fit_quality{};
            std::vector<std::string> flags{};
            for (auto m : all_metrics) {
                const auto* model = result.model_for(m);
                fit_quality.push_back("{} {:.6f}"_format(to_string(m), model->r_squared));
                for (auto flag : model->flags) {
                    flags.push_back("{} {}"_format(to_string(m), to_string(flag)));
                }
            }

            mustache::data out{};
            out.set("name", spec.name);
            out.set("ranges", utils::join_with_separator(ranges, ", "sv));
            out.set("parameters", utils::join_with_separator(params, ", "sv));
            out.set("sample_count", std::to_string(result.sample_count));
            out.set("discarded_count", std::to_string(result.discarded_count));
            out.set("r_squared", utils::join_with_separator(fit_quality, ", "sv));
            out.set("has_flags", !flags.empty());
            out.set("flags", utils::join_with_separator(flags, ", "sv));
            out.set("base", coefficients_literal(base_coefficients(result, config)));
            out.set("has_components", !spec.components.empty());
            out.set("components", components);
            return out;
        }

        static mustache::data unit_data(
                std::string_view module,
                const std::vector<const operation_result*>& ordered,
                const render_config& config,
                const render_metadata& metadata) {
            mustache::data operations{mustache::data::type::list};
            for (const auto* result : ordered) {
                operations.push_back(operation_data(*result, config));
            }

            mustache::data out{};
            out.set("header", header_block(config));
            out.set("module", std::string{module});
            out.set("version", std::string{version});
            out.set("steps", std::to_string(metadata.trials.steps));
            out.set("repeats", std::to_string(metadata.trials.repeats));
            out.set("lowest_range_only", "{}"_format(metadata.trials.lowest_range_only));
            out.set("highest_range_only", "{}"_format(metadata.trials.highest_range_only));
            out.set("analysis", std::string{to_string(metadata.analysis.method)});
            out.set("trim_fraction", "{:.3f}"_format(metadata.analysis.trim_fraction));
            out.set("negative_slopes", std::string{to_string(config.negative_slopes)});
            out.set("ticks_per_nanosecond", "{:.3f}"_format(config.ticks_per_nanosecond));
            out.set("operations", operations);
            return out;
        }

    }  // namespace detail

    int64_t quantize(double value, double scale, negative_slope_policy policy) {
        auto scaled = value * scale;
        scaled = std::round(scaled * 1e6) / 1e6;
        auto rounded = std::ceil(scaled);
        if (policy == negative_slope_policy::clamp && rounded < 0.0) {
            return 0;
        }
        constexpr auto hi = static_cast<double>(std::numeric_limits<int64_t>::max());
        constexpr auto lo = static_cast<double>(std::numeric_limits<int64_t>::min());
        if (rounded >= hi) {
            return std::numeric_limits<int64_t>::max();
        }
        if (rounded <= lo) {
            return std::numeric_limits<int64_t>::min();
        }
        return static_cast<int64_t>(rounded);
    }

    std::string render_module(
            std::string_view module,
            const std::vector<operation_result>& results,
            const render_config& config,
            const render_metadata& metadata) {
        std::vector<const operation_result*> ordered{};
        ordered.reserve(results.size());
        for (const auto& result : results) {
            detail::check_result(module, result);
            ordered.push_back(&result);
        }
        std::ranges::sort(ordered, {}, [](const operation_result* r) { return std::string_view{r->spec.name}; });
        for (size_t i = 1U; i < ordered.size(); ++i) {
            if (ordered[i]->spec.name == ordered[i - 1U]->spec.name) {
                throw benchmark_error{
                        error_kind::rendering_inconsistency,
                        "operation rendered twice",
                        ordered[i]->spec.module,
                        ordered[i]->spec.name};
            }
        }

        mustache::mustache unit{config.template_text ? *config.template_text : std::string{detail::default_template}};
        if (!unit.is_valid()) {
            throw benchmark_error{
                    error_kind::invalid_configuration, "invalid unit template: {}"_format(unit.error_message())};
        }
        // generated code, not markup
        unit.set_custom_escape([](const std::string& text) { return text; });
        return unit.render(detail::unit_data(module, ordered, config, metadata));
    }

    std::vector<rendered_unit> render_modules(
            const std::vector<operation_result>& results,
            const render_config& config,
            const render_metadata& metadata) {
        std::set<std::string> modules{};
        for (const auto& result : results) {
            modules.insert(result.spec.module);
        }

        std::vector<rendered_unit> units{};
        units.reserve(modules.size());
        for (const auto& module : modules) {
            std::vector<operation_result> members{};
            for (const auto& result : results) {
                if (result.spec.module == module) {
                    members.push_back(result);
                }
            }
            units.push_back(rendered_unit{module, render_module(module, members, config, metadata)});
        }
        return units;
    }

}  // namespace tare
