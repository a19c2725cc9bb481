#pragma once

#include <glaze/glaze.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tare::internal {

    struct component_record {
        std::string name{};
        uint32_t min{};
        uint32_t max{};
    };

    struct component_value_record {
        std::string name{};
        uint32_t value{};
    };

    struct operation_record {
        std::string module{};
        std::string name{};
        std::vector<component_record> components{};
        bool extra{false};
    };

    struct sample_record {
        uint64_t trial{};
        std::vector<component_value_record> assignment{};
        int64_t elapsed_ns{};
        uint64_t reads{};
        uint64_t writes{};
        uint64_t proof_size{};
        bool succeeded{false};
        std::optional<std::string> failure{};
    };

    struct sample_set_record {
        operation_record operation{};
        std::vector<sample_record> samples{};
    };

    struct slope_record {
        std::string component{};
        double slope{};
    };

    struct model_record {
        std::string metric{};
        double base{};
        std::vector<slope_record> slopes{};
        double r_squared{};
        uint64_t data_points{};
        std::vector<std::string> flags{};
    };

    struct result_record {
        operation_record operation{};
        std::vector<model_record> models{};
        uint64_t sample_count{};
        uint64_t discarded_count{};
    };

    struct persisted_results {
        int schema_version{1};
        std::vector<result_record> results{};
    };

    struct persisted_samples {
        int schema_version{1};
        std::vector<sample_set_record> sample_sets{};
    };

    // Config file; every field optional so a file may set any subset
    struct persisted_config {
        int schema_version{1};
        std::optional<std::vector<std::string>> modules{};
        std::optional<std::vector<std::string>> operations{};
        std::optional<bool> extra{};
        std::optional<uint32_t> steps{};
        std::optional<uint32_t> repeats{};
        std::optional<bool> lowest_range_only{};
        std::optional<bool> highest_range_only{};
        std::optional<double> max_discard_fraction{};
        std::optional<int64_t> trial_timeout_ms{};
        std::optional<bool> verify{};
        std::optional<unsigned> jobs{};
        std::optional<std::string> analysis{};
        std::optional<double> trim_fraction{};
        std::optional<std::string> negative_slopes{};
        std::optional<double> ticks_per_nanosecond{};
        std::optional<std::string> output{};
        std::optional<std::string> header{};
        std::optional<std::string> template_file{};
        std::optional<std::string> raw{};
        std::optional<std::string> json{};
    };

}  // namespace tare::internal

namespace glz {

    template <>
    struct meta<tare::internal::component_record> {
        using T = tare::internal::component_record;
        static constexpr auto value = object("name", &T::name, "min", &T::min, "max", &T::max);
    };

    template <>
    struct meta<tare::internal::component_value_record> {
        using T = tare::internal::component_value_record;
        static constexpr auto value = object("name", &T::name, "value", &T::value);
    };

    template <>
    struct meta<tare::internal::operation_record> {
        using T = tare::internal::operation_record;
        static constexpr auto value =
                object("module", &T::module, "name", &T::name, "components", &T::components, "extra", &T::extra);
    };

    template <>
    struct meta<tare::internal::sample_record> {
        using T = tare::internal::sample_record;
        static constexpr auto value =
                object("trial",
                       &T::trial,
                       "assignment",
                       &T::assignment,
                       "elapsed_ns",
                       &T::elapsed_ns,
                       "reads",
                       &T::reads,
                       "writes",
                       &T::writes,
                       "proof_size",
                       &T::proof_size,
                       "succeeded",
                       &T::succeeded,
                       "failure",
                       &T::failure);
    };

    template <>
    struct meta<tare::internal::sample_set_record> {
        using T = tare::internal::sample_set_record;
        static constexpr auto value = object("operation", &T::operation, "samples", &T::samples);
    };

    template <>
    struct meta<tare::internal::slope_record> {
        using T = tare::internal::slope_record;
        static constexpr auto value = object("component", &T::component, "slope", &T::slope);
    };

    template <>
    struct meta<tare::internal::model_record> {
        using T = tare::internal::model_record;
        static constexpr auto value =
                object("metric",
                       &T::metric,
                       "base",
                       &T::base,
                       "slopes",
                       &T::slopes,
                       "r_squared",
                       &T::r_squared,
                       "data_points",
                       &T::data_points,
                       "flags",
                       &T::flags);
    };

    template <>
    struct meta<tare::internal::result_record> {
        using T = tare::internal::result_record;
        static constexpr auto value =
                object("operation",
                       &T::operation,
                       "models",
                       &T::models,
                       "sample_count",
                       &T::sample_count,
                       "discarded_count",
                       &T::discarded_count);
    };

    template <>
    struct meta<tare::internal::persisted_results> {
        using T = tare::internal::persisted_results;
        static constexpr auto value = object("schema_version", &T::schema_version, "results", &T::results);
    };

    template <>
    struct meta<tare::internal::persisted_samples> {
        using T = tare::internal::persisted_samples;
        static constexpr auto value = object("schema_version", &T::schema_version, "sample_sets", &T::sample_sets);
    };

    template <>
    struct meta<tare::internal::persisted_config> {
        using T = tare::internal::persisted_config;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "modules",
                       &T::modules,
                       "operations",
                       &T::operations,
                       "extra",
                       &T::extra,
                       "steps",
                       &T::steps,
                       "repeats",
                       &T::repeats,
                       "lowest_range_only",
                       &T::lowest_range_only,
                       "highest_range_only",
                       &T::highest_range_only,
                       "max_discard_fraction",
                       &T::max_discard_fraction,
                       "trial_timeout_ms",
                       &T::trial_timeout_ms,
                       "verify",
                       &T::verify,
                       "jobs",
                       &T::jobs,
                       "analysis",
                       &T::analysis,
                       "trim_fraction",
                       &T::trim_fraction,
                       "negative_slopes",
                       &T::negative_slopes,
                       "ticks_per_nanosecond",
                       &T::ticks_per_nanosecond,
                       "output",
                       &T::output,
                       "header",
                       &T::header,
                       "template",
                       &T::template_file,
                       "raw",
                       &T::raw,
                       "json",
                       &T::json);
    };

}  // namespace glz
