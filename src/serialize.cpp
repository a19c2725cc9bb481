#include "tare/serialize.hpp"

#include "tare/format.hpp"

#include "internal/types.hpp"

#include <glaze/glaze.hpp>

#include <stdexcept>

using namespace tare::literals;

namespace tare {

    namespace detail {

        static internal::operation_record to_record(const operation_spec& spec) {
            auto record = internal::operation_record{.module = spec.module, .name = spec.name, .extra = spec.extra};
            for (const auto& c : spec.components) {
                record.components.push_back({c.name, c.min, c.max});
            }
            return record;
        }

        static operation_spec from_record(const internal::operation_record& record) {
            auto spec = operation_spec{.module = record.module, .name = record.name, .extra = record.extra};
            for (const auto& c : record.components) {
                spec.components.push_back({c.name, c.min, c.max});
            }
            return spec;
        }

        static internal::sample_record to_record(const raw_sample& sample) {
            auto record = internal::sample_record{
                    .trial = sample.trial,
                    .elapsed_ns = sample.elapsed.count(),
                    .reads = sample.reads,
                    .writes = sample.writes,
                    .proof_size = sample.proof_size,
                    .succeeded = sample.succeeded,
                    .failure = sample.failure};
            for (const auto& v : sample.assignment.values) {
                record.assignment.push_back({v.name, v.value});
            }
            return record;
        }

        static raw_sample from_record(const internal::sample_record& record) {
            auto sample = raw_sample{
                    .trial = static_cast<size_t>(record.trial),
                    .elapsed = std::chrono::nanoseconds{record.elapsed_ns},
                    .reads = record.reads,
                    .writes = record.writes,
                    .proof_size = record.proof_size,
                    .succeeded = record.succeeded,
                    .failure = record.failure};
            for (const auto& v : record.assignment) {
                sample.assignment.values.push_back({v.name, v.value});
            }
            return sample;
        }

        static internal::model_record to_record(const cost_model& model) {
            auto record = internal::model_record{
                    .metric = std::string{to_string(model.kind)},
                    .base = model.base,
                    .r_squared = model.r_squared,
                    .data_points = model.data_points};
            for (const auto& s : model.per_component) {
                record.slopes.push_back({s.name, s.slope});
            }
            for (auto flag : model.flags) {
                record.flags.emplace_back(to_string(flag));
            }
            return record;
        }

        static cost_model from_record(const internal::model_record& record) {
            auto model = cost_model{
                    .base = record.base,
                    .r_squared = record.r_squared,
                    .data_points = static_cast<size_t>(record.data_points)};
            if (!try_parse_metric(record.metric, model.kind)) {
                throw std::runtime_error("unknown metric in results: {}"_format(record.metric));
            }
            for (const auto& s : record.slopes) {
                model.per_component.push_back({s.component, s.slope});
            }
            for (const auto& text : record.flags) {
                auto flag = model_flag::negative_slope;
                if (!try_parse_model_flag(text, flag)) {
                    throw std::runtime_error("unknown model flag in results: {}"_format(text));
                }
                model.flags.push_back(flag);
            }
            return model;
        }

        template <typename T>
        static std::string write_document(const T& document) {
            std::string json{};
            auto ec = glz::write_json(document, json);
            if (ec) {
                throw std::runtime_error("failed to serialize json document");
            }
            return json;
        }

        template <typename T>
        static T read_document(std::string_view text, std::string_view what) {
            T document{};
            auto json = std::string{text};
            auto ec = glz::read_json(document, json);
            if (ec) {
                throw std::runtime_error("failed to parse {} json: {}"_format(what, glz::format_error(ec, json)));
            }
            if (document.schema_version > results_schema_version) {
                throw std::runtime_error(
                        "unsupported schema_version in {} json: {} > {}"_format(
                                what, document.schema_version, results_schema_version));
            }
            return document;
        }

    }  // namespace detail

    std::string serialize_results(const std::vector<operation_result>& results) {
        auto document = internal::persisted_results{.schema_version = results_schema_version};
        document.results.reserve(results.size());
        for (const auto& result : results) {
            auto record = internal::result_record{
                    .operation = detail::to_record(result.spec),
                    .sample_count = result.sample_count,
                    .discarded_count = result.discarded_count};
            for (const auto& model : result.models) {
                record.models.push_back(detail::to_record(model));
            }
            document.results.push_back(std::move(record));
        }
        return detail::write_document(document);
    }

    std::vector<operation_result> deserialize_results(std::string_view json) {
        auto document = detail::read_document<internal::persisted_results>(json, "results");
        std::vector<operation_result> results{};
        results.reserve(document.results.size());
        for (const auto& record : document.results) {
            auto result = operation_result{
                    .spec = detail::from_record(record.operation),
                    .sample_count = static_cast<size_t>(record.sample_count),
                    .discarded_count = static_cast<size_t>(record.discarded_count)};
            for (const auto& model : record.models) {
                result.models.push_back(detail::from_record(model));
            }
            results.push_back(std::move(result));
        }
        return results;
    }

    std::string serialize_samples(const std::vector<sample_set>& samples) {
        auto document = internal::persisted_samples{.schema_version = results_schema_version};
        document.sample_sets.reserve(samples.size());
        for (const auto& set : samples) {
            auto record = internal::sample_set_record{.operation = detail::to_record(set.operation)};
            record.samples.reserve(set.samples.size());
            for (const auto& sample : set.samples) {
                record.samples.push_back(detail::to_record(sample));
            }
            document.sample_sets.push_back(std::move(record));
        }
        return detail::write_document(document);
    }

    std::vector<sample_set> deserialize_samples(std::string_view json) {
        auto document = detail::read_document<internal::persisted_samples>(json, "samples");
        std::vector<sample_set> sets{};
        sets.reserve(document.sample_sets.size());
        for (const auto& record : document.sample_sets) {
            auto set = sample_set{.operation = detail::from_record(record.operation)};
            for (const auto& sample : record.samples) {
                set.samples.push_back(detail::from_record(sample));
            }
            sets.push_back(std::move(set));
        }
        return sets;
    }

}  // namespace tare
