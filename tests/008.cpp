#include "utils.hpp"

namespace tare::test {

    namespace detail {
        static std::vector<operation_result> sample_results() {
            auto with_components = operation_result{
                    .spec = {.module = "kv",
                             .name = "read_write",
                             .components = {{"r", 0U, 500U}, {"w", 0U, 500U}},
                             .extra = true},
                    .sample_count = 40U,
                    .discarded_count = 2U};
            with_components.models.push_back(cost_model{
                    .kind = metric::time,
                    .base = 1234.5678901234,
                    .per_component = {{"r", 0.1}, {"w", -3.0e-7}},
                    .r_squared = 0.987654321,
                    .data_points = 9U,
                    .flags = {model_flag::negative_slope, model_flag::outliers_trimmed}});
            with_components.models.push_back(cost_model{
                    .kind = metric::reads, .base = 0.0, .per_component = {{"r", 1.0}, {"w", 0.0}}, .r_squared = 1.0});

            auto bare = operation_result{.spec = {.module = "system", .name = "noop"}, .sample_count = 20U};
            bare.models.push_back(cost_model{.kind = metric::proof_size, .base = -1.0, .flags = {model_flag::negative_base}});
            return {with_components, bare};
        }
    }  // namespace detail

    TEST_CASE("008: results survive a serialize and deserialize cycle", "[008][serialize]") {
        auto results = detail::sample_results();
        auto json = serialize_results(results);

        auto restored = deserialize_results(json);
        CHECK(restored == results);
        CHECK(serialize_results(restored) == json);

        CHECK_THAT(json, ContainsSubstring(R"("schema_version":1)"));
        CHECK_THAT(json, ContainsSubstring(R"("metric":"time")"));
        CHECK_THAT(json, ContainsSubstring(R"("negative_slope")"));
    }

    TEST_CASE("008: sample sets survive a serialize and deserialize cycle", "[008][serialize]") {
        auto set = sample_set{.operation = one_component_spec("kv", "insert")};
        set.samples.push_back(time_sample(assign({{"n", 0U}}), 1'500, 3U));
        set.samples.back().trial = 0U;
        set.samples.push_back(failed_sample(assign({{"n", 100U}}), "timed out after 50ms"));
        set.samples.back().trial = 1U;

        auto json = serialize_samples({set});
        auto restored = deserialize_samples(json);
        REQUIRE(restored.size() == 1U);
        CHECK(restored.front() == set);
        CHECK(serialize_samples(restored) == json);
        CHECK_THAT(json, ContainsSubstring(R"("failure":"timed out after 50ms")"));
    }

    TEST_CASE("008: malformed or newer documents are rejected", "[008][serialize]") {
        CHECK_THROWS_AS(deserialize_results("{not json"), std::runtime_error);
        CHECK_THROWS_WITH(
                deserialize_results(R"({"schema_version":2,"results":[]})"),
                ContainsSubstring("unsupported schema_version"));

        auto json = serialize_results(detail::sample_results());
        auto pos = json.find(R"("metric":"time")");
        REQUIRE(pos != std::string::npos);
        json.replace(pos, 15U, R"("metric":"heat")");
        CHECK_THROWS_WITH(deserialize_results(json), ContainsSubstring("unknown metric"));
    }

    TEST_CASE("008: empty collections serialize to documents without entries", "[008][serialize]") {
        auto json = serialize_results({});
        CHECK(deserialize_results(json).empty());
        CHECK(deserialize_samples(serialize_samples({})).empty());
    }

}  // namespace tare::test
