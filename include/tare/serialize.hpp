#pragma once

#include "types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace tare {

    inline constexpr int results_schema_version = 1;

    // JSON documents for archival and cross-run comparison. Serializing what was deserialized
    // reproduces the input bytes. Parse failures throw std::runtime_error.
    std::string serialize_results(const std::vector<operation_result>& results);
    std::vector<operation_result> deserialize_results(std::string_view json);

    std::string serialize_samples(const std::vector<sample_set>& samples);
    std::vector<sample_set> deserialize_samples(std::string_view json);

}  // namespace tare
