#pragma once

#include "config.hpp"
#include "format.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tare {

    struct component {
        std::string name{};
        uint32_t min{};
        uint32_t max{};

        bool operator==(const component&) const = default;
    };

    struct component_value {
        std::string name{};
        uint32_t value{};

        bool operator==(const component_value&) const = default;
        auto operator<=>(const component_value&) const = default;
    };

    // One value per declared component, in declaration order
    struct component_assignment {
        static constexpr bool to_string_formattable = true;

        std::vector<component_value> values{};

        std::optional<uint32_t> value_of(std::string_view name) const {
            for (const auto& v : values) {
                if (v.name == name) {
                    return v.value;
                }
            }
            return std::nullopt;
        }

        std::string to_string() const {
            if (values.empty()) {
                return "<none>";
            }
            std::vector<std::string> parts{};
            parts.reserve(values.size());
            for (const auto& v : values) {
                parts.push_back(v.name + "=" + std::to_string(v.value));
            }
            return utils::join_with_separator(parts, ", "sv);
        }

        bool operator==(const component_assignment&) const = default;
        auto operator<=>(const component_assignment&) const = default;
    };

    struct operation_spec {
        std::string module{};
        std::string name{};
        std::vector<component> components{};
        bool extra{false};

        std::string qualified_name() const { return module + "::" + name; }

        bool operator==(const operation_spec&) const = default;
    };

    struct storage_counters {
        uint64_t reads{};
        uint64_t writes{};
        uint64_t proof_size{};

        bool operator==(const storage_counters&) const = default;
    };

    struct raw_sample {
        size_t trial{};
        component_assignment assignment{};
        std::chrono::nanoseconds elapsed{};
        uint64_t reads{};
        uint64_t writes{};
        uint64_t proof_size{};
        bool succeeded{false};
        std::optional<std::string> failure{};

        double value(metric m) const {
            switch (m) {
                case metric::time:
                    return static_cast<double>(elapsed.count());
                case metric::reads:
                    return static_cast<double>(reads);
                case metric::writes:
                    return static_cast<double>(writes);
                case metric::proof_size:
                    return static_cast<double>(proof_size);
            }
            return 0.0;
        }

        bool operator==(const raw_sample&) const = default;
    };

    // Appended to only by the collector; read-only once handed to analysis
    struct sample_set {
        operation_spec operation{};
        std::vector<raw_sample> samples{};

        size_t discarded_count() const {
            return static_cast<size_t>(std::ranges::count(samples, false, &raw_sample::succeeded));
        }

        bool operator==(const sample_set&) const = default;
    };

    enum class model_flag : uint8_t {
        negative_base,
        negative_slope,
        outliers_trimmed,
    };

    inline constexpr std::string_view to_string(model_flag flag) {
        switch (flag) {
            case model_flag::negative_base:
                return "negative_base"sv;
            case model_flag::negative_slope:
                return "negative_slope"sv;
            case model_flag::outliers_trimmed:
                return "outliers_trimmed"sv;
        }
        return "negative_slope"sv;
    }

    inline constexpr bool try_parse_model_flag(std::string_view text, model_flag& out) {
        for (auto flag : {model_flag::negative_base, model_flag::negative_slope, model_flag::outliers_trimmed}) {
            if (text == to_string(flag)) {
                out = flag;
                return true;
            }
        }
        return false;
    }

    struct component_slope {
        std::string name{};
        double slope{};

        bool operator==(const component_slope&) const = default;
    };

    struct cost_model {
        metric kind{metric::time};
        double base{};
        std::vector<component_slope> per_component{};
        double r_squared{};
        size_t data_points{};
        std::vector<model_flag> flags{};

        std::optional<double> slope_of(std::string_view name) const {
            for (const auto& s : per_component) {
                if (s.name == name) {
                    return s.slope;
                }
            }
            return std::nullopt;
        }

        bool has_flag(model_flag flag) const { return std::ranges::find(flags, flag) != flags.end(); }

        bool operator==(const cost_model&) const = default;
    };

    struct operation_result {
        operation_spec spec{};
        std::vector<cost_model> models{};
        size_t sample_count{};
        size_t discarded_count{};

        const cost_model* model_for(metric m) const {
            for (const auto& model : models) {
                if (model.kind == m) {
                    return &model;
                }
            }
            return nullptr;
        }

        bool operator==(const operation_result&) const = default;
    };

}  // namespace tare
