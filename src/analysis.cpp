#include "tare/analysis.hpp"

#include "tare/errors.hpp"
#include "tare/format.hpp"

#include "internal/stats.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <utility>

using namespace tare::literals;

namespace tare {

    namespace detail {

        // Fitted coefficients this close to zero from below are rounding noise, not negative cost
        static constexpr double negative_tolerance = 1e-9;

        struct fit {
            double base{};
            std::vector<double> slopes{};
        };

        [[noreturn]] static void underdetermined(const operation_spec& spec, std::string message) {
            throw benchmark_error{error_kind::underdetermined_model, std::move(message), spec.module, spec.name};
        }

        static std::vector<data_point> trim_outliers(
                std::vector<data_point> points, double trim_fraction, size_t free_parameters, bool& trimmed) {
            trimmed = false;
            if (trim_fraction <= 0.0 || points.size() <= free_parameters) {
                return points;
            }

            auto count = static_cast<size_t>(std::floor(static_cast<double>(points.size()) * trim_fraction));
            count = std::min(count, (points.size() - free_parameters) / 2U);
            if (count == 0U) {
                return points;
            }

            // ties broken by assignment keeps the choice of dropped points deterministic
            std::ranges::stable_sort(points, [](const data_point& lhs, const data_point& rhs) {
                if (lhs.y != rhs.y) {
                    return lhs.y < rhs.y;
                }
                return lhs.assignment < rhs.assignment;
            });
            points.erase(points.end() - static_cast<std::ptrdiff_t>(count), points.end());
            points.erase(points.begin(), points.begin() + static_cast<std::ptrdiff_t>(count));
            std::ranges::sort(points, {}, &data_point::assignment);
            trimmed = true;
            return points;
        }

        static fit fit_least_squares(const operation_spec& spec, const std::vector<data_point>& points) {
            auto k = spec.components.size();
            auto n = points.size();

            std::vector<double> ys{};
            ys.reserve(n);
            for (const auto& p : points) {
                ys.push_back(p.y);
            }
            auto y_mean = stats::mean(ys);
            if (k == 0U) {
                return {.base = y_mean};
            }

            // centered normal equations for the slopes; the intercept follows from the means
            std::vector<double> x_mean(k, 0.0);
            for (const auto& p : points) {
                for (size_t c = 0U; c < k; ++c) {
                    x_mean[c] += p.x[c];
                }
            }
            for (auto& m : x_mean) {
                m /= static_cast<double>(n);
            }

            std::vector<double> xtx(k * k, 0.0);
            std::vector<double> xty(k, 0.0);
            for (const auto& p : points) {
                for (size_t i = 0U; i < k; ++i) {
                    auto xi = p.x[i] - x_mean[i];
                    xty[i] += xi * (p.y - y_mean);
                    for (size_t j = 0U; j < k; ++j) {
                        xtx[i * k + j] += xi * (p.x[j] - x_mean[j]);
                    }
                }
            }

            auto solved = stats::solve_linear_system(std::move(xtx), std::move(xty), k);
            if (solved.singular) {
                underdetermined(
                        spec,
                        "component {} does not vary independently of the others"_format(
                                spec.components[solved.singular->column].name));
            }

            auto result = fit{.slopes = std::move(solved.solution)};
            result.base = y_mean;
            for (size_t c = 0U; c < k; ++c) {
                result.base -= result.slopes[c] * x_mean[c];
            }
            return result;
        }

        static fit fit_median_slopes(const operation_spec& spec, const std::vector<data_point>& points) {
            auto k = spec.components.size();
            auto result = fit{.slopes = std::vector<double>(k, 0.0)};

            for (size_t c = 0U; c < k; ++c) {
                std::vector<double> slopes{};
                for (size_t i = 0U; i < points.size(); ++i) {
                    for (size_t j = i + 1U; j < points.size(); ++j) {
                        const auto& a = points[i];
                        const auto& b = points[j];
                        if (a.x[c] == b.x[c]) {
                            continue;
                        }
                        auto others_equal = true;
                        for (size_t o = 0U; o < k && others_equal; ++o) {
                            others_equal = o == c || a.x[o] == b.x[o];
                        }
                        if (others_equal) {
                            slopes.push_back((b.y - a.y) / (b.x[c] - a.x[c]));
                        }
                    }
                }
                if (slopes.empty()) {
                    underdetermined(
                            spec,
                            "no two points differ only in component {}"_format(spec.components[c].name));
                }
                result.slopes[c] = stats::median(slopes);
            }

            std::vector<double> intercepts{};
            intercepts.reserve(points.size());
            for (const auto& p : points) {
                auto intercept = p.y;
                for (size_t c = 0U; c < k; ++c) {
                    intercept -= result.slopes[c] * p.x[c];
                }
                intercepts.push_back(intercept);
            }
            result.base = stats::median(intercepts);
            return result;
        }

    }  // namespace detail

    std::vector<data_point> group_medians(const sample_set& samples, metric kind) {
        std::map<component_assignment, std::vector<double>> groups{};
        for (const auto& s : samples.samples) {
            if (s.succeeded) {
                groups[s.assignment].push_back(s.value(kind));
            }
        }

        std::vector<data_point> points{};
        points.reserve(groups.size());
        for (auto& [assignment, values] : groups) {
            auto point = data_point{.assignment = assignment, .repeats = values.size()};
            point.x.reserve(samples.operation.components.size());
            for (const auto& c : samples.operation.components) {
                point.x.push_back(static_cast<double>(assignment.value_of(c.name).value_or(0U)));
            }
            point.y = stats::median(values);
            points.push_back(std::move(point));
        }
        return points;
    }

    cost_model analyze(const sample_set& samples, metric kind, const analysis_config& config) {
        const auto& spec = samples.operation;
        auto points = group_medians(samples, kind);
        if (points.empty()) {
            throw benchmark_error{
                    error_kind::empty_sample_set, "no successful samples to analyze", spec.module, spec.name};
        }

        auto free_parameters = spec.components.size() + 1U;
        if (points.size() < free_parameters) {
            detail::underdetermined(
                    spec,
                    "{} distinct assignments for {} free parameters (base + {} components)"_format(
                            points.size(), free_parameters, spec.components.size()));
        }

        auto trimmed = false;
        points = detail::trim_outliers(std::move(points), config.trim_fraction, free_parameters, trimmed);

        auto fitted = config.method == analysis_choice::median_slopes ? detail::fit_median_slopes(spec, points)
                                                                      : detail::fit_least_squares(spec, points);

        auto model = cost_model{.kind = kind, .base = fitted.base, .data_points = points.size()};
        model.per_component.reserve(spec.components.size());
        for (size_t c = 0U; c < spec.components.size(); ++c) {
            model.per_component.push_back(component_slope{spec.components[c].name, fitted.slopes[c]});
        }

        std::vector<double> observed{};
        std::vector<double> predicted{};
        for (const auto& p : points) {
            auto estimate = fitted.base;
            for (size_t c = 0U; c < p.x.size(); ++c) {
                estimate += fitted.slopes[c] * p.x[c];
            }
            observed.push_back(p.y);
            predicted.push_back(estimate);
        }
        model.r_squared = stats::r_squared(observed, predicted);

        if (model.base < -detail::negative_tolerance) {
            model.flags.push_back(model_flag::negative_base);
        }
        if (std::ranges::any_of(model.per_component, [](const component_slope& s) {
                return s.slope < -detail::negative_tolerance;
            })) {
            model.flags.push_back(model_flag::negative_slope);
            debug_log(spec.qualified_name(), ": negative ", to_string(kind), " slope retained");
        }
        if (trimmed) {
            model.flags.push_back(model_flag::outliers_trimmed);
        }
        return model;
    }

    operation_result analyze_operation(const sample_set& samples, const analysis_config& config) {
        auto result = operation_result{
                .spec = samples.operation,
                .sample_count = samples.samples.size(),
                .discarded_count = samples.discarded_count()};
        result.models.reserve(all_metrics.size());
        for (auto m : all_metrics) {
            result.models.push_back(analyze(samples, m, config));
        }
        return result;
    }

}  // namespace tare
