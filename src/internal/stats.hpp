#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <optional>
#include <vector>

namespace tare::stats {

    // Median of `values`; averages the middle pair for even sizes. Reorders its argument.
    inline double median(std::vector<double>& values) {
        if (values.empty()) {
            return 0.0;
        }
        auto mid = values.size() / 2U;
        std::ranges::nth_element(values, values.begin() + static_cast<std::ptrdiff_t>(mid));
        auto upper = values[mid];
        if (values.size() % 2U == 1U) {
            return upper;
        }
        auto lower = *std::max_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid));
        return lower + (upper - lower) / 2.0;
    }

    inline double mean(const std::vector<double>& values) {
        if (values.empty()) {
            return 0.0;
        }
        auto sum = 0.0;
        for (auto v : values) {
            sum += v;
        }
        return sum / static_cast<double>(values.size());
    }

    struct singular_matrix {
        size_t column{};
    };

    struct solve_result {
        std::vector<double> solution{};
        std::optional<singular_matrix> singular{};
    };

    /*
     * Solves the dense n x n system `a * x = b` by Gaussian elimination with partial pivoting.
     * `a` is row-major. A pivot smaller than `tolerance` times the largest entry of its column
     * marks the system singular and names that column.
     */
    inline solve_result solve_linear_system(std::vector<double> a, std::vector<double> b, size_t n) {
        constexpr double tolerance = 1e-10;
        auto at = [&](size_t r, size_t c) -> double& { return a[r * n + c]; };

        std::vector<double> column_scale(n, 0.0);
        for (size_t c = 0U; c < n; ++c) {
            for (size_t r = 0U; r < n; ++r) {
                column_scale[c] = std::max(column_scale[c], std::abs(at(r, c)));
            }
        }

        for (size_t col = 0U; col < n; ++col) {
            auto pivot = col;
            for (size_t r = col + 1U; r < n; ++r) {
                if (std::abs(at(r, col)) > std::abs(at(pivot, col))) {
                    pivot = r;
                }
            }
            if (column_scale[col] == 0.0 || std::abs(at(pivot, col)) <= tolerance * column_scale[col]) {
                return {.singular = singular_matrix{col}};
            }
            if (pivot != col) {
                for (size_t c = 0U; c < n; ++c) {
                    std::swap(at(col, c), at(pivot, c));
                }
                std::swap(b[col], b[pivot]);
            }
            for (size_t r = col + 1U; r < n; ++r) {
                auto factor = at(r, col) / at(col, col);
                if (factor == 0.0) {
                    continue;
                }
                for (size_t c = col; c < n; ++c) {
                    at(r, c) -= factor * at(col, c);
                }
                b[r] -= factor * b[col];
            }
        }

        std::vector<double> x(n, 0.0);
        for (size_t i = n; i-- > 0U;) {
            auto sum = b[i];
            for (size_t c = i + 1U; c < n; ++c) {
                sum -= at(i, c) * x[c];
            }
            x[i] = sum / at(i, i);
        }
        return {.solution = std::move(x)};
    }

    // Coefficient of determination; 1 when the data has no spread and the fit is exact
    inline double r_squared(const std::vector<double>& observed, const std::vector<double>& predicted) {
        auto y_mean = mean(observed);
        auto ss_tot = 0.0;
        auto ss_res = 0.0;
        for (size_t i = 0U; i < observed.size(); ++i) {
            ss_tot += (observed[i] - y_mean) * (observed[i] - y_mean);
            ss_res += (observed[i] - predicted[i]) * (observed[i] - predicted[i]);
        }
        if (ss_tot == 0.0) {
            return ss_res <= 1e-12 * (1.0 + y_mean * y_mean) ? 1.0 : 0.0;
        }
        return std::max(0.0, 1.0 - ss_res / ss_tot);
    }

}  // namespace tare::stats
