#pragma once

#include "utils.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tare {

    using namespace std::string_view_literals;

    inline constexpr auto version = "0.1.0"sv;

    /*
     * Tare Run Config Options
     *
     * Selection
     * - modules: Module patterns to benchmark; `*` matches any run of characters.
     * - operations: Operation patterns within the selected modules.
     * - include_extra: Also run operations their module declares as extra.
     * - list_only: Print the selected operations with their component ranges and exit.
     *
     * Sweep (trial_config)
     * - steps: Sampled points per component range, both endpoints included.
     * - repeats: Consecutive trials per sampled point.
     * - lowest_range_only: Pin the components not being swept at their minimum.
     * - highest_range_only: Pin the components not being swept at their maximum.
     *
     * Collection
     * - max_discard_fraction: Fail an operation when failed/total trials exceeds this.
     * - trial_timeout_ms: Wall-time budget for one trial; overrun makes a failed sample.
     * - verify: Run each operation's verification step after every trial.
     * - jobs: Worker concurrency; each worker owns one sandbox.
     *
     * Analysis
     * - analysis: Fitting method (least_squares or median_slopes).
     * - trim_fraction: Fraction of per-point medians trimmed from each end before fitting.
     *
     * Rendering
     * - negative_slopes: Keep negative coefficients signed or clamp them to zero.
     * - ticks_per_nanosecond: Accounting ticks per measured nanosecond of time.
     * - output_path: Generated source directory, or file when one module is selected.
     * - header_file: Text prepended verbatim to every generated unit.
     * - template_file: Mustache template replacing the built-in layout of a generated unit.
     *
     * Raw results
     * - raw_path: Sample sets as JSON.
     * - json_path: Operation results as JSON.
     *
     * App
     * - config_file: JSON file pre-populating these options.
     * - quiet/verbose: Coarse verbosity knobs for progress output.
     * - print_config: Print the resolved config and exit.
     */

    enum class metric : uint8_t { time, reads, writes, proof_size };
    enum class analysis_choice : uint8_t { least_squares, median_slopes };
    enum class negative_slope_policy : uint8_t { keep, clamp };

    inline constexpr auto all_metrics = std::array{metric::time, metric::reads, metric::writes, metric::proof_size};

    inline constexpr std::string_view to_string(metric m) {
        switch (m) {
            case metric::time:
                return "time"sv;
            case metric::reads:
                return "reads"sv;
            case metric::writes:
                return "writes"sv;
            case metric::proof_size:
                return "proof_size"sv;
        }
        return "time"sv;
    }

    inline constexpr bool try_parse_metric(std::string_view text, metric& out) {
        for (auto m : all_metrics) {
            if (utils::str_case_eq(text, to_string(m))) {
                out = m;
                return true;
            }
        }
        return false;
    }

    inline constexpr std::string_view to_string(analysis_choice choice) {
        switch (choice) {
            case analysis_choice::least_squares:
                return "least_squares"sv;
            case analysis_choice::median_slopes:
                return "median_slopes"sv;
        }
        return "least_squares"sv;
    }

    inline constexpr bool try_parse_analysis_choice(std::string_view text, analysis_choice& out) {
        if (utils::str_case_eq(text, "least_squares"sv) || utils::str_case_eq(text, "least-squares"sv) ||
            utils::str_case_eq(text, "ols"sv)) {
            out = analysis_choice::least_squares;
            return true;
        }
        if (utils::str_case_eq(text, "median_slopes"sv) || utils::str_case_eq(text, "median-slopes"sv)) {
            out = analysis_choice::median_slopes;
            return true;
        }
        return false;
    }

    inline constexpr std::string_view to_string(negative_slope_policy policy) {
        switch (policy) {
            case negative_slope_policy::keep:
                return "keep"sv;
            case negative_slope_policy::clamp:
                return "clamp"sv;
        }
        return "keep"sv;
    }

    inline constexpr bool try_parse_negative_slope_policy(std::string_view text, negative_slope_policy& out) {
        if (utils::str_case_eq(text, "keep"sv)) {
            out = negative_slope_policy::keep;
            return true;
        }
        if (utils::str_case_eq(text, "clamp"sv)) {
            out = negative_slope_policy::clamp;
            return true;
        }
        return false;
    }

    struct trial_config {
        uint32_t steps{50U};
        uint32_t repeats{20U};
        bool lowest_range_only{false};
        bool highest_range_only{false};

        bool operator==(const trial_config&) const = default;
    };

    struct collector_config {
        double max_discard_fraction{0.1};
    };

    struct adapter_config {
        std::chrono::milliseconds timeout{30'000};
        bool verify{false};
    };

    struct analysis_config {
        analysis_choice method{analysis_choice::least_squares};
        double trim_fraction{0.0};
    };

    struct render_config {
        negative_slope_policy negative_slopes{negative_slope_policy::keep};
        double ticks_per_nanosecond{1'000.0};
        std::optional<std::string> header_text{};
        std::optional<std::string> template_text{};
    };

    struct run_config {
        std::vector<std::string> modules{"*"};
        std::vector<std::string> operations{"*"};
        bool include_extra{false};
        bool list_only{false};

        trial_config trials{};
        collector_config collector{};
        adapter_config adapter{};
        unsigned jobs{1U};

        analysis_config analysis{};
        render_config render{};

        std::optional<std::filesystem::path> output_path{};
        std::optional<std::filesystem::path> header_file{};
        std::optional<std::filesystem::path> template_file{};
        std::optional<std::filesystem::path> raw_path{};
        std::optional<std::filesystem::path> json_path{};

        std::optional<std::filesystem::path> config_file{};
        bool quiet{false};
        bool verbose{false};
        bool print_config{false};
    };

    // Throws benchmark_error{invalid_configuration} on the first violated bound
    void validate(const run_config& cfg);

}  // namespace tare
