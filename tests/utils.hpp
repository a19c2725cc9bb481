#pragma once

#include "tare.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

extern "C" {
#include <unistd.h>
}

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace tare::test {

    using namespace std::string_view_literals;
    using Catch::Matchers::ContainsSubstring;
    using Catch::Matchers::WithinAbs;

    // What a scripted trial reports; `fail` makes invoke throw, `hang` makes it block until stopped
    struct scripted_outcome {
        std::chrono::nanoseconds elapsed{};
        storage_counters counters{};
        bool fail{false};
        bool hang{false};
    };

    // (spec, assignment, per-operation trial number) -> outcome
    using trial_script =
            std::function<scripted_outcome(const operation_spec&, const component_assignment&, size_t)>;

    namespace detail {
        namespace fs = std::filesystem;

        struct script_state {
            trial_script script;
            std::mutex mutex{};
            std::map<std::string, size_t> calls{};
            size_t instances{};
        };

        class scripted_sandbox final : public sandbox {
          public:
            explicit scripted_sandbox(std::shared_ptr<script_state> state) : state_{std::move(state)} {}

            void prepare(const operation_spec& spec, const component_assignment& assignment) override {
                size_t call{};
                {
                    std::lock_guard lock{state_->mutex};
                    call = state_->calls[spec.qualified_name()]++;
                }
                outcome_ = state_->script(spec, assignment, call);
            }

            void invoke(std::stop_token stop) override {
                if (outcome_.hang) {
                    while (!stop.stop_requested()) {
                        std::this_thread::sleep_for(std::chrono::milliseconds{1});
                    }
                    throw std::runtime_error("interrupted");
                }
                if (outcome_.fail) {
                    throw std::runtime_error("scripted failure");
                }
            }

            storage_counters counters() const override { return outcome_.counters; }

            std::optional<std::chrono::nanoseconds> metered_elapsed() const override { return outcome_.elapsed; }

            void reset() override { outcome_ = {}; }

          private:
            std::shared_ptr<script_state> state_;
            scripted_outcome outcome_{};
        };

        struct temp_dir {
            fs::path path{};

            explicit temp_dir(std::string_view prefix) {
                auto now = std::chrono::system_clock::now().time_since_epoch().count();
                std::ostringstream dir_name{};
                dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
                path = fs::temp_directory_path() / dir_name.str();
                fs::create_directories(path);
            }

            ~temp_dir() {
                std::error_code ec{};
                fs::remove_all(path, ec);
            }
        };

        inline std::string read_text_file(const fs::path& path) {
            std::ifstream in{path};
            REQUIRE(in.good());
            std::ostringstream ss{};
            ss << in.rdbuf();
            return ss.str();
        }

        inline void write_text_file(const fs::path& path, std::string_view text) {
            std::ofstream out{path};
            REQUIRE(out.good());
            out << text;
            REQUIRE(out.good());
        }

        inline std::vector<char*> to_argv(std::vector<std::string>& args) {
            std::vector<char*> argv{};
            argv.reserve(args.size());
            for (auto& arg : args) {
                argv.push_back(arg.data());
            }
            return argv;
        }
    }  // namespace detail

    // Factory whose sandboxes follow `script`; `instances`, when given, counts sandboxes created
    inline sandbox_factory make_scripted_factory(trial_script script, std::shared_ptr<size_t> instances = {}) {
        auto state = std::make_shared<detail::script_state>();
        state->script = std::move(script);
        return [state, instances]() -> std::unique_ptr<sandbox> {
            if (instances) {
                std::lock_guard lock{state->mutex};
                ++*instances;
            }
            return std::make_unique<detail::scripted_sandbox>(state);
        };
    }

    // Exact linear cost: time = base + sum(slope * value) ns, reads = writes = sum(values), no proof
    inline trial_script linear_script(double base_ns, std::map<std::string, double> slopes_ns) {
        return [base_ns, slopes = std::move(slopes_ns)](
                       const operation_spec&, const component_assignment& assignment, size_t) {
            auto ns = base_ns;
            uint64_t total{};
            for (const auto& v : assignment.values) {
                if (auto it = slopes.find(v.name); it != slopes.end()) {
                    ns += it->second * v.value;
                }
                total += v.value;
            }
            return scripted_outcome{
                    .elapsed = std::chrono::nanoseconds{static_cast<int64_t>(ns)},
                    .counters = {.reads = total, .writes = total, .proof_size = 0U}};
        };
    }

    inline component_assignment assign(std::initializer_list<std::pair<std::string_view, uint32_t>> values) {
        component_assignment out{};
        for (const auto& [name, value] : values) {
            out.values.push_back({std::string{name}, value});
        }
        return out;
    }

    inline raw_sample time_sample(component_assignment assignment, int64_t ns, uint64_t reads = 0U) {
        return raw_sample{
                .assignment = std::move(assignment),
                .elapsed = std::chrono::nanoseconds{ns},
                .reads = reads,
                .succeeded = true};
    }

    inline raw_sample failed_sample(component_assignment assignment, std::string reason = "boom") {
        return raw_sample{.assignment = std::move(assignment), .failure = std::move(reason)};
    }

    inline operation_spec one_component_spec(std::string module = "m", std::string name = "op") {
        return operation_spec{.module = std::move(module), .name = std::move(name), .components = {{"n", 0U, 100U}}};
    }

}  // namespace tare::test
