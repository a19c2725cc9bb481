#include "tare/sandbox.hpp"

#include "tare/errors.hpp"
#include "tare/format.hpp"

#include <chrono>
#include <exception>
#include <future>
#include <stdexcept>
#include <thread>
#include <utility>

using namespace tare::literals;

namespace tare {

    namespace detail {

        struct trial_outcome {
            std::chrono::nanoseconds elapsed{};
            storage_counters counters{};
            std::optional<std::string> failure{};
        };

        static trial_outcome run_trial(
                sandbox& sb,
                const operation_spec& spec,
                const component_assignment& assignment,
                bool verify,
                std::stop_token stop) {
            auto out = trial_outcome{};
            try {
                sb.prepare(spec, assignment);

                auto start = std::chrono::steady_clock::now();
                sb.invoke(stop);
                auto finish = std::chrono::steady_clock::now();

                out.elapsed = sb.metered_elapsed().value_or(
                        std::chrono::duration_cast<std::chrono::nanoseconds>(finish - start));
                out.counters = sb.counters();

                if (verify) {
                    try {
                        sb.verify();
                    } catch (const std::exception& e) {
                        out.failure = "verification failed: {}"_format(e.what());
                    }
                }
            } catch (const std::exception& e) {
                out.failure = e.what();
            }

            try {
                sb.reset();
            } catch (const std::exception& e) {
                if (!out.failure) {
                    out.failure = "reset failed: {}"_format(e.what());
                }
            }
            return out;
        }

    }  // namespace detail

    execution_adapter::execution_adapter(sandbox_factory factory, adapter_config config)
        : factory_{std::move(factory)}, config_{config} {
        if (!factory_) {
            throw std::invalid_argument("execution_adapter requires a sandbox factory");
        }
        if (config_.timeout <= std::chrono::milliseconds::zero()) {
            throw benchmark_error{
                    error_kind::invalid_configuration,
                    "trial timeout must be positive, got {}ms"_format(config_.timeout.count())};
        }
        sandbox_ = std::shared_ptr<sandbox>{factory_()};
        if (!sandbox_) {
            throw std::runtime_error("sandbox factory returned no instance");
        }
    }

    execution_adapter::~execution_adapter() {
        for (auto& worker : abandoned_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    raw_sample execution_adapter::execute(const operation_spec& spec, const component_assignment& assignment) {
        auto sample = raw_sample{.assignment = assignment};

        auto promise = std::make_shared<std::promise<detail::trial_outcome>>();
        auto future = promise->get_future();
        auto stop = std::stop_source{};

        // the worker owns copies of everything it touches so it may outlive this call
        std::thread worker{[sb = sandbox_,
                            promise,
                            spec_copy = spec,
                            assignment_copy = assignment,
                            verify = config_.verify,
                            token = stop.get_token()]() {
            try {
                promise->set_value(detail::run_trial(*sb, spec_copy, assignment_copy, verify, token));
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        }};

        if (future.wait_for(config_.timeout) == std::future_status::timeout) {
            stop.request_stop();
            abandoned_.push_back(std::move(worker));
            debug_log("trial for ", spec.qualified_name(), " timed out; replacing sandbox");

            sandbox_ = std::shared_ptr<sandbox>{factory_()};
            if (!sandbox_) {
                throw std::runtime_error("sandbox factory returned no instance");
            }
            sample.failure = "timed out after {}ms"_format(config_.timeout.count());
            return sample;
        }

        worker.join();
        auto outcome = future.get();
        if (outcome.failure) {
            sample.failure = std::move(outcome.failure);
            return sample;
        }

        sample.elapsed = outcome.elapsed;
        sample.reads = outcome.counters.reads;
        sample.writes = outcome.counters.writes;
        sample.proof_size = outcome.counters.proof_size;
        sample.succeeded = true;
        return sample;
    }

}  // namespace tare
