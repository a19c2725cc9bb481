#pragma once

#include "types.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

namespace tare {

    /*
     * Isolated executor for one operation at a time.
     *
     * A trial is prepare -> invoke -> counters -> [verify] -> reset. Only `invoke` is timed.
     * `prepare` must leave the instance in a state that observes none of the writes made by any
     * earlier trial; counters cover the `invoke` call alone. Errors are reported by throwing.
     * Instances are used by one thread at a time.
     */
    class sandbox {
      public:
        virtual ~sandbox() = default;

        virtual void prepare(const operation_spec& spec, const component_assignment& assignment) = 0;
        virtual void invoke(std::stop_token stop) = 0;
        virtual storage_counters counters() const = 0;
        virtual void verify() {}

        // Engines that meter execution themselves report it here instead of wall time
        virtual std::optional<std::chrono::nanoseconds> metered_elapsed() const { return std::nullopt; }

        virtual void reset() = 0;
    };

    using sandbox_factory = std::function<std::unique_ptr<sandbox>()>;

    /*
     * Runs single trials against a sandbox it owns. Never throws for a failing trial: errors,
     * verification failures and timeouts all come back as `succeeded = false` samples with zeroed
     * metrics and a `failure` reason.
     *
     * On timeout the stuck invocation is asked to stop and left to finish on its own thread,
     * keeping its sandbox alive; the adapter continues with a fresh instance from the factory.
     * Destroying the adapter joins every abandoned invocation.
     */
    class execution_adapter {
      public:
        execution_adapter(sandbox_factory factory, adapter_config config);
        ~execution_adapter();

        execution_adapter(const execution_adapter&) = delete;
        execution_adapter& operator=(const execution_adapter&) = delete;

        raw_sample execute(const operation_spec& spec, const component_assignment& assignment);

        size_t abandoned_count() const { return abandoned_.size(); }

      private:
        sandbox_factory factory_;
        adapter_config config_;
        std::shared_ptr<sandbox> sandbox_;
        std::vector<std::thread> abandoned_{};
    };

}  // namespace tare
