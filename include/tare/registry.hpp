#pragma once

#include "sandbox.hpp"
#include "storage.hpp"
#include "types.hpp"

#include <functional>
#include <map>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace tare {

    struct trial_context {
        memory_storage& storage;
        const component_assignment& assignment;
        std::stop_token stop{};

        // Throws std::out_of_range when the operation declares no such component
        uint32_t value(std::string_view component) const;
    };

    using trial_step = std::function<void(trial_context&)>;

    struct operation_definition {
        operation_spec spec{};
        trial_step setup{};
        trial_step body{};
        trial_step verify{};
    };

    /*
     * Operation declarations supplied by runtime modules. Modules register definitions before a run;
     * `validate` checks every declaration up front so a bad one fails the run before any trial.
     */
    class registry {
      public:
        void add(operation_definition definition);

        const operation_definition* find(std::string_view module, std::string_view name) const;

        std::vector<operation_spec> specs() const;
        std::vector<std::string> modules() const;

        // Throws benchmark_error{invalid_declaration}
        void validate() const;

        bool empty() const { return definitions_.empty(); }

      private:
        std::vector<operation_definition> definitions_{};
    };

    // Throws benchmark_error{invalid_declaration} for a malformed spec
    void validate_declaration(const operation_spec& spec);

    /*
     * In-process sandbox: runs registered operation bodies against a private copy of the genesis
     * state. Each instance owns its own storage, so instances never share mutable state. The
     * definitions are shared and immutable; an instance keeps them alive for as long as it runs.
     */
    class memory_sandbox final : public sandbox {
      public:
        explicit memory_sandbox(
                std::shared_ptr<const registry> ops, std::map<std::string, std::string> genesis = {});

        void whitelist(std::string key) { storage_.whitelist(std::move(key)); }

        void prepare(const operation_spec& spec, const component_assignment& assignment) override;
        void invoke(std::stop_token stop) override;
        storage_counters counters() const override;
        void verify() override;
        void reset() override;

        memory_storage& storage() { return storage_; }

      private:
        std::shared_ptr<const registry> ops_;
        memory_storage storage_;
        const operation_definition* current_{nullptr};
        component_assignment assignment_{};
    };

    // Sandboxes created by the factory run a snapshot of `ops` taken here
    sandbox_factory make_memory_sandbox_factory(
            const registry& ops,
            std::map<std::string, std::string> genesis = {},
            std::vector<std::string> whitelist = {});

}  // namespace tare
