#include "tare/registry.hpp"

#include "tare/errors.hpp"
#include "tare/format.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

using namespace tare::literals;

namespace tare {

    uint32_t trial_context::value(std::string_view component) const {
        if (auto v = assignment.value_of(component)) {
            return *v;
        }
        throw std::out_of_range("no component named {}"_format(component));
    }

    void validate_declaration(const operation_spec& spec) {
        auto fail = [&](std::string message) {
            throw benchmark_error{error_kind::invalid_declaration, std::move(message), spec.module, spec.name};
        };

        if (!utils::is_emittable_identifier(spec.module)) {
            fail("module name '{}' is not an identifier"_format(spec.module));
        }
        if (!utils::is_emittable_identifier(spec.name)) {
            fail("operation name '{}' is not an identifier"_format(spec.name));
        }

        std::set<std::string_view> seen{};
        for (const auto& c : spec.components) {
            if (!utils::is_emittable_identifier(c.name)) {
                fail("component name '{}' is not an identifier"_format(c.name));
            }
            if (!seen.insert(c.name).second) {
                fail("component {} declared twice"_format(c.name));
            }
            if (c.min > c.max) {
                fail("component {} has min {} > max {}"_format(c.name, c.min, c.max));
            }
        }
    }

    void registry::add(operation_definition definition) {
        definitions_.push_back(std::move(definition));
    }

    const operation_definition* registry::find(std::string_view module, std::string_view name) const {
        auto it = std::ranges::find_if(definitions_, [&](const operation_definition& def) {
            return def.spec.module == module && def.spec.name == name;
        });
        return it == definitions_.end() ? nullptr : &*it;
    }

    std::vector<operation_spec> registry::specs() const {
        std::vector<operation_spec> out{};
        out.reserve(definitions_.size());
        for (const auto& def : definitions_) {
            out.push_back(def.spec);
        }
        return out;
    }

    std::vector<std::string> registry::modules() const {
        std::vector<std::string> out{};
        for (const auto& def : definitions_) {
            if (std::ranges::find(out, def.spec.module) == out.end()) {
                out.push_back(def.spec.module);
            }
        }
        return out;
    }

    void registry::validate() const {
        std::set<std::pair<std::string_view, std::string_view>> seen{};
        for (const auto& def : definitions_) {
            validate_declaration(def.spec);
            if (!def.body) {
                throw benchmark_error{
                        error_kind::invalid_declaration, "operation has no body", def.spec.module, def.spec.name};
            }
            if (!seen.emplace(def.spec.module, def.spec.name).second) {
                throw benchmark_error{
                        error_kind::invalid_declaration,
                        "operation declared twice",
                        def.spec.module,
                        def.spec.name};
            }
        }
    }

    memory_sandbox::memory_sandbox(
            std::shared_ptr<const registry> ops, std::map<std::string, std::string> genesis)
        : ops_{std::move(ops)}, storage_{std::move(genesis)} {
        if (!ops_) {
            throw std::invalid_argument("memory_sandbox requires a registry");
        }
    }

    void memory_sandbox::prepare(const operation_spec& spec, const component_assignment& assignment) {
        storage_.rollback();
        current_ = ops_->find(spec.module, spec.name);
        if (!current_) {
            throw std::runtime_error("no operation registered as {}"_format(spec.qualified_name()));
        }
        assignment_ = assignment;

        if (current_->setup) {
            auto ctx = trial_context{storage_, assignment_};
            current_->setup(ctx);
        }
        storage_.begin_trial();
    }

    void memory_sandbox::invoke(std::stop_token stop) {
        if (!current_) {
            throw std::logic_error("invoke called before prepare");
        }
        auto ctx = trial_context{storage_, assignment_, std::move(stop)};
        current_->body(ctx);
    }

    storage_counters memory_sandbox::counters() const {
        return storage_.counters();
    }

    void memory_sandbox::verify() {
        if (current_ && current_->verify) {
            auto ctx = trial_context{storage_, assignment_};
            current_->verify(ctx);
        }
    }

    void memory_sandbox::reset() {
        storage_.rollback();
        current_ = nullptr;
        assignment_ = {};
    }

    sandbox_factory make_memory_sandbox_factory(
            const registry& ops, std::map<std::string, std::string> genesis, std::vector<std::string> whitelist) {
        auto snapshot = std::make_shared<const registry>(ops);
        return [snapshot = std::move(snapshot), genesis = std::move(genesis), whitelist = std::move(whitelist)]()
                       -> std::unique_ptr<sandbox> {
            auto sb = std::make_unique<memory_sandbox>(snapshot, genesis);
            for (const auto& key : whitelist) {
                sb->whitelist(key);
            }
            return sb;
        };
    }

}  // namespace tare
