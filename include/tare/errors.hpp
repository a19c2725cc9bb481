#pragma once

#include "format.hpp"
#include "types.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tare {

    enum class error_kind : uint8_t {
        trial_execution_failure,
        excessive_discard_rate,
        empty_sample_set,
        underdetermined_model,
        rendering_inconsistency,
        invalid_declaration,
        invalid_configuration,
    };

    inline constexpr std::string_view to_string(error_kind kind) {
        switch (kind) {
            case error_kind::trial_execution_failure:
                return "trial_execution_failure"sv;
            case error_kind::excessive_discard_rate:
                return "excessive_discard_rate"sv;
            case error_kind::empty_sample_set:
                return "empty_sample_set"sv;
            case error_kind::underdetermined_model:
                return "underdetermined_model"sv;
            case error_kind::rendering_inconsistency:
                return "rendering_inconsistency"sv;
            case error_kind::invalid_declaration:
                return "invalid_declaration"sv;
            case error_kind::invalid_configuration:
                return "invalid_configuration"sv;
        }
        return "invalid_configuration"sv;
    }

    inline constexpr bool is_operation_level(error_kind kind) {
        switch (kind) {
            case error_kind::excessive_discard_rate:
            case error_kind::empty_sample_set:
            case error_kind::underdetermined_model:
                return true;
            default:
                return false;
        }
    }

    class benchmark_error : public std::runtime_error {
      public:
        benchmark_error(
                error_kind kind,
                std::string message,
                std::string module = {},
                std::string operation = {},
                std::optional<component_assignment> assignment = std::nullopt)
            : std::runtime_error{compose(kind, message, module, operation, assignment)},
              kind_{kind},
              detail_{std::move(message)},
              module_{std::move(module)},
              operation_{std::move(operation)},
              assignment_{std::move(assignment)} {}

        error_kind kind() const noexcept { return kind_; }
        const std::string& detail() const noexcept { return detail_; }
        const std::string& module() const noexcept { return module_; }
        const std::string& operation() const noexcept { return operation_; }
        const std::optional<component_assignment>& assignment() const noexcept { return assignment_; }

      private:
        static std::string compose(
                error_kind kind,
                const std::string& message,
                const std::string& module,
                const std::string& operation,
                const std::optional<component_assignment>& assignment) {
            using namespace tare::literals;
            std::string out{to_string(kind)};
            if (!module.empty() || !operation.empty()) {
                out.append(" [").append(module).append("::").append(operation).append("]");
            }
            out.append(": ").append(message);
            if (assignment) {
                out.append(" (at {})"_format(*assignment));
            }
            return out;
        }

        error_kind kind_;
        std::string detail_;
        std::string module_;
        std::string operation_;
        std::optional<component_assignment> assignment_;
    };

}  // namespace tare
