#pragma once

#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <iterator>

namespace tare {

    struct planned_trial {
        size_t index{};
        size_t swept_component{};
        uint32_t step{};
        component_assignment assignment{};
    };

    /*
     * Expands an operation's components into the ordered trial sequence: each component in
     * declaration order is stepped from min to max (both included) while the others stay pinned,
     * and every point is repeated `repeats` times back to back. Trials are computed from their
     * index, so iteration is lazy and any number of passes yields the same order.
     */
    class sweep_planner {
      public:
        class iterator {
          public:
            using iterator_category = std::input_iterator_tag;
            using value_type = planned_trial;
            using difference_type = std::ptrdiff_t;

            iterator() = default;
            iterator(const sweep_planner* planner, size_t index) : planner_{planner}, index_{index} {}

            planned_trial operator*() const { return planner_->at(index_); }

            iterator& operator++() {
                ++index_;
                return *this;
            }

            void operator++(int) { ++index_; }

            friend bool operator==(const iterator& it, std::default_sentinel_t) {
                return it.index_ >= it.planner_->size();
            }

          private:
            const sweep_planner* planner_{nullptr};
            size_t index_{};
        };

        sweep_planner(operation_spec spec, trial_config config);

        iterator begin() const { return iterator{this, 0U}; }
        std::default_sentinel_t end() const { return std::default_sentinel; }

        size_t size() const;
        planned_trial at(size_t index) const;

        // Value of `component` at sweep step `step`
        uint32_t value_at(size_t component, uint32_t step) const;

        const operation_spec& spec() const { return spec_; }
        const trial_config& config() const { return config_; }

      private:
        uint32_t pinned_value(size_t component) const;

        operation_spec spec_;
        trial_config config_;
    };

}  // namespace tare
