#pragma once

#include <cstdint>
#include <initializer_list>
#include <limits>

namespace tare {

    // Resource cost of one operation, in accounting units
    struct weight {
        std::uint64_t ref_time{};
        std::uint64_t proof_size{};
        std::uint64_t reads{};
        std::uint64_t writes{};

        constexpr weight& operator+=(const weight& other) {
            ref_time = saturating_add(ref_time, other.ref_time);
            proof_size = saturating_add(proof_size, other.proof_size);
            reads = saturating_add(reads, other.reads);
            writes = saturating_add(writes, other.writes);
            return *this;
        }

        friend constexpr weight operator+(weight lhs, const weight& rhs) { return lhs += rhs; }

        constexpr bool operator==(const weight&) const = default;

      private:
        static constexpr std::uint64_t saturating_add(std::uint64_t a, std::uint64_t b) {
            std::uint64_t out{};
            return __builtin_add_overflow(a, b, &out) ? std::numeric_limits<std::uint64_t>::max() : out;
        }
    };

    // Signed coefficients as rendered from a fitted model
    struct weight_coefficients {
        std::int64_t ref_time{};
        std::int64_t proof_size{};
        std::int64_t reads{};
        std::int64_t writes{};
    };

    struct weight_term {
        weight_coefficients slope{};
        std::uint64_t value{};
    };

    namespace detail {
        __extension__ typedef __int128 wide;

        inline constexpr wide wide_max = static_cast<wide>(std::numeric_limits<std::uint64_t>::max());

        constexpr wide clamp_wide(wide v) {
            if (v > wide_max) {
                return wide_max;
            }
            if (v < -wide_max) {
                return -wide_max;
            }
            return v;
        }

        constexpr std::uint64_t to_unsigned(wide v) {
            if (v <= 0) {
                return 0U;
            }
            return static_cast<std::uint64_t>(v > wide_max ? wide_max : v);
        }
    }  // namespace detail

    /*
     * base + sum(slope * value) per dimension. Intermediate sums are clamped so that no
     * combination of inputs overflows, and each final dimension saturates into [0, uint64 max].
     */
    constexpr weight evaluate(const weight_coefficients& base, std::initializer_list<weight_term> terms = {}) {
        detail::wide ref_time = base.ref_time;
        detail::wide proof_size = base.proof_size;
        detail::wide reads = base.reads;
        detail::wide writes = base.writes;

        for (const auto& term : terms) {
            auto v = static_cast<detail::wide>(term.value);
            ref_time = detail::clamp_wide(ref_time + detail::clamp_wide(term.slope.ref_time * v));
            proof_size = detail::clamp_wide(proof_size + detail::clamp_wide(term.slope.proof_size * v));
            reads = detail::clamp_wide(reads + detail::clamp_wide(term.slope.reads * v));
            writes = detail::clamp_wide(writes + detail::clamp_wide(term.slope.writes * v));
        }

        return weight{
                .ref_time = detail::to_unsigned(ref_time),
                .proof_size = detail::to_unsigned(proof_size),
                .reads = detail::to_unsigned(reads),
                .writes = detail::to_unsigned(writes)};
    }

}  // namespace tare
