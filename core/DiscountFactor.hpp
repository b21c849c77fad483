#pragma once

#include "Types.hpp"
#include "../utils/CheckedMath.hpp"

#include <cstdint>
#include <stdexcept>

namespace torex {

    // Hyperbolic markdown of a benchmark value over elapsed time:
    //
    //   discounted(t) = value * factor / (factor + t)
    //
    // With factor = tau * (1 - epsilon) / epsilon the markdown at t == tau is
    // epsilon. The curve starts at the full value, never increases, and only
    // approaches zero. A zero factor disables discounting.
    class DiscountFactor {
        public:
            constexpr DiscountFactor() = default;
            constexpr explicit DiscountFactor(std::int64_t factor) : factor_(factor) {}

            static DiscountFactor from_tau(Timestamp tau, std::int64_t epsilon_pm) {
                if (tau < 0)
                    throw std::invalid_argument("DiscountFactor: tau must be non-negative");
                if (epsilon_pm <= 0 || epsilon_pm > ONE_HUNDRED_PERCENT_PM)
                    throw std::invalid_argument("DiscountFactor: epsilon_pm out of (0, 1e6]");
                return DiscountFactor(utils::mul_div(tau, ONE_HUNDRED_PERCENT_PM - epsilon_pm, epsilon_pm,
                                                     "DiscountFactor::from_tau"));
            }

            static constexpr DiscountFactor disabled() { return DiscountFactor(0); }

            Amount discounted_value(Amount full_value, Timestamp elapsed) const {
                if (full_value < 0)
                    throw std::invalid_argument("DiscountFactor: negative full value");
                if (elapsed < 0)
                    throw std::invalid_argument("DiscountFactor: negative elapsed time");
                if (full_value == 0) return 0;
                if (factor_ == 0) return full_value;
                return utils::mul_div(full_value, factor_, utils::checked_add(factor_, elapsed),
                                      "DiscountFactor::discounted_value");
            }

            constexpr std::int64_t value() const { return factor_; }
            constexpr bool is_disabled() const { return factor_ == 0; }

        private:
            std::int64_t factor_ = 0;
        };

} // namespace torex
