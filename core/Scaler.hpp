#pragma once

#include "../utils/CheckedMath.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>

namespace torex {

    // Signed multiplier/divisor between two unit domains.
    //   s >= 0: scale(v) = v * s
    //   s <  0: scale(v) = v / -s   (truncates toward zero)
    class Scaler {
        public:
            constexpr Scaler() = default;
            constexpr explicit Scaler(std::int64_t s) : s_(s) {}

            static Scaler ten_pow(int exponent) {
                if (exponent > 18 || exponent < -18)
                    throw std::invalid_argument("Scaler::ten_pow exponent out of range");
                std::int64_t p = 1;
                for (int i = 0; i < (exponent < 0 ? -exponent : exponent); ++i) p *= 10;
                return Scaler(exponent >= 0 ? p : -p);
            }

            std::int64_t scale(std::int64_t value) const {
                if (s_ >= 0) return utils::checked_mul(value, s_, "Scaler::scale");
                if (s_ == std::numeric_limits<std::int64_t>::min())
                    throw std::overflow_error("Scaler::scale divisor out of range");
                return value / -s_;
            }

            constexpr Scaler inverse() const { return Scaler(-s_); }
            constexpr std::int64_t value() const { return s_; }

            friend constexpr bool operator==(const Scaler& a, const Scaler& b) { return a.s_ == b.s_; }

        private:
            std::int64_t s_ = 1;
        };

} // namespace torex
