#pragma once

#include "../core/Types.hpp"

#include <cstdint>

namespace observer {

    // A pool's price history as a running sum of tick * seconds. The price at
    // tick i is 1.0001^i of token1 per token0.
    class ITickOracle {
        public:
            virtual ~ITickOracle() = default;

            virtual std::int64_t tick_cumulative(torex::Timestamp at) const = 0;
            virtual std::int32_t current_tick() const = 0;
        };

} // namespace observer
