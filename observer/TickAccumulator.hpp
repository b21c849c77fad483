#pragma once

#include "ITickOracle.hpp"
#include "../utils/CheckedMath.hpp"

#include <cstdint>
#include <stdexcept>

namespace observer {

    // In-memory tick history: the tick is piecewise constant between updates.
    class TickAccumulator : public ITickOracle {
        public:
            TickAccumulator(torex::Timestamp start, std::int32_t tick)
                : tick_(tick), updated_at_(start) {}

            void set_tick(torex::Timestamp at, std::int32_t tick) {
                if (at < updated_at_) throw std::invalid_argument("TickAccumulator: time went backwards");
                cumulative_ = tick_cumulative(at);
                updated_at_ = at;
                tick_ = tick;
            }

            std::int64_t tick_cumulative(torex::Timestamp at) const override {
                if (at < updated_at_)
                    throw std::invalid_argument("TickAccumulator: observation before last update");
                return utils::checked_add(cumulative_, utils::checked_mul(tick_, at - updated_at_, "tick cumulative"),
                                          "tick cumulative");
            }

            std::int32_t current_tick() const override { return tick_; }

        private:
            std::int32_t tick_;
            torex::Timestamp updated_at_;
            std::int64_t cumulative_ = 0;
        };

} // namespace observer
