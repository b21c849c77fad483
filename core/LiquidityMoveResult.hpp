#pragma once

#include "Types.hpp"

#include <ostream>

namespace torex {

    struct BenchmarkQuote {
        Amount min_out_amount = 0;
        Timestamp duration = 0;
        Amount twap = 0;
    };

    struct LiquidityEstimations {
        Amount in_amount = 0;
        Amount min_out_amount = 0;
        Timestamp duration = 0;
        Amount twap = 0;
    };

    struct LiquidityMoveResult {
        Timestamp duration_since_last_move = 0;
        Amount twap_since_last_move = 0;
        Amount in_amount = 0;
        Amount min_out_amount = 0;
        Amount out_amount = 0;
        // Differs from out_amount by the distribution pool's unit rounding.
        Amount actual_out_amount = 0;

        friend std::ostream& operator<<(std::ostream& os, const LiquidityMoveResult& r) {
            os << "[LiquidityMove] duration=" << r.duration_since_last_move
               << " twap=" << r.twap_since_last_move
               << " in=" << r.in_amount
               << " min_out=" << r.min_out_amount
               << " out=" << r.out_amount
               << " actual_out=" << r.actual_out_amount;
            return os;
        }
    };

} // namespace torex
