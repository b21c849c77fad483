#pragma once

#include "../core/Types.hpp"

#include <string>

namespace torex {

    // Counterparty of a liquidity move. It receives in_amount of in-asset before
    // the callback and must leave at least min_out_amount of out-asset with the
    // exchange before returning true.
    class ILiquidityMover {
        public:
            virtual ~ILiquidityMover() = default;

            virtual bool move_liquidity_callback(const AssetId& in_asset, const AssetId& out_asset, Amount in_amount,
                                                 Amount min_out_amount, const std::string& mover_data) = 0;
        };

} // namespace torex
