#pragma once

#include "../core/LiquidityMoveResult.hpp"
#include "../core/Types.hpp"

#include <string>
#include <variant>

namespace torex {

    struct TorexFlowUpdated {
        AccountId trader;
        FlowRate new_flow_rate = 0;
        FlowRate new_contrib_flow_rate = 0;
        Amount back_adjustment = 0;  // positive: charged, negative: refunded
        FlowRate requested_fee_dist_flow_rate = 0;
        FlowRate actual_fee_dist_flow_rate = 0;
        Timestamp at = 0;
    };

    struct LiquidityMoved {
        AccountId liquidity_mover;
        LiquidityMoveResult result;
        Timestamp at = 0;
    };

    struct ControllerError {
        std::string hook;
        std::string reason;
        Timestamp at = 0;
    };

    using TorexEvent = std::variant<TorexFlowUpdated, LiquidityMoved, ControllerError>;

} // namespace torex
