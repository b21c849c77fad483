#pragma once

#include "../core/LiquidityMoveResult.hpp"
#include "../core/Types.hpp"
#include "../ledger/GasMeter.hpp"

#include <string>

namespace torex {

    struct FlowChangedNotice {
        AccountId trader;
        FlowRate prev_flow_rate = 0;
        FlowRate prev_fee_flow_rate = 0;
        Timestamp last_updated = 0;
        FlowRate new_flow_rate = 0;
        Timestamp now = 0;
        std::string user_data;
    };

    // Supplies per-trader fee rates and hears about completed liquidity moves.
    // Implementations may throw or burn their gas budget; the exchange decides
    // per call site whether that aborts the operation or is contained.
    class IController {
        public:
            virtual ~IController() = default;

            // Returns the requested fee flow rate; it is clamped before use.
            virtual FlowRate on_in_flow_changed(const FlowChangedNotice& notice, ledger::GasMeter& gas) = 0;

            virtual bool on_liquidity_moved(const LiquidityMoveResult& result, ledger::GasMeter& gas) = 0;
        };

} // namespace torex
