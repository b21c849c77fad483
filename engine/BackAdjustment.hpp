#pragma once

#include "../core/TraderState.hpp"
#include "../core/Types.hpp"
#include "../utils/CheckedMath.hpp"

#include <algorithm>
#include <stdexcept>

namespace torex {

    // Settlement owed at a flow-rate change, so that a trader ends the cycle as
    // if it had streamed at its new rate since the last liquidity move.
    //
    // A contribution increase charges the elapsed contribution delta, any
    // elapsed fee increase and the growth of the fee stream's locked buffer.
    // A decrease refunds only the contribution delta: fees already
    // distributed are not returned, and no buffer is charged.
    struct BackAdjustment {
        Amount contrib_adjustment = 0;  // signed
        Amount fee_charge = 0;
        Amount buffer_charge = 0;

        Amount total_charge() const {
            return utils::checked_add(utils::checked_add(std::max<Amount>(0, contrib_adjustment), fee_charge),
                                      buffer_charge, "back adjustment charge");
        }

        Amount refund() const { return contrib_adjustment < 0 ? -contrib_adjustment : 0; }
    };

    inline BackAdjustment compute_back_adjustment(Timestamp elapsed, const TraderState& prev, const TraderState& next,
                                                  Amount buffer_delta) {
        if (elapsed < 0) throw std::invalid_argument("back adjustment: negative elapsed time");

        BackAdjustment adj;
        adj.contrib_adjustment = utils::checked_mul(
            elapsed, utils::checked_sub(next.contrib_flow_rate, prev.contrib_flow_rate), "contrib back adjustment");
        if (adj.contrib_adjustment > 0) {
            adj.fee_charge = std::max<Amount>(
                0, utils::checked_mul(elapsed, utils::checked_sub(next.fee_flow_rate, prev.fee_flow_rate),
                                      "fee back adjustment"));
            adj.buffer_charge = std::max<Amount>(0, buffer_delta);
        }
        return adj;
    }

} // namespace torex
