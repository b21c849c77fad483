#pragma once

#include "Types.hpp"
#include "../utils/CheckedMath.hpp"

namespace torex {

    // Split of a trader's gross inbound rate between what funds the exchange
    // and what is diverted to the fee distribution pool.
    struct TraderState {
        FlowRate contrib_flow_rate = 0;
        FlowRate fee_flow_rate = 0;

        FlowRate gross_flow_rate() const {
            return utils::checked_add(contrib_flow_rate, fee_flow_rate, "TraderState::gross_flow_rate");
        }

        friend bool operator==(const TraderState& a, const TraderState& b) {
            return a.contrib_flow_rate == b.contrib_flow_rate && a.fee_flow_rate == b.fee_flow_rate;
        }
    };

} // namespace torex
