#pragma once

#include "../core/TraderState.hpp"
#include "../core/Types.hpp"
#include "../utils/CheckedMath.hpp"

#include <cstddef>
#include <map>

namespace torex {

    // Per-trader rate split plus the exchange-wide rate totals that every
    // trader update folds into.
    class TraderLedger {
        public:
            TraderState get(const AccountId& trader) const {
                auto it = traders_.find(trader);
                return it == traders_.end() ? TraderState{} : it->second;
            }

            bool knows(const AccountId& trader) const { return traders_.count(trader) != 0; }

            // Stores the new split and moves the requested fee rate by the
            // trader's fee delta. Returns the new requested fee rate.
            FlowRate apply(const AccountId& trader, const TraderState& next) {
                TraderState& current = traders_[trader];
                requested_fee_dist_flow_rate_ = utils::checked_add(
                    requested_fee_dist_flow_rate_,
                    utils::checked_sub(next.fee_flow_rate, current.fee_flow_rate),
                    "requested fee flow rate");
                total_contrib_flow_rate_ = utils::checked_add(
                    total_contrib_flow_rate_,
                    utils::checked_sub(next.contrib_flow_rate, current.contrib_flow_rate),
                    "total contribution flow rate");
                current = next;
                return requested_fee_dist_flow_rate_;
            }

            FlowRate requested_fee_dist_flow_rate() const { return requested_fee_dist_flow_rate_; }
            FlowRate total_contrib_flow_rate() const { return total_contrib_flow_rate_; }

            std::size_t size() const { return traders_.size(); }
            const std::map<AccountId, TraderState>& traders() const { return traders_; }

        private:
            std::map<AccountId, TraderState> traders_;
            FlowRate requested_fee_dist_flow_rate_ = 0;
            FlowRate total_contrib_flow_rate_ = 0;
        };

} // namespace torex
