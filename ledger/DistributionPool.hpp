#pragma once

#include "../core/Types.hpp"
#include "../utils/CheckedMath.hpp"

#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ledger {

    using torex::AccountId;
    using torex::Amount;
    using torex::AssetId;
    using torex::FlowRate;
    using torex::PoolId;
    using torex::Timestamp;
    using torex::Units;

    struct PoolMember {
        Units units = 0;
        Amount settled_value = 0;          // accrued up to the last sync, not yet claimed
        Amount synced_value_per_unit = 0;  // pool index at the last sync
        bool connected = false;
    };

    struct FlowDistribution {
        FlowRate requested_rate = 0;
        FlowRate actual_rate = 0;
        Amount deposit = 0;
    };

    struct FlowRateChange {
        AccountId distributor;
        FlowRate old_actual_rate = 0;
        FlowRate new_actual_rate = 0;
    };

    // Proportional payout bookkeeping. A member's share of anything distributed
    // is units / total_units. Amounts are split per unit with truncation, so the
    // actual amount is always a multiple of total_units.
    //
    // The pool only tracks a value-per-unit index; moving balances in and out
    // of accounts is the Ledger's job.
    class DistributionPool {
        public:
            DistributionPool(PoolId id, AssetId asset, AccountId admin, Timestamp now)
                : id_(std::move(id)), asset_(std::move(asset)), admin_(std::move(admin)), settled_at_(now) {}

            const PoolId& id() const { return id_; }
            const AssetId& asset() const { return asset_; }
            const AccountId& admin() const { return admin_; }
            Units total_units() const { return total_units_; }

            Units member_units(const AccountId& member) const {
                auto it = members_.find(member);
                return it == members_.end() ? 0 : it->second.units;
            }

            bool is_connected(const AccountId& member) const {
                auto it = members_.find(member);
                return it != members_.end() && it->second.connected;
            }

            const std::map<AccountId, PoolMember>& members() const { return members_; }

            Amount value_per_unit_at(Timestamp t) const {
                return utils::checked_add(settled_value_per_unit_,
                                          utils::checked_mul(per_unit_flow_rate_, t - settled_at_, "pool index"),
                                          "pool index");
            }

            Amount accrued(const AccountId& member, Timestamp t) const {
                auto it = members_.find(member);
                if (it == members_.end()) return 0;
                const PoolMember& m = it->second;
                Amount delta = utils::checked_sub(value_per_unit_at(t), m.synced_value_per_unit, "pool accrual");
                return utils::checked_add(m.settled_value, utils::checked_mul(m.units, delta, "pool accrual"),
                                          "pool accrual");
            }

            void set_member_units(const AccountId& member, Units units, Timestamp t) {
                if (units < 0) throw std::invalid_argument("DistributionPool: negative units for " + member);
                settle(t);
                PoolMember& m = sync_member(member, t);
                total_units_ = utils::checked_add(utils::checked_sub(total_units_, m.units), units, "pool total units");
                m.units = units;
            }

            void set_connected(const AccountId& member, bool connected, Timestamp t) {
                sync_member(member, t).connected = connected;
            }

            // Returns everything the member has accrued and resets its claim.
            Amount take_accrued(const AccountId& member, Timestamp t) {
                auto it = members_.find(member);
                if (it == members_.end()) return 0;
                PoolMember& m = sync_member(member, t);
                Amount value = m.settled_value;
                m.settled_value = 0;
                return value;
            }

            Amount estimate_actual_amount(Amount requested) const {
                if (requested < 0) throw std::invalid_argument("DistributionPool: negative distribution");
                if (total_units_ == 0) return 0;
                return utils::checked_mul(requested / total_units_, total_units_, "pool distribution");
            }

            FlowRate estimate_actual_flow_rate(FlowRate requested) const {
                if (requested < 0) throw std::invalid_argument("DistributionPool: negative flow rate");
                if (total_units_ == 0) return 0;
                return utils::checked_mul(requested / total_units_, total_units_, "pool flow rate");
            }

            // Instant distribution. Returns the amount actually paid out.
            Amount distribute(Amount requested, Timestamp t) {
                Amount actual = estimate_actual_amount(requested);
                if (actual == 0) return 0;
                settle(t);
                settled_value_per_unit_ = utils::checked_add(settled_value_per_unit_, actual / total_units_,
                                                             "pool index");
                return actual;
            }

            const FlowDistribution* flow_distribution(const AccountId& distributor) const {
                auto it = flows_.find(distributor);
                return it == flows_.end() ? nullptr : &it->second;
            }

            const std::map<AccountId, FlowDistribution>& flow_distributions() const { return flows_; }

            // Sets a distributor's requested rate; returns the old and new actual rates.
            FlowRateChange set_flow_distribution(const AccountId& distributor, FlowRate requested, Amount deposit,
                                                 Timestamp t) {
                settle(t);
                FlowDistribution& fd = flows_[distributor];
                FlowRateChange change{distributor, fd.actual_rate, estimate_actual_flow_rate(requested)};
                fd.requested_rate = requested;
                fd.actual_rate = change.new_actual_rate;
                fd.deposit = deposit;
                if (requested == 0) flows_.erase(distributor);
                recompute_per_unit_flow_rate();
                return change;
            }

            // After a units change every distributor's actual rate is re-derived
            // from its requested rate. The caller moves the balance effects.
            std::vector<FlowRateChange> rebalance_flows(Timestamp t) {
                settle(t);
                std::vector<FlowRateChange> changes;
                for (auto& [distributor, fd] : flows_) {
                    FlowRate next = estimate_actual_flow_rate(fd.requested_rate);
                    if (next != fd.actual_rate) {
                        changes.push_back({distributor, fd.actual_rate, next});
                        fd.actual_rate = next;
                    }
                }
                recompute_per_unit_flow_rate();
                return changes;
            }

            void set_flow_deposit(const AccountId& distributor, Amount deposit) {
                auto it = flows_.find(distributor);
                if (it != flows_.end()) it->second.deposit = deposit;
            }

        private:
            void settle(Timestamp t) {
                settled_value_per_unit_ = value_per_unit_at(t);
                settled_at_ = t;
            }

            PoolMember& sync_member(const AccountId& member, Timestamp t) {
                Amount accrued_now = accrued(member, t);
                PoolMember& m = members_[member];
                m.settled_value = accrued_now;
                m.synced_value_per_unit = value_per_unit_at(t);
                return m;
            }

            void recompute_per_unit_flow_rate() {
                per_unit_flow_rate_ = 0;
                if (total_units_ == 0) return;
                for (const auto& [_, fd] : flows_) {
                    per_unit_flow_rate_ = utils::checked_add(per_unit_flow_rate_, fd.actual_rate / total_units_,
                                                             "pool flow rate");
                }
            }

            PoolId id_;
            AssetId asset_;
            AccountId admin_;
            Units total_units_ = 0;
            Amount settled_value_per_unit_ = 0;
            FlowRate per_unit_flow_rate_ = 0;
            Timestamp settled_at_ = 0;
            std::map<AccountId, PoolMember> members_;
            std::map<AccountId, FlowDistribution> flows_;
        };

} // namespace ledger
