#pragma once

#include "DistributionPool.hpp"
#include "GasMeter.hpp"
#include "IFlowReceiver.hpp"
#include "LedgerErrors.hpp"
#include "../core/EngineConfig.hpp"
#include "../core/Types.hpp"
#include "../security/AuditLogger.hpp"
#include "../utils/CheckedMath.hpp"

#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace ledger {

    struct AccountState {
        Amount settled_balance = 0;
        Timestamp settled_at = 0;
        FlowRate net_flow_rate = 0;
        Amount deposit = 0;  // locked by outgoing streams and flow distributions
        Amount owed_deposit = 0;  // part of `deposit` locked on senders instead
    };

    struct FlowState {
        FlowRate rate = 0;
        Timestamp updated_at = 0;
        Amount deposit = 0;
        Amount owed_deposit = 0;  // receiver's deposit credit drawn on this stream
    };

    struct FlowDistributionEstimate {
        FlowRate actual_rate = 0;
        Amount deposit = 0;
    };

    // In-memory host ledger: per-asset balances that accrue continuously from
    // constant-rate streams, allowances, and proportional distribution pools.
    //
    // Every stream operation is atomic. A registered receiver is notified
    // inside the operation and can veto it by throwing; the ledger then rolls
    // back to the state before the call.
    //
    // While notified, a receiver may post deposits beyond its available
    // balance, up to the stream's new deposit. Whatever it cannot cover when
    // the notification returns is locked on the sender as the stream's owed
    // deposit, and released again on the stream's next change.
    class Ledger {
        private:
            struct AssetBook {
                std::map<AccountId, AccountState> accounts;
                std::map<std::pair<AccountId, AccountId>, FlowState> flows;
                std::map<std::pair<AccountId, AccountId>, Amount> allowances;  // (owner, spender)
            };

            struct State {
                std::map<AssetId, AssetBook> assets;
                std::map<PoolId, DistributionPool> pools;
                std::uint64_t pool_sequence = 0;
            };

        public:
            // Snapshot of the whole ledger state, restored on destruction unless
            // committed. Nests freely.
            class Transaction {
                public:
                    explicit Transaction(Ledger& ledger) : ledger_(ledger), saved_(ledger.state_) {}

                    ~Transaction() {
                        if (!committed_) ledger_.state_ = std::move(saved_);
                    }

                    void commit() { committed_ = true; }

                    Transaction(const Transaction&) = delete;
                    Transaction& operator=(const Transaction&) = delete;

                private:
                    Ledger& ledger_;
                    State saved_;
                    bool committed_ = false;
                };

            explicit Ledger(Timestamp genesis = 0,
                            Timestamp liquidation_period = torex::EngineConfig::default_liquidation_period)
                : now_(genesis), liquidation_period_(liquidation_period) {
                if (liquidation_period < 0) throw std::invalid_argument("Ledger: negative liquidation period");
            }

            Ledger(const Ledger&) = delete;
            Ledger& operator=(const Ledger&) = delete;

            // ===== Clock =====

            Timestamp now() const { return now_; }

            void advance_time(Timestamp seconds) {
                if (seconds < 0) throw std::invalid_argument("Ledger: time cannot go backwards");
                now_ = utils::checked_add(now_, seconds, "Ledger clock");
            }

            void set_time(Timestamp t) {
                if (t < now_) throw std::invalid_argument("Ledger: time cannot go backwards");
                now_ = t;
            }

            Timestamp liquidation_period() const { return liquidation_period_; }

            // ===== Assets & balances =====

            void create_asset(const AssetId& asset) {
                if (asset.empty()) throw std::invalid_argument("Ledger: empty asset id");
                state_.assets.try_emplace(asset);
            }

            bool has_asset(const AssetId& asset) const { return state_.assets.count(asset) != 0; }

            void mint(const AssetId& asset, const AccountId& to, Amount amount) {
                if (amount < 0) throw std::invalid_argument("Ledger: negative mint");
                AccountState& acc = settle(asset, to);
                acc.settled_balance = utils::checked_add(acc.settled_balance, amount, "mint");
            }

            // Balance including locked deposits and connected pool accruals.
            Amount realtime_balance(const AssetId& asset, const AccountId& account) const {
                const AssetBook& b = book(asset);
                Amount total = 0;
                auto it = b.accounts.find(account);
                if (it != b.accounts.end()) total = settled_at_now(it->second);
                for (const auto& [_, pool] : state_.pools) {
                    if (pool.asset() == asset && pool.is_connected(account))
                        total = utils::checked_add(total, pool.accrued(account, now_), "realtime balance");
                }
                return total;
            }

            Amount deposit_of(const AssetId& asset, const AccountId& account) const {
                const AssetBook& b = book(asset);
                auto it = b.accounts.find(account);
                return it == b.accounts.end() ? 0 : it->second.deposit;
            }

            Amount owed_deposit_of(const AssetId& asset, const AccountId& account) const {
                const AssetBook& b = book(asset);
                auto it = b.accounts.find(account);
                return it == b.accounts.end() ? 0 : it->second.owed_deposit;
            }

            // Spendable balance: realtime balance minus the deposits the account
            // backs itself. Negative when the account is critical.
            Amount balance_of(const AssetId& asset, const AccountId& account) const {
                Amount locked = std::max<Amount>(0, deposit_of(asset, account) - owed_deposit_of(asset, account));
                return utils::checked_sub(realtime_balance(asset, account), locked, "available balance");
            }

            bool is_critical(const AssetId& asset, const AccountId& account) const {
                return balance_of(asset, account) < 0;
            }

            FlowRate net_flow_rate(const AssetId& asset, const AccountId& account) const {
                const AssetBook& b = book(asset);
                auto it = b.accounts.find(account);
                return it == b.accounts.end() ? 0 : it->second.net_flow_rate;
            }

            // Everything the asset is worth across accounts and pools. Constant
            // except through mint.
            Amount total_value(const AssetId& asset) const {
                const AssetBook& b = book(asset);
                Amount total = 0;
                for (const auto& [_, acc] : b.accounts)
                    total = utils::checked_add(total, settled_at_now(acc), "total value");
                for (const auto& [_, pool] : state_.pools) {
                    if (pool.asset() != asset) continue;
                    for (const auto& entry : pool.members())
                        total = utils::checked_add(total, pool.accrued(entry.first, now_), "total value");
                }
                return total;
            }

            void transfer(const AssetId& asset, const AccountId& from, const AccountId& to, Amount amount) {
                if (amount < 0) throw std::invalid_argument("Ledger: negative transfer");
                require_available(asset, from, amount);
                AccountState& src = settle(asset, from);
                src.settled_balance -= amount;
                AccountState& dst = settle(asset, to);
                dst.settled_balance = utils::checked_add(dst.settled_balance, amount, "transfer");
            }

            void approve(const AssetId& asset, const AccountId& owner, const AccountId& spender, Amount amount) {
                if (amount < 0) throw std::invalid_argument("Ledger: negative allowance");
                mutable_book(asset).allowances[{owner, spender}] = amount;
            }

            Amount allowance(const AssetId& asset, const AccountId& owner, const AccountId& spender) const {
                const AssetBook& b = book(asset);
                auto it = b.allowances.find({owner, spender});
                return it == b.allowances.end() ? 0 : it->second;
            }

            void transfer_from(const AssetId& asset, const AccountId& spender, const AccountId& owner,
                               const AccountId& to, Amount amount) {
                if (amount < 0) throw std::invalid_argument("Ledger: negative transfer");
                if (amount == 0) return;
                Amount& allowed = mutable_book(asset).allowances[{owner, spender}];
                if (allowed < amount) throw InsufficientAllowanceError(owner, spender);
                transfer(asset, owner, to, amount);
                allowed -= amount;
            }

            // ===== Streams =====

            void create_flow(const AssetId& asset, const AccountId& sender, const AccountId& receiver, FlowRate rate,
                             GasMeter& gas, const std::string& user_data = {}) {
                if (sender == receiver) throw std::invalid_argument("Ledger: stream to self");
                if (rate <= 0) throw std::invalid_argument("Ledger: stream rate must be positive");
                if (find_flow(asset, sender, receiver))
                    throw LedgerError("stream already exists: " + sender + " -> " + receiver);
                apply_flow(asset, sender, receiver, rate, gas, user_data);
            }

            void update_flow(const AssetId& asset, const AccountId& sender, const AccountId& receiver, FlowRate rate,
                             GasMeter& gas, const std::string& user_data = {}) {
                if (rate <= 0) throw std::invalid_argument("Ledger: stream rate must be positive");
                if (!find_flow(asset, sender, receiver))
                    throw UnknownFlowError("no stream " + sender + " -> " + receiver);
                apply_flow(asset, sender, receiver, rate, gas, user_data);
            }

            // Sender and receiver may always delete; anyone may once the sender is critical.
            void delete_flow(const AssetId& asset, const AccountId& sender, const AccountId& receiver,
                             const AccountId& by, GasMeter& gas, const std::string& user_data = {}) {
                if (!find_flow(asset, sender, receiver))
                    throw UnknownFlowError("no stream " + sender + " -> " + receiver);
                if (by != sender && by != receiver && !is_critical(asset, sender))
                    throw LedgerError(by + " may not delete stream " + sender + " -> " + receiver);
                apply_flow(asset, sender, receiver, 0, gas, user_data);
            }

            void create_flow(const AssetId& asset, const AccountId& sender, const AccountId& receiver, FlowRate rate,
                             const std::string& user_data = {}) {
                GasMeter gas(torex::EngineConfig::default_call_gas);
                create_flow(asset, sender, receiver, rate, gas, user_data);
            }

            void update_flow(const AssetId& asset, const AccountId& sender, const AccountId& receiver, FlowRate rate,
                             const std::string& user_data = {}) {
                GasMeter gas(torex::EngineConfig::default_call_gas);
                update_flow(asset, sender, receiver, rate, gas, user_data);
            }

            void delete_flow(const AssetId& asset, const AccountId& sender, const AccountId& receiver,
                             const std::string& user_data = {}) {
                GasMeter gas(torex::EngineConfig::default_call_gas);
                delete_flow(asset, sender, receiver, sender, gas, user_data);
            }

            std::optional<FlowState> find_flow(const AssetId& asset, const AccountId& sender,
                                               const AccountId& receiver) const {
                const AssetBook& b = book(asset);
                auto it = b.flows.find({sender, receiver});
                if (it == b.flows.end()) return std::nullopt;
                return it->second;
            }

            FlowRate flow_rate(const AssetId& asset, const AccountId& sender, const AccountId& receiver) const {
                auto flow = find_flow(asset, sender, receiver);
                return flow ? flow->rate : 0;
            }

            void register_receiver(const AccountId& account, IFlowReceiver* receiver) {
                if (receiver) receivers_[account] = receiver;
                else receivers_.erase(account);
            }

            void unregister_receiver(const AccountId& account) { receivers_.erase(account); }

            // ===== Distribution pools =====

            PoolId create_pool(const AssetId& asset, const AccountId& admin) {
                book(asset);
                PoolId id = "pool:" + asset + ":" + std::to_string(++state_.pool_sequence);
                state_.pools.emplace(id, DistributionPool(id, asset, admin, now_));
                security::AuditLogger::instance().log(security::AuditLogger::Level::Debug,
                                                      "[Pool Created] id={} admin={}", id, admin);
                return id;
            }

            const DistributionPool& pool(const PoolId& id) const {
                auto it = state_.pools.find(id);
                if (it == state_.pools.end()) throw UnknownPoolError(id);
                return it->second;
            }

            void update_member_units(const PoolId& id, const AccountId& by, const AccountId& member, Units units) {
                DistributionPool& p = mutable_pool(id);
                if (by != p.admin()) throw LedgerError(by + " is not the admin of " + id);
                for (const auto& [distributor, _] : p.flow_distributions()) settle(p.asset(), distributor);
                settle(p.asset(), member);
                p.set_member_units(member, units, now_);
                for (const FlowRateChange& change : p.rebalance_flows(now_)) {
                    AccountState& acc = settle(p.asset(), change.distributor);
                    acc.net_flow_rate = utils::checked_add(
                        acc.net_flow_rate, utils::checked_sub(change.old_actual_rate, change.new_actual_rate),
                        "net flow rate");
                    const FlowDistribution* fd = p.flow_distribution(change.distributor);
                    Amount old_deposit = fd ? fd->deposit : 0;
                    Amount new_deposit = utils::checked_mul(change.new_actual_rate, liquidation_period_, "deposit");
                    acc.deposit = utils::checked_add(acc.deposit, new_deposit - old_deposit, "deposit");
                    p.set_flow_deposit(change.distributor, new_deposit);
                }
            }

            Units member_units(const PoolId& id, const AccountId& member) const { return pool(id).member_units(member); }
            Units total_units(const PoolId& id) const { return pool(id).total_units(); }

            void connect_pool(const PoolId& id, const AccountId& member) {
                DistributionPool& p = mutable_pool(id);
                settle(p.asset(), member);
                p.set_connected(member, true, now_);
            }

            // Pending value is claimed first so the member's balance does not drop.
            void disconnect_pool(const PoolId& id, const AccountId& member) {
                claim_all(id, member);
                mutable_pool(id).set_connected(member, false, now_);
            }

            Amount claimable(const PoolId& id, const AccountId& member) const {
                const DistributionPool& p = pool(id);
                return p.is_connected(member) ? 0 : p.accrued(member, now_);
            }

            Amount claim_all(const PoolId& id, const AccountId& member) {
                DistributionPool& p = mutable_pool(id);
                Amount value = p.take_accrued(member, now_);
                AccountState& acc = settle(p.asset(), member);
                acc.settled_balance = utils::checked_add(acc.settled_balance, value, "claim");
                return value;
            }

            Amount estimate_distribution_actual_amount(const PoolId& id, Amount requested) const {
                return pool(id).estimate_actual_amount(requested);
            }

            Amount distribute(const AccountId& from, const PoolId& id, Amount requested) {
                DistributionPool& p = mutable_pool(id);
                Amount actual = p.estimate_actual_amount(requested);
                if (actual == 0) return 0;
                require_available(p.asset(), from, actual);
                AccountState& acc = settle(p.asset(), from);
                acc.settled_balance -= actual;
                p.distribute(requested, now_);
                return actual;
            }

            FlowDistributionEstimate estimate_flow_distribution(const PoolId& id, FlowRate requested_rate) const {
                FlowRate actual = pool(id).estimate_actual_flow_rate(requested_rate);
                return {actual, utils::checked_mul(actual, liquidation_period_, "deposit")};
            }

            FlowRate distribute_flow(const AccountId& from, const PoolId& id, FlowRate requested_rate) {
                DistributionPool& p = mutable_pool(id);
                FlowDistributionEstimate next = estimate_flow_distribution(id, requested_rate);
                const FlowDistribution* current = p.flow_distribution(from);
                Amount old_deposit = current ? current->deposit : 0;
                Amount deposit_delta = utils::checked_sub(next.deposit, old_deposit, "deposit");
                if (deposit_delta > 0) require_deposit(p.asset(), from, deposit_delta);

                AccountState& acc = settle(p.asset(), from);
                FlowRateChange change = p.set_flow_distribution(from, requested_rate, next.deposit, now_);
                acc.net_flow_rate = utils::checked_add(
                    acc.net_flow_rate, utils::checked_sub(change.old_actual_rate, change.new_actual_rate),
                    "net flow rate");
                acc.deposit = utils::checked_add(acc.deposit, deposit_delta, "deposit");
                return change.new_actual_rate;
            }

            FlowRate flow_distribution_rate(const PoolId& id, const AccountId& from) const {
                const FlowDistribution* fd = pool(id).flow_distribution(from);
                return fd ? fd->actual_rate : 0;
            }

            Amount flow_distribution_deposit(const PoolId& id, const AccountId& from) const {
                const FlowDistribution* fd = pool(id).flow_distribution(from);
                return fd ? fd->deposit : 0;
            }

        private:
            const AssetBook& book(const AssetId& asset) const {
                auto it = state_.assets.find(asset);
                if (it == state_.assets.end()) throw LedgerError("unknown asset: " + asset);
                return it->second;
            }

            AssetBook& mutable_book(const AssetId& asset) {
                auto it = state_.assets.find(asset);
                if (it == state_.assets.end()) throw LedgerError("unknown asset: " + asset);
                return it->second;
            }

            DistributionPool& mutable_pool(const PoolId& id) {
                auto it = state_.pools.find(id);
                if (it == state_.pools.end()) throw UnknownPoolError(id);
                return it->second;
            }

            Amount settled_at_now(const AccountState& acc) const {
                return utils::checked_add(acc.settled_balance,
                                          utils::checked_mul(acc.net_flow_rate, now_ - acc.settled_at, "accrual"),
                                          "balance");
            }

            AccountState& settle(const AssetId& asset, const AccountId& account) {
                AccountState& acc = mutable_book(asset).accounts[account];
                acc.settled_balance = settled_at_now(acc);
                acc.settled_at = now_;
                return acc;
            }

            void require_available(const AssetId& asset, const AccountId& account, Amount amount) const {
                Amount available = balance_of(asset, account);
                if (available < amount) throw InsufficientBalanceError(account, available, amount);
            }

            // Posting `delta` more deposit must leave the account non-critical.
            void require_deposit(const AssetId& asset, const AccountId& account, Amount delta) const {
                Amount locked = std::max<Amount>(
                    0, deposit_of(asset, account) + delta - owed_deposit_of(asset, account));
                if (realtime_balance(asset, account) < locked)
                    throw InsufficientBalanceError(account, balance_of(asset, account), delta);
            }

            // Sets sender -> receiver to `rate` (0 deletes) and notifies the receiver
            // with the stream's new deposit as credit.
            void apply_flow(const AssetId& asset, const AccountId& sender, const AccountId& receiver, FlowRate rate,
                            GasMeter& gas, const std::string& user_data) {
                Transaction tx(*this);

                AssetBook& b = mutable_book(asset);
                FlowState prev = b.flows.count({sender, receiver}) ? b.flows[{sender, receiver}] : FlowState{};
                Amount new_deposit = utils::checked_mul(rate, liquidation_period_, "stream deposit");
                Amount deposit_delta = new_deposit - prev.deposit;
                if (deposit_delta - prev.owed_deposit > 0)
                    require_deposit(asset, sender, deposit_delta - prev.owed_deposit);

                AccountState& src = settle(asset, sender);
                src.net_flow_rate = utils::checked_sub(src.net_flow_rate, rate - prev.rate, "net flow rate");
                src.deposit += deposit_delta - prev.owed_deposit;
                AccountState& dst = settle(asset, receiver);
                dst.net_flow_rate = utils::checked_add(dst.net_flow_rate, rate - prev.rate, "net flow rate");
                dst.owed_deposit -= prev.owed_deposit;

                if (rate == 0) b.flows.erase({sender, receiver});
                else b.flows[{sender, receiver}] = FlowState{rate, now_, new_deposit};

                security::AuditLogger::instance().log(security::AuditLogger::Level::Debug,
                                                      "[Stream] {} {} -> {} rate {} -> {}",
                                                      asset, sender, receiver, prev.rate, rate);

                auto it = receivers_.find(receiver);
                if (it != receivers_.end()) {
                    FlowChange change{asset, sender, receiver, prev.rate,
                                      prev.rate == 0 ? now_ : prev.updated_at, rate, now_, user_data};
                    dst.owed_deposit += new_deposit;
                    it->second->on_flow_changed(change, gas);
                    // The receiver may have rolled back nested transactions: look everything up again.
                    settle_deposit_credit(asset, sender, receiver, new_deposit);
                }
                tx.commit();
            }

            void settle_deposit_credit(const AssetId& asset, const AccountId& sender, const AccountId& receiver,
                                       Amount credit) {
                AccountState& dst = settle(asset, receiver);
                dst.owed_deposit -= credit;
                Amount used = std::min(credit, std::max<Amount>(0, -balance_of(asset, receiver)));
                if (used == 0) return;

                Amount sender_available = balance_of(asset, sender);
                if (sender_available < used) throw InsufficientBalanceError(sender, sender_available, used);
                settle(asset, receiver).owed_deposit += used;
                settle(asset, sender).deposit += used;
                mutable_book(asset).flows.at({sender, receiver}).owed_deposit = used;
            }

            Timestamp now_;
            Timestamp liquidation_period_;
            State state_;
            std::map<AccountId, IFlowReceiver*> receivers_;
        };

} // namespace ledger
