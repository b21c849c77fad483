#pragma once

#include "BackAdjustment.hpp"
#include "ControllerHookDispatcher.hpp"
#include "IController.hpp"
#include "ILiquidityMover.hpp"
#include "TorexEvents.hpp"
#include "TraderLedger.hpp"
#include "../core/Errors.hpp"
#include "../core/LiquidityMoveResult.hpp"
#include "../core/TorexConfig.hpp"
#include "../core/TraderState.hpp"
#include "../core/Types.hpp"
#include "../ledger/Ledger.hpp"
#include "../observability/Observability.hpp"
#include "../security/AuditLogger.hpp"
#include "../utils/CheckedMath.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace torex {

    struct TorexDetails {
        Amount in_balance = 0;
        Amount out_balance = 0;
        FlowRate in_net_flow_rate = 0;
        FlowRate total_contrib_flow_rate = 0;
        FlowRate requested_fee_dist_flow_rate = 0;
        FlowRate actual_fee_dist_flow_rate = 0;
        Amount fee_dist_buffer = 0;
        Units out_pool_total_units = 0;
        Timestamp last_move_time = 0;
        std::size_t trader_count = 0;
        std::uint64_t controller_internal_error_counter = 0;
    };

    // Time-weighted exchange of a continuously streamed in-asset for an
    // out-asset.
    //
    // Traders stream in-asset to the exchange's account; the ledger reports
    // every stream change through on_flow_changed. Anyone holding a liquidity
    // mover may call move_liquidity to take the accumulated in-asset in return
    // for at least the discounted TWAP value of out-asset, which is then
    // distributed to traders by contribution rate.
    //
    // Both entry points are all-or-nothing: ledger effects run in a ledger
    // transaction and the exchange's own storage is restored on any exception.
    class Torex : public ledger::IFlowReceiver {
        public:
            Torex(ledger::Ledger& ledger, AccountId self, TorexConfig config)
                : ledger_(ledger),
                  self_(std::move(self)),
                  config_((config.validate(), std::move(config))),
                  dispatcher_(config_.controller_safe_callback_gas_limit) {
                if (!ledger_.has_asset(config_.in_asset) || !ledger_.has_asset(config_.out_asset))
                    throw std::invalid_argument("Torex: assets must exist on the ledger");

                out_pool_ = ledger_.create_pool(config_.out_asset, self_);
                fee_pool_ = ledger_.create_pool(config_.in_asset,
                                                config_.fee_pool_admin.empty() ? self_ : config_.fee_pool_admin);

                Timestamp now = ledger_.now();
                config_.observer->create_checkpoint(now);
                storage_.last_move_time = now;
                ledger_.register_receiver(self_, this);

                security::AuditLogger::instance().log(
                    security::AuditLogger::Level::Info,
                    "[Torex Created] {} {}>{} max_fee_pm={} discount_factor={}",
                    self_, config_.in_asset, config_.out_asset, config_.max_allowed_fee_pm,
                    config_.discount_factor.value());
            }

            ~Torex() override { ledger_.unregister_receiver(self_); }

            Torex(const Torex&) = delete;
            Torex& operator=(const Torex&) = delete;

            const AccountId& address() const { return self_; }
            const TorexConfig& config() const { return config_; }

            std::pair<AssetId, AssetId> get_paired_assets() const { return {config_.in_asset, config_.out_asset}; }
            const PoolId& out_distribution_pool() const { return out_pool_; }
            const PoolId& fee_distribution_pool() const { return fee_pool_; }

            TraderState get_trader_state(const AccountId& trader) const { return storage_.traders.get(trader); }

            std::uint64_t controller_internal_error_counter() const {
                return storage_.controller_internal_error_counter;
            }

            Timestamp last_move_time() const { return storage_.last_move_time; }

            // Deposit the ledger holds for the fee flow. Pool unit changes
            // re-post it outside of any stream change, so it is never cached.
            Amount fee_dist_buffer() const { return ledger_.flow_distribution_deposit(fee_pool_, self_); }
            const std::vector<TorexEvent>& events() const { return storage_.events; }

            // Upper bound of what the exchange will pull from the trader through
            // its allowance if the trader's rate becomes new_flow_rate now,
            // whatever fee the controller picks.
            Amount estimate_approval_required(const AccountId& trader, FlowRate new_flow_rate) const {
                if (new_flow_rate < 0) throw std::invalid_argument("Torex: negative flow rate");
                TraderState prev = storage_.traders.get(trader);
                Timestamp elapsed = ledger_.now() - storage_.last_move_time;

                // Zero fee maximizes the contribution charge; the maximum fee
                // maximizes the fee and buffer charges.
                Amount charge = 0;
                for (FlowRate fee : {FlowRate{0}, max_fee_flow_rate(new_flow_rate)}) {
                    TraderState next{new_flow_rate - fee, fee};
                    FlowRate requested = utils::checked_add(storage_.traders.requested_fee_dist_flow_rate(),
                                                            utils::checked_sub(fee, prev.fee_flow_rate),
                                                            "approval estimate");
                    Amount buffer_delta =
                        ledger_.estimate_flow_distribution(fee_pool_, std::max<FlowRate>(0, requested)).deposit -
                        fee_dist_buffer();
                    charge = std::max(charge, compute_back_adjustment(elapsed, prev, next, buffer_delta).total_charge());
                }
                return charge;
            }

            BenchmarkQuote get_benchmark_quote(Amount in_amount) const {
                observer::TwapQuote quote = config_.observer->get_twap_since_last_checkpoint(ledger_.now(), in_amount);
                Amount twap = config_.twap_scaler.scale(quote.out_amount);
                return {config_.discount_factor.discounted_value(twap, quote.duration), quote.duration, twap};
            }

            LiquidityEstimations get_liquidity_estimations() const {
                Amount in_amount = std::max<Amount>(0, ledger_.balance_of(config_.in_asset, self_));
                BenchmarkQuote quote = get_benchmark_quote(in_amount);
                return {in_amount, quote.min_out_amount, quote.duration, quote.twap};
            }

            TorexDetails debug_current_details() const {
                TorexDetails d;
                d.in_balance = ledger_.balance_of(config_.in_asset, self_);
                d.out_balance = ledger_.balance_of(config_.out_asset, self_);
                d.in_net_flow_rate = ledger_.net_flow_rate(config_.in_asset, self_);
                d.total_contrib_flow_rate = storage_.traders.total_contrib_flow_rate();
                d.requested_fee_dist_flow_rate = storage_.traders.requested_fee_dist_flow_rate();
                d.actual_fee_dist_flow_rate = ledger_.flow_distribution_rate(fee_pool_, self_);
                d.fee_dist_buffer = fee_dist_buffer();
                d.out_pool_total_units = ledger_.total_units(out_pool_);
                d.last_move_time = storage_.last_move_time;
                d.trader_count = storage_.traders.size();
                d.controller_internal_error_counter = storage_.controller_internal_error_counter;
                return d;
            }

            LiquidityMoveResult move_liquidity(const AccountId& mover_account, ILiquidityMover& mover,
                                               const std::string& mover_data, ledger::GasMeter& gas) {
                if (moving_) throw ReentrantCallError();
                MovingGuard guard(moving_);

                Timestamp now = ledger_.now();
                if (now == storage_.last_move_time) throw SameInstantMovementError();
                dispatcher_.ensure_budget(gas);

                return observability::Observability::instance().trace("torex.move_liquidity", [&] {
                    Storage saved = storage_;
                    ledger::Ledger::Transaction tx(ledger_);
                    try {
                        LiquidityMoveResult result = execute_liquidity_move(mover_account, mover, mover_data, gas, now);
                        tx.commit();
                        return result;
                    } catch (...) {
                        storage_ = std::move(saved);
                        throw;
                    }
                });
            }

            LiquidityMoveResult move_liquidity(const AccountId& mover_account, ILiquidityMover& mover,
                                               const std::string& mover_data = {}) {
                ledger::GasMeter gas(EngineConfig::default_call_gas);
                return move_liquidity(mover_account, mover, mover_data, gas);
            }

            void on_flow_changed(const ledger::FlowChange& change, ledger::GasMeter& gas) override {
                if (change.receiver != self_)
                    throw UnauthorizedCallerError("Torex: stream notice for " + change.receiver);
                if (change.asset != config_.in_asset) throw ForeignStreamError(change.asset);
                if (ledger_.flow_rate(change.asset, change.sender, self_) != change.new_flow_rate)
                    throw UnauthorizedCallerError("Torex: stream notice does not match the ledger");

                Storage saved = storage_;
                try {
                    handle_flow_change(change, gas);
                } catch (...) {
                    storage_ = std::move(saved);
                    throw;
                }
            }

        private:
            struct Storage {
                TraderLedger traders;
                Timestamp last_move_time = 0;
                std::uint64_t controller_internal_error_counter = 0;
                std::vector<TorexEvent> events;
            };

            struct MovingGuard {
                explicit MovingGuard(bool& flag) : flag_(flag) { flag_ = true; }
                ~MovingGuard() { flag_ = false; }
                bool& flag_;
            };

            FlowRate max_fee_flow_rate(FlowRate flow_rate) const {
                return utils::mul_div(flow_rate, config_.max_allowed_fee_pm, ONE_HUNDRED_PERCENT_PM, "max fee");
            }

            void record_controller_error(const char* hook, const std::string& reason, Timestamp now) {
                ++storage_.controller_internal_error_counter;
                storage_.events.push_back(ControllerError{hook, reason, now});
                observability::Observability::instance().increment_metric("torex.controller_errors");
            }

            // Deletions must go through whatever the controller does; creates
            // and updates fail with it.
            FlowRate query_fee_flow_rate(const FlowChangedNotice& notice, const TraderState& prev,
                                         ledger::GasMeter& gas) {
                auto call = [this, &notice](ledger::GasMeter& g) {
                    return config_.controller->on_in_flow_changed(notice, g);
                };
                if (notice.new_flow_rate != 0) return dispatcher_.unsafe_call(gas, call);

                dispatcher_.ensure_budget(gas);
                ledger::Ledger::Transaction controller_tx(ledger_);
                SafeCallResult<FlowRate> r = dispatcher_.safe_call(gas, "on_in_flow_changed", call);
                if (r.ok) {
                    controller_tx.commit();
                    return r.value;
                }
                record_controller_error("on_in_flow_changed", r.reason, notice.now);
                return prev.fee_flow_rate;
            }

            void handle_flow_change(const ledger::FlowChange& change, ledger::GasMeter& gas) {
                const AccountId& trader = change.sender;
                const Timestamp now = change.now;
                const bool first_seen = !storage_.traders.knows(trader);
                TraderState prev = storage_.traders.get(trader);

                FlowChangedNotice notice{trader, change.prev_flow_rate, prev.fee_flow_rate, change.last_updated,
                                         change.new_flow_rate, now, change.user_data};
                FlowRate requested_fee = query_fee_flow_rate(notice, prev, gas);

                // The controller's answer is never trusted beyond the ceiling.
                TraderState next;
                next.fee_flow_rate = std::clamp<FlowRate>(requested_fee, 0, max_fee_flow_rate(change.new_flow_rate));
                next.contrib_flow_rate = change.new_flow_rate - next.fee_flow_rate;

                ledger_.update_member_units(out_pool_, self_, trader,
                                            config_.out_distribution_scaler.scale(next.contrib_flow_rate));
                if (first_seen) ledger_.connect_pool(out_pool_, trader);

                FlowRate requested_fee_rate = storage_.traders.apply(trader, next);
                ledger::FlowDistributionEstimate fee_estimate =
                    ledger_.estimate_flow_distribution(fee_pool_, requested_fee_rate);
                Amount buffer_delta = fee_estimate.deposit - fee_dist_buffer();

                BackAdjustment adj =
                    compute_back_adjustment(now - storage_.last_move_time, prev, next, buffer_delta);

                if (adj.total_charge() > 0)
                    ledger_.transfer_from(config_.in_asset, self_, trader, self_, adj.total_charge());

                // Buffer growth not charged above is fronted by the exchange,
                // backed by the ledger's deposit credit for this stream.
                FlowRate actual_fee_rate = ledger_.distribute_flow(self_, fee_pool_, requested_fee_rate);

                if (adj.fee_charge > 0) ledger_.distribute(self_, fee_pool_, adj.fee_charge);
                if (adj.refund() > 0) ledger_.transfer(config_.in_asset, self_, trader, adj.refund());

                Amount signed_adjustment = utils::checked_sub(adj.total_charge(), adj.refund(), "back adjustment");
                storage_.events.push_back(TorexFlowUpdated{trader, change.new_flow_rate, next.contrib_flow_rate,
                                                           signed_adjustment, requested_fee_rate, actual_fee_rate,
                                                           now});
                observability::Observability::instance().increment_metric("torex.flow_updates");
                security::AuditLogger::instance().log(
                    security::AuditLogger::Level::Info,
                    "[Torex Flow Updated] trader={} rate={} contrib={} fee={} back_adjustment={}",
                    trader, change.new_flow_rate, next.contrib_flow_rate, next.fee_flow_rate, signed_adjustment);
            }

            LiquidityMoveResult execute_liquidity_move(const AccountId& mover_account, ILiquidityMover& mover,
                                                       const std::string& mover_data, ledger::GasMeter& gas,
                                                       Timestamp now) {
                LiquidityEstimations est = get_liquidity_estimations();

                ledger_.transfer(config_.in_asset, self_, mover_account, est.in_amount);
                if (!mover.move_liquidity_callback(config_.in_asset, config_.out_asset, est.in_amount,
                                                   est.min_out_amount, mover_data))
                    throw MoverCallbackRejectedError();

                // What the exchange holds counts, not what the mover claims to have sent.
                Amount out_amount = std::max<Amount>(0, ledger_.balance_of(config_.out_asset, self_));
                if (out_amount < est.min_out_amount)
                    throw InsufficientProceedsError(out_amount, est.min_out_amount);

                storage_.last_move_time = now;

                Amount actual_out_amount = ledger_.estimate_distribution_actual_amount(out_pool_, out_amount);
                ledger_.distribute(self_, out_pool_, actual_out_amount);

                LiquidityMoveResult result{est.duration, est.twap, est.in_amount, est.min_out_amount, out_amount,
                                           actual_out_amount};
                storage_.events.push_back(LiquidityMoved{mover_account, result, now});
                observability::Observability::instance().increment_metric("torex.liquidity_moves");
                security::AuditLogger::instance().log(
                    security::AuditLogger::Level::Info,
                    "[Liquidity Moved] mover={} duration={} in={} min_out={} out={} distributed={}",
                    mover_account, result.duration_since_last_move, result.in_amount, result.min_out_amount,
                    result.out_amount, result.actual_out_amount);

                ledger::Ledger::Transaction controller_tx(ledger_);
                SafeCallResult<bool> ack = dispatcher_.safe_call(
                    gas, "on_liquidity_moved",
                    [this, &result](ledger::GasMeter& g) { return config_.controller->on_liquidity_moved(result, g); });
                if (ack.ok && ack.value) {
                    controller_tx.commit();
                } else {
                    record_controller_error("on_liquidity_moved", ack.ok ? "not acknowledged" : ack.reason, now);
                }

                // The observer is outside the ledger transaction: checkpoint last.
                config_.observer->create_checkpoint(now);
                return result;
            }

            ledger::Ledger& ledger_;
            AccountId self_;
            TorexConfig config_;
            ControllerHookDispatcher dispatcher_;
            PoolId out_pool_;
            PoolId fee_pool_;
            Storage storage_;
            bool moving_ = false;
        };

} // namespace torex
