#pragma once

#include "IController.hpp"
#include "../core/Types.hpp"
#include "../ledger/Ledger.hpp"
#include "../security/AuditLogger.hpp"
#include "../utils/CheckedMath.hpp"

#include <cstdint>
#include <stdexcept>
#include <utility>

namespace torex {

    // Charges every trader the same share of its gross rate and splits the fee
    // stream between beneficiaries by fee-pool units.
    class FlatFeeController : public IController {
        public:
            explicit FlatFeeController(std::int64_t fee_pm, std::uint64_t gas_per_call = 25'000)
                : fee_pm_(fee_pm), gas_per_call_(gas_per_call) {
                if (fee_pm < 0 || fee_pm > ONE_HUNDRED_PERCENT_PM)
                    throw std::invalid_argument("FlatFeeController: fee_pm out of [0, 1e6]");
            }

            // The fee pool is created by the exchange with `self` as its admin.
            void bind_fee_pool(ledger::Ledger& ledger, AccountId self, PoolId fee_pool) {
                ledger_ = &ledger;
                self_ = std::move(self);
                fee_pool_ = std::move(fee_pool);
            }

            void set_beneficiary_units(const AccountId& beneficiary, Units units) {
                if (!ledger_) throw std::logic_error("FlatFeeController: fee pool not bound");
                ledger_->update_member_units(fee_pool_, self_, beneficiary, units);
                security::AuditLogger::instance().log(security::AuditLogger::Level::Info,
                                                      "[Fee Beneficiary] {} units={}", beneficiary, units);
            }

            FlowRate on_in_flow_changed(const FlowChangedNotice& notice, ledger::GasMeter& gas) override {
                gas.consume(gas_per_call_);
                return utils::mul_div(notice.new_flow_rate, fee_pm_, ONE_HUNDRED_PERCENT_PM, "flat fee");
            }

            bool on_liquidity_moved(const LiquidityMoveResult& result, ledger::GasMeter& gas) override {
                gas.consume(gas_per_call_);
                ++liquidity_moves_;
                total_in_moved_ = utils::checked_add(total_in_moved_, result.in_amount, "controller stats");
                return true;
            }

            std::int64_t fee_pm() const { return fee_pm_; }
            std::uint64_t liquidity_moves() const { return liquidity_moves_; }
            Amount total_in_moved() const { return total_in_moved_; }

        private:
            std::int64_t fee_pm_;
            std::uint64_t gas_per_call_;
            ledger::Ledger* ledger_ = nullptr;
            AccountId self_;
            PoolId fee_pool_;
            std::uint64_t liquidity_moves_ = 0;
            Amount total_in_moved_ = 0;
        };

} // namespace torex
