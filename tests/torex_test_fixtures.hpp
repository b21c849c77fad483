#pragma once

#include <gtest/gtest.h>

#include "engine/IController.hpp"
#include "engine/ILiquidityMover.hpp"
#include "engine/Torex.hpp"
#include "ledger/Ledger.hpp"
#include "observer/ITwapObserver.hpp"
#include "security/AuditLogger.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace torex_test {

    using torex::AccountId;
    using torex::Amount;
    using torex::FlowRate;
    using torex::Timestamp;

    // out = in * numerator / denominator, whatever the elapsed time.
    class FixedPriceObserver : public observer::ITwapObserver {
        public:
            FixedPriceObserver(Amount numerator, Amount denominator) : num_(numerator), den_(denominator) {}

            bool fail_checkpoint = false;

            void create_checkpoint(Timestamp now) override {
                if (fail_checkpoint) throw std::runtime_error("observer unavailable");
                checkpoint_ = now;
                ++checkpoints_;
            }

            Timestamp get_duration_since_last_checkpoint(Timestamp now) const override { return now - checkpoint_; }

            observer::TwapQuote get_twap_since_last_checkpoint(Timestamp now, Amount in_amount) const override {
                return {utils::mul_div(in_amount, num_, den_, "fixed price"), now - checkpoint_};
            }

            Timestamp checkpoint() const { return checkpoint_; }
            int checkpoints() const { return checkpoints_; }

        private:
            Amount num_;
            Amount den_;
            Timestamp checkpoint_ = 0;
            int checkpoints_ = 0;
        };

    // Controller whose behavior per hook is chosen by the test.
    class ScriptedController : public torex::IController {
        public:
            // ThrowInt throws something that is not a std::exception.
            enum class Mode { Normal, Throw, ThrowInt, BurnGas, Nack };

            // Fee returned on flow changes, as a function of the new gross rate.
            std::function<FlowRate(FlowRate)> fee = [](FlowRate) { return FlowRate{0}; };
            Mode on_create_or_update = Mode::Normal;
            Mode on_delete = Mode::Normal;
            Mode on_moved = Mode::Normal;

            int flow_notices = 0;
            int move_notices = 0;
            torex::FlowChangedNotice last_notice;

            FlowRate on_in_flow_changed(const torex::FlowChangedNotice& notice, ledger::GasMeter& gas) override {
                gas.consume(10'000);
                ++flow_notices;
                last_notice = notice;
                misbehave(notice.new_flow_rate == 0 ? on_delete : on_create_or_update, gas);
                return fee(notice.new_flow_rate);
            }

            bool on_liquidity_moved(const torex::LiquidityMoveResult&, ledger::GasMeter& gas) override {
                gas.consume(10'000);
                ++move_notices;
                misbehave(on_moved, gas);
                return on_moved != Mode::Nack;
            }

        private:
            static void misbehave(Mode mode, ledger::GasMeter& gas) {
                if (mode == Mode::Throw) throw std::runtime_error("controller exploded");
                if (mode == Mode::ThrowInt) throw 42;
                if (mode == Mode::BurnGas) gas.consume(gas.remaining() + 1);
            }
        };

    // Pays the exchange min_out_amount + bonus of out-asset from its own stock.
    class ScriptedMover : public torex::ILiquidityMover {
        public:
            ScriptedMover(ledger::Ledger& ledger, AccountId self, AccountId exchange)
                : ledger_(ledger), self_(std::move(self)), exchange_(std::move(exchange)) {}

            Amount bonus = 0;
            bool acknowledge = true;
            std::function<void()> during_callback;

            int calls = 0;
            Amount last_in_amount = 0;
            Amount last_min_out_amount = 0;
            std::string last_data;

            bool move_liquidity_callback(const torex::AssetId&, const torex::AssetId& out_asset, Amount in_amount,
                                         Amount min_out_amount, const std::string& mover_data) override {
                ++calls;
                last_in_amount = in_amount;
                last_min_out_amount = min_out_amount;
                last_data = mover_data;
                if (during_callback) during_callback();
                Amount pay = min_out_amount + bonus;
                if (pay > 0) ledger_.transfer(out_asset, self_, exchange_, pay);
                return acknowledge;
            }

            const AccountId& account() const { return self_; }

        private:
            ledger::Ledger& ledger_;
            AccountId self_;
            AccountId exchange_;
        };

    class TorexFixture : public ::testing::Test {
        protected:
            static constexpr Timestamp kGenesis = 1'725'000'000;
            static constexpr Amount kSupply = 1'000'000'000'000;

            void SetUp() override {
                security::AuditLogger::instance().set_sink(&log_);
                ledger.create_asset(in_asset);
                ledger.create_asset(out_asset);
                ledger.mint(out_asset, "mover", kSupply);
            }

            void TearDown() override { security::AuditLogger::instance().set_sink(nullptr); }

            torex::TorexConfig make_config(torex::DiscountFactor discount = torex::DiscountFactor::disabled(),
                                           std::int64_t max_fee_pm = 100'000) {
                torex::TorexConfig config;
                config.in_asset = in_asset;
                config.out_asset = out_asset;
                config.observer = price;
                config.discount_factor = discount;
                config.controller = controller;
                config.max_allowed_fee_pm = max_fee_pm;
                return config;
            }

            torex::Torex& make_torex(torex::TorexConfig config) {
                exchange = std::make_unique<torex::Torex>(ledger, "torex", std::move(config));
                mover = std::make_unique<ScriptedMover>(ledger, "mover", exchange->address());
                return *exchange;
            }

            torex::Torex& make_torex() { return make_torex(make_config()); }

            void fund(const AccountId& trader, Amount amount = kSupply) {
                ledger.mint(in_asset, trader, amount);
                ledger.approve(in_asset, trader, exchange->address(), amount);
            }

            // What the trader has handed over so far, deposits excluded.
            Amount paid_in(const AccountId& trader, Amount funded = kSupply) const {
                return funded - ledger.realtime_balance(in_asset, trader);
            }

            const torex::AssetId in_asset = "USDCx";
            const torex::AssetId out_asset = "ETHx";
            ledger::Ledger ledger{kGenesis};
            std::shared_ptr<FixedPriceObserver> price = std::make_shared<FixedPriceObserver>(2, 1);
            std::shared_ptr<ScriptedController> controller = std::make_shared<ScriptedController>();
            std::unique_ptr<torex::Torex> exchange;
            std::unique_ptr<ScriptedMover> mover;
            std::ostringstream log_;
        };

} // namespace torex_test
