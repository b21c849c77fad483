#include "core/EngineConfig.hpp"
#include "engine/FlatFeeController.hpp"
#include "engine/Torex.hpp"
#include "ledger/Ledger.hpp"
#include "observability/Observability.hpp"
#include "observer/ChainedTwapObserver.hpp"
#include "observer/TickAccumulator.hpp"
#include "security/AuditLogger.hpp"
#include "utils/Panic.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#ifndef BUILD_HASH
#define BUILD_HASH "unknown"
#endif

namespace {

    using security::AuditLogger;

    void verify_build_flags() {
#if !defined(__OPTIMIZE__)
        AuditLogger::instance().log(AuditLogger::Level::Warn, "Built without optimizations (-O2)");
#endif
#if !defined(__GNUC__)
        PANIC("Unsupported compiler: 128-bit integer arithmetic required");
#endif
#ifdef __SANITIZE_ADDRESS__
        AuditLogger::instance().log(AuditLogger::Level::Info, "AddressSanitizer is enabled.");
#endif
    }

    // Market maker with its own out-asset inventory; always pays exactly the floor.
    class InventoryMover : public torex::ILiquidityMover {
        public:
            InventoryMover(ledger::Ledger& ledger, torex::AccountId self, torex::AccountId torex)
                : ledger_(ledger), self_(std::move(self)), torex_(std::move(torex)) {}

            bool move_liquidity_callback(const torex::AssetId&, const torex::AssetId& out_asset,
                                         torex::Amount in_amount, torex::Amount min_out_amount,
                                         const std::string&) override {
                ledger_.transfer(out_asset, self_, torex_, min_out_amount);
                received_in_ += in_amount;
                return true;
            }

            const torex::AccountId& account() const { return self_; }
            torex::Amount received_in() const { return received_in_; }

        private:
            ledger::Ledger& ledger_;
            torex::AccountId self_;
            torex::AccountId torex_;
            torex::Amount received_in_ = 0;
        };

    std::map<std::string, std::int64_t> parse_overrides(int argc, char** argv) {
        std::map<std::string, std::int64_t> opts{
            {"traders", 3}, {"rate", 1000}, {"moves", 5}, {"interval", 3600},
            {"fee_pm", 5000}, {"tick", -20000}, {"tau", 3600}, {"epsilon_pm", 100000}};
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto eq = arg.find('=');
            if (eq == std::string::npos || !opts.count(arg.substr(0, eq)))
                throw std::invalid_argument("unknown option: " + arg + " (expected key=value)");
            opts[arg.substr(0, eq)] = std::stoll(arg.substr(eq + 1));
        }
        return opts;
    }

    int run(const std::map<std::string, std::int64_t>& opts) {
        const torex::AssetId in_asset = "USDCx";
        const torex::AssetId out_asset = "ETHx";
        const torex::Amount supply = 1'000'000'000'000;

        ledger::Ledger ledger(1'700'000'000);
        ledger.create_asset(in_asset);
        ledger.create_asset(out_asset);

        auto oracle = std::make_shared<observer::TickAccumulator>(ledger.now(), static_cast<std::int32_t>(opts.at("tick")));
        auto twap = std::make_shared<observer::ChainedTwapObserver>(
            std::vector<observer::TwapHop>{{oracle, false}}, ledger.now());
        auto controller = std::make_shared<torex::FlatFeeController>(opts.at("fee_pm"));

        torex::TorexConfig config;
        config.in_asset = in_asset;
        config.out_asset = out_asset;
        config.observer = twap;
        config.discount_factor = torex::DiscountFactor::from_tau(opts.at("tau"), opts.at("epsilon_pm"));
        config.controller = controller;
        config.fee_pool_admin = "controller";
        config.max_allowed_fee_pm = 30'000;

        torex::Torex exchange(ledger, "torex:USDCx>ETHx", config);
        controller->bind_fee_pool(ledger, "controller", exchange.fee_distribution_pool());
        controller->set_beneficiary_units("staker", 1);
        ledger.connect_pool(exchange.fee_distribution_pool(), "staker");

        InventoryMover mover(ledger, "mover", exchange.address());
        ledger.mint(out_asset, mover.account(), supply);

        std::vector<torex::AccountId> traders;
        for (std::int64_t i = 0; i < opts.at("traders"); ++i) {
            torex::AccountId trader = "trader-" + std::to_string(i);
            ledger.mint(in_asset, trader, supply);
            ledger.approve(in_asset, trader, exchange.address(), supply);
            traders.push_back(trader);
        }

        const torex::Amount in_total = ledger.total_value(in_asset);
        const torex::Amount out_total = ledger.total_value(out_asset);

        for (std::int64_t m = 0; m < opts.at("moves"); ++m) {
            // Traders join one per cycle at staggered points inside it.
            if (m < static_cast<std::int64_t>(traders.size())) {
                ledger.advance_time(opts.at("interval") / 3);
                ledger.create_flow(in_asset, traders[m], exchange.address(), opts.at("rate") * (m + 1));
                ledger.advance_time(opts.at("interval") - opts.at("interval") / 3);
            } else {
                ledger.advance_time(opts.at("interval"));
            }
            oracle->set_tick(ledger.now(), static_cast<std::int32_t>(opts.at("tick") + 10 * m));

            torex::LiquidityMoveResult result = exchange.move_liquidity(mover.account(), mover);
            std::cout << result << '\n';

            if (ledger.total_value(in_asset) != in_total || ledger.total_value(out_asset) != out_total)
                PANIC("value not conserved after liquidity move " + std::to_string(m));
        }

        for (const auto& trader : traders) {
            if (ledger.flow_rate(in_asset, trader, exchange.address()) > 0)
                ledger.delete_flow(in_asset, trader, exchange.address());
            std::cout << trader << " out=" << ledger.balance_of(out_asset, trader)
                      << " in=" << ledger.balance_of(in_asset, trader) << '\n';
        }

        torex::TorexDetails d = exchange.debug_current_details();
        std::cout << "torex in=" << d.in_balance << " out=" << d.out_balance
                  << " controller_errors=" << d.controller_internal_error_counter
                  << " moves=" << controller->liquidity_moves() << '\n';
        for (const auto& [name, value] : observability::Observability::instance().snapshot())
            std::cout << name << '=' << value << '\n';
        return 0;
    }

} // namespace

int main(int argc, char** argv) {
    verify_build_flags();

    AuditLogger::instance().set_min_level(torex::EngineConfig::log_level);
    AuditLogger::instance().log(AuditLogger::Level::Info, "Torex simulation initialized. build={}", BUILD_HASH);

    try {
        return run(parse_overrides(argc, argv));
    } catch (const std::exception& e) {
        AuditLogger::instance().log(AuditLogger::Level::Error, "Simulation aborted: {}", e.what());
        return EXIT_FAILURE;
    }
}
