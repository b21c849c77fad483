#pragma once

#include "ITickOracle.hpp"
#include "ITwapObserver.hpp"
#include "../security/AuditLogger.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

namespace observer {

    struct TwapHop {
        std::shared_ptr<ITickOracle> oracle;
        bool inverse = false;  // quote token0 for token1 instead of token1 for token0
    };

    // Quotes an amount through a path of pools (A -> B -> C ...), each hop at
    // its own time-weighted average tick since the last checkpoint.
    class ChainedTwapObserver : public ITwapObserver {
        public:
            ChainedTwapObserver(std::vector<TwapHop> hops, torex::Timestamp now) : hops_(std::move(hops)) {
                if (hops_.empty()) throw std::invalid_argument("ChainedTwapObserver: no hops");
                for (const auto& hop : hops_) {
                    if (!hop.oracle) throw std::invalid_argument("ChainedTwapObserver: null oracle");
                }
                checkpoint_time_ = now;
                snapshot(now);
            }

            void create_checkpoint(torex::Timestamp now) override {
                if (now < checkpoint_time_)
                    throw std::invalid_argument("ChainedTwapObserver: checkpoint in the past");
                checkpoint_time_ = now;
                snapshot(now);
                security::AuditLogger::instance().log(security::AuditLogger::Level::Debug,
                                                      "[Twap Checkpoint] t={} hops={}", now, hops_.size());
            }

            torex::Timestamp get_duration_since_last_checkpoint(torex::Timestamp now) const override {
                if (now < checkpoint_time_)
                    throw std::invalid_argument("ChainedTwapObserver: query before checkpoint");
                return now - checkpoint_time_;
            }

            TwapQuote get_twap_since_last_checkpoint(torex::Timestamp now, torex::Amount in_amount) const override {
                if (in_amount < 0) throw std::invalid_argument("ChainedTwapObserver: negative amount");
                torex::Timestamp duration = get_duration_since_last_checkpoint(now);

                long double amount = static_cast<long double>(in_amount);
                for (std::size_t i = 0; i < hops_.size(); ++i) {
                    std::int64_t tick = average_tick(i, now, duration);
                    if (hops_[i].inverse) tick = -tick;
                    amount = std::floor(amount * std::pow(1.0001L, static_cast<long double>(tick)));
                }

                if (!std::isfinite(amount) ||
                    amount > static_cast<long double>(std::numeric_limits<torex::Amount>::max()))
                    throw std::overflow_error("ChainedTwapObserver: quote out of range");
                return {static_cast<torex::Amount>(amount), duration};
            }

            torex::Timestamp checkpoint_time() const { return checkpoint_time_; }

        private:
            void snapshot(torex::Timestamp now) {
                checkpoint_cumulatives_.clear();
                for (const auto& hop : hops_) checkpoint_cumulatives_.push_back(hop.oracle->tick_cumulative(now));
            }

            // Floor of the mean tick; rounds toward negative infinity like the pool oracle.
            std::int64_t average_tick(std::size_t i, torex::Timestamp now, torex::Timestamp duration) const {
                if (duration == 0) return hops_[i].oracle->current_tick();
                std::int64_t delta = hops_[i].oracle->tick_cumulative(now) - checkpoint_cumulatives_[i];
                std::int64_t tick = delta / duration;
                if (delta < 0 && delta % duration != 0) --tick;
                return tick;
            }

            std::vector<TwapHop> hops_;
            std::vector<std::int64_t> checkpoint_cumulatives_;
            torex::Timestamp checkpoint_time_ = 0;
        };

} // namespace observer
