#pragma once

#include "../core/Types.hpp"

namespace observer {

    struct TwapQuote {
        torex::Amount out_amount = 0;
        torex::Timestamp duration = 0;
    };

    // Time-weighted price source measured since the last checkpoint.
    // Checkpoints only move forward; duration = now - last checkpoint time.
    class ITwapObserver {
        public:
            virtual ~ITwapObserver() = default;

            virtual void create_checkpoint(torex::Timestamp now) = 0;
            virtual torex::Timestamp get_duration_since_last_checkpoint(torex::Timestamp now) const = 0;
            virtual TwapQuote get_twap_since_last_checkpoint(torex::Timestamp now, torex::Amount in_amount) const = 0;
        };

} // namespace observer
