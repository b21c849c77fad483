#pragma once

#include "LedgerErrors.hpp"

#include <cstdint>

namespace ledger {

    // Execution budget of one call frame. A callee frame gets a fresh meter
    // limited by forwardable(); the caller is then charged what it used.
    class GasMeter {
        public:
            explicit GasMeter(std::uint64_t limit) : limit_(limit), remaining_(limit) {}

            void consume(std::uint64_t amount) {
                if (amount > remaining_) {
                    remaining_ = 0;
                    throw OutOfGasError();
                }
                remaining_ -= amount;
            }

            void exhaust() { remaining_ = 0; }

            // All but one 64th of the remaining budget may be handed to a callee.
            std::uint64_t forwardable() const { return remaining_ - remaining_ / 64; }

            std::uint64_t remaining() const { return remaining_; }
            std::uint64_t used() const { return limit_ - remaining_; }
            std::uint64_t limit() const { return limit_; }

        private:
            std::uint64_t limit_;
            std::uint64_t remaining_;
        };

} // namespace ledger
