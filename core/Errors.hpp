#pragma once

#include <stdexcept>
#include <string>

namespace torex {

    class TorexError : public std::runtime_error {
        public:
            explicit TorexError(const std::string& what) : std::runtime_error(what) {}
        };

    class InsufficientProceedsError : public TorexError {
        public:
            InsufficientProceedsError(long long out_amount, long long min_out_amount)
                : TorexError("liquidity mover sent insufficient out-asset: got " +
                             std::to_string(out_amount) + ", required " + std::to_string(min_out_amount)) {}
        };

    class SameInstantMovementError : public TorexError {
        public:
            SameInstantMovementError() : TorexError("no two liquidity moves at the same instant") {}
        };

    class ReentrantCallError : public TorexError {
        public:
            ReentrantCallError() : TorexError("reentrant liquidity move") {}
        };

    class MoverCallbackRejectedError : public TorexError {
        public:
            MoverCallbackRejectedError() : TorexError("liquidity mover callback did not acknowledge") {}
        };

    class ForeignStreamError : public TorexError {
        public:
            explicit ForeignStreamError(const std::string& asset)
                : TorexError("stream of unsupported asset: " + asset) {}
        };

    class UnauthorizedCallerError : public TorexError {
        public:
            explicit UnauthorizedCallerError(const std::string& what) : TorexError(what) {}
        };

} // namespace torex
