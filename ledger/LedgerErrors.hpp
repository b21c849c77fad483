#pragma once

#include <stdexcept>
#include <string>

namespace ledger {

    class LedgerError : public std::runtime_error {
        public:
            explicit LedgerError(const std::string& what) : std::runtime_error(what) {}
        };

    class InsufficientBalanceError : public LedgerError {
        public:
            InsufficientBalanceError(const std::string& account, long long available, long long required)
                : LedgerError("insufficient balance for " + account + ": available " +
                              std::to_string(available) + ", required " + std::to_string(required)) {}
        };

    class InsufficientAllowanceError : public LedgerError {
        public:
            InsufficientAllowanceError(const std::string& owner, const std::string& spender)
                : LedgerError("insufficient allowance from " + owner + " to " + spender) {}
        };

    class UnknownFlowError : public LedgerError {
        public:
            explicit UnknownFlowError(const std::string& what) : LedgerError(what) {}
        };

    class UnknownPoolError : public LedgerError {
        public:
            explicit UnknownPoolError(const std::string& pool) : LedgerError("unknown pool: " + pool) {}
        };

    class OutOfGasError : public LedgerError {
        public:
            OutOfGasError() : LedgerError("out of gas") {}
        };

} // namespace ledger
