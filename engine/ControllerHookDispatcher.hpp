#pragma once

#include "../ledger/GasMeter.hpp"
#include "../ledger/LedgerErrors.hpp"
#include "../security/AuditLogger.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <string>
#include <type_traits>
#include <utility>

namespace torex {

    template <typename T>
    struct SafeCallResult {
        bool ok = false;
        T value{};
        std::string reason;  // failure payload when !ok
    };

    // Calls into the controller under one of two policies.
    //
    // unsafe_call: the callee gets everything the caller can forward; any
    // failure propagates and aborts the caller's operation.
    //
    // safe_call: the callee gets at most the configured limit; anything the callee
    // throws is captured and returned. The one failure that is NOT contained is the callee
    // running out of gas while the caller could not forward the full limit:
    // the caller under-supplied gas, and swallowing that would let it skip
    // the hook at will. In that case the caller's remaining budget is burned
    // and OutOfGasError propagates.
    class ControllerHookDispatcher {
        public:
            explicit ControllerHookDispatcher(std::uint64_t safe_callback_gas_limit)
                : safe_callback_gas_limit_(safe_callback_gas_limit) {}

            std::uint64_t safe_callback_gas_limit() const { return safe_callback_gas_limit_; }

            // Up-front version of the same rule, for callers that must not fail
            // after they have started mutating state.
            void ensure_budget(ledger::GasMeter& caller) const {
                if (caller.forwardable() < safe_callback_gas_limit_) {
                    security::AuditLogger::instance().log(
                        security::AuditLogger::Level::Warn,
                        "[Controller Hook] caller budget {} below safe callback limit {}",
                        caller.remaining(), safe_callback_gas_limit_);
                    caller.exhaust();
                    throw ledger::OutOfGasError();
                }
            }

            template <typename Fn>
            auto safe_call(ledger::GasMeter& caller, const char* hook, Fn&& fn)
                -> SafeCallResult<std::invoke_result_t<Fn, ledger::GasMeter&>> {
                using Value = std::invoke_result_t<Fn, ledger::GasMeter&>;
                const std::uint64_t forwarded = std::min(safe_callback_gas_limit_, caller.forwardable());
                ledger::GasMeter callee(forwarded);
                try {
                    Value value = std::forward<Fn>(fn)(callee);
                    caller.consume(callee.used());
                    return {true, std::move(value), {}};
                } catch (const ledger::OutOfGasError& e) {
                    caller.consume(callee.used());
                    if (forwarded < safe_callback_gas_limit_) {
                        security::AuditLogger::instance().log(
                            security::AuditLogger::Level::Warn,
                            "[Controller Hook] {} ran out of under-supplied gas ({} < {}), propagating",
                            hook, forwarded, safe_callback_gas_limit_);
                        caller.exhaust();
                        throw;
                    }
                    return failure<Value>(hook, e.what());
                } catch (const std::exception& e) {
                    caller.consume(callee.used());
                    return failure<Value>(hook, e.what());
                } catch (...) {
                    caller.consume(callee.used());
                    return failure<Value>(hook, "unknown exception");
                }
            }

            template <typename Fn>
            auto unsafe_call(ledger::GasMeter& caller, Fn&& fn) -> std::invoke_result_t<Fn, ledger::GasMeter&> {
                ledger::GasMeter callee(caller.forwardable());
                try {
                    auto value = std::forward<Fn>(fn)(callee);
                    caller.consume(callee.used());
                    return value;
                } catch (...) {
                    caller.consume(callee.used());
                    throw;
                }
            }

        private:
            template <typename Value>
            static SafeCallResult<Value> failure(const char* hook, const std::string& reason) {
                security::AuditLogger::instance().log(security::AuditLogger::Level::Warn,
                                                      "[Controller Hook Failed] hook={} reason={}", hook, reason);
                SafeCallResult<Value> result;
                result.reason = reason;
                return result;
            }

            std::uint64_t safe_callback_gas_limit_;
        };

} // namespace torex
