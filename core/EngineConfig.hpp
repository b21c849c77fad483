#pragma once

#include "Types.hpp"
#include "../security/AuditLogger.hpp"

#include <cstdint>

namespace torex {

    // Process-wide defaults. Per-exchange settings live in TorexConfig.
    struct EngineConfig {
        static inline std::uint64_t default_call_gas = 30'000'000;
        static inline Timestamp default_liquidation_period = 4 * 3600;
        static inline std::uint64_t default_safe_callback_gas_limit = 3'000'000;
        static inline security::AuditLogger::Level log_level = security::AuditLogger::Level::Info;
    };

} // namespace torex
