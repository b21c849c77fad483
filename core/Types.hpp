#pragma once

#include <cstdint>
#include <string>

namespace torex {

    using AccountId = std::string;
    using AssetId = std::string;
    using PoolId = std::string;

    using Amount = std::int64_t;
    using FlowRate = std::int64_t;
    using Units = std::int64_t;
    using Timestamp = std::int64_t;

    // Parts-per-million denominator for fee and discount percentages.
    inline constexpr std::int64_t ONE_HUNDRED_PERCENT_PM = 1'000'000;

} // namespace torex
