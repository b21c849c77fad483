#pragma once

#include "DiscountFactor.hpp"
#include "EngineConfig.hpp"
#include "Scaler.hpp"
#include "Types.hpp"
#include "../observer/ITwapObserver.hpp"

#include <cstdint>
#include <memory>
#include <stdexcept>

namespace torex {

    class IController;

    // Fixed at exchange creation.
    struct TorexConfig {
        AssetId in_asset;
        AssetId out_asset;
        std::shared_ptr<observer::ITwapObserver> observer;
        Scaler twap_scaler{1};
        DiscountFactor discount_factor;
        // Contribution flow rate -> out pool units.
        Scaler out_distribution_scaler{1};
        std::shared_ptr<IController> controller;
        // Administers the fee pool's units. Empty means the exchange itself.
        AccountId fee_pool_admin;
        std::uint64_t controller_safe_callback_gas_limit = EngineConfig::default_safe_callback_gas_limit;
        std::int64_t max_allowed_fee_pm = 0;

        void validate() const {
            if (in_asset.empty() || out_asset.empty())
                throw std::invalid_argument("TorexConfig: asset ids must be set");
            if (in_asset == out_asset)
                throw std::invalid_argument("TorexConfig: in and out assets must differ");
            if (!observer) throw std::invalid_argument("TorexConfig: observer is required");
            if (!controller) throw std::invalid_argument("TorexConfig: controller is required");
            if (discount_factor.value() < 0)
                throw std::invalid_argument("TorexConfig: negative discount factor");
            if (max_allowed_fee_pm < 0 || max_allowed_fee_pm > ONE_HUNDRED_PERCENT_PM)
                throw std::invalid_argument("TorexConfig: max_allowed_fee_pm out of [0, 1e6]");
            if (controller_safe_callback_gas_limit == 0)
                throw std::invalid_argument("TorexConfig: safe callback gas limit must be positive");
        }
    };

} // namespace torex
