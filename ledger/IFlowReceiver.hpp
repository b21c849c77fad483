#pragma once

#include "GasMeter.hpp"
#include "../core/Types.hpp"

#include <string>

namespace ledger {

    // What a receiving account learns when a stream into it changes. The
    // stream itself is already updated when the receiver is notified.
    struct FlowChange {
        torex::AssetId asset;
        torex::AccountId sender;
        torex::AccountId receiver;
        torex::FlowRate prev_flow_rate = 0;
        torex::Timestamp last_updated = 0;
        torex::FlowRate new_flow_rate = 0;
        torex::Timestamp now = 0;
        std::string user_data;
    };

    class IFlowReceiver {
        public:
            virtual ~IFlowReceiver() = default;

            // Throwing aborts the whole stream operation.
            virtual void on_flow_changed(const FlowChange& change, GasMeter& gas) = 0;
        };

} // namespace ledger
