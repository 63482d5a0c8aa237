#pragma once

#include <chrono>
#include <datapod/datapod.hpp>
#include <functional>
#include <string>

#include "blockindex/model/types.hpp"

namespace blockindex::sync {

    /// Read access to a full node. Every call receives the timeout it must honour
    /// and reports node_unavailable / node_timeout on transport failures. Unknown
    /// heights or hashes are dp::Error::not_found. Calls have no side effects.
    struct NodeClient {
        std::function<dp::Result<model::ChainTip, dp::Error>(std::chrono::milliseconds)> get_best_block;
        std::function<dp::Result<model::Block, dp::Error>(dp::i64, std::chrono::milliseconds)> get_block_by_height;
        std::function<dp::Result<model::Block, dp::Error>(const std::string &, std::chrono::milliseconds)>
            get_block_by_hash;

        inline bool valid() const {
            return static_cast<bool>(get_best_block) && static_cast<bool>(get_block_by_height) &&
                   static_cast<bool>(get_block_by_hash);
        }
    };

} // namespace blockindex::sync
