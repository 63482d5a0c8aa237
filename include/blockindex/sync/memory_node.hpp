#pragma once

#include <datapod/datapod.hpp>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "blockindex/model/builder.hpp"
#include "blockindex/model/types.hpp"
#include "node_client.hpp"

namespace blockindex::sync {

    // ===========================================
    // MemoryNode - in-process chain source
    // ===========================================

    /// Holds every block it was given (by hash) plus the current best chain.
    /// The best chain can be extended or reorganized at any time from another
    /// thread; client() exposes it through the NodeClient capability.
    class MemoryNode {
      public:
        MemoryNode() = default;

        MemoryNode(const MemoryNode &) = delete;
        MemoryNode &operator=(const MemoryNode &) = delete;

        /// Append a block on top of the best chain. Parent and height must link.
        dp::Result<void, dp::Error> extend(const model::Block &block);

        /// Replace the best chain from `blocks.front().height` upward. The first
        /// block must link to the kept prefix.
        dp::Result<void, dp::Error> reorganize(const std::vector<model::Block> &blocks);

        /// Drop best-chain blocks above `height` (blocks stay reachable by hash)
        void truncate(dp::i64 height);

        model::ChainTip tip() const;

        dp::i64 height() const;

        dp::Result<model::Block, dp::Error> blockAt(dp::i64 height) const;

        dp::Result<model::Block, dp::Error> blockByHash(const std::string &hash) const;

        /// Builder for the next block on the current best chain
        model::BlockBuilder nextBlock() const;

        NodeClient client();

      private:
        mutable std::mutex mutex_;
        std::map<std::string, model::Block> by_hash_;
        std::vector<std::string> best_chain_;

        dp::Result<void, dp::Error> linkCheck(const model::Block &block, dp::i64 expected_height) const;
    };

} // namespace blockindex::sync
