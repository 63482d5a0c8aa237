#include <blockindex/common/error.hpp>
#include <blockindex/sync/memory_node.hpp>

namespace blockindex::sync {

    dp::Result<void, dp::Error> MemoryNode::linkCheck(const model::Block &block, dp::i64 expected_height) const {
        if (block.height != expected_height) {
            std::string msg = "block height " + std::to_string(block.height) + ", expected " +
                              std::to_string(expected_height);
            return dp::Result<void, dp::Error>::err(dp::Error::invalid_argument(dp::String(msg.c_str())));
        }
        std::string parent = expected_height == 0 ? std::string() : best_chain_[expected_height - 1];
        if (model::str(block.parent_hash) != parent) {
            return dp::Result<void, dp::Error>::err(
                dp::Error::invalid_argument("Block does not link to the best chain"));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> MemoryNode::extend(const model::Block &block) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto linked = linkCheck(block, static_cast<dp::i64>(best_chain_.size()));
        if (linked.is_err())
            return linked;
        by_hash_[model::str(block.hash)] = block;
        best_chain_.push_back(model::str(block.hash));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> MemoryNode::reorganize(const std::vector<model::Block> &blocks) {
        if (blocks.empty())
            return dp::Result<void, dp::Error>::err(dp::Error::invalid_argument("No replacement blocks"));

        std::lock_guard<std::mutex> lock(mutex_);
        dp::i64 fork_height = blocks.front().height;
        if (fork_height < 0 || fork_height > static_cast<dp::i64>(best_chain_.size()))
            return dp::Result<void, dp::Error>::err(dp::Error::invalid_argument("Fork height outside best chain"));

        auto previous = best_chain_;
        best_chain_.resize(static_cast<std::size_t>(fork_height));
        for (const auto &block : blocks) {
            auto linked = linkCheck(block, static_cast<dp::i64>(best_chain_.size()));
            if (linked.is_err()) {
                best_chain_ = previous;
                return linked;
            }
            best_chain_.push_back(model::str(block.hash));
        }
        for (const auto &block : blocks)
            by_hash_[model::str(block.hash)] = block;
        return dp::Result<void, dp::Error>::ok();
    }

    void MemoryNode::truncate(dp::i64 height) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t keep = height < 0 ? 0 : static_cast<std::size_t>(height + 1);
        if (keep < best_chain_.size())
            best_chain_.resize(keep);
    }

    model::ChainTip MemoryNode::tip() const {
        std::lock_guard<std::mutex> lock(mutex_);
        model::ChainTip tip;
        if (best_chain_.empty())
            return tip;
        tip.height = static_cast<dp::i64>(best_chain_.size()) - 1;
        tip.hash = dp::String(best_chain_.back().c_str());
        return tip;
    }

    dp::i64 MemoryNode::height() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<dp::i64>(best_chain_.size()) - 1;
    }

    dp::Result<model::Block, dp::Error> MemoryNode::blockAt(dp::i64 height) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (height < 0 || height >= static_cast<dp::i64>(best_chain_.size())) {
            std::string msg = "No block at height " + std::to_string(height);
            return dp::Result<model::Block, dp::Error>::err(dp::Error::not_found(dp::String(msg.c_str())));
        }
        return dp::Result<model::Block, dp::Error>::ok(by_hash_.at(best_chain_[static_cast<std::size_t>(height)]));
    }

    dp::Result<model::Block, dp::Error> MemoryNode::blockByHash(const std::string &hash) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = by_hash_.find(hash);
        if (it == by_hash_.end()) {
            std::string msg = "Unknown block " + hash;
            return dp::Result<model::Block, dp::Error>::err(dp::Error::not_found(dp::String(msg.c_str())));
        }
        return dp::Result<model::Block, dp::Error>::ok(it->second);
    }

    model::BlockBuilder MemoryNode::nextBlock() const {
        auto current = tip();
        return model::BlockBuilder(current.height + 1, current.hash);
    }

    NodeClient MemoryNode::client() {
        NodeClient client;
        client.get_best_block = [this](std::chrono::milliseconds) {
            return dp::Result<model::ChainTip, dp::Error>::ok(tip());
        };
        client.get_block_by_height = [this](dp::i64 height, std::chrono::milliseconds) { return blockAt(height); };
        client.get_block_by_hash = [this](const std::string &hash, std::chrono::milliseconds) {
            return blockByHash(hash);
        };
        return client;
    }

} // namespace blockindex::sync
