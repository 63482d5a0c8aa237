#pragma once

#include <variant>
#include <vector>

#include "blockindex/model/types.hpp"

namespace blockindex::indexer {

    // ===========================================
    // Storage mutations
    // ===========================================

    /// Insert the block header row
    struct InsertBlock {
        model::Block block;
    };

    struct DeleteBlock {
        dp::i64 height = 0;
        dp::String hash;
    };

    /// Insert a transaction with its transfers and outputs
    struct InsertTransaction {
        model::Transaction tx;
        dp::i64 block_height = 0;
        dp::String block_hash;
        dp::i64 position = 0;
    };

    /// Delete a transaction; its transfers and outputs go with it
    struct DeleteTransaction {
        dp::String tx_id;
    };

    /// Mark an output spent. Fails the commit if the output is unknown, already
    /// spent, or does not carry the expected address and amount.
    struct SpendOutput {
        model::OutPoint outpoint;
        dp::String address;
        dp::i64 amount = 0;
        dp::String spender_tx_id;
    };

    struct UnspendOutput {
        model::OutPoint outpoint;
        dp::String spender_tx_id;
    };

    /// Signed delta upserted into address_aggregates. Entries that return to
    /// all-zero are removed.
    struct AdjustAggregate {
        dp::String address;
        dp::i64 balance = 0;
        dp::i64 tx_count = 0;
        dp::i64 total_received = 0;
        dp::i64 total_sent = 0;

        inline AdjustAggregate negated() const {
            return AdjustAggregate{address, -balance, -tx_count, -total_received, -total_sent};
        }
    };

    using Mutation =
        std::variant<InsertBlock, DeleteBlock, InsertTransaction, DeleteTransaction, SpendOutput, UnspendOutput,
                     AdjustAggregate>;

    // ===========================================
    // MutationSet - one block applied or reverted
    // ===========================================

    struct MutationSet {
        enum class Kind { Apply = 0, Revert = 1 };

        Kind kind = Kind::Apply;
        dp::i64 height = 0;
        dp::String block_hash;
        dp::String parent_hash;
        std::vector<Mutation> mutations;

        /// Cursor the store must hold for this set to be committed
        inline model::SyncCursor expectedCursor() const {
            if (kind == Kind::Apply)
                return model::SyncCursor::at(height - 1, parent_hash);
            return model::SyncCursor::at(height, block_hash);
        }

        /// Cursor stored by the same commit
        inline model::SyncCursor resultingCursor() const {
            if (kind == Kind::Apply)
                return model::SyncCursor::at(height, block_hash);
            return model::SyncCursor::at(height - 1, parent_hash);
        }

        inline std::size_t size() const { return mutations.size(); }
        inline bool empty() const { return mutations.empty(); }
    };

} // namespace blockindex::indexer
