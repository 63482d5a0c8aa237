#pragma once

#include <algorithm>
#include <datapod/datapod.hpp>
#include <string>
#include <vector>

#include "blockindex/model/types.hpp"
#include "blockindex/storage/index_store.hpp"

namespace blockindex::query {

    struct IndexStats {
        model::SyncCursor cursor;
        dp::i64 block_count = 0;
        dp::i64 transaction_count = 0;
        dp::i64 address_count = 0;
    };

    /// Page of an address's transaction history, oldest first
    struct AddressHistory {
        model::AddressAggregate aggregate;
        std::vector<std::string> tx_ids;
        model::SyncCursor as_of;
    };

    // ===========================================
    // QueryService - read-only view of the index
    // ===========================================

    /// Answers come from committed state only. Unknown keys and heights above the
    /// cursor are dp::Error::not_found. Calls are safe from any thread while the
    /// follower writes.
    class QueryService {
      public:
        static constexpr dp::i32 MAX_PAGE_SIZE = 1000;

        explicit QueryService(const storage::IndexStore &store) : store_(store) {}

        /// Last indexed block; callers compare it with the node to detect staleness
        inline dp::Result<model::SyncCursor, dp::Error> getSyncCursor() const { return store_.readCursor(); }

        inline dp::Result<model::Block, dp::Error> getBlock(dp::i64 height) const { return store_.getBlock(height); }

        inline dp::Result<model::Block, dp::Error> getBlockByHash(const std::string &hash) const {
            return store_.getBlockByHash(hash);
        }

        inline dp::Result<model::BlockSummary, dp::Error> getBlockSummary(dp::i64 height) const {
            auto snap = store_.snapshot();
            if (snap.is_err())
                return dp::Result<model::BlockSummary, dp::Error>::err(snap.error());
            return snap.value()->getBlockSummary(height);
        }

        inline dp::Result<std::vector<std::string>, dp::Error> getBlockTransactions(dp::i64 height) const {
            auto snap = store_.snapshot();
            if (snap.is_err())
                return dp::Result<std::vector<std::string>, dp::Error>::err(snap.error());
            return snap.value()->getBlockTransactionIds(height);
        }

        inline dp::Result<model::IndexedTransaction, dp::Error> getTransaction(const std::string &tx_id) const {
            return store_.getTransaction(tx_id);
        }

        inline dp::Result<model::AddressAggregate, dp::Error> getAddress(const std::string &address) const {
            return store_.getAddressAggregate(address);
        }

        /// Aggregate and one page of history read from the same snapshot
        inline dp::Result<AddressHistory, dp::Error> getAddressHistory(const std::string &address, dp::i32 limit = 100,
                                                                       dp::i32 offset = 0) const {
            if (limit <= 0 || offset < 0)
                return dp::Result<AddressHistory, dp::Error>::err(
                    dp::Error::invalid_argument("limit must be positive and offset non-negative"));
            limit = std::min(limit, MAX_PAGE_SIZE);

            auto snap = store_.snapshot();
            if (snap.is_err())
                return dp::Result<AddressHistory, dp::Error>::err(snap.error());

            AddressHistory history;
            auto aggregate = snap.value()->getAddressAggregate(address);
            if (aggregate.is_err())
                return dp::Result<AddressHistory, dp::Error>::err(aggregate.error());
            history.aggregate = aggregate.value();

            auto ids = snap.value()->getAddressTransactions(address, limit, offset);
            if (ids.is_err())
                return dp::Result<AddressHistory, dp::Error>::err(ids.error());
            history.tx_ids = ids.value();

            auto cursor = snap.value()->readCursor();
            if (cursor.is_err())
                return dp::Result<AddressHistory, dp::Error>::err(cursor.error());
            history.as_of = cursor.value();
            return dp::Result<AddressHistory, dp::Error>::ok(std::move(history));
        }

        inline dp::Result<std::vector<model::Utxo>, dp::Error> getAddressUtxos(const std::string &address) const {
            auto snap = store_.snapshot();
            if (snap.is_err())
                return dp::Result<std::vector<model::Utxo>, dp::Error>::err(snap.error());

            auto aggregate = snap.value()->getAddressAggregate(address);
            if (aggregate.is_err())
                return dp::Result<std::vector<model::Utxo>, dp::Error>::err(aggregate.error());
            return snap.value()->getAddressUtxos(address);
        }

        inline dp::Result<IndexStats, dp::Error> getStats() const {
            auto snap = store_.snapshot();
            if (snap.is_err())
                return dp::Result<IndexStats, dp::Error>::err(snap.error());

            IndexStats stats;
            auto cursor = snap.value()->readCursor();
            auto blocks = snap.value()->getBlockCount();
            auto txs = snap.value()->getTransactionCount();
            auto addresses = snap.value()->getAddressCount();
            if (cursor.is_err())
                return dp::Result<IndexStats, dp::Error>::err(cursor.error());
            if (blocks.is_err())
                return dp::Result<IndexStats, dp::Error>::err(blocks.error());
            if (txs.is_err())
                return dp::Result<IndexStats, dp::Error>::err(txs.error());
            if (addresses.is_err())
                return dp::Result<IndexStats, dp::Error>::err(addresses.error());

            stats.cursor = cursor.value();
            stats.block_count = blocks.value();
            stats.transaction_count = txs.value();
            stats.address_count = addresses.value();
            return dp::Result<IndexStats, dp::Error>::ok(stats);
        }

      private:
        const storage::IndexStore &store_;
    };

} // namespace blockindex::query
