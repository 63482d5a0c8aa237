#pragma once

#include <datapod/datapod.hpp>
#include <string>
#include <tuple>

namespace blockindex::model {

    inline std::string str(const dp::String &s) { return std::string(s.c_str()); }

    inline bool same(const dp::String &a, const dp::String &b) { return str(a) == str(b); }

    // ===========================================
    // Chain data as served by the node
    // ===========================================

    /// Reference to one output of an earlier transaction
    struct OutPoint {
        dp::String tx_id;
        dp::u32 index = 0;

        inline bool isNull() const { return tx_id.empty(); }

        auto members() { return std::tie(tx_id, index); }
        auto members() const { return std::tie(tx_id, index); }
    };

    /// Debit of `amount` from `address`, optionally spending a previous output
    struct TxInput {
        dp::String address;
        dp::i64 amount = 0;
        OutPoint prev_out;

        auto members() { return std::tie(address, amount, prev_out); }
        auto members() const { return std::tie(address, amount, prev_out); }
    };

    /// Credit of `amount` to `address`
    struct TxOutput {
        dp::String address;
        dp::i64 amount = 0;

        auto members() { return std::tie(address, amount); }
        auto members() const { return std::tie(address, amount); }
    };

    struct Transaction {
        dp::String id;
        dp::Vector<TxInput> inputs;
        dp::Vector<TxOutput> outputs;

        /// Transactions without inputs mint value; only allowed first in a block
        inline bool isCoinbase() const { return inputs.empty(); }

        auto members() { return std::tie(id, inputs, outputs); }
        auto members() const { return std::tie(id, inputs, outputs); }
    };

    struct Block {
        dp::i64 height = 0;
        dp::String hash;
        dp::String parent_hash;
        dp::i64 timestamp = 0;
        dp::Vector<Transaction> transactions;

        auto members() { return std::tie(height, hash, parent_hash, timestamp, transactions); }
        auto members() const { return std::tie(height, hash, parent_hash, timestamp, transactions); }
    };

    /// Node's best block pointer
    struct ChainTip {
        dp::i64 height = -1;
        dp::String hash;

        auto members() { return std::tie(height, hash); }
        auto members() const { return std::tie(height, hash); }
    };

    // ===========================================
    // Index state
    // ===========================================

    /// Height and hash of the last block fully applied to the index.
    /// The empty cursor (height -1) means nothing is indexed yet.
    struct SyncCursor {
        dp::i64 height = -1;
        dp::String hash;

        inline bool empty() const { return height < 0; }

        inline bool operator==(const SyncCursor &other) const {
            return height == other.height && same(hash, other.hash);
        }
        inline bool operator!=(const SyncCursor &other) const { return !(*this == other); }

        inline bool matches(const ChainTip &tip) const { return height == tip.height && same(hash, tip.hash); }

        inline static SyncCursor at(dp::i64 h, const dp::String &block_hash) {
            if (h < 0)
                return SyncCursor{};
            SyncCursor c;
            c.height = h;
            c.hash = block_hash;
            return c;
        }

        inline std::string toString() const {
            if (empty())
                return "(empty)";
            return std::to_string(height) + ":" + str(hash);
        }

        auto members() { return std::tie(height, hash); }
        auto members() const { return std::tie(height, hash); }
    };

    /// Derived per-address summary, never written directly
    struct AddressAggregate {
        dp::String address;
        dp::i64 balance = 0;
        dp::i64 tx_count = 0;
        dp::i64 total_received = 0;
        dp::i64 total_sent = 0;

        inline bool isZero() const { return balance == 0 && tx_count == 0 && total_received == 0 && total_sent == 0; }

        auto members() { return std::tie(address, balance, tx_count, total_received, total_sent); }
        auto members() const { return std::tie(address, balance, tx_count, total_received, total_sent); }
    };

    /// Block header plus derived data, as returned by queries
    struct BlockSummary {
        dp::i64 height = 0;
        dp::String hash;
        dp::String parent_hash;
        dp::i64 timestamp = 0;
        dp::i64 tx_count = 0;

        auto members() { return std::tie(height, hash, parent_hash, timestamp, tx_count); }
        auto members() const { return std::tie(height, hash, parent_hash, timestamp, tx_count); }
    };

    /// Transaction together with the block it was indexed from
    struct IndexedTransaction {
        Transaction tx;
        dp::i64 block_height = 0;
        dp::String block_hash;
        dp::i64 position = 0;
    };

    /// Unspent output owned by an address
    struct Utxo {
        OutPoint outpoint;
        dp::String address;
        dp::i64 amount = 0;
        dp::i64 block_height = 0;
    };

} // namespace blockindex::model
