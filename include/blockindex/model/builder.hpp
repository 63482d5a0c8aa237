#pragma once

#include <sstream>
#include <string>

#include "blockindex/common/hash.hpp"
#include "types.hpp"

namespace blockindex::model {

    /// Content hash of a transaction. `context` distinguishes otherwise identical
    /// transfers placed in different blocks.
    inline dp::Result<dp::String, dp::Error> computeTransactionId(const Transaction &tx, const std::string &context) {
        std::stringstream ss;
        ss << context << "|in";
        for (const auto &in : tx.inputs) {
            ss << "|" << in.address.c_str() << ":" << in.amount << ":" << in.prev_out.tx_id.c_str() << ":"
               << in.prev_out.index;
        }
        ss << "|out";
        for (const auto &out : tx.outputs) {
            ss << "|" << out.address.c_str() << ":" << out.amount;
        }
        auto digest = sha256Hex(ss.str());
        if (digest.is_err())
            return dp::Result<dp::String, dp::Error>::err(digest.error());
        return dp::Result<dp::String, dp::Error>::ok(dp::String(digest.value().c_str()));
    }

    inline dp::Result<dp::String, dp::Error> computeBlockHash(const Block &block, const std::string &salt = "") {
        std::stringstream ss;
        ss << block.height << "|" << block.parent_hash.c_str() << "|" << block.timestamp << "|" << salt;
        for (const auto &tx : block.transactions)
            ss << "|" << tx.id.c_str();
        auto digest = sha256Hex(ss.str());
        if (digest.is_err())
            return dp::Result<dp::String, dp::Error>::err(digest.error());
        return dp::Result<dp::String, dp::Error>::ok(dp::String(digest.value().c_str()));
    }

    // ===========================================
    // BlockBuilder - assembles well-formed blocks
    // ===========================================

    class BlockBuilder {
      public:
        inline BlockBuilder(dp::i64 height, const dp::String &parent_hash) {
            block_.height = height;
            block_.parent_hash = parent_hash;
            block_.timestamp = currentTimestamp();
        }

        /// Mint `amount` to `address`
        inline BlockBuilder &coinbase(const std::string &address, dp::i64 amount) {
            Transaction tx;
            tx.outputs.push_back(TxOutput{dp::String(address.c_str()), amount});
            block_.transactions.push_back(tx);
            return *this;
        }

        /// Account-style move of `amount` from one address to another
        inline BlockBuilder &transfer(const std::string &from, const std::string &to, dp::i64 amount) {
            Transaction tx;
            tx.inputs.push_back(TxInput{dp::String(from.c_str()), amount, OutPoint{}});
            tx.outputs.push_back(TxOutput{dp::String(to.c_str()), amount});
            block_.transactions.push_back(tx);
            return *this;
        }

        /// Spend a previous output, paying `amount` to `to` and the remainder back to the owner
        inline BlockBuilder &spend(const OutPoint &prev, const std::string &owner, dp::i64 value, const std::string &to,
                                   dp::i64 amount) {
            Transaction tx;
            tx.inputs.push_back(TxInput{dp::String(owner.c_str()), value, prev});
            tx.outputs.push_back(TxOutput{dp::String(to.c_str()), amount});
            if (value > amount)
                tx.outputs.push_back(TxOutput{dp::String(owner.c_str()), value - amount});
            block_.transactions.push_back(tx);
            return *this;
        }

        inline BlockBuilder &add(const Transaction &tx) {
            block_.transactions.push_back(tx);
            return *this;
        }

        inline BlockBuilder &timestamp(dp::i64 ts) {
            block_.timestamp = ts;
            return *this;
        }

        /// Makes the hash differ from a sibling block with the same content
        inline BlockBuilder &salt(const std::string &s) {
            salt_ = s;
            return *this;
        }

        /// Assign transaction ids (where missing) and the block hash
        inline dp::Result<Block, dp::Error> build() const {
            Block block = block_;
            for (dp::usize i = 0; i < block.transactions.size(); ++i) {
                auto &tx = block.transactions[i];
                if (!tx.id.empty())
                    continue;
                std::string context = std::to_string(block.height) + "|" + str(block.parent_hash) + "|" + salt_ +
                                      "|" + std::to_string(i);
                auto id = computeTransactionId(tx, context);
                if (id.is_err())
                    return dp::Result<Block, dp::Error>::err(id.error());
                tx.id = id.value();
            }
            auto hash = computeBlockHash(block, salt_);
            if (hash.is_err())
                return dp::Result<Block, dp::Error>::err(hash.error());
            block.hash = hash.value();
            return dp::Result<Block, dp::Error>::ok(std::move(block));
        }

      private:
        Block block_;
        std::string salt_;
    };

} // namespace blockindex::model
