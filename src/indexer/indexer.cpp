#include <blockindex/common/error.hpp>
#include <blockindex/indexer/indexer.hpp>

#include <limits>
#include <map>
#include <set>
#include <string>
#include <utility>

namespace blockindex::indexer {

    namespace {

        bool checkedAdd(dp::i64 a, dp::i64 b, dp::i64 &out) {
            if (b > 0 && a > std::numeric_limits<dp::i64>::max() - b)
                return false;
            if (b < 0 && a < std::numeric_limits<dp::i64>::min() - b)
                return false;
            out = a + b;
            return true;
        }

        dp::Error integrity(const model::Block &block, const std::string &what) {
            std::string msg = "block " + std::to_string(block.height) + " (" + model::str(block.hash) + "): " + what;
            return data_integrity(dp::String(msg.c_str()));
        }

        std::string outpointKey(const model::OutPoint &op) {
            return model::str(op.tx_id) + ":" + std::to_string(op.index);
        }

    } // namespace

    dp::Result<void, dp::Error> Indexer::validate(const model::Block &block) {
        if (block.height < 0)
            return dp::Result<void, dp::Error>::err(integrity(block, "negative height"));
        if (block.hash.empty())
            return dp::Result<void, dp::Error>::err(integrity(block, "empty block hash"));
        if (block.height > 0 && block.parent_hash.empty())
            return dp::Result<void, dp::Error>::err(integrity(block, "missing parent hash"));

        std::map<std::string, dp::usize> positions;
        std::set<std::string> spent;

        for (dp::usize i = 0; i < block.transactions.size(); ++i) {
            const auto &tx = block.transactions[i];
            std::string id = model::str(tx.id);
            if (id.empty())
                return dp::Result<void, dp::Error>::err(integrity(block, "transaction without id"));
            if (!positions.emplace(id, i).second)
                return dp::Result<void, dp::Error>::err(integrity(block, "duplicate transaction " + id));
            if (tx.isCoinbase() && i != 0)
                return dp::Result<void, dp::Error>::err(integrity(block, "coinbase transaction " + id +
                                                                             " not at position 0"));

            dp::i64 total_in = 0;
            for (const auto &in : tx.inputs) {
                if (in.address.empty())
                    return dp::Result<void, dp::Error>::err(integrity(block, "input without address in " + id));
                if (in.amount < 0)
                    return dp::Result<void, dp::Error>::err(integrity(block, "negative input amount in " + id));
                if (!checkedAdd(total_in, in.amount, total_in))
                    return dp::Result<void, dp::Error>::err(integrity(block, "input amount overflow in " + id));

                if (in.prev_out.isNull())
                    continue;
                std::string key = outpointKey(in.prev_out);
                if (!spent.insert(key).second)
                    return dp::Result<void, dp::Error>::err(integrity(block, "outpoint " + key + " spent twice"));
                auto earlier = positions.find(model::str(in.prev_out.tx_id));
                if (earlier != positions.end() && earlier->second == i)
                    return dp::Result<void, dp::Error>::err(integrity(block, "transaction " + id + " spends itself"));
            }

            dp::i64 total_out = 0;
            for (const auto &out : tx.outputs) {
                if (out.address.empty())
                    return dp::Result<void, dp::Error>::err(integrity(block, "output without address in " + id));
                if (out.amount < 0)
                    return dp::Result<void, dp::Error>::err(integrity(block, "negative output amount in " + id));
                if (!checkedAdd(total_out, out.amount, total_out))
                    return dp::Result<void, dp::Error>::err(integrity(block, "output amount overflow in " + id));
            }

            if (!tx.isCoinbase() && total_out > total_in)
                return dp::Result<void, dp::Error>::err(integrity(block, "outputs exceed inputs in " + id));
        }

        // Forward references: an input may only spend an output of an earlier transaction in the block
        for (dp::usize i = 0; i < block.transactions.size(); ++i) {
            for (const auto &in : block.transactions[i].inputs) {
                if (in.prev_out.isNull())
                    continue;
                auto target = positions.find(model::str(in.prev_out.tx_id));
                if (target == positions.end())
                    continue;
                if (target->second > i)
                    return dp::Result<void, dp::Error>::err(
                        integrity(block, "transaction " + model::str(block.transactions[i].id) +
                                             " spends output of later transaction " + target->first));
                if (in.prev_out.index >= block.transactions[target->second].outputs.size())
                    return dp::Result<void, dp::Error>::err(
                        integrity(block, "outpoint " + outpointKey(in.prev_out) + " out of range"));
            }
        }

        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<std::vector<AdjustAggregate>, dp::Error> Indexer::aggregateDeltas(const model::Block &block) {
        std::map<std::string, AdjustAggregate> deltas;

        auto entry = [&deltas](const dp::String &address) -> AdjustAggregate & {
            auto [it, inserted] = deltas.try_emplace(model::str(address));
            if (inserted)
                it->second.address = address;
            return it->second;
        };

        for (const auto &tx : block.transactions) {
            std::set<std::string> touched;
            for (const auto &in : tx.inputs) {
                auto &d = entry(in.address);
                if (!checkedAdd(d.total_sent, in.amount, d.total_sent) ||
                    !checkedAdd(d.balance, -in.amount, d.balance))
                    return dp::Result<std::vector<AdjustAggregate>, dp::Error>::err(
                        integrity(block, "aggregate overflow for " + model::str(in.address)));
                touched.insert(model::str(in.address));
            }
            for (const auto &out : tx.outputs) {
                auto &d = entry(out.address);
                if (!checkedAdd(d.total_received, out.amount, d.total_received) ||
                    !checkedAdd(d.balance, out.amount, d.balance))
                    return dp::Result<std::vector<AdjustAggregate>, dp::Error>::err(
                        integrity(block, "aggregate overflow for " + model::str(out.address)));
                touched.insert(model::str(out.address));
            }
            for (const auto &address : touched)
                deltas[address].tx_count += 1;
        }

        std::vector<AdjustAggregate> result;
        result.reserve(deltas.size());
        for (auto &[_, delta] : deltas)
            result.push_back(std::move(delta));
        return dp::Result<std::vector<AdjustAggregate>, dp::Error>::ok(std::move(result));
    }

    dp::Result<MutationSet, dp::Error> Indexer::apply(const model::Block &block) const {
        auto valid = validate(block);
        if (valid.is_err())
            return dp::Result<MutationSet, dp::Error>::err(valid.error());

        auto deltas = aggregateDeltas(block);
        if (deltas.is_err())
            return dp::Result<MutationSet, dp::Error>::err(deltas.error());

        MutationSet set;
        set.kind = MutationSet::Kind::Apply;
        set.height = block.height;
        set.block_hash = block.hash;
        set.parent_hash = block.parent_hash;

        set.mutations.emplace_back(InsertBlock{block});
        for (dp::usize i = 0; i < block.transactions.size(); ++i) {
            const auto &tx = block.transactions[i];
            set.mutations.emplace_back(InsertTransaction{tx, block.height, block.hash, static_cast<dp::i64>(i)});
            for (const auto &in : tx.inputs) {
                if (in.prev_out.isNull())
                    continue;
                set.mutations.emplace_back(SpendOutput{in.prev_out, in.address, in.amount, tx.id});
            }
        }
        for (const auto &delta : deltas.value())
            set.mutations.emplace_back(delta);

        return dp::Result<MutationSet, dp::Error>::ok(std::move(set));
    }

    dp::Result<MutationSet, dp::Error> Indexer::revert(const model::Block &block) const {
        auto valid = validate(block);
        if (valid.is_err())
            return dp::Result<MutationSet, dp::Error>::err(valid.error());

        auto deltas = aggregateDeltas(block);
        if (deltas.is_err())
            return dp::Result<MutationSet, dp::Error>::err(deltas.error());

        MutationSet set;
        set.kind = MutationSet::Kind::Revert;
        set.height = block.height;
        set.block_hash = block.hash;
        set.parent_hash = block.parent_hash;

        for (const auto &delta : deltas.value())
            set.mutations.emplace_back(delta.negated());
        for (dp::usize i = block.transactions.size(); i-- > 0;) {
            const auto &tx = block.transactions[i];
            for (dp::usize j = tx.inputs.size(); j-- > 0;) {
                const auto &in = tx.inputs[j];
                if (in.prev_out.isNull())
                    continue;
                set.mutations.emplace_back(UnspendOutput{in.prev_out, tx.id});
            }
            set.mutations.emplace_back(DeleteTransaction{tx.id});
        }
        set.mutations.emplace_back(DeleteBlock{block.height, block.hash});

        return dp::Result<MutationSet, dp::Error>::ok(std::move(set));
    }

} // namespace blockindex::indexer
