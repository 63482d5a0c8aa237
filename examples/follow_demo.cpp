/**
 * Example: following an in-process node through a reorganization
 *
 * This demo shows how to:
 * 1. Build a short chain on a MemoryNode
 * 2. Index it into a SQLite database with BlockIndex
 * 3. Replace the last blocks on the node and let the follower roll back and replay
 * 4. Query balances, history and unspent outputs
 */

#include <blockindex/blockindex.hpp>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <spdlog/spdlog.h>
#include <thread>

using namespace blockindex;

namespace {

    void printAddress(const query::QueryService &q, const std::string &address) {
        auto agg = q.getAddress(address);
        if (agg.is_err()) {
            std::cout << "   " << address << ": " << agg.error().message.c_str() << std::endl;
            return;
        }
        std::cout << "   " << address << ": balance=" << agg.value().balance << " txs=" << agg.value().tx_count
                  << " received=" << agg.value().total_received << " sent=" << agg.value().total_sent << std::endl;
    }

    bool mine(sync::MemoryNode &node, const std::string &from, const std::string &to, dp::i64 amount) {
        auto block = node.nextBlock().transfer(from, to, amount).build();
        if (block.is_err())
            return false;
        return node.extend(block.value()).is_ok();
    }

} // namespace

int main() {
    spdlog::set_level(spdlog::level::info);

    const std::string db_path = "follow_demo.db";
    std::filesystem::remove(db_path);
    std::filesystem::remove(db_path + "-wal");
    std::filesystem::remove(db_path + "-shm");

    // ===========================================
    // Step 1: Build a chain on the node
    // ===========================================

    std::cout << "=== Building chain ===" << std::endl;
    sync::MemoryNode node;
    auto genesis = node.nextBlock().coinbase("alice", 1000).build();
    if (genesis.is_err() || node.extend(genesis.value()).is_err()) {
        std::cerr << "Failed to create genesis block" << std::endl;
        return 1;
    }
    for (int i = 0; i < 5; ++i) {
        if (!mine(node, "alice", "bob", 10)) {
            std::cerr << "Failed to mine block" << std::endl;
            return 1;
        }
    }
    std::cout << "   Node tip: " << node.tip().height << std::endl;

    // ===========================================
    // Step 2: Index it
    // ===========================================

    std::cout << "\n=== Initial sync ===" << std::endl;
    BlockIndex index;
    sync::FollowerConfig config;
    config.poll_interval_ms = 50;
    auto init = index.initialize(db_path, node.client(), config);
    if (init.is_err()) {
        std::cerr << "Failed to open index: " << init.error().message.c_str() << std::endl;
        return 1;
    }

    auto first = index.sync();
    if (first.is_err()) {
        std::cerr << "Sync failed: " << first.error().message.c_str() << std::endl;
        return 1;
    }
    std::cout << "   Applied " << first.value().applied << " blocks, cursor "
              << first.value().cursor.toString() << std::endl;
    printAddress(index.query(), "alice");
    printAddress(index.query(), "bob");

    // ===========================================
    // Step 3: Reorganize the last two blocks
    // ===========================================

    std::cout << "\n=== Reorg ===" << std::endl;
    auto fork_parent = node.blockAt(3);
    if (fork_parent.is_err()) {
        std::cerr << "Missing fork parent" << std::endl;
        return 1;
    }
    auto b4 = model::BlockBuilder(4, fork_parent.value().hash).transfer("alice", "carol", 0).salt("fork").build();
    if (b4.is_err()) {
        std::cerr << "Failed to build fork" << std::endl;
        return 1;
    }
    auto b5 = model::BlockBuilder(5, b4.value().hash).transfer("alice", "carol", 0).salt("fork").build();
    if (b5.is_err() || node.reorganize({b4.value(), b5.value()}).is_err()) {
        std::cerr << "Failed to reorganize node" << std::endl;
        return 1;
    }

    auto second = index.sync();
    if (second.is_err()) {
        std::cerr << "Sync failed: " << second.error().message.c_str() << std::endl;
        return 1;
    }
    std::cout << "   Reverted " << second.value().reverted << ", applied " << second.value().applied
              << ", cursor " << second.value().cursor.toString() << std::endl;
    printAddress(index.query(), "alice");
    printAddress(index.query(), "bob");
    printAddress(index.query(), "carol");

    // ===========================================
    // Step 4: Background following
    // ===========================================

    std::cout << "\n=== Background follower ===" << std::endl;
    index.start();
    mine(node, "bob", "carol", 5);
    index.follower().notifyNewTip();
    for (int i = 0; i < 100 && !index.follower().status().caughtUp(); ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    index.stop();

    auto status = index.follower().status();
    std::cout << "   State: " << sync::toString(status.state) << ", cursor " << status.cursor.toString()
              << ", applied " << status.blocks_applied << ", reverted " << status.blocks_reverted << std::endl;

    auto history = index.query().getAddressHistory("carol");
    if (history.is_ok()) {
        std::cout << "   carol history:";
        for (const auto &id : history.value().tx_ids)
            std::cout << " " << id.substr(0, 8);
        std::cout << std::endl;
    }

    auto stats = index.query().getStats();
    if (stats.is_ok()) {
        std::cout << "   Blocks: " << stats.value().block_count << ", transactions: "
                  << stats.value().transaction_count << ", addresses: " << stats.value().address_count << std::endl;
    }

    auto linked = index.store().verifyLinkage();
    auto conserved = index.store().verifyAggregates();
    std::cout << "   Linkage ok: " << (linked.is_ok() && linked.value()) << ", aggregates ok: "
              << (conserved.is_ok() && conserved.value()) << std::endl;

    index.close();
    std::filesystem::remove(db_path);
    std::filesystem::remove(db_path + "-wal");
    std::filesystem::remove(db_path + "-shm");
    return 0;
}
