#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "test_support.hpp"
#include <thread>

using namespace blockindex;
using namespace testing;

namespace {

    // Aborts every block insert at one height
    class FailingInsertTrigger : public storage::ISchemaExtension {
      public:
        explicit FailingInsertTrigger(dp::i64 height) : height_(height) {}

        std::vector<std::string> getCreateTableStatements() const override {
            return {"CREATE TRIGGER IF NOT EXISTS fail_block_insert BEFORE INSERT ON blocks WHEN NEW.height = " +
                    std::to_string(height_) + " BEGIN SELECT RAISE(ABORT, 'injected disk failure'); END"};
        }

        std::vector<std::string> getCreateIndexStatements() const override { return {}; }

      private:
        dp::i64 height_;
    };

    struct SmallChain {
        model::Block b0, b1, b2;

        SmallChain() {
            b0 = build(model::BlockBuilder(0, "").coinbase("alice", 1000));
            b1 = build(model::BlockBuilder(1, b0.hash).spend(outputOf(b0, 0, 0), "alice", 1000, "bob", 300));
            b2 = build(model::BlockBuilder(2, b1.hash)
                           .coinbase("miner", 50)
                           .spend(outputOf(b1, 0, 0), "bob", 300, "carol", 100)
                           .transfer("carol", "dave", 25));
        }
    };

} // namespace

// ===========================================
// Utility function tests
// ===========================================

TEST_CASE("Utility functions") {
    SUBCASE("SHA256 hashing") {
        std::vector<uint8_t> data = {0x48, 0x65, 0x6c, 0x6c, 0x6f}; // "Hello"
        auto hash = computeSHA256(data);

        CHECK(hash.size() == 32);
        CHECK(hash == computeSHA256(data));

        std::vector<uint8_t> data2 = {0x48, 0x65, 0x6c, 0x6c, 0x6f, 0x21}; // "Hello!"
        CHECK(hash != computeSHA256(data2));
    }

    SUBCASE("Hex conversion") {
        std::vector<uint8_t> bytes = {0x01, 0x23, 0x45, 0x67, 0x89, 0xab, 0xcd, 0xef};
        std::string hex = hashToHex(bytes);

        CHECK(hex.length() == 16);
        CHECK(hexToHash(hex) == bytes);
    }

    SUBCASE("Block hashes depend on salt") {
        auto a = build(model::BlockBuilder(1, "parent").timestamp(7).transfer("x", "y", 1));
        auto b = build(model::BlockBuilder(1, "parent").timestamp(7).transfer("x", "y", 1).salt("fork"));
        CHECK(a.hash.size() == 64);
        CHECK_FALSE(model::same(a.hash, b.hash));
        CHECK_FALSE(model::same(a.transactions[0].id, b.transactions[0].id));
    }
}

// ===========================================
// Lifecycle
// ===========================================

TEST_CASE("IndexStore lifecycle") {
    SUBCASE("In-memory databases are rejected") {
        storage::IndexStore store;
        auto result = store.open(":memory:");
        CHECK(result.is_err());
        CHECK_FALSE(store.isOpen());
    }

    SUBCASE("Operations on a closed store fail") {
        storage::IndexStore store;
        CHECK(store.initializeCoreSchema().is_err());
        CHECK(store.readCursor().is_err());

        indexer::Indexer indexer;
        SmallChain chain;
        auto set = indexer.apply(chain.b0);
        REQUIRE(set.is_ok());
        auto committed = store.commit(set.value());
        REQUIRE(committed.is_err());
        CHECK(committed.error().code == ERR_STORE_NOT_OPEN);
    }

    SUBCASE("Fresh store has the empty cursor") {
        TestDB db("test_store_fresh");
        CHECK(db.store.isOpen());
        CHECK(db.cursor().empty());
        CHECK(db.store.verifyLinkage().value());
        CHECK(db.store.verifyAggregates().value());
        CHECK(db.store.quickCheck().value());
    }

    SUBCASE("Schema initialization is idempotent") {
        TestDB db("test_store_schema");
        CHECK(db.store.initializeCoreSchema().is_ok());
        CHECK(db.store.initializeCoreSchema().is_ok());
    }

    SUBCASE("State persists across reopen") {
        TestDB db("test_store_reopen");
        SmallChain chain;
        commitApply(db.store, chain.b0);
        commitApply(db.store, chain.b1);
        auto before = db.fingerprint();

        db.reopen();
        CHECK(db.cursor() == model::SyncCursor::at(1, chain.b1.hash));
        CHECK(db.fingerprint() == before);
    }

    SUBCASE("Snapshot released after reopening onto another file") {
        TestDB first("test_store_first");
        TestDB second("test_store_second");
        SmallChain chain;
        commitApply(first.store, chain.b0);
        commitApply(first.store, chain.b1);

        storage::IndexStore store;
        REQUIRE(store.open(first.path).is_ok());
        std::vector<std::shared_ptr<storage::Snapshot>> held;
        for (int i = 0; i < 3; ++i) {
            auto snap = store.snapshot();
            REQUIRE(snap.is_ok());
            held.push_back(snap.value());
        }

        store.close();
        REQUIRE(store.open(second.path).is_ok());
        REQUIRE(store.initializeCoreSchema().is_ok());

        // Old views keep reading the first file until they are released
        CHECK(held.front()->readCursor().value() == model::SyncCursor::at(1, chain.b1.hash));
        held.clear();

        for (int i = 0; i < 4; ++i) {
            auto snap = store.snapshot();
            REQUIRE(snap.is_ok());
            CHECK(snap.value()->readCursor().value().empty());
            CHECK(snap.value()->getBlockCount().value() == 0);
        }
        CHECK(is_not_found(store.getBlock(0).error()));
        store.close();
    }

    SUBCASE("Snapshot outlives its store") {
        TestDB db("test_store_outlive");
        SmallChain chain;
        commitApply(db.store, chain.b0);

        std::shared_ptr<storage::Snapshot> kept;
        {
            storage::IndexStore store;
            REQUIRE(store.open(db.path).is_ok());
            auto snap = store.snapshot();
            REQUIRE(snap.is_ok());
            kept = snap.value();
        }
        CHECK(kept->readCursor().value() == model::SyncCursor::at(0, chain.b0.hash));
        kept.reset();
        CHECK(db.cursor() == model::SyncCursor::at(0, chain.b0.hash));
    }
}

// ===========================================
// Commit
// ===========================================

TEST_CASE("IndexStore commit") {
    TestDB db("test_store_commit");
    SmallChain chain;
    indexer::Indexer indexer;

    SUBCASE("Apply moves the cursor and stores the block") {
        commitApply(db.store, chain.b0);
        commitApply(db.store, chain.b1);
        commitApply(db.store, chain.b2);

        CHECK(db.cursor() == model::SyncCursor::at(2, chain.b2.hash));

        auto block = db.store.getBlock(2);
        REQUIRE(block.is_ok());
        CHECK(model::same(block.value().hash, chain.b2.hash));
        CHECK(model::same(block.value().parent_hash, chain.b1.hash));
        CHECK(block.value().timestamp == chain.b2.timestamp);
        REQUIRE(block.value().transactions.size() == 3);
        for (std::size_t i = 0; i < 3; ++i) {
            CHECK(model::same(block.value().transactions[i].id, chain.b2.transactions[i].id));
        }
        CHECK(block.value().transactions[1].outputs.size() == 2);

        auto by_hash = db.store.getBlockByHash(model::str(chain.b1.hash));
        REQUIRE(by_hash.is_ok());
        CHECK(by_hash.value().height == 1);
    }

    SUBCASE("Aggregates follow every transfer") {
        commitApply(db.store, chain.b0);
        commitApply(db.store, chain.b1);
        commitApply(db.store, chain.b2);

        CHECK(balanceOf(db.store, "alice") == 700);
        CHECK(balanceOf(db.store, "bob") == 200);
        CHECK(balanceOf(db.store, "carol") == 75);
        CHECK(balanceOf(db.store, "dave") == 25);
        CHECK(balanceOf(db.store, "miner") == 50);

        auto alice = db.store.getAddressAggregate("alice");
        REQUIRE(alice.is_ok());
        CHECK(alice.value().tx_count == 2);
        CHECK(alice.value().total_received == 1700);
        CHECK(alice.value().total_sent == 1000);

        CHECK(db.store.verifyAggregates().value());
        CHECK(db.store.verifyLinkage().value());
    }

    SUBCASE("Transactions carry their block back-reference") {
        commitApply(db.store, chain.b0);
        commitApply(db.store, chain.b1);
        commitApply(db.store, chain.b2);

        auto tx = db.store.getTransaction(model::str(chain.b2.transactions[2].id));
        REQUIRE(tx.is_ok());
        CHECK(tx.value().block_height == 2);
        CHECK(model::same(tx.value().block_hash, chain.b2.hash));
        CHECK(tx.value().position == 2);
        REQUIRE(tx.value().tx.inputs.size() == 1);
        CHECK(model::str(tx.value().tx.inputs[0].address) == "carol");
    }

    SUBCASE("Committing the same block twice is rejected") {
        commitApply(db.store, chain.b0);
        commitApply(db.store, chain.b1);

        auto again = indexer.apply(chain.b1);
        REQUIRE(again.is_ok());
        auto result = db.store.commit(again.value());
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_CURSOR_MISMATCH);

        CHECK(balanceOf(db.store, "bob") == 300);
        CHECK(db.cursor() == model::SyncCursor::at(1, chain.b1.hash));
    }

    SUBCASE("Out of order blocks are rejected") {
        commitApply(db.store, chain.b0);
        auto skip = indexer.apply(chain.b2);
        REQUIRE(skip.is_ok());
        auto result = db.store.commit(skip.value());
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_CURSOR_MISMATCH);
        CHECK(db.store.getBlock(2).is_err());
    }

    SUBCASE("Spending an unknown output aborts the whole commit") {
        commitApply(db.store, chain.b0);
        auto before = db.fingerprint();

        auto bogus = build(model::BlockBuilder(1, chain.b0.hash).spend(model::OutPoint{"missing", 0}, "alice", 5,
                                                                         "bob", 5));
        auto set = indexer.apply(bogus);
        REQUIRE(set.is_ok());
        auto result = db.store.commit(set.value());
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_DATA_INTEGRITY);

        CHECK(db.fingerprint() == before);
        CHECK(db.store.getBlock(1).is_err());
    }

    SUBCASE("Spending an already spent output is an integrity error") {
        commitApply(db.store, chain.b0);
        commitApply(db.store, chain.b1);

        auto double_spend =
            build(model::BlockBuilder(2, chain.b1.hash).spend(outputOf(chain.b0, 0, 0), "alice", 1000, "eve", 1000));
        auto set = indexer.apply(double_spend);
        REQUIRE(set.is_ok());
        auto result = db.store.commit(set.value());
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_DATA_INTEGRITY);
        CHECK(db.cursor() == model::SyncCursor::at(1, chain.b1.hash));
    }

    SUBCASE("Spending with a mismatched amount is an integrity error") {
        commitApply(db.store, chain.b0);
        auto wrong = build(model::BlockBuilder(1, chain.b0.hash).spend(outputOf(chain.b0, 0, 0), "alice", 999, "bob",
                                                                         999));
        auto set = indexer.apply(wrong);
        REQUIRE(set.is_ok());
        auto result = db.store.commit(set.value());
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_DATA_INTEGRITY);
    }

    SUBCASE("Revert restores the previous state exactly") {
        TestDB reference("test_store_commit_reference");
        commitApply(reference.store, chain.b0);
        commitApply(reference.store, chain.b1);

        commitApply(db.store, chain.b0);
        commitApply(db.store, chain.b1);
        commitApply(db.store, chain.b2);
        commitRevert(db.store, chain.b2);

        CHECK(db.fingerprint() == reference.fingerprint());
        CHECK(db.store.getAddressAggregate("dave").is_err());
        CHECK(db.store.getTransaction(model::str(chain.b2.transactions[0].id)).is_err());
    }

    SUBCASE("Reverting everything returns to the empty index") {
        TestDB empty("test_store_commit_empty");
        commitApply(db.store, chain.b0);
        commitApply(db.store, chain.b1);
        commitRevert(db.store, chain.b1);
        commitRevert(db.store, chain.b0);

        CHECK(db.cursor().empty());
        CHECK(db.fingerprint() == empty.fingerprint());
    }

    SUBCASE("Reverting a block that is not the tip is rejected") {
        commitApply(db.store, chain.b0);
        commitApply(db.store, chain.b1);
        auto set = indexer.revert(chain.b0);
        REQUIRE(set.is_ok());
        auto result = db.store.commit(set.value());
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_CURSOR_MISMATCH);
    }

    SUBCASE("Engine failure leaves nothing behind") {
        REQUIRE(db.store.registerExtension(FailingInsertTrigger(1)).is_ok());
        commitApply(db.store, chain.b0);
        auto before = db.fingerprint();

        auto set = indexer.apply(chain.b1);
        REQUIRE(set.is_ok());
        auto result = db.store.commit(set.value());
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_STORAGE_COMMIT);
        CHECK(is_transient(result.error()));
        CHECK(db.fingerprint() == before);

        REQUIRE(db.store.executeSql("DROP TRIGGER fail_block_insert").is_ok());
        CHECK(db.store.commit(set.value()).is_ok());
        CHECK(db.cursor() == model::SyncCursor::at(1, chain.b1.hash));
    }
}

// ===========================================
// Reads
// ===========================================

TEST_CASE("IndexStore reads") {
    TestDB db("test_store_reads");
    SmallChain chain;
    commitApply(db.store, chain.b0);
    commitApply(db.store, chain.b1);
    commitApply(db.store, chain.b2);

    SUBCASE("Unknown keys are not_found") {
        CHECK(is_not_found(db.store.getBlock(3).error()));
        CHECK(is_not_found(db.store.getBlock(-1).error()));
        CHECK(is_not_found(db.store.getBlockByHash("nope").error()));
        CHECK(is_not_found(db.store.getTransaction("nope").error()));
        CHECK(is_not_found(db.store.getAddressAggregate("nobody").error()));
    }

    SUBCASE("Unspent outputs") {
        auto snap = db.store.snapshot();
        REQUIRE(snap.is_ok());

        auto alice = snap.value()->getAddressUtxos("alice");
        REQUIRE(alice.is_ok());
        REQUIRE(alice.value().size() == 1);
        CHECK(alice.value()[0].amount == 700);
        CHECK(alice.value()[0].block_height == 1);

        auto bob = snap.value()->getAddressUtxos("bob");
        REQUIRE(bob.is_ok());
        REQUIRE(bob.value().size() == 1);
        CHECK(bob.value()[0].amount == 200);
        CHECK(model::same(bob.value()[0].outpoint.tx_id, chain.b2.transactions[1].id));
        CHECK(bob.value()[0].outpoint.index == 1);
    }

    SUBCASE("Address history is ordered by chain position") {
        auto snap = db.store.snapshot();
        REQUIRE(snap.is_ok());

        auto carol = snap.value()->getAddressTransactions("carol");
        REQUIRE(carol.is_ok());
        REQUIRE(carol.value().size() == 2);
        CHECK(carol.value()[0] == model::str(chain.b2.transactions[1].id));
        CHECK(carol.value()[1] == model::str(chain.b2.transactions[2].id));

        auto page = snap.value()->getAddressTransactions("carol", 1, 1);
        REQUIRE(page.is_ok());
        REQUIRE(page.value().size() == 1);
        CHECK(page.value()[0] == carol.value()[1]);
    }

    SUBCASE("Block transaction ids") {
        auto snap = db.store.snapshot();
        REQUIRE(snap.is_ok());
        auto ids = snap.value()->getBlockTransactionIds(2);
        REQUIRE(ids.is_ok());
        REQUIRE(ids.value().size() == 3);
        CHECK(ids.value()[0] == model::str(chain.b2.transactions[0].id));
        CHECK(is_not_found(snap.value()->getBlockTransactionIds(9).error()));
    }

    SUBCASE("Counts") {
        auto snap = db.store.snapshot();
        REQUIRE(snap.is_ok());
        CHECK(snap.value()->getBlockCount().value() == 3);
        CHECK(snap.value()->getTransactionCount().value() == 5);
        CHECK(snap.value()->getAddressCount().value() == 5);
    }

    SUBCASE("A snapshot does not see later commits") {
        auto snap = db.store.snapshot();
        REQUIRE(snap.is_ok());
        auto before = snap.value()->stateFingerprint();
        REQUIRE(before.is_ok());

        auto b3 = build(model::BlockBuilder(3, chain.b2.hash).transfer("dave", "erin", 5));
        commitApply(db.store, b3);

        CHECK(snap.value()->readCursor().value() == model::SyncCursor::at(2, chain.b2.hash));
        CHECK(is_not_found(snap.value()->getBlockSummary(3).error()));
        CHECK(snap.value()->stateFingerprint().value() == before.value());

        CHECK(db.cursor() == model::SyncCursor::at(3, b3.hash));
    }

    SUBCASE("Many snapshots at once") {
        std::vector<std::shared_ptr<storage::Snapshot>> held;
        for (int i = 0; i < 12; ++i) {
            auto snap = db.store.snapshot();
            REQUIRE(snap.is_ok());
            held.push_back(snap.value());
        }
        for (const auto &snap : held) {
            CHECK(snap->getBlockCount().value() == 3);
        }
        held.clear();
        CHECK(db.store.readCursor().is_ok());
    }
}

// ===========================================
// Diagnostics
// ===========================================

TEST_CASE("IndexStore diagnostics") {
    TestDB db("test_store_diagnostics");
    SmallChain chain;
    commitApply(db.store, chain.b0);
    commitApply(db.store, chain.b1);

    SUBCASE("Tampered aggregates are detected") {
        CHECK(db.store.verifyAggregates().value());
        REQUIRE(db.store.executeSql("UPDATE address_aggregates SET balance = balance + 1 WHERE address = 'bob'").is_ok());
        CHECK_FALSE(db.store.verifyAggregates().value());
    }

    SUBCASE("Broken linkage is detected") {
        CHECK(db.store.verifyLinkage().value());
        REQUIRE(db.store.executeSql("UPDATE blocks SET parent_hash = 'forged' WHERE height = 1").is_ok());
        CHECK_FALSE(db.store.verifyLinkage().value());
    }

    SUBCASE("Cursor off the top block is detected") {
        REQUIRE(db.store.executeSql("UPDATE sync_cursor SET height = 0").is_ok());
        CHECK_FALSE(db.store.verifyLinkage().value());
    }

    SUBCASE("Fingerprints differ for different content") {
        TestDB other("test_store_diagnostics_other");
        commitApply(other.store, chain.b0);
        CHECK(other.fingerprint() != db.fingerprint());
        commitApply(other.store, chain.b1);
        CHECK(other.fingerprint() == db.fingerprint());
    }
}
