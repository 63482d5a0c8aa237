#pragma once

#include <atomic>
#include <datapod/datapod.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "blockindex/indexer/mutation.hpp"
#include "blockindex/model/types.hpp"

// Forward declaration for sqlite3 C API
struct sqlite3;

namespace blockindex::storage {

    // ===========================================
    // Configuration
    // ===========================================

    /// SQLite database configuration
    struct OpenOptions {
        bool enable_wal = true;
        bool enable_foreign_keys = true;
        dp::i32 busy_timeout_ms = 5000;
        dp::i32 cache_size_kb = 20000;
        enum class Synchronous { OFF = 0, NORMAL = 1, FULL = 2 };
        Synchronous sync_mode = Synchronous::NORMAL;
        /// Idle reader connections kept for query snapshots
        dp::i32 max_idle_readers = 8;

        auto members() {
            return std::tie(enable_wal, enable_foreign_keys, busy_timeout_ms, cache_size_kb, sync_mode,
                            max_idle_readers);
        }
        auto members() const {
            return std::tie(enable_wal, enable_foreign_keys, busy_timeout_ms, cache_size_kb, sync_mode,
                            max_idle_readers);
        }
    };

    /// Interface for caller-defined schema additions (tables, indexes, triggers)
    class ISchemaExtension {
      public:
        virtual ~ISchemaExtension() = default;

        /// CREATE statements, should use "IF NOT EXISTS"
        virtual std::vector<std::string> getCreateTableStatements() const = 0;

        virtual std::vector<std::string> getCreateIndexStatements() const = 0;

        /// Key = version number, Value = SQL statements to execute
        virtual std::vector<std::pair<int32_t, std::vector<std::string>>> getMigrations() const { return {}; }
    };

    class IndexStore;

    /// Reader connections to one opened database file. Shared by the store and
    /// every snapshot drawn from it; closing or reopening the store retires it.
    class ReaderPool;

    // ===========================================
    // Snapshot - consistent read view
    // ===========================================

    /// Read transaction on a pooled reader connection. Every read made through one
    /// snapshot observes the same committed state; the view is released when the
    /// snapshot is destroyed.
    class Snapshot {
        struct Token {
            explicit Token() = default;
        };

      public:
        Snapshot(Token, std::shared_ptr<ReaderPool> pool, sqlite3 *db);
        ~Snapshot();

        Snapshot(const Snapshot &) = delete;
        Snapshot &operator=(const Snapshot &) = delete;

        dp::Result<model::SyncCursor, dp::Error> readCursor() const;

        dp::Result<model::BlockSummary, dp::Error> getBlockSummary(dp::i64 height) const;
        dp::Result<model::BlockSummary, dp::Error> getBlockSummaryByHash(const std::string &hash) const;

        /// Full block, transactions decoded from their stored payloads
        dp::Result<model::Block, dp::Error> getBlock(dp::i64 height) const;
        dp::Result<model::Block, dp::Error> getBlockByHash(const std::string &hash) const;

        dp::Result<std::vector<std::string>, dp::Error> getBlockTransactionIds(dp::i64 height) const;

        dp::Result<model::IndexedTransaction, dp::Error> getTransaction(const std::string &tx_id) const;

        dp::Result<model::AddressAggregate, dp::Error> getAddressAggregate(const std::string &address) const;

        /// Transaction ids touching the address, oldest first
        dp::Result<std::vector<std::string>, dp::Error> getAddressTransactions(const std::string &address,
                                                                              dp::i32 limit = 100,
                                                                              dp::i32 offset = 0) const;

        dp::Result<std::vector<model::Utxo>, dp::Error> getAddressUtxos(const std::string &address) const;

        dp::Result<dp::i64, dp::Error> getBlockCount() const;
        dp::Result<dp::i64, dp::Error> getTransactionCount() const;
        dp::Result<dp::i64, dp::Error> getAddressCount() const;

        /// Every stored block links to the block below it, heights are contiguous
        /// and the cursor points at the top block
        dp::Result<bool, dp::Error> verifyLinkage() const;

        /// Every aggregate equals the sum of the indexed transfers for its address
        dp::Result<bool, dp::Error> verifyAggregates() const;

        /// SHA256 over the ordered logical content of all index tables
        dp::Result<std::string, dp::Error> stateFingerprint() const;

      private:
        friend class IndexStore;

        std::shared_ptr<ReaderPool> pool_;
        sqlite3 *db_;
        bool active_;
    };

    // ===========================================
    // IndexStore - transactional chain index
    // ===========================================

    class IndexStore {
      public:
        IndexStore();
        ~IndexStore();

        IndexStore(const IndexStore &) = delete;
        IndexStore &operator=(const IndexStore &) = delete;

        /// Open or create the database file. In-memory databases are rejected:
        /// reader snapshots need their own connections to the same file.
        dp::Result<void, dp::Error> open(const std::string &path, const OpenOptions &opts = OpenOptions{});

        void close();

        bool isOpen() const;

        const std::string &path() const { return db_path_; }

        /// Create core tables and run migrations
        dp::Result<void, dp::Error> initializeCoreSchema();

        dp::Result<void, dp::Error> registerExtension(const ISchemaExtension &extension);

        // ===========================================
        // Write path (single writer)
        // ===========================================

        /// Apply all mutations and move the cursor in one transaction. The stored
        /// cursor must equal `set.expectedCursor()`, otherwise nothing is written
        /// and ERR_CURSOR_MISMATCH is returned.
        /// @return the cursor now stored
        dp::Result<model::SyncCursor, dp::Error> commit(const indexer::MutationSet &set);

        // ===========================================
        // Reads
        // ===========================================

        /// Start a read view. Single reads below open and close one each.
        dp::Result<std::shared_ptr<Snapshot>, dp::Error> snapshot() const;

        dp::Result<model::SyncCursor, dp::Error> readCursor() const;
        dp::Result<model::Block, dp::Error> getBlock(dp::i64 height) const;
        dp::Result<model::Block, dp::Error> getBlockByHash(const std::string &hash) const;
        dp::Result<model::IndexedTransaction, dp::Error> getTransaction(const std::string &tx_id) const;
        dp::Result<model::AddressAggregate, dp::Error> getAddressAggregate(const std::string &address) const;

        dp::Result<bool, dp::Error> verifyLinkage() const;
        dp::Result<bool, dp::Error> verifyAggregates() const;
        dp::Result<std::string, dp::Error> stateFingerprint() const;

        /// SQLite integrity check
        dp::Result<bool, dp::Error> quickCheck() const;

        /// Execute raw SQL on the writer connection (extensions, maintenance)
        dp::Result<void, dp::Error> executeSql(const std::string &sql);

      private:
        sqlite3 *db_;
        std::string db_path_;
        OpenOptions opts_;
        std::atomic<bool> is_open_;

        mutable std::mutex write_mutex_;
        mutable std::mutex pool_mutex_;
        std::shared_ptr<ReaderPool> readers_;

        std::shared_ptr<ReaderPool> readerPool() const;

        bool createCoreSchemaV1();
        bool tableExists(const std::string &table_name);
        int32_t getCurrentSchemaVersion();
        bool setSchemaVersion(int32_t version);

        static constexpr const char *SCHEMA_MIGRATIONS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS schema_migrations (
                version INTEGER PRIMARY KEY,
                applied_at INTEGER NOT NULL
            )
        )";

        static constexpr const char *BLOCKS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS blocks (
                height INTEGER PRIMARY KEY,
                hash TEXT NOT NULL UNIQUE,
                parent_hash TEXT NOT NULL,
                timestamp INTEGER NOT NULL,
                tx_count INTEGER NOT NULL
            )
        )";

        static constexpr const char *TRANSACTIONS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS transactions (
                tx_id TEXT PRIMARY KEY,
                block_height INTEGER NOT NULL,
                block_hash TEXT NOT NULL,
                position INTEGER NOT NULL,
                payload BLOB NOT NULL,
                FOREIGN KEY(block_height) REFERENCES blocks(height) ON DELETE CASCADE
            )
        )";

        static constexpr const char *TRANSFERS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS transfers (
                tx_id TEXT NOT NULL,
                direction INTEGER NOT NULL,
                io_index INTEGER NOT NULL,
                address TEXT NOT NULL,
                amount INTEGER NOT NULL,
                block_height INTEGER NOT NULL,
                position INTEGER NOT NULL,
                PRIMARY KEY(tx_id, direction, io_index),
                FOREIGN KEY(tx_id) REFERENCES transactions(tx_id) ON DELETE CASCADE
            )
        )";

        static constexpr const char *OUTPUTS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS outputs (
                tx_id TEXT NOT NULL,
                output_index INTEGER NOT NULL,
                address TEXT NOT NULL,
                amount INTEGER NOT NULL,
                block_height INTEGER NOT NULL,
                spent_by TEXT,
                PRIMARY KEY(tx_id, output_index),
                FOREIGN KEY(tx_id) REFERENCES transactions(tx_id) ON DELETE CASCADE
            )
        )";

        static constexpr const char *ADDRESS_AGGREGATES_TABLE = R"(
            CREATE TABLE IF NOT EXISTS address_aggregates (
                address TEXT PRIMARY KEY,
                balance INTEGER NOT NULL,
                tx_count INTEGER NOT NULL,
                total_received INTEGER NOT NULL,
                total_sent INTEGER NOT NULL
            )
        )";

        static constexpr const char *SYNC_CURSOR_TABLE = R"(
            CREATE TABLE IF NOT EXISTS sync_cursor (
                id INTEGER PRIMARY KEY CHECK (id = 0),
                height INTEGER NOT NULL,
                hash TEXT NOT NULL
            )
        )";

        static constexpr const char *IDX_TX_BLOCK_HEIGHT =
            "CREATE INDEX IF NOT EXISTS idx_tx_block_height ON transactions(block_height, position)";
        static constexpr const char *IDX_TRANSFERS_ADDRESS =
            "CREATE INDEX IF NOT EXISTS idx_transfers_address ON transfers(address, block_height, position)";
        static constexpr const char *IDX_OUTPUTS_ADDRESS =
            "CREATE INDEX IF NOT EXISTS idx_outputs_address ON outputs(address, spent_by)";
    };

} // namespace blockindex::storage
