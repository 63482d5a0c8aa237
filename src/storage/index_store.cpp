#include <blockindex/common/error.hpp>
#include <blockindex/common/hash.hpp>
#include <blockindex/storage/index_store.hpp>

#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <variant>

namespace blockindex::storage {

    namespace {

        // ===========================================
        // Statement - prepared statement with RAII finalize
        // ===========================================

        class Statement {
          public:
            Statement(sqlite3 *db, const char *sql) : stmt_(nullptr) {
                rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
            }

            ~Statement() {
                if (stmt_)
                    sqlite3_finalize(stmt_);
            }

            Statement(const Statement &) = delete;
            Statement &operator=(const Statement &) = delete;

            bool ok() const { return rc_ == SQLITE_OK && stmt_ != nullptr; }

            Statement &bind(int idx, int64_t value) {
                sqlite3_bind_int64(stmt_, idx, value);
                return *this;
            }

            Statement &bind(int idx, const std::string &value) {
                sqlite3_bind_text(stmt_, idx, value.c_str(), -1, SQLITE_TRANSIENT);
                return *this;
            }

            Statement &bind(int idx, const dp::String &value) { return bind(idx, model::str(value)); }

            Statement &bind(int idx, const std::vector<uint8_t> &blob) {
                sqlite3_bind_blob(stmt_, idx, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
                return *this;
            }

            int step() { return sqlite3_step(stmt_); }

            int64_t columnInt(int col) const { return sqlite3_column_int64(stmt_, col); }

            std::string columnText(int col) const {
                const unsigned char *text = sqlite3_column_text(stmt_, col);
                return text ? reinterpret_cast<const char *>(text) : "";
            }

            dp::String columnString(int col) const { return dp::String(columnText(col).c_str()); }

            std::vector<uint8_t> columnBlob(int col) const {
                const void *blob = sqlite3_column_blob(stmt_, col);
                int size = sqlite3_column_bytes(stmt_, col);
                if (!blob || size <= 0)
                    return {};
                return std::vector<uint8_t>(static_cast<const uint8_t *>(blob),
                                            static_cast<const uint8_t *>(blob) + size);
            }

            int columnCount() const { return sqlite3_column_count(stmt_); }

          private:
            sqlite3_stmt *stmt_;
            int rc_;
        };

        std::string errmsg(sqlite3 *db) { return db ? sqlite3_errmsg(db) : "no database"; }

        dp::Error readError(sqlite3 *db, const std::string &what) {
            return dp::Error::io_error(dp::String((what + ": " + errmsg(db)).c_str()));
        }

        /// Key and reference violations mean the block contradicts the index;
        /// anything else (including trigger aborts) is an engine failure.
        dp::Error writeError(sqlite3 *db, const std::string &what) {
            dp::String msg((what + ": " + errmsg(db)).c_str());
            int code = db ? sqlite3_extended_errcode(db) : SQLITE_ERROR;
            if ((code & 0xff) == SQLITE_CONSTRAINT && code != SQLITE_CONSTRAINT_TRIGGER)
                return data_integrity(msg);
            return storage_commit(msg);
        }

        dp::Error notFound(const std::string &what) { return dp::Error::not_found(dp::String(what.c_str())); }

        // ===========================================
        // Write transaction guard
        // ===========================================

        class WriteTxGuard {
          public:
            explicit WriteTxGuard(sqlite3 *db) : db_(db), active_(false) {
                active_ = (sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) == SQLITE_OK);
            }

            ~WriteTxGuard() {
                if (active_)
                    sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
            }

            WriteTxGuard(const WriteTxGuard &) = delete;
            WriteTxGuard &operator=(const WriteTxGuard &) = delete;

            bool active() const { return active_; }

            dp::Result<void, dp::Error> commit() {
                if (!active_)
                    return dp::Result<void, dp::Error>::err(storage_commit("No active transaction"));
                if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
                    auto err = writeError(db_, "COMMIT failed");
                    sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
                    active_ = false;
                    return dp::Result<void, dp::Error>::err(err);
                }
                active_ = false;
                return dp::Result<void, dp::Error>::ok();
            }

          private:
            sqlite3 *db_;
            bool active_;
        };

        // ===========================================
        // Payload encoding
        // ===========================================

        dp::Result<std::vector<uint8_t>, dp::Error> encodeTransaction(const model::Transaction &tx) {
            try {
                model::Transaction copy = tx;
                auto buf = dp::serialize<dp::Mode::WITH_VERSION>(copy);
                return dp::Result<std::vector<uint8_t>, dp::Error>::ok(std::vector<uint8_t>(buf.begin(), buf.end()));
            } catch (const std::exception &e) {
                return dp::Result<std::vector<uint8_t>, dp::Error>::err(serialization_failed(dp::String(e.what())));
            }
        }

        dp::Result<model::Transaction, dp::Error> decodeTransaction(const std::vector<uint8_t> &payload) {
            try {
                dp::ByteBuf buf(payload.begin(), payload.end());
                auto tx = dp::deserialize<dp::Mode::WITH_VERSION, model::Transaction>(buf);
                return dp::Result<model::Transaction, dp::Error>::ok(std::move(tx));
            } catch (const std::exception &e) {
                return dp::Result<model::Transaction, dp::Error>::err(deserialization_failed(dp::String(e.what())));
            }
        }

        // ===========================================
        // Read helpers (any connection)
        // ===========================================

        dp::Result<dp::i64, dp::Error> queryInt(sqlite3 *db, const char *sql) {
            Statement stmt(db, sql);
            if (!stmt.ok())
                return dp::Result<dp::i64, dp::Error>::err(readError(db, "prepare failed"));
            if (stmt.step() != SQLITE_ROW)
                return dp::Result<dp::i64, dp::Error>::err(readError(db, "query failed"));
            return dp::Result<dp::i64, dp::Error>::ok(stmt.columnInt(0));
        }

        dp::Result<model::SyncCursor, dp::Error> readCursorOn(sqlite3 *db) {
            Statement stmt(db, "SELECT height, hash FROM sync_cursor WHERE id = 0");
            if (!stmt.ok())
                return dp::Result<model::SyncCursor, dp::Error>::err(readError(db, "prepare cursor read"));
            int rc = stmt.step();
            if (rc == SQLITE_DONE)
                return dp::Result<model::SyncCursor, dp::Error>::ok(model::SyncCursor{});
            if (rc != SQLITE_ROW)
                return dp::Result<model::SyncCursor, dp::Error>::err(readError(db, "cursor read"));
            return dp::Result<model::SyncCursor, dp::Error>::ok(
                model::SyncCursor::at(stmt.columnInt(0), stmt.columnString(1)));
        }

        model::BlockSummary summaryFromRow(const Statement &stmt) {
            model::BlockSummary s;
            s.height = stmt.columnInt(0);
            s.hash = stmt.columnString(1);
            s.parent_hash = stmt.columnString(2);
            s.timestamp = stmt.columnInt(3);
            s.tx_count = stmt.columnInt(4);
            return s;
        }

        dp::Result<model::BlockSummary, dp::Error> readSummary(sqlite3 *db, const char *sql, Statement &stmt,
                                                               const std::string &key) {
            if (!stmt.ok())
                return dp::Result<model::BlockSummary, dp::Error>::err(readError(db, "prepare block read"));
            int rc = stmt.step();
            if (rc == SQLITE_DONE)
                return dp::Result<model::BlockSummary, dp::Error>::err(notFound("Block not found: " + key));
            if (rc != SQLITE_ROW)
                return dp::Result<model::BlockSummary, dp::Error>::err(readError(db, std::string("query: ") + sql));
            return dp::Result<model::BlockSummary, dp::Error>::ok(summaryFromRow(stmt));
        }

        constexpr const char *BLOCK_BY_HEIGHT =
            "SELECT height, hash, parent_hash, timestamp, tx_count FROM blocks WHERE height = ?";
        constexpr const char *BLOCK_BY_HASH =
            "SELECT height, hash, parent_hash, timestamp, tx_count FROM blocks WHERE hash = ?";

        dp::Result<model::BlockSummary, dp::Error> summaryByHeight(sqlite3 *db, dp::i64 height) {
            Statement stmt(db, BLOCK_BY_HEIGHT);
            stmt.bind(1, height);
            return readSummary(db, BLOCK_BY_HEIGHT, stmt, std::to_string(height));
        }

        dp::Result<model::BlockSummary, dp::Error> summaryByHash(sqlite3 *db, const std::string &hash) {
            Statement stmt(db, BLOCK_BY_HASH);
            stmt.bind(1, hash);
            return readSummary(db, BLOCK_BY_HASH, stmt, hash);
        }

        dp::Result<model::Block, dp::Error> assembleBlock(sqlite3 *db, const model::BlockSummary &summary) {
            model::Block block;
            block.height = summary.height;
            block.hash = summary.hash;
            block.parent_hash = summary.parent_hash;
            block.timestamp = summary.timestamp;

            Statement stmt(db, "SELECT payload FROM transactions WHERE block_height = ? ORDER BY position");
            if (!stmt.ok())
                return dp::Result<model::Block, dp::Error>::err(readError(db, "prepare block transactions"));
            stmt.bind(1, summary.height);

            int rc;
            while ((rc = stmt.step()) == SQLITE_ROW) {
                auto tx = decodeTransaction(stmt.columnBlob(0));
                if (tx.is_err())
                    return dp::Result<model::Block, dp::Error>::err(tx.error());
                block.transactions.push_back(tx.value());
            }
            if (rc != SQLITE_DONE)
                return dp::Result<model::Block, dp::Error>::err(readError(db, "block transactions"));

            if (static_cast<dp::i64>(block.transactions.size()) != summary.tx_count) {
                std::string msg = "block " + std::to_string(summary.height) + " stores " +
                                  std::to_string(block.transactions.size()) + " of " +
                                  std::to_string(summary.tx_count) + " transactions";
                return dp::Result<model::Block, dp::Error>::err(data_integrity(dp::String(msg.c_str())));
            }
            return dp::Result<model::Block, dp::Error>::ok(std::move(block));
        }

        /// Appends every row of `sql` as '|' separated text lines
        bool appendRows(sqlite3 *db, const char *tag, const char *sql, std::string &out) {
            Statement stmt(db, sql);
            if (!stmt.ok())
                return false;
            int rc;
            while ((rc = stmt.step()) == SQLITE_ROW) {
                out += tag;
                for (int i = 0; i < stmt.columnCount(); ++i) {
                    out += '|';
                    out += stmt.columnText(i);
                }
                out += '\n';
            }
            return rc == SQLITE_DONE;
        }

        // ===========================================
        // Mutation executors (writer connection, inside a transaction)
        // ===========================================

        class MutationWriter {
          public:
            explicit MutationWriter(sqlite3 *db) : db_(db) {}

            dp::Result<void, dp::Error> operator()(const indexer::InsertBlock &m) {
                Statement stmt(db_, "INSERT INTO blocks (height, hash, parent_hash, timestamp, tx_count) "
                                    "VALUES (?, ?, ?, ?, ?)");
                if (!stmt.ok())
                    return fail("prepare block insert");
                stmt.bind(1, m.block.height)
                    .bind(2, m.block.hash)
                    .bind(3, m.block.parent_hash)
                    .bind(4, m.block.timestamp)
                    .bind(5, static_cast<int64_t>(m.block.transactions.size()));
                if (stmt.step() != SQLITE_DONE)
                    return fail("insert block " + std::to_string(m.block.height));
                return dp::Result<void, dp::Error>::ok();
            }

            dp::Result<void, dp::Error> operator()(const indexer::DeleteBlock &m) {
                Statement remaining(db_, "SELECT COUNT(*) FROM transactions WHERE block_height = ?");
                if (!remaining.ok())
                    return fail("prepare block transaction count");
                remaining.bind(1, m.height);
                if (remaining.step() != SQLITE_ROW)
                    return fail("count block transactions");
                if (remaining.columnInt(0) != 0)
                    return integrity("block " + std::to_string(m.height) + " still has transactions");

                Statement stmt(db_, "DELETE FROM blocks WHERE height = ? AND hash = ?");
                if (!stmt.ok())
                    return fail("prepare block delete");
                stmt.bind(1, m.height).bind(2, m.hash);
                if (stmt.step() != SQLITE_DONE)
                    return fail("delete block " + std::to_string(m.height));
                if (sqlite3_changes(db_) != 1)
                    return integrity("block " + std::to_string(m.height) + ":" + model::str(m.hash) +
                                     " is not stored");
                return dp::Result<void, dp::Error>::ok();
            }

            dp::Result<void, dp::Error> operator()(const indexer::InsertTransaction &m) {
                auto payload = encodeTransaction(m.tx);
                if (payload.is_err())
                    return dp::Result<void, dp::Error>::err(payload.error());

                Statement stmt(db_, "INSERT INTO transactions (tx_id, block_height, block_hash, position, payload) "
                                    "VALUES (?, ?, ?, ?, ?)");
                if (!stmt.ok())
                    return fail("prepare transaction insert");
                stmt.bind(1, m.tx.id).bind(2, m.block_height).bind(3, m.block_hash).bind(4, m.position);
                stmt.bind(5, payload.value());
                if (stmt.step() != SQLITE_DONE)
                    return fail("insert transaction " + model::str(m.tx.id));

                for (dp::usize i = 0; i < m.tx.inputs.size(); ++i) {
                    const auto &in = m.tx.inputs[i];
                    auto r = insertTransfer(m, 0, static_cast<int64_t>(i), in.address, in.amount);
                    if (r.is_err())
                        return r;
                }
                for (dp::usize i = 0; i < m.tx.outputs.size(); ++i) {
                    const auto &out = m.tx.outputs[i];
                    auto r = insertTransfer(m, 1, static_cast<int64_t>(i), out.address, out.amount);
                    if (r.is_err())
                        return r;

                    Statement output(db_, "INSERT INTO outputs (tx_id, output_index, address, amount, block_height, "
                                          "spent_by) VALUES (?, ?, ?, ?, ?, NULL)");
                    if (!output.ok())
                        return fail("prepare output insert");
                    output.bind(1, m.tx.id)
                        .bind(2, static_cast<int64_t>(i))
                        .bind(3, out.address)
                        .bind(4, out.amount)
                        .bind(5, m.block_height);
                    if (output.step() != SQLITE_DONE)
                        return fail("insert output " + model::str(m.tx.id) + ":" + std::to_string(i));
                }
                return dp::Result<void, dp::Error>::ok();
            }

            dp::Result<void, dp::Error> operator()(const indexer::DeleteTransaction &m) {
                Statement spent(db_, "SELECT COUNT(*) FROM outputs WHERE tx_id = ? AND spent_by IS NOT NULL");
                if (!spent.ok())
                    return fail("prepare spent output count");
                spent.bind(1, m.tx_id);
                if (spent.step() != SQLITE_ROW)
                    return fail("count spent outputs");
                if (spent.columnInt(0) != 0)
                    return integrity("transaction " + model::str(m.tx_id) + " has outputs spent elsewhere");

                for (const char *sql : {"DELETE FROM transfers WHERE tx_id = ?", "DELETE FROM outputs WHERE tx_id = ?"}) {
                    Statement stmt(db_, sql);
                    if (!stmt.ok())
                        return fail("prepare transaction cleanup");
                    stmt.bind(1, m.tx_id);
                    if (stmt.step() != SQLITE_DONE)
                        return fail("cleanup transaction " + model::str(m.tx_id));
                }

                Statement stmt(db_, "DELETE FROM transactions WHERE tx_id = ?");
                if (!stmt.ok())
                    return fail("prepare transaction delete");
                stmt.bind(1, m.tx_id);
                if (stmt.step() != SQLITE_DONE)
                    return fail("delete transaction " + model::str(m.tx_id));
                if (sqlite3_changes(db_) != 1)
                    return integrity("transaction " + model::str(m.tx_id) + " is not stored");
                return dp::Result<void, dp::Error>::ok();
            }

            dp::Result<void, dp::Error> operator()(const indexer::SpendOutput &m) {
                Statement stmt(db_, "UPDATE outputs SET spent_by = ? WHERE tx_id = ? AND output_index = ? "
                                    "AND spent_by IS NULL AND address = ? AND amount = ?");
                if (!stmt.ok())
                    return fail("prepare output spend");
                stmt.bind(1, m.spender_tx_id)
                    .bind(2, m.outpoint.tx_id)
                    .bind(3, static_cast<int64_t>(m.outpoint.index))
                    .bind(4, m.address)
                    .bind(5, m.amount);
                if (stmt.step() != SQLITE_DONE)
                    return fail("spend output");
                if (sqlite3_changes(db_) != 1)
                    return integrity("output " + model::str(m.outpoint.tx_id) + ":" +
                                     std::to_string(m.outpoint.index) + " is unknown, spent or mismatched");
                return dp::Result<void, dp::Error>::ok();
            }

            dp::Result<void, dp::Error> operator()(const indexer::UnspendOutput &m) {
                Statement stmt(db_, "UPDATE outputs SET spent_by = NULL WHERE tx_id = ? AND output_index = ? "
                                    "AND spent_by = ?");
                if (!stmt.ok())
                    return fail("prepare output unspend");
                stmt.bind(1, m.outpoint.tx_id).bind(2, static_cast<int64_t>(m.outpoint.index)).bind(3, m.spender_tx_id);
                if (stmt.step() != SQLITE_DONE)
                    return fail("unspend output");
                if (sqlite3_changes(db_) != 1)
                    return integrity("output " + model::str(m.outpoint.tx_id) + ":" +
                                     std::to_string(m.outpoint.index) + " is not spent by " +
                                     model::str(m.spender_tx_id));
                return dp::Result<void, dp::Error>::ok();
            }

            dp::Result<void, dp::Error> operator()(const indexer::AdjustAggregate &m) {
                Statement upsert(db_, "INSERT INTO address_aggregates (address, balance, tx_count, total_received, "
                                      "total_sent) VALUES (?, ?, ?, ?, ?) ON CONFLICT(address) DO UPDATE SET "
                                      "balance = balance + excluded.balance, "
                                      "tx_count = tx_count + excluded.tx_count, "
                                      "total_received = total_received + excluded.total_received, "
                                      "total_sent = total_sent + excluded.total_sent");
                if (!upsert.ok())
                    return fail("prepare aggregate upsert");
                upsert.bind(1, m.address)
                    .bind(2, m.balance)
                    .bind(3, m.tx_count)
                    .bind(4, m.total_received)
                    .bind(5, m.total_sent);
                if (upsert.step() != SQLITE_DONE)
                    return fail("adjust aggregate " + model::str(m.address));

                Statement check(db_, "SELECT tx_count, total_received, total_sent FROM address_aggregates "
                                     "WHERE address = ?");
                if (!check.ok())
                    return fail("prepare aggregate check");
                check.bind(1, m.address);
                if (check.step() != SQLITE_ROW)
                    return fail("read aggregate " + model::str(m.address));
                if (check.columnInt(0) < 0 || check.columnInt(1) < 0 || check.columnInt(2) < 0)
                    return integrity("aggregate for " + model::str(m.address) + " would become negative");

                Statement prune(db_, "DELETE FROM address_aggregates WHERE address = ? AND balance = 0 AND "
                                     "tx_count = 0 AND total_received = 0 AND total_sent = 0");
                if (!prune.ok())
                    return fail("prepare aggregate prune");
                prune.bind(1, m.address);
                if (prune.step() != SQLITE_DONE)
                    return fail("prune aggregate " + model::str(m.address));
                return dp::Result<void, dp::Error>::ok();
            }

          private:
            sqlite3 *db_;

            dp::Result<void, dp::Error> insertTransfer(const indexer::InsertTransaction &m, int64_t direction,
                                                       int64_t io_index, const dp::String &address, dp::i64 amount) {
                Statement stmt(db_, "INSERT INTO transfers (tx_id, direction, io_index, address, amount, "
                                    "block_height, position) VALUES (?, ?, ?, ?, ?, ?, ?)");
                if (!stmt.ok())
                    return fail("prepare transfer insert");
                stmt.bind(1, m.tx.id)
                    .bind(2, direction)
                    .bind(3, io_index)
                    .bind(4, address)
                    .bind(5, amount)
                    .bind(6, m.block_height)
                    .bind(7, m.position);
                if (stmt.step() != SQLITE_DONE)
                    return fail("insert transfer for " + model::str(m.tx.id));
                return dp::Result<void, dp::Error>::ok();
            }

            dp::Result<void, dp::Error> fail(const std::string &what) const {
                return dp::Result<void, dp::Error>::err(writeError(db_, what));
            }

            static dp::Result<void, dp::Error> integrity(const std::string &what) {
                return dp::Result<void, dp::Error>::err(data_integrity(dp::String(what.c_str())));
            }
        };

        dp::Result<void, dp::Error> writeCursor(sqlite3 *db, const model::SyncCursor &cursor) {
            if (cursor.empty()) {
                if (sqlite3_exec(db, "DELETE FROM sync_cursor", nullptr, nullptr, nullptr) != SQLITE_OK)
                    return dp::Result<void, dp::Error>::err(writeError(db, "clear cursor"));
                return dp::Result<void, dp::Error>::ok();
            }
            Statement stmt(db, "INSERT OR REPLACE INTO sync_cursor (id, height, hash) VALUES (0, ?, ?)");
            if (!stmt.ok())
                return dp::Result<void, dp::Error>::err(writeError(db, "prepare cursor write"));
            stmt.bind(1, cursor.height).bind(2, cursor.hash);
            if (stmt.step() != SQLITE_DONE)
                return dp::Result<void, dp::Error>::err(writeError(db, "write cursor"));
            return dp::Result<void, dp::Error>::ok();
        }

        void applyPragmas(sqlite3 *db, const OpenOptions &opts, const std::string &path, bool writer) {
            if (!db)
                return;

            if (writer && opts.enable_wal) {
                if (sqlite3_exec(db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr) != SQLITE_OK)
                    spdlog::warn("Could not enable WAL on {}: {}", path, errmsg(db));
            }

            if (opts.enable_foreign_keys) {
                sqlite3_exec(db, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);
            }

            std::string busy_timeout = "PRAGMA busy_timeout=" + std::to_string(opts.busy_timeout_ms) + ";";
            sqlite3_exec(db, busy_timeout.c_str(), nullptr, nullptr, nullptr);

            std::string cache_size = "PRAGMA cache_size=-" + std::to_string(opts.cache_size_kb) + ";";
            sqlite3_exec(db, cache_size.c_str(), nullptr, nullptr, nullptr);

            if (!writer)
                return;

            std::string sync_mode;
            switch (opts.sync_mode) {
            case OpenOptions::Synchronous::OFF:
                sync_mode = "PRAGMA synchronous=OFF;";
                break;
            case OpenOptions::Synchronous::NORMAL:
                sync_mode = "PRAGMA synchronous=NORMAL;";
                break;
            case OpenOptions::Synchronous::FULL:
                sync_mode = "PRAGMA synchronous=FULL;";
                break;
            }
            sqlite3_exec(db, sync_mode.c_str(), nullptr, nullptr, nullptr);
        }

    } // namespace

    // ===========================================
    // ReaderPool
    // ===========================================

    class ReaderPool {
      public:
        ReaderPool(std::string path, const OpenOptions &opts) : path_(std::move(path)), opts_(opts) {}

        ~ReaderPool() { retire(); }

        ReaderPool(const ReaderPool &) = delete;
        ReaderPool &operator=(const ReaderPool &) = delete;

        dp::Result<sqlite3 *, dp::Error> acquire() {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (retired_)
                    return dp::Result<sqlite3 *, dp::Error>::err(store_not_open());
                if (!idle_.empty()) {
                    sqlite3 *reader = idle_.back();
                    idle_.pop_back();
                    return dp::Result<sqlite3 *, dp::Error>::ok(reader);
                }
            }

            sqlite3 *reader = nullptr;
            int rc = sqlite3_open_v2(path_.c_str(), &reader, SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX, nullptr);
            if (rc != SQLITE_OK) {
                auto err = readError(reader, "open reader connection");
                if (reader)
                    sqlite3_close(reader);
                return dp::Result<sqlite3 *, dp::Error>::err(err);
            }
            applyPragmas(reader, opts_, path_, false);
            return dp::Result<sqlite3 *, dp::Error>::ok(reader);
        }

        /// Connections handed back after retire() are closed, never pooled
        void release(sqlite3 *db) {
            if (!db)
                return;
            std::lock_guard<std::mutex> lock(mutex_);
            if (retired_ || static_cast<dp::i32>(idle_.size()) >= opts_.max_idle_readers) {
                sqlite3_close(db);
                return;
            }
            idle_.push_back(db);
        }

        void retire() {
            std::lock_guard<std::mutex> lock(mutex_);
            retired_ = true;
            for (auto *reader : idle_)
                sqlite3_close(reader);
            idle_.clear();
        }

      private:
        const std::string path_;
        const OpenOptions opts_;
        std::mutex mutex_;
        std::vector<sqlite3 *> idle_;
        bool retired_ = false;
    };

    // ===========================================
    // Snapshot
    // ===========================================

    Snapshot::Snapshot(Token, std::shared_ptr<ReaderPool> pool, sqlite3 *db)
        : pool_(std::move(pool)), db_(db), active_(false) {
        // A deferred read transaction pins its snapshot at the first read
        if (sqlite3_exec(db_, "BEGIN", nullptr, nullptr, nullptr) == SQLITE_OK) {
            active_ = sqlite3_exec(db_, "SELECT COUNT(*) FROM sync_cursor", nullptr, nullptr, nullptr) == SQLITE_OK;
            if (!active_)
                sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    Snapshot::~Snapshot() {
        if (active_)
            sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr);
        pool_->release(db_);
    }

    dp::Result<model::SyncCursor, dp::Error> Snapshot::readCursor() const { return readCursorOn(db_); }

    dp::Result<model::BlockSummary, dp::Error> Snapshot::getBlockSummary(dp::i64 height) const {
        return summaryByHeight(db_, height);
    }

    dp::Result<model::BlockSummary, dp::Error> Snapshot::getBlockSummaryByHash(const std::string &hash) const {
        return summaryByHash(db_, hash);
    }

    dp::Result<model::Block, dp::Error> Snapshot::getBlock(dp::i64 height) const {
        auto summary = summaryByHeight(db_, height);
        if (summary.is_err())
            return dp::Result<model::Block, dp::Error>::err(summary.error());
        return assembleBlock(db_, summary.value());
    }

    dp::Result<model::Block, dp::Error> Snapshot::getBlockByHash(const std::string &hash) const {
        auto summary = summaryByHash(db_, hash);
        if (summary.is_err())
            return dp::Result<model::Block, dp::Error>::err(summary.error());
        return assembleBlock(db_, summary.value());
    }

    dp::Result<std::vector<std::string>, dp::Error> Snapshot::getBlockTransactionIds(dp::i64 height) const {
        auto summary = summaryByHeight(db_, height);
        if (summary.is_err())
            return dp::Result<std::vector<std::string>, dp::Error>::err(summary.error());

        Statement stmt(db_, "SELECT tx_id FROM transactions WHERE block_height = ? ORDER BY position");
        if (!stmt.ok())
            return dp::Result<std::vector<std::string>, dp::Error>::err(readError(db_, "prepare block tx ids"));
        stmt.bind(1, height);

        std::vector<std::string> ids;
        int rc;
        while ((rc = stmt.step()) == SQLITE_ROW)
            ids.push_back(stmt.columnText(0));
        if (rc != SQLITE_DONE)
            return dp::Result<std::vector<std::string>, dp::Error>::err(readError(db_, "block tx ids"));
        return dp::Result<std::vector<std::string>, dp::Error>::ok(std::move(ids));
    }

    dp::Result<model::IndexedTransaction, dp::Error> Snapshot::getTransaction(const std::string &tx_id) const {
        Statement stmt(db_, "SELECT block_height, block_hash, position, payload FROM transactions WHERE tx_id = ?");
        if (!stmt.ok())
            return dp::Result<model::IndexedTransaction, dp::Error>::err(readError(db_, "prepare transaction read"));
        stmt.bind(1, tx_id);

        int rc = stmt.step();
        if (rc == SQLITE_DONE)
            return dp::Result<model::IndexedTransaction, dp::Error>::err(notFound("Transaction not found: " + tx_id));
        if (rc != SQLITE_ROW)
            return dp::Result<model::IndexedTransaction, dp::Error>::err(readError(db_, "transaction read"));

        auto tx = decodeTransaction(stmt.columnBlob(3));
        if (tx.is_err())
            return dp::Result<model::IndexedTransaction, dp::Error>::err(tx.error());

        model::IndexedTransaction indexed;
        indexed.tx = tx.value();
        indexed.block_height = stmt.columnInt(0);
        indexed.block_hash = stmt.columnString(1);
        indexed.position = stmt.columnInt(2);
        return dp::Result<model::IndexedTransaction, dp::Error>::ok(std::move(indexed));
    }

    dp::Result<model::AddressAggregate, dp::Error> Snapshot::getAddressAggregate(const std::string &address) const {
        Statement stmt(db_, "SELECT address, balance, tx_count, total_received, total_sent FROM address_aggregates "
                            "WHERE address = ?");
        if (!stmt.ok())
            return dp::Result<model::AddressAggregate, dp::Error>::err(readError(db_, "prepare aggregate read"));
        stmt.bind(1, address);

        int rc = stmt.step();
        if (rc == SQLITE_DONE)
            return dp::Result<model::AddressAggregate, dp::Error>::err(notFound("Address not found: " + address));
        if (rc != SQLITE_ROW)
            return dp::Result<model::AddressAggregate, dp::Error>::err(readError(db_, "aggregate read"));

        model::AddressAggregate agg;
        agg.address = stmt.columnString(0);
        agg.balance = stmt.columnInt(1);
        agg.tx_count = stmt.columnInt(2);
        agg.total_received = stmt.columnInt(3);
        agg.total_sent = stmt.columnInt(4);
        return dp::Result<model::AddressAggregate, dp::Error>::ok(std::move(agg));
    }

    dp::Result<std::vector<std::string>, dp::Error> Snapshot::getAddressTransactions(const std::string &address,
                                                                                    dp::i32 limit,
                                                                                    dp::i32 offset) const {
        Statement stmt(db_, "SELECT tx_id FROM transfers WHERE address = ? GROUP BY tx_id "
                            "ORDER BY MIN(block_height), MIN(position) LIMIT ? OFFSET ?");
        if (!stmt.ok())
            return dp::Result<std::vector<std::string>, dp::Error>::err(readError(db_, "prepare address history"));
        stmt.bind(1, address).bind(2, static_cast<int64_t>(limit)).bind(3, static_cast<int64_t>(offset));

        std::vector<std::string> ids;
        int rc;
        while ((rc = stmt.step()) == SQLITE_ROW)
            ids.push_back(stmt.columnText(0));
        if (rc != SQLITE_DONE)
            return dp::Result<std::vector<std::string>, dp::Error>::err(readError(db_, "address history"));
        return dp::Result<std::vector<std::string>, dp::Error>::ok(std::move(ids));
    }

    dp::Result<std::vector<model::Utxo>, dp::Error> Snapshot::getAddressUtxos(const std::string &address) const {
        Statement stmt(db_, "SELECT tx_id, output_index, address, amount, block_height FROM outputs "
                            "WHERE address = ? AND spent_by IS NULL ORDER BY block_height, tx_id, output_index");
        if (!stmt.ok())
            return dp::Result<std::vector<model::Utxo>, dp::Error>::err(readError(db_, "prepare utxo read"));
        stmt.bind(1, address);

        std::vector<model::Utxo> utxos;
        int rc;
        while ((rc = stmt.step()) == SQLITE_ROW) {
            model::Utxo utxo;
            utxo.outpoint.tx_id = stmt.columnString(0);
            utxo.outpoint.index = static_cast<dp::u32>(stmt.columnInt(1));
            utxo.address = stmt.columnString(2);
            utxo.amount = stmt.columnInt(3);
            utxo.block_height = stmt.columnInt(4);
            utxos.push_back(std::move(utxo));
        }
        if (rc != SQLITE_DONE)
            return dp::Result<std::vector<model::Utxo>, dp::Error>::err(readError(db_, "utxo read"));
        return dp::Result<std::vector<model::Utxo>, dp::Error>::ok(std::move(utxos));
    }

    dp::Result<dp::i64, dp::Error> Snapshot::getBlockCount() const {
        return queryInt(db_, "SELECT COUNT(*) FROM blocks");
    }

    dp::Result<dp::i64, dp::Error> Snapshot::getTransactionCount() const {
        return queryInt(db_, "SELECT COUNT(*) FROM transactions");
    }

    dp::Result<dp::i64, dp::Error> Snapshot::getAddressCount() const {
        return queryInt(db_, "SELECT COUNT(*) FROM address_aggregates");
    }

    dp::Result<bool, dp::Error> Snapshot::verifyLinkage() const {
        auto broken = queryInt(db_, "SELECT COUNT(*) FROM blocks b JOIN blocks p ON p.height = b.height - 1 "
                                    "WHERE b.parent_hash <> p.hash");
        if (broken.is_err())
            return dp::Result<bool, dp::Error>::err(broken.error());
        if (broken.value() != 0)
            return dp::Result<bool, dp::Error>::ok(false);

        auto dangling = queryInt(db_, "SELECT COUNT(*) FROM transactions t LEFT JOIN blocks b "
                                      "ON b.height = t.block_height WHERE b.hash IS NULL OR b.hash <> t.block_hash");
        if (dangling.is_err())
            return dp::Result<bool, dp::Error>::err(dangling.error());
        if (dangling.value() != 0)
            return dp::Result<bool, dp::Error>::ok(false);

        Statement stmt(db_, "SELECT MIN(height), MAX(height), COUNT(*) FROM blocks");
        if (!stmt.ok() || stmt.step() != SQLITE_ROW)
            return dp::Result<bool, dp::Error>::err(readError(db_, "block range"));
        dp::i64 count = stmt.columnInt(2);

        auto cursor = readCursorOn(db_);
        if (cursor.is_err())
            return dp::Result<bool, dp::Error>::err(cursor.error());

        if (count == 0)
            return dp::Result<bool, dp::Error>::ok(cursor.value().empty());

        dp::i64 min_height = stmt.columnInt(0);
        dp::i64 max_height = stmt.columnInt(1);
        if (min_height != 0 || max_height - min_height + 1 != count)
            return dp::Result<bool, dp::Error>::ok(false);

        auto top = summaryByHeight(db_, max_height);
        if (top.is_err())
            return dp::Result<bool, dp::Error>::err(top.error());
        return dp::Result<bool, dp::Error>::ok(cursor.value() ==
                                               model::SyncCursor::at(top.value().height, top.value().hash));
    }

    dp::Result<bool, dp::Error> Snapshot::verifyAggregates() const {
        constexpr const char *DERIVED = R"(
            WITH derived AS (
                SELECT address,
                       SUM(CASE WHEN direction = 1 THEN amount ELSE -amount END) AS balance,
                       COUNT(DISTINCT tx_id) AS tx_count,
                       SUM(CASE WHEN direction = 1 THEN amount ELSE 0 END) AS total_received,
                       SUM(CASE WHEN direction = 0 THEN amount ELSE 0 END) AS total_sent
                FROM transfers GROUP BY address
            )
            SELECT
                (SELECT COUNT(*) FROM derived d LEFT JOIN address_aggregates a ON a.address = d.address
                 WHERE a.address IS NULL OR a.balance <> d.balance OR a.tx_count <> d.tx_count
                    OR a.total_received <> d.total_received OR a.total_sent <> d.total_sent)
              + (SELECT COUNT(*) FROM address_aggregates a LEFT JOIN derived d ON d.address = a.address
                 WHERE d.address IS NULL)
        )";
        auto mismatches = queryInt(db_, DERIVED);
        if (mismatches.is_err())
            return dp::Result<bool, dp::Error>::err(mismatches.error());
        return dp::Result<bool, dp::Error>::ok(mismatches.value() == 0);
    }

    dp::Result<std::string, dp::Error> Snapshot::stateFingerprint() const {
        auto cursor = readCursorOn(db_);
        if (cursor.is_err())
            return dp::Result<std::string, dp::Error>::err(cursor.error());

        std::string dump = "cursor|" + cursor.value().toString() + "\n";
        bool ok = appendRows(db_, "block", "SELECT height, hash, parent_hash, timestamp, tx_count FROM blocks "
                                           "ORDER BY height", dump) &&
                  appendRows(db_, "tx", "SELECT tx_id, block_height, block_hash, position FROM transactions "
                                        "ORDER BY tx_id", dump) &&
                  appendRows(db_, "transfer", "SELECT tx_id, direction, io_index, address, amount, block_height, "
                                              "position FROM transfers ORDER BY tx_id, direction, io_index", dump) &&
                  appendRows(db_, "output", "SELECT tx_id, output_index, address, amount, block_height, "
                                            "COALESCE(spent_by, '') FROM outputs ORDER BY tx_id, output_index",
                             dump) &&
                  appendRows(db_, "aggregate", "SELECT address, balance, tx_count, total_received, total_sent "
                                               "FROM address_aggregates ORDER BY address", dump);
        if (!ok)
            return dp::Result<std::string, dp::Error>::err(readError(db_, "fingerprint dump"));

        auto digest = sha256Hex(dump);
        if (digest.is_err())
            return dp::Result<std::string, dp::Error>::err(digest.error());
        return dp::Result<std::string, dp::Error>::ok(digest.value());
    }

    // ===========================================
    // IndexStore lifecycle
    // ===========================================

    IndexStore::IndexStore() : db_(nullptr), is_open_(false) {}

    IndexStore::~IndexStore() { close(); }

    dp::Result<void, dp::Error> IndexStore::open(const std::string &path, const OpenOptions &opts) {
        if (path.empty() || path == ":memory:")
            return dp::Result<void, dp::Error>::err(
                dp::Error::invalid_argument("Index store needs a database file path"));
        if (is_open_)
            close();

        int rc = sqlite3_open_v2(path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
        if (rc != SQLITE_OK) {
            std::string msg = "Failed to open " + path + ": " + errmsg(db_);
            spdlog::error("{}", msg);
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            is_open_ = false;
            return dp::Result<void, dp::Error>::err(dp::Error::io_error(dp::String(msg.c_str())));
        }

        db_path_ = path;
        opts_ = opts;
        applyPragmas(db_, opts_, db_path_, true);
        {
            std::lock_guard<std::mutex> pool_lock(pool_mutex_);
            readers_ = std::make_shared<ReaderPool>(db_path_, opts_);
        }
        is_open_ = true;
        return dp::Result<void, dp::Error>::ok();
    }

    void IndexStore::close() {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        is_open_ = false;
        {
            // Snapshots still out keep the retired pool alive and close their
            // connection on release
            std::lock_guard<std::mutex> pool_lock(pool_mutex_);
            if (readers_)
                readers_->retire();
            readers_.reset();
        }

        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    bool IndexStore::isOpen() const { return is_open_; }

    dp::Result<void, dp::Error> IndexStore::initializeCoreSchema() {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(store_not_open());

        WriteTxGuard tx(db_);
        if (!tx.active())
            return dp::Result<void, dp::Error>::err(schema_error(dp::String(errmsg(db_).c_str())));

        if (sqlite3_exec(db_, SCHEMA_MIGRATIONS_TABLE, nullptr, nullptr, nullptr) != SQLITE_OK)
            return dp::Result<void, dp::Error>::err(schema_error(dp::String(errmsg(db_).c_str())));

        int32_t current_version = getCurrentSchemaVersion();
        if (current_version < 1) {
            if (!createCoreSchemaV1() || !setSchemaVersion(1)) {
                spdlog::error("Core schema creation failed on {}: {}", db_path_, errmsg(db_));
                return dp::Result<void, dp::Error>::err(schema_error(dp::String(errmsg(db_).c_str())));
            }
        }

        auto committed = tx.commit();
        if (committed.is_err())
            return dp::Result<void, dp::Error>::err(schema_error(committed.error().message));
        return dp::Result<void, dp::Error>::ok();
    }

    bool IndexStore::createCoreSchemaV1() {
        for (const char *sql : {BLOCKS_TABLE, TRANSACTIONS_TABLE, TRANSFERS_TABLE, OUTPUTS_TABLE,
                                ADDRESS_AGGREGATES_TABLE, SYNC_CURSOR_TABLE, IDX_TX_BLOCK_HEIGHT,
                                IDX_TRANSFERS_ADDRESS, IDX_OUTPUTS_ADDRESS}) {
            if (sqlite3_exec(db_, sql, nullptr, nullptr, nullptr) != SQLITE_OK)
                return false;
        }
        return true;
    }

    dp::Result<void, dp::Error> IndexStore::registerExtension(const ISchemaExtension &extension) {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(store_not_open());

        WriteTxGuard tx(db_);
        if (!tx.active())
            return dp::Result<void, dp::Error>::err(schema_error(dp::String(errmsg(db_).c_str())));

        std::vector<std::string> statements = extension.getCreateTableStatements();
        for (const auto &sql : extension.getCreateIndexStatements())
            statements.push_back(sql);

        int32_t current_version = getCurrentSchemaVersion();
        int32_t newest = current_version;
        for (const auto &[version, migration] : extension.getMigrations()) {
            if (version <= current_version)
                continue;
            for (const auto &sql : migration)
                statements.push_back(sql);
            newest = std::max(newest, version);
        }

        for (const auto &sql : statements) {
            if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, nullptr) != SQLITE_OK) {
                spdlog::error("Schema extension statement failed: {}", errmsg(db_));
                return dp::Result<void, dp::Error>::err(schema_error(dp::String(errmsg(db_).c_str())));
            }
        }
        if (newest > current_version && !setSchemaVersion(newest))
            return dp::Result<void, dp::Error>::err(schema_error(dp::String(errmsg(db_).c_str())));

        auto committed = tx.commit();
        if (committed.is_err())
            return dp::Result<void, dp::Error>::err(schema_error(committed.error().message));
        return dp::Result<void, dp::Error>::ok();
    }

    bool IndexStore::tableExists(const std::string &table_name) {
        Statement stmt(db_, "SELECT name FROM sqlite_master WHERE type='table' AND name=?");
        if (!stmt.ok())
            return false;
        stmt.bind(1, table_name);
        return stmt.step() == SQLITE_ROW;
    }

    int32_t IndexStore::getCurrentSchemaVersion() {
        if (!tableExists("schema_migrations"))
            return 0;
        Statement stmt(db_, "SELECT MAX(version) FROM schema_migrations");
        if (!stmt.ok() || stmt.step() != SQLITE_ROW)
            return 0;
        return static_cast<int32_t>(stmt.columnInt(0));
    }

    bool IndexStore::setSchemaVersion(int32_t version) {
        Statement stmt(db_, "INSERT OR REPLACE INTO schema_migrations (version, applied_at) VALUES (?, ?)");
        if (!stmt.ok())
            return false;
        stmt.bind(1, static_cast<int64_t>(version)).bind(2, currentTimestamp());
        return stmt.step() == SQLITE_DONE;
    }

    // ===========================================
    // Commit
    // ===========================================

    dp::Result<model::SyncCursor, dp::Error> IndexStore::commit(const indexer::MutationSet &set) {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (!db_ || !is_open_)
            return dp::Result<model::SyncCursor, dp::Error>::err(store_not_open());

        WriteTxGuard tx(db_);
        if (!tx.active())
            return dp::Result<model::SyncCursor, dp::Error>::err(writeError(db_, "BEGIN failed"));

        auto stored = readCursorOn(db_);
        if (stored.is_err())
            return dp::Result<model::SyncCursor, dp::Error>::err(storage_commit(stored.error().message));

        auto expected = set.expectedCursor();
        if (stored.value() != expected) {
            std::string msg = "stored cursor " + stored.value().toString() + ", block " +
                              std::to_string(set.height) + " expects " + expected.toString();
            return dp::Result<model::SyncCursor, dp::Error>::err(cursor_mismatch(dp::String(msg.c_str())));
        }

        MutationWriter writer(db_);
        for (const auto &mutation : set.mutations) {
            auto applied = std::visit(writer, mutation);
            if (applied.is_err())
                return dp::Result<model::SyncCursor, dp::Error>::err(applied.error());
        }

        auto resulting = set.resultingCursor();
        auto cursor_written = writeCursor(db_, resulting);
        if (cursor_written.is_err())
            return dp::Result<model::SyncCursor, dp::Error>::err(cursor_written.error());

        auto committed = tx.commit();
        if (committed.is_err())
            return dp::Result<model::SyncCursor, dp::Error>::err(committed.error());
        return dp::Result<model::SyncCursor, dp::Error>::ok(resulting);
    }

    dp::Result<void, dp::Error> IndexStore::executeSql(const std::string &sql) {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(store_not_open());

        char *err = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
        if (rc != SQLITE_OK) {
            std::string msg = err ? err : errmsg(db_);
            if (err)
                sqlite3_free(err);
            return dp::Result<void, dp::Error>::err(dp::Error::io_error(dp::String(msg.c_str())));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Readers
    // ===========================================

    std::shared_ptr<ReaderPool> IndexStore::readerPool() const {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        return readers_;
    }

    dp::Result<std::shared_ptr<Snapshot>, dp::Error> IndexStore::snapshot() const {
        auto pool = readerPool();
        if (!pool)
            return dp::Result<std::shared_ptr<Snapshot>, dp::Error>::err(store_not_open());
        auto reader = pool->acquire();
        if (reader.is_err())
            return dp::Result<std::shared_ptr<Snapshot>, dp::Error>::err(reader.error());

        auto snap = std::make_shared<Snapshot>(Snapshot::Token(), pool, reader.value());
        if (!snap->active_)
            return dp::Result<std::shared_ptr<Snapshot>, dp::Error>::err(
                readError(reader.value(), "begin read snapshot"));
        return dp::Result<std::shared_ptr<Snapshot>, dp::Error>::ok(std::move(snap));
    }

    namespace {

        template <typename T, typename Fn> dp::Result<T, dp::Error> withSnapshot(const IndexStore &store, Fn &&fn) {
            auto snap = store.snapshot();
            if (snap.is_err())
                return dp::Result<T, dp::Error>::err(snap.error());
            return fn(*snap.value());
        }

    } // namespace

    dp::Result<model::SyncCursor, dp::Error> IndexStore::readCursor() const {
        return withSnapshot<model::SyncCursor>(*this, [](const Snapshot &s) { return s.readCursor(); });
    }

    dp::Result<model::Block, dp::Error> IndexStore::getBlock(dp::i64 height) const {
        return withSnapshot<model::Block>(*this, [height](const Snapshot &s) { return s.getBlock(height); });
    }

    dp::Result<model::Block, dp::Error> IndexStore::getBlockByHash(const std::string &hash) const {
        return withSnapshot<model::Block>(*this, [&hash](const Snapshot &s) { return s.getBlockByHash(hash); });
    }

    dp::Result<model::IndexedTransaction, dp::Error> IndexStore::getTransaction(const std::string &tx_id) const {
        return withSnapshot<model::IndexedTransaction>(*this,
                                                       [&tx_id](const Snapshot &s) { return s.getTransaction(tx_id); });
    }

    dp::Result<model::AddressAggregate, dp::Error> IndexStore::getAddressAggregate(const std::string &address) const {
        return withSnapshot<model::AddressAggregate>(
            *this, [&address](const Snapshot &s) { return s.getAddressAggregate(address); });
    }

    dp::Result<bool, dp::Error> IndexStore::verifyLinkage() const {
        return withSnapshot<bool>(*this, [](const Snapshot &s) { return s.verifyLinkage(); });
    }

    dp::Result<bool, dp::Error> IndexStore::verifyAggregates() const {
        return withSnapshot<bool>(*this, [](const Snapshot &s) { return s.verifyAggregates(); });
    }

    dp::Result<std::string, dp::Error> IndexStore::stateFingerprint() const {
        return withSnapshot<std::string>(*this, [](const Snapshot &s) { return s.stateFingerprint(); });
    }

    dp::Result<bool, dp::Error> IndexStore::quickCheck() const {
        auto pool = readerPool();
        if (!pool)
            return dp::Result<bool, dp::Error>::err(store_not_open());
        auto reader = pool->acquire();
        if (reader.is_err())
            return dp::Result<bool, dp::Error>::err(reader.error());

        bool ok = false;
        {
            Statement stmt(reader.value(), "PRAGMA quick_check");
            if (stmt.ok() && stmt.step() == SQLITE_ROW)
                ok = (stmt.columnText(0) == "ok");
        }
        pool->release(reader.value());
        return dp::Result<bool, dp::Error>::ok(ok);
    }

} // namespace blockindex::storage
