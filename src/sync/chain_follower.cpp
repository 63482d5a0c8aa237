#include <blockindex/common/error.hpp>
#include <blockindex/sync/chain_follower.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace blockindex::sync {

    namespace {

        /// Store reads report generic datapod errors; the follower treats them as
        /// storage trouble unless they already carry a project code.
        dp::Error asStorageError(const dp::Error &err) {
            if (is_transient(err) || is_fatal(err) || err.code == ERR_CURSOR_MISMATCH)
                return err;
            if (is_not_found(err) || err.code == ERR_DESERIALIZATION_FAILED)
                return data_integrity(err.message);
            return storage_commit(err.message);
        }

    } // namespace

    const char *toString(SyncState state) {
        switch (state) {
        case SyncState::Idle:
            return "idle";
        case SyncState::Syncing:
            return "syncing";
        case SyncState::Degraded:
            return "degraded";
        case SyncState::Halted:
            return "halted";
        case SyncState::Stopped:
            return "stopped";
        }
        return "unknown";
    }

    ChainFollower::ChainFollower(storage::IndexStore &store, NodeClient node, FollowerConfig config)
        : store_(store), node_(std::move(node)), config_(config) {}

    ChainFollower::~ChainFollower() { stop(); }

    // ===========================================
    // Step
    // ===========================================

    dp::Result<StepReport, dp::Error> ChainFollower::advance() {
        std::unique_lock<std::mutex> guard(step_mutex_, std::try_to_lock);
        if (!guard.owns_lock()) {
            StepReport report;
            report.skipped = true;
            return dp::Result<StepReport, dp::Error>::ok(report);
        }

        {
            std::lock_guard<std::mutex> lock(status_mutex_);
            if (halt_error_)
                return dp::Result<StepReport, dp::Error>::err(*halt_error_);
            status_.state = SyncState::Syncing;
        }

        StepReport report;
        auto result = step(report);
        if (result.is_err()) {
            recordFailure(result.error());
            return dp::Result<StepReport, dp::Error>::err(result.error());
        }
        recordSuccess(report);
        return dp::Result<StepReport, dp::Error>::ok(report);
    }

    dp::Result<void, dp::Error> ChainFollower::step(StepReport &report) {
        if (!node_.valid())
            return dp::Result<void, dp::Error>::err(dp::Error::invalid_argument("Node client is incomplete"));

        auto stored = store_.readCursor();
        if (stored.is_err())
            return dp::Result<void, dp::Error>::err(asStorageError(stored.error()));
        model::SyncCursor cursor = stored.value();
        report.cursor = cursor;

        auto best = node_.get_best_block(timeout());
        if (best.is_err())
            return dp::Result<void, dp::Error>::err(best.error());
        model::ChainTip tip = best.value();
        {
            std::lock_guard<std::mutex> lock(status_mutex_);
            status_.node_tip = tip;
            status_.cursor = cursor;
        }

        if (cursor.matches(tip))
            return dp::Result<void, dp::Error>::ok();

        dp::i64 ancestor = cursor.height;
        if (!cursor.empty()) {
            bool extension = false;
            auto found = findCommonAncestor(cursor, tip, extension);
            if (found.is_err())
                return dp::Result<void, dp::Error>::err(found.error());
            ancestor = found.value();

            if (!extension) {
                report.reorg_depth = cursor.height - ancestor;
                spdlog::info("Reorg detected at height {}: rolling back {} block(s) to ancestor {}", cursor.height,
                             report.reorg_depth, ancestor);
                auto rolled = rollback(cursor, ancestor, report);
                if (rolled.is_err())
                    return rolled;
                if (report.interrupted)
                    return dp::Result<void, dp::Error>::ok();
            }
        }

        return replay(cursor, tip.height, report);
    }

    dp::Result<dp::i64, dp::Error> ChainFollower::findCommonAncestor(const model::SyncCursor &cursor,
                                                                     const model::ChainTip &tip, bool &extension) {
        auto snap = store_.snapshot();
        if (snap.is_err())
            return dp::Result<dp::i64, dp::Error>::err(asStorageError(snap.error()));

        dp::i64 limit = allow_deep_reorg_ ? 0 : config_.max_reorg_depth;
        for (dp::i64 h = cursor.height; h >= 0; --h) {
            if (limit > 0 && cursor.height - h > limit) {
                std::string msg = "no common ancestor within " + std::to_string(limit) + " blocks of height " +
                                  std::to_string(cursor.height);
                return dp::Result<dp::i64, dp::Error>::err(reorg_too_deep(dp::String(msg.c_str())));
            }

            if (h > tip.height)
                continue;

            auto node_block = node_.get_block_by_height(h, timeout());
            if (node_block.is_err()) {
                if (is_not_found(node_block.error()))
                    continue;
                return dp::Result<dp::i64, dp::Error>::err(node_block.error());
            }

            std::string stored_hash = model::str(cursor.hash);
            if (h != cursor.height) {
                auto summary = snap.value()->getBlockSummary(h);
                if (summary.is_err())
                    return dp::Result<dp::i64, dp::Error>::err(asStorageError(summary.error()));
                stored_hash = model::str(summary.value().hash);
            }

            if (model::str(node_block.value().hash) == stored_hash) {
                extension = (h == cursor.height);
                return dp::Result<dp::i64, dp::Error>::ok(h);
            }
        }

        if (limit > 0 && cursor.height + 1 > limit) {
            std::string msg = "chain diverges below genesis, " + std::to_string(cursor.height + 1) +
                              " blocks exceed the limit of " + std::to_string(limit);
            return dp::Result<dp::i64, dp::Error>::err(reorg_too_deep(dp::String(msg.c_str())));
        }
        return dp::Result<dp::i64, dp::Error>::ok(-1);
    }

    dp::Result<void, dp::Error> ChainFollower::rollback(model::SyncCursor &cursor, dp::i64 ancestor,
                                                        StepReport &report) {
        while (cursor.height > ancestor) {
            if (stop_requested_) {
                report.interrupted = true;
                return dp::Result<void, dp::Error>::ok();
            }

            auto block = store_.getBlock(cursor.height);
            if (block.is_err())
                return dp::Result<void, dp::Error>::err(asStorageError(block.error()));

            auto set = indexer_.revert(block.value());
            if (set.is_err())
                return dp::Result<void, dp::Error>::err(set.error());

            auto committed = store_.commit(set.value());
            if (committed.is_err()) {
                if (committed.error().code == ERR_CURSOR_MISMATCH) {
                    report.interrupted = true;
                    return dp::Result<void, dp::Error>::ok();
                }
                return dp::Result<void, dp::Error>::err(committed.error());
            }

            spdlog::debug("Reverted block {} ({})", cursor.height, model::str(cursor.hash));
            cursor = committed.value();
            report.cursor = cursor;
            report.reverted++;
            recordProgress(cursor, false);
        }
        allow_deep_reorg_ = false;
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> ChainFollower::replay(model::SyncCursor &cursor, dp::i64 target, StepReport &report) {
        while (cursor.height < target) {
            dp::i64 height = cursor.height + 1;
            bool switched = false;
            auto block = fetchLinkedBlock(cursor, switched);
            if (block.is_err()) {
                if (is_not_found(block.error())) {
                    spdlog::info("Block {} disappeared from the node, re-planning", height);
                    report.interrupted = true;
                    return dp::Result<void, dp::Error>::ok();
                }
                return dp::Result<void, dp::Error>::err(block.error());
            }

            if (switched) {
                spdlog::info("Node switched best chain at height {}, re-planning", height);
                report.interrupted = true;
                return dp::Result<void, dp::Error>::ok();
            }

            if (stop_requested_) {
                report.interrupted = true;
                return dp::Result<void, dp::Error>::ok();
            }

            auto set = indexer_.apply(block.value());
            if (set.is_err())
                return dp::Result<void, dp::Error>::err(set.error());

            auto committed = store_.commit(set.value());
            if (committed.is_err()) {
                if (committed.error().code == ERR_CURSOR_MISMATCH) {
                    report.interrupted = true;
                    return dp::Result<void, dp::Error>::ok();
                }
                return dp::Result<void, dp::Error>::err(committed.error());
            }

            cursor = committed.value();
            report.cursor = cursor;
            report.applied++;
            spdlog::debug("Applied block {} ({}, {} tx)", height, model::str(cursor.hash),
                          block.value().transactions.size());
            recordProgress(cursor, true);
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<model::Block, dp::Error> ChainFollower::fetchBlock(dp::i64 height) {
        dp::i32 attempts = 1 + std::max<dp::i32>(config_.integrity_refetch_attempts, 0);
        dp::Error last = data_integrity();
        for (dp::i32 attempt = 0; attempt < attempts; ++attempt) {
            auto block = node_.get_block_by_height(height, timeout());
            if (block.is_err())
                return block;

            if (block.value().height != height) {
                std::string msg = "node returned height " + std::to_string(block.value().height) + " for " +
                                  std::to_string(height);
                last = data_integrity(dp::String(msg.c_str()));
            } else {
                auto valid = indexer::Indexer::validate(block.value());
                if (valid.is_ok())
                    return block;
                last = valid.error();
            }
            spdlog::warn("Malformed block at height {} (attempt {}/{}): {}", height, attempt + 1, attempts,
                         message_of(last));
        }
        return dp::Result<model::Block, dp::Error>::err(last);
    }

    dp::Result<model::Block, dp::Error> ChainFollower::fetchLinkedBlock(const model::SyncCursor &cursor,
                                                                        bool &switched) {
        dp::i64 height = cursor.height + 1;
        dp::i32 attempts = 1 + std::max<dp::i32>(config_.integrity_refetch_attempts, 0);
        dp::Error last = data_integrity();
        for (dp::i32 attempt = 0; attempt < attempts; ++attempt) {
            auto block = fetchBlock(height);
            if (block.is_err() || cursor.empty() || model::same(block.value().parent_hash, cursor.hash))
                return block;

            // A parent mismatch is a chain switch only if the node no longer serves
            // the cursor block below it
            auto below = node_.get_block_by_height(cursor.height, timeout());
            if (below.is_err()) {
                if (!is_not_found(below.error()))
                    return dp::Result<model::Block, dp::Error>::err(below.error());
                switched = true;
                return block;
            }
            if (!model::same(below.value().hash, cursor.hash)) {
                switched = true;
                return block;
            }

            std::string msg = "block " + std::to_string(height) + " names parent " +
                              model::str(block.value().parent_hash) + " but the node serves " +
                              model::str(cursor.hash) + " at height " + std::to_string(cursor.height);
            last = data_integrity(dp::String(msg.c_str()));
            spdlog::warn("Unlinked block at height {} (attempt {}/{}): {}", height, attempt + 1, attempts, msg);
        }
        return dp::Result<model::Block, dp::Error>::err(last);
    }

    // ===========================================
    // Status bookkeeping
    // ===========================================

    void ChainFollower::setState(SyncState state) {
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_.state = state;
    }

    void ChainFollower::recordProgress(const model::SyncCursor &cursor, bool applied) {
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_.cursor = cursor;
        if (applied)
            status_.blocks_applied++;
        else
            status_.blocks_reverted++;
    }

    void ChainFollower::recordSuccess(const StepReport &report) {
        std::lock_guard<std::mutex> lock(status_mutex_);
        if (status_.consecutive_failures > 0)
            spdlog::info("Sync recovered after {} failure(s)", status_.consecutive_failures);
        status_.state = SyncState::Idle;
        status_.cursor = report.cursor;
        status_.consecutive_failures = 0;
        status_.last_error.clear();

        // An interrupted step without progress would otherwise be retried at once
        if (report.interrupted && report.applied == 0 && report.reverted == 0 && !stop_requested_) {
            status_.stalled_steps++;
            dp::i64 initial = std::max<dp::i64>(config_.initial_backoff_ms, 1);
            if (status_.backoff_ms == 0)
                status_.backoff_ms = initial;
            else
                status_.backoff_ms = std::max(initial, std::min(status_.backoff_ms * 2, config_.max_backoff_ms));
            spdlog::warn("Sync made no progress in {} step(s), retry in {} ms", status_.stalled_steps,
                         status_.backoff_ms);
            return;
        }
        status_.stalled_steps = 0;
        status_.backoff_ms = 0;
    }

    void ChainFollower::recordFailure(const dp::Error &err) {
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_.last_error = message_of(err);

        if (is_fatal(err)) {
            halt_error_ = err;
            status_.state = SyncState::Halted;
            spdlog::error("Sync halted at cursor {}: {}", status_.cursor.toString(), status_.last_error);
            return;
        }

        status_.consecutive_failures++;
        if (status_.backoff_ms == 0)
            status_.backoff_ms = config_.initial_backoff_ms;
        else
            status_.backoff_ms = std::min(status_.backoff_ms * 2, config_.max_backoff_ms);
        status_.state = SyncState::Degraded;
        spdlog::warn("Sync degraded ({} consecutive failure(s), retry in {} ms): {}", status_.consecutive_failures,
                     status_.backoff_ms, status_.last_error);
    }

    SyncStatus ChainFollower::status() const {
        std::lock_guard<std::mutex> lock(status_mutex_);
        return status_;
    }

    void ChainFollower::resume(bool allow_deep_reorg) {
        {
            std::lock_guard<std::mutex> lock(status_mutex_);
            if (!halt_error_)
                return;
            halt_error_.reset();
            status_.state = SyncState::Idle;
            status_.last_error.clear();
        }
        allow_deep_reorg_ = allow_deep_reorg;
        spdlog::info("Sync resumed{}", allow_deep_reorg ? " without reorg depth limit" : "");
        notifyNewTip();
    }

    // ===========================================
    // Background loop
    // ===========================================

    std::chrono::milliseconds ChainFollower::nextWait() const {
        std::lock_guard<std::mutex> lock(status_mutex_);
        switch (status_.state) {
        case SyncState::Degraded:
            return std::chrono::milliseconds(status_.backoff_ms);
        case SyncState::Idle:
            if (!status_.caughtUp())
                return std::chrono::milliseconds(status_.backoff_ms);
            return std::chrono::milliseconds(config_.poll_interval_ms);
        default:
            return std::chrono::milliseconds(config_.poll_interval_ms);
        }
    }

    void ChainFollower::run() {
        while (!stop_requested_) {
            auto result = advance();
            if (result.is_ok() && result.value().skipped)
                spdlog::debug("Sync step skipped, another step is running");

            auto wait = nextWait();
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_cv_.wait_for(lock, wait, [this] { return stop_requested_.load() || wake_pending_; });
            wake_pending_ = false;
        }
        setState(SyncState::Stopped);
    }

    void ChainFollower::start() {
        if (thread_.joinable())
            return;
        stop_requested_ = false;
        thread_ = std::thread([this] { run(); });
    }

    void ChainFollower::requestStop() {
        stop_requested_ = true;
        std::lock_guard<std::mutex> lock(wake_mutex_);
        wake_cv_.notify_all();
    }

    void ChainFollower::stop() {
        requestStop();
        if (thread_.joinable())
            thread_.join();
        std::lock_guard<std::mutex> guard(step_mutex_);
        stop_requested_ = false;
    }

    bool ChainFollower::running() const { return thread_.joinable() && !stop_requested_; }

    void ChainFollower::notifyNewTip() {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        wake_pending_ = true;
        wake_cv_.notify_all();
    }

} // namespace blockindex::sync
