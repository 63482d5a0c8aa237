#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <datapod/datapod.hpp>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <tuple>

#include "blockindex/indexer/indexer.hpp"
#include "blockindex/model/types.hpp"
#include "blockindex/storage/index_store.hpp"
#include "node_client.hpp"

namespace blockindex::sync {

    // ===========================================
    // Configuration
    // ===========================================

    struct FollowerConfig {
        /// Wait between steps when the index has caught up
        dp::i64 poll_interval_ms = 1000;
        /// Passed to every NodeClient call
        dp::i64 node_timeout_ms = 5000;
        dp::i64 initial_backoff_ms = 100;
        dp::i64 max_backoff_ms = 30000;
        /// Deepest rollback performed without operator action, 0 = unbounded
        dp::i64 max_reorg_depth = 100;
        /// Extra fetches of a block that fails validation before halting
        dp::i32 integrity_refetch_attempts = 2;

        auto members() {
            return std::tie(poll_interval_ms, node_timeout_ms, initial_backoff_ms, max_backoff_ms, max_reorg_depth,
                            integrity_refetch_attempts);
        }
        auto members() const {
            return std::tie(poll_interval_ms, node_timeout_ms, initial_backoff_ms, max_backoff_ms, max_reorg_depth,
                            integrity_refetch_attempts);
        }
    };

    enum class SyncState {
        Idle = 0,     ///< last step succeeded
        Syncing = 1,  ///< a step is running
        Degraded = 2, ///< transient failures, retrying with backoff
        Halted = 3,   ///< fatal error, waiting for resume()
        Stopped = 4,  ///< background loop ended
    };

    const char *toString(SyncState state);

    struct SyncStatus {
        SyncState state = SyncState::Idle;
        model::SyncCursor cursor;
        model::ChainTip node_tip;
        dp::i32 consecutive_failures = 0;
        /// Consecutive interrupted steps that neither applied nor reverted a block
        dp::i32 stalled_steps = 0;
        dp::i64 backoff_ms = 0;
        std::string last_error;
        dp::i64 blocks_applied = 0;
        dp::i64 blocks_reverted = 0;

        inline bool caughtUp() const { return cursor.matches(node_tip); }
    };

    /// Outcome of one advance() call
    struct StepReport {
        /// Another advance() was already running
        bool skipped = false;
        /// Ended early: stop requested or the node changed its best chain mid-step
        bool interrupted = false;
        dp::i64 applied = 0;
        dp::i64 reverted = 0;
        /// Blocks rolled back by a reorg in this step
        dp::i64 reorg_depth = 0;
        model::SyncCursor cursor;
    };

    // ===========================================
    // ChainFollower - keeps the index on the node's best chain
    // ===========================================

    class ChainFollower {
      public:
        ChainFollower(storage::IndexStore &store, NodeClient node, FollowerConfig config = FollowerConfig{});
        ~ChainFollower();

        ChainFollower(const ChainFollower &) = delete;
        ChainFollower &operator=(const ChainFollower &) = delete;

        /// One reconciliation step: extend, or roll back to the common ancestor and
        /// replay. Every block is its own commit; on error the cursor stays at the
        /// last committed block.
        dp::Result<StepReport, dp::Error> advance();

        /// Run advance() on a background thread until stop()
        void start();

        /// Request stop, wait for the background thread and any advance() in
        /// flight, then re-arm manual stepping. A running commit finishes.
        /// Must not be called from inside advance().
        void stop();

        /// Non-blocking: no further block is applied or reverted until stop() or
        /// start() returns
        void requestStop();

        bool running() const;

        /// Wake the background loop before the poll interval elapses
        void notifyNewTip();

        /// Leave the Halted state. With `allow_deep_reorg` the next step ignores
        /// max_reorg_depth.
        void resume(bool allow_deep_reorg = false);

        SyncStatus status() const;

        const FollowerConfig &config() const { return config_; }

      private:
        storage::IndexStore &store_;
        NodeClient node_;
        FollowerConfig config_;
        indexer::Indexer indexer_;

        std::mutex step_mutex_;
        std::atomic<bool> stop_requested_{false};
        std::atomic<bool> allow_deep_reorg_{false};

        mutable std::mutex status_mutex_;
        SyncStatus status_;
        std::optional<dp::Error> halt_error_;

        std::thread thread_;
        std::mutex wake_mutex_;
        std::condition_variable wake_cv_;
        bool wake_pending_ = false;

        std::chrono::milliseconds timeout() const { return std::chrono::milliseconds(config_.node_timeout_ms); }

        void run();
        dp::Result<void, dp::Error> step(StepReport &report);
        dp::Result<dp::i64, dp::Error> findCommonAncestor(const model::SyncCursor &cursor, const model::ChainTip &tip,
                                                          bool &extension);
        dp::Result<void, dp::Error> rollback(model::SyncCursor &cursor, dp::i64 ancestor, StepReport &report);
        dp::Result<void, dp::Error> replay(model::SyncCursor &cursor, dp::i64 target, StepReport &report);
        dp::Result<model::Block, dp::Error> fetchBlock(dp::i64 height);
        dp::Result<model::Block, dp::Error> fetchLinkedBlock(const model::SyncCursor &cursor, bool &switched);

        void setState(SyncState state);
        void recordProgress(const model::SyncCursor &cursor, bool applied);
        void recordSuccess(const StepReport &report);
        void recordFailure(const dp::Error &err);
        std::chrono::milliseconds nextWait() const;
    };

} // namespace blockindex::sync
