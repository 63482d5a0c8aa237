#pragma once

#include <datapod/datapod.hpp>
#include <memory>
#include <string>

#include "blockindex/common/error.hpp"
#include "blockindex/query/query_service.hpp"
#include "blockindex/storage/index_store.hpp"
#include "blockindex/sync/chain_follower.hpp"
#include "blockindex/sync/node_client.hpp"

namespace blockindex {

    // ===========================================
    // BlockIndex - store, follower and queries together
    // ===========================================

    /// Owns the index database, the follower that writes it and the query
    /// service that reads it. The recommended entry point for embedding.
    class BlockIndex {
      public:
        BlockIndex() = default;
        ~BlockIndex() { close(); }

        BlockIndex(const BlockIndex &) = delete;
        BlockIndex &operator=(const BlockIndex &) = delete;

        /// Open (or create) the database and bind it to a node
        /// @param db_path Path to the SQLite file
        /// @param node Node capability the follower reads from
        /// @param config Follower tuning
        /// @param opts Storage options
        inline dp::Result<void, dp::Error> initialize(const std::string &db_path, sync::NodeClient node,
                                                      const sync::FollowerConfig &config = sync::FollowerConfig{},
                                                      const storage::OpenOptions &opts = storage::OpenOptions{}) {
            if (!node.valid())
                return dp::Result<void, dp::Error>::err(dp::Error::invalid_argument("Node client is incomplete"));
            close();

            auto opened = store_.open(db_path, opts);
            if (opened.is_err())
                return opened;
            auto schema = store_.initializeCoreSchema();
            if (schema.is_err()) {
                store_.close();
                return schema;
            }

            follower_ = std::make_unique<sync::ChainFollower>(store_, std::move(node), config);
            query_ = std::make_unique<query::QueryService>(store_);
            return dp::Result<void, dp::Error>::ok();
        }

        inline dp::Result<void, dp::Error> registerSchema(const storage::ISchemaExtension &extension) {
            return store_.registerExtension(extension);
        }

        inline bool isInitialized() const { return follower_ != nullptr && store_.isOpen(); }

        inline void close() {
            if (follower_)
                follower_->stop();
            follower_.reset();
            query_.reset();
            store_.close();
        }

        // ===========================================
        // Sync control
        // ===========================================

        inline dp::Result<sync::StepReport, dp::Error> sync() {
            if (!follower_)
                return dp::Result<sync::StepReport, dp::Error>::err(store_not_open());
            return follower_->advance();
        }

        inline void start() {
            if (follower_)
                follower_->start();
        }

        inline void stop() {
            if (follower_)
                follower_->stop();
        }

        // ===========================================
        // Access
        // ===========================================

        inline sync::ChainFollower &follower() { return *follower_; }
        inline const query::QueryService &query() const { return *query_; }
        inline storage::IndexStore &store() { return store_; }
        inline const storage::IndexStore &store() const { return store_; }

      private:
        storage::IndexStore store_;
        std::unique_ptr<sync::ChainFollower> follower_;
        std::unique_ptr<query::QueryService> query_;
    };

} // namespace blockindex
