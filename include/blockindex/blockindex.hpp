#pragma once

// Chain indexer: node client, indexer, store, follower and queries

#include "blockindex/block_index.hpp"
#include "blockindex/common/error.hpp"
#include "blockindex/common/hash.hpp"
#include "blockindex/indexer/indexer.hpp"
#include "blockindex/model/builder.hpp"
#include "blockindex/model/types.hpp"
#include "blockindex/query/query_service.hpp"
#include "blockindex/storage/index_store.hpp"
#include "blockindex/sync/chain_follower.hpp"
#include "blockindex/sync/memory_node.hpp"
#include "blockindex/sync/node_client.hpp"
