#pragma once

#include <datapod/datapod.hpp>

#include "blockindex/model/types.hpp"
#include "mutation.hpp"

namespace blockindex::indexer {

    /// Pure transformation from a block to the storage mutations that add it to
    /// the index (apply) or remove it (revert). Holds no state; revert(b) undoes
    /// apply(b) exactly on any starting state.
    class Indexer {
      public:
        Indexer() = default;

        dp::Result<MutationSet, dp::Error> apply(const model::Block &block) const;
        dp::Result<MutationSet, dp::Error> revert(const model::Block &block) const;

        /// Structural checks; failures are data-integrity errors
        static dp::Result<void, dp::Error> validate(const model::Block &block);

        /// Per-address deltas for the whole block, ordered by address
        static dp::Result<std::vector<AdjustAggregate>, dp::Error> aggregateDeltas(const model::Block &block);
    };

} // namespace blockindex::indexer
