#ifndef CLUSTER_SET_COMMANDS_H
#define CLUSTER_SET_COMMANDS_H

#include <chrono>
#include <stop_token>
#include <vector>
#include "ByteArray.h"
#include "ClusterTopology.h"
#include "ScatterExecutor.h"
#include "SetCommands.h"
#include "ShardRouter.h"

// Multi-key set commands over a hash-sharded cluster. Keys sharing a slot
// go to the owning shard as one native command; otherwise every key is
// read from its own shard in parallel and the algebra is applied here.
//
// All operations take at least one key and throw std::invalid_argument
// otherwise. Failures surface as RoutingError, FetchError,
// InterruptedError or WriteError, after outstanding reads are cancelled.
class ClusterSetCommands {
   private:
    ShardCommandExecutor& executor_;
    ShardRouter router_;
    ScatterExecutor scatter_;

    size_t storeAcrossShards(SetOperation op, const ByteArray& dest,
                             const std::vector<ByteArray>& keys,
                             std::stop_token stop);
    size_t store(SetOperation op, const ByteArray& dest,
                 const std::vector<ByteArray>& keys, std::stop_token stop);
    ByteArraySet compute(SetOperation op, const std::vector<ByteArray>& keys,
                         std::stop_token stop);

   public:
    ClusterSetCommands(
        const TopologyOracle& topology, ShardCommandExecutor& executor,
        MemberFetcher& fetcher,
        std::chrono::milliseconds poll_interval = std::chrono::milliseconds(5));

    ByteArraySet sInter(const std::vector<ByteArray>& keys,
                        std::stop_token stop = {});
    ByteArraySet sUnion(const std::vector<ByteArray>& keys,
                        std::stop_token stop = {});
    // keys[0] is the base; the rest are subtracted from it in order.
    ByteArraySet sDiff(const std::vector<ByteArray>& keys,
                       std::stop_token stop = {});

    // Across shards the result is added to dest with a single write and
    // the number of newly added members is returned. An empty result
    // writes nothing and returns 0.
    size_t sInterStore(const ByteArray& dest,
                       const std::vector<ByteArray>& keys,
                       std::stop_token stop = {});
    size_t sUnionStore(const ByteArray& dest,
                       const std::vector<ByteArray>& keys,
                       std::stop_token stop = {});
    size_t sDiffStore(const ByteArray& dest, const std::vector<ByteArray>& keys,
                      std::stop_token stop = {});

    // NOT ATOMIC when source and dest live on different shards: the member
    // is removed from source and then added to dest as two separate
    // writes, so a failure in between loses it. Same-slot moves use the
    // shard's atomic SMOVE.
    bool sMove(const ByteArray& source, const ByteArray& dest,
               const ByteArray& member);

    // Scatter/gather path regardless of key placement.
    ByteArraySet computeAcrossShards(SetOperation op,
                                     const std::vector<ByteArray>& keys,
                                     std::stop_token stop = {});
};

#endif
