#ifndef SHARD_ROUTER_H
#define SHARD_ROUTER_H

#include <map>
#include <vector>
#include "ByteArray.h"
#include "ClusterTopology.h"

// Owning shard -> the distinct keys it serves, in caller order.
using ShardKeyMap = std::map<ShardAddress, std::vector<ByteArray>>;

class ShardRouter {
   private:
    const TopologyOracle& topology_;

   public:
    explicit ShardRouter(const TopologyOracle& topology);

    ShardAddress owner(const ByteArray& key) const;

    // Resolves every key before returning, so a RoutingError leaves no
    // partial map behind.
    ShardKeyMap route(const std::vector<ByteArray>& keys) const;
};

#endif
