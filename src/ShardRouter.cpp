#include "ShardRouter.h"
#include <unordered_set>
#include <vector>

using namespace std;

ShardRouter::ShardRouter(const TopologyOracle& topology)
    : topology_(topology) {}

ShardAddress ShardRouter::owner(const ByteArray& key) const {
    return topology_.resolve(key);
}

ShardKeyMap ShardRouter::route(const vector<ByteArray>& keys) const {
    ShardKeyMap routes;
    unordered_set<ByteArray> seen;

    for (const auto& key : keys) {
        if (!seen.insert(key).second) continue;

        routes[owner(key)].push_back(key);
    }

    return routes;
}
