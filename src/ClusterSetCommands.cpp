#include "ClusterSetCommands.h"
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>
#include "Errors.h"
#include "SetAggregator.h"
#include "SlotHash.h"

using namespace std;

namespace {

void requireKeys(const vector<ByteArray>& keys) {
    if (keys.empty()) {
        throw invalid_argument("At least one source key is required");
    }
}

}  // namespace

ClusterSetCommands::ClusterSetCommands(const TopologyOracle& topology,
                                       ShardCommandExecutor& executor,
                                       MemberFetcher& fetcher,
                                       chrono::milliseconds poll_interval)
    : executor_(executor),
      router_(topology),
      scatter_(fetcher, poll_interval) {}

ByteArraySet ClusterSetCommands::compute(SetOperation op,
                                         const vector<ByteArray>& keys,
                                         stop_token stop) {
    requireKeys(keys);

    if (SlotHash::isSameSlotForAllKeys(keys)) {
        return executor_.runSetOperation(op, keys);
    }
    return computeAcrossShards(op, keys, stop);
}

ByteArraySet ClusterSetCommands::computeAcrossShards(
    SetOperation op, const vector<ByteArray>& keys, stop_token stop) {
    requireKeys(keys);

    ShardKeyMap routes = router_.route(keys);
    ScatterExecutor::FetchedSets fetched = scatter_.fetchAll(routes, stop);

    // Operands are taken in caller order, not in completion order.
    return SetAggregator::aggregate(
        op, keys.size(), [&](size_t i) -> const ByteArraySet& {
            return fetched.at(keys[i]);
        });
}

ByteArraySet ClusterSetCommands::sInter(const vector<ByteArray>& keys,
                                        stop_token stop) {
    return compute(SetOperation::Intersect, keys, stop);
}

ByteArraySet ClusterSetCommands::sUnion(const vector<ByteArray>& keys,
                                        stop_token stop) {
    return compute(SetOperation::Union, keys, stop);
}

ByteArraySet ClusterSetCommands::sDiff(const vector<ByteArray>& keys,
                                       stop_token stop) {
    return compute(SetOperation::Difference, keys, stop);
}

size_t ClusterSetCommands::store(SetOperation op, const ByteArray& dest,
                                 const vector<ByteArray>& keys,
                                 stop_token stop) {
    requireKeys(keys);

    vector<ByteArray> all_keys;
    all_keys.reserve(keys.size() + 1);
    all_keys.push_back(dest);
    all_keys.insert(all_keys.end(), keys.begin(), keys.end());

    if (SlotHash::isSameSlotForAllKeys(all_keys)) {
        return executor_.runStoreOperation(op, dest, keys);
    }
    return storeAcrossShards(op, dest, keys, stop);
}

size_t ClusterSetCommands::storeAcrossShards(SetOperation op,
                                             const ByteArray& dest,
                                             const vector<ByteArray>& keys,
                                             stop_token stop) {
    // dest is routed with the sources, before any read goes out.
    router_.owner(dest);

    ByteArraySet result = computeAcrossShards(op, keys, stop);
    if (result.empty()) {
        return 0;
    }

    try {
        return executor_.addMembers(dest, result.toVector());
    } catch (const ClusterError&) {
        throw;
    } catch (const exception& e) {
        throw WriteError("Failed to store " + to_string(result.size()) +
                         " members of " + operationName(op) + " into '" +
                         dest.describe() + "': " + e.what());
    }
}

size_t ClusterSetCommands::sInterStore(const ByteArray& dest,
                                       const vector<ByteArray>& keys,
                                       stop_token stop) {
    return store(SetOperation::Intersect, dest, keys, stop);
}

size_t ClusterSetCommands::sUnionStore(const ByteArray& dest,
                                       const vector<ByteArray>& keys,
                                       stop_token stop) {
    return store(SetOperation::Union, dest, keys, stop);
}

size_t ClusterSetCommands::sDiffStore(const ByteArray& dest,
                                      const vector<ByteArray>& keys,
                                      stop_token stop) {
    return store(SetOperation::Difference, dest, keys, stop);
}

bool ClusterSetCommands::sMove(const ByteArray& source, const ByteArray& dest,
                               const ByteArray& member) {
    if (SlotHash::isSameSlotForAllKeys({source, dest})) {
        return executor_.move(source, dest, member);
    }

    if (!executor_.exists(source)) {
        return false;
    }
    if (executor_.removeMembers(source, {member}) == 0) {
        return false;
    }
    if (executor_.isMember(dest, member)) {
        return true;
    }
    return executor_.addMembers(dest, {member}) > 0;
}
