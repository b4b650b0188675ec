#include "LocalCluster.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "Errors.h"
#include "SlotHash.h"

namespace fs = std::filesystem;
using namespace std;

LocalCluster::LocalCluster(ClusterTopology topology, const fs::path& data_dir)
    : topology_(std::move(topology)) {
    for (const auto& cluster_node : topology_.nodes()) {
        if (!cluster_node.master) continue;

        fs::path node_path;
        if (!data_dir.empty()) {
            node_path = data_dir / (cluster_node.address.host + "_" +
                                    to_string(cluster_node.address.port) +
                                    ".csv");
        }
        nodes_[cluster_node.address] =
            make_shared<Node>(cluster_node.address, node_path);
    }
}

const ClusterTopology& LocalCluster::topology() const {
    return topology_;
}

shared_ptr<Node> LocalCluster::node(const ShardAddress& address) const {
    auto it = nodes_.find(address);
    return it == nodes_.end() ? nullptr : it->second;
}

vector<shared_ptr<Node>> LocalCluster::nodes() const {
    vector<shared_ptr<Node>> all;
    all.reserve(nodes_.size());
    for (const auto& [address, shard] : nodes_) {
        all.push_back(shard);
    }
    return all;
}

bool LocalCluster::setNodeDown(const ShardAddress& address, bool down) {
    auto target = node(address);
    if (!target) {
        return false;
    }
    target->setDown(down);
    return true;
}

shared_ptr<Node> LocalCluster::nodeFor(const ByteArray& key) const {
    ShardAddress address = topology_.resolve(key);
    auto owner = node(address);
    if (!owner) {
        throw RoutingError("Topology names " + address.toString() +
                           " but no such node is running");
    }
    return owner;
}

shared_ptr<Node> LocalCluster::slotOwner(const vector<ByteArray>& keys) const {
    if (!SlotHash::isSameSlotForAllKeys(keys)) {
        throw ClusterError(
            "CROSSSLOT Keys in request don't hash to the same slot");
    }
    return nodeFor(keys.front());
}

ByteArraySet LocalCluster::runSetOperation(SetOperation op,
                                           const vector<ByteArray>& keys) {
    return slotOwner(keys)->compute(op, keys);
}

size_t LocalCluster::runStoreOperation(SetOperation op, const ByteArray& dest,
                                       const vector<ByteArray>& keys) {
    vector<ByteArray> all_keys(keys);
    all_keys.push_back(dest);
    return slotOwner(all_keys)->store(op, dest, keys);
}

bool LocalCluster::move(const ByteArray& source, const ByteArray& dest,
                        const ByteArray& member) {
    return slotOwner({source, dest})->move(source, dest, member);
}

size_t LocalCluster::addMembers(const ByteArray& key,
                                const vector<ByteArray>& members) {
    return nodeFor(key)->add(key, members);
}

size_t LocalCluster::removeMembers(const ByteArray& key,
                                   const vector<ByteArray>& members) {
    return nodeFor(key)->remove(key, members);
}

bool LocalCluster::isMember(const ByteArray& key, const ByteArray& member) {
    return nodeFor(key)->isMember(key, member);
}

bool LocalCluster::exists(const ByteArray& key) {
    return nodeFor(key)->exists(key);
}

PendingFetch LocalCluster::fetchMembers(const ShardAddress& shard,
                                        const ByteArray& key) {
    auto target = node(shard);
    if (!target) {
        throw FetchError("No node at " + shard.toString());
    }

    auto cancelled = make_shared<atomic<bool>>(false);

    auto result = async(launch::async, [target, key, cancelled]() {
        auto deadline = chrono::steady_clock::now() + target->latency();
        while (!*cancelled && chrono::steady_clock::now() < deadline) {
            this_thread::sleep_for(chrono::milliseconds(1));
        }
        if (*cancelled) {
            throw FetchError("Read of '" + key.describe() + "' was cancelled");
        }
        return target->members(key);
    });

    return PendingFetch(key, shard, std::move(result),
                        [cancelled]() { *cancelled = true; });
}

ByteArraySet LocalCluster::members(const ByteArray& key) const {
    return nodeFor(key)->members(key);
}

size_t LocalCluster::card(const ByteArray& key) const {
    return nodeFor(key)->card(key);
}

bool LocalCluster::del(const ByteArray& key) {
    return nodeFor(key)->del(key);
}

size_t LocalCluster::load() {
    size_t loaded = 0;
    for (const auto& [address, shard] : nodes_) {
        if (shard->load()) loaded++;
    }
    return loaded;
}

bool LocalCluster::flush() const {
    bool ok = true;
    for (const auto& [address, shard] : nodes_) {
        if (!shard->flush()) ok = false;
    }
    return ok;
}
