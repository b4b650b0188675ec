#ifndef NODE_H
#define NODE_H

#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "ByteArray.h"
#include "ClusterTopology.h"
#include "SetCommands.h"

namespace fs = std::filesystem;

// One shard of the cluster: key -> set of members, held in memory and
// optionally mirrored to a file. Empty sets are removed, as a set-typed
// key ceases to exist once its last member is gone.
//
// Every call on a node marked down throws FetchError.
class Node {
   private:
    ShardAddress address_;
    fs::path path_;
    std::unordered_map<ByteArray, ByteArraySet> sets_;
    mutable std::mutex mutex_;
    std::atomic<bool> down_;
    std::atomic<long> latency_ms_;

    void checkReachable() const;
    ByteArraySet membersLocked(const ByteArray& key) const;

   public:
    explicit Node(ShardAddress address, fs::path file_path = {});

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    const ShardAddress& address() const;
    std::string path() const;

    ByteArraySet members(const ByteArray& key) const;
    size_t card(const ByteArray& key) const;
    bool exists(const ByteArray& key) const;
    bool isMember(const ByteArray& key, const ByteArray& member) const;
    size_t keyCount() const;

    size_t add(const ByteArray& key, const std::vector<ByteArray>& members);
    size_t remove(const ByteArray& key, const std::vector<ByteArray>& members);
    bool del(const ByteArray& key);

    ByteArraySet compute(SetOperation op,
                         const std::vector<ByteArray>& keys) const;
    // Replaces dest with the result; an empty result deletes dest.
    size_t store(SetOperation op, const ByteArray& dest,
                 const std::vector<ByteArray>& keys);
    bool move(const ByteArray& source, const ByteArray& dest,
              const ByteArray& member);

    void setDown(bool down);
    bool isDown() const;
    void setLatency(std::chrono::milliseconds latency);
    std::chrono::milliseconds latency() const;

    // Lines of hex(key),hex(member). Returns false when the file cannot
    // be read; malformed lines are reported and skipped.
    bool load();
    bool flush() const;
};

#endif
