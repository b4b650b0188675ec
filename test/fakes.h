#ifndef TEST_FAKES_H
#define TEST_FAKES_H

#include <chrono>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include "ByteArray.h"
#include "ClusterTopology.h"
#include "Errors.h"
#include "SetAggregator.h"
#include "SetCommands.h"

inline ByteArray bytes(const std::string& text) {
    return ByteArray(text);
}

inline ByteArraySet setOf(std::initializer_list<std::string> members) {
    ByteArraySet result;
    for (const auto& member : members) {
        result.add(ByteArray(member));
    }
    return result;
}

inline std::filesystem::path tempDir(const std::string& prefix) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 999999);

    auto path = std::filesystem::temp_directory_path() /
                (prefix +
                 std::to_string(std::chrono::system_clock::now()
                                    .time_since_epoch()
                                    .count()) +
                 "_" + std::to_string(dis(gen)));
    std::filesystem::create_directories(path);
    return path;
}

// Finds a key of the form "<prefix>:<n>" owned by the given shard.
inline ByteArray keyOnShard(const TopologyOracle& topology,
                            const ShardAddress& shard,
                            const std::string& prefix) {
    for (int i = 0; i < 100000; i++) {
        ByteArray key(prefix + ":" + std::to_string(i));
        if (topology.resolve(key) == shard) return key;
    }
    throw std::runtime_error("no key found for " + shard.toString());
}

class FakeTopology : public TopologyOracle {
   public:
    std::unordered_map<ByteArray, ShardAddress> owners;
    mutable int resolveCalls = 0;

    void place(const ByteArray& key, const ShardAddress& shard) {
        owners[key] = shard;
    }

    ShardAddress resolve(const ByteArray& key) const override {
        resolveCalls++;
        auto it = owners.find(key);
        if (it == owners.end()) {
            throw RoutingError("no shard for " + key.describe());
        }
        return it->second;
    }
};

// Answers reads from a script: a stored set, a failure, or a read that
// never completes. Unknown keys answer with an empty set.
class ScriptedFetcher : public MemberFetcher {
   public:
    std::unordered_map<ByteArray, ByteArraySet> data;
    std::unordered_map<ByteArray, std::string> failures;
    std::unordered_map<ByteArray, bool> hanging;

    std::unordered_map<ByteArray, int> fetchCount;
    std::unordered_map<ByteArray, int> cancelCount;
    std::vector<std::pair<ShardAddress, ByteArray>> issued;

    PendingFetch fetchMembers(const ShardAddress& shard,
                              const ByteArray& key) override {
        fetchCount[key]++;
        issued.emplace_back(shard, key);

        auto promise = std::make_shared<std::promise<ByteArraySet>>();
        promises_.push_back(promise);

        if (failures.count(key)) {
            promise->set_exception(std::make_exception_ptr(
                std::runtime_error(failures[key])));
        } else if (!hanging[key]) {
            auto it = data.find(key);
            promise->set_value(it == data.end() ? ByteArraySet() : it->second);
        }

        return PendingFetch(key, shard, promise->get_future(),
                            [this, key]() { cancelCount[key]++; });
    }

   private:
    std::vector<std::shared_ptr<std::promise<ByteArraySet>>> promises_;
};

// Single-shard executor backed by one map, recording what it was asked.
class RecordingExecutor : public ShardCommandExecutor {
   public:
    std::unordered_map<ByteArray, ByteArraySet> data;
    bool failWrites = false;

    int setOperationCalls = 0;
    int storeOperationCalls = 0;
    int moveCalls = 0;
    std::vector<std::pair<ByteArray, std::vector<ByteArray>>> writes;
    std::vector<std::string> calls;

    ByteArraySet runSetOperation(SetOperation op,
                                 const std::vector<ByteArray>& keys) override {
        setOperationCalls++;
        calls.push_back(operationName(op));
        return SetAggregator::aggregate(op, operands(keys));
    }

    size_t runStoreOperation(SetOperation op, const ByteArray& dest,
                             const std::vector<ByteArray>& keys) override {
        storeOperationCalls++;
        calls.push_back(operationName(op) + "STORE");
        ByteArraySet result = SetAggregator::aggregate(op, operands(keys));
        size_t stored = result.size();
        if (result.empty()) {
            data.erase(dest);
        } else {
            data[dest] = result;
        }
        return stored;
    }

    bool move(const ByteArray& source, const ByteArray& dest,
              const ByteArray& member) override {
        moveCalls++;
        calls.push_back("move");
        auto it = data.find(source);
        if (it == data.end() || !it->second.remove(member)) return false;
        data[dest].add(member);
        return true;
    }

    size_t addMembers(const ByteArray& key,
                      const std::vector<ByteArray>& members) override {
        calls.push_back("add");
        if (failWrites) {
            throw std::runtime_error("READONLY replica");
        }
        writes.emplace_back(key, members);
        return data[key].addAll(members);
    }

    size_t removeMembers(const ByteArray& key,
                         const std::vector<ByteArray>& members) override {
        calls.push_back("remove");
        auto it = data.find(key);
        if (it == data.end()) return 0;
        size_t removed = 0;
        for (const auto& member : members) {
            if (it->second.remove(member)) removed++;
        }
        if (it->second.empty()) data.erase(it);
        return removed;
    }

    bool isMember(const ByteArray& key, const ByteArray& member) override {
        calls.push_back("ismember");
        auto it = data.find(key);
        return it != data.end() && it->second.contains(member);
    }

    bool exists(const ByteArray& key) override {
        calls.push_back("exists");
        return data.count(key) > 0;
    }

   private:
    std::vector<ByteArraySet> operands(const std::vector<ByteArray>& keys) {
        std::vector<ByteArraySet> sets;
        for (const auto& key : keys) {
            auto it = data.find(key);
            sets.push_back(it == data.end() ? ByteArraySet() : it->second);
        }
        return sets;
    }
};

#endif
