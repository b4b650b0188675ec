#ifndef SET_COMMANDS_H
#define SET_COMMANDS_H

#include <chrono>
#include <functional>
#include <future>
#include <string>
#include <vector>
#include "ByteArray.h"
#include "ClusterTopology.h"

enum class SetOperation { Intersect, Union, Difference };

std::string operationName(SetOperation op);

// Handle on one in-flight member read. The read result is delivered
// through the future; cancel() runs the fetcher's cancellation hook at
// most once, whether or not the read has completed.
class PendingFetch {
   private:
    ByteArray key_;
    ShardAddress shard_;
    std::future<ByteArraySet> result_;
    std::function<void()> on_cancel_;
    bool cancelled_;

   public:
    PendingFetch(ByteArray key, ShardAddress shard,
                 std::future<ByteArraySet> result,
                 std::function<void()> on_cancel);

    PendingFetch(PendingFetch&& other) noexcept = default;
    PendingFetch& operator=(PendingFetch&& other) noexcept = default;

    PendingFetch(const PendingFetch&) = delete;
    PendingFetch& operator=(const PendingFetch&) = delete;

    const ByteArray& key() const;
    const ShardAddress& shard() const;

    bool ready() const;
    void waitFor(std::chrono::milliseconds timeout) const;
    // Rethrows whatever the read failed with. Call once.
    ByteArraySet get();
    void cancel();
};

// Per-key read primitive: SMEMBERS routed to one specific shard.
class MemberFetcher {
   public:
    virtual ~MemberFetcher() = default;

    // A key that does not exist resolves to an empty set.
    virtual PendingFetch fetchMembers(const ShardAddress& shard,
                                      const ByteArray& key) = 0;
};

// Commands run against the single shard owning all the keys involved.
class ShardCommandExecutor {
   public:
    virtual ~ShardCommandExecutor() = default;

    // Native SINTER / SUNION / SDIFF. Keys must share a slot.
    virtual ByteArraySet runSetOperation(SetOperation op,
                                         const std::vector<ByteArray>& keys) = 0;
    // Native *STORE: replaces dest, returns the size of the stored set.
    virtual size_t runStoreOperation(SetOperation op, const ByteArray& dest,
                                     const std::vector<ByteArray>& keys) = 0;
    // Native atomic SMOVE. Keys must share a slot.
    virtual bool move(const ByteArray& source, const ByteArray& dest,
                      const ByteArray& member) = 0;

    // Returns the number of members that were not present before.
    virtual size_t addMembers(const ByteArray& key,
                              const std::vector<ByteArray>& members) = 0;
    virtual size_t removeMembers(const ByteArray& key,
                                 const std::vector<ByteArray>& members) = 0;
    virtual bool isMember(const ByteArray& key, const ByteArray& member) = 0;
    virtual bool exists(const ByteArray& key) = 0;
};

#endif
