#ifndef SCATTER_EXECUTOR_H
#define SCATTER_EXECUTOR_H

#include <chrono>
#include <stop_token>
#include <unordered_map>
#include <vector>
#include "ByteArray.h"
#include "SetCommands.h"
#include "ShardRouter.h"

class ScatterExecutor {
   private:
    MemberFetcher& fetcher_;
    std::chrono::milliseconds poll_interval_;

    ByteArraySet collect(PendingFetch& fetch) const;

   public:
    using FetchedSets = std::unordered_map<ByteArray, ByteArraySet>;

    explicit ScatterExecutor(
        MemberFetcher& fetcher,
        std::chrono::milliseconds poll_interval = std::chrono::milliseconds(5));

    // Issues one read per key, all before waiting on any, then joins them.
    // The first failed read aborts with FetchError; a stop request while
    // joining aborts with InterruptedError. Every issued read is cancelled
    // exactly once on the way out, successful or not.
    FetchedSets fetchAll(const ShardKeyMap& routes,
                         std::stop_token stop = {}) const;
};

#endif
