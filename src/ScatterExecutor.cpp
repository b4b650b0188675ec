#include "ScatterExecutor.h"
#include <exception>
#include <string>
#include <vector>
#include "Errors.h"

using namespace std;

namespace {

// Cancels every issued read when the join scope is left. Cancellation
// hooks must not throw.
class CancelOnExit {
   private:
    vector<PendingFetch>& pending_;

   public:
    explicit CancelOnExit(vector<PendingFetch>& pending) : pending_(pending) {}
    ~CancelOnExit() {
        for (auto& fetch : pending_) {
            fetch.cancel();
        }
    }

    CancelOnExit(const CancelOnExit&) = delete;
    CancelOnExit& operator=(const CancelOnExit&) = delete;
};

}  // namespace

ScatterExecutor::ScatterExecutor(MemberFetcher& fetcher,
                                 chrono::milliseconds poll_interval)
    : fetcher_(fetcher), poll_interval_(poll_interval) {}

ByteArraySet ScatterExecutor::collect(PendingFetch& fetch) const {
    try {
        return fetch.get();
    } catch (const exception& e) {
        throw FetchError("SMEMBERS " + fetch.key().describe() + " on " +
                         fetch.shard().toString() + " failed: " + e.what());
    }
}

ScatterExecutor::FetchedSets ScatterExecutor::fetchAll(const ShardKeyMap& routes,
                                                       stop_token stop) const {
    size_t total = 0;
    for (const auto& [shard, keys] : routes) {
        total += keys.size();
    }

    vector<PendingFetch> pending;
    pending.reserve(total);
    CancelOnExit cancel_on_exit(pending);

    for (const auto& [shard, keys] : routes) {
        for (const auto& key : keys) {
            try {
                pending.push_back(fetcher_.fetchMembers(shard, key));
            } catch (const FetchError&) {
                throw;
            } catch (const exception& e) {
                throw FetchError("Cannot issue SMEMBERS " + key.describe() +
                                 " to " + shard.toString() + ": " + e.what());
            }
        }
    }

    FetchedSets results;
    results.reserve(total);
    vector<bool> done(pending.size(), false);
    size_t remaining = pending.size();

    while (remaining > 0) {
        if (stop.stop_requested()) {
            throw InterruptedError("Interrupted while waiting on " +
                                   to_string(remaining) + " of " +
                                   to_string(total) + " member reads");
        }

        bool progressed = false;
        for (size_t i = 0; i < pending.size(); i++) {
            if (done[i] || !pending[i].ready()) continue;

            results.emplace(pending[i].key(), collect(pending[i]));
            done[i] = true;
            remaining--;
            progressed = true;
        }

        if (!progressed) {
            for (size_t i = 0; i < pending.size(); i++) {
                if (!done[i]) {
                    pending[i].waitFor(poll_interval_);
                    break;
                }
            }
        }
    }

    return results;
}
