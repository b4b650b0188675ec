#include "SetCommands.h"
#include <chrono>
#include <future>
#include <string>
#include <utility>

using namespace std;

string operationName(SetOperation op) {
    switch (op) {
        case SetOperation::Intersect:
            return "SINTER";
        case SetOperation::Union:
            return "SUNION";
        case SetOperation::Difference:
            return "SDIFF";
    }
    return "UNKNOWN";
}

PendingFetch::PendingFetch(ByteArray key, ShardAddress shard,
                           future<ByteArraySet> result,
                           function<void()> on_cancel)
    : key_(std::move(key)),
      shard_(std::move(shard)),
      result_(std::move(result)),
      on_cancel_(std::move(on_cancel)),
      cancelled_(false) {}

const ByteArray& PendingFetch::key() const {
    return key_;
}

const ShardAddress& PendingFetch::shard() const {
    return shard_;
}

bool PendingFetch::ready() const {
    return result_.valid() &&
           result_.wait_for(chrono::seconds(0)) == future_status::ready;
}

void PendingFetch::waitFor(chrono::milliseconds timeout) const {
    if (result_.valid()) {
        result_.wait_for(timeout);
    }
}

ByteArraySet PendingFetch::get() {
    return result_.get();
}

void PendingFetch::cancel() {
    if (cancelled_) return;
    cancelled_ = true;
    if (on_cancel_) on_cancel_();
}
