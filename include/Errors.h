#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

class ClusterError : public std::runtime_error {
   public:
    explicit ClusterError(const std::string& message)
        : std::runtime_error(message) {}
};

// No shard serves a key's slot. Raised before any request is issued.
class RoutingError : public ClusterError {
   public:
    explicit RoutingError(const std::string& message) : ClusterError(message) {}
};

// A per-key read failed or its node was unreachable.
class FetchError : public ClusterError {
   public:
    explicit FetchError(const std::string& message) : ClusterError(message) {}
};

// The caller asked to stop while the operation was waiting on its fetches.
class InterruptedError : public ClusterError {
   public:
    explicit InterruptedError(const std::string& message)
        : ClusterError(message) {}
};

// Writing an aggregated result to its destination key failed.
class WriteError : public ClusterError {
   public:
    explicit WriteError(const std::string& message) : ClusterError(message) {}
};

#endif
