#ifndef CLUSTER_TOPOLOGY_H
#define CLUSTER_TOPOLOGY_H

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "ByteArray.h"

struct ShardAddress {
    std::string host;
    uint16_t port = 0;

    std::string toString() const;
    static std::optional<ShardAddress> parse(const std::string& text);

    bool operator==(const ShardAddress& other) const;
    bool operator!=(const ShardAddress& other) const;
    bool operator<(const ShardAddress& other) const;
};

namespace std {
template <>
struct hash<ShardAddress> {
    size_t operator()(const ShardAddress& address) const noexcept;
};
}  // namespace std

struct SlotRange {
    uint16_t first;
    uint16_t last;

    bool contains(uint16_t slot) const { return slot >= first && slot <= last; }
};

struct ClusterNode {
    ShardAddress address;
    std::vector<SlotRange> slots;
    bool master = true;

    bool servesSlot(uint16_t slot) const;
};

// Resolves the shard owning a key from an already known topology. Never
// does network I/O.
class TopologyOracle {
   public:
    virtual ~TopologyOracle() = default;

    // Throws RoutingError when no master serves the key's slot.
    virtual ShardAddress resolve(const ByteArray& key) const = 0;
};

class ClusterTopology : public TopologyOracle {
   private:
    std::vector<ClusterNode> nodes_;

   public:
    ClusterTopology() = default;
    explicit ClusterTopology(std::vector<ClusterNode> nodes);

    // Three masters on 127.0.0.1:7000-7002 splitting all slots.
    static ClusterTopology defaultLayout();

    // One node per line: host,port,first-last[,first-last...]
    // Blank lines and '#' comments are ignored, malformed lines are
    // reported on stderr and skipped.
    static ClusterTopology load(const std::filesystem::path& path);
    static std::optional<ClusterNode> parseNode(const std::string& line);
    bool save(const std::filesystem::path& path) const;

    ShardAddress resolve(const ByteArray& key) const override;

    const std::vector<ClusterNode>& nodes() const;
    const ClusterNode* lookup(const ShardAddress& address) const;
    // Slots not served by any master.
    size_t uncoveredSlots() const;
};

#endif
