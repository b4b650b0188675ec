#ifndef LOCAL_CLUSTER_H
#define LOCAL_CLUSTER_H

#include <filesystem>
#include <map>
#include <memory>
#include <vector>
#include "ByteArray.h"
#include "ClusterTopology.h"
#include "Node.h"
#include "SetCommands.h"

// In-process cluster: a fixed topology and one Node per master. Serves as
// both the single-shard executor and the per-key fetch primitive.
class LocalCluster : public ShardCommandExecutor, public MemberFetcher {
   private:
    ClusterTopology topology_;
    std::map<ShardAddress, std::shared_ptr<Node>> nodes_;

    std::shared_ptr<Node> nodeFor(const ByteArray& key) const;
    // Native multi-key commands are only valid within one slot.
    std::shared_ptr<Node> slotOwner(const std::vector<ByteArray>& keys) const;

   public:
    explicit LocalCluster(ClusterTopology topology,
                          const std::filesystem::path& data_dir = {});

    const ClusterTopology& topology() const;
    std::shared_ptr<Node> node(const ShardAddress& address) const;
    std::vector<std::shared_ptr<Node>> nodes() const;
    bool setNodeDown(const ShardAddress& address, bool down);

    ByteArraySet runSetOperation(SetOperation op,
                                 const std::vector<ByteArray>& keys) override;
    size_t runStoreOperation(SetOperation op, const ByteArray& dest,
                             const std::vector<ByteArray>& keys) override;
    bool move(const ByteArray& source, const ByteArray& dest,
              const ByteArray& member) override;
    size_t addMembers(const ByteArray& key,
                      const std::vector<ByteArray>& members) override;
    size_t removeMembers(const ByteArray& key,
                         const std::vector<ByteArray>& members) override;
    bool isMember(const ByteArray& key, const ByteArray& member) override;
    bool exists(const ByteArray& key) override;

    PendingFetch fetchMembers(const ShardAddress& shard,
                              const ByteArray& key) override;

    ByteArraySet members(const ByteArray& key) const;
    size_t card(const ByteArray& key) const;
    bool del(const ByteArray& key);

    // Number of nodes whose file could be read.
    size_t load();
    bool flush() const;
};

#endif
