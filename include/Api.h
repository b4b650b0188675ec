#ifndef API_H
#define API_H

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "ClusterSetCommands.h"
#include "LocalCluster.h"

class SetAPI {
   public:
    SetAPI(const std::string& dbPath, std::ostream& out = std::cout,
           std::ostream& err = std::cerr);
    ~SetAPI();

    void addOp(const std::string& key, const std::vector<std::string>& members);
    void removeOp(const std::string& key,
                  const std::vector<std::string>& members);
    void membersOp(const std::string& key);
    void cardOp(const std::string& key);
    void isMemberOp(const std::string& key, const std::string& member);
    void existsOp(const std::vector<std::string>& keys);
    void deleteOp(const std::vector<std::string>& keys);

    void algebraOp(SetOperation op, const std::vector<std::string>& keys);
    void storeOp(SetOperation op, const std::string& dest,
                 const std::vector<std::string>& keys);
    void moveOp(const std::string& source, const std::string& dest,
                const std::string& member);

    void keySlotOp(const std::string& key);
    void nodesOp();
    void nodeStateOp(const std::string& address, bool down);

    LocalCluster& cluster();

   private:
    std::filesystem::path database_path;
    std::unique_ptr<LocalCluster> localCluster;
    std::unique_ptr<ClusterSetCommands> setCommands;
    std::ostream& out;
    std::ostream& err;

    static ClusterTopology loadTopology(const std::filesystem::path& dbPath,
                                        std::ostream& err);
    template <typename Command>
    void run(const std::string& name, Command&& command);
    void printSet(const ByteArraySet& members);
    void persist();
};

#endif
