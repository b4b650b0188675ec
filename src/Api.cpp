#include "Api.h"
#include <exception>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "SlotHash.h"

namespace fs = std::filesystem;
using namespace std;

namespace {

vector<ByteArray> toKeys(const vector<string> &tokens) {
    vector<ByteArray> keys;
    keys.reserve(tokens.size());
    for (const auto &token : tokens) {
        keys.emplace_back(token);
    }
    return keys;
}

}  // namespace

SetAPI::SetAPI(const string &dbPath, ostream &out, ostream &err)
    : database_path(dbPath), out(out), err(err) {
    fs::create_directories(database_path);

    localCluster = make_unique<LocalCluster>(loadTopology(database_path, err),
                                             database_path);
    localCluster->load();
    setCommands = make_unique<ClusterSetCommands>(
        localCluster->topology(), *localCluster, *localCluster);
}

SetAPI::~SetAPI() = default;

ClusterTopology SetAPI::loadTopology(const fs::path &dbPath, ostream &err) {
    fs::path layout_path = dbPath / "nodes.conf";

    if (!fs::exists(layout_path)) {
        ClusterTopology topology = ClusterTopology::defaultLayout();
        topology.save(layout_path);
        return topology;
    }

    ClusterTopology topology = ClusterTopology::load(layout_path);
    if (topology.nodes().empty()) {
        err << "No nodes in " << layout_path.string()
            << ", using the default layout" << endl;
        return ClusterTopology::defaultLayout();
    }

    size_t uncovered = topology.uncoveredSlots();
    if (uncovered > 0) {
        err << "Warning: " << uncovered
            << " slots are not served by any master" << endl;
    }
    return topology;
}

LocalCluster &SetAPI::cluster() {
    return *localCluster;
}

template <typename Command>
void SetAPI::run(const string &name, Command &&command) {
    try {
        command();
    } catch (const invalid_argument &e) {
        err << "(error) ERR wrong arguments for '" << name << "': " << e.what()
            << endl;
    } catch (const exception &e) {
        err << "(error) " << e.what() << endl;
    }
}

void SetAPI::printSet(const ByteArraySet &members) {
    if (members.empty()) {
        out << "(empty set)" << endl;
        return;
    }

    size_t index = 1;
    for (const auto &member : members.toVector()) {
        out << index++ << ") \"" << member.describe() << "\"" << endl;
    }
}

void SetAPI::persist() {
    if (!localCluster->flush()) {
        err << "Failed to persist cluster state to " << database_path.string()
            << endl;
    }
}

void SetAPI::addOp(const string &key, const vector<string> &members) {
    run("sadd", [&]() {
        size_t added = localCluster->addMembers(ByteArray(key), toKeys(members));
        persist();
        out << "(integer) " << added << endl;
    });
}

void SetAPI::removeOp(const string &key, const vector<string> &members) {
    run("srem", [&]() {
        size_t removed =
            localCluster->removeMembers(ByteArray(key), toKeys(members));
        persist();
        out << "(integer) " << removed << endl;
    });
}

void SetAPI::membersOp(const string &key) {
    run("smembers", [&]() { printSet(localCluster->members(ByteArray(key))); });
}

void SetAPI::cardOp(const string &key) {
    run("scard", [&]() {
        out << "(integer) " << localCluster->card(ByteArray(key)) << endl;
    });
}

void SetAPI::isMemberOp(const string &key, const string &member) {
    run("sismember", [&]() {
        bool present = localCluster->isMember(ByteArray(key), ByteArray(member));
        out << "(integer) " << (present ? 1 : 0) << endl;
    });
}

void SetAPI::existsOp(const vector<string> &keys) {
    run("exists", [&]() {
        size_t count = 0;
        for (const auto &key : keys) {
            if (localCluster->exists(ByteArray(key))) count++;
        }
        out << "(integer) " << count << endl;
    });
}

void SetAPI::deleteOp(const vector<string> &keys) {
    run("del", [&]() {
        size_t count = 0;
        for (const auto &key : keys) {
            if (localCluster->del(ByteArray(key))) count++;
        }
        persist();
        out << "(integer) " << count << endl;
    });
}

void SetAPI::algebraOp(SetOperation op, const vector<string> &keys) {
    run(operationName(op), [&]() {
        vector<ByteArray> sources = toKeys(keys);
        switch (op) {
            case SetOperation::Intersect:
                printSet(setCommands->sInter(sources));
                break;
            case SetOperation::Union:
                printSet(setCommands->sUnion(sources));
                break;
            case SetOperation::Difference:
                printSet(setCommands->sDiff(sources));
                break;
        }
    });
}

void SetAPI::storeOp(SetOperation op, const string &dest,
                     const vector<string> &keys) {
    run(operationName(op) + "STORE", [&]() {
        vector<ByteArray> sources = toKeys(keys);
        ByteArray destination(dest);
        size_t stored = 0;
        switch (op) {
            case SetOperation::Intersect:
                stored = setCommands->sInterStore(destination, sources);
                break;
            case SetOperation::Union:
                stored = setCommands->sUnionStore(destination, sources);
                break;
            case SetOperation::Difference:
                stored = setCommands->sDiffStore(destination, sources);
                break;
        }
        persist();
        out << "(integer) " << stored << endl;
    });
}

void SetAPI::moveOp(const string &source, const string &dest,
                    const string &member) {
    run("smove", [&]() {
        ByteArray from(source);
        ByteArray to(dest);
        if (!SlotHash::isSameSlotForAllKeys({from, to})) {
            out << "(note) " << source << " and " << dest
                << " hash to different slots, the move is not atomic" << endl;
        }
        bool moved = setCommands->sMove(from, to, ByteArray(member));
        persist();
        out << "(integer) " << (moved ? 1 : 0) << endl;
    });
}

void SetAPI::keySlotOp(const string &key) {
    run("keyslot", [&]() {
        ByteArray raw(key);
        out << "(integer) " << SlotHash::calculateSlot(raw) << " -> "
            << localCluster->topology().resolve(raw).toString() << endl;
    });
}

void SetAPI::nodesOp() {
    for (const auto &node : localCluster->topology().nodes()) {
        out << node.address.toString() << (node.master ? " master" : " replica");
        for (const auto &range : node.slots) {
            out << " " << range.first << "-" << range.last;
        }

        auto running = localCluster->node(node.address);
        if (running) {
            out << " keys=" << running->keyCount()
                << (running->isDown() ? " down" : " up");
        }
        out << endl;
    }
}

void SetAPI::nodeStateOp(const string &address, bool down) {
    auto parsed = ShardAddress::parse(address);
    if (!parsed) {
        err << "Error: expected <host>:<port>, got " << address << endl;
        return;
    }

    if (!localCluster->setNodeDown(*parsed, down)) {
        err << "Error: no node at " << address << endl;
        return;
    }
    out << "Node " << parsed->toString() << (down ? " is down" : " is up")
        << endl;
}
