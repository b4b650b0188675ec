#include "ClusterTopology.h"
#include <boost/algorithm/string.hpp>
#include <boost/container_hash/hash.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>
#include "Errors.h"
#include "SlotHash.h"

namespace fs = std::filesystem;
using namespace std;

namespace {

optional<uint16_t> parseNumber(const string& text, long max) {
    try {
        size_t consumed = 0;
        long value = stol(text, &consumed);
        if (consumed != text.size() || value < 0 || value > max) {
            return nullopt;
        }
        return static_cast<uint16_t>(value);
    } catch (const invalid_argument&) {
        return nullopt;
    } catch (const out_of_range&) {
        return nullopt;
    }
}

}  // namespace

string ShardAddress::toString() const {
    return host + ":" + to_string(port);
}

optional<ShardAddress> ShardAddress::parse(const string& text) {
    size_t pos = text.rfind(':');
    if (pos == string::npos || pos == 0) {
        return nullopt;
    }

    auto port = parseNumber(text.substr(pos + 1), 65535);
    if (!port || *port == 0) {
        return nullopt;
    }
    return ShardAddress{text.substr(0, pos), *port};
}

bool ShardAddress::operator==(const ShardAddress& other) const {
    return host == other.host && port == other.port;
}

bool ShardAddress::operator!=(const ShardAddress& other) const {
    return !(*this == other);
}

bool ShardAddress::operator<(const ShardAddress& other) const {
    return tie(host, port) < tie(other.host, other.port);
}

size_t std::hash<ShardAddress>::operator()(
    const ShardAddress& address) const noexcept {
    size_t seed = 0;
    boost::hash_combine(seed, address.host);
    boost::hash_combine(seed, address.port);
    return seed;
}

bool ClusterNode::servesSlot(uint16_t slot) const {
    for (const auto& range : slots) {
        if (range.contains(slot)) return true;
    }
    return false;
}

ClusterTopology::ClusterTopology(vector<ClusterNode> nodes)
    : nodes_(std::move(nodes)) {}

ClusterTopology ClusterTopology::defaultLayout() {
    return ClusterTopology(vector<ClusterNode>{
        {.address = {"127.0.0.1", 7000}, .slots = {{0, 5460}}},
        {.address = {"127.0.0.1", 7001}, .slots = {{5461, 10922}}},
        {.address = {"127.0.0.1", 7002}, .slots = {{10923, 16383}}},
    });
}

optional<ClusterNode> ClusterTopology::parseNode(const string& line) {
    vector<string> fields;
    boost::algorithm::split(fields, line, boost::is_any_of(","));
    for (auto& field : fields) {
        boost::algorithm::trim(field);
    }

    if (fields.size() < 3 || fields[0].empty()) {
        return nullopt;
    }

    auto port = parseNumber(fields[1], 65535);
    if (!port || *port == 0) {
        return nullopt;
    }

    ClusterNode node{.address = {fields[0], *port}};

    for (size_t i = 2; i < fields.size(); i++) {
        size_t dash = fields[i].find('-');
        string first_text = fields[i].substr(0, dash);
        string last_text =
            dash == string::npos ? first_text : fields[i].substr(dash + 1);

        auto first = parseNumber(first_text, SlotHash::SLOT_COUNT - 1);
        auto last = parseNumber(last_text, SlotHash::SLOT_COUNT - 1);
        if (!first || !last || *first > *last) {
            return nullopt;
        }
        node.slots.push_back({*first, *last});
    }

    return node;
}

ClusterTopology ClusterTopology::load(const fs::path& path) {
    ifstream file(path);
    if (!file.is_open()) {
        throw runtime_error("Cannot open cluster layout: " + path.string());
    }

    vector<ClusterNode> nodes;
    string line;

    while (getline(file, line)) {
        boost::algorithm::trim(line);
        if (line.empty() || line.starts_with("#")) continue;

        auto node = parseNode(line);
        if (!node) {
            cerr << "Invalid node format in line: " << line << endl;
            continue;
        }
        nodes.push_back(*node);
    }

    return ClusterTopology(std::move(nodes));
}

bool ClusterTopology::save(const fs::path& path) const {
    ofstream file(path);
    if (!file.is_open()) {
        cerr << "Failed to write cluster layout: " << path.string() << endl;
        return false;
    }

    file << "# host,port,first-last[,first-last...]\n";
    for (const auto& node : nodes_) {
        file << node.address.host << "," << node.address.port;
        for (const auto& range : node.slots) {
            file << "," << range.first << "-" << range.last;
        }
        file << "\n";
    }
    return true;
}

ShardAddress ClusterTopology::resolve(const ByteArray& key) const {
    uint16_t slot = SlotHash::calculateSlot(key);

    for (const auto& node : nodes_) {
        if (node.master && node.servesSlot(slot)) {
            return node.address;
        }
    }

    throw RoutingError("Could not find master node serving slot " +
                       to_string(slot) + " for key '" + key.describe() +
                       "', bad topology?");
}

const vector<ClusterNode>& ClusterTopology::nodes() const {
    return nodes_;
}

const ClusterNode* ClusterTopology::lookup(const ShardAddress& address) const {
    for (const auto& node : nodes_) {
        if (node.address == address) return &node;
    }
    return nullptr;
}

size_t ClusterTopology::uncoveredSlots() const {
    size_t uncovered = 0;
    for (uint16_t slot = 0; slot < SlotHash::SLOT_COUNT; slot++) {
        bool served = false;
        for (const auto& node : nodes_) {
            if (node.master && node.servesSlot(slot)) {
                served = true;
                break;
            }
        }
        if (!served) uncovered++;
    }
    return uncovered;
}
