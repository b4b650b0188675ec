#include "Node.h"
#include <boost/algorithm/hex.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>
#include <string>
#include <system_error>
#include <utility>
#include <vector>
#include "Errors.h"
#include "SetAggregator.h"

namespace fs = std::filesystem;
using namespace std;

namespace {

string encode(const ByteArray& value) {
    string hex;
    boost::algorithm::hex(value.bytes().begin(), value.bytes().end(),
                          back_inserter(hex));
    return hex;
}

ByteArray decode(const string& hex) {
    vector<uint8_t> bytes;
    boost::algorithm::unhex(hex.begin(), hex.end(), back_inserter(bytes));
    return ByteArray(std::move(bytes));
}

}  // namespace

Node::Node(ShardAddress address, fs::path file_path)
    : address_(std::move(address)),
      path_(std::move(file_path)),
      down_(false),
      latency_ms_(0) {}

const ShardAddress& Node::address() const {
    return address_;
}

string Node::path() const {
    return path_.string();
}

void Node::checkReachable() const {
    if (down_) {
        throw FetchError("Node " + address_.toString() + " is unreachable");
    }
}

ByteArraySet Node::membersLocked(const ByteArray& key) const {
    auto it = sets_.find(key);
    if (it == sets_.end()) {
        return {};
    }
    return it->second;
}

ByteArraySet Node::members(const ByteArray& key) const {
    checkReachable();
    lock_guard<mutex> lock(mutex_);
    return membersLocked(key);
}

size_t Node::card(const ByteArray& key) const {
    checkReachable();
    lock_guard<mutex> lock(mutex_);
    auto it = sets_.find(key);
    return it == sets_.end() ? 0 : it->second.size();
}

bool Node::exists(const ByteArray& key) const {
    checkReachable();
    lock_guard<mutex> lock(mutex_);
    return sets_.find(key) != sets_.end();
}

bool Node::isMember(const ByteArray& key, const ByteArray& member) const {
    checkReachable();
    lock_guard<mutex> lock(mutex_);
    auto it = sets_.find(key);
    return it != sets_.end() && it->second.contains(member);
}

size_t Node::keyCount() const {
    lock_guard<mutex> lock(mutex_);
    return sets_.size();
}

size_t Node::add(const ByteArray& key, const vector<ByteArray>& members) {
    checkReachable();
    if (members.empty()) {
        return 0;
    }

    lock_guard<mutex> lock(mutex_);
    return sets_[key].addAll(members);
}

size_t Node::remove(const ByteArray& key, const vector<ByteArray>& members) {
    checkReachable();
    lock_guard<mutex> lock(mutex_);

    auto it = sets_.find(key);
    if (it == sets_.end()) {
        return 0;
    }

    size_t removed = 0;
    for (const auto& member : members) {
        if (it->second.remove(member)) removed++;
    }
    if (it->second.empty()) {
        sets_.erase(it);
    }
    return removed;
}

bool Node::del(const ByteArray& key) {
    checkReachable();
    lock_guard<mutex> lock(mutex_);
    return sets_.erase(key) > 0;
}

ByteArraySet Node::compute(SetOperation op,
                           const vector<ByteArray>& keys) const {
    checkReachable();
    lock_guard<mutex> lock(mutex_);

    vector<ByteArraySet> operands;
    operands.reserve(keys.size());
    for (const auto& key : keys) {
        operands.push_back(membersLocked(key));
    }
    return SetAggregator::aggregate(op, operands);
}

size_t Node::store(SetOperation op, const ByteArray& dest,
                   const vector<ByteArray>& keys) {
    checkReachable();
    lock_guard<mutex> lock(mutex_);

    vector<ByteArraySet> operands;
    operands.reserve(keys.size());
    for (const auto& key : keys) {
        operands.push_back(membersLocked(key));
    }

    ByteArraySet result = SetAggregator::aggregate(op, operands);
    size_t stored = result.size();

    if (result.empty()) {
        sets_.erase(dest);
    } else {
        sets_[dest] = std::move(result);
    }
    return stored;
}

bool Node::move(const ByteArray& source, const ByteArray& dest,
                const ByteArray& member) {
    checkReachable();
    lock_guard<mutex> lock(mutex_);

    auto it = sets_.find(source);
    if (it == sets_.end() || !it->second.contains(member)) {
        return false;
    }
    if (source == dest) {
        return true;
    }

    it->second.remove(member);
    if (it->second.empty()) {
        sets_.erase(it);
    }
    sets_[dest].add(member);
    return true;
}

void Node::setDown(bool down) {
    down_ = down;
}

bool Node::isDown() const {
    return down_;
}

void Node::setLatency(chrono::milliseconds latency) {
    latency_ms_ = static_cast<long>(latency.count());
}

chrono::milliseconds Node::latency() const {
    return chrono::milliseconds(latency_ms_.load());
}

bool Node::load() {
    if (path_.empty() || !fs::exists(path_)) {
        return false;
    }

    ifstream file(path_);
    if (!file.is_open()) {
        cerr << "Failed to open node file: " << path() << endl;
        return false;
    }

    unordered_map<ByteArray, ByteArraySet> loaded;
    string line;

    while (getline(file, line)) {
        if (line.empty()) continue;

        size_t pos = line.find(',');
        if (pos == string::npos || pos == 0) {
            cerr << "Invalid member format in line: " << line << endl;
            continue;
        }

        try {
            ByteArray key = decode(line.substr(0, pos));
            ByteArray member = decode(line.substr(pos + 1));
            loaded[key].add(member);
        } catch (const boost::algorithm::hex_decode_error&) {
            cerr << "Invalid hex encoding in line: " << line << endl;
        }
    }

    lock_guard<mutex> lock(mutex_);
    sets_ = std::move(loaded);
    return true;
}

bool Node::flush() const {
    if (path_.empty()) {
        return false;
    }

    fs::path temp_path = path_;
    temp_path += ".tmp";

    {
        ofstream out_file(temp_path);
        if (!out_file.is_open()) {
            cerr << "Failed to open node file for writing: "
                 << temp_path.string() << endl;
            return false;
        }

        lock_guard<mutex> lock(mutex_);
        for (const auto& [key, members] : sets_) {
            string encoded_key = encode(key);
            for (const auto& member : members) {
                out_file << encoded_key << "," << encode(member) << "\n";
            }
        }
    }

    error_code ec;
    fs::rename(temp_path, path_, ec);
    if (ec) {
        cerr << "Failed to replace node file " << path() << ": "
             << ec.message() << endl;
        return false;
    }
    return true;
}
