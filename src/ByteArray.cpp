#include "ByteArray.h"
#include <algorithm>
#include <boost/algorithm/hex.hpp>
#include <boost/container_hash/hash.hpp>
#include <cctype>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

using namespace std;

ByteArray::ByteArray(vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}

ByteArray::ByteArray(string_view text) : bytes_(text.begin(), text.end()) {}

ByteArray::ByteArray(initializer_list<uint8_t> bytes) : bytes_(bytes) {}

const vector<uint8_t>& ByteArray::bytes() const {
    return bytes_;
}

const uint8_t* ByteArray::data() const {
    return bytes_.data();
}

size_t ByteArray::size() const {
    return bytes_.size();
}

bool ByteArray::empty() const {
    return bytes_.empty();
}

string ByteArray::toString() const {
    return string(bytes_.begin(), bytes_.end());
}

string ByteArray::describe() const {
    bool printable = ranges::all_of(
        bytes_, [](uint8_t c) { return isprint(static_cast<int>(c)) != 0; });
    if (printable) {
        return toString();
    }

    string hex;
    boost::algorithm::hex(bytes_.begin(), bytes_.end(), back_inserter(hex));
    return "0x" + hex;
}

size_t ByteArray::hash() const {
    return boost::hash_range(bytes_.begin(), bytes_.end());
}

bool ByteArray::operator==(const ByteArray& other) const {
    return bytes_ == other.bytes_;
}

bool ByteArray::operator!=(const ByteArray& other) const {
    return !(*this == other);
}

bool ByteArray::operator<(const ByteArray& other) const {
    return bytes_ < other.bytes_;
}

ByteArraySet::ByteArraySet(const vector<ByteArray>& members)
    : members_(members.begin(), members.end()) {}

ByteArraySet::ByteArraySet(initializer_list<ByteArray> members)
    : members_(members) {}

bool ByteArraySet::add(const ByteArray& member) {
    return members_.insert(member).second;
}

size_t ByteArraySet::addAll(const ByteArraySet& other) {
    size_t added = 0;
    for (const auto& member : other) {
        if (add(member)) added++;
    }
    return added;
}

size_t ByteArraySet::addAll(const vector<ByteArray>& members) {
    size_t added = 0;
    for (const auto& member : members) {
        if (add(member)) added++;
    }
    return added;
}

bool ByteArraySet::remove(const ByteArray& member) {
    return members_.erase(member) > 0;
}

void ByteArraySet::retainAll(const ByteArraySet& other) {
    for (auto it = members_.begin(); it != members_.end();) {
        if (!other.contains(*it)) {
            it = members_.erase(it);
        } else {
            ++it;
        }
    }
}

void ByteArraySet::removeAll(const ByteArraySet& other) {
    if (&other == this) {
        clear();
        return;
    }

    if (other.size() < members_.size()) {
        for (const auto& member : other) {
            members_.erase(member);
        }
        return;
    }

    for (auto it = members_.begin(); it != members_.end();) {
        if (other.contains(*it)) {
            it = members_.erase(it);
        } else {
            ++it;
        }
    }
}

bool ByteArraySet::contains(const ByteArray& member) const {
    return members_.find(member) != members_.end();
}

size_t ByteArraySet::size() const {
    return members_.size();
}

bool ByteArraySet::empty() const {
    return members_.empty();
}

void ByteArraySet::clear() {
    members_.clear();
}

vector<ByteArray> ByteArraySet::toVector() const {
    vector<ByteArray> sorted(members_.begin(), members_.end());
    sort(sorted.begin(), sorted.end());
    return sorted;
}

unordered_set<ByteArray>::const_iterator ByteArraySet::begin() const {
    return members_.begin();
}

unordered_set<ByteArray>::const_iterator ByteArraySet::end() const {
    return members_.end();
}

bool ByteArraySet::operator==(const ByteArraySet& other) const {
    return members_ == other.members_;
}

bool ByteArraySet::operator!=(const ByteArraySet& other) const {
    return !(*this == other);
}
