#ifndef BYTE_ARRAY_H
#define BYTE_ARRAY_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

// Owned byte sequence compared, ordered and hashed by content. Keys and
// members are both ByteArrays.
class ByteArray {
   private:
    std::vector<uint8_t> bytes_;

   public:
    ByteArray() = default;
    explicit ByteArray(std::vector<uint8_t> bytes);
    explicit ByteArray(std::string_view text);
    ByteArray(std::initializer_list<uint8_t> bytes);

    const std::vector<uint8_t>& bytes() const;
    const uint8_t* data() const;
    size_t size() const;
    bool empty() const;

    std::string toString() const;
    // Printable form for diagnostics: text when printable, hex otherwise.
    std::string describe() const;

    size_t hash() const;

    bool operator==(const ByteArray& other) const;
    bool operator!=(const ByteArray& other) const;
    bool operator<(const ByteArray& other) const;
};

namespace std {
template <>
struct hash<ByteArray> {
    size_t operator()(const ByteArray& value) const noexcept {
        return value.hash();
    }
};
}  // namespace std

class ByteArraySet {
   private:
    std::unordered_set<ByteArray> members_;

   public:
    ByteArraySet() = default;
    explicit ByteArraySet(const std::vector<ByteArray>& members);
    ByteArraySet(std::initializer_list<ByteArray> members);

    bool add(const ByteArray& member);
    size_t addAll(const ByteArraySet& other);
    size_t addAll(const std::vector<ByteArray>& members);
    bool remove(const ByteArray& member);
    // Keeps only the members also present in other.
    void retainAll(const ByteArraySet& other);
    void removeAll(const ByteArraySet& other);

    bool contains(const ByteArray& member) const;
    size_t size() const;
    bool empty() const;
    void clear();

    // Sorted by content so callers get a stable order.
    std::vector<ByteArray> toVector() const;

    std::unordered_set<ByteArray>::const_iterator begin() const;
    std::unordered_set<ByteArray>::const_iterator end() const;

    bool operator==(const ByteArraySet& other) const;
    bool operator!=(const ByteArraySet& other) const;
};

#endif
