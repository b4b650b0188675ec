#include "SlotHash.h"
#include <algorithm>
#include <stdexcept>
#include <vector>

using namespace std;

uint16_t SlotHash::crc16(const uint8_t* data, size_t length) {
    uint16_t crc = 0;
    for (size_t i = 0; i < length; i++) {
        crc ^= static_cast<uint16_t>(data[i]) << 8;
        for (int bit = 0; bit < 8; bit++) {
            if (crc & 0x8000) {
                crc = static_cast<uint16_t>((crc << 1) ^ 0x1021);
            } else {
                crc = static_cast<uint16_t>(crc << 1);
            }
        }
    }
    return crc;
}

uint16_t SlotHash::calculateSlot(const ByteArray& key) {
    const auto& bytes = key.bytes();

    auto open = find(bytes.begin(), bytes.end(), '{');
    if (open != bytes.end()) {
        auto close = find(open + 1, bytes.end(), '}');
        if (close != bytes.end() && close > open + 1) {
            size_t offset = (open + 1) - bytes.begin();
            size_t length = close - (open + 1);
            return crc16(bytes.data() + offset, length) % SLOT_COUNT;
        }
    }

    return crc16(bytes.data(), bytes.size()) % SLOT_COUNT;
}

bool SlotHash::isSameSlotForAllKeys(const vector<ByteArray>& keys) {
    if (keys.empty()) {
        throw invalid_argument("At least one key is required");
    }

    uint16_t slot = calculateSlot(keys.front());
    for (size_t i = 1; i < keys.size(); i++) {
        if (calculateSlot(keys[i]) != slot) {
            return false;
        }
    }
    return true;
}
