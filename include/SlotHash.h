#ifndef SLOT_HASH_H
#define SLOT_HASH_H

#include <cstdint>
#include <vector>
#include "ByteArray.h"

class SlotHash {
   public:
    static constexpr uint16_t SLOT_COUNT = 16384;

    // CRC16-CCITT (XMODEM): polynomial 0x1021, initial value 0.
    static uint16_t crc16(const uint8_t* data, size_t length);

    // Honors hash tags: for "user:{42}:name" only "42" is hashed.
    static uint16_t calculateSlot(const ByteArray& key);

    // Throws std::invalid_argument when keys is empty.
    static bool isSameSlotForAllKeys(const std::vector<ByteArray>& keys);
};

#endif
