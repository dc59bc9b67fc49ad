#pragma once
#include <stdint.h>
#include <stddef.h>

template <typename T>
bool GetBitMask(const T value, const int bitMask) {
    return value & bitMask;
}

//all multi byte values are little endian
uint16_t ParseUInt16(const uint8_t * const message, uint32_t offset);

void WriteUInt16(uint16_t value, uint8_t *message, uint32_t offset);
