#include "common.hh"

uint16_t ParseUInt16(const uint8_t *const message, uint32_t offset)
{
    uint16_t step = message[offset + 1] << 8;
    step |= message[offset];
    return step;
}

void WriteUInt16(uint16_t value, uint8_t *message, uint32_t offset)
{
    message[offset] = value & 0xFF;
    message[offset + 1] = (value & 0xFF00) >> 8;
}
