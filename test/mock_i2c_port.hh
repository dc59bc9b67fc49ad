#pragma once

#include <gmock/gmock.h>
#include <i2c.hh>

class MockI2CPort : public iI2CPort
{
public:
    MOCK_METHOD(ErrorCode, Write, (uint8_t address7bit, const uint8_t *data, size_t len), (override));
    MOCK_METHOD(ErrorCode, WriteRead, (uint8_t address7bit, const uint8_t *out, size_t outLen, uint8_t *in, size_t inLen), (override));
    MOCK_METHOD(esp_err_t, GetLastError, (), (override));
};
