#pragma once

#include <stdint.h>
#include <stddef.h>
#include <esp_err.h>
#include "errorcodes.hh"

//Blocking bus transport consumed by the chip drivers
class iI2CPort{
    public:
    virtual ~iI2CPort(){}
    virtual ErrorCode Write(const uint8_t address7bit, const uint8_t * const data, const size_t len)=0;
    //one combined transaction: write out, repeated start, read into in
    virtual ErrorCode WriteRead(const uint8_t address7bit, const uint8_t * const out, const size_t outLen, uint8_t *in, const size_t inLen)=0;
    //esp_err_t of the last failed transaction; successful transactions leave it untouched, ESP_OK until the first failure
    virtual esp_err_t GetLastError()=0;
};
