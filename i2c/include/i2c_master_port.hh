#pragma once

#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include <driver/i2c_master.h>
#include "i2c.hh"

class I2CMasterPort:public iI2CPort{
    private:
    i2c_master_bus_handle_t bus_handle;
    const uint32_t scl_speed_hz;
    const int timeoutMs;
    SemaphoreHandle_t lock{nullptr};
    i2c_master_dev_handle_t devices[128]{};
    esp_err_t lastError{ESP_OK};
    esp_err_t getDevice(const uint8_t address7bit, i2c_master_dev_handle_t &dev);
    ErrorCode finish(esp_err_t err, const uint8_t address7bit);
    public:
    I2CMasterPort(i2c_master_bus_handle_t bus_handle, uint32_t scl_speed_hz=100000, int timeoutMs=1000);
    ~I2CMasterPort() override;
    I2CMasterPort(const I2CMasterPort&)=delete;
    I2CMasterPort& operator=(const I2CMasterPort&)=delete;

    ErrorCode Write(const uint8_t address7bit, const uint8_t * const data, const size_t len) override;
    ErrorCode WriteRead(const uint8_t address7bit, const uint8_t * const out, const size_t outLen, uint8_t *in, const size_t inLen) override;
    esp_err_t GetLastError() override{
        return lastError;
    }
    ErrorCode IsAvailable(const uint8_t address7bit);
};
