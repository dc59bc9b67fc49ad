#include <esp_log.h>
#include "i2c_master_port.hh"

static const char *TAG = "I2C_PORT";

I2CMasterPort::I2CMasterPort(i2c_master_bus_handle_t bus_handle, uint32_t scl_speed_hz, int timeoutMs):
    bus_handle(bus_handle), scl_speed_hz(scl_speed_hz), timeoutMs(timeoutMs)
{
    lock = xSemaphoreCreateMutex();
}

I2CMasterPort::~I2CMasterPort()
{
    for (auto &dev : devices)
    {
        if (dev)
        {
            i2c_master_bus_rm_device(dev);
            dev = nullptr;
        }
    }
    if (lock)
    {
        vSemaphoreDelete(lock);
    }
}

esp_err_t I2CMasterPort::getDevice(const uint8_t address7bit, i2c_master_dev_handle_t &dev)
{
    if (address7bit >= 128)
    {
        return ESP_ERR_INVALID_ARG;
    }
    if (!devices[address7bit])
    {
        i2c_device_config_t dev_cfg = {
            .dev_addr_length = I2C_ADDR_BIT_LEN_7,
            .device_address = address7bit,
            .scl_speed_hz = scl_speed_hz,
            .scl_wait_us = 0,
            .flags = {},
        };
        esp_err_t err = i2c_master_bus_add_device(bus_handle, &dev_cfg, &devices[address7bit]);
        if (err != ESP_OK)
        {
            devices[address7bit] = nullptr;
            return err;
        }
        ESP_LOGD(TAG, "Added device 0x%02X to bus", address7bit);
    }
    dev = devices[address7bit];
    return ESP_OK;
}

ErrorCode I2CMasterPort::finish(esp_err_t err, const uint8_t address7bit)
{
    xSemaphoreGive(lock);
    if (err != ESP_OK)
    {
        lastError = err;
        ESP_LOGE(TAG, "Transaction with 0x%02X failed: %s", address7bit, esp_err_to_name(err));
        return ErrorCode::DEVICE_NOT_RESPONDING;
    }
    return ErrorCode::OK;
}

ErrorCode I2CMasterPort::Write(const uint8_t address7bit, const uint8_t *const data, const size_t len)
{
    RETURN_ERRORCODE_ON_FALSE(data, ErrorCode::INVALID_ARGUMENT_VALUES, "Data is NULL for address 0x%02X", address7bit);
    if (!xSemaphoreTake(lock, pdMS_TO_TICKS(timeoutMs)))
    {
        ESP_LOGE(TAG, "Could not take port mutex");
        lastError = ESP_ERR_TIMEOUT;
        return ErrorCode::TIMEOUT;
    }
    i2c_master_dev_handle_t dev{nullptr};
    esp_err_t err = getDevice(address7bit, dev);
    if (err == ESP_OK)
    {
        err = i2c_master_transmit(dev, data, len, timeoutMs);
    }
    return finish(err, address7bit);
}

ErrorCode I2CMasterPort::WriteRead(const uint8_t address7bit, const uint8_t *const out, const size_t outLen, uint8_t *in, const size_t inLen)
{
    RETURN_ERRORCODE_ON_FALSE(out && in, ErrorCode::INVALID_ARGUMENT_VALUES, "Buffer is NULL for address 0x%02X", address7bit);
    if (!xSemaphoreTake(lock, pdMS_TO_TICKS(timeoutMs)))
    {
        ESP_LOGE(TAG, "Could not take port mutex");
        lastError = ESP_ERR_TIMEOUT;
        return ErrorCode::TIMEOUT;
    }
    i2c_master_dev_handle_t dev{nullptr};
    esp_err_t err = getDevice(address7bit, dev);
    if (err == ESP_OK)
    {
        err = i2c_master_transmit_receive(dev, out, outLen, in, inLen, timeoutMs);
    }
    return finish(err, address7bit);
}

ErrorCode I2CMasterPort::IsAvailable(const uint8_t address7bit)
{
    if (!xSemaphoreTake(lock, pdMS_TO_TICKS(timeoutMs)))
    {
        ESP_LOGE(TAG, "Could not take port mutex");
        lastError = ESP_ERR_TIMEOUT;
        return ErrorCode::TIMEOUT;
    }
    esp_err_t err = i2c_master_probe(bus_handle, address7bit, timeoutMs);
    xSemaphoreGive(lock);
    if (err != ESP_OK)
    {
        lastError = err;
        return ErrorCode::DEVICE_NOT_RESPONDING;
    }
    return ErrorCode::OK;
}
