#include <cassert>
#include <inttypes.h>
#include <esp_log.h>
#include <common.hh>
#include <errorcodes.hh>
#include "tsl2591.hh"
#define TAG "TSL2591"

namespace TSL2591
{
    M::M(iI2CPort *i2cPort) : i2cPort(i2cPort),
                              gainMultiplier(GainMultiplier(GAIN::LOW)),
                              integrationMs(IntegrationMs(INTEGRATION::_100MS))
    {
        assert(i2cPort != nullptr);
    }

    ErrorCode M::Write(uint8_t reg, uint8_t value)
    {
        const uint8_t buf[]{(uint8_t)(CMD::NORMAL | reg), value};
        ESP_LOGD(TAG, "Write 0x%02X to reg 0x%02X", value, reg);
        return i2cPort->Write(I2C_ADDRESS, buf, sizeof(buf));
    }

    ErrorCode M::Read(uint8_t reg, uint8_t *buf, size_t len)
    {
        const uint8_t cmd = CMD::NORMAL | reg;
        return i2cPort->WriteRead(I2C_ADDRESS, &cmd, 1, buf, len);
    }

    ErrorCode M::Update(uint8_t reg, uint8_t mask, uint8_t value)
    {
        uint8_t oldValue{0};
        RETURN_ON_ERRORCODE(Read(reg, &oldValue, 1));
        uint8_t newValue = (oldValue & ~mask) | (value & mask);
        if (newValue == oldValue)
        {
            return ErrorCode::OK;
        }
        return Write(reg, newValue);
    }

    ErrorCode M::special(uint8_t command)
    {
        ESP_LOGD(TAG, "Special function 0x%02X", command);
        return i2cPort->Write(I2C_ADDRESS, &command, 1);
    }

    ErrorCode M::PowerOn()
    {
        RETURN_ON_ERRORCODE(Update(REG::ENABLE, ENABLE::POWER_MASK, ENABLE::POWER_ON));
        poweredOn = true;
        return ErrorCode::OK;
    }

    ErrorCode M::PowerOff()
    {
        RETURN_ON_ERRORCODE(Update(REG::ENABLE, ENABLE::POWER_MASK, ENABLE::POWER_OFF));
        poweredOn = false;
        return ErrorCode::OK;
    }

    // AGAIN, ATIME, PERSIST and the thresholds only latch while PON is deasserted.
    // Power is restored even if the change itself failed.
    template <typename F>
    ErrorCode M::poweredDown(F change)
    {
        RETURN_ON_ERRORCODE(PowerOff());
        ErrorCode err = change();
        ErrorCode restored = PowerOn();
        if (err != ErrorCode::OK)
        {
            if (restored != ErrorCode::OK)
            {
                ESP_LOGW(TAG, "Could not power on again after failed configuration: %s", ErrorCodeStr[(int)restored]);
            }
            return err;
        }
        return restored;
    }

    ErrorCode M::Reset()
    {
        RETURN_ON_ERRORCODE(PowerOff());
        RETURN_ON_ERRORCODE(Write(REG::CONFIG, CONFIG::SRESET));
        // soft reset puts AGAIN and ATIME back to their defaults
        gain = GAIN::LOW;
        integration = INTEGRATION::_100MS;
        gainMultiplier = GainMultiplier(gain);
        integrationMs = IntegrationMs(integration);
        RETURN_ON_ERRORCODE(PowerOn());
        ESP_LOGI(TAG, "TSL2591 successfully reset");
        return ErrorCode::OK;
    }

    ErrorCode M::GetId(uint8_t &id)
    {
        return Read(REG::ID, &id, 1);
    }

    ErrorCode M::GetPackageId(uint8_t &pid)
    {
        return Read(REG::PID, &pid, 1);
    }

    ErrorCode M::Setup(uint8_t &deviceId)
    {
        ErrorCode err = Reset();
        if (err != ErrorCode::OK)
        {
            ESP_LOGE(TAG, "Reset failed: %s", ErrorCodeStr[(int)err]);
            return err;
        }
        RETURN_ON_ERRORCODE(GetId(deviceId));
        observedId = deviceId;
        if (deviceId != DEVICE_ID)
        {
            ESP_LOGE(TAG, "Unexpected device id 0x%02X, expected 0x%02X", deviceId, DEVICE_ID);
            return ErrorCode::UNEXPECTED_DEVICE_ID;
        }
        RETURN_ON_ERRORCODE(PowerOn());
        ESP_LOGI(TAG, "TSL2591 found and powered on");
        return ErrorCode::OK;
    }

    ErrorCode M::Setup()
    {
        uint8_t deviceId{0};
        return Setup(deviceId);
    }

    ErrorCode M::SetGain(GAIN gain)
    {
        return poweredDown([&]()
                           {
            ErrorCode e = Update(REG::CONFIG, CONFIG::AGAIN_MASK, (uint8_t)gain);
            if (e == ErrorCode::OK)
            {
                this->gain = gain;
                gainMultiplier = GainMultiplier(gain);
                ESP_LOGD(TAG, "Gain multiplier is now %" PRIu16, gainMultiplier);
            }
            return e; });
    }

    ErrorCode M::SetIntegration(INTEGRATION time)
    {
        return poweredDown([&]()
                           {
            ErrorCode e = Update(REG::CONFIG, CONFIG::ATIME_MASK, (uint8_t)time);
            if (e == ErrorCode::OK)
            {
                integration = time;
                integrationMs = IntegrationMs(time);
                ESP_LOGD(TAG, "Integration time is now %" PRIu16 "ms", integrationMs);
            }
            return e; });
    }

    ErrorCode M::SetPersist(PERSIST persist)
    {
        return poweredDown([&]()
                           { return Write(REG::PERSIST, (uint8_t)persist); });
    }

    ErrorCode M::writeThresholds(uint8_t firstReg, uint16_t low, uint16_t high)
    {
        uint8_t buf[5];
        buf[0] = CMD::NORMAL | firstReg;
        WriteUInt16(low, buf, 1);
        WriteUInt16(high, buf, 3);
        return poweredDown([&]()
                           { return i2cPort->Write(I2C_ADDRESS, buf, sizeof(buf)); });
    }

    ErrorCode M::SetThreshold(uint16_t low, uint16_t high)
    {
        return writeThresholds(REG::AILTL, low, high);
    }

    ErrorCode M::SetNoPersistThreshold(uint16_t low, uint16_t high)
    {
        return writeThresholds(REG::NPAILTL, low, high);
    }

    ErrorCode M::GetStatus(Status &status)
    {
        uint8_t reg{0};
        RETURN_ON_ERRORCODE(Read(REG::STATUS, &reg, 1));
        status.valid = GetBitMask(reg, STATUS::AVALID_MASK);
        status.alsInterrupt = GetBitMask(reg, STATUS::AINT_MASK);
        status.noPersistInterrupt = GetBitMask(reg, STATUS::NPINTR_MASK);
        return ErrorCode::OK;
    }

    ErrorCode M::IsCycleComplete(bool &complete)
    {
        uint8_t reg{0};
        RETURN_ON_ERRORCODE(Read(REG::STATUS, &reg, 1));
        complete = GetBitMask(reg, STATUS::AVALID_MASK);
        return ErrorCode::OK;
    }

    ErrorCode M::GetRawAlsData(AlsData &data, bool checkComplete)
    {
        if (checkComplete)
        {
            bool complete{false};
            RETURN_ON_ERRORCODE(IsCycleComplete(complete));
            if (!complete)
            {
                return ErrorCode::INTEGRATION_CYCLE_INCOMPLETE;
            }
            // toggling AEN restarts the cycle, so AVALID signals the next complete reading
            RETURN_ON_ERRORCODE(Update(REG::ENABLE, ENABLE::AEN_MASK, 0));
            RETURN_ON_ERRORCODE(Update(REG::ENABLE, ENABLE::AEN_MASK, ENABLE::AEN_MASK));
        }

        // C0DATAL, C0DATAH, C1DATAL, C1DATAH in one shot
        uint8_t buf[4];
        RETURN_ON_ERRORCODE(Read(REG::C0DATAL, buf, sizeof(buf)));
        data.visible = ParseUInt16(buf, 0);
        data.infrared = ParseUInt16(buf, 2);

        const uint16_t maxCount = integrationMs == 100 ? MAX_ADC_COUNT_100MS : MAX_ADC_COUNT;
        if (data.visible >= maxCount || data.infrared >= maxCount)
        {
            ESP_LOGW(TAG, "ADC saturated: visible=%" PRIu16 " infrared=%" PRIu16, data.visible, data.infrared);
            return ErrorCode::ADC_SATURATED;
        }
        return ErrorCode::OK;
    }

    ErrorCode M::GetLux(Lux &lux, bool checkComplete)
    {
        AlsData data{};
        RETURN_ON_ERRORCODE(GetRawAlsData(data, checkComplete));
        lux = CalculateLux(data, gain, integration);
        return ErrorCode::OK;
    }

    ErrorCode M::EnableInterrupt(bool enable)
    {
        return Update(REG::ENABLE, ENABLE::AIEN_MASK, enable ? ENABLE::AIEN_MASK : 0);
    }

    ErrorCode M::EnableNoPersistInterrupt(bool enable)
    {
        return Update(REG::ENABLE, ENABLE::NPIEN_MASK, enable ? ENABLE::NPIEN_MASK : 0);
    }

    ErrorCode M::EnableSleepAfterInterrupt(bool enable)
    {
        return Update(REG::ENABLE, ENABLE::SAI_MASK, enable ? ENABLE::SAI_MASK : 0);
    }

    ErrorCode M::ClearInterrupt()
    {
        return special(CMD::CLEAR_INT);
    }

    ErrorCode M::ClearNoPersistInterrupt()
    {
        return special(CMD::CLEAR_NP_INT);
    }

    ErrorCode M::ClearAllInterrupts()
    {
        return special(CMD::CLEAR_ALL_INT);
    }

    ErrorCode M::ForceInterrupt()
    {
        return special(CMD::FORCE_INT);
    }
}
