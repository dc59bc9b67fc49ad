#pragma once

#include <cstdint>
#include <cstddef>
#include <i2c.hh>
#include <errorcodes.hh>

namespace TSL2591
{
    constexpr uint8_t I2C_ADDRESS{0x29};
    constexpr uint8_t DEVICE_ID{0x50};
    constexpr uint16_t MAX_ADC_COUNT{65535};
    //ADC headroom is reduced at the shortest integration time
    constexpr uint16_t MAX_ADC_COUNT_100MS{36863};
    //device factor of the lux formula
    constexpr int64_t LUX_DF{408};

    constexpr uint8_t bit(int n)
    {
        return (uint8_t)(1u << n);
    }

    namespace REG
    {
        constexpr uint8_t ENABLE{0x00};
        constexpr uint8_t CONFIG{0x01};
        constexpr uint8_t AILTL{0x04};
        constexpr uint8_t AILTH{0x05};
        constexpr uint8_t AIHTL{0x06};
        constexpr uint8_t AIHTH{0x07};
        constexpr uint8_t NPAILTL{0x08};
        constexpr uint8_t NPAILTH{0x09};
        constexpr uint8_t NPAIHTL{0x0A};
        constexpr uint8_t NPAIHTH{0x0B};
        constexpr uint8_t PERSIST{0x0C};
        constexpr uint8_t PID{0x11};
        constexpr uint8_t ID{0x12};
        constexpr uint8_t STATUS{0x13};
        constexpr uint8_t C0DATAL{0x14};
        constexpr uint8_t C0DATAH{0x15};
        constexpr uint8_t C1DATAL{0x16};
        constexpr uint8_t C1DATAH{0x17};
    }

    // CMD:7 | TRANSACTION:6:5 | ADDR/SF:4:0
    namespace CMD
    {
        constexpr uint8_t NORMAL = bit(7) | bit(5);
        constexpr uint8_t SPECIAL = bit(7) | bit(6) | bit(5);
        constexpr uint8_t FORCE_INT = SPECIAL | 0x04;
        constexpr uint8_t CLEAR_ALL_INT = SPECIAL | 0x06;
        constexpr uint8_t CLEAR_INT = SPECIAL | 0x07;
        constexpr uint8_t CLEAR_NP_INT = SPECIAL | 0x0A;
    }

    // ENABLE: NPIEN:7 | SAI:6 | Reserved:5 | AIEN:4 | Reserved:3:2 | AEN:1 | PON:0
    namespace ENABLE
    {
        constexpr uint8_t POWER_MASK = bit(1) | bit(0);
        constexpr uint8_t POWER_ON = bit(1) | bit(0);
        constexpr uint8_t POWER_OFF = 0;
        constexpr uint8_t AEN_MASK = bit(1);
        constexpr uint8_t AIEN_MASK = bit(4);
        constexpr uint8_t SAI_MASK = bit(6);
        constexpr uint8_t NPIEN_MASK = bit(7);
    }

    // CONFIG: SRESET:7 | Reserved:6 | AGAIN:5:4 | Reserved:3 | ATIME:2:0
    namespace CONFIG
    {
        constexpr uint8_t SRESET = bit(7);
        constexpr uint8_t AGAIN_MASK = bit(5) | bit(4);
        constexpr uint8_t ATIME_MASK = bit(2) | bit(1) | bit(0);
    }

    // STATUS: Reserved:7:6 | NPINTR:5 | AINT:4 | Reserved:3:1 | AVALID:0
    namespace STATUS
    {
        constexpr uint8_t AVALID_MASK = bit(0);
        constexpr uint8_t AINT_MASK = bit(4);
        constexpr uint8_t NPINTR_MASK = bit(5);
    }

    enum class GAIN : uint8_t
    {
        LOW = 0x00,
        MED = 0x10,
        HIGH = 0x20,
        MAX = 0x30,
    };

    enum class INTEGRATION : uint8_t
    {
        _100MS = 0x00,
        _200MS = 0x01,
        _300MS = 0x02,
        _400MS = 0x03,
        _500MS = 0x04,
        _600MS = 0x05,
    };

    //number of consecutive out-of-range cycles before an interrupt is raised
    enum class PERSIST : uint8_t
    {
        EVERY = 0x00,
        _1 = 0x01,
        _2 = 0x02,
        _3 = 0x03,
        _5 = 0x04,
        _10 = 0x05,
        _15 = 0x06,
        _20 = 0x07,
        _25 = 0x08,
        _30 = 0x09,
        _35 = 0x0A,
        _40 = 0x0B,
        _45 = 0x0C,
        _50 = 0x0D,
        _55 = 0x0E,
        _60 = 0x0F,
    };

    uint16_t GainMultiplier(GAIN gain);
    uint16_t IntegrationMs(INTEGRATION time);

    struct AlsData
    {
        uint16_t visible;  // channel 0, visible + infrared
        uint16_t infrared; // channel 1
    };

    // value = integer + fractional/1'000'000
    struct Lux
    {
        int32_t integer;
        int32_t fractional;
    };

    struct Status
    {
        bool valid;
        bool alsInterrupt;
        bool noPersistInterrupt;
    };

    /**
     * @brief Fixed point conversion of raw channel counts to illuminance.
     *
     * cpl = IntegrationMs(time) * GainMultiplier(gain) * 1e6
     * strength = (visible - infrared) * (1e6 - infrared * 1e6 / visible) * LUX_DF
     * integer = strength / cpl, fractional = (strength % cpl) * 1e6 / cpl
     *
     * Both lookups yield nonzero values for every register encoding, so cpl is never zero.
     */
    Lux CalculateLux(const AlsData &data, GAIN gain, INTEGRATION time);

    /**
     * @brief Driver for the TSL2591 ambient light sensor.
     *
     * Every operation is a blocking sequence of bus transactions. The driver holds no lock;
     * callers sharing one instance between tasks have to serialise whole operations.
     */
    class M
    {
    private:
        iI2CPort *i2cPort;
        GAIN gain{GAIN::LOW};
        INTEGRATION integration{INTEGRATION::_100MS};
        uint16_t gainMultiplier;
        uint16_t integrationMs;
        bool poweredOn{false};
        uint8_t observedId{0};

        template <typename F>
        ErrorCode poweredDown(F change);
        ErrorCode writeThresholds(uint8_t firstReg, uint16_t low, uint16_t high);
        ErrorCode special(uint8_t command);

    public:
        M(iI2CPort *i2cPort);
        M(const M &) = delete;
        M &operator=(const M &) = delete;

        //reset, verify device id, power on
        ErrorCode Setup(uint8_t &deviceId);
        ErrorCode Setup();

        ErrorCode Write(uint8_t reg, uint8_t value);
        ErrorCode Read(uint8_t reg, uint8_t *buf, size_t len);
        //read-modify-write, skips the write if nothing changes
        ErrorCode Update(uint8_t reg, uint8_t mask, uint8_t value);

        ErrorCode PowerOn();
        ErrorCode PowerOff();
        ErrorCode Reset();
        ErrorCode GetId(uint8_t &id);
        ErrorCode GetPackageId(uint8_t &pid);

        ErrorCode SetGain(GAIN gain);
        ErrorCode SetIntegration(INTEGRATION time);
        ErrorCode SetPersist(PERSIST persist);
        ErrorCode SetThreshold(uint16_t low, uint16_t high);
        ErrorCode SetNoPersistThreshold(uint16_t low, uint16_t high);

        ErrorCode GetStatus(Status &status);
        ErrorCode IsCycleComplete(bool &complete);
        /**
         * @brief Reads both channels in one transaction.
         *
         * With checkComplete the data valid flag must be set, otherwise INTEGRATION_CYCLE_INCOMPLETE
         * is returned before any data is read. After a valid flag was seen the ALS is re-armed.
         * ADC_SATURATED is returned with data filled in.
         */
        ErrorCode GetRawAlsData(AlsData &data, bool checkComplete);
        ErrorCode GetLux(Lux &lux, bool checkComplete);

        ErrorCode EnableInterrupt(bool enable);
        ErrorCode EnableNoPersistInterrupt(bool enable);
        ErrorCode EnableSleepAfterInterrupt(bool enable);
        ErrorCode ClearInterrupt();
        ErrorCode ClearNoPersistInterrupt();
        ErrorCode ClearAllInterrupts();
        ErrorCode ForceInterrupt();

        bool IsPoweredOn() const { return poweredOn; }
        GAIN GetGain() const { return gain; }
        INTEGRATION GetIntegration() const { return integration; }
        uint16_t GetGainMultiplier() const { return gainMultiplier; }
        uint16_t GetIntegrationMs() const { return integrationMs; }
        uint8_t GetObservedId() const { return observedId; }
    };
}
