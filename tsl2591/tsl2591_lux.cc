#include "tsl2591.hh"

namespace TSL2591
{
    // indexed by the AGAIN field, bits 5:4
    constexpr uint16_t GAIN_MULTIPLIER[]{1, 25, 400, 9200};
    // indexed by the ATIME field
    constexpr uint16_t INTEGRATION_MS[]{100, 200, 300, 400, 500, 600};

    uint16_t GainMultiplier(GAIN gain)
    {
        return GAIN_MULTIPLIER[((uint8_t)gain & CONFIG::AGAIN_MASK) >> 4];
    }

    uint16_t IntegrationMs(INTEGRATION time)
    {
        constexpr size_t entries = sizeof(INTEGRATION_MS) / sizeof(INTEGRATION_MS[0]);
        const size_t index = (uint8_t)time & CONFIG::ATIME_MASK;
        // ATIME 110b and 111b are reserved, treated as the longest time
        return INTEGRATION_MS[index < entries ? index : entries - 1];
    }

    Lux CalculateLux(const AlsData &data, GAIN gain, INTEGRATION time)
    {
        constexpr int64_t ONE_MILLION{1000000};
        const int64_t gainMultiplier = GainMultiplier(gain);
        const int64_t integrationMs = IntegrationMs(time);
        const int64_t visible = data.visible;
        const int64_t infrared = data.infrared;
        // counts per lux
        const int64_t cpl = integrationMs * gainMultiplier * ONE_MILLION;

        int64_t strength{0};
        if (visible > 0)
        {
            strength = (visible - infrared) * (ONE_MILLION - (infrared * ONE_MILLION) / visible) * LUX_DF;
        }

        Lux lux;
        lux.integer = (int32_t)(strength / cpl);
        lux.fractional = (int32_t)(((strength % cpl) * ONE_MILLION) / cpl);
        return lux;
    }
}
