#include <gtest/gtest.h>
#include <tsl2591.hh>
#include "fake_tsl2591.hh"

using namespace TSL2591;

class AlsAcquisitionTest : public ::testing::Test
{
protected:
    FakeTsl2591 chip;
    M dev{&chip};

    void SetUp() override
    {
        ASSERT_EQ(ErrorCode::OK, dev.Setup());
        chip.log.clear();
    }
};

TEST_F(AlsAcquisitionTest, IncompleteCycleReadsNoData)
{
    chip.SetChannels(1000, 100);
    AlsData data{};
    EXPECT_EQ(ErrorCode::INTEGRATION_CYCLE_INCOMPLETE, dev.GetRawAlsData(data, true));
    EXPECT_EQ(1u, chip.ReadsFrom(REG::STATUS));
    EXPECT_EQ(0u, chip.ReadsFrom(REG::C0DATAL));
    EXPECT_EQ(0u, chip.WritesTo(REG::ENABLE));
    EXPECT_EQ(0, data.visible);
}

TEST_F(AlsAcquisitionTest, CompleteCycleIsReArmedBeforeDataRead)
{
    chip.SetStatusBits(STATUS::AVALID_MASK);
    chip.SetChannels(1000, 100);
    AlsData data{};
    ASSERT_EQ(ErrorCode::OK, dev.GetRawAlsData(data, true));
    EXPECT_EQ(1000, data.visible);
    EXPECT_EQ(100, data.infrared);

    ASSERT_EQ(6u, chip.log.size());
    EXPECT_EQ((std::vector<uint8_t>{0xA0, 0x01}), chip.log[2].out);
    EXPECT_EQ((std::vector<uint8_t>{0xA0, 0x03}), chip.log[4].out);
    EXPECT_EQ((std::vector<uint8_t>{0xB4}), chip.log[5].out);
    EXPECT_EQ(4u, chip.log[5].inLen);
    // AEN toggle clears the valid flag until the next cycle completes
    EXPECT_EQ(0, chip.regs[REG::STATUS] & STATUS::AVALID_MASK);
    EXPECT_EQ(ENABLE::POWER_ON, chip.regs[REG::ENABLE] & ENABLE::POWER_MASK);
}

TEST_F(AlsAcquisitionTest, UncheckedReadIsSingleTransaction)
{
    chip.SetChannels(0x1234, 0x0042);
    AlsData data{};
    ASSERT_EQ(ErrorCode::OK, dev.GetRawAlsData(data, false));
    EXPECT_EQ(0x1234, data.visible);
    EXPECT_EQ(0x0042, data.infrared);
    EXPECT_EQ(1u, chip.log.size());
}

TEST_F(AlsAcquisitionTest, SaturationCeilingAt100ms)
{
    AlsData data{};
    chip.SetChannels(36862, 36862);
    EXPECT_EQ(ErrorCode::OK, dev.GetRawAlsData(data, false));

    chip.SetChannels(36863, 10);
    EXPECT_EQ(ErrorCode::ADC_SATURATED, dev.GetRawAlsData(data, false));
    EXPECT_EQ(36863, data.visible);
    EXPECT_EQ(10, data.infrared);

    chip.SetChannels(100, 40000);
    EXPECT_EQ(ErrorCode::ADC_SATURATED, dev.GetRawAlsData(data, false));
    EXPECT_EQ(40000, data.infrared);
}

TEST_F(AlsAcquisitionTest, SaturationCeilingAtLongerIntegration)
{
    ASSERT_EQ(ErrorCode::OK, dev.SetIntegration(INTEGRATION::_200MS));
    AlsData data{};
    chip.SetChannels(36863, 50000);
    EXPECT_EQ(ErrorCode::OK, dev.GetRawAlsData(data, false));

    chip.SetChannels(65534, 65534);
    EXPECT_EQ(ErrorCode::OK, dev.GetRawAlsData(data, false));

    chip.SetChannels(65535, 0);
    EXPECT_EQ(ErrorCode::ADC_SATURATED, dev.GetRawAlsData(data, false));
    EXPECT_EQ(65535, data.visible);
}

TEST_F(AlsAcquisitionTest, DataReadFailurePropagates)
{
    chip.failWhen = [](const Transaction &t)
    { return t.kind == Transaction::KIND::WRITE_READ && t.out[0] == (CMD::NORMAL | REG::C0DATAL); };
    AlsData data{};
    EXPECT_EQ(ErrorCode::DEVICE_NOT_RESPONDING, dev.GetRawAlsData(data, false));
    EXPECT_EQ(ESP_FAIL, chip.GetLastError());
}

TEST_F(AlsAcquisitionTest, LuxUsesCurrentGainAndIntegration)
{
    ASSERT_EQ(ErrorCode::OK, dev.SetGain(GAIN::MED));
    ASSERT_EQ(ErrorCode::OK, dev.SetIntegration(INTEGRATION::_600MS));
    chip.SetStatusBits(STATUS::AVALID_MASK);
    chip.SetChannels(1000, 100);
    Lux lux{};
    ASSERT_EQ(ErrorCode::OK, dev.GetLux(lux, true));
    EXPECT_EQ(22, lux.integer);
    EXPECT_EQ(32000, lux.fractional);
}

TEST_F(AlsAcquisitionTest, SaturatedReadingIsNotConverted)
{
    chip.SetChannels(40000, 100);
    Lux lux{-1, -1};
    EXPECT_EQ(ErrorCode::ADC_SATURATED, dev.GetLux(lux, false));
    EXPECT_EQ(-1, lux.integer);
    EXPECT_EQ(-1, lux.fractional);
}

TEST_F(AlsAcquisitionTest, IncompleteCycleIsNotConverted)
{
    Lux lux{-1, -1};
    EXPECT_EQ(ErrorCode::INTEGRATION_CYCLE_INCOMPLETE, dev.GetLux(lux, true));
    EXPECT_EQ(-1, lux.integer);
}

TEST_F(AlsAcquisitionTest, CycleCompleteFlag)
{
    bool complete{true};
    ASSERT_EQ(ErrorCode::OK, dev.IsCycleComplete(complete));
    EXPECT_FALSE(complete);
    chip.SetStatusBits(STATUS::AVALID_MASK);
    ASSERT_EQ(ErrorCode::OK, dev.IsCycleComplete(complete));
    EXPECT_TRUE(complete);
}
