#include <gtest/gtest.h>
#include <errorcodes.hh>

TEST(ErrorCodeTest, NamesFollowEnumOrder)
{
    EXPECT_EQ(0, (int)ErrorCode::OK);
    EXPECT_STREQ("OK", ErrorCodeStr[(int)ErrorCode::OK]);
    EXPECT_STREQ("DEVICE_NOT_RESPONDING", ErrorCodeStr[(int)ErrorCode::DEVICE_NOT_RESPONDING]);
    EXPECT_STREQ("TIMEOUT", ErrorCodeStr[(int)ErrorCode::TIMEOUT]);
    EXPECT_STREQ("INVALID_ARGUMENT_VALUES", ErrorCodeStr[(int)ErrorCode::INVALID_ARGUMENT_VALUES]);
    EXPECT_STREQ("UNEXPECTED_DEVICE_ID", ErrorCodeStr[(int)ErrorCode::UNEXPECTED_DEVICE_ID]);
    EXPECT_STREQ("ADC_SATURATED", ErrorCodeStr[(int)ErrorCode::ADC_SATURATED]);
    EXPECT_STREQ("INTEGRATION_CYCLE_INCOMPLETE", ErrorCodeStr[(int)ErrorCode::INTEGRATION_CYCLE_INCOMPLETE]);
}

TEST(ErrorCodeTest, TableHasOneNamePerCode)
{
    constexpr size_t names = sizeof(ErrorCodeStr) / sizeof(ErrorCodeStr[0]);
    EXPECT_EQ((size_t)ErrorCode::INTEGRATION_CYCLE_INCOMPLETE + 1, names);
}
