#include <gtest/gtest.h>

#include "services/ssid_builder.hpp"

#include <cctype>

using wifirig::services::SsidBuilder;

namespace
{
    bool is_salt_char(char c)
    {
        return std::islower(static_cast<unsigned char>(c)) || std::isdigit(static_cast<unsigned char>(c));
    }
}

TEST(SsidBuilderTest, StripsKnownTestPrefix)
{
    SsidBuilder builder("network_WiFi_SimpleConnect");
    EXPECT_EQ(builder.prefix(), "SimpleConnect_");
}

TEST(SsidBuilderTest, KeepsOtherTestNames)
{
    SsidBuilder builder("roaming");
    EXPECT_EQ(builder.prefix(), "roaming_");
}

TEST(SsidBuilderTest, AppendsSaltAndSuffix)
{
    SsidBuilder builder("network_WiFi_Demo");
    std::string ssid = builder.build("_ch1");

    ASSERT_EQ(ssid.size(), std::string("Demo_").size() + SsidBuilder::SALT_LENGTH + std::string("_ch1").size());
    EXPECT_EQ(ssid.substr(0, 5), "Demo_");
    EXPECT_EQ(ssid.substr(ssid.size() - 4), "_ch1");
    for (size_t i = 5; i < 5 + SsidBuilder::SALT_LENGTH; ++i)
    {
        EXPECT_TRUE(is_salt_char(ssid[i])) << "unexpected salt character " << ssid[i];
    }
}

TEST(SsidBuilderTest, TruncatesFromTheLeft)
{
    SsidBuilder builder("network_WiFi_AVeryLongTestNameThatGoesOnAndOn");
    std::string ssid = builder.build("_tail");

    EXPECT_EQ(ssid.size(), SsidBuilder::MAX_SSID_LENGTH);
    EXPECT_EQ(ssid.substr(ssid.size() - 5), "_tail");
}

TEST(SsidBuilderTest, SuccessiveSsidsDiffer)
{
    SsidBuilder builder("network_WiFi_Demo");
    EXPECT_NE(builder.build(""), builder.build(""));
}
