#include <gtest/gtest.h>
#include "../src/Version.h"

#include <string>

TEST(VersionTest, String_ExpandsComponentsToDigits)
{
    const std::string expected = std::to_string(TESSERA_VERSION_MAJOR) + "." +
                                 std::to_string(TESSERA_VERSION_MINOR) + "." +
                                 std::to_string(TESSERA_VERSION_PATCH);
    EXPECT_EQ(std::string(TESSERA_VERSION), expected);
    EXPECT_EQ(std::string(TESSERA_VERSION).find("TESSERA"), std::string::npos);
}

TEST(VersionTest, Struct_MatchesMacros)
{
    EXPECT_EQ(kTesseraVersion.major, static_cast<uint32_t>(TESSERA_VERSION_MAJOR));
    EXPECT_EQ(kTesseraVersion.minor, static_cast<uint32_t>(TESSERA_VERSION_MINOR));
    EXPECT_EQ(kTesseraVersion.patch, static_cast<uint32_t>(TESSERA_VERSION_PATCH));
}

TEST(VersionTest, Compare_OrdersByComponent)
{
    EXPECT_LT((TesseraVersion{1, 2, 9}), (TesseraVersion{1, 3, 0}));
    EXPECT_LT((TesseraVersion{0, 9, 9}), (TesseraVersion{1, 0, 0}));
    EXPECT_EQ((TesseraVersion{1, 2, 3}).Packed(), 0x01020003u);
    EXPECT_LT((TesseraVersion{1, 2, 9}).Packed(), (TesseraVersion{1, 3, 0}).Packed());
}
