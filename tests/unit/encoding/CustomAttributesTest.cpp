#include <gtest/gtest.h>

#include "custom_attributes.hpp"

namespace metatext::encoding
{
namespace
{
    TEST(CustomAttributesTest, MarkerPayloadHasNoArguments)
    {
        EXPECT_EQ(toHex(markerPayload()), "01 00 00 00");
    }

    TEST(CustomAttributesTest, CountParamIndexUsesInt16NamedField)
    {
        const auto payload = countParamIndexPayload(2);
        ASSERT_TRUE(payload.has_value());
        EXPECT_EQ(toHex(*payload),
            "01 00 01 00 53 06 0F 43 6F 75 6E 74 50 61 72 61 6D 49 6E 64 65 78 02 00");
        EXPECT_FALSE(countParamIndexPayload(0x10000).has_value());
    }

    TEST(CustomAttributesTest, CountConstUsesInt32NamedField)
    {
        const auto payload = countConstPayload(260);
        ASSERT_TRUE(payload.has_value());
        EXPECT_EQ(toHex(*payload), "01 00 01 00 53 08 0A 43 6F 75 6E 74 43 6F 6E 73 74 04 01 00 00");
    }

    TEST(CustomAttributesTest, AssociatedEnumCarriesSerString)
    {
        const auto payload = associatedEnumPayload("ArcFlags");
        ASSERT_TRUE(payload.has_value());
        EXPECT_EQ(toHex(*payload), "01 00 08 41 72 63 46 6C 61 67 73 00 00");
    }

    TEST(CustomAttributesTest, UnmanagedFunctionPointerCarriesCallingConvention)
    {
        const auto payload = unmanagedFunctionPointerPayload(1);
        ASSERT_TRUE(payload.has_value());
        EXPECT_EQ(toHex(*payload), "01 00 01 00 00 00 00 00");
        EXPECT_FALSE(unmanagedFunctionPointerPayload(0x100000000ull).has_value());
    }

    TEST(CustomAttributesTest, InterfaceGuidSubstitutesGroupAndValue)
    {
        const Guid guid = makeInterfaceGuid(0x05, 0x09);
        EXPECT_EQ(formatGuid(guid), "23170F69-40C1-278A-0000-000500090000");

        const ByteBuffer payload = guidPayload(guid);
        ASSERT_EQ(payload.size(), 20u);
        EXPECT_EQ(toHex(payload), "01 00 69 0F 17 23 C1 40 8A 27 00 00 00 05 00 09 00 00 00 00");
        EXPECT_EQ(payload[13], 0x05);
        EXPECT_EQ(payload[15], 0x09);
    }

    TEST(CustomAttributesTest, InterfaceGuidTemplateIsStableForOtherBytes)
    {
        const ByteBuffer zero = guidPayload(makeInterfaceGuid(0, 0));
        const ByteBuffer full = guidPayload(makeInterfaceGuid(0xFF, 0xFF));
        ASSERT_EQ(zero.size(), full.size());
        for (std::size_t index = 0; index < zero.size(); ++index)
        {
            if (index == 13 || index == 15)
            {
                EXPECT_EQ(zero[index], 0x00);
                EXPECT_EQ(full[index], 0xFF);
            }
            else
            {
                EXPECT_EQ(zero[index], full[index]) << "byte " << index;
            }
        }
    }
} // namespace
} // namespace metatext::encoding
