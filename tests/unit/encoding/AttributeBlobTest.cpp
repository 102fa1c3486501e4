#include <gtest/gtest.h>

#include "attribute_blob.hpp"

#include <cstdint>
#include <string>

namespace metatext::encoding
{
namespace
{
    TEST(AttributeBlobTest, LittleEndianPutsLeastSignificantByteFirst)
    {
        const auto bytes = encodeLittleEndian(0x12345678u, 4);
        ASSERT_TRUE(bytes.has_value());
        EXPECT_EQ(toHex(*bytes), "78 56 34 12");

        const auto widened = encodeLittleEndian(3, 2);
        ASSERT_TRUE(widened.has_value());
        EXPECT_EQ(toHex(*widened), "03 00");
    }

    TEST(AttributeBlobTest, LittleEndianRejectsValuesThatDoNotFit)
    {
        EXPECT_FALSE(encodeLittleEndian(256, 1).has_value());
        EXPECT_FALSE(encodeLittleEndian(0x10000, 2).has_value());
        EXPECT_TRUE(encodeLittleEndian(0xFFFF, 2).has_value());
        EXPECT_FALSE(encodeLittleEndian(1, 0).has_value());
    }

    TEST(AttributeBlobTest, LittleEndianDecodesWhatItEncodes)
    {
        const std::uint64_t samples[] = {0u, 1u, 0x7Fu, 0x80u, 0xFFu, 0x1234u, 0xFFFFFFFFu, 0x0102030405060708u};
        for (std::size_t byteCount = 1; byteCount <= 8; ++byteCount)
        {
            for (std::uint64_t sample : samples)
            {
                if (byteCount < 8 && (sample >> (8 * byteCount)) != 0)
                {
                    continue;
                }
                const auto bytes = encodeLittleEndian(sample, byteCount);
                ASSERT_TRUE(bytes.has_value()) << sample << " in " << byteCount << " bytes";
                EXPECT_EQ(bytes->size(), byteCount);
                EXPECT_EQ(decodeLittleEndian(*bytes), sample);
            }
        }
    }

    TEST(AttributeBlobTest, ReordersGuidGroupsIntoAttributeLayout)
    {
        const auto guid = parseGuid("23170F69-40C1-278A-0000-000500090000");
        ASSERT_TRUE(guid.has_value());

        const Guid reordered = reorderGuid(*guid);
        const ByteBuffer bytes(reordered.begin(), reordered.end());
        EXPECT_EQ(toHex(bytes), "69 0F 17 23 C1 40 8A 27 00 00 00 05 00 09 00 00");
    }

    TEST(AttributeBlobTest, ParsesAndFormatsGuids)
    {
        const auto braced = parseGuid("{00000000-0000-0000-C000-000000000046}");
        ASSERT_TRUE(braced.has_value());
        EXPECT_EQ(formatGuid(*braced), "00000000-0000-0000-C000-000000000046");

        const auto lower = parseGuid("6b29fc40-ca47-1067-b31d-00dd010662da");
        ASSERT_TRUE(lower.has_value());
        EXPECT_EQ(formatGuid(*lower), "6B29FC40-CA47-1067-B31D-00DD010662DA");

        EXPECT_FALSE(parseGuid("6b29fc40ca471067b31d00dd010662da").has_value());
        EXPECT_FALSE(parseGuid("6b29fc40-ca47-1067-b31d-00dd010662dz").has_value());
        EXPECT_FALSE(parseGuid("").has_value());
    }

    TEST(AttributeBlobTest, PascalStringOfEmptyTextIsSingleZeroByte)
    {
        const auto bytes = encodePascalString("");
        ASSERT_TRUE(bytes.has_value());
        EXPECT_EQ(toHex(*bytes), "00");
    }

    TEST(AttributeBlobTest, PascalStringCarriesLengthThenBytes)
    {
        const auto bytes = encodePascalString("CountConst");
        ASSERT_TRUE(bytes.has_value());
        EXPECT_EQ(toHex(*bytes), "0A 43 6F 75 6E 74 43 6F 6E 73 74");

        EXPECT_TRUE(encodePascalString(std::string(127, 'a')).has_value());
        EXPECT_FALSE(encodePascalString(std::string(128, 'a')).has_value());
    }

    TEST(AttributeBlobTest, SerStringUsesOneBytePrefixUpTo0x7F)
    {
        const auto bytes = encodeSerString(std::string(0x7F, 'x'));
        ASSERT_TRUE(bytes.has_value());
        ASSERT_EQ(bytes->size(), 1u + 0x7F);
        EXPECT_EQ((*bytes)[0], 0x7F);
        EXPECT_EQ((*bytes)[0] & 0x80, 0);
        EXPECT_EQ((*bytes)[1], 'x');
    }

    TEST(AttributeBlobTest, SerStringUsesTwoBytePrefixFrom0x80)
    {
        const auto bytes = encodeSerString(std::string(0x80, 'x'));
        ASSERT_TRUE(bytes.has_value());
        ASSERT_EQ(bytes->size(), 2u + 0x80);
        EXPECT_EQ((*bytes)[0] & 0xC0, 0x80);
        EXPECT_EQ((*bytes)[0], 0x80);
        EXPECT_EQ((*bytes)[1], 0x80);

        const auto largest = encodeSerString(std::string(0x3FFF, 'x'));
        ASSERT_TRUE(largest.has_value());
        EXPECT_EQ((*largest)[0], 0xBF);
        EXPECT_EQ((*largest)[1], 0xFF);
        EXPECT_EQ(largest->size(), 2u + 0x3FFF);
    }

    TEST(AttributeBlobTest, SerStringUsesFourBytePrefixFrom0x4000)
    {
        const auto bytes = encodeSerString(std::string(0x4000, 'x'));
        ASSERT_TRUE(bytes.has_value());
        ASSERT_EQ(bytes->size(), 4u + 0x4000);
        EXPECT_EQ((*bytes)[0] & 0xE0, 0xC0);
        EXPECT_EQ((*bytes)[0], 0xC0);
        EXPECT_EQ((*bytes)[1], 0x00);
        EXPECT_EQ((*bytes)[2], 0x40);
        EXPECT_EQ((*bytes)[3], 0x00);
    }

    TEST(AttributeBlobTest, SerStringEncodesUtf8Bytes)
    {
        const auto bytes = encodeSerString("\xC3\xA9t\xC3\xA9");
        ASSERT_TRUE(bytes.has_value());
        EXPECT_EQ(toHex(*bytes), "05 C3 A9 74 C3 A9");
    }
} // namespace
} // namespace metatext::encoding
