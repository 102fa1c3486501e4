#include <gtest/gtest.h>

#include "type_reference.hpp"

namespace metatext::metadata
{
namespace
{
    Metadata makeMetadata()
    {
        Metadata metadata;
        metadata.header = MetadataHeader{"IgorPavlov.SevenZip", "1:0:0:0"};
        return metadata;
    }

    TEST(TypeReferenceTest, MapsWellKnownNames)
    {
        const Metadata metadata = makeMetadata();
        EXPECT_EQ(toIlType(TypeReference{"UINT32", 0, std::nullopt}, metadata), "uint32");
        EXPECT_EQ(toIlType(TypeReference{"size_t", 0, std::nullopt}, metadata), "native uint");
        EXPECT_EQ(toIlType(TypeReference{"HRESULT", 0, std::nullopt}, metadata),
            "valuetype [Windows.Win32.winmd]Windows.Win32.Foundation.HRESULT");
        EXPECT_EQ(toIlType(TypeReference{"IUnknown", 0, std::nullopt}, metadata),
            "[Windows.Win32.winmd]Windows.Win32.System.Com.IUnknown");
    }

    TEST(TypeReferenceTest, AppendsOneStarPerIndirection)
    {
        const Metadata metadata = makeMetadata();
        EXPECT_EQ(toIlType(TypeReference{"BSTR", 1, std::nullopt}, metadata),
            "valuetype [Windows.Win32.winmd]Windows.Win32.Foundation.BSTR*");
        EXPECT_EQ(toIlType(TypeReference{"void", 2, std::nullopt}, metadata), "void**");
    }

    TEST(TypeReferenceTest, TreatsInterfaceLookingNamesAsLocalClasses)
    {
        const Metadata metadata = makeMetadata();
        EXPECT_TRUE(isComInterfaceName("IInArchive"));
        EXPECT_FALSE(isComInterfaceName("INT32"));
        EXPECT_FALSE(isComInterfaceName("Ix"));
        EXPECT_FALSE(isComInterfaceName("Item"));

        EXPECT_EQ(toIlType(TypeReference{"IInStream", 1, std::nullopt}, metadata),
            "class IgorPavlov.SevenZip.IInStream*");
        EXPECT_EQ(toIlType(TypeReference{"ISTREAM", 0, std::nullopt}, metadata), "ISTREAM");
    }

    TEST(TypeReferenceTest, ResolvesFunctionPointersAndStructs)
    {
        Metadata metadata = makeMetadata();
        FunctionPointerType pointer;
        pointer.signature.name = "Func_CreateObject";
        metadata.functionPointers.push_back(pointer);
        Struct declared;
        declared.name = "ArcProps";
        metadata.structs.push_back(declared);

        EXPECT_EQ(toIlType(TypeReference{"Func_CreateObject", 0, std::nullopt}, metadata),
            "class IgorPavlov.SevenZip.Func_CreateObject");
        EXPECT_EQ(toIlType(TypeReference{"ArcProps", 1, std::nullopt}, metadata),
            "valuetype IgorPavlov.SevenZip.ArcProps*");
        EXPECT_EQ(toIlType(TypeReference{"Unrelated", 0, std::nullopt}, metadata), "Unrelated");
    }

    TEST(TypeReferenceTest, EnrichRewritesToEnumBaseType)
    {
        Metadata metadata = makeMetadata();
        Enumeration enumeration;
        enumeration.name = "ArcFlags";
        enumeration.baseType = TypeReference{"UINT32", 0, std::nullopt};
        metadata.enumerations.push_back(enumeration);
        metadata.enumerationIndex.emplace("ArcFlags", 0);

        TypeReference type{"ArcFlags", 0, std::nullopt};
        enrich(type, metadata);
        EXPECT_EQ(type.name, "UINT32");
        EXPECT_EQ(type.pointerDepth, 0u);
        ASSERT_TRUE(type.backingEnum.has_value());
        EXPECT_EQ(*type.backingEnum, "ArcFlags");
        EXPECT_EQ(toIlType(type, metadata), "uint32");
    }

    TEST(TypeReferenceTest, EnrichIgnoresPointersAndUnknownNames)
    {
        Metadata metadata = makeMetadata();
        Enumeration enumeration;
        enumeration.name = "ArcFlags";
        enumeration.baseType = TypeReference{"UINT32", 0, std::nullopt};
        metadata.enumerations.push_back(enumeration);
        metadata.enumerationIndex.emplace("ArcFlags", 0);

        TypeReference pointer{"ArcFlags", 1, std::nullopt};
        enrich(pointer, metadata);
        EXPECT_EQ(pointer.name, "ArcFlags");
        EXPECT_FALSE(pointer.backingEnum.has_value());

        TypeReference other{"UINT32", 0, std::nullopt};
        enrich(other, metadata);
        EXPECT_EQ(other.name, "UINT32");
        EXPECT_FALSE(other.backingEnum.has_value());
    }

    TEST(TypeReferenceTest, KnowsIntegerRanges)
    {
        const auto byteRange = integerRangeOf("uint8");
        ASSERT_TRUE(byteRange.has_value());
        EXPECT_EQ(byteRange->positiveLimit, 255u);
        EXPECT_EQ(byteRange->negativeLimit, 128u);

        const auto shortRange = integerRangeOf("int16");
        ASSERT_TRUE(shortRange.has_value());
        EXPECT_EQ(shortRange->positiveLimit, 32767u);
        EXPECT_EQ(shortRange->negativeLimit, 32768u);

        const auto wideRange = integerRangeOf("uint64");
        ASSERT_TRUE(wideRange.has_value());
        EXPECT_EQ(wideRange->positiveLimit, 0xFFFFFFFFFFFFFFFFull);

        EXPECT_FALSE(integerRangeOf("valuetype [netstandard]System.Guid").has_value());
    }
} // namespace
} // namespace metatext::metadata
