#include "type_reference.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <utility>

namespace metatext::metadata
{
    namespace
    {
        constexpr std::array<std::pair<std::string_view, std::string_view>, 30> kWellKnownTypes = {{
            {"BOOL", "valuetype [Windows.Win32.winmd]Windows.Win32.Foundation.BOOL"},
            {"BSTR", "valuetype [Windows.Win32.winmd]Windows.Win32.Foundation.BSTR"},
            {"FILETIME", "valuetype [Windows.Win32.winmd]Windows.Win32.Foundation.FILETIME"},
            {"GUID", "valuetype [netstandard]System.Guid"},
            {"HRESULT", "valuetype [Windows.Win32.winmd]Windows.Win32.Foundation.HRESULT"},
            {"IUnknown", "[Windows.Win32.winmd]Windows.Win32.System.Com.IUnknown"},
            {"PROPID", "uint32"},
            {"PROPVARIANT", "valuetype [Windows.Win32.winmd]Windows.Win32.System.Com.StructuredStorage.PROPVARIANT"},
            {"size_t", "native uint"},
            {"VARTYPE", "uint16"},
            {"INT8", "int8"},
            {"INT16", "int16"},
            {"INT32", "int32"},
            {"INT64", "int64"},
            {"UINT8", "uint8"},
            {"UINT16", "uint16"},
            {"UINT32", "uint32"},
            {"UINT64", "uint64"},
            {"BYTE", "uint8"},
            {"WORD", "uint16"},
            {"DWORD", "uint32"},
            {"ULONG", "uint32"},
            {"LONG", "int32"},
            {"ULONGLONG", "uint64"},
            {"LONGLONG", "int64"},
            {"WCHAR", "char"},
            {"VOID", "void"},
            {"PCWSTR", "valuetype [Windows.Win32.winmd]Windows.Win32.Foundation.PCWSTR"},
            {"PWSTR", "valuetype [Windows.Win32.winmd]Windows.Win32.Foundation.PWSTR"},
            {"HANDLE", "valuetype [Windows.Win32.winmd]Windows.Win32.Foundation.HANDLE"},
        }};

        constexpr std::uint64_t kInt8Negative = 0x80;
        constexpr std::uint64_t kInt16Negative = 0x8000;
        constexpr std::uint64_t kInt32Negative = 0x80000000;
        constexpr std::uint64_t kInt64Negative = 0x8000000000000000;

        constexpr std::array<std::pair<std::string_view, IntegerRange>, 9> kIntegerRanges = {{
            {"int8", {std::numeric_limits<std::int8_t>::max(), kInt8Negative}},
            {"int16", {std::numeric_limits<std::int16_t>::max(), kInt16Negative}},
            {"int32", {std::numeric_limits<std::int32_t>::max(), kInt32Negative}},
            {"int64", {std::numeric_limits<std::int64_t>::max(), kInt64Negative}},
            {"uint8", {std::numeric_limits<std::uint8_t>::max(), kInt8Negative}},
            {"uint16", {std::numeric_limits<std::uint16_t>::max(), kInt16Negative}},
            {"uint32", {std::numeric_limits<std::uint32_t>::max(), kInt32Negative}},
            {"uint64", {std::numeric_limits<std::uint64_t>::max(), kInt64Negative}},
            {"char", {std::numeric_limits<std::uint16_t>::max(), kInt16Negative}},
        }};

        bool isAsciiUpper(char ch)
        {
            return ch >= 'A' && ch <= 'Z';
        }

        bool isAsciiLower(char ch)
        {
            return ch >= 'a' && ch <= 'z';
        }

        std::string localClassName(const Metadata& metadata, std::string_view name)
        {
            return metadata.name() + "." + std::string{name};
        }
    } // namespace

    bool isComInterfaceName(std::string_view name)
    {
        return name.size() > 2 && name[0] == 'I' && isAsciiUpper(name[1]) && isAsciiLower(name[2]);
    }

    std::string toBaseIlType(std::string_view name, const Metadata& metadata)
    {
        for (const auto& [source, ilType] : kWellKnownTypes)
        {
            if (source == name)
            {
                return std::string{ilType};
            }
        }

        if (isComInterfaceName(name))
        {
            return "class " + localClassName(metadata, name);
        }

        const bool isFunctionPointer = std::any_of(metadata.functionPointers.begin(),
            metadata.functionPointers.end(),
            [name](const FunctionPointerType& pointer) { return pointer.signature.name == name; });
        if (isFunctionPointer)
        {
            return "class " + localClassName(metadata, name);
        }

        const bool isStruct = std::any_of(metadata.structs.begin(), metadata.structs.end(),
            [name](const Struct& declared) { return declared.name == name; });
        if (isStruct)
        {
            return "valuetype " + localClassName(metadata, name);
        }

        return std::string{name};
    }

    std::string toIlType(const TypeReference& type, const Metadata& metadata)
    {
        std::string result = toBaseIlType(type.name, metadata);
        result.append(type.pointerDepth, '*');
        return result;
    }

    void enrich(TypeReference& type, const Metadata& metadata)
    {
        if (type.pointerDepth != 0)
        {
            return;
        }

        const Enumeration* enumeration = metadata.findEnumeration(toBaseIlType(type.name, metadata));
        if (enumeration == nullptr)
        {
            return;
        }

        type.name = enumeration->baseType.name;
        type.pointerDepth = enumeration->baseType.pointerDepth;
        type.backingEnum = enumeration->name;
    }

    std::optional<IntegerRange> integerRangeOf(std::string_view ilType)
    {
        for (const auto& [name, range] : kIntegerRanges)
        {
            if (name == ilType)
            {
                return range;
            }
        }
        return std::nullopt;
    }
} // namespace metatext::metadata
