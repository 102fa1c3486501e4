#pragma once

#include "../encoding/attribute_blob.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace metatext::metadata
{
    struct TypeReference
    {
        std::string name;
        std::uint32_t pointerDepth{0};
        // Set by enrichment only.
        std::optional<std::string> backingEnum;
    };

    enum class ArgumentDirection
    {
        In,
        Out,
        InOut
    };

    [[nodiscard]] inline bool isIn(ArgumentDirection direction) noexcept
    {
        return direction == ArgumentDirection::In || direction == ArgumentDirection::InOut;
    }

    [[nodiscard]] inline bool isOut(ArgumentDirection direction) noexcept
    {
        return direction == ArgumentDirection::Out || direction == ArgumentDirection::InOut;
    }

    enum class ArraySizeKind
    {
        None,
        CountInArgument,
        ConstantCount
    };

    struct ArraySize
    {
        ArraySizeKind kind{ArraySizeKind::None};
        std::uint64_t value{0};
    };

    struct Argument
    {
        std::string name;
        TypeReference type;
        ArgumentDirection direction{ArgumentDirection::In};
        bool isOptional{false};
        bool isConst{false};
        bool isComOutPointer{false};
        ArraySize arraySize{};

        [[nodiscard]] bool hasAttributePayloads() const noexcept
        {
            return isConst || isComOutPointer || arraySize.kind != ArraySizeKind::None || type.backingEnum.has_value();
        }
    };

    struct FunctionSignature
    {
        std::string name;
        TypeReference returnType;
        std::vector<Argument> arguments;
    };

    struct FreeFunction
    {
        FunctionSignature signature;
        std::string dll;
        std::string callingConvention{"winapi"};
    };

    struct FunctionPointerType
    {
        // System.Runtime.InteropServices.CallingConvention.Winapi
        static constexpr std::uint32_t kDefaultCallingConvention = 1;

        FunctionSignature signature;
        std::uint32_t callingConventionCode{kDefaultCallingConvention};
    };

    struct InterfaceMethod
    {
        FunctionSignature signature;
    };

    struct Interface
    {
        std::string name;
        std::uint8_t group{0};
        std::uint8_t value{0};
        TypeReference baseType;
        std::vector<InterfaceMethod> methods;
    };

    // Literal value as written: a magnitude plus a sign.
    struct EnumVariant
    {
        std::string name;
        std::uint64_t magnitude{0};
        bool isNegative{false};

        [[nodiscard]] std::string valueText() const
        {
            return (isNegative ? "-" : "") + std::to_string(magnitude);
        }
    };

    struct Enumeration
    {
        std::string name;
        TypeReference baseType;
        bool isFlags{false};
        std::vector<EnumVariant> variants;
        std::unordered_map<std::string, std::size_t> variantIndex;

        [[nodiscard]] bool hasVariant(const std::string& variantName) const
        {
            return variantIndex.find(variantName) != variantIndex.end();
        }
    };

    struct StructField
    {
        std::string name;
        TypeReference type;
    };

    struct Struct
    {
        std::string name;
        std::vector<StructField> fields;
    };

    struct GuidConstant
    {
        std::string name;
        encoding::Guid guid{};
        std::string displayText;
    };

    struct MetadataHeader
    {
        std::string name;
        std::string version;
    };

    struct Metadata
    {
        std::optional<MetadataHeader> header;
        std::vector<FreeFunction> functions;
        std::vector<FunctionPointerType> functionPointers;
        std::vector<Interface> interfaces;
        std::vector<Enumeration> enumerations;
        std::unordered_map<std::string, std::size_t> enumerationIndex;
        std::vector<Struct> structs;
        std::vector<GuidConstant> guidConstants;
        // lower-cased; std::set keeps the emission order sorted
        std::set<std::string> importedDlls;

        [[nodiscard]] const Enumeration* findEnumeration(const std::string& enumName) const
        {
            const auto found = enumerationIndex.find(enumName);
            if (found == enumerationIndex.end())
            {
                return nullptr;
            }
            return &enumerations[found->second];
        }

        [[nodiscard]] const std::string& name() const
        {
            static const std::string empty;
            return header.has_value() ? header->name : empty;
        }
    };
} // namespace metatext::metadata
