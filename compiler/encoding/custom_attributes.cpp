#include "custom_attributes.hpp"

namespace metatext::encoding
{
    namespace
    {
        constexpr std::uint8_t kNamedArgumentField = 0x53;
        constexpr std::uint8_t kElementTypeInt16 = 0x06;
        constexpr std::uint8_t kElementTypeInt32 = 0x08;

        constexpr Guid kInterfaceGuidTemplate = {
            0x23, 0x17, 0x0F, 0x69,
            0x40, 0xC1,
            0x27, 0x8A,
            0x00, 0x00,
            0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        };
        constexpr std::size_t kInterfaceGroupOffset = 11;
        constexpr std::size_t kInterfaceValueOffset = 13;

        void appendProlog(ByteBuffer& buffer)
        {
            buffer.push_back(0x01);
            buffer.push_back(0x00);
        }

        void appendNoNamedArguments(ByteBuffer& buffer)
        {
            buffer.push_back(0x00);
            buffer.push_back(0x00);
        }

        void append(ByteBuffer& buffer, const ByteBuffer& tail)
        {
            buffer.insert(buffer.end(), tail.begin(), tail.end());
        }

        std::optional<ByteBuffer> singleNamedFieldPayload(std::uint8_t elementType,
            std::string_view fieldName,
            std::uint64_t value,
            std::size_t valueWidth)
        {
            const auto name = encodePascalString(fieldName);
            const auto encodedValue = encodeLittleEndian(value, valueWidth);
            if (!name.has_value() || !encodedValue.has_value())
            {
                return std::nullopt;
            }

            ByteBuffer payload;
            appendProlog(payload);
            // one named argument
            payload.push_back(0x01);
            payload.push_back(0x00);
            payload.push_back(kNamedArgumentField);
            payload.push_back(elementType);
            append(payload, *name);
            append(payload, *encodedValue);
            return payload;
        }
    } // namespace

    ByteBuffer markerPayload()
    {
        ByteBuffer payload;
        appendProlog(payload);
        appendNoNamedArguments(payload);
        return payload;
    }

    std::optional<ByteBuffer> countParamIndexPayload(std::uint64_t argumentIndex)
    {
        return singleNamedFieldPayload(kElementTypeInt16, "CountParamIndex", argumentIndex, 2);
    }

    std::optional<ByteBuffer> countConstPayload(std::uint64_t count)
    {
        return singleNamedFieldPayload(kElementTypeInt32, "CountConst", count, 4);
    }

    std::optional<ByteBuffer> associatedEnumPayload(std::string_view enumName)
    {
        const auto name = encodeSerString(enumName);
        if (!name.has_value())
        {
            return std::nullopt;
        }

        ByteBuffer payload;
        appendProlog(payload);
        append(payload, *name);
        appendNoNamedArguments(payload);
        return payload;
    }

    std::optional<ByteBuffer> unmanagedFunctionPointerPayload(std::uint64_t callingConvention)
    {
        const auto encoded = encodeLittleEndian(callingConvention, 4);
        if (!encoded.has_value())
        {
            return std::nullopt;
        }

        ByteBuffer payload;
        appendProlog(payload);
        append(payload, *encoded);
        appendNoNamedArguments(payload);
        return payload;
    }

    ByteBuffer guidPayload(const Guid& guid)
    {
        const Guid reordered = reorderGuid(guid);

        ByteBuffer payload;
        appendProlog(payload);
        payload.insert(payload.end(), reordered.begin(), reordered.end());
        appendNoNamedArguments(payload);
        return payload;
    }

    Guid makeInterfaceGuid(std::uint8_t group, std::uint8_t value)
    {
        Guid guid = kInterfaceGuidTemplate;
        guid[kInterfaceGroupOffset] = group;
        guid[kInterfaceValueOffset] = value;
        return guid;
    }
} // namespace metatext::encoding
