#include "attribute_blob.hpp"

namespace metatext::encoding
{
    namespace
    {
        constexpr std::size_t kPascalStringLimit = 0x7F;
        constexpr std::size_t kSerStringOneByteLimit = 0x7F;
        constexpr std::size_t kSerStringTwoByteLimit = 0x3FFF;
        constexpr std::size_t kSerStringFourByteLimit = 0x1FFFFFFF;

        char hexDigit(unsigned value)
        {
            return static_cast<char>(value < 10 ? ('0' + value) : ('A' + (value - 10)));
        }

        std::optional<std::uint8_t> hexValue(char ch)
        {
            if (ch >= '0' && ch <= '9')
            {
                return static_cast<std::uint8_t>(ch - '0');
            }
            if (ch >= 'a' && ch <= 'f')
            {
                return static_cast<std::uint8_t>(ch - 'a' + 10);
            }
            if (ch >= 'A' && ch <= 'F')
            {
                return static_cast<std::uint8_t>(ch - 'A' + 10);
            }
            return std::nullopt;
        }

        void appendBytes(ByteBuffer& buffer, std::string_view text)
        {
            buffer.reserve(buffer.size() + text.size());
            for (char ch : text)
            {
                buffer.push_back(static_cast<std::uint8_t>(ch));
            }
        }
    } // namespace

    std::optional<ByteBuffer> encodeLittleEndian(std::uint64_t value, std::size_t byteCount)
    {
        if (byteCount < sizeof(std::uint64_t) && (value >> (8 * byteCount)) != 0)
        {
            return std::nullopt;
        }

        ByteBuffer bytes;
        bytes.reserve(byteCount);
        for (std::size_t index = 0; index < byteCount; ++index)
        {
            if (index < sizeof(std::uint64_t))
            {
                bytes.push_back(static_cast<std::uint8_t>((value >> (8 * index)) & 0xFF));
            }
            else
            {
                bytes.push_back(0);
            }
        }
        return bytes;
    }

    std::uint64_t decodeLittleEndian(const ByteBuffer& bytes)
    {
        std::uint64_t value = 0;
        const std::size_t count = bytes.size() < sizeof(std::uint64_t) ? bytes.size() : sizeof(std::uint64_t);
        for (std::size_t index = count; index > 0; --index)
        {
            value = (value << 8) | bytes[index - 1];
        }
        return value;
    }

    Guid reorderGuid(const Guid& guid)
    {
        Guid reordered{};

        // Data1
        reordered[0] = guid[3];
        reordered[1] = guid[2];
        reordered[2] = guid[1];
        reordered[3] = guid[0];
        // Data2
        reordered[4] = guid[5];
        reordered[5] = guid[4];
        // Data3
        reordered[6] = guid[7];
        reordered[7] = guid[6];

        for (std::size_t index = 8; index < guid.size(); ++index)
        {
            reordered[index] = guid[index];
        }
        return reordered;
    }

    std::optional<ByteBuffer> encodePascalString(std::string_view text)
    {
        if (text.size() > kPascalStringLimit)
        {
            return std::nullopt;
        }

        ByteBuffer bytes;
        bytes.push_back(static_cast<std::uint8_t>(text.size()));
        appendBytes(bytes, text);
        return bytes;
    }

    std::optional<ByteBuffer> encodeSerString(std::string_view text)
    {
        const std::size_t length = text.size();
        ByteBuffer bytes;

        if (length <= kSerStringOneByteLimit)
        {
            // 0xxx_xxxx
            bytes.push_back(static_cast<std::uint8_t>(length));
        }
        else if (length <= kSerStringTwoByteLimit)
        {
            // 10xx_xxxx xxxx_xxxx
            bytes.push_back(static_cast<std::uint8_t>(((length >> 8) & 0x3F) | 0x80));
            bytes.push_back(static_cast<std::uint8_t>(length & 0xFF));
        }
        else if (length <= kSerStringFourByteLimit)
        {
            // 110x_xxxx xxxx_xxxx xxxx_xxxx xxxx_xxxx
            bytes.push_back(static_cast<std::uint8_t>(((length >> 24) & 0x1F) | 0xC0));
            bytes.push_back(static_cast<std::uint8_t>((length >> 16) & 0xFF));
            bytes.push_back(static_cast<std::uint8_t>((length >> 8) & 0xFF));
            bytes.push_back(static_cast<std::uint8_t>(length & 0xFF));
        }
        else
        {
            return std::nullopt;
        }

        appendBytes(bytes, text);
        return bytes;
    }

    std::optional<Guid> parseGuid(std::string_view text)
    {
        if (text.size() >= 2 && text.front() == '{' && text.back() == '}')
        {
            text = text.substr(1, text.size() - 2);
        }

        // 8-4-4-4-12
        constexpr std::size_t kCanonicalLength = 36;
        if (text.size() != kCanonicalLength)
        {
            return std::nullopt;
        }

        Guid guid{};
        std::size_t byteIndex = 0;
        std::size_t position = 0;
        while (position < text.size())
        {
            if (position == 8 || position == 13 || position == 18 || position == 23)
            {
                if (text[position] != '-')
                {
                    return std::nullopt;
                }
                ++position;
                continue;
            }

            const auto high = hexValue(text[position]);
            const auto low = hexValue(text[position + 1]);
            if (!high.has_value() || !low.has_value() || byteIndex >= guid.size())
            {
                return std::nullopt;
            }

            guid[byteIndex++] = static_cast<std::uint8_t>((*high << 4) | *low);
            position += 2;
        }

        if (byteIndex != guid.size())
        {
            return std::nullopt;
        }
        return guid;
    }

    std::string formatGuid(const Guid& guid)
    {
        std::string text;
        text.reserve(36);
        for (std::size_t index = 0; index < guid.size(); ++index)
        {
            if (index == 4 || index == 6 || index == 8 || index == 10)
            {
                text.push_back('-');
            }
            text.push_back(hexDigit((guid[index] >> 4) & 0xF));
            text.push_back(hexDigit(guid[index] & 0xF));
        }
        return text;
    }

    std::string toHex(const ByteBuffer& bytes)
    {
        std::string text;
        text.reserve(bytes.size() * 3);
        for (std::size_t index = 0; index < bytes.size(); ++index)
        {
            if (index != 0)
            {
                text.push_back(' ');
            }
            text.push_back(hexDigit((bytes[index] >> 4) & 0xF));
            text.push_back(hexDigit(bytes[index] & 0xF));
        }
        return text;
    }
} // namespace metatext::encoding
