#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace metatext::encoding
{
    using ByteBuffer = std::vector<std::uint8_t>;

    // Canonical (textual) byte order: bytes appear as written in
    // "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx".
    using Guid = std::array<std::uint8_t, 16>;

    [[nodiscard]] std::optional<ByteBuffer> encodeLittleEndian(std::uint64_t value, std::size_t byteCount);
    [[nodiscard]] std::uint64_t decodeLittleEndian(const ByteBuffer& bytes);

    // Swaps the Data1/Data2/Data3 groups into the little-endian layout the
    // GuidAttribute constructor arguments use; Data4 is copied unchanged.
    [[nodiscard]] Guid reorderGuid(const Guid& guid);

    [[nodiscard]] std::optional<ByteBuffer> encodePascalString(std::string_view text);
    [[nodiscard]] std::optional<ByteBuffer> encodeSerString(std::string_view text);

    [[nodiscard]] std::optional<Guid> parseGuid(std::string_view text);
    [[nodiscard]] std::string formatGuid(const Guid& guid);

    [[nodiscard]] std::string toHex(const ByteBuffer& bytes);
} // namespace metatext::encoding
