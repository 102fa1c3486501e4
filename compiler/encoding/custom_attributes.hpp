#pragma once

#include "attribute_blob.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace metatext::encoding
{
    // Every payload starts with the 01 00 prolog and ends with the
    // named-argument count, as ECMA-335 II.23.3 lays out custom attributes.

    [[nodiscard]] ByteBuffer markerPayload();
    [[nodiscard]] std::optional<ByteBuffer> countParamIndexPayload(std::uint64_t argumentIndex);
    [[nodiscard]] std::optional<ByteBuffer> countConstPayload(std::uint64_t count);
    [[nodiscard]] std::optional<ByteBuffer> associatedEnumPayload(std::string_view enumName);
    [[nodiscard]] std::optional<ByteBuffer> unmanagedFunctionPointerPayload(std::uint64_t callingConvention);
    [[nodiscard]] ByteBuffer guidPayload(const Guid& guid);

    // 23170F69-40C1-278A-0000-00gg00vv0000
    [[nodiscard]] Guid makeInterfaceGuid(std::uint8_t group, std::uint8_t value);
} // namespace metatext::encoding
