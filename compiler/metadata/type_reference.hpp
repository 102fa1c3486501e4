#pragma once

#include "model.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace metatext::metadata
{
    // Largest magnitude a literal may have, per sign. Unsigned types accept
    // negative literals down to the signed minimum of the same width.
    struct IntegerRange
    {
        std::uint64_t positiveLimit{0};
        std::uint64_t negativeLimit{0};
    };

    // "I" followed by an ASCII upper-case and an ASCII lower-case letter.
    [[nodiscard]] bool isComInterfaceName(std::string_view name);

    [[nodiscard]] std::string toBaseIlType(std::string_view name, const Metadata& metadata);
    [[nodiscard]] std::string toIlType(const TypeReference& type, const Metadata& metadata);

    // Rewrites a depth-0 reference naming an already declared enumeration to the
    // enumeration's base type and records the enumeration as its backing enum.
    void enrich(TypeReference& type, const Metadata& metadata);

    [[nodiscard]] std::optional<IntegerRange> integerRangeOf(std::string_view ilType);
} // namespace metatext::metadata
