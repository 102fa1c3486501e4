#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace metatext::frontend
{
    enum class CommandKind : std::uint16_t
    {
        Meta,
        FunctionPointer,
        Dll,
        Function,
        Argument,
        OptionalArgument,
        Interface,
        Method,
        StandardMethod,
        Include,
        Enumeration,
        FlagsEnumeration,
        Variant,
        Struct,
        Field,
        GuidConstant
    };

    struct Command
    {
        CommandKind kind{CommandKind::Meta};
        std::uint32_t line{0};
        // fields[0] is the keyword itself
        std::vector<std::string> fields;

        [[nodiscard]] std::size_t fieldCount() const noexcept
        {
            return fields.size();
        }
    };

    [[nodiscard]] std::optional<CommandKind> lookupCommand(std::string_view keyword);
    [[nodiscard]] std::string_view toString(CommandKind kind);
    [[nodiscard]] std::string_view usage(CommandKind kind);
} // namespace metatext::frontend
