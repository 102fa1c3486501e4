#pragma once

#include "../common/diagnostic.hpp"
#include "command.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace metatext::frontend
{
    using metatext::common::Diagnostic;

    // Removes the line terminator and any '#' comment. The result is empty
    // when the line carries no command.
    [[nodiscard]] std::string_view stripLine(std::string_view rawLine);

    [[nodiscard]] std::vector<std::string> splitFields(std::string_view text);

    class LineParser
    {
    public:
        explicit LineParser(std::string_view fileName);

        [[nodiscard]] std::optional<Command> parse(std::string_view rawLine, std::uint32_t lineNumber);
        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

    private:
        std::string m_fileName;
        std::vector<Diagnostic> m_diagnostics;
    };
} // namespace metatext::frontend
