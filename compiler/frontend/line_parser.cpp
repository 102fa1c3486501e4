#include "line_parser.hpp"

#include <cctype>
#include <utility>

namespace metatext::frontend
{
    namespace
    {
        bool isBlank(std::string_view text)
        {
            for (char ch : text)
            {
                if (!std::isspace(static_cast<unsigned char>(ch)))
                {
                    return false;
                }
            }
            return true;
        }

        std::string_view trimRight(std::string_view text)
        {
            std::size_t end = text.size();
            while (end > 0 && std::isspace(static_cast<unsigned char>(text[end - 1])))
            {
                --end;
            }
            return text.substr(0, end);
        }
    } // namespace

    std::string_view stripLine(std::string_view rawLine)
    {
        std::string_view line = rawLine;
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
        {
            line.remove_suffix(1);
        }

        const auto hashIndex = line.find('#');
        if (hashIndex != std::string_view::npos)
        {
            line = trimRight(line.substr(0, hashIndex));
        }

        if (isBlank(line))
        {
            return std::string_view{};
        }
        return line;
    }

    std::vector<std::string> splitFields(std::string_view text)
    {
        std::vector<std::string> fields;
        std::size_t start = 0;
        while (true)
        {
            const auto tabIndex = text.find('\t', start);
            if (tabIndex == std::string_view::npos)
            {
                fields.emplace_back(text.substr(start));
                break;
            }
            fields.emplace_back(text.substr(start, tabIndex - start));
            start = tabIndex + 1;
        }
        return fields;
    }

    LineParser::LineParser(std::string_view fileName)
        : m_fileName(fileName)
    {
    }

    std::optional<Command> LineParser::parse(std::string_view rawLine, std::uint32_t lineNumber)
    {
        const std::string_view line = stripLine(rawLine);
        if (line.empty())
        {
            return std::nullopt;
        }

        std::vector<std::string> fields = splitFields(line);
        const auto kind = lookupCommand(fields.front());
        if (!kind.has_value())
        {
            Diagnostic diag;
            diag.code = "META-E1001";
            diag.message = "Unknown command '" + fields.front() + "'.";
            diag.kind = common::DiagnosticKind::Grammar;
            diag.location = {m_fileName, lineNumber};
            m_diagnostics.emplace_back(std::move(diag));
            return std::nullopt;
        }

        Command command;
        command.kind = *kind;
        command.line = lineNumber;
        command.fields = std::move(fields);
        return command;
    }

    const std::vector<Diagnostic>& LineParser::diagnostics() const noexcept
    {
        return m_diagnostics;
    }
} // namespace metatext::frontend
