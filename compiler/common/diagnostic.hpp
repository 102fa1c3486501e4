#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace metatext::common
{
    enum class DiagnosticKind
    {
        Grammar,
        Context,
        Semantic,
        Input,
        Render
    };

    struct SourceLocation
    {
        std::string file;
        std::uint32_t line{0};
    };

    struct Diagnostic
    {
        std::string code;
        std::string message;
        DiagnosticKind kind{DiagnosticKind::Grammar};
        SourceLocation location{};
    };

    [[nodiscard]] inline std::string_view toString(DiagnosticKind kind)
    {
        switch (kind)
        {
        case DiagnosticKind::Grammar: return "grammar";
        case DiagnosticKind::Context: return "context";
        case DiagnosticKind::Semantic: return "semantic";
        case DiagnosticKind::Input: return "input";
        case DiagnosticKind::Render: return "render";
        }
        return "unknown";
    }
} // namespace metatext::common
