#pragma once

#include "../common/diagnostic.hpp"
#include "../frontend/command.hpp"
#include "../frontend/source_reader.hpp"
#include "model.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace metatext::metadata
{
    using metatext::common::Diagnostic;
    using metatext::common::DiagnosticKind;

    // Walks definition files line by line and builds the Metadata model.
    // Collection stops at the first diagnostic; the model is only meaningful
    // when collectPath() returned true.
    class Collector
    {
    public:
        static constexpr std::uint32_t kMaxIncludeDepth = 64;

        Collector() = default;

        [[nodiscard]] bool collectPath(const std::filesystem::path& path);
        [[nodiscard]] bool collectSource(const frontend::SourceFile& source);

        [[nodiscard]] const Metadata& metadata() const noexcept;
        [[nodiscard]] Metadata takeMetadata();
        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

    private:
        struct FreeFunctionSlot
        {
            std::size_t functionIndex{0};
        };

        struct FunctionPointerSlot
        {
            std::size_t pointerIndex{0};
        };

        struct MethodSlot
        {
            std::size_t interfaceIndex{0};
            std::size_t methodIndex{0};
        };

        using FunctionLikeSlot = std::variant<FreeFunctionSlot, FunctionPointerSlot, MethodSlot>;

        // The header slot is Metadata::header itself.
        struct Context
        {
            std::optional<std::string> dll;
            std::optional<FunctionLikeSlot> functionLike;
            std::optional<std::size_t> interfaceIndex;
            std::optional<std::size_t> enumerationIndex;
            std::optional<std::size_t> structIndex;
        };

        bool collectSourceAtDepth(const frontend::SourceFile& source, std::uint32_t depth);
        bool dispatch(const frontend::Command& command, std::uint32_t depth);

        bool handleMeta(const frontend::Command& command);
        bool handleFunctionPointer(const frontend::Command& command);
        bool handleDll(const frontend::Command& command);
        bool handleFunction(const frontend::Command& command);
        bool handleArgument(const frontend::Command& command, bool isOptional);
        bool handleInterface(const frontend::Command& command);
        bool handleMethod(const frontend::Command& command);
        bool handleStandardMethod(const frontend::Command& command);
        bool handleInclude(const frontend::Command& command, std::uint32_t depth);
        bool handleEnumeration(const frontend::Command& command, bool isFlags);
        bool handleVariant(const frontend::Command& command);
        bool handleStruct(const frontend::Command& command);
        bool handleField(const frontend::Command& command);
        bool handleGuidConstant(const frontend::Command& command);

        bool applyArgumentAttributes(const frontend::Command& command, std::string_view words, Argument& argument);

        FunctionSignature& currentSignature();
        TypeReference makeEnrichedType(std::string name, std::uint32_t pointerDepth) const;

        bool expectFieldCount(const frontend::Command& command, std::size_t minimum, std::size_t maximum);
        bool requireHeader(const frontend::Command& command);
        bool requireContext(const frontend::Command& command, bool present, std::string_view code, std::string_view contextName);
        std::optional<std::int64_t> parseInteger(const frontend::Command& command, std::size_t fieldIndex, std::string_view what);
        std::optional<std::uint32_t> parseDepth(const frontend::Command& command, std::size_t fieldIndex);

        bool fail(DiagnosticKind kind, std::string code, std::string message, std::uint32_t line);

    private:
        Metadata m_metadata;
        Context m_context;
        std::vector<Diagnostic> m_diagnostics;
        std::filesystem::path m_currentFile;
    };
} // namespace metatext::metadata
