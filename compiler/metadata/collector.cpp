#include "collector.hpp"

#include "../frontend/line_parser.hpp"
#include "type_reference.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <limits>
#include <system_error>
#include <utility>

namespace metatext::metadata
{
    namespace
    {
        constexpr std::array<std::string_view, 5> kCallingConventions = {
            "winapi", "cdecl", "stdcall", "thiscall", "fastcall"};

        constexpr std::string_view kResultCodeType = "HRESULT";

        std::optional<std::uint64_t> parseUnsignedText(std::string_view text, int base)
        {
            if (text.empty())
            {
                return std::nullopt;
            }

            std::uint64_t value = 0;
            const char* end = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(text.data(), end, value, base);
            if (ec != std::errc{} || ptr != end)
            {
                return std::nullopt;
            }
            return value;
        }

        struct IntegerLiteral
        {
            std::uint64_t magnitude{0};
            bool isNegative{false};
        };

        // Optional sign, then decimal or 0x-prefixed hex digits. "-0" is not negative.
        std::optional<IntegerLiteral> parseIntegerLiteral(std::string_view text)
        {
            bool negative = false;
            if (!text.empty() && (text.front() == '-' || text.front() == '+'))
            {
                negative = text.front() == '-';
                text.remove_prefix(1);
            }

            int base = 10;
            if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
            {
                base = 16;
                text.remove_prefix(2);
            }

            const auto magnitude = parseUnsignedText(text, base);
            if (!magnitude.has_value())
            {
                return std::nullopt;
            }
            return IntegerLiteral{*magnitude, negative && *magnitude != 0};
        }

        std::optional<std::int64_t> parseSignedText(std::string_view text)
        {
            const auto literal = parseIntegerLiteral(text);
            if (!literal.has_value())
            {
                return std::nullopt;
            }

            constexpr auto kMaximum = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
            if (literal->isNegative)
            {
                if (literal->magnitude > kMaximum + 1)
                {
                    return std::nullopt;
                }
                if (literal->magnitude == kMaximum + 1)
                {
                    return std::numeric_limits<std::int64_t>::min();
                }
                return -static_cast<std::int64_t>(literal->magnitude);
            }

            if (literal->magnitude > kMaximum)
            {
                return std::nullopt;
            }
            return static_cast<std::int64_t>(literal->magnitude);
        }

        // "ca12" or "cc4"; the prefix must be followed by decimal digits only.
        bool hasCountPrefix(std::string_view word, std::string_view prefix)
        {
            if (word.size() <= prefix.size() || word.compare(0, prefix.size(), prefix) != 0)
            {
                return false;
            }
            for (std::size_t index = prefix.size(); index < word.size(); ++index)
            {
                if (word[index] < '0' || word[index] > '9')
                {
                    return false;
                }
            }
            return true;
        }

        std::optional<ArgumentDirection> parseDirection(std::string_view text)
        {
            if (text == "in")
            {
                return ArgumentDirection::In;
            }
            if (text == "out")
            {
                return ArgumentDirection::Out;
            }
            if (text == "inout")
            {
                return ArgumentDirection::InOut;
            }
            return std::nullopt;
        }

        std::string toLower(std::string_view text)
        {
            std::string lowered;
            lowered.reserve(text.size());
            for (char ch : text)
            {
                lowered.push_back((ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch);
            }
            return lowered;
        }
    } // namespace

    bool Collector::collectPath(const std::filesystem::path& path)
    {
        const auto source = frontend::readSourceFile(path);
        if (!source.has_value())
        {
            Diagnostic diag;
            diag.code = "META-E4001";
            diag.message = "Unable to open definition file '" + path.string() + "'.";
            diag.kind = DiagnosticKind::Input;
            diag.location = {path.string(), 0};
            m_diagnostics.emplace_back(std::move(diag));
            return false;
        }

        return collectSourceAtDepth(*source, 0);
    }

    bool Collector::collectSource(const frontend::SourceFile& source)
    {
        return collectSourceAtDepth(source, 0);
    }

    const Metadata& Collector::metadata() const noexcept
    {
        return m_metadata;
    }

    Metadata Collector::takeMetadata()
    {
        return std::move(m_metadata);
    }

    const std::vector<Diagnostic>& Collector::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    bool Collector::collectSourceAtDepth(const frontend::SourceFile& source, std::uint32_t depth)
    {
        std::filesystem::path enclosingFile = std::move(m_currentFile);
        m_currentFile = source.path;

        frontend::LineParser parser{source.path.string()};
        bool success = true;
        std::uint32_t lineNumber = 0;
        for (const auto& rawLine : source.lines)
        {
            ++lineNumber;
            const auto command = parser.parse(rawLine, lineNumber);
            if (!parser.diagnostics().empty())
            {
                m_diagnostics.insert(m_diagnostics.end(), parser.diagnostics().begin(), parser.diagnostics().end());
                success = false;
                break;
            }

            if (!command.has_value())
            {
                continue;
            }

            if (!dispatch(*command, depth))
            {
                success = false;
                break;
            }
        }

        m_currentFile = std::move(enclosingFile);
        return success;
    }

    bool Collector::dispatch(const frontend::Command& command, std::uint32_t depth)
    {
        switch (command.kind)
        {
        case frontend::CommandKind::Meta: return handleMeta(command);
        case frontend::CommandKind::FunctionPointer: return handleFunctionPointer(command);
        case frontend::CommandKind::Dll: return handleDll(command);
        case frontend::CommandKind::Function: return handleFunction(command);
        case frontend::CommandKind::Argument: return handleArgument(command, false);
        case frontend::CommandKind::OptionalArgument: return handleArgument(command, true);
        case frontend::CommandKind::Interface: return handleInterface(command);
        case frontend::CommandKind::Method: return handleMethod(command);
        case frontend::CommandKind::StandardMethod: return handleStandardMethod(command);
        case frontend::CommandKind::Include: return handleInclude(command, depth);
        case frontend::CommandKind::Enumeration: return handleEnumeration(command, false);
        case frontend::CommandKind::FlagsEnumeration: return handleEnumeration(command, true);
        case frontend::CommandKind::Variant: return handleVariant(command);
        case frontend::CommandKind::Struct: return handleStruct(command);
        case frontend::CommandKind::Field: return handleField(command);
        case frontend::CommandKind::GuidConstant: return handleGuidConstant(command);
        }

        return fail(DiagnosticKind::Grammar, "META-E1001", "Unknown command.", command.line);
    }

    bool Collector::handleMeta(const frontend::Command& command)
    {
        if (!expectFieldCount(command, 3, 3))
        {
            return false;
        }

        if (m_metadata.header.has_value())
        {
            return fail(DiagnosticKind::Semantic, "META-E3001",
                "Duplicate 'meta' declaration; metadata '" + m_metadata.header->name + "' is already declared.",
                command.line);
        }

        m_metadata.header = MetadataHeader{command.fields[1], command.fields[2]};
        return true;
    }

    bool Collector::handleFunctionPointer(const frontend::Command& command)
    {
        if (!expectFieldCount(command, 4, 5) || !requireHeader(command))
        {
            return false;
        }

        const auto returnDepth = parseDepth(command, 3);
        if (!returnDepth.has_value())
        {
            return false;
        }

        FunctionPointerType pointer;
        if (command.fieldCount() == 5)
        {
            const auto code = parseInteger(command, 4, "calling convention code");
            if (!code.has_value())
            {
                return false;
            }
            if (*code < 0 || *code > std::numeric_limits<std::uint32_t>::max())
            {
                return fail(DiagnosticKind::Semantic, "META-E3011",
                    "Calling convention code " + std::to_string(*code) + " does not fit in 4 bytes.", command.line);
            }
            pointer.callingConventionCode = static_cast<std::uint32_t>(*code);
        }

        pointer.signature.name = command.fields[1];
        pointer.signature.returnType = makeEnrichedType(command.fields[2], *returnDepth);
        m_metadata.functionPointers.emplace_back(std::move(pointer));
        m_context.functionLike = FunctionPointerSlot{m_metadata.functionPointers.size() - 1};
        return true;
    }

    bool Collector::handleDll(const frontend::Command& command)
    {
        if (!expectFieldCount(command, 2, 2) || !requireHeader(command))
        {
            return false;
        }

        m_context.dll = command.fields[1];
        m_metadata.importedDlls.insert(toLower(command.fields[1]));
        return true;
    }

    bool Collector::handleFunction(const frontend::Command& command)
    {
        if (!expectFieldCount(command, 4, 5) || !requireHeader(command)
            || !requireContext(command, m_context.dll.has_value(), "META-E2002", "dll"))
        {
            return false;
        }

        const auto returnDepth = parseDepth(command, 3);
        if (!returnDepth.has_value())
        {
            return false;
        }

        FreeFunction function;
        if (command.fieldCount() == 5)
        {
            const std::string& convention = command.fields[4];
            if (std::find(kCallingConventions.begin(), kCallingConventions.end(), convention) == kCallingConventions.end())
            {
                return fail(DiagnosticKind::Grammar, "META-E1006",
                    "Unknown calling convention '" + convention + "'; expected winapi, cdecl, stdcall, thiscall or fastcall.",
                    command.line);
            }
            function.callingConvention = convention;
        }

        function.signature.name = command.fields[1];
        function.signature.returnType = makeEnrichedType(command.fields[2], *returnDepth);
        function.dll = *m_context.dll;
        m_metadata.functions.emplace_back(std::move(function));
        m_context.functionLike = FreeFunctionSlot{m_metadata.functions.size() - 1};
        return true;
    }

    bool Collector::handleArgument(const frontend::Command& command, bool isOptional)
    {
        if (!expectFieldCount(command, 5, 6) || !requireHeader(command)
            || !requireContext(command, m_context.functionLike.has_value(), "META-E2003", "fn, fptr or meth"))
        {
            return false;
        }

        const auto direction = parseDirection(command.fields[1]);
        if (!direction.has_value())
        {
            return fail(DiagnosticKind::Grammar, "META-E1004",
                "Unknown argument direction '" + command.fields[1] + "'; expected in, out or inout.", command.line);
        }

        const auto depth = parseDepth(command, 4);
        if (!depth.has_value())
        {
            return false;
        }

        Argument argument;
        argument.name = command.fields[2];
        argument.direction = *direction;
        argument.isOptional = isOptional;

        if (command.fieldCount() == 6 && !applyArgumentAttributes(command, command.fields[5], argument))
        {
            return false;
        }

        argument.type = makeEnrichedType(command.fields[3], *depth);
        currentSignature().arguments.emplace_back(std::move(argument));
        return true;
    }

    bool Collector::applyArgumentAttributes(const frontend::Command& command, std::string_view words, Argument& argument)
    {
        std::size_t start = 0;
        while (start <= words.size())
        {
            std::size_t end = words.find(' ', start);
            if (end == std::string_view::npos)
            {
                end = words.size();
            }

            const std::string_view word = words.substr(start, end - start);
            start = end + 1;
            if (word.empty())
            {
                continue;
            }

            if (word == "const")
            {
                argument.isConst = true;
                continue;
            }

            if (word == "com_out")
            {
                argument.isComOutPointer = true;
                continue;
            }

            const bool isCountInArgument = hasCountPrefix(word, "ca");
            const bool isConstantCount = hasCountPrefix(word, "cc");
            if (!isCountInArgument && !isConstantCount)
            {
                return fail(DiagnosticKind::Grammar, "META-E1005",
                    "Unknown argument attribute '" + std::string{word} + "'; expected const, com_out, ca<N> or cc<N>.",
                    command.line);
            }

            if (argument.arraySize.kind != ArraySizeKind::None)
            {
                return fail(DiagnosticKind::Semantic, "META-E3006",
                    "Argument '" + argument.name + "' has more than one array size attribute.", command.line);
            }

            const auto count = parseUnsignedText(word.substr(2), 10);
            const std::uint64_t limit = isCountInArgument ? std::numeric_limits<std::uint16_t>::max()
                                                          : std::numeric_limits<std::uint32_t>::max();
            if (!count.has_value() || *count > limit)
            {
                return fail(DiagnosticKind::Semantic, "META-E3007",
                    "Array size attribute '" + std::string{word} + "' is out of range.", command.line);
            }

            argument.arraySize.kind = isCountInArgument ? ArraySizeKind::CountInArgument : ArraySizeKind::ConstantCount;
            argument.arraySize.value = *count;
        }
        return true;
    }

    bool Collector::handleInterface(const frontend::Command& command)
    {
        if (!expectFieldCount(command, 5, 5) || !requireHeader(command))
        {
            return false;
        }

        const auto group = parseInteger(command, 2, "group");
        if (!group.has_value())
        {
            return false;
        }
        const auto value = parseInteger(command, 3, "value");
        if (!value.has_value())
        {
            return false;
        }

        if (*group < 0 || *group > 255)
        {
            return fail(DiagnosticKind::Semantic, "META-E3003",
                "Interface group " + std::to_string(*group) + " must be between 0 and 255.", command.line);
        }
        if (*value < 0 || *value > 255)
        {
            return fail(DiagnosticKind::Semantic, "META-E3003",
                "Interface value " + std::to_string(*value) + " must be between 0 and 255.", command.line);
        }

        Interface declared;
        declared.name = command.fields[1];
        declared.group = static_cast<std::uint8_t>(*group);
        declared.value = static_cast<std::uint8_t>(*value);
        declared.baseType = TypeReference{command.fields[4], 0, std::nullopt};
        m_metadata.interfaces.emplace_back(std::move(declared));
        m_context.interfaceIndex = m_metadata.interfaces.size() - 1;
        return true;
    }

    bool Collector::handleMethod(const frontend::Command& command)
    {
        if (!expectFieldCount(command, 4, 4) || !requireHeader(command)
            || !requireContext(command, m_context.interfaceIndex.has_value(), "META-E2004", "iface"))
        {
            return false;
        }

        const auto returnDepth = parseDepth(command, 3);
        if (!returnDepth.has_value())
        {
            return false;
        }

        InterfaceMethod method;
        method.signature.name = command.fields[1];
        method.signature.returnType = makeEnrichedType(command.fields[2], *returnDepth);

        auto& methods = m_metadata.interfaces[*m_context.interfaceIndex].methods;
        methods.emplace_back(std::move(method));
        m_context.functionLike = MethodSlot{*m_context.interfaceIndex, methods.size() - 1};
        return true;
    }

    bool Collector::handleStandardMethod(const frontend::Command& command)
    {
        if (!expectFieldCount(command, 2, 2) || !requireHeader(command)
            || !requireContext(command, m_context.interfaceIndex.has_value(), "META-E2004", "iface"))
        {
            return false;
        }

        InterfaceMethod method;
        method.signature.name = command.fields[1];
        method.signature.returnType = TypeReference{std::string{kResultCodeType}, 0, std::nullopt};

        auto& methods = m_metadata.interfaces[*m_context.interfaceIndex].methods;
        methods.emplace_back(std::move(method));
        m_context.functionLike = MethodSlot{*m_context.interfaceIndex, methods.size() - 1};
        return true;
    }

    bool Collector::handleInclude(const frontend::Command& command, std::uint32_t depth)
    {
        if (!expectFieldCount(command, 2, 2) || !requireHeader(command))
        {
            return false;
        }

        if (depth + 1 > kMaxIncludeDepth)
        {
            return fail(DiagnosticKind::Semantic, "META-E3010",
                "Include nesting is deeper than " + std::to_string(kMaxIncludeDepth)
                    + " levels; is '" + command.fields[1] + "' including itself?",
                command.line);
        }

        const std::filesystem::path includePath = frontend::resolveIncludePath(m_currentFile, command.fields[1]);
        const auto source = frontend::readSourceFile(includePath);
        if (!source.has_value())
        {
            return fail(DiagnosticKind::Input, "META-E4001",
                "Unable to open included file '" + includePath.string() + "'.", command.line);
        }

        return collectSourceAtDepth(*source, depth + 1);
    }

    bool Collector::handleEnumeration(const frontend::Command& command, bool isFlags)
    {
        if (!expectFieldCount(command, 3, 3) || !requireHeader(command))
        {
            return false;
        }

        const std::string& name = command.fields[1];
        if (m_metadata.findEnumeration(name) != nullptr)
        {
            return fail(DiagnosticKind::Semantic, "META-E3004",
                "Duplicate enumeration '" + name + "'.", command.line);
        }

        Enumeration enumeration;
        enumeration.name = name;
        enumeration.baseType = TypeReference{command.fields[2], 0, std::nullopt};
        enumeration.isFlags = isFlags;

        m_metadata.enumerations.emplace_back(std::move(enumeration));
        m_metadata.enumerationIndex.emplace(name, m_metadata.enumerations.size() - 1);
        m_context.enumerationIndex = m_metadata.enumerations.size() - 1;
        return true;
    }

    bool Collector::handleVariant(const frontend::Command& command)
    {
        if (!expectFieldCount(command, 3, 3) || !requireHeader(command)
            || !requireContext(command, m_context.enumerationIndex.has_value(), "META-E2005", "enum or flags"))
        {
            return false;
        }

        Enumeration& enumeration = m_metadata.enumerations[*m_context.enumerationIndex];
        const std::string& name = command.fields[1];
        if (enumeration.hasVariant(name))
        {
            return fail(DiagnosticKind::Semantic, "META-E3005",
                "Duplicate variant '" + name + "' in enumeration '" + enumeration.name + "'.", command.line);
        }

        const std::string& text = command.fields[2];
        const auto literal = parseIntegerLiteral(text);
        if (!literal.has_value())
        {
            return fail(DiagnosticKind::Grammar, "META-E1003",
                "Expected an integer variant value, found '" + text + "'.", command.line);
        }

        const std::string baseIlType = toIlType(enumeration.baseType, m_metadata);
        const auto range = integerRangeOf(baseIlType);
        if (range.has_value()
            && literal->magnitude > (literal->isNegative ? range->negativeLimit : range->positiveLimit))
        {
            return fail(DiagnosticKind::Semantic, "META-E3008",
                "Variant '" + name + "' value " + text + " does not fit in " + baseIlType + ".", command.line);
        }

        enumeration.variants.push_back(EnumVariant{name, literal->magnitude, literal->isNegative});
        enumeration.variantIndex.emplace(name, enumeration.variants.size() - 1);
        return true;
    }

    bool Collector::handleStruct(const frontend::Command& command)
    {
        if (!expectFieldCount(command, 2, 2) || !requireHeader(command))
        {
            return false;
        }

        Struct declared;
        declared.name = command.fields[1];
        m_metadata.structs.emplace_back(std::move(declared));
        m_context.structIndex = m_metadata.structs.size() - 1;
        return true;
    }

    bool Collector::handleField(const frontend::Command& command)
    {
        if (!expectFieldCount(command, 4, 4) || !requireHeader(command)
            || !requireContext(command, m_context.structIndex.has_value(), "META-E2006", "struct"))
        {
            return false;
        }

        const auto depth = parseDepth(command, 3);
        if (!depth.has_value())
        {
            return false;
        }

        StructField field;
        field.name = command.fields[1];
        field.type = makeEnrichedType(command.fields[2], *depth);
        m_metadata.structs[*m_context.structIndex].fields.emplace_back(std::move(field));
        return true;
    }

    bool Collector::handleGuidConstant(const frontend::Command& command)
    {
        if (!expectFieldCount(command, 3, 3) || !requireHeader(command))
        {
            return false;
        }

        const auto guid = encoding::parseGuid(command.fields[2]);
        if (!guid.has_value())
        {
            return fail(DiagnosticKind::Semantic, "META-E3009",
                "Invalid GUID '" + command.fields[2] + "'; expected xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx.", command.line);
        }

        GuidConstant constant;
        constant.name = command.fields[1];
        constant.guid = *guid;
        constant.displayText = encoding::formatGuid(*guid);
        m_metadata.guidConstants.emplace_back(std::move(constant));
        return true;
    }

    FunctionSignature& Collector::currentSignature()
    {
        struct SignatureLocator
        {
            Metadata& metadata;

            FunctionSignature& operator()(const FreeFunctionSlot& slot) const
            {
                return metadata.functions[slot.functionIndex].signature;
            }

            FunctionSignature& operator()(const FunctionPointerSlot& slot) const
            {
                return metadata.functionPointers[slot.pointerIndex].signature;
            }

            FunctionSignature& operator()(const MethodSlot& slot) const
            {
                return metadata.interfaces[slot.interfaceIndex].methods[slot.methodIndex].signature;
            }
        };

        return std::visit(SignatureLocator{m_metadata}, *m_context.functionLike);
    }

    TypeReference Collector::makeEnrichedType(std::string name, std::uint32_t pointerDepth) const
    {
        TypeReference type{std::move(name), pointerDepth, std::nullopt};
        enrich(type, m_metadata);
        return type;
    }

    bool Collector::expectFieldCount(const frontend::Command& command, std::size_t minimum, std::size_t maximum)
    {
        const std::size_t count = command.fieldCount();
        if (count >= minimum && count <= maximum)
        {
            return true;
        }

        return fail(DiagnosticKind::Grammar, "META-E1002",
            "Wrong number of fields for '" + std::string{frontend::toString(command.kind)} + "'. Usage: "
                + std::string{frontend::usage(command.kind)},
            command.line);
    }

    bool Collector::requireHeader(const frontend::Command& command)
    {
        return requireContext(command, m_metadata.header.has_value(), "META-E2001", "meta");
    }

    bool Collector::requireContext(const frontend::Command& command,
        bool present,
        std::string_view code,
        std::string_view contextName)
    {
        if (present)
        {
            return true;
        }

        return fail(DiagnosticKind::Context, std::string{code},
            "'" + std::string{frontend::toString(command.kind)} + "' requires a preceding "
                + std::string{contextName} + " declaration (missing context: " + std::string{contextName} + ").",
            command.line);
    }

    std::optional<std::int64_t> Collector::parseInteger(const frontend::Command& command,
        std::size_t fieldIndex,
        std::string_view what)
    {
        const auto value = parseSignedText(command.fields[fieldIndex]);
        if (!value.has_value())
        {
            fail(DiagnosticKind::Grammar, "META-E1003",
                "Expected an integer " + std::string{what} + ", found '" + command.fields[fieldIndex] + "'.",
                command.line);
        }
        return value;
    }

    std::optional<std::uint32_t> Collector::parseDepth(const frontend::Command& command, std::size_t fieldIndex)
    {
        const auto value = parseInteger(command, fieldIndex, "pointer depth");
        if (!value.has_value())
        {
            return std::nullopt;
        }

        if (*value < 0 || *value > std::numeric_limits<std::uint32_t>::max())
        {
            fail(DiagnosticKind::Semantic, "META-E3002",
                "Pointer depth " + std::to_string(*value) + " is invalid; expected a non-negative count.",
                command.line);
            return std::nullopt;
        }
        return static_cast<std::uint32_t>(*value);
    }

    bool Collector::fail(DiagnosticKind kind, std::string code, std::string message, std::uint32_t line)
    {
        Diagnostic diag;
        diag.code = std::move(code);
        diag.message = std::move(message);
        diag.kind = kind;
        diag.location = {m_currentFile.string(), line};
        m_diagnostics.emplace_back(std::move(diag));
        return false;
    }
} // namespace metatext::metadata
