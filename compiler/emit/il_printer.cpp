#include "il_printer.hpp"

#include "../encoding/attribute_blob.hpp"
#include "../encoding/custom_attributes.hpp"
#include "../metadata/type_reference.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace metatext::emit
{
    namespace
    {
        using metadata::Argument;
        using metadata::ArraySizeKind;
        using metadata::Metadata;

        constexpr std::string_view kMetadataAttributes = "[Windows.Win32.winmd]Windows.Win32.Foundation.Metadata.";

        constexpr std::string_view kGuidAttributeCtor
            = "GuidAttribute::.ctor(uint32, uint16, uint16, uint8, uint8, uint8, uint8, uint8, uint8, uint8, uint8)";

        void printIndent(std::ostream& stream, int level)
        {
            for (int i = 0; i < level; ++i)
            {
                stream << "    ";
            }
        }

        class IlWriter
        {
        public:
            IlWriter(const Metadata& metadata, std::ostream& stream, std::vector<common::Diagnostic>& diagnostics)
                : m_metadata(metadata)
                , m_stream(stream)
                , m_diagnostics(diagnostics)
            {
            }

            bool write()
            {
                if (!m_metadata.header.has_value())
                {
                    return fail("META-E5001", "Nothing to render: the definition does not declare 'meta'.");
                }

                writePreamble();

                for (const auto& pointer : m_metadata.functionPointers)
                {
                    if (!writeFunctionPointer(pointer))
                    {
                        return false;
                    }
                }

                if (!writeApis())
                {
                    return false;
                }

                for (const auto& declared : m_metadata.interfaces)
                {
                    if (!writeInterface(declared))
                    {
                        return false;
                    }
                }

                for (const auto& enumeration : m_metadata.enumerations)
                {
                    writeEnumeration(enumeration);
                }

                for (const auto& declared : m_metadata.structs)
                {
                    if (!writeStruct(declared))
                    {
                        return false;
                    }
                }

                return true;
            }

        private:
            std::string qualified(std::string_view name) const
            {
                return m_metadata.name() + "." + std::string{name};
            }

            std::string ilType(const metadata::TypeReference& type) const
            {
                return metadata::toIlType(type, m_metadata);
            }

            void writePreamble()
            {
                for (const auto& dll : m_metadata.importedDlls)
                {
                    m_stream << ".module extern '" << dll << "'\n";
                }

                m_stream << ".assembly extern netstandard\n"
                         << "{\n"
                         << "    .publickeytoken = (\n"
                         << "        cc 7b 13 ff cd 2d dd 51\n"
                         << "    )\n"
                         << "    .ver 2:1:0:0\n"
                         << "}\n"
                         << ".assembly extern Windows.Win32.winmd\n"
                         << "{\n"
                         << "    .ver 0:0:0:0\n"
                         << "}\n\n";

                m_stream << ".assembly " << m_metadata.header->name << ".winmd\n"
                         << "{\n"
                         << "    .ver " << m_metadata.header->version << "\n"
                         << "}\n\n";

                m_stream << ".module " << m_metadata.header->name << ".winmd\n"
                         << ".imagebase 0x00400000\n"
                         << ".file alignment 0x00000200\n"
                         << ".stackreserve 0x00100000\n"
                         << ".subsystem 0x0003 // WindowsCui\n"
                         << ".corflags 0x00000001 // ILOnly\n\n";
            }

            void writePayload(int level,
                std::string_view constructor,
                const encoding::ByteBuffer& payload,
                std::string_view comment = {})
            {
                printIndent(m_stream, level);
                m_stream << ".custom instance void " << constructor << " = (\n";
                printIndent(m_stream, level + 1);
                m_stream << encoding::toHex(payload);
                if (!comment.empty())
                {
                    m_stream << " // " << comment;
                }
                m_stream << "\n";
                printIndent(m_stream, level);
                m_stream << ")\n";
            }

            void writeArguments(const metadata::FunctionSignature& signature, int level)
            {
                for (std::size_t index = 0; index < signature.arguments.size(); ++index)
                {
                    const Argument& argument = signature.arguments[index];
                    printIndent(m_stream, level);
                    if (metadata::isIn(argument.direction))
                    {
                        m_stream << "[in] ";
                    }
                    if (metadata::isOut(argument.direction))
                    {
                        m_stream << "[out] ";
                    }
                    if (argument.isOptional)
                    {
                        m_stream << "[opt] ";
                    }
                    m_stream << ilType(argument.type) << " '" << argument.name << "'";
                    m_stream << (index + 1 < signature.arguments.size() ? ",\n" : "\n");
                }
            }

            bool writeAssociatedEnum(int level, const std::string& enumName)
            {
                const auto payload = encoding::associatedEnumPayload(enumName);
                if (!payload.has_value())
                {
                    return fail("META-E5002", "Enumeration name '" + enumName + "' is too long to encode.");
                }
                writePayload(level, std::string{kMetadataAttributes} + "AssociatedEnumAttribute::.ctor(string)",
                    *payload, enumName);
                return true;
            }

            bool writeArgumentAttributes(const metadata::FunctionSignature& signature, int level)
            {
                for (std::size_t index = 0; index < signature.arguments.size(); ++index)
                {
                    const Argument& argument = signature.arguments[index];
                    if (!argument.hasAttributePayloads())
                    {
                        continue;
                    }

                    // .param [0] is the return value
                    printIndent(m_stream, level);
                    m_stream << ".param [" << (index + 1) << "]\n";

                    if (argument.isConst)
                    {
                        writePayload(level + 1, std::string{kMetadataAttributes} + "ConstAttribute::.ctor()",
                            encoding::markerPayload());
                    }
                    if (argument.isComOutPointer)
                    {
                        writePayload(level + 1, std::string{kMetadataAttributes} + "ComOutPtrAttribute::.ctor()",
                            encoding::markerPayload());
                    }

                    if (argument.arraySize.kind != ArraySizeKind::None)
                    {
                        const bool byArgument = argument.arraySize.kind == ArraySizeKind::CountInArgument;
                        const auto payload = byArgument ? encoding::countParamIndexPayload(argument.arraySize.value)
                                                        : encoding::countConstPayload(argument.arraySize.value);
                        if (!payload.has_value())
                        {
                            return fail("META-E5002", "Array size of argument '" + argument.name + "' in '"
                                    + signature.name + "' cannot be encoded.");
                        }
                        const std::string comment = std::string{byArgument ? "CountParamIndex = " : "CountConst = "}
                            + std::to_string(argument.arraySize.value);
                        writePayload(level + 1, std::string{kMetadataAttributes} + "NativeArrayInfoAttribute::.ctor()",
                            *payload, comment);
                    }

                    if (argument.type.backingEnum.has_value() && !writeAssociatedEnum(level + 1, *argument.type.backingEnum))
                    {
                        return false;
                    }
                }
                return true;
            }

            bool writeFunctionPointer(const metadata::FunctionPointerType& pointer)
            {
                const auto& signature = pointer.signature;
                const auto payload = encoding::unmanagedFunctionPointerPayload(pointer.callingConventionCode);
                if (!payload.has_value())
                {
                    return fail("META-E5002", "Calling convention of '" + signature.name + "' cannot be encoded.");
                }

                m_stream << ".class public auto autochar sealed beforefieldinit " << qualified(signature.name) << "\n"
                         << "    extends [netstandard]System.MulticastDelegate\n"
                         << "{\n";
                writePayload(1,
                    "[netstandard]System.Runtime.InteropServices.UnmanagedFunctionPointerAttribute::.ctor("
                    "valuetype [netstandard]System.Runtime.InteropServices.CallingConvention)",
                    *payload);
                m_stream << "\n"
                         << "    .method public hidebysig specialname rtspecialname\n"
                         << "        instance void .ctor (\n"
                         << "            object 'object',\n"
                         << "            native int 'method'\n"
                         << "        ) runtime managed\n"
                         << "    {\n"
                         << "    }\n\n";

                m_stream << "    .method public hidebysig newslot virtual\n"
                         << "        instance " << ilType(signature.returnType) << " Invoke (\n";
                writeArguments(signature, 3);
                m_stream << "        ) runtime managed\n"
                         << "    {\n";
                if (!writeArgumentAttributes(signature, 2))
                {
                    return false;
                }
                m_stream << "    }\n"
                         << "}\n\n";
                return true;
            }

            bool writeApis()
            {
                if (m_metadata.functions.empty() && m_metadata.guidConstants.empty())
                {
                    return true;
                }

                m_stream << ".class public auto autochar abstract sealed beforefieldinit " << qualified("Apis") << "\n"
                         << "    extends [netstandard]System.Object\n"
                         << "{\n";

                for (const auto& function : m_metadata.functions)
                {
                    const auto& signature = function.signature;
                    m_stream << "    .method public hidebysig static pinvokeimpl(\"" << function.dll << "\" nomangle "
                             << function.callingConvention << ")\n"
                             << "        " << ilType(signature.returnType) << " " << signature.name << " (\n";
                    writeArguments(signature, 3);
                    m_stream << "        ) cil managed\n"
                             << "    {\n";
                    if (!writeArgumentAttributes(signature, 2))
                    {
                        return false;
                    }
                    m_stream << "    }\n\n";
                }

                for (const auto& constant : m_metadata.guidConstants)
                {
                    m_stream << "    .field public static valuetype [netstandard]System.Guid '" << constant.name << "'\n";
                    writePayload(1, std::string{kMetadataAttributes} + std::string{kGuidAttributeCtor},
                        encoding::guidPayload(constant.guid), constant.displayText);
                }

                m_stream << "}\n\n";
                return true;
            }

            bool writeInterface(const metadata::Interface& declared)
            {
                const encoding::Guid guid = encoding::makeInterfaceGuid(declared.group, declared.value);

                m_stream << ".class interface public abstract auto ansi " << qualified(declared.name) << "\n"
                         << "    implements " << ilType(declared.baseType) << "\n"
                         << "{\n";
                writePayload(1, std::string{kMetadataAttributes} + std::string{kGuidAttributeCtor},
                    encoding::guidPayload(guid), encoding::formatGuid(guid));

                for (const auto& method : declared.methods)
                {
                    const auto& signature = method.signature;
                    m_stream << "\n"
                             << "    .method public hidebysig newslot abstract virtual\n"
                             << "        instance " << ilType(signature.returnType) << " " << signature.name << " (\n";
                    writeArguments(signature, 3);
                    m_stream << "        ) cil managed\n"
                             << "    {\n";
                    if (!writeArgumentAttributes(signature, 2))
                    {
                        return false;
                    }
                    m_stream << "    }\n";
                }

                m_stream << "}\n\n";
                return true;
            }

            void writeEnumeration(const metadata::Enumeration& enumeration)
            {
                const std::string baseType = ilType(enumeration.baseType);

                m_stream << ".class public auto ansi sealed " << qualified(enumeration.name) << "\n"
                         << "       extends [netstandard]System.Enum\n"
                         << "{\n";
                if (enumeration.isFlags)
                {
                    m_stream << "    .custom instance void [netstandard]System.FlagsAttribute::.ctor() = ( "
                             << encoding::toHex(encoding::markerPayload()) << " )\n";
                }
                m_stream << "    .field public specialname rtspecialname " << baseType << " value__\n";
                for (const auto& variant : enumeration.variants)
                {
                    m_stream << "    .field public static literal valuetype " << qualified(enumeration.name) << " "
                             << variant.name << " = " << baseType << "(" << variant.valueText() << ")\n";
                }
                m_stream << "}\n\n";
            }

            bool writeStruct(const metadata::Struct& declared)
            {
                m_stream << ".class public sequential ansi sealed beforefieldinit " << qualified(declared.name) << "\n"
                         << "       extends [netstandard]System.ValueType\n"
                         << "{\n";
                for (const auto& field : declared.fields)
                {
                    m_stream << "    .field public " << ilType(field.type) << " '" << field.name << "'\n";
                    if (field.type.backingEnum.has_value() && !writeAssociatedEnum(1, *field.type.backingEnum))
                    {
                        return false;
                    }
                }
                m_stream << "}\n\n";
                return true;
            }

            bool fail(std::string code, std::string message)
            {
                common::Diagnostic diag;
                diag.code = std::move(code);
                diag.message = std::move(message);
                diag.kind = common::DiagnosticKind::Render;
                m_diagnostics.emplace_back(std::move(diag));
                return false;
            }

        private:
            const Metadata& m_metadata;
            std::ostream& m_stream;
            std::vector<common::Diagnostic>& m_diagnostics;
        };
    } // namespace

    bool printIl(const metadata::Metadata& metadata, std::ostream& stream, std::vector<common::Diagnostic>& diagnostics)
    {
        IlWriter writer{metadata, stream, diagnostics};
        return writer.write();
    }
} // namespace metatext::emit
