#include "command.hpp"

#include <array>
#include <utility>

namespace metatext::frontend
{
    namespace
    {
        constexpr std::array<std::pair<std::string_view, CommandKind>, 16> kKeywords = {{
            {"meta", CommandKind::Meta},
            {"fptr", CommandKind::FunctionPointer},
            {"dll", CommandKind::Dll},
            {"fn", CommandKind::Function},
            {"arg", CommandKind::Argument},
            {"optarg", CommandKind::OptionalArgument},
            {"iface", CommandKind::Interface},
            {"meth", CommandKind::Method},
            {"stdmeth", CommandKind::StandardMethod},
            {"include", CommandKind::Include},
            {"enum", CommandKind::Enumeration},
            {"flags", CommandKind::FlagsEnumeration},
            {"variant", CommandKind::Variant},
            {"struct", CommandKind::Struct},
            {"field", CommandKind::Field},
            {"guid", CommandKind::GuidConstant},
        }};
    } // namespace

    std::optional<CommandKind> lookupCommand(std::string_view keyword)
    {
        for (const auto& [text, kind] : kKeywords)
        {
            if (text == keyword)
            {
                return kind;
            }
        }
        return std::nullopt;
    }

    std::string_view toString(CommandKind kind)
    {
        switch (kind)
        {
        case CommandKind::Meta: return "meta";
        case CommandKind::FunctionPointer: return "fptr";
        case CommandKind::Dll: return "dll";
        case CommandKind::Function: return "fn";
        case CommandKind::Argument: return "arg";
        case CommandKind::OptionalArgument: return "optarg";
        case CommandKind::Interface: return "iface";
        case CommandKind::Method: return "meth";
        case CommandKind::StandardMethod: return "stdmeth";
        case CommandKind::Include: return "include";
        case CommandKind::Enumeration: return "enum";
        case CommandKind::FlagsEnumeration: return "flags";
        case CommandKind::Variant: return "variant";
        case CommandKind::Struct: return "struct";
        case CommandKind::Field: return "field";
        case CommandKind::GuidConstant: return "guid";
        }
        return "unknown";
    }

    std::string_view usage(CommandKind kind)
    {
        switch (kind)
        {
        case CommandKind::Meta: return "meta NAME VERSION";
        case CommandKind::FunctionPointer: return "fptr NAME RETTYPE RETSTARS [CALLCONV]";
        case CommandKind::Dll: return "dll NAME";
        case CommandKind::Function: return "fn NAME RETTYPE RETSTARS [CALLCONV]";
        case CommandKind::Argument: return "arg DIRECTION NAME TYPE STARS [ATTRIBS]";
        case CommandKind::OptionalArgument: return "optarg DIRECTION NAME TYPE STARS [ATTRIBS]";
        case CommandKind::Interface: return "iface NAME GROUP VALUE BASETYPE";
        case CommandKind::Method: return "meth NAME RETTYPE RETSTARS";
        case CommandKind::StandardMethod: return "stdmeth NAME";
        case CommandKind::Include: return "include PATH";
        case CommandKind::Enumeration: return "enum NAME BASETYPE";
        case CommandKind::FlagsEnumeration: return "flags NAME BASETYPE";
        case CommandKind::Variant: return "variant NAME VALUE";
        case CommandKind::Struct: return "struct NAME";
        case CommandKind::Field: return "field NAME TYPE STARS";
        case CommandKind::GuidConstant: return "guid NAME GUID";
        }
        return "";
    }
} // namespace metatext::frontend
