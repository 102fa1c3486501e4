#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace metatext
{
    struct CommandLineOptions
    {
        std::string inputPath;
        std::string outputPath;
    };

    class CommandLineParser
    {
    public:
        std::optional<CommandLineOptions> parse(int argc, char** argv) const
        {
            std::vector<std::string> positional;

            for (int index = 1; index < argc; ++index)
            {
                std::string_view argument{argv[index]};

                if (argument.size() > 1 && argument[0] == '-')
                {
                    std::cerr << "META-E6001 UnknownOption: unrecognised option '" << argument << "'.\n";
                    return std::nullopt;
                }

                positional.emplace_back(argument);
            }

            if (positional.size() < 2)
            {
                std::cerr << "META-E6002 MissingArgument: expected an input definition file and an output IL file.\n";
                return std::nullopt;
            }

            if (positional.size() > 2)
            {
                std::cerr << "META-E6003 UnexpectedArgument: unexpected argument '" << positional[2] << "'.\n";
                return std::nullopt;
            }

            CommandLineOptions options;
            options.inputPath = std::move(positional[0]);
            options.outputPath = std::move(positional[1]);
            return options;
        }
    };
} // namespace metatext
