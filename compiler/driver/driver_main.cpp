#include "../common/diagnostic.hpp"
#include "../emit/il_printer.hpp"
#include "../metadata/collector.hpp"
#include "command_line.hpp"
#include "il_output_writer.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#ifndef METATEXT_BUILD_PROFILE
#define METATEXT_BUILD_PROFILE "local"
#endif

namespace metatext
{
    void printUsage()
    {
        std::cerr << "metatext2il - native API definition to IL compiler (build profile: " << METATEXT_BUILD_PROFILE << ")\n"
                  << "Usage: metatext2il <input.txt> <output.il>\n";
    }

    void reportDiagnostics(const std::vector<common::Diagnostic>& diagnostics)
    {
        for (const auto& diagnostic : diagnostics)
        {
            std::cerr << diagnostic.code << ' ';
            if (!diagnostic.location.file.empty())
            {
                std::cerr << diagnostic.location.file;
                if (diagnostic.location.line != 0)
                {
                    std::cerr << ':' << diagnostic.location.line;
                }
                std::cerr << ' ';
            }
            std::cerr << "[" << common::toString(diagnostic.kind) << "] -> " << diagnostic.message << '\n';
        }
    }

    int runTranslator(const CommandLineOptions& options)
    {
        std::cout << "[information] Starting metatext2il.\n";
        std::cout << "  input: " << options.inputPath << "\n";
        std::cout << "  output: " << options.outputPath << "\n";

        metadata::Collector collector;
        if (!collector.collectPath(options.inputPath))
        {
            reportDiagnostics(collector.diagnostics());
            std::cerr << "META-W6001 Translation halted; no output written.\n";
            return 1;
        }

        const metadata::Metadata model = collector.takeMetadata();
        std::size_t methodCount = 0;
        for (const auto& declared : model.interfaces)
        {
            methodCount += declared.methods.size();
        }

        std::cout << "[notice] Collected metadata '" << model.name() << "' (functions: " << model.functions.size()
                  << ", function pointers: " << model.functionPointers.size()
                  << ", interfaces: " << model.interfaces.size() << " with " << methodCount << " methods"
                  << ", enumerations: " << model.enumerations.size()
                  << ", structs: " << model.structs.size()
                  << ", guids: " << model.guidConstants.size()
                  << ", dlls: " << model.importedDlls.size() << ").\n";

        std::ostringstream rendered;
        std::vector<common::Diagnostic> renderDiagnostics;
        if (!emit::printIl(model, rendered, renderDiagnostics))
        {
            reportDiagnostics(renderDiagnostics);
            std::cerr << "META-W6001 Translation halted; no output written.\n";
            return 1;
        }

        std::string errorMessage;
        if (!writeIlOutput(options.outputPath, rendered.str(), errorMessage))
        {
            std::cerr << "META-E6004 OutputWriteFailed: " << errorMessage << "\n";
            std::cerr << "META-W6001 Translation halted; no output written.\n";
            return 1;
        }

        std::cout << "[notice] IL written to " << options.outputPath << "\n";
        return 0;
    }
} // namespace metatext

int main(int argc, char** argv)
{
    metatext::CommandLineParser parser;
    const auto options = parser.parse(argc, argv);

    if (!options.has_value())
    {
        metatext::printUsage();
        return 1;
    }

    return metatext::runTranslator(options.value());
}
