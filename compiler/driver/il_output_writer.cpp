#include "il_output_writer.hpp"

#include <fstream>
#include <system_error>

namespace metatext
{
    namespace
    {
        std::filesystem::path temporarySibling(const std::filesystem::path& outputPath)
        {
            std::filesystem::path temporary = outputPath;
            temporary += ".partial";
            return temporary;
        }

        void removeQuietly(const std::filesystem::path& path)
        {
            std::error_code removeError;
            std::filesystem::remove(path, removeError);
        }
    } // namespace

    bool writeIlOutput(const std::filesystem::path& outputPath, std::string_view content, std::string& errorMessage)
    {
        const auto parentDirectory = outputPath.parent_path();
        if (!parentDirectory.empty())
        {
            std::error_code createError;
            std::filesystem::create_directories(parentDirectory, createError);
            if (createError)
            {
                errorMessage = "failed to create directories for '" + outputPath.string() + "': " + createError.message();
                return false;
            }
        }

        const std::filesystem::path temporaryPath = temporarySibling(outputPath);
        {
            std::ofstream file(temporaryPath, std::ios::binary | std::ios::trunc);
            if (!file)
            {
                errorMessage = "unable to open '" + temporaryPath.string() + "' for writing.";
                return false;
            }

            file.write(content.data(), static_cast<std::streamsize>(content.size()));
            file.flush();
            if (!file.good())
            {
                errorMessage = "failed while writing IL output to '" + temporaryPath.string() + "'.";
                file.close();
                removeQuietly(temporaryPath);
                return false;
            }
        }

        std::error_code renameError;
        std::filesystem::rename(temporaryPath, outputPath, renameError);
        if (renameError)
        {
            errorMessage = "failed to move '" + temporaryPath.string() + "' to '" + outputPath.string()
                + "': " + renameError.message();
            removeQuietly(temporaryPath);
            return false;
        }

        return true;
    }
} // namespace metatext
