#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace metatext
{
    // Writes next to the destination first and renames into place, so a failed
    // run never leaves a truncated output file behind.
    bool writeIlOutput(const std::filesystem::path& outputPath, std::string_view content, std::string& errorMessage);
}
