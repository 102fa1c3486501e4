#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace metatext::frontend
{
    struct SourceFile
    {
        std::filesystem::path path;
        std::vector<std::string> lines;
    };

    [[nodiscard]] std::vector<std::string> splitLines(std::string_view content);
    [[nodiscard]] std::optional<SourceFile> readSourceFile(const std::filesystem::path& path);

    // Relative include paths are taken relative to the directory of the file
    // that contains the include line.
    [[nodiscard]] std::filesystem::path resolveIncludePath(const std::filesystem::path& includingFile,
        std::string_view includeText);
} // namespace metatext::frontend
