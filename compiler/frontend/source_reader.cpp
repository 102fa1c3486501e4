#include "source_reader.hpp"

#include <fstream>
#include <sstream>
#include <utility>

namespace metatext::frontend
{
    std::vector<std::string> splitLines(std::string_view content)
    {
        std::vector<std::string> lines;
        std::size_t start = 0;
        while (start < content.size())
        {
            const auto newline = content.find('\n', start);
            if (newline == std::string_view::npos)
            {
                lines.emplace_back(content.substr(start));
                break;
            }
            lines.emplace_back(content.substr(start, newline - start + 1));
            start = newline + 1;
        }
        return lines;
    }

    std::optional<SourceFile> readSourceFile(const std::filesystem::path& path)
    {
        std::ifstream stream(path, std::ios::binary);
        if (!stream)
        {
            return std::nullopt;
        }

        std::ostringstream buffer;
        buffer << stream.rdbuf();
        if (stream.bad())
        {
            return std::nullopt;
        }

        SourceFile file;
        file.path = path;
        file.lines = splitLines(buffer.str());
        return file;
    }

    std::filesystem::path resolveIncludePath(const std::filesystem::path& includingFile,
        std::string_view includeText)
    {
        std::filesystem::path included{std::string{includeText}};
        if (included.is_absolute() || !includingFile.has_parent_path())
        {
            return included.lexically_normal();
        }
        return (includingFile.parent_path() / included).lexically_normal();
    }
} // namespace metatext::frontend
