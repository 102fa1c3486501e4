#include <gtest/gtest.h>

#include "command_line.hpp"

#include <iterator>
#include <string>

namespace
{
    TEST(CommandLineParserTest, ParsesInputAndOutput)
    {
        const char* argv[] = {
            "metatext2il",
            "defs/7zip.txt",
            "out/7zip.il"
        };

        metatext::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        ASSERT_TRUE(options.has_value());
        EXPECT_EQ(options->inputPath, "defs/7zip.txt");
        EXPECT_EQ(options->outputPath, "out/7zip.il");
    }

    TEST(CommandLineParserTest, MissingOutputFails)
    {
        const char* argv[] = {
            "metatext2il",
            "defs/7zip.txt"
        };

        metatext::CommandLineParser parser;
        testing::internal::CaptureStderr();
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        const std::string errors = testing::internal::GetCapturedStderr();
        EXPECT_FALSE(options.has_value());
        EXPECT_NE(errors.find("META-E6002"), std::string::npos);
    }

    TEST(CommandLineParserTest, NoArgumentsFails)
    {
        const char* argv[] = {
            "metatext2il"
        };

        metatext::CommandLineParser parser;
        testing::internal::CaptureStderr();
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        testing::internal::GetCapturedStderr();
        EXPECT_FALSE(options.has_value());
    }

    TEST(CommandLineParserTest, ExtraArgumentFails)
    {
        const char* argv[] = {
            "metatext2il",
            "a.txt",
            "a.il",
            "b.il"
        };

        metatext::CommandLineParser parser;
        testing::internal::CaptureStderr();
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        const std::string errors = testing::internal::GetCapturedStderr();
        EXPECT_FALSE(options.has_value());
        EXPECT_NE(errors.find("META-E6003"), std::string::npos);
        EXPECT_NE(errors.find("b.il"), std::string::npos);
    }

    TEST(CommandLineParserTest, RejectsOptions)
    {
        const char* argv[] = {
            "metatext2il",
            "--verbose",
            "a.txt",
            "a.il"
        };

        metatext::CommandLineParser parser;
        testing::internal::CaptureStderr();
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        const std::string errors = testing::internal::GetCapturedStderr();
        EXPECT_FALSE(options.has_value());
        EXPECT_NE(errors.find("META-E6001"), std::string::npos);
    }

    TEST(CommandLineParserTest, LoneDashIsPositional)
    {
        const char* argv[] = {
            "metatext2il",
            "-",
            "a.il"
        };

        metatext::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        ASSERT_TRUE(options.has_value());
        EXPECT_EQ(options->inputPath, "-");
    }
} // namespace
