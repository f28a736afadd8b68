// ==============================================================================
// test_cli_gtest.cpp - Тесты CLI парсинга (GoogleTest)
// ==============================================================================

#include "mediascope/cli.hpp"

#include <gtest/gtest.h>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace mediascope::cli::test {

namespace {

/// argv из списка строк (argv[0] = "mediascope")
class ArgvBuilder {
public:
    explicit ArgvBuilder(std::vector<std::string> args) : storage_(std::move(args)) {
        storage_.insert(storage_.begin(), "mediascope");
        for (auto& s : storage_) {
            pointers_.push_back(s.data());
        }
        pointers_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

ParseResult parse_args(std::vector<std::string> args) {
    ArgvBuilder builder(std::move(args));
    return parse(builder.argc(), builder.argv());
}

}  // anonymous namespace

// ==============================================================================
// Команды
// ==============================================================================

TEST(CliTest, Parse_NoArgs_ReturnsRunCommand) {
    // Act
    auto result = parse_args({});

    // Assert
    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<RunCommand>(result.command));
}

TEST(CliTest, Parse_Help_ReturnsHelpCommand) {
    EXPECT_TRUE(std::holds_alternative<HelpCommand>(parse_args({"--help"}).command));
    EXPECT_TRUE(std::holds_alternative<HelpCommand>(parse_args({"-h"}).command));
}

TEST(CliTest, Parse_Version_ReturnsVersionCommand) {
    auto result = parse_args({"-V"});

    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<VersionCommand>(result.command));
    EXPECT_TRUE(std::holds_alternative<VersionCommand>(parse_args({"--version"}).command));
}

// ==============================================================================
// Ошибки использования
// ==============================================================================

TEST(CliTest, Parse_PositionalArgument_Rejected) {
    // Arrange & Act
    auto result = parse_args({"clip.mp4"});

    // Assert
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("unexpected argument 'clip.mp4'"),
              std::string::npos);
    EXPECT_NE(result.diagnostic.stderr_message.find("Usage: mediascope [OPTIONS]"),
              std::string::npos);
}

TEST(CliTest, Parse_UnknownFlag_Rejected) {
    auto result = parse_args({"--verbose"});

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
}

TEST(CliTest, Parse_HelpWithExtra_ReportsExtra) {
    auto result = parse_args({"--help", "extra"});

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("'extra'"), std::string::npos);
}

// ==============================================================================
// Тексты
// ==============================================================================

TEST(CliTest, RenderVersion_Format) {
    EXPECT_EQ(render_version(), "mediascope 0.1.0\n");
}

TEST(CliTest, RenderHelp_ListsOptionsAndKeys) {
    std::string help = render_help();

    EXPECT_NE(help.find("Usage: mediascope [OPTIONS]"), std::string::npos);
    EXPECT_NE(help.find("--help"), std::string::npos);
    EXPECT_NE(help.find("--version"), std::string::npos);
    EXPECT_NE(help.find("Add filter"), std::string::npos);
    EXPECT_NE(help.find("MEDIASCOPE_CONFIG"), std::string::npos);
}

}  // namespace mediascope::cli::test
