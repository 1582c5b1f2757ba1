// ==============================================================================
// test_cli_gtest.cpp - Тесты CLI модуля (GoogleTest)
// ==============================================================================
//
// Парсинг глобальных опций и подкоманд, help/version, ошибки использования.
//
// TST-CLI-001..TST-CLI-010
//
// ==============================================================================

#include "glgname/cli.hpp"

#include <gtest/gtest.h>
#include <initializer_list>
#include <string>
#include <variant>
#include <vector>

namespace glgname::cli::test {

// ==============================================================================
// Вспомогательные функции
// ==============================================================================

// Конвертация вектора строк в argc/argv
struct Args {
    std::vector<std::string> strings;
    std::vector<char*> ptrs;

    explicit Args(std::initializer_list<std::string> args) : strings(args) {
        for (auto& s : strings) {
            ptrs.push_back(s.data());
        }
        ptrs.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(strings.size()); }

    char** argv() { return ptrs.data(); }
};

// ==============================================================================
// TST-CLI-001: help / version
// ==============================================================================

TEST(CliTest, Parse_Help_ReturnsHelpCommand) {
    // Arrange
    Args args{"glgname", "--help"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    EXPECT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_FALSE(std::get<HelpCommand>(result.command).command.has_value());
}

TEST(CliTest, Parse_HelpSubcommand_ReturnsHelpForCommand) {
    Args args{"glgname", "help", "build"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_EQ(std::get<HelpCommand>(result.command).command.value_or(""), "build");
}

TEST(CliTest, Parse_CommandHelpFlag_ReturnsHelpForCommand) {
    Args args{"glgname", "scan", "-h"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_EQ(std::get<HelpCommand>(result.command).command.value_or(""), "scan");
}

TEST(CliTest, Parse_Version_ReturnsVersionCommand) {
    Args args{"glgname", "-V"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<VersionCommand>(result.command));
    EXPECT_EQ(render_version(), "glgname 1.0.0\n");
}

TEST(CliTest, Parse_NoArguments_UsageExitCode) {
    Args args{"glgname"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("Usage: glgname"), std::string::npos);
}

// ==============================================================================
// TST-CLI-002: Глобальные опции
// ==============================================================================

TEST(CliTest, Parse_GlobalOptions) {
    // Arrange
    Args args{"glgname", "-q", "-v", "-v", "-c", "glgname.yaml", "parse", "a.fit"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.global.quiet);
    EXPECT_EQ(result.global.verbose, 2);
    ASSERT_TRUE(result.global.config.has_value());
    EXPECT_EQ(result.global.config->string(), "glgname.yaml");
}

TEST(CliTest, Parse_ConfigWithoutValue_UsageError) {
    Args args{"glgname", "--config"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
}

// ==============================================================================
// TST-CLI-003: parse
// ==============================================================================

TEST(CliTest, Parse_Parse_PathsAndFlags) {
    Args args{"glgname", "parse", "--jsonl", "--skip-errors", "a.fit", "b.fit"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<ParseCommand>(result.command));
    const auto& cmd = std::get<ParseCommand>(result.command);
    EXPECT_EQ(cmd.paths.size(), 2u);
    EXPECT_TRUE(cmd.jsonl);
    EXPECT_FALSE(cmd.json);
    EXPECT_TRUE(cmd.skip_errors);
}

TEST(CliTest, Parse_Parse_NoPaths_UsageError) {
    Args args{"glgname", "parse", "--json"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("<PATH>..."), std::string::npos);
}

// ==============================================================================
// TST-CLI-004: build
// ==============================================================================

TEST(CliTest, Parse_Build_AllFields) {
    Args args{"glgname", "build", "--type", "cspec", "-d", "n0", "--trigger", "-u",
              "090131090", "--ver", "2", "--ext", "pha", "--dir", "/data", "--meta", "x"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<BuildCommand>(result.command));
    const auto& cmd = std::get<BuildCommand>(result.command);
    EXPECT_EQ(cmd.data_type.value_or(""), "cspec");
    EXPECT_EQ(cmd.detector.value_or(""), "n0");
    EXPECT_TRUE(cmd.trigger);
    EXPECT_EQ(cmd.uid.value_or(""), "090131090");
    EXPECT_EQ(cmd.version.value_or(""), "2");
    EXPECT_EQ(cmd.extension.value_or(""), "pha");
    EXPECT_EQ(cmd.directory.value_or(""), "/data");
    EXPECT_EQ(cmd.meta.value_or(""), "x");
}

TEST(CliTest, Parse_Build_DetectorModesExclusive) {
    Args args{"glgname", "build", "--type", "ctime", "-u", "170101", "--det", "n0",
              "--each-detector"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("cannot be used together"),
              std::string::npos);
}

TEST(CliTest, Parse_Build_MissingValue) {
    Args args{"glgname", "build", "--type"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("a value is required for '--type'"),
              std::string::npos);
}

// ==============================================================================
// TST-CLI-005: scan
// ==============================================================================

TEST(CliTest, Parse_Scan_Options) {
    Args args{"glgname", "scan", "-r", "-a", "--absolute", "-m", "^glg_", "-p", "/data"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<ScanCommand>(result.command));
    const auto& cmd = std::get<ScanCommand>(result.command);
    EXPECT_EQ(cmd.root.string(), "/data");
    EXPECT_TRUE(cmd.recursive);
    EXPECT_TRUE(cmd.hidden);
    EXPECT_TRUE(cmd.absolute);
    EXPECT_TRUE(cmd.parse);
    EXPECT_EQ(cmd.match.value_or(""), "^glg_");
}

TEST(CliTest, Parse_Scan_TwoRoots_UsageError) {
    Args args{"glgname", "scan", "/a", "/b"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("unexpected argument '/b' found"),
              std::string::npos);
}

// ==============================================================================
// TST-CLI-006: check
// ==============================================================================

TEST(CliTest, Parse_Check_Parent) {
    Args args{"glgname", "check", "--parent", "/data", "a.fit"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    const auto& cmd = std::get<CheckCommand>(result.command);
    EXPECT_EQ(cmd.parent.value_or(""), "/data");
    ASSERT_EQ(cmd.paths.size(), 1u);
}

// ==============================================================================
// TST-CLI-007: ymd
// ==============================================================================

TEST(CliTest, Parse_Ymd_OneOrTwoPositionals) {
    Args one{"glgname", "ymd", "glg_ctime_n0_170101_v00.pha"};
    Args two{"glgname", "ymd", "/archive", "2017-01-01"};

    ParseResult r1 = parse(one.argc(), one.argv());
    ParseResult r2 = parse(two.argc(), two.argv());

    ASSERT_TRUE(r1.ok);
    ASSERT_TRUE(r2.ok);
    const auto& c1 = std::get<YmdCommand>(r1.command);
    const auto& c2 = std::get<YmdCommand>(r2.command);
    EXPECT_FALSE(c1.base.has_value());
    EXPECT_EQ(c1.value, "glg_ctime_n0_170101_v00.pha");
    EXPECT_EQ(c2.base.value_or(""), "/archive");
    EXPECT_EQ(c2.value, "2017-01-01");
}

// ==============================================================================
// TST-CLI-008: Неизвестные аргументы
// ==============================================================================

TEST(CliTest, Parse_UnknownSubcommand) {
    Args args{"glgname", "frobnicate"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("unrecognized subcommand 'frobnicate'"),
              std::string::npos);
}

TEST(CliTest, Parse_UnknownOption) {
    Args args{"glgname", "check", "--bogus", "a.fit"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("unexpected argument '--bogus' found"),
              std::string::npos);
    EXPECT_NE(result.diagnostic.stderr_message.find("For more information, try '--help'."),
              std::string::npos);
}

// ==============================================================================
// TST-CLI-009: Тексты справки
// ==============================================================================

TEST(CliTest, RenderHelp_ListsCommands) {
    std::string help = render_help();

    for (const char* cmd : {"parse", "build", "scan", "check", "ymd"}) {
        EXPECT_NE(help.find(std::string("  ") + cmd), std::string::npos) << cmd;
    }
}

TEST(CliTest, RenderHelp_PerCommandUsage) {
    EXPECT_NE(render_help(std::string("ymd")).find("Usage: glgname ymd"), std::string::npos);
    EXPECT_NE(render_help(std::string("nope")).find("unrecognized subcommand"),
              std::string::npos);
}

// ==============================================================================
// TST-CLI-010: Детерминизм
// ==============================================================================

TEST(CliTest, Parse_SameArgs_SameResult) {
    Args a{"glgname", "parse", "-j", "x.fit"};
    Args b{"glgname", "parse", "-j", "x.fit"};

    ParseResult r1 = parse(a.argc(), a.argv());
    ParseResult r2 = parse(b.argc(), b.argv());

    ASSERT_TRUE(r1.ok);
    ASSERT_TRUE(r2.ok);
    EXPECT_EQ(std::get<ParseCommand>(r1.command).paths,
              std::get<ParseCommand>(r2.command).paths);
}

}  // namespace glgname::cli::test
