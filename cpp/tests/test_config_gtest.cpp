// ==============================================================================
// test_config_gtest.cpp - Тесты YAML конфигурации (GoogleTest)
// ==============================================================================
//
// Тесты: TST-CFG-001..TST-CFG-006
//
// ==============================================================================

#include "glgname/config.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace glgname::config::test {

// ==============================================================================
// TST-CFG-001: Полная конфигурация
// ==============================================================================

TEST(ConfigTest, TST_CFG_001_Parse_AllSections) {
    // Arrange
    const char* yaml = R"(
scan:
  hidden: true
  recursive: true
  match: "^glg_"
archive:
  base: /data/gbm/archive
templates:
  daily_ctime:
    data_type: ctime
    extension: pha
  trigger_tte:
    data_type: tte
    trigger: true
    version: 1
)";

    // Act
    auto result = parse_config(yaml);

    // Assert
    ASSERT_TRUE(result) << result.error.format();
    const auto& cfg = result.config;
    EXPECT_TRUE(cfg.scan.hidden);
    EXPECT_TRUE(cfg.scan.recursive);
    EXPECT_FALSE(cfg.scan.absolute);
    EXPECT_EQ(cfg.scan.match.value_or(""), "^glg_");
    EXPECT_EQ(cfg.archive_base.value_or(""), "/data/gbm/archive");
    EXPECT_EQ(cfg.templates.size(), 2u);
}

TEST(ConfigTest, TST_CFG_001_Parse_Empty) {
    auto result = parse_config("");

    ASSERT_TRUE(result);
    EXPECT_FALSE(result.config.scan.recursive);
    EXPECT_FALSE(result.config.archive_base.has_value());
    EXPECT_TRUE(result.config.templates.empty());
}

// ==============================================================================
// TST-CFG-002: Шаблоны
// ==============================================================================

TEST(ConfigTest, TST_CFG_002_BuilderFor_AppliesTemplate) {
    auto result = parse_config(R"(
templates:
  trigger_tte:
    data_type: tte
    trigger: true
    version: 1
)");
    ASSERT_TRUE(result);

    auto builder = result.config.builder_for("trigger_tte");
    ASSERT_TRUE(builder.has_value());
    auto built = builder->detector("n4").uid("170817529").build();

    ASSERT_TRUE(built) << built.error.format();
    EXPECT_EQ(built.filename->basename(), "glg_tte_n4_bn170817529_v01.fit");
}

TEST(ConfigTest, TST_CFG_002_BuilderFor_UnknownTemplate) {
    Config cfg;

    EXPECT_FALSE(cfg.builder_for("nope").has_value());
}

TEST(ConfigTest, TST_CFG_002_Template_UnknownField) {
    auto result = parse_config(R"(
templates:
  broken:
    data_type: tte
    colour: red
)");

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::UnknownField);
    EXPECT_NE(result.error.message.find("template 'broken'"), std::string::npos);
}

TEST(ConfigTest, TST_CFG_002_Template_InvalidDetector) {
    auto result = parse_config(R"(
templates:
  broken:
    detector: n12
)");

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::InvalidDetector);
}

TEST(ConfigTest, TST_CFG_002_Template_VersionOutOfRange_WithoutRequiredFields) {
    // data_type/uid задаются при сборке; версия проверяется уже при загрузке
    auto result = parse_config(R"(
templates:
  broken:
    version: 150
)");

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::InvalidVersion);
    EXPECT_NE(result.error.message.find("template 'broken'"), std::string::npos);
}

TEST(ConfigTest, TST_CFG_002_Template_MetaSeparatorOnly) {
    auto result = parse_config(R"(
templates:
  broken:
    meta: "_"
)");

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::InvalidValue);
}

TEST(ConfigTest, TST_CFG_002_Template_PartialFields_Accepted) {
    auto result = parse_config(R"(
templates:
  partial:
    detector: b0
)");

    ASSERT_TRUE(result) << result.error.format();
    EXPECT_EQ(result.config.templates.count("partial"), 1u);
}

// ==============================================================================
// TST-CFG-003: Неизвестные ключи
// ==============================================================================

TEST(ConfigTest, TST_CFG_003_UnknownRootKey) {
    auto result = parse_config("output: json\n");

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::Config);
    EXPECT_EQ(result.error.context, "output");
}

TEST(ConfigTest, TST_CFG_003_UnknownScanKey) {
    auto result = parse_config("scan:\n  follow_links: true\n");

    EXPECT_FALSE(result);
    EXPECT_NE(result.error.message.find("'scan'"), std::string::npos);
}

// ==============================================================================
// TST-CFG-004: Некорректный YAML
// ==============================================================================

TEST(ConfigTest, TST_CFG_004_MalformedYaml) {
    auto result = parse_config("scan: [unterminated\n");

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::Config);
}

TEST(ConfigTest, TST_CFG_004_WrongValueType) {
    auto result = parse_config("scan:\n  recursive: maybe\n");

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::Config);
}

TEST(ConfigTest, TST_CFG_004_SectionNotMapping) {
    auto result = parse_config("archive: /data\n");

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.context, "archive");
}

// ==============================================================================
// TST-CFG-005: Загрузка из файла
// ==============================================================================

TEST(ConfigTest, TST_CFG_005_LoadConfig_File) {
    auto path = std::filesystem::temp_directory_path() /
                ("glgname_config_" +
                 std::to_string(
#ifdef _WIN32
                     GetCurrentProcessId()
#else
                     getpid()
#endif
                         ) +
                 ".yaml");
    {
        std::ofstream out(path);
        out << "archive:\n  base: /srv/archive\n";
    }

    auto result = load_config(path);

    ASSERT_TRUE(result) << result.error.format();
    EXPECT_EQ(result.config.archive_base.value_or(""), "/srv/archive");
    std::filesystem::remove(path);
}

// ==============================================================================
// TST-CFG-006: Отсутствующий файл
// ==============================================================================

TEST(ConfigTest, TST_CFG_006_LoadConfig_MissingFile) {
    auto path = std::filesystem::temp_directory_path() / "glgname_config_does_not_exist.yaml";

    auto result = load_config(path);

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.kind, ErrorKind::Config);
    EXPECT_EQ(result.error.context, path.string());
}

}  // namespace glgname::config::test
