// ==============================================================================
// glgname/config.hpp - YAML конфигурация
// ==============================================================================
//
// Назначение:
// - Параметры обхода каталогов по умолчанию (секция scan)
// - Корень архива для каталогов по датам (секция archive)
// - Именованные шаблоны записей (секция templates)
//
// Пример:
//   scan:
//     hidden: false
//     recursive: true
//     match: "^glg_"
//   archive:
//     base: /data/gbm/archive
//   templates:
//     tte_trigger:
//       data_type: tte
//       trigger: true
//
// ==============================================================================

#ifndef GLGNAME_CONFIG_HPP
#define GLGNAME_CONFIG_HPP

#include <glgname/error.hpp>
#include <glgname/filename.hpp>
#include <glgname/scanner.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace glgname::config {

/// Шаблон записи: поле -> значение, применяется через FilenameBuilder::set()
using Template = std::map<std::string, std::string>;

struct Config {
    io::ScanOptions scan;
    std::optional<std::string> archive_base;
    std::map<std::string, Template> templates;

    /// Builder, заполненный полями шаблона.
    /// Неизвестный шаблон -> nullopt.
    std::optional<name::FilenameBuilder> builder_for(const std::string& template_name) const;
};

struct ConfigResult {
    bool ok = false;
    Config config;
    Error error;

    explicit operator bool() const { return ok; }
};

/// Загрузить конфигурацию из файла
ConfigResult load_config(const std::filesystem::path& path);

/// Разобрать конфигурацию из YAML текста
ConfigResult parse_config(std::string_view yaml_text);

}  // namespace glgname::config

#endif  // GLGNAME_CONFIG_HPP
