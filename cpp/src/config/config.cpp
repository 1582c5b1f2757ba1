// ==============================================================================
// config.cpp - YAML конфигурация
// ==============================================================================

#include "glgname/config.hpp"

#include <initializer_list>
#include <string>
#include <utility>
#include <yaml-cpp/yaml.h>

namespace glgname::config {

namespace {

Error config_error(std::string message, std::string context) {
    return Error{ErrorKind::Config, std::move(message), std::move(context)};
}

/// Проверить, что все ключи секции из допустимого набора
bool check_keys(const YAML::Node& section, std::initializer_list<const char*> allowed,
                const std::string& section_name, Error& error) {
    for (const auto& kv : section) {
        std::string key = kv.first.as<std::string>();
        bool known = false;
        for (const char* a : allowed) {
            if (key == a) {
                known = true;
                break;
            }
        }
        if (!known) {
            error = config_error("unknown key in section '" + section_name + "'", key);
            return false;
        }
    }
    return true;
}

bool parse_scan(const YAML::Node& node, io::ScanOptions& scan, Error& error) {
    if (!node.IsMap()) {
        error = config_error("section must be a mapping", "scan");
        return false;
    }
    if (!check_keys(node, {"hidden", "recursive", "absolute", "match"}, "scan", error)) {
        return false;
    }
    if (node["hidden"]) {
        scan.hidden = node["hidden"].as<bool>();
    }
    if (node["recursive"]) {
        scan.recursive = node["recursive"].as<bool>();
    }
    if (node["absolute"]) {
        scan.absolute = node["absolute"].as<bool>();
    }
    if (node["match"]) {
        scan.match = node["match"].as<std::string>();
    }
    return true;
}

bool parse_archive(const YAML::Node& node, Config& cfg, Error& error) {
    if (!node.IsMap()) {
        error = config_error("section must be a mapping", "archive");
        return false;
    }
    if (!check_keys(node, {"base"}, "archive", error)) {
        return false;
    }
    if (node["base"]) {
        cfg.archive_base = node["base"].as<std::string>();
    }
    return true;
}

bool parse_templates(const YAML::Node& node, Config& cfg, Error& error) {
    if (!node.IsMap()) {
        error = config_error("section must be a mapping", "templates");
        return false;
    }
    for (const auto& entry : node) {
        std::string tmpl_name = entry.first.as<std::string>();
        if (!entry.second.IsMap()) {
            error = config_error("template must be a mapping", tmpl_name);
            return false;
        }

        Template tmpl;
        for (const auto& field : entry.second) {
            tmpl[field.first.as<std::string>()] = field.second.as<std::string>();
        }

        // Поля проверяются тем же путём, что и при сборке имени. Обязательные
        // поля, которых нет в шаблоне, заполняются заглушками, чтобы проверка
        // версии и meta не пряталась за MissingField.
        name::FilenameBuilder check;
        check.data_type("template").uid("000000000").extension(name::DEFAULT_EXTENSION);
        for (const auto& [key, value] : tmpl) {
            check.set(key, value);
        }
        auto checked = check.build();
        if (!checked) {
            error = checked.error;
            error.message = "template '" + tmpl_name + "': " + error.message;
            return false;
        }

        cfg.templates.emplace(std::move(tmpl_name), std::move(tmpl));
    }
    return true;
}

ConfigResult parse_root(const YAML::Node& root) {
    ConfigResult result;

    if (root.IsNull()) {
        result.ok = true;
        return result;
    }
    if (!root.IsMap()) {
        result.error = config_error("configuration must be a mapping", "");
        return result;
    }
    if (!check_keys(root, {"scan", "archive", "templates"}, "root", result.error)) {
        return result;
    }

    if (root["scan"] && !parse_scan(root["scan"], result.config.scan, result.error)) {
        return result;
    }
    if (root["archive"] && !parse_archive(root["archive"], result.config, result.error)) {
        return result;
    }
    if (root["templates"] && !parse_templates(root["templates"], result.config, result.error)) {
        return result;
    }

    result.ok = true;
    return result;
}

}  // namespace

std::optional<name::FilenameBuilder> Config::builder_for(const std::string& template_name) const {
    auto it = templates.find(template_name);
    if (it == templates.end()) {
        return std::nullopt;
    }
    name::FilenameBuilder b;
    for (const auto& [key, value] : it->second) {
        b.set(key, value);
    }
    return b;
}

ConfigResult load_config(const std::filesystem::path& path) {
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        ConfigResult result = parse_root(root);
        if (!result && result.error.context.empty()) {
            result.error.context = path.string();
        }
        return result;
    } catch (const YAML::Exception& e) {
        ConfigResult result;
        result.error = config_error(e.what(), path.string());
        return result;
    }
}

ConfigResult parse_config(std::string_view yaml_text) {
    try {
        YAML::Node root = YAML::Load(std::string(yaml_text));
        return parse_root(root);
    } catch (const YAML::Exception& e) {
        ConfigResult result;
        result.error = config_error(e.what(), "");
        return result;
    }
}

}  // namespace glgname::config
