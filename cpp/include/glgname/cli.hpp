// ==============================================================================
// glgname/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef GLGNAME_CLI_HPP
#define GLGNAME_CLI_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace glgname::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;                              // -v (повторяемый)
    bool quiet = false;                           // -q, --quiet
    std::optional<std::filesystem::path> config;  // -c, --config
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// parse - разбор имён файлов
struct ParseCommand {
    std::vector<std::string> paths;
    bool json = false;                            // -j, --json
    bool jsonl = false;                           // --jsonl
    bool skip_errors = false;                     // --skip-errors
    std::optional<std::filesystem::path> output;  // -o, --output
};

/// build - сборка имени из полей
struct BuildCommand {
    std::optional<std::string> template_name;  // -t, --template
    std::optional<std::string> data_type;      // --type
    std::optional<std::string> detector;       // -d, --det
    bool all_detectors = false;                // --all-detectors
    bool each_detector = false;                // --each-detector
    std::optional<std::string> uid;            // -u, --uid
    bool trigger = false;                      // --trigger
    std::optional<std::string> meta;           // --meta
    std::optional<std::string> version;        // --ver
    std::optional<std::string> extension;      // --ext
    std::optional<std::string> directory;      // --dir
};

/// scan - обход каталога
struct ScanCommand {
    std::filesystem::path root;
    bool hidden = false;               // -a, --hidden
    bool recursive = false;            // -r, --recursive
    bool absolute = false;             // --absolute
    std::optional<std::string> match;  // -m, --match
    bool parse = false;                // -p, --parse (только канонические имена)
    bool json = false;                 // -j, --json
};

/// check - существование, полнота, версии
struct CheckCommand {
    std::vector<std::string> paths;
    std::optional<std::string> parent;  // --parent
    bool skip_errors = false;           // --skip-errors
};

/// ymd - каталог по дате
struct YmdCommand {
    std::optional<std::string> base;  // позиционный или archive.base из конфигурации
    std::string value;                // имя файла или YYYY-MM-DD
};

struct HelpCommand {
    std::optional<std::string> command;
};

struct VersionCommand {};

using Command = std::variant<ParseCommand, BuildCommand, ScanCommand, CheckCommand, YmdCommand,
                             HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика и результат
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

ParseResult parse(int argc, char** argv);

std::string render_help(const std::optional<std::string>& command = std::nullopt);

std::string render_version();

constexpr const char* VERSION = "1.0.0";

constexpr const char* ABOUT = "Parse, build and organise GBM data product filenames";

}  // namespace glgname::cli

#endif  // GLGNAME_CLI_HPP
