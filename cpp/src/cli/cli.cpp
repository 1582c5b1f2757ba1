// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Собственный парсер argv, сообщения об ошибках в стиле clap:
//   error: <текст>\n\nUsage: ...\n\nFor more information, try '--help'.\n
// Ошибки использования -> exit code 2.
//
// ==============================================================================

#include "glgname/cli.hpp"

#include <cstring>
#include <utility>

namespace glgname::cli {

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

std::string usage_line(const std::optional<std::string>& command) {
    if (!command) {
        return "Usage: glgname [OPTIONS] <COMMAND>";
    }
    if (*command == "parse") {
        return "Usage: glgname parse [OPTIONS] <PATH>...";
    }
    if (*command == "build") {
        return "Usage: glgname build [OPTIONS] --type <TYPE> --uid <UID>";
    }
    if (*command == "scan") {
        return "Usage: glgname scan [OPTIONS] <DIR>";
    }
    if (*command == "check") {
        return "Usage: glgname check [OPTIONS] <PATH>...";
    }
    if (*command == "ymd") {
        return "Usage: glgname ymd [BASE] <NAME|DATE>";
    }
    return "Usage: glgname [OPTIONS] <COMMAND>";
}

/// Заполнить результат ошибкой использования
void usage_error(ParseResult& result, const std::string& message,
                 const std::optional<std::string>& command) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = "error: " + message + "\n\n" + usage_line(command) +
                                       "\n\nFor more information, try '--help'.\n";
}

/// Курсор по аргументам подкоманды
class Args {
public:
    Args(int argc, char** argv, int start) : argc_(argc), argv_(argv), pos_(start) {}

    bool done() const { return pos_ >= argc_; }
    const char* next() { return argv_[pos_++]; }

    /// Значение опции: следующий аргумент
    std::optional<std::string> value() {
        if (pos_ >= argc_) {
            return std::nullopt;
        }
        return std::string(argv_[pos_++]);
    }

private:
    int argc_;
    char** argv_;
    int pos_;
};

/// Разобрать значение опции; при отсутствии - ошибка использования
bool take_value(Args& args, const char* option, std::optional<std::string>& out,
                ParseResult& result, const std::string& command) {
    out = args.value();
    if (!out) {
        usage_error(result,
                    std::string("a value is required for '") + option + "' but none was supplied",
                    command);
        return false;
    }
    return true;
}

bool is_option(const char* arg) {
    return arg[0] == '-' && arg[1] != '\0';
}

bool is_help(const char* arg) {
    return str_eq(arg, "-h") || str_eq(arg, "--help");
}

void unexpected(ParseResult& result, const char* arg, const std::string& command) {
    usage_error(result, std::string("unexpected argument '") + arg + "' found", command);
}

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

bool parse_parse(Args& args, ParseResult& result) {
    ParseCommand cmd;
    while (!args.done()) {
        const char* arg = args.next();
        if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{"parse"};
            return true;
        } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            cmd.json = true;
        } else if (str_eq(arg, "--jsonl")) {
            cmd.jsonl = true;
        } else if (str_eq(arg, "--skip-errors")) {
            cmd.skip_errors = true;
        } else if (str_eq(arg, "-o") || str_eq(arg, "--output")) {
            std::optional<std::string> v;
            if (!take_value(args, arg, v, result, "parse")) {
                return false;
            }
            cmd.output = std::filesystem::path(*v);
        } else if (is_option(arg)) {
            unexpected(result, arg, "parse");
            return false;
        } else {
            cmd.paths.emplace_back(arg);
        }
    }

    if (cmd.paths.empty()) {
        usage_error(result, "the following required arguments were not provided: <PATH>...",
                    "parse");
        return false;
    }
    result.ok = true;
    result.command = std::move(cmd);
    return true;
}

bool parse_build(Args& args, ParseResult& result) {
    BuildCommand cmd;
    while (!args.done()) {
        const char* arg = args.next();
        bool ok = true;
        if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{"build"};
            return true;
        } else if (str_eq(arg, "-t") || str_eq(arg, "--template")) {
            ok = take_value(args, arg, cmd.template_name, result, "build");
        } else if (str_eq(arg, "--type")) {
            ok = take_value(args, arg, cmd.data_type, result, "build");
        } else if (str_eq(arg, "-d") || str_eq(arg, "--det")) {
            ok = take_value(args, arg, cmd.detector, result, "build");
        } else if (str_eq(arg, "--all-detectors")) {
            cmd.all_detectors = true;
        } else if (str_eq(arg, "--each-detector")) {
            cmd.each_detector = true;
        } else if (str_eq(arg, "-u") || str_eq(arg, "--uid")) {
            ok = take_value(args, arg, cmd.uid, result, "build");
        } else if (str_eq(arg, "--trigger")) {
            cmd.trigger = true;
        } else if (str_eq(arg, "--meta")) {
            ok = take_value(args, arg, cmd.meta, result, "build");
        } else if (str_eq(arg, "--ver")) {
            ok = take_value(args, arg, cmd.version, result, "build");
        } else if (str_eq(arg, "--ext")) {
            ok = take_value(args, arg, cmd.extension, result, "build");
        } else if (str_eq(arg, "--dir")) {
            ok = take_value(args, arg, cmd.directory, result, "build");
        } else {
            unexpected(result, arg, "build");
            return false;
        }
        if (!ok) {
            return false;
        }
    }

    int detector_modes = (cmd.detector ? 1 : 0) + (cmd.all_detectors ? 1 : 0) +
                         (cmd.each_detector ? 1 : 0);
    if (detector_modes > 1) {
        usage_error(result,
                    "'--det', '--all-detectors' and '--each-detector' cannot be used together",
                    "build");
        return false;
    }
    result.ok = true;
    result.command = std::move(cmd);
    return true;
}

bool parse_scan(Args& args, ParseResult& result) {
    ScanCommand cmd;
    bool have_root = false;
    while (!args.done()) {
        const char* arg = args.next();
        if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{"scan"};
            return true;
        } else if (str_eq(arg, "-a") || str_eq(arg, "--hidden")) {
            cmd.hidden = true;
        } else if (str_eq(arg, "-r") || str_eq(arg, "--recursive")) {
            cmd.recursive = true;
        } else if (str_eq(arg, "--absolute")) {
            cmd.absolute = true;
        } else if (str_eq(arg, "-p") || str_eq(arg, "--parse")) {
            cmd.parse = true;
        } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            cmd.json = true;
        } else if (str_eq(arg, "-m") || str_eq(arg, "--match")) {
            if (!take_value(args, arg, cmd.match, result, "scan")) {
                return false;
            }
        } else if (is_option(arg) || have_root) {
            unexpected(result, arg, "scan");
            return false;
        } else {
            cmd.root = std::filesystem::path(arg);
            have_root = true;
        }
    }

    if (!have_root) {
        usage_error(result, "the following required arguments were not provided: <DIR>", "scan");
        return false;
    }
    result.ok = true;
    result.command = std::move(cmd);
    return true;
}

bool parse_check(Args& args, ParseResult& result) {
    CheckCommand cmd;
    while (!args.done()) {
        const char* arg = args.next();
        if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{"check"};
            return true;
        } else if (str_eq(arg, "--parent")) {
            if (!take_value(args, arg, cmd.parent, result, "check")) {
                return false;
            }
        } else if (str_eq(arg, "--skip-errors")) {
            cmd.skip_errors = true;
        } else if (is_option(arg)) {
            unexpected(result, arg, "check");
            return false;
        } else {
            cmd.paths.emplace_back(arg);
        }
    }

    if (cmd.paths.empty()) {
        usage_error(result, "the following required arguments were not provided: <PATH>...",
                    "check");
        return false;
    }
    result.ok = true;
    result.command = std::move(cmd);
    return true;
}

bool parse_ymd(Args& args, ParseResult& result) {
    std::vector<std::string> positional;
    while (!args.done()) {
        const char* arg = args.next();
        if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{"ymd"};
            return true;
        } else if (is_option(arg)) {
            unexpected(result, arg, "ymd");
            return false;
        }
        positional.emplace_back(arg);
    }

    YmdCommand cmd;
    if (positional.size() == 1) {
        cmd.value = positional[0];
    } else if (positional.size() == 2) {
        cmd.base = positional[0];
        cmd.value = positional[1];
    } else if (positional.empty()) {
        usage_error(result, "the following required arguments were not provided: <NAME|DATE>",
                    "ymd");
        return false;
    } else {
        unexpected(result, positional[2].c_str(), "ymd");
        return false;
    }
    result.ok = true;
    result.command = std::move(cmd);
    return true;
}

}  // namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("glgname ") + VERSION + "\n";
}

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: glgname [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  parse    Parse data file names into their fields\n"
               "  build    Build a canonical data file name from fields\n"
               "  scan     List files under a directory\n"
               "  check    Check existence, detector completeness and versions\n"
               "  ymd      Print the date-partitioned directory for a file or date\n"
               "  help     Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "  -c, --config <CONFIG>  YAML configuration file\n"
               "  -v...                  Print verbose output\n"
               "  -q, --quiet            Suppress informational output\n"
               "  -h, --help             Print help\n"
               "  -V, --version          Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Parse a trigger spectrum file name:\n"
               "        glgname parse glg_cspec_n0_bn090131090_v00.pha\n"
               "\n"
               "    Build the file names of every detector:\n"
               "        glgname build --type ctime --uid 170101 --ext pha --each-detector\n"
               "\n"
               "    Place a file into the daily archive:\n"
               "        glgname ymd /data/archive glg_ctime_nb_170101_v00.pha\n";
    } else if (*command == "parse") {
        return "Parse data file names into their fields\n"
               "\n"
               "Usage: glgname parse [OPTIONS] <PATH>...\n"
               "\n"
               "Arguments:\n"
               "  <PATH>...  Paths or names of data files\n"
               "\n"
               "Options:\n"
               "  -j, --json             Output as JSON\n"
               "      --jsonl            Output as JSON lines\n"
               "      --skip-errors      Report unrecognised names and continue\n"
               "  -o, --output <OUTPUT>  Save output to a file\n"
               "  -h, --help             Print help\n";
    } else if (*command == "build") {
        return "Build a canonical data file name from fields\n"
               "\n"
               "Usage: glgname build [OPTIONS] --type <TYPE> --uid <UID>\n"
               "\n"
               "Options:\n"
               "  -t, --template <NAME>  Start from a template of the configuration file\n"
               "      --type <TYPE>      Data type, e.g. cspec, ctime, tte\n"
               "  -d, --det <DET>        Detector: short code, full name or index\n"
               "      --all-detectors    Use the 'all' detector token\n"
               "      --each-detector    Print one name per detector\n"
               "  -u, --uid <UID>        Unique id: trigger id or YYMMDD date id\n"
               "      --trigger          The uid is a trigger id (bn prefix)\n"
               "      --meta <META>      Free-form metadata\n"
               "      --ver <VERSION>    Version number 0..99 [default: 0]\n"
               "      --ext <EXT>        File extension [default: fit]\n"
               "      --dir <DIR>        Directory to prepend\n"
               "  -h, --help             Print help\n";
    } else if (*command == "scan") {
        return "List files under a directory\n"
               "\n"
               "Usage: glgname scan [OPTIONS] <DIR>\n"
               "\n"
               "Arguments:\n"
               "  <DIR>  Directory to scan\n"
               "\n"
               "Options:\n"
               "  -a, --hidden         Include hidden entries\n"
               "  -r, --recursive      Descend into subdirectories\n"
               "      --absolute       Print absolute paths\n"
               "  -m, --match <REGEX>  Only files whose name matches from the start\n"
               "  -p, --parse          Only canonical data file names, with fields\n"
               "  -j, --json           Output as JSON\n"
               "  -h, --help           Print help\n";
    } else if (*command == "check") {
        return "Check existence, detector completeness and versions\n"
               "\n"
               "Usage: glgname check [OPTIONS] <PATH>...\n"
               "\n"
               "Arguments:\n"
               "  <PATH>...  Paths of data files\n"
               "\n"
               "Options:\n"
               "      --parent <DIR>  Look for the files under this directory\n"
               "      --skip-errors   Ignore unrecognised names\n"
               "  -h, --help          Print help\n";
    } else if (*command == "ymd") {
        return "Print the date-partitioned directory for a file or date\n"
               "\n"
               "Usage: glgname ymd [BASE] <NAME|DATE>\n"
               "\n"
               "Arguments:\n"
               "  [BASE]       Archive root [default: archive.base of the configuration]\n"
               "  <NAME|DATE>  Data file name or YYYY-MM-DD date\n"
               "\n"
               "Options:\n"
               "  -h, --help  Print help\n";
    }
    return "error: unrecognized subcommand '" + *command + "'\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    // Глобальные опции до подкоманды
    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (str_eq(arg, "-v")) {
            result.global.verbose++;
        } else if (str_eq(arg, "-vv")) {
            result.global.verbose += 2;
        } else if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "-c") || str_eq(arg, "--config")) {
            if (i + 1 >= argc) {
                usage_error(result,
                            std::string("a value is required for '") + arg +
                                "' but none was supplied",
                            std::nullopt);
                return result;
            }
            result.global.config = std::filesystem::path(argv[++i]);
        } else if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (is_option(arg)) {
            usage_error(result, std::string("unexpected argument '") + arg + "' found",
                        std::nullopt);
            return result;
        } else {
            cmd_idx = i;
            break;
        }
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const char* cmd = argv[cmd_idx];
    Args args(argc, argv, cmd_idx + 1);

    if (str_eq(cmd, "parse")) {
        parse_parse(args, result);
    } else if (str_eq(cmd, "build")) {
        parse_build(args, result);
    } else if (str_eq(cmd, "scan")) {
        parse_scan(args, result);
    } else if (str_eq(cmd, "check")) {
        parse_check(args, result);
    } else if (str_eq(cmd, "ymd")) {
        parse_ymd(args, result);
    } else if (str_eq(cmd, "help")) {
        HelpCommand help;
        if (!args.done()) {
            help.command = std::string(args.next());
        }
        result.ok = true;
        result.command = help;
    } else if (str_eq(cmd, "version")) {
        result.ok = true;
        result.command = VersionCommand{};
    } else {
        usage_error(result, std::string("unrecognized subcommand '") + cmd + "'", std::nullopt);
    }

    return result;
}

}  // namespace glgname::cli
