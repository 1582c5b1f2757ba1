// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Загрузка YAML конфигурации (-c)
// 3. Создание Writer (output)
// 4. Dispatch команды, возврат exit code
//
// Исключения перехватываются на границе app: "[x] <err>", exit code 1.
//
// ==============================================================================

#include "glgname/cli.hpp"
#include "glgname/collection.hpp"
#include "glgname/config.hpp"
#include "glgname/datepath.hpp"
#include "glgname/detector.hpp"
#include "glgname/error.hpp"
#include "glgname/filename.hpp"
#include "glgname/output.hpp"
#include "glgname/scanner.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <rapidjson/document.h>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace {

using namespace glgname;

// ----------------------------------------------------------------------------
// JSON представление записи
// ----------------------------------------------------------------------------

rapidjson::Value to_json(const name::Filename& f, rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    auto str = [&alloc](const std::string& s) {
        return rapidjson::Value(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
    };

    obj.AddMember("basename", str(f.basename()), alloc);
    obj.AddMember("data_type", str(f.data_type()), alloc);
    obj.AddMember("detector", str(f.detector_name()), alloc);
    obj.AddMember("trigger", f.trigger(), alloc);
    obj.AddMember("uid", str(f.uid()), alloc);
    obj.AddMember("meta", str(f.meta()), alloc);
    obj.AddMember("version", f.version(), alloc);
    obj.AddMember("extension", str(f.extension()), alloc);
    obj.AddMember("directory", str(f.directory()), alloc);
    return obj;
}

std::vector<std::string> to_row(const name::Filename& f) {
    return {f.data_type(), f.detector_name(), f.trigger() ? "yes" : "no",
            f.uid(),       f.meta(),          f.version_str(),
            f.extension(), f.directory()};
}

const std::vector<std::string> RECORD_HEADERS = {"data_type", "detector", "trigger", "uid",
                                                 "meta",      "version",  "ext",     "directory"};

/// Разобрать пути согласно --skip-errors; нераспознанные -> предупреждения
std::vector<name::Filename> parse_paths(const std::vector<std::string>& paths, bool skip_errors,
                                        output::Writer& writer) {
    if (!skip_errors) {
        return name::list_from_paths(paths, name::UnknownPolicy::FailFast);
    }
    std::vector<std::string> unknown;
    auto files = name::list_from_paths(paths, name::UnknownPolicy::Collect, &unknown);
    for (const auto& p : unknown) {
        writer.warn("unrecognized file name - " + p);
    }
    return files;
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

int run_parse(const cli::ParseCommand& cmd, output::Writer& writer) {
    std::unique_ptr<output::Writer> file_writer;
    output::Writer* out = &writer;
    if (cmd.output.has_value()) {
        output::OutputConfig out_cfg = writer.config();
        out_cfg.output_path = cmd.output;
        file_writer = std::make_unique<output::Writer>(out_cfg);
        if (!file_writer->has_output_file()) {
            writer.error("unable to open output file - " + cmd.output->string());
            return 1;
        }
        out = file_writer.get();
    }

    auto files = parse_paths(cmd.paths, cmd.skip_errors, writer);
    writer.debug("parsed " + std::to_string(files.size()) + " of " +
                 std::to_string(cmd.paths.size()) + " names");

    if (cmd.json || cmd.jsonl) {
        rapidjson::Document doc(rapidjson::kArrayType);
        auto& alloc = doc.GetAllocator();
        for (const auto& f : files) {
            if (cmd.jsonl) {
                out->write_json_line(to_json(f, alloc));
            } else {
                doc.PushBack(to_json(f, alloc), alloc);
            }
        }
        if (cmd.json) {
            out->write_json_pretty(doc);
        }
        return 0;
    }

    output::Table table;
    table.set_headers(RECORD_HEADERS);
    for (const auto& f : files) {
        table.add_row(to_row(f));
    }
    table.print(*out);
    return 0;
}

// ----------------------------------------------------------------------------
// build
// ----------------------------------------------------------------------------

int run_build(const cli::BuildCommand& cmd, const config::Config& cfg, output::Writer& writer) {
    name::FilenameBuilder builder;
    if (cmd.template_name) {
        auto tmpl = cfg.builder_for(*cmd.template_name);
        if (!tmpl) {
            writer.error("unknown template - " + *cmd.template_name);
            return 1;
        }
        builder = *tmpl;
        writer.debug("using template " + *cmd.template_name);
    }

    if (cmd.data_type) {
        builder.data_type(*cmd.data_type);
    }
    if (cmd.detector) {
        builder.set("detector", *cmd.detector);
    }
    if (cmd.all_detectors) {
        builder.all_detectors();
    }
    if (cmd.uid) {
        builder.uid(*cmd.uid);
    }
    if (cmd.trigger) {
        builder.trigger(true);
    }
    if (cmd.meta) {
        builder.meta(*cmd.meta);
    }
    if (cmd.version) {
        builder.set("version", *cmd.version);
    }
    if (cmd.extension) {
        builder.extension(*cmd.extension);
    }
    if (cmd.directory) {
        builder.directory(*cmd.directory);
    }

    auto result = builder.build();
    if (!result) {
        writer.error(result.error.format());
        return 1;
    }

    if (cmd.each_detector) {
        for (const auto& f : result.filename->detector_list()) {
            writer.write_line(output::Stream::Stdout, f.full_path());
        }
    } else {
        writer.write_line(output::Stream::Stdout, result.filename->full_path());
    }
    return 0;
}

// ----------------------------------------------------------------------------
// scan
// ----------------------------------------------------------------------------

int run_scan(const cli::ScanCommand& cmd, const config::Config& cfg, output::Writer& writer) {
    // Флаги командной строки дополняют секцию scan конфигурации
    io::ScanOptions opt = cfg.scan;
    opt.hidden = opt.hidden || cmd.hidden;
    opt.recursive = opt.recursive || cmd.recursive;
    opt.absolute = opt.absolute || cmd.absolute;
    if (cmd.match) {
        opt.match = cmd.match;
    }

    auto scanner = io::scan_dir(cmd.root, opt);
    writer.debug("scanning " + cmd.root.string());

    rapidjson::Document doc(rapidjson::kArrayType);
    auto& alloc = doc.GetAllocator();
    output::Table table;
    table.set_headers(RECORD_HEADERS);
    size_t count = 0;

    for (const auto& path : scanner) {
        if (!cmd.parse) {
            ++count;
            if (cmd.json) {
                doc.PushBack(rapidjson::Value(path.c_str(),
                                              static_cast<rapidjson::SizeType>(path.size()), alloc),
                             alloc);
            } else {
                // Пути печатаются по мере обхода
                writer.write_line(output::Stream::Stdout, path);
            }
            continue;
        }

        auto parsed = name::Filename::from_path(path);
        if (!parsed) {
            writer.trace("skipping " + path);
            continue;
        }
        ++count;
        if (cmd.json) {
            doc.PushBack(to_json(*parsed, alloc), alloc);
        } else {
            table.add_row(to_row(*parsed));
        }
    }

    if (cmd.json) {
        writer.write_json_pretty(doc);
    } else if (cmd.parse) {
        table.print(writer);
    }
    writer.info("found " + std::to_string(count) + " files");
    return 0;
}

// ----------------------------------------------------------------------------
// check
// ----------------------------------------------------------------------------

int run_check(const cli::CheckCommand& cmd, output::Writer& writer) {
    auto files = parse_paths(cmd.paths, cmd.skip_errors, writer);

    bool exist = collection::all_exist(files, cmd.parent);
    bool complete = collection::is_complete(files);
    auto min_v = collection::min_version(files);
    auto max_v = collection::max_version(files);

    output::Table table;
    table.set_headers({"check", "result"});
    table.add_row({"files", std::to_string(files.size())});
    table.add_row({"all exist", exist ? "yes" : "no"});
    table.add_row({"complete", complete ? "yes" : "no"});
    table.add_row({"min version", min_v ? name::version_string(*min_v) : "-"});
    table.add_row({"max version", max_v ? name::version_string(*max_v) : "-"});

    if (!complete) {
        std::string missing;
        for (auto det : collection::missing_detectors(files)) {
            if (!missing.empty()) {
                missing += ", ";
            }
            missing += detector::short_name(det);
        }
        table.add_row({"missing", missing});
    }
    table.print(writer);

    return (exist && complete) ? 0 : 1;
}

// ----------------------------------------------------------------------------
// ymd
// ----------------------------------------------------------------------------

int run_ymd(const cli::YmdCommand& cmd, const config::Config& cfg, output::Writer& writer) {
    std::optional<std::string> base = cmd.base ? cmd.base : cfg.archive_base;
    if (!base) {
        writer.error("no archive base given and none configured (archive.base)");
        return 2;
    }

    std::string path;
    if (auto date = datepath::Date::parse(cmd.value)) {
        path = datepath::ymd_path(*base, *date);
    } else {
        path = datepath::ymd_path(*base, cmd.value);
    }
    writer.write_line(output::Stream::Stdout, path);
    return 0;
}

// ----------------------------------------------------------------------------
// run
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    auto parsed = cli::parse(argc, argv);
    if (!parsed.ok) {
        std::cerr << parsed.diagnostic.stderr_message;
        return parsed.diagnostic.exit_code;
    }

    output::OutputConfig out_cfg;
    out_cfg.quiet = parsed.global.quiet;
    out_cfg.verbose = parsed.global.verbose;
    output::Writer writer(out_cfg);
    writer.trace(std::string("glgname ") + cli::VERSION);

    if (auto* help = std::get_if<cli::HelpCommand>(&parsed.command)) {
        writer.write(output::Stream::Stdout, cli::render_help(help->command));
        return 0;
    }
    if (std::holds_alternative<cli::VersionCommand>(parsed.command)) {
        writer.write(output::Stream::Stdout, cli::render_version());
        return 0;
    }

    config::Config cfg;
    if (parsed.global.config) {
        auto loaded = config::load_config(*parsed.global.config);
        if (!loaded) {
            writer.error(loaded.error.format());
            return 1;
        }
        cfg = std::move(loaded.config);
        writer.debug("loaded configuration " + parsed.global.config->string());
    }

    try {
        if (auto* c = std::get_if<cli::ParseCommand>(&parsed.command)) {
            return run_parse(*c, writer);
        }
        if (auto* c = std::get_if<cli::BuildCommand>(&parsed.command)) {
            return run_build(*c, cfg, writer);
        }
        if (auto* c = std::get_if<cli::ScanCommand>(&parsed.command)) {
            return run_scan(*c, cfg, writer);
        }
        if (auto* c = std::get_if<cli::CheckCommand>(&parsed.command)) {
            return run_check(*c, writer);
        }
        if (auto* c = std::get_if<cli::YmdCommand>(&parsed.command)) {
            return run_ymd(*c, cfg, writer);
        }
    } catch (const NameError& e) {
        writer.error(e.error().format());
        return 1;
    }

    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
