// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// Байты первичны: std::fwrite без std::endl, flush только явно.
// RapidJSON для JSON сериализации.
//
// ==============================================================================

#include "glgname/output.hpp"

#include <algorithm>
#include <cstdio>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace glgname::output {

namespace {

constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

// Рамка таблицы, UTF-8
constexpr const char* BOX_V = "\xe2\x94\x82";      // │
constexpr const char* BOX_H = "\xe2\x94\x80";      // ─
constexpr const char* BOX_TL = "\xe2\x94\x8c";     // ┌
constexpr const char* BOX_TR = "\xe2\x94\x90";     // ┐
constexpr const char* BOX_BL = "\xe2\x94\x94";     // └
constexpr const char* BOX_BR = "\xe2\x94\x98";     // ┘
constexpr const char* BOX_LT = "\xe2\x94\x9c";     // ├
constexpr const char* BOX_RT = "\xe2\x94\xa4";     // ┤
constexpr const char* BOX_TT = "\xe2\x94\xac";     // ┬
constexpr const char* BOX_BT = "\xe2\x94\xb4";     // ┴
constexpr const char* BOX_CROSS = "\xe2\x94\xbc";  // ┼

std::string prefixed(std::string_view prefix, std::string_view message) {
    std::string result(prefix);
    result += ' ';
    result.append(message);
    result += '\n';
    return result;
}

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    if (config_.output_path.has_value()) {
        open_output_file();
    }
}

Writer::~Writer() {
    close_output_file();
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    FILE* f = get_file(s);
    if (f != nullptr && !bytes.empty()) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

FILE* Writer::get_file(Stream s) const {
    // stdout перенаправляется в файл при --output
    if (s == Stream::Stdout) {
        return output_file_ != nullptr ? output_file_ : stdout;
    }
    return stderr;
}

void Writer::write_prefixed(std::string_view prefix, Color color, std::string_view message) {
    if (supports_color(Stream::Stderr)) {
        write(Stream::Stderr, ansi_color_code(color));
        write(Stream::Stderr, prefix);
        write(Stream::Stderr, ANSI_RESET);
    } else {
        write(Stream::Stderr, prefix);
    }
    write(Stream::Stderr, " ");
    write_line(Stream::Stderr, message);
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[+]", Color::Green, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[!]", Color::Yellow, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются и при --quiet
    write_prefixed("[x]", Color::Red, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    write_prefixed("[*]", Color::Cyan, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    write_prefixed("[~]", Color::Magenta, message);
}

void Writer::write_json(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
}

void Writer::write_json_line(const rapidjson::Value& value) {
    write_json(value);
    write(Stream::Stdout, "\n");
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    write(Stream::Stdout, "\n");
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
    }
}

bool Writer::open_output_file() {
    if (!config_.output_path.has_value() || output_file_ != nullptr) {
        return output_file_ != nullptr;
    }
    output_file_ = std::fopen(config_.output_path->string().c_str(), "wb");
    return output_file_ != nullptr;
}

void Writer::close_output_file() {
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
        std::fclose(output_file_);
        output_file_ = nullptr;
    }
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

void Table::set_headers(const std::vector<std::string>& headers) {
    headers_ = headers;
}

void Table::add_row(const std::vector<std::string>& cells) {
    rows_.push_back(cells);
}

std::vector<size_t> Table::column_widths() const {
    size_t num_cols = headers_.size();
    for (const auto& row : rows_) {
        num_cols = std::max(num_cols, row.size());
    }

    std::vector<size_t> widths(num_cols, 0);
    for (size_t i = 0; i < headers_.size(); ++i) {
        widths[i] = headers_[i].size();
    }
    for (const auto& row : rows_) {
        for (size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }
    return widths;
}

std::string Table::format_border(const std::vector<size_t>& widths, const char* left,
                                 const char* middle, const char* right) const {
    std::string line = left;
    for (size_t i = 0; i < widths.size(); ++i) {
        for (size_t j = 0; j < widths[i] + 2; ++j) {
            line += BOX_H;
        }
        line += (i + 1 < widths.size()) ? middle : right;
    }
    line += '\n';
    return line;
}

std::string Table::format_row(const std::vector<size_t>& widths,
                              const std::vector<std::string>& cells) const {
    std::string line = BOX_V;
    for (size_t i = 0; i < widths.size(); ++i) {
        const std::string cell = (i < cells.size()) ? cells[i] : std::string();
        line += ' ';
        line += cell;
        line.append(widths[i] - cell.size() + 1, ' ');
        line += BOX_V;
    }
    line += '\n';
    return line;
}

std::string Table::to_string() const {
    std::vector<size_t> widths = column_widths();
    if (widths.empty()) {
        return {};
    }

    std::string result = format_border(widths, BOX_TL, BOX_TT, BOX_TR);
    if (!headers_.empty()) {
        result += format_row(widths, headers_);
        result += format_border(widths, BOX_LT, BOX_CROSS, BOX_RT);
    }
    for (const auto& row : rows_) {
        result += format_row(widths, row);
    }
    result += format_border(widths, BOX_BL, BOX_BT, BOX_BR);
    return result;
}

void Table::print(Writer& w) const {
    w.write(Stream::Stdout, to_string());
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_info(std::string_view message) {
    return prefixed("[+]", message);
}

std::string format_error(std::string_view message) {
    return prefixed("[x]", message);
}

std::string format_warning(std::string_view message) {
    return prefixed("[!]", message);
}

std::string format_debug(std::string_view message) {
    return prefixed("[*]", message);
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
        break;
    }
    return "";
}

std::string ansi_reset_code() {
    return ANSI_RESET;
}

// Цвет только для терминала; перенаправленный вывод остаётся без ANSI
bool supports_color(Stream s) {
    std::FILE* stream = s == Stream::Stdout ? stdout : stderr;
#ifdef _WIN32
    return _isatty(_fileno(stream)) != 0;
#else
    return isatty(fileno(stream)) != 0;
#endif
}

}  // namespace glgname::output
