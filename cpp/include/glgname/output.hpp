// ==============================================================================
// glgname/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Сообщения с префиксами [+] [!] [x] [*] [~]
// - JSON / JSON Lines через RapidJSON
// - Таблицы с рамкой
// - Вывод в файл (--output)
//
// Библиотечные модули ничего не печатают: только app через Writer.
//
// ==============================================================================

#ifndef GLGNAME_OUTPUT_HPP
#define GLGNAME_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace glgname::output {

enum class Stream { Stdout, Stderr };

enum class Format {
    Std,   // таблица/текст
    Json,  // JSON массив
    Jsonl  // один объект на строку
};

enum class Color { Default, Green, Yellow, Red, Cyan, Magenta };

struct OutputConfig {
    bool quiet = false;  // -q
    int verbose = 0;     // -v (повторяемый)
    Format format = Format::Std;

    // --output
    std::optional<std::filesystem::path> output_path;
};

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    void write(Stream s, std::string_view bytes);
    void write_line(Stream s, std::string_view bytes);

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (verbose > 1)
    void trace(std::string_view message);

    void write_json(const rapidjson::Value& value);
    void write_json_line(const rapidjson::Value& value);
    void write_json_pretty(const rapidjson::Value& value);

    void flush();

    const OutputConfig& config() const { return config_; }

    bool open_output_file();
    void close_output_file();
    bool has_output_file() const { return output_file_ != nullptr; }

private:
    void write_prefixed(std::string_view prefix, Color color, std::string_view message);
    FILE* get_file(Stream s) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;
};

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

class Table {
public:
    void set_headers(const std::vector<std::string>& headers);
    void add_row(const std::vector<std::string>& cells);

    void print(Writer& w) const;
    std::string to_string() const;

    size_t row_count() const { return rows_.size(); }

private:
    std::vector<size_t> column_widths() const;
    std::string format_border(const std::vector<size_t>& widths, const char* left,
                              const char* middle, const char* right) const;
    std::string format_row(const std::vector<size_t>& widths,
                           const std::vector<std::string>& cells) const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_info(std::string_view message);
std::string format_error(std::string_view message);
std::string format_warning(std::string_view message);
std::string format_debug(std::string_view message);

std::string ansi_color_code(Color color);
std::string ansi_reset_code();

/// TTY check
bool supports_color(Stream s);

}  // namespace glgname::output

#endif  // GLGNAME_OUTPUT_HPP
