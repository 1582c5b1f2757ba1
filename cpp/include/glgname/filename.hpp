// ==============================================================================
// glgname/filename.hpp - Каноническое имя файла данных GBM
// ==============================================================================
//
// Формат:
//   glg_<data_type>_<detector>_[bn]<uid>[<meta>]_v<version>.<extension>
//
// Назначение:
// - Грамматика имени (единственный источник истины о допустимых именах)
// - Filename: структурированная запись, разбор и сериализация
// - FilenameBuilder: закрытое присваивание полей по имени + валидация
// - Пакетный разбор списков путей
//
// Закон обратимости: parse(basename(r)) восстанавливает поля r,
// basename(parse(s)) == s для канонических имён.
//
// ==============================================================================

#ifndef GLGNAME_FILENAME_HPP
#define GLGNAME_FILENAME_HPP

#include <glgname/detector.hpp>
#include <glgname/error.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace glgname::name {

// ----------------------------------------------------------------------------
// Константы грамматики
// ----------------------------------------------------------------------------

constexpr const char* PREFIX = "glg_";
constexpr const char* TRIGGER_MARKER = "bn";
constexpr const char* ALL_DETECTORS = "all";
constexpr const char* DEFAULT_EXTENSION = "fit";
constexpr int MAX_VERSION = 99;

// ----------------------------------------------------------------------------
// Fields - поля, извлечённые грамматикой
// ----------------------------------------------------------------------------

struct Fields {
    std::string data_type;
    std::string detector;  // короткий код как в строке, либо "all"
    bool trigger = false;
    std::string uid;
    std::string meta;  // с ведущим '_', либо пусто
    int version = 0;
    std::string extension;
};

/// Разобрать базовое имя (без каталога) по грамматике.
/// Совпадение полное (якоря с двух сторон), регистр не учитывается.
std::optional<Fields> match(std::string_view basename);

/// Собрать базовое имя из полей. Обратна match() для его результатов.
std::string serialize(const Fields& fields);

/// Версия ровно двумя цифрами: 3 -> "03"
std::string version_string(int version);

// ----------------------------------------------------------------------------
// Filename
// ----------------------------------------------------------------------------

class FilenameBuilder;

/// Запись имени файла. Создаётся через FilenameBuilder или from_path(),
/// после создания не изменяется.
class Filename {
public:
    /// Разобрать путь: каталог отделяется, базовое имя проверяется грамматикой.
    /// nullopt если имя не каноническое.
    static std::optional<Filename> from_path(std::string_view path);

    /// Создать запись из пар (имя поля, значение).
    /// Неизвестное имя поля -> UnknownField.
    struct BuildResult;
    static BuildResult create(const std::map<std::string, std::string>& fields);

    static FilenameBuilder builder();

    // Поля
    const std::string& data_type() const { return data_type_; }
    /// nullopt означает "all"
    const std::optional<detector::Detector>& detector() const { return detector_; }
    bool trigger() const { return trigger_; }
    const std::string& uid() const { return uid_; }
    const std::string& meta() const { return meta_; }
    int version() const { return version_; }
    const std::string& extension() const { return extension_; }
    const std::string& directory() const { return directory_; }

    /// Короткий код детектора или "all"
    std::string detector_name() const;

    /// "00".."99"
    std::string version_str() const;

    /// Каноническое базовое имя
    std::string basename() const;

    /// directory / basename (или basename, если каталог пуст)
    std::string full_path() const;

    /// Поля в форме грамматики
    Fields fields() const;

    /// По одной копии на каждый детектор (канонический порядок),
    /// копии отличаются только детектором.
    std::vector<Filename> detector_list() const;

    /// Копия с другим детектором / каталогом
    Filename with_detector(std::optional<detector::Detector> det) const;
    Filename with_directory(std::string directory) const;

    bool operator==(const Filename& other) const;
    bool operator!=(const Filename& other) const { return !(*this == other); }

private:
    friend class FilenameBuilder;

    Filename() = default;

    std::string data_type_;
    std::optional<detector::Detector> detector_;
    bool trigger_ = false;
    std::string uid_;
    std::string meta_;
    int version_ = 0;
    std::string extension_ = DEFAULT_EXTENSION;
    std::string directory_;
};

struct Filename::BuildResult {
    bool ok = false;
    std::optional<Filename> filename;
    Error error;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// FilenameBuilder
// ----------------------------------------------------------------------------

/// Builder для Filename
///
/// Использование:
/// @code
///   auto result = Filename::builder()
///       .data_type("cspec")
///       .detector("n0")
///       .trigger(true)
///       .uid("090131090")
///       .extension("pha")
///       .build();
///   if (result) {
///       std::string name = result.filename->basename();
///   }
/// @endcode
///
/// Ошибки накапливаются до build(); сообщается первая.
class FilenameBuilder {
public:
    FilenameBuilder() = default;

    FilenameBuilder& data_type(std::string value);

    /// Детектор: нормализованное значение, короткий код/полное имя/"all",
    /// или индекс
    FilenameBuilder& detector(detector::Detector det);
    FilenameBuilder& detector(std::string_view name);
    FilenameBuilder& detector(int index);
    FilenameBuilder& all_detectors();

    FilenameBuilder& trigger(bool value);
    FilenameBuilder& uid(std::string value);
    FilenameBuilder& meta(std::string value);
    FilenameBuilder& version(int value);
    FilenameBuilder& extension(std::string value);
    FilenameBuilder& directory(std::string value);

    /// Присвоить поле по имени. Допустимые имена: data_type, detector,
    /// trigger, uid, meta, version, extension, directory.
    FilenameBuilder& set(std::string_view field, std::string_view value);

    /// Начать с полей существующей записи
    FilenameBuilder& from(const Filename& other);

    Filename::BuildResult build() const;

private:
    void fail(ErrorKind kind, std::string message, std::string context);

    Filename record_;
    std::optional<Error> error_;
};

// ----------------------------------------------------------------------------
// Пакетный разбор
// ----------------------------------------------------------------------------

enum class UnknownPolicy {
    Collect,  // нераспознанные пути -> в побочный список
    FailFast  // первый нераспознанный путь -> NameError(NoGrammarMatch)
};

/// Разобрать список путей.
/// При Collect нераспознанные пути дописываются в *unknown (если задан).
/// @throws NameError при FailFast и нераспознанном пути
std::vector<Filename> list_from_paths(const std::vector<std::string>& paths,
                                      UnknownPolicy policy,
                                      std::vector<std::string>* unknown = nullptr);

}  // namespace glgname::name

#endif  // GLGNAME_FILENAME_HPP
