// ==============================================================================
// glgname/error.hpp - Ошибки библиотеки имён файлов
// ==============================================================================
//
// Назначение:
// - Единый тип ошибки (вид + сообщение + контекст)
// - Исключение NameError для путей, где ошибка не возвращается значением
//   (fail-fast пакетный разбор, вычисление каталога по дате)
//
// ==============================================================================

#ifndef GLGNAME_ERROR_HPP
#define GLGNAME_ERROR_HPP

#include <stdexcept>
#include <string>

namespace glgname {

// ----------------------------------------------------------------------------
// Виды ошибок
// ----------------------------------------------------------------------------

enum class ErrorKind {
    None,
    InvalidDetector,        // код/имя/индекс детектора не распознан
    NoGrammarMatch,         // строка не соответствует каноническому имени
    UnparseableDateSource,  // из значения нельзя получить дату
    UnknownField,           // имя поля не входит в схему записи
    MissingField,           // обязательное поле не задано
    InvalidValue,           // значение поля не разбирается
    InvalidVersion,         // версия вне [0, 99]
    Io,                     // ошибка файловой системы
    Config                  // ошибка конфигурации
};

/// Имя вида ошибки для сообщений ("invalid detector", ...)
const char* kind_name(ErrorKind kind);

// ----------------------------------------------------------------------------
// Error
// ----------------------------------------------------------------------------

struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;
    std::string context;  // строка/путь/поле, вызвавшее ошибку

    /// "<kind>: <message> - <context>"
    std::string format() const;
};

// ----------------------------------------------------------------------------
// NameError
// ----------------------------------------------------------------------------

class NameError : public std::runtime_error {
public:
    explicit NameError(Error error);

    const Error& error() const noexcept { return error_; }
    ErrorKind kind() const noexcept { return error_.kind; }

private:
    Error error_;
};

}  // namespace glgname

#endif  // GLGNAME_ERROR_HPP
