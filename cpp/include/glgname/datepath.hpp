// ==============================================================================
// glgname/datepath.hpp - Каталоги, разбитые по датам
// ==============================================================================
//
// Назначение:
// - Date: календарная дата год/месяц/день
// - ymd_path(): base / "YYYY-MM-DD" по имени файла, записи или дате
//
// Из имени берётся 6-значный YYMMDD (с необязательным "bn" и суффиксом),
// год дополняется по правилу %y: 69..99 -> 19xx, 00..68 -> 20xx.
//
// ==============================================================================

#ifndef GLGNAME_DATEPATH_HPP
#define GLGNAME_DATEPATH_HPP

#include <glgname/filename.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace glgname::datepath {

// ----------------------------------------------------------------------------
// Date
// ----------------------------------------------------------------------------

struct Date {
    int year = 1970;
    int month = 1;  // 1-12
    int day = 1;    // 1-31

    bool valid() const;

    /// "YYYY-MM-DD"
    std::string to_string() const;

    /// "YYMMDD" -> Date
    static std::optional<Date> from_yymmdd(std::string_view yymmdd);

    /// "YYYY-MM-DD" -> Date
    static std::optional<Date> parse(std::string_view iso);

    /// Дата момента времени в UTC
    static Date from_time_point(std::chrono::system_clock::time_point tp);

    bool operator==(const Date& other) const;
};

/// YYMMDD из имени файла; nullopt если шаблон не совпал
std::optional<std::string> extract_yymmdd(std::string_view name);

// ----------------------------------------------------------------------------
// ymd_path
// ----------------------------------------------------------------------------

using DateSource =
    std::variant<std::string, name::Filename, Date, std::chrono::system_clock::time_point>;

/// base / "YYYY-MM-DD"
/// @throws NameError(UnparseableDateSource) если дату получить нельзя
std::string ymd_path(const std::string& base, const DateSource& value);

}  // namespace glgname::datepath

#endif  // GLGNAME_DATEPATH_HPP
