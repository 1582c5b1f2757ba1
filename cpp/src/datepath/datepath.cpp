// ==============================================================================
// datepath.cpp - Каталоги, разбитые по датам
// ==============================================================================

#include "glgname/datepath.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <regex>
#include <type_traits>
#include <utility>

namespace glgname::datepath {

namespace {

// "_" + необязательный "bn" + YYMMDD + необязательный суффикс + "_"
const std::regex& date_pattern() {
    static const std::regex pattern(R"(^.*_(?:bn)?(\d{6})(?:\d{3}|_\d\dz)?_.*$)",
                                    std::regex::ECMAScript | std::regex::icase);
    return pattern;
}

bool is_leap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap(year)) {
        return 29;
    }
    return DAYS[month - 1];
}

std::optional<int> parse_digits(std::string_view text) {
    int value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

[[noreturn]] void unparseable(std::string message, std::string context) {
    throw NameError(Error{ErrorKind::UnparseableDateSource, std::move(message), std::move(context)});
}

}  // namespace

// ----------------------------------------------------------------------------
// Date
// ----------------------------------------------------------------------------

bool Date::valid() const {
    if (year < 1 || year > 9999 || month < 1 || month > 12) {
        return false;
    }
    return day >= 1 && day <= days_in_month(year, month);
}

std::string Date::to_string() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

std::optional<Date> Date::from_yymmdd(std::string_view yymmdd) {
    if (yymmdd.size() != 6) {
        return std::nullopt;
    }
    auto yy = parse_digits(yymmdd.substr(0, 2));
    auto mm = parse_digits(yymmdd.substr(2, 2));
    auto dd = parse_digits(yymmdd.substr(4, 2));
    if (!yy || !mm || !dd) {
        return std::nullopt;
    }

    // Правило %y из POSIX strptime
    Date d;
    d.year = (*yy >= 69) ? 1900 + *yy : 2000 + *yy;
    d.month = *mm;
    d.day = *dd;
    if (!d.valid()) {
        return std::nullopt;
    }
    return d;
}

std::optional<Date> Date::parse(std::string_view iso) {
    if (iso.size() != 10 || iso[4] != '-' || iso[7] != '-') {
        return std::nullopt;
    }
    auto yyyy = parse_digits(iso.substr(0, 4));
    auto mm = parse_digits(iso.substr(5, 2));
    auto dd = parse_digits(iso.substr(8, 2));
    if (!yyyy || !mm || !dd) {
        return std::nullopt;
    }

    Date d{*yyyy, *mm, *dd};
    if (!d.valid()) {
        return std::nullopt;
    }
    return d;
}

Date Date::from_time_point(std::chrono::system_clock::time_point tp) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    if (gmtime_s(&tm, &tt) != 0) {
        unparseable("time point out of range", std::to_string(static_cast<long long>(tt)));
    }
#else
    if (gmtime_r(&tt, &tm) == nullptr) {  // UTC
        unparseable("time point out of range", std::to_string(static_cast<long long>(tt)));
    }
#endif
    Date d{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
    if (!d.valid()) {
        unparseable("invalid calendar date", d.to_string());
    }
    return d;
}

bool Date::operator==(const Date& other) const {
    return year == other.year && month == other.month && day == other.day;
}

std::optional<std::string> extract_yymmdd(std::string_view name) {
    std::match_results<std::string_view::const_iterator> m;
    if (!std::regex_match(name.begin(), name.end(), m, date_pattern())) {
        return std::nullopt;
    }
    return m[1].str();
}

// ----------------------------------------------------------------------------
// ymd_path
// ----------------------------------------------------------------------------

std::string ymd_path(const std::string& base, const DateSource& value) {
    Date date = std::visit(
        [](const auto& v) -> Date {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Date>) {
                if (!v.valid()) {
                    unparseable("invalid calendar date", v.to_string());
                }
                return v;
            } else if constexpr (std::is_same_v<T, std::chrono::system_clock::time_point>) {
                return Date::from_time_point(v);
            } else {
                std::string text;
                if constexpr (std::is_same_v<T, name::Filename>) {
                    text = v.basename();
                } else {
                    text = v;
                }
                auto yymmdd = extract_yymmdd(text);
                if (!yymmdd) {
                    unparseable("can't parse a YYMMDD value", text);
                }
                auto d = Date::from_yymmdd(*yymmdd);
                if (!d) {
                    unparseable("not a calendar date", *yymmdd);
                }
                return *d;
            }
        },
        value);

    return (std::filesystem::path(base) / date.to_string()).string();
}

}  // namespace glgname::datepath
