// ==============================================================================
// error.cpp - Ошибки библиотеки имён файлов
// ==============================================================================

#include "glgname/error.hpp"

#include <utility>

namespace glgname {

const char* kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "no error";
    case ErrorKind::InvalidDetector:
        return "invalid detector";
    case ErrorKind::NoGrammarMatch:
        return "unrecognized file name";
    case ErrorKind::UnparseableDateSource:
        return "unparseable date source";
    case ErrorKind::UnknownField:
        return "unknown field";
    case ErrorKind::MissingField:
        return "missing field";
    case ErrorKind::InvalidValue:
        return "invalid value";
    case ErrorKind::InvalidVersion:
        return "invalid version";
    case ErrorKind::Io:
        return "i/o error";
    case ErrorKind::Config:
        return "config error";
    }
    return "unknown error";
}

std::string Error::format() const {
    std::string result = kind_name(kind);
    if (!message.empty()) {
        result += ": ";
        result += message;
    }
    if (!context.empty()) {
        result += " - ";
        result += context;
    }
    return result;
}

NameError::NameError(Error error) : std::runtime_error(error.format()), error_(std::move(error)) {}

}  // namespace glgname
