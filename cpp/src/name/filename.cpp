// ==============================================================================
// filename.cpp - Каноническое имя файла данных GBM
// ==============================================================================
//
// Грамматика (регистр не учитывается, якоря с двух сторон):
//   ^glg_(.+)_([bn][0-9ab]|all)_(bn)?(\d{9}|\d{6}_\d\dz|\d{6})(_.+?)?_v(\d\d)\.(.+)$
//
// Группы: 1 data_type, 2 detector, 3 trigger, 4 uid, 5 meta, 6 version,
// 7 extension. data_type жадный: граница определяется токеном детектора.
//
// ==============================================================================

#include "glgname/filename.hpp"

#include <cctype>
#include <cstdio>
#include <filesystem>
#include <regex>
#include <utility>

namespace glgname::name {

namespace {

// ----------------------------------------------------------------------------
// Грамматика
// ----------------------------------------------------------------------------

enum Group : size_t {
    GROUP_DATA_TYPE = 1,
    GROUP_DETECTOR,
    GROUP_TRIGGER,
    GROUP_UID,
    GROUP_META,
    GROUP_VERSION,
    GROUP_EXTENSION
};

const std::regex& grammar() {
    static const std::regex pattern(
        R"(^glg_(.+)_([bn][0-9ab]|all)_(bn)?(\d{9}|\d{6}_\d\dz|\d{6})(_.+?)?_v(\d\d)\.(.+)$)",
        std::regex::ECMAScript | std::regex::icase);
    return pattern;
}

std::string to_lower(std::string_view s) {
    std::string result(s);
    for (auto& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

/// Целое без знака и мусора; nullopt при ошибке
std::optional<int> parse_int(std::string_view text) {
    if (text.empty() || text.size() > 9) {
        return std::nullopt;
    }
    int value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

std::optional<bool> parse_bool(std::string_view text) {
    std::string lower = to_lower(text);
    if (lower == "true" || lower == "1" || lower == "yes") {
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no") {
        return false;
    }
    return std::nullopt;
}

}  // namespace

// ----------------------------------------------------------------------------
// match / serialize
// ----------------------------------------------------------------------------

std::optional<Fields> match(std::string_view basename) {
    std::match_results<std::string_view::const_iterator> m;
    if (!std::regex_match(basename.begin(), basename.end(), m, grammar())) {
        return std::nullopt;
    }

    Fields fields;
    fields.data_type = m[GROUP_DATA_TYPE].str();
    fields.detector = to_lower(m[GROUP_DETECTOR].str());
    fields.trigger = m[GROUP_TRIGGER].matched;
    fields.uid = m[GROUP_UID].str();
    fields.meta = m[GROUP_META].matched ? m[GROUP_META].str() : std::string();
    fields.version = *parse_int(m[GROUP_VERSION].str());
    fields.extension = m[GROUP_EXTENSION].str();
    return fields;
}

std::string serialize(const Fields& fields) {
    std::string result = PREFIX;
    result += fields.data_type;
    result += '_';
    result += fields.detector;
    result += '_';
    if (fields.trigger) {
        result += TRIGGER_MARKER;
    }
    result += fields.uid;
    result += fields.meta;
    result += "_v";
    result += version_string(fields.version);
    result += '.';
    result += fields.extension;
    return result;
}

std::string version_string(int version) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d", version);
    return buf;
}

// ----------------------------------------------------------------------------
// Filename
// ----------------------------------------------------------------------------

std::optional<Filename> Filename::from_path(std::string_view path) {
    std::filesystem::path p{std::string(path)};
    auto fields = match(p.filename().string());
    if (!fields) {
        return std::nullopt;
    }

    Filename result;
    result.data_type_ = std::move(fields->data_type);
    // Грамматика допускает только известные коды или "all"
    if (fields->detector != ALL_DETECTORS) {
        result.detector_ = detector::from_name(fields->detector);
    }
    result.trigger_ = fields->trigger;
    result.uid_ = std::move(fields->uid);
    result.meta_ = std::move(fields->meta);
    result.version_ = fields->version;
    result.extension_ = std::move(fields->extension);
    result.directory_ = p.parent_path().string();
    return result;
}

Filename::BuildResult Filename::create(const std::map<std::string, std::string>& fields) {
    FilenameBuilder b;
    for (const auto& [field, value] : fields) {
        b.set(field, value);
    }
    return b.build();
}

FilenameBuilder Filename::builder() {
    return FilenameBuilder();
}

std::string Filename::detector_name() const {
    return detector_ ? detector::short_name(*detector_) : ALL_DETECTORS;
}

std::string Filename::version_str() const {
    return version_string(version_);
}

std::string Filename::basename() const {
    return serialize(fields());
}

std::string Filename::full_path() const {
    if (directory_.empty()) {
        return basename();
    }
    return (std::filesystem::path(directory_) / basename()).string();
}

Fields Filename::fields() const {
    Fields f;
    f.data_type = data_type_;
    f.detector = detector_name();
    f.trigger = trigger_;
    f.uid = uid_;
    f.meta = meta_;
    f.version = version_;
    f.extension = extension_;
    return f;
}

std::vector<Filename> Filename::detector_list() const {
    std::vector<Filename> result;
    result.reserve(detector::DETECTOR_COUNT);
    for (auto det : detector::all_detectors()) {
        result.push_back(with_detector(det));
    }
    return result;
}

Filename Filename::with_detector(std::optional<detector::Detector> det) const {
    Filename copy = *this;
    copy.detector_ = det;
    return copy;
}

Filename Filename::with_directory(std::string directory) const {
    Filename copy = *this;
    copy.directory_ = std::move(directory);
    return copy;
}

bool Filename::operator==(const Filename& other) const {
    return data_type_ == other.data_type_ && detector_ == other.detector_ &&
           trigger_ == other.trigger_ && uid_ == other.uid_ && meta_ == other.meta_ &&
           version_ == other.version_ && extension_ == other.extension_ &&
           directory_ == other.directory_;
}

// ----------------------------------------------------------------------------
// FilenameBuilder
// ----------------------------------------------------------------------------

void FilenameBuilder::fail(ErrorKind kind, std::string message, std::string context) {
    // Сохраняется первая ошибка
    if (!error_) {
        error_ = Error{kind, std::move(message), std::move(context)};
    }
}

FilenameBuilder& FilenameBuilder::data_type(std::string value) {
    record_.data_type_ = std::move(value);
    return *this;
}

FilenameBuilder& FilenameBuilder::detector(detector::Detector det) {
    record_.detector_ = det;
    return *this;
}

FilenameBuilder& FilenameBuilder::detector(std::string_view name) {
    if (to_lower(name) == ALL_DETECTORS) {
        record_.detector_.reset();
        return *this;
    }
    auto det = detector::from_name(name);
    if (!det) {
        fail(ErrorKind::InvalidDetector, "no such detector", std::string(name));
        return *this;
    }
    record_.detector_ = det;
    return *this;
}

FilenameBuilder& FilenameBuilder::detector(int index) {
    auto det = detector::from_index(index);
    if (!det) {
        fail(ErrorKind::InvalidDetector, "detector index out of range", std::to_string(index));
        return *this;
    }
    record_.detector_ = det;
    return *this;
}

FilenameBuilder& FilenameBuilder::all_detectors() {
    record_.detector_.reset();
    return *this;
}

FilenameBuilder& FilenameBuilder::trigger(bool value) {
    record_.trigger_ = value;
    return *this;
}

FilenameBuilder& FilenameBuilder::uid(std::string value) {
    record_.uid_ = std::move(value);
    return *this;
}

FilenameBuilder& FilenameBuilder::meta(std::string value) {
    // meta хранится с ведущим разделителем
    if (!value.empty() && value.front() != '_') {
        value.insert(value.begin(), '_');
    }
    record_.meta_ = std::move(value);
    return *this;
}

FilenameBuilder& FilenameBuilder::version(int value) {
    record_.version_ = value;
    return *this;
}

FilenameBuilder& FilenameBuilder::extension(std::string value) {
    record_.extension_ = std::move(value);
    return *this;
}

FilenameBuilder& FilenameBuilder::directory(std::string value) {
    record_.directory_ = std::move(value);
    return *this;
}

FilenameBuilder& FilenameBuilder::set(std::string_view field, std::string_view value) {
    if (field == "data_type") {
        return data_type(std::string(value));
    }
    if (field == "detector") {
        // Строка из цифр - индекс детектора
        if (auto idx = parse_int(value)) {
            return detector(*idx);
        }
        return detector(value);
    }
    if (field == "trigger") {
        auto flag = parse_bool(value);
        if (!flag) {
            fail(ErrorKind::InvalidValue, "trigger must be true or false", std::string(value));
            return *this;
        }
        return trigger(*flag);
    }
    if (field == "uid") {
        return uid(std::string(value));
    }
    if (field == "meta") {
        return meta(std::string(value));
    }
    if (field == "version") {
        auto v = parse_int(value);
        if (!v) {
            fail(ErrorKind::InvalidValue, "version must be an integer", std::string(value));
            return *this;
        }
        return version(*v);
    }
    if (field == "extension") {
        return extension(std::string(value));
    }
    if (field == "directory") {
        return directory(std::string(value));
    }
    fail(ErrorKind::UnknownField, "not a filename field", std::string(field));
    return *this;
}

FilenameBuilder& FilenameBuilder::from(const Filename& other) {
    record_ = other;
    return *this;
}

Filename::BuildResult FilenameBuilder::build() const {
    Filename::BuildResult result;

    if (error_) {
        result.error = *error_;
        return result;
    }
    if (record_.data_type_.empty()) {
        result.error = Error{ErrorKind::MissingField, "data_type is required", "data_type"};
        return result;
    }
    if (record_.uid_.empty()) {
        result.error = Error{ErrorKind::MissingField, "uid is required", "uid"};
        return result;
    }
    if (record_.extension_.empty()) {
        result.error = Error{ErrorKind::MissingField, "extension is required", "extension"};
        return result;
    }
    if (record_.version_ < 0 || record_.version_ > MAX_VERSION) {
        result.error = Error{ErrorKind::InvalidVersion, "version must be in [0, 99]",
                             std::to_string(record_.version_)};
        return result;
    }
    // meta должна читаться обратно той же: "_" или "_05z" после 6-значного uid
    // грамматика разбирает иначе
    if (!record_.meta_.empty()) {
        auto reparsed = match(serialize(record_.fields()));
        if (!reparsed || reparsed->meta != record_.meta_) {
            result.error = Error{ErrorKind::InvalidValue,
                                 "meta does not survive a parse of the built name",
                                 record_.meta_};
            return result;
        }
    }

    result.ok = true;
    result.filename = record_;
    return result;
}

// ----------------------------------------------------------------------------
// Пакетный разбор
// ----------------------------------------------------------------------------

std::vector<Filename> list_from_paths(const std::vector<std::string>& paths,
                                      UnknownPolicy policy, std::vector<std::string>* unknown) {
    std::vector<Filename> result;
    result.reserve(paths.size());

    for (const auto& path : paths) {
        auto parsed = Filename::from_path(path);
        if (parsed) {
            result.push_back(std::move(*parsed));
            continue;
        }
        if (policy == UnknownPolicy::FailFast) {
            throw NameError(Error{ErrorKind::NoGrammarMatch, "not a canonical data file name", path});
        }
        if (unknown != nullptr) {
            unknown->push_back(path);
        }
    }

    return result;
}

}  // namespace glgname::name
