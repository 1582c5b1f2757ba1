// ==============================================================================
// glgname/scanner.hpp - Ленивый обход каталога
// ==============================================================================
//
// Назначение:
// - Последовательность путей к файлам под корневым каталогом
// - Фильтры: скрытые записи, рекурсия, абсолютные пути, regex по имени
// - Ленивость: следующий путь вычисляется при инкременте итератора
// - Перезапускаемость: каждый begin() начинает новый обход
//
// Порядок - как отдаёт файловая система, без сортировки.
//
// ==============================================================================

#ifndef GLGNAME_SCANNER_HPP
#define GLGNAME_SCANNER_HPP

#include <cstddef>
#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace glgname::io {

// ----------------------------------------------------------------------------
// ScanOptions
// ----------------------------------------------------------------------------

struct ScanOptions {
    /// Включать записи, имя которых начинается с '.'
    bool hidden = false;

    /// Спускаться в подкаталоги
    bool recursive = false;

    /// Отдавать абсолютные пути
    bool absolute = false;

    /// Регулярное выражение, с начала имени файла (не каталога).
    /// nullopt - все файлы.
    std::optional<std::string> match;
};

// ----------------------------------------------------------------------------
// DirectoryScanner
// ----------------------------------------------------------------------------

/// Диапазон путей для range-for
///
/// @code
///   for (const auto& path : scan_dir("/data/daily", opt)) {
///       ...
///   }
/// @endcode
///
/// Ошибки файловой системы бросаются как std::runtime_error в момент,
/// когда итератор до них доходит.
class DirectoryScanner {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = const std::string&;

        iterator() = default;

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }

        iterator& operator++();
        void operator++(int) { ++*this; }

        bool operator==(const iterator& other) const;
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        friend class DirectoryScanner;

        struct State;

        iterator(const DirectoryScanner& owner);

        void advance();

        std::shared_ptr<State> state_;
        std::string current_;
    };

    DirectoryScanner(std::filesystem::path root, ScanOptions options);

    /// Новый обход с начала
    iterator begin() const;
    iterator end() const { return iterator(); }

    const std::filesystem::path& root() const { return root_; }
    const ScanOptions& options() const { return options_; }

    /// Обойти целиком
    std::vector<std::string> collect() const;

private:
    std::filesystem::path root_;
    ScanOptions options_;
    std::optional<std::regex> pattern_;
};

/// @throws std::runtime_error если match не компилируется
DirectoryScanner scan_dir(const std::filesystem::path& root, const ScanOptions& options = {});

}  // namespace glgname::io

#endif  // GLGNAME_SCANNER_HPP
