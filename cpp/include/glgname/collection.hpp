// ==============================================================================
// glgname/collection.hpp - Операции над наборами имён файлов
// ==============================================================================
//
// Назначение:
// - Проверка существования всех файлов набора
// - Наличие детектора и полнота набора (по файлу на каждый детектор)
// - Минимальная/максимальная версия
//
// ==============================================================================

#ifndef GLGNAME_COLLECTION_HPP
#define GLGNAME_COLLECTION_HPP

#include <glgname/detector.hpp>
#include <glgname/filename.hpp>

#include <optional>
#include <string>
#include <vector>

namespace glgname::collection {

/// true если файл каждой записи существует. Путь: parent_dir / basename,
/// если parent_dir задан, иначе full_path() записи. Останавливается на
/// первом отсутствующем файле.
/// @throws std::runtime_error при ошибке файловой системы
bool all_exist(const std::vector<name::Filename>& files,
               const std::optional<std::string>& parent_dir = std::nullopt);

/// true если хотя бы одна запись относится к детектору
/// (nullopt - запись "all")
bool has_detector(const std::vector<name::Filename>& files,
                  const std::optional<detector::Detector>& det);

/// true если для каждого детектора набора есть запись
bool is_complete(const std::vector<name::Filename>& files);

/// Детекторы, для которых записи нет (канонический порядок)
std::vector<detector::Detector> missing_detectors(const std::vector<name::Filename>& files);

// ----------------------------------------------------------------------------
// Версии
// ----------------------------------------------------------------------------

std::optional<int> max_version(const std::vector<name::Filename>& files);
std::optional<int> min_version(const std::vector<name::Filename>& files);

/// Варианты для путей: пути, из которых версия не извлекается, пропускаются
std::optional<int> max_version(const std::vector<std::string>& paths);
std::optional<int> min_version(const std::vector<std::string>& paths);

}  // namespace glgname::collection

#endif  // GLGNAME_COLLECTION_HPP
