// ==============================================================================
// collection.cpp - Операции над наборами имён файлов
// ==============================================================================

#include "glgname/collection.hpp"

#include <algorithm>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <system_error>

namespace glgname::collection {

namespace {

bool path_exists(const std::filesystem::path& path) {
    std::error_code ec;
    bool exists = std::filesystem::exists(path, ec);
    if (ec) {
        throw std::runtime_error("failed to check path existence - " + path.string() + ": " +
                                 ec.message());
    }
    return exists;
}

std::optional<int> fold_versions(const std::vector<name::Filename>& files,
                                 const std::function<bool(int, int)>& better) {
    std::optional<int> result;
    for (const auto& f : files) {
        if (!result || better(f.version(), *result)) {
            result = f.version();
        }
    }
    return result;
}

/// Версии путей, из которых она извлекается; остальные пропускаются
std::vector<name::Filename> parse_versioned(const std::vector<std::string>& paths) {
    return name::list_from_paths(paths, name::UnknownPolicy::Collect);
}

}  // namespace

bool all_exist(const std::vector<name::Filename>& files,
               const std::optional<std::string>& parent_dir) {
    for (const auto& f : files) {
        std::filesystem::path path = parent_dir ? std::filesystem::path(*parent_dir) / f.basename()
                                                : std::filesystem::path(f.full_path());
        if (!path_exists(path)) {
            return false;
        }
    }
    return true;
}

bool has_detector(const std::vector<name::Filename>& files,
                  const std::optional<detector::Detector>& det) {
    return std::any_of(files.begin(), files.end(),
                       [&det](const name::Filename& f) { return f.detector() == det; });
}

bool is_complete(const std::vector<name::Filename>& files) {
    for (auto det : detector::all_detectors()) {
        if (!has_detector(files, det)) {
            return false;
        }
    }
    return true;
}

std::vector<detector::Detector> missing_detectors(const std::vector<name::Filename>& files) {
    std::vector<detector::Detector> result;
    for (auto det : detector::all_detectors()) {
        if (!has_detector(files, det)) {
            result.push_back(det);
        }
    }
    return result;
}

std::optional<int> max_version(const std::vector<name::Filename>& files) {
    return fold_versions(files, std::greater<int>());
}

std::optional<int> min_version(const std::vector<name::Filename>& files) {
    return fold_versions(files, std::less<int>());
}

std::optional<int> max_version(const std::vector<std::string>& paths) {
    return max_version(parse_versioned(paths));
}

std::optional<int> min_version(const std::vector<std::string>& paths) {
    return min_version(parse_versioned(paths));
}

}  // namespace glgname::collection
