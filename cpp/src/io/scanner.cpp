// ==============================================================================
// scanner.cpp - Ленивый обход каталога
// ==============================================================================
//
// Обход в глубину на явном стеке directory_iterator: вложенный каталог
// открывается в момент, когда до него дошёл итератор, и обходится до
// продолжения родительского.
//
// ==============================================================================

#include "glgname/scanner.hpp"

#include <stdexcept>
#include <system_error>
#include <utility>

namespace glgname::io {

namespace {

bool is_hidden(const std::filesystem::path& p) {
    std::string name = p.filename().string();
    return !name.empty() && name.front() == '.';
}

std::filesystem::directory_iterator open_directory(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        throw std::runtime_error("failed to read directory - " + dir.string() + ": " +
                                 ec.message());
    }
    return it;
}

}  // namespace

// ----------------------------------------------------------------------------
// iterator
// ----------------------------------------------------------------------------

struct DirectoryScanner::iterator::State {
    ScanOptions options;
    std::optional<std::regex> pattern;

    // Текущий путь спуска; вершина - обходимый каталог
    std::vector<std::filesystem::directory_iterator> stack;
};

DirectoryScanner::iterator::iterator(const DirectoryScanner& owner)
    : state_(std::make_shared<State>()) {
    state_->options = owner.options_;
    state_->pattern = owner.pattern_;
    state_->stack.push_back(open_directory(owner.root_));
    advance();
}

DirectoryScanner::iterator& DirectoryScanner::iterator::operator++() {
    advance();
    return *this;
}

bool DirectoryScanner::iterator::operator==(const iterator& other) const {
    return state_ == other.state_;
}

void DirectoryScanner::iterator::advance() {
    if (!state_) {
        return;
    }

    const ScanOptions& opt = state_->options;
    auto& stack = state_->stack;

    while (!stack.empty()) {
        auto& it = stack.back();
        if (it == std::filesystem::directory_iterator()) {
            stack.pop_back();
            continue;
        }

        std::filesystem::directory_entry entry = *it;
        std::error_code ec;
        it.increment(ec);
        if (ec) {
            throw std::runtime_error("failed to read directory entry - " + ec.message());
        }

        const std::filesystem::path& path = entry.path();
        if (!opt.hidden && is_hidden(path)) {
            continue;
        }

        std::error_code type_ec;
        if (entry.is_regular_file(type_ec)) {
            std::string name = path.filename().string();
            if (state_->pattern &&
                !std::regex_search(name, *state_->pattern,
                                   std::regex_constants::match_continuous)) {
                continue;
            }
            current_ = opt.absolute ? std::filesystem::absolute(path).string() : path.string();
            return;
        }
        if (opt.recursive && entry.is_directory(type_ec)) {
            // ссылка it может стать недействительной после push_back
            stack.push_back(open_directory(path));
        }
    }

    // Обход завершён: итератор становится end()
    state_.reset();
    current_.clear();
}

// ----------------------------------------------------------------------------
// DirectoryScanner
// ----------------------------------------------------------------------------

DirectoryScanner::DirectoryScanner(std::filesystem::path root, ScanOptions options)
    : root_(std::move(root)), options_(std::move(options)) {
    if (options_.match) {
        try {
            pattern_.emplace(*options_.match, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            throw std::runtime_error("invalid match pattern '" + *options_.match +
                                     "': " + e.what());
        }
    }
}

DirectoryScanner::iterator DirectoryScanner::begin() const {
    return iterator(*this);
}

std::vector<std::string> DirectoryScanner::collect() const {
    std::vector<std::string> result;
    for (const auto& path : *this) {
        result.push_back(path);
    }
    return result;
}

DirectoryScanner scan_dir(const std::filesystem::path& root, const ScanOptions& options) {
    return DirectoryScanner(root, options);
}

}  // namespace glgname::io
