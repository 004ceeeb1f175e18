#include "scanner.hpp"
#include "errors.hpp"
#include "image_codec.hpp"
#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <spdlog/spdlog.h>

namespace imgmin {

namespace fs = std::filesystem;

fs::path compressed_path_for(const fs::path& source, const std::string& marker) {
    fs::path name = source.stem();
    name += marker;
    name += source.extension();
    return source.parent_path() / name;
}

bool has_marker(const fs::path& path, const std::string& marker) {
    return path.filename().string().find(marker + ".") != std::string::npos;
}

std::optional<fs::path> original_path_for(const fs::path& compressed, const std::string& marker) {
    std::string stem = compressed.stem().string();
    if (marker.empty() || stem.size() <= marker.size()) return std::nullopt;
    if (stem.compare(stem.size() - marker.size(), marker.size(), marker) != 0) {
        return std::nullopt;
    }
    fs::path name = stem.substr(0, stem.size() - marker.size());
    name += compressed.extension();
    return compressed.parent_path() / name;
}

Scanner::Scanner(fs::path directory, std::string marker, bool recursive, Mode mode)
    : directory_(std::move(directory)),
      marker_(std::move(marker)),
      recursive_(recursive),
      mode_(mode) {
    if (marker_.empty()) {
        throw std::invalid_argument("marker suffix must not be empty");
    }
    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) {
        throw Error(ErrorKind::DirectoryNotFound,
                    "'" + directory_.string() + "' is not a valid directory");
    }
}

bool Scanner::matches(const fs::directory_entry& entry) const {
    std::error_code ec;
    // SYMLINK: nich folgen, sonst endlosschleifen bei links auf parent dirs
    if (entry.is_symlink(ec) || !entry.is_regular_file(ec)) return false;

    const auto& path = entry.path();
    if (!is_supported(path)) return false;

    if (mode_ == Mode::Sources) {
        return !has_marker(path, marker_);
    }
    return original_path_for(path, marker_).has_value();
}

Scanner::iterator Scanner::begin() const {
    return iterator(this);
}

std::vector<fs::path> Scanner::collect() const {
    std::vector<fs::path> files(begin(), end());
    std::sort(files.begin(), files.end());
    return files;
}

Scanner::iterator::iterator(const Scanner* owner) : owner_(owner) {
    std::error_code ec;
    it_ = fs::recursive_directory_iterator(
        owner_->directory_, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("Cannot scan {}: {}", owner_->directory_.string(), ec.message());
        it_ = fs::recursive_directory_iterator();
        return;
    }
    advance_to_match(false);
}

void Scanner::iterator::advance_to_match(bool step_first) {
    const fs::recursive_directory_iterator end;
    bool step = step_first;

    while (it_ != end) {
        if (step) {
            if (!owner_->recursive_) {
                it_.disable_recursion_pending();
            }
            std::error_code ec;
            it_.increment(ec);
            if (ec) {
                // permission fehler mitten im walk, rest vom baum geht verloren
                spdlog::warn("Error scanning {}: {}", owner_->directory_.string(), ec.message());
                it_ = end;
                break;
            }
            if (it_ == end) break;
        }
        step = true;

        if (owner_->matches(*it_)) {
            current_ = it_->path();
            return;
        }
    }
    current_.clear();
}

Scanner::iterator& Scanner::iterator::operator++() {
    advance_to_match(true);
    return *this;
}

Scanner::iterator Scanner::iterator::operator++(int) {
    iterator copy = *this;
    ++(*this);
    return copy;
}

} // namespace imgmin
