#pragma once
// verzeichnis durchsuchen, bilder finden, _min dateien rauslassen

#include <filesystem>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace imgmin {

// a.jpg + "_min" -> a_min.jpg (gleiches verzeichnis)
std::filesystem::path compressed_path_for(
    const std::filesystem::path& source,
    const std::string& marker
);

// true wenn der name schon "<marker>." enthält, z.b. "a_min.jpg"
bool has_marker(const std::filesystem::path& path, const std::string& marker);

// a_min.jpg -> a.jpg, nullopt wenn der stem nicht auf marker endet
std::optional<std::filesystem::path> original_path_for(
    const std::filesystem::path& compressed,
    const std::string& marker
);

class Scanner {
public:
    enum class Mode {
        Sources,    // bilder ohne marker -> compress
        Compressed  // bilder mit marker -> replace
    };

    // Throws Error(DirectoryNotFound) if directory is missing or not a directory.
    Scanner(std::filesystem::path directory, std::string marker,
            bool recursive = true, Mode mode = Mode::Sources);

    // Lazy walk over matching files. Every begin() starts a fresh walk.
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::filesystem::path;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::filesystem::path*;
        using reference = const std::filesystem::path&;

        iterator() = default;

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }
        iterator& operator++();
        iterator operator++(int);

        bool operator==(const iterator& other) const { return it_ == other.it_; }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        friend class Scanner;
        explicit iterator(const Scanner* owner);
        void advance_to_match(bool step_first);

        const Scanner* owner_ = nullptr;
        std::filesystem::recursive_directory_iterator it_;
        std::filesystem::path current_;
    };

    iterator begin() const;
    iterator end() const { return iterator(); }

    // alles einsammeln, nach pfad sortiert
    std::vector<std::filesystem::path> collect() const;

    bool matches(const std::filesystem::directory_entry& entry) const;

private:
    std::filesystem::path directory_;
    std::string marker_;
    bool recursive_;
    Mode mode_;
};

} // namespace imgmin
