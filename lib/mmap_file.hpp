// mmap_file.hpp - read-only memory mapped input files
// quell bytes direkt aus dem page cache an den codec geben, kein extra buffer
// windows und linux version weil die apis komplett anders sind
#pragma once

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>
#else
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#endif

namespace mmapfile {

class MappedFile {
public:
    MappedFile() = default;
    explicit MappedFile(const std::string& path) { open(path); }
    ~MappedFile() { close(); }

    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    // false on failure, error() says why. Empty files count as failure
    // because they cannot be mapped.
    bool open(const std::string& path) {
        close();
#ifdef _WIN32
        file_ = CreateFileA(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr,
                            OPEN_EXISTING, FILE_FLAG_SEQUENTIAL_SCAN, nullptr);
        if (file_ == INVALID_HANDLE_VALUE) return fail("cannot open file");

        LARGE_INTEGER file_size;
        if (!GetFileSizeEx(file_, &file_size)) return fail("cannot stat file");
        size_ = static_cast<size_t>(file_size.QuadPart);
        if (size_ == 0) return fail("file is empty");

        mapping_ = CreateFileMappingA(file_, nullptr, PAGE_READONLY, 0, 0, nullptr);
        if (!mapping_) return fail("cannot create file mapping");

        data_ = MapViewOfFile(mapping_, FILE_MAP_READ, 0, 0, 0);
        if (!data_) return fail("cannot map file");
#else
        fd_ = ::open(path.c_str(), O_RDONLY);
        if (fd_ < 0) return fail(std::strerror(errno));

        struct stat st;
        if (fstat(fd_, &st) < 0) return fail(std::strerror(errno));
        if (!S_ISREG(st.st_mode)) return fail("not a regular file");
        size_ = static_cast<size_t>(st.st_size);
        if (size_ == 0) return fail("file is empty");

        void* p = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
        if (p == MAP_FAILED) return fail(std::strerror(errno));
        data_ = p;

        // wird eh einmal komplett durchgelesen
        madvise(data_, size_, MADV_SEQUENTIAL);
#endif
        error_.clear();
        return true;
    }

    void close() {
#ifdef _WIN32
        if (data_) UnmapViewOfFile(data_);
        if (mapping_) CloseHandle(mapping_);
        if (file_ != INVALID_HANDLE_VALUE) CloseHandle(file_);
        mapping_ = nullptr;
        file_ = INVALID_HANDLE_VALUE;
#else
        if (data_) munmap(data_, size_);
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
#endif
        data_ = nullptr;
        size_ = 0;
    }

    const uint8_t* data() const { return static_cast<const uint8_t*>(data_); }
    size_t size() const { return size_; }
    bool is_open() const { return data_ != nullptr; }
    const std::string& error() const { return error_; }

private:
    bool fail(const char* why) {
        std::string msg = why;
        close();
        error_ = std::move(msg);
        return false;
    }

    void* data_ = nullptr;
    size_t size_ = 0;
    std::string error_;

#ifdef _WIN32
    HANDLE file_ = INVALID_HANDLE_VALUE;
    HANDLE mapping_ = nullptr;
#else
    int fd_ = -1;
#endif
};

} // namespace mmapfile
