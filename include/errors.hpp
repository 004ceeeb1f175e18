#pragma once
// fehler arten, fatale werden geworfen, per-file landen im result

#include <stdexcept>
#include <string>

namespace imgmin {

enum class ErrorKind {
    None,
    DirectoryNotFound,
    InvalidQuality,
    UnreadableFile,
    CodecError,
    WriteError,
    BackupError,
    RestoreError
};

const char* to_string(ErrorKind kind) noexcept;

// Fatal for the whole invocation: DirectoryNotFound, InvalidQuality, RestoreError
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace imgmin
