#include "errors.hpp"

namespace imgmin {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None:              return "None";
        case ErrorKind::DirectoryNotFound: return "DirectoryNotFound";
        case ErrorKind::InvalidQuality:    return "InvalidQuality";
        case ErrorKind::UnreadableFile:    return "UnreadableFile";
        case ErrorKind::CodecError:        return "CodecError";
        case ErrorKind::WriteError:        return "WriteError";
        case ErrorKind::BackupError:       return "BackupError";
        case ErrorKind::RestoreError:      return "RestoreError";
    }
    return "Unknown";
}

} // namespace imgmin
