#pragma once
// batch compress: scannen, parallel durch den codec jagen, results sammeln

#include "errors.hpp"
#include "image_codec.hpp"
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace imgmin {

constexpr int MIN_QUALITY = 1;
constexpr int MAX_QUALITY = 100;
constexpr int DEFAULT_QUALITY = 50;
constexpr const char* DEFAULT_MARKER = "_min";

struct CompressOptions {
    int quality = DEFAULT_QUALITY;
    std::string marker = DEFAULT_MARKER;
    size_t concurrency = 0;     // 0 = cores - 1
    bool recursive = true;
    bool drop_larger = false;   // output löschen wenn nicht kleiner
};

struct CompressionResult {
    std::filesystem::path input_path;
    std::filesystem::path output_path;
    size_t original_size = 0;
    size_t compressed_size = 0;
    bool success = false;
    bool discarded = false;     // drop_larger hat zugeschlagen
    ErrorKind error = ErrorKind::None;
    std::string error_message;
    double processing_time_ms = 0;

    // negativ wenns größer geworden ist, wird nicht geclampt
    double compression_ratio() const {
        if (original_size == 0) return 0;
        return 1.0 - (static_cast<double>(compressed_size) / original_size);
    }
};

// Throws Error(InvalidQuality) outside [MIN_QUALITY, MAX_QUALITY].
void validate_quality(int quality);

// 0 -> hardware threads minus one, never below 1
size_t resolve_concurrency(size_t requested);

class BatchCompressor {
public:
    // Validates options up front, nothing on disk is touched before that.
    BatchCompressor(ImageCodec& codec, CompressOptions options);

    // Compress every candidate below directory. Per-file failures end up in
    // the results; only a missing directory throws. Sorted by input path.
    std::vector<CompressionResult> run(const std::filesystem::path& directory);

    // einzelne datei, wirft nie
    CompressionResult compress_file(const std::filesystem::path& source);

private:
    ImageCodec& codec_;
    CompressOptions options_;
};

} // namespace imgmin
