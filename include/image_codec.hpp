#pragma once
// codec schnittstelle, das eigentliche pixel zeug machen stb + fpng

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace imgmin {

enum class ImageFormat {
    JPEG,
    PNG
};

const char* to_string(ImageFormat format) noexcept;

// format aus der extension, nullopt wenn nicht unterstützt
std::optional<ImageFormat> format_from_path(const std::filesystem::path& path);

// welche extensions gehen (lowercase, mit punkt)
const std::vector<std::string>& supported_extensions();
bool is_supported(const std::filesystem::path& path);

struct EncodeResult {
    std::vector<uint8_t> bytes;
    std::string error;  // leer = ok

    bool ok() const { return error.empty(); }

    static EncodeResult failure(std::string message) {
        EncodeResult r;
        r.error = std::move(message);
        return r;
    }
};

// encode(bytes, format, quality) -> bytes | error
// Implementations must be callable from several worker threads at once.
class ImageCodec {
public:
    virtual ~ImageCodec() = default;

    virtual EncodeResult encode(
        const uint8_t* data,
        size_t size,
        ImageFormat format,
        int quality
    ) = 0;
};

// stb_image zum laden, stb_image_write für jpeg, fpng für png
class StbCodec : public ImageCodec {
public:
    StbCodec();

    EncodeResult encode(
        const uint8_t* data,
        size_t size,
        ImageFormat format,
        int quality
    ) override;

private:
    EncodeResult encode_jpeg(const uint8_t* data, size_t size, int quality);
    EncodeResult encode_png(const uint8_t* data, size_t size);
};

} // namespace imgmin
