#include "image_codec.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <memory>
#include <mutex>

// stb braucht die flags sonst isses lahm
#define STBI_SSE2

// nur jpeg + png laden, rest fliegt raus
#define STBI_ONLY_JPEG
#define STBI_ONLY_PNG

#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image.h"
#include "stb_image_write.h"

// fpng für png output
#include "fpng.h"

namespace imgmin {

namespace {

// fpng muss einmal init werden sonst crashed das
std::once_flag fpng_init_flag;

constexpr int MAX_DIMENSION = 65535;
constexpr uint64_t MAX_PIXELS = 100000000;  // 100 megapixel

struct StbiDeleter {
    void operator()(stbi_uc* p) const { stbi_image_free(p); }
};
using StbiPixels = std::unique_ptr<stbi_uc, StbiDeleter>;

// stbi_failure_reason() is thread_local in stb_image >= 2.26
std::string decode_error() {
    const char* reason = stbi_failure_reason();
    return std::string("Failed to decode image: ") + (reason ? reason : "unknown error");
}

bool dimensions_ok(int width, int height) {
    return width > 0 && height > 0 &&
           width <= MAX_DIMENSION && height <= MAX_DIMENSION &&
           static_cast<uint64_t>(width) * static_cast<uint64_t>(height) <= MAX_PIXELS;
}

void append_to_vector(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<uint8_t>*>(context);
    auto* bytes = static_cast<const uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

} // namespace

const char* to_string(ImageFormat format) noexcept {
    switch (format) {
        case ImageFormat::JPEG: return "JPEG";
        case ImageFormat::PNG:  return "PNG";
    }
    return "unknown";
}

const std::vector<std::string>& supported_extensions() {
    static const std::vector<std::string> exts = {".jpg", ".jpeg", ".png"};
    return exts;
}

std::optional<ImageFormat> format_from_path(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".jpg" || ext == ".jpeg") return ImageFormat::JPEG;
    if (ext == ".png") return ImageFormat::PNG;
    return std::nullopt;
}

bool is_supported(const std::filesystem::path& path) {
    return format_from_path(path).has_value();
}

StbCodec::StbCodec() {
    std::call_once(fpng_init_flag, []() {
        fpng::fpng_init();
    });
}

EncodeResult StbCodec::encode(
    const uint8_t* data,
    size_t size,
    ImageFormat format,
    int quality
) {
    if (!data || size == 0) {
        return EncodeResult::failure("Empty input buffer");
    }
    if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return EncodeResult::failure("Input too large for decoder");
    }

    switch (format) {
        case ImageFormat::JPEG:
            return encode_jpeg(data, size, quality);
        case ImageFormat::PNG:
            return encode_png(data, size);
    }
    return EncodeResult::failure("Unsupported format");
}

EncodeResult StbCodec::encode_jpeg(const uint8_t* data, size_t size, int quality) {
    int width = 0, height = 0, channels = 0;
    if (!stbi_info_from_memory(data, static_cast<int>(size), &width, &height, &channels)) {
        return EncodeResult::failure(decode_error());
    }
    if (!dimensions_ok(width, height)) {
        return EncodeResult::failure("Image dimensions out of range: " +
            std::to_string(width) + "x" + std::to_string(height));
    }

    // grau bleibt grau, alles andere wird rgb (jpeg kann kein alpha)
    int wanted = (channels == 1) ? 1 : 3;

    StbiPixels pixels(stbi_load_from_memory(
        data, static_cast<int>(size), &width, &height, &channels, wanted));
    if (!pixels) {
        return EncodeResult::failure(decode_error());
    }

    EncodeResult result;
    // grob raten damit nich dauernd realloc
    result.bytes.reserve(size);

    int ok = stbi_write_jpg_to_func(
        append_to_vector, &result.bytes,
        width, height, wanted,
        pixels.get(),
        std::clamp(quality, 1, 100)
    );
    if (!ok || result.bytes.empty()) {
        return EncodeResult::failure("JPEG encoder failed");
    }
    return result;
}

// png ist lossless, quality wird hier ignoriert
EncodeResult StbCodec::encode_png(const uint8_t* data, size_t size) {
    int width = 0, height = 0, channels = 0;
    if (!stbi_info_from_memory(data, static_cast<int>(size), &width, &height, &channels)) {
        return EncodeResult::failure(decode_error());
    }
    if (!dimensions_ok(width, height)) {
        return EncodeResult::failure("Image dimensions out of range: " +
            std::to_string(width) + "x" + std::to_string(height));
    }

    // fpng geht nur mit rgb/rgba, alpha behalten wenn da
    bool has_alpha = (channels == 2 || channels == 4);
    int wanted = has_alpha ? 4 : 3;

    StbiPixels pixels(stbi_load_from_memory(
        data, static_cast<int>(size), &width, &height, &channels, wanted));
    if (!pixels) {
        return EncodeResult::failure(decode_error());
    }

    EncodeResult result;
    bool ok = fpng::fpng_encode_image_to_memory(
        pixels.get(),
        static_cast<uint32_t>(width), static_cast<uint32_t>(height),
        static_cast<uint32_t>(wanted),
        result.bytes,
        fpng::FPNG_ENCODE_SLOWER
    );
    if (!ok || result.bytes.empty()) {
        return EncodeResult::failure("PNG encoder failed");
    }
    return result;
}

} // namespace imgmin
