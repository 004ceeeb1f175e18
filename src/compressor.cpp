#include "compressor.hpp"
#include "scanner.hpp"
#include "thread_pool.hpp"
#include "mmap_file.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <future>
#include <iterator>
#include <stdexcept>
#include <thread>
#include <spdlog/spdlog.h>

namespace imgmin {

namespace fs = std::filesystem;

namespace {

// quell bytes: mmap wenns geht, sonst normal einlesen
class SourceBytes {
public:
    bool load(const fs::path& path) {
        if (mapped_.open(path.string())) {
            return true;
        }
        error_ = mapped_.error();
        if (error_ == "file is empty") {
            return false;
        }

        // mmap ging nich (pipe, komisches fs, ...), fread fallback
        std::ifstream in(path, std::ios::binary);
        if (!in) return false;
        buffer_.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        if (in.bad() || buffer_.empty()) return false;
        error_.clear();
        return true;
    }

    const uint8_t* data() const {
        return mapped_.is_open() ? mapped_.data()
                                 : reinterpret_cast<const uint8_t*>(buffer_.data());
    }
    size_t size() const { return mapped_.is_open() ? mapped_.size() : buffer_.size(); }
    const std::string& error() const { return error_; }

private:
    mmapfile::MappedFile mapped_;
    std::vector<char> buffer_;
    std::string error_;
};

// ATOMIC WRITE: erst .tmp schreiben, dann rename, kein halbes output file
bool write_atomically(const fs::path& target, const std::vector<uint8_t>& bytes, std::string& error) {
    fs::path temp_path = target;
    temp_path += ".tmp";

    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            error = "Cannot create " + temp_path.filename().string();
            return false;
        }
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        out.close();
        if (!out) {
            std::error_code rm_ec;
            fs::remove(temp_path, rm_ec);
            error = "Failed to write " + temp_path.filename().string();
            return false;
        }
    }

    std::error_code ec;
    fs::rename(temp_path, target, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(temp_path, rm_ec);
        error = "Failed to finalize output: " + ec.message();
        return false;
    }
    return true;
}

} // namespace

void validate_quality(int quality) {
    if (quality < MIN_QUALITY || quality > MAX_QUALITY) {
        throw Error(ErrorKind::InvalidQuality,
                    "Quality must be between " + std::to_string(MIN_QUALITY) + " and " +
                    std::to_string(MAX_QUALITY) + ", got " + std::to_string(quality));
    }
}

size_t resolve_concurrency(size_t requested) {
    if (requested > 0) return requested;
    // einen kern fürs system übrig lassen
    size_t cores = std::thread::hardware_concurrency();
    if (cores == 0) cores = 4;
    return std::max<size_t>(cores - 1, 1);
}

BatchCompressor::BatchCompressor(ImageCodec& codec, CompressOptions options)
    : codec_(codec), options_(std::move(options)) {
    validate_quality(options_.quality);
    if (options_.marker.empty()) {
        throw std::invalid_argument("marker suffix must not be empty");
    }
}

CompressionResult BatchCompressor::compress_file(const fs::path& source) {
    CompressionResult result;
    result.input_path = source;
    result.output_path = compressed_path_for(source, options_.marker);

    auto start = std::chrono::steady_clock::now();
    auto finish = [&](CompressionResult& r) -> CompressionResult& {
        auto end = std::chrono::steady_clock::now();
        r.processing_time_ms = std::chrono::duration<double, std::milli>(end - start).count();
        if (!r.success) {
            spdlog::error("Failed {}: {} ({})", source.string(), r.error_message, to_string(r.error));
        }
        return r;
    };
    auto fail = [&](ErrorKind kind, std::string message) -> CompressionResult& {
        result.success = false;
        result.error = kind;
        result.error_message = std::move(message);
        // kein altes _min file liegen lassen, replace würde sonst veralteten inhalt einspielen
        std::error_code ec;
        if (fs::remove(result.output_path, ec); ec) {
            spdlog::warn("Cannot remove stale output {}: {}", result.output_path.string(), ec.message());
        }
        return finish(result);
    };

    try {
        auto format = format_from_path(source);
        if (!format) {
            return fail(ErrorKind::UnreadableFile, "Unsupported file extension");
        }

        SourceBytes input;
        if (!input.load(source)) {
            return fail(ErrorKind::UnreadableFile, "Cannot read input file: " + input.error());
        }
        result.original_size = input.size();

        EncodeResult encoded = codec_.encode(input.data(), input.size(), *format, options_.quality);
        if (!encoded.ok()) {
            return fail(ErrorKind::CodecError, encoded.error);
        }

        std::string write_error;
        if (!write_atomically(result.output_path, encoded.bytes, write_error)) {
            return fail(ErrorKind::WriteError, write_error);
        }
        result.compressed_size = encoded.bytes.size();
        result.success = true;

        if (options_.drop_larger && result.compressed_size >= result.original_size) {
            std::error_code ec;
            fs::remove(result.output_path, ec);
            if (ec) {
                return fail(ErrorKind::WriteError, "Cannot remove larger output: " + ec.message());
            }
            result.discarded = true;
            spdlog::info("Skipping {} - compressed file is not smaller", source.filename().string());
        } else {
            spdlog::debug("Compressed {} {} -> {} ({} -> {} bytes, {:.2f}%)", to_string(*format),
                          source.filename().string(), result.output_path.filename().string(),
                          result.original_size, result.compressed_size,
                          result.compression_ratio() * 100.0);
        }
    } catch (const std::bad_alloc&) {
        return fail(ErrorKind::CodecError, "Out of memory");
    } catch (const std::exception& e) {
        return fail(ErrorKind::WriteError, e.what());
    }

    return finish(result);
}

std::vector<CompressionResult> BatchCompressor::run(const fs::path& directory) {
    Scanner scanner(directory, options_.marker, options_.recursive, Scanner::Mode::Sources);
    auto files = scanner.collect();

    std::vector<CompressionResult> results;
    if (files.empty()) {
        spdlog::info("No images to compress in {}", directory.string());
        return results;
    }

    size_t num_threads = std::min(resolve_concurrency(options_.concurrency), files.size());
    spdlog::info("Compressing {} image(s) with {} thread(s), quality {}",
                 files.size(), num_threads, options_.quality);

    // jeder task gibt sein result übers future zurück, kein shared state
    std::vector<std::future<CompressionResult>> futures;
    futures.reserve(files.size());
    {
        ThreadPool pool(num_threads);
        for (const auto& file : files) {
            futures.push_back(pool.submit([this, file]() {
                return compress_file(file);
            }));
        }

        results.reserve(files.size());
        for (auto& f : futures) {
            results.push_back(f.get());
        }
    }

    // reihenfolge ist beliebig fertig geworden, für den report sortieren
    std::sort(results.begin(), results.end(),
              [](const CompressionResult& a, const CompressionResult& b) {
                  return a.input_path < b.input_path;
              });
    return results;
}

} // namespace imgmin
