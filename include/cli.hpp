#pragma once
// cli parsing und so

#include "compressor.hpp"
#include "image_codec.hpp"
#include "replacer.hpp"
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace imgmin {

enum class Command {
    Compress,
    Replace
};

struct CLIConfig {
    Command command = Command::Compress;
    std::filesystem::path directory = ".";
    int quality = DEFAULT_QUALITY;     // wird erst in run() geprüft
    std::string marker = DEFAULT_MARKER;
    size_t jobs = 0;                   // 0 = automatisch
    bool recursive = true;
    bool drop_larger = false;
    bool verbose = false;
};

class CLI {
public:
    static std::optional<CLIConfig> parse(int argc, const char* const argv[]);
    static void print_help();
    static void print_version();

    // Exit code: 0 ok, 1 partial failure, 2 everything failed.
    // Fatal errors (imgmin::Error) propagate to the caller.
    static int run(const CLIConfig& config);
    static int run(const CLIConfig& config, ImageCodec& codec);

    static void print_report(std::ostream& out, const std::vector<CompressionResult>& results,
                             double total_time_ms);
    static void print_replace_report(std::ostream& out, const std::vector<ReplaceOutcome>& outcomes);

    static std::string format_size(size_t bytes);

private:
    static int run_compress(const CLIConfig& config, ImageCodec& codec);
    static int run_replace(const CLIConfig& config);
};

} // namespace imgmin
