#include "cli.hpp"
#include "stats.hpp"
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace imgmin {

constexpr const char* IMGMIN_VERSION = "1.0.0";

namespace {

// ganze zahl, kein müll hinten dran ("50abc" zählt nich)
bool parse_int(const std::string& text, long long& out) {
    try {
        size_t pos = 0;
        out = std::stoll(text, &pos);
        return pos == text.size();
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool parse_quality(const std::string& text, int& quality) {
    long long value = 0;
    if (!parse_int(text, value)) {
        std::cerr << "Error: Invalid quality value '" << text << "'\n";
        return false;
    }
    // zu groß für int -> 0, run() meldet dann InvalidQuality
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        value = 0;
    }
    quality = static_cast<int>(value);
    return true;
}

} // namespace

void CLI::print_version() {
    std::cout << "imgmin " << IMGMIN_VERSION << "\n";
    std::cout << "Batch JPEG/PNG recompressor\n";
}

void CLI::print_help() {
    std::cout << R"(
imgmin v)" << IMGMIN_VERSION << R"(

  Recompress every JPEG/PNG in a folder into <name>_min.<ext> copies,
  then optionally swap the originals for the compressed versions.

USAGE
  imgmin compress [<directory>] [quality] [options]
  imgmin replace  [<directory>] [options]

EXAMPLES
  imgmin compress photos/             Quality 50 (default)
  imgmin compress photos/ 70          Quality 70
  imgmin compress photos/ -j 4        Four worker threads
  imgmin replace photos/              Replace originals with *_min files

OPTIONS
  -q, --quality <1-100>  Compression quality (default: 50)
  -j, --jobs <n>         Worker threads (default: cores - 1)
  -s, --suffix <text>    Marker for compressed files (default: _min)
  --no-recursive         Only the given directory, no subfolders
  --drop-larger          Delete outputs that are not smaller than the source
  -v, --verbose          Log every file
  -h, --help             Show this help message
  --version              Show version number

EXIT CODES
  0  all files done   1  some files failed / fatal error   2  all files failed

)";
}

std::optional<CLIConfig> CLI::parse(int argc, const char* const argv[]) {
    if (argc < 2) {
        print_help();
        return std::nullopt;
    }

    CLIConfig config;
    std::vector<std::string> positional;
    bool have_command = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_help();
            std::exit(0);
        }
        else if (arg == "--version") {
            print_version();
            std::exit(0);
        }
        else if (arg == "-q" || arg == "--quality") {
            if (++i >= argc) {
                std::cerr << "Error: " << arg << " requires a number (1-100)\n";
                return std::nullopt;
            }
            if (!parse_quality(argv[i], config.quality)) return std::nullopt;
        }
        else if (arg == "-j" || arg == "--jobs") {
            long long jobs = 0;
            if (++i >= argc || !parse_int(argv[i], jobs) || jobs < 0) {
                std::cerr << "Error: " << arg << " requires a non-negative thread count\n";
                return std::nullopt;
            }
            config.jobs = static_cast<size_t>(jobs);
        }
        else if (arg == "-s" || arg == "--suffix") {
            if (++i >= argc || std::string(argv[i]).empty()) {
                std::cerr << "Error: " << arg << " requires a non-empty suffix\n";
                return std::nullopt;
            }
            config.marker = argv[i];
        }
        else if (arg == "--no-recursive") {
            config.recursive = false;
        }
        else if (arg == "--drop-larger") {
            config.drop_larger = true;
        }
        else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        }
        else if (!have_command && (arg == "compress" || arg == "replace")) {
            config.command = (arg == "compress") ? Command::Compress : Command::Replace;
            have_command = true;
        }
        else if (arg[0] != '-' || arg.size() == 1 || std::isdigit(static_cast<unsigned char>(arg[1]))) {
            // "-5" is a (bad) quality, not an option
            positional.push_back(arg);
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Use 'imgmin --help' for usage information.\n";
            return std::nullopt;
        }
    }

    if (!have_command) {
        std::cerr << "Error: expected a command, 'compress' or 'replace'\n";
        std::cerr << "Use 'imgmin --help' for usage information.\n";
        return std::nullopt;
    }

    size_t max_positional = (config.command == Command::Compress) ? 2 : 1;
    if (positional.size() > max_positional) {
        std::cerr << "Error: too many arguments\n";
        return std::nullopt;
    }
    if (!positional.empty()) {
        config.directory = positional[0];
    }
    if (positional.size() == 2 && !parse_quality(positional[1], config.quality)) {
        return std::nullopt;
    }

    return config;
}

std::string CLI::format_size(size_t bytes) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);
    if (bytes >= 1024 * 1024)
        out << static_cast<double>(bytes) / (1024 * 1024) << " MB";
    else if (bytes >= 1024)
        out << static_cast<double>(bytes) / 1024 << " KB";
    else
        out << bytes << " B";
    return out.str();
}

void CLI::print_report(std::ostream& out, const std::vector<CompressionResult>& results,
                       double total_time_ms) {
    if (results.empty()) {
        out << "No images found to compress.\n";
        return;
    }

    for (const auto& r : results) {
        out << r.input_path.string();
        if (!r.success) {
            out << "  FAILED: " << r.error_message << "\n";
            continue;
        }
        out << " -> " << r.output_path.filename().string() << "  "
            << format_size(r.original_size) << " -> " << format_size(r.compressed_size);

        double ratio = r.compression_ratio() * 100;
        out << std::fixed << std::setprecision(2);
        if (ratio >= 0) {
            out << " (" << ratio << "% smaller";
        } else {
            out << " (" << -ratio << "% larger";
        }
        out << ", " << std::setprecision(0) << r.processing_time_ms << " ms)";
        if (r.discarded) {
            out << " [discarded]";
        }
        out << "\n";
    }

    BatchStats stats = summarize(results);
    out << "\n";
    out << "Done! " << stats.succeeded << " of " << stats.file_count << " images compressed";
    if (stats.failed > 0) out << ", " << stats.failed << " failed";
    if (stats.discarded > 0) out << ", " << stats.discarded << " discarded (not smaller)";
    out << "\n";
    out << "  " << format_size(stats.total_original) << " -> " << format_size(stats.total_compressed)
        << std::fixed << std::setprecision(2)
        << " (average ratio " << stats.average_ratio * 100 << "%)\n";
    out << "  took " << std::setprecision(0) << total_time_ms << " ms\n";
}

void CLI::print_replace_report(std::ostream& out, const std::vector<ReplaceOutcome>& outcomes) {
    size_t replaced = 0;
    size_t failed = 0;
    for (const auto& o : outcomes) {
        if (o.replaced) {
            out << "Replaced: " << o.original_path.string() << "\n";
            replaced++;
        } else if (!o.skipped) {
            out << "FAILED: " << o.original_path.string() << " - " << o.error_message << "\n";
            failed++;
        }
    }

    if (replaced == 0 && failed == 0) {
        out << "No files to replace.\n";
        return;
    }
    out << "\nReplaced " << replaced << " file(s)";
    if (failed > 0) out << ", " << failed << " failed";
    out << "\n";
}

int CLI::run(const CLIConfig& config) {
    if (config.command == Command::Compress) {
        // quality vor dem codec checken, der soll gar nich erst angefasst werden
        validate_quality(config.quality);
        StbCodec codec;
        return run_compress(config, codec);
    }
    return run_replace(config);
}

int CLI::run(const CLIConfig& config, ImageCodec& codec) {
    if (config.command == Command::Compress) {
        return run_compress(config, codec);
    }
    return run_replace(config);
}

int CLI::run_compress(const CLIConfig& config, ImageCodec& codec) {
    CompressOptions options;
    options.quality = config.quality;
    options.marker = config.marker;
    options.concurrency = config.jobs;
    options.recursive = config.recursive;
    options.drop_larger = config.drop_larger;

    BatchCompressor compressor(codec, options);

    auto start_time = std::chrono::steady_clock::now();
    auto results = compressor.run(config.directory);
    auto end_time = std::chrono::steady_clock::now();
    double total_time = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    print_report(std::cout, results, total_time);

    size_t total_failures = 0;
    for (const auto& r : results) {
        if (!r.success) total_failures++;
    }
    if (total_failures > 0 && total_failures == results.size()) return 2;  // All failed
    if (total_failures > 0) return 1;                                      // Partial failure
    return 0;
}

int CLI::run_replace(const CLIConfig& config) {
    ReplaceOptions options;
    options.marker = config.marker;
    options.recursive = config.recursive;

    Replacer replacer(options);
    std::vector<ReplaceOutcome> outcomes;
    try {
        outcomes = replacer.run(config.directory);
    } catch (const Error& e) {
        // was schon ersetzt ist trotzdem anzeigen, dann weiter nach main
        if (e.kind() == ErrorKind::RestoreError) {
            print_replace_report(std::cout, replacer.outcomes());
        }
        throw;
    }

    print_replace_report(std::cout, outcomes);

    size_t failed = 0;
    size_t attempted = 0;
    for (const auto& o : outcomes) {
        if (o.skipped) continue;
        attempted++;
        if (!o.replaced) failed++;
    }
    if (failed > 0 && failed == attempted) return 2;
    if (failed > 0) return 1;
    return 0;
}

} // namespace imgmin
