#include "replacer.hpp"
#include "scanner.hpp"
#include <stdexcept>
#include <system_error>
#include <spdlog/spdlog.h>

namespace imgmin {

namespace fs = std::filesystem;

Replacer::Replacer(ReplaceOptions options) : options_(std::move(options)) {
    if (options_.marker.empty()) {
        throw std::invalid_argument("marker suffix must not be empty");
    }
}

fs::path Replacer::backup_path_for(const fs::path& original) {
    fs::path backup = original;
    backup += ".backup";
    return backup;
}

void Replacer::create_backup(const fs::path& original, const fs::path& backup) {
    // copy statt rename: original bleibt liegen bis der swap durch ist
    fs::copy_file(original, backup, fs::copy_options::none);
}

void Replacer::swap_in(const fs::path& compressed, const fs::path& original) {
    fs::path temp_path = original;
    temp_path += ".tmp";

    fs::copy_file(compressed, temp_path, fs::copy_options::overwrite_existing);
    std::error_code ec;
    fs::rename(temp_path, original, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(temp_path, rm_ec);
        throw fs::filesystem_error("cannot move compressed file into place", temp_path, original, ec);
    }
}

void Replacer::verify(const fs::path& original, std::uintmax_t expected_size) {
    auto actual = fs::file_size(original);
    if (actual != expected_size) {
        throw std::runtime_error("size mismatch after replace: expected " +
                                 std::to_string(expected_size) + " bytes, found " +
                                 std::to_string(actual));
    }
}

void Replacer::restore(const fs::path& backup, const fs::path& original) {
    fs::rename(backup, original);
}

ReplaceOutcome Replacer::replace_one(const fs::path& compressed, const fs::path& original) {
    ReplaceOutcome outcome;
    outcome.original_path = original;
    outcome.compressed_path = compressed;
    outcome.backup_path = backup_path_for(original);

    auto fail = [&](ErrorKind kind, std::string message) {
        outcome.error = kind;
        outcome.error_message = std::move(message);
        spdlog::error("Failed to replace {}: {}", original.filename().string(), outcome.error_message);
        return outcome;
    };

    std::error_code ec;
    if (!fs::exists(original, ec)) {
        outcome.skipped = true;
        spdlog::debug("No original for {}, skipping", compressed.filename().string());
        return outcome;
    }

    auto expected_size = fs::file_size(compressed, ec);
    if (ec) {
        return fail(ErrorKind::UnreadableFile, "Cannot read compressed file: " + ec.message());
    }

    // altes backup von nem abgebrochenen lauf nich überschreiben
    bool backup_exists = fs::exists(outcome.backup_path, ec);
    if (ec) {
        return fail(ErrorKind::BackupError,
                    "Cannot check backup " + outcome.backup_path.filename().string() + ": " + ec.message());
    }
    if (backup_exists) {
        return fail(ErrorKind::BackupError,
                    "Backup " + outcome.backup_path.filename().string() + " already exists");
    }

    try {
        create_backup(original, outcome.backup_path);
    } catch (const std::exception& e) {
        std::error_code rm_ec;
        fs::remove(outcome.backup_path, rm_ec);
        return fail(ErrorKind::BackupError, std::string("Cannot create backup: ") + e.what());
    }

    try {
        swap_in(compressed, original);
        verify(original, expected_size);
    } catch (const std::exception& e) {
        spdlog::warn("Replacing {} failed ({}), restoring from backup",
                     original.filename().string(), e.what());
        try {
            restore(outcome.backup_path, original);
        } catch (const std::exception& restore_error) {
            throw Error(ErrorKind::RestoreError,
                        "Could not restore " + original.string() + " after failed replace (" +
                        e.what() + "): " + restore_error.what() +
                        ". Original content is kept in " + outcome.backup_path.string());
        }
        return fail(ErrorKind::WriteError, e.what());
    }

    outcome.replaced = true;

    fs::remove(outcome.backup_path, ec);
    if (ec) {
        spdlog::warn("Replaced {} but could not delete backup {}: {}",
                     original.filename().string(), outcome.backup_path.string(), ec.message());
    }
    fs::remove(compressed, ec);
    if (ec) {
        spdlog::warn("Replaced {} but could not delete {}: {}",
                     original.filename().string(), compressed.filename().string(), ec.message());
    }

    spdlog::info("Replaced: {}", original.filename().string());
    return outcome;
}

std::vector<ReplaceOutcome> Replacer::run(const fs::path& directory) {
    Scanner scanner(directory, options_.marker, options_.recursive, Scanner::Mode::Compressed);

    // erst alles einsammeln, wir ändern gleich das verzeichnis
    auto compressed_files = scanner.collect();

    // outcomes_ wächst mit, damit nach nem RestoreError klar ist was schon ersetzt wurde
    outcomes_.clear();
    outcomes_.reserve(compressed_files.size());
    for (const auto& compressed : compressed_files) {
        auto original = original_path_for(compressed, options_.marker);
        if (!original) continue;
        outcomes_.push_back(replace_one(compressed, *original));
    }
    return outcomes_;
}

} // namespace imgmin
