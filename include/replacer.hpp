#pragma once
// originale durch die _min versionen ersetzen, mit backup

#include "compressor.hpp"
#include "errors.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace imgmin {

struct ReplaceOptions {
    std::string marker = DEFAULT_MARKER;
    bool recursive = true;
};

struct ReplaceOutcome {
    std::filesystem::path original_path;
    std::filesystem::path compressed_path;
    std::filesystem::path backup_path;  // existiert nur während dem swap
    bool replaced = false;
    bool skipped = false;               // kein original zum ersetzen da
    ErrorKind error = ErrorKind::None;
    std::string error_message;
};

// Sequential backup -> swap -> verify -> cleanup per file.
//
// At every point at least one of original, backup or compressed content is
// on disk. A failed swap or verify restores the original from the backup and
// the run goes on with the next file. If the restore itself fails, run()
// throws Error(RestoreError) and leaves the backup where it is.
//
// The step methods are virtual so a test can make any of them fail.
class Replacer {
public:
    explicit Replacer(ReplaceOptions options = {});
    virtual ~Replacer() = default;

    // Throws Error(DirectoryNotFound) or Error(RestoreError).
    std::vector<ReplaceOutcome> run(const std::filesystem::path& directory);

    // Outcomes of the last run() so far. After a RestoreError this holds
    // every file handled before the one that could not be restored.
    const std::vector<ReplaceOutcome>& outcomes() const { return outcomes_; }

    ReplaceOutcome replace_one(const std::filesystem::path& compressed,
                               const std::filesystem::path& original);

    static std::filesystem::path backup_path_for(const std::filesystem::path& original);

protected:
    virtual void create_backup(const std::filesystem::path& original,
                               const std::filesystem::path& backup);
    virtual void swap_in(const std::filesystem::path& compressed,
                         const std::filesystem::path& original);
    virtual void verify(const std::filesystem::path& original, std::uintmax_t expected_size);
    virtual void restore(const std::filesystem::path& backup,
                         const std::filesystem::path& original);

private:
    ReplaceOptions options_;
    std::vector<ReplaceOutcome> outcomes_;
};

} // namespace imgmin
