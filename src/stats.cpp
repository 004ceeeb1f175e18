#include "stats.hpp"

namespace imgmin {

BatchStats summarize(const std::vector<CompressionResult>& results) {
    BatchStats stats;
    stats.file_count = results.size();

    for (const auto& r : results) {
        if (!r.success) {
            stats.failed++;
            continue;
        }
        stats.succeeded++;
        if (r.discarded) {
            stats.discarded++;
            continue;
        }
        stats.total_original += r.original_size;
        stats.total_compressed += r.compressed_size;
    }

    if (stats.total_original > 0) {
        stats.average_ratio = 1.0 - static_cast<double>(stats.total_compressed) / stats.total_original;
    }
    return stats;
}

} // namespace imgmin
