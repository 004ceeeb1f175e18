#pragma once

#include "compressor.hpp"
#include <cstddef>
#include <vector>

namespace imgmin {

struct BatchStats {
    size_t file_count = 0;
    size_t succeeded = 0;
    size_t failed = 0;
    size_t discarded = 0;
    size_t total_original = 0;    // nur erfolgreiche, nicht verworfene
    size_t total_compressed = 0;
    double average_ratio = 0;     // 1 - total_compressed / total_original
};

// Pure fold over the results. The average ratio is weighted by bytes, so a
// few large files dominate it the same way they dominate disk usage.
BatchStats summarize(const std::vector<CompressionResult>& results);

} // namespace imgmin
