/*
 * parafetch/src/fetcher/range_planner.cpp
 *
 * Splits a resource of known length into contiguous byte ranges, one per worker.
 * The last range absorbs the division remainder. Unknown lengths collapse to a single
 * open-ended range.
 */

#include <parafetch/fetcher/fetcher.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace parafetch {

Expected<std::vector<ByteRange>> planRanges(std::int64_t totalLength, int concurrency) {
    if (concurrency < 1) {
        return Error{ErrorCode::InvalidConfiguration,
                     "concurrency must be >= 1, got " + std::to_string(concurrency)};
    }

    std::vector<ByteRange> ranges;
    if (totalLength < 0) {
        if (concurrency > 1) {
            spdlog::debug("Content length unknown; using a single open-ended range instead of {}",
                          concurrency);
        }
        ranges.push_back(ByteRange{0, 0, -1});
        return ranges;
    }

    // No zero-width ranges: never more workers than bytes.
    const std::int64_t n =
        std::max<std::int64_t>(1, std::min<std::int64_t>(concurrency, totalLength));
    const std::int64_t chunkSize = totalLength / n;
    const std::int64_t remainder = totalLength % n;

    ranges.reserve(static_cast<std::size_t>(n));
    for (std::int64_t i = 0; i < n; ++i) {
        ByteRange r;
        r.index = static_cast<std::size_t>(i);
        r.start = chunkSize * i;
        r.end = chunkSize * (i + 1);
        if (i == n - 1)
            r.end += remainder;
        ranges.push_back(r);
    }
    return ranges;
}

} // namespace parafetch
