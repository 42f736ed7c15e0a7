/*
 * parafetch/src/downloader/range_planner.cpp
 *
 * Splits [0, totalSize) into contiguous inclusive byte ranges.
 * - Fixed chunk (MiB): ceil(size / chunk) segments, workers capped at the segment count
 * - Otherwise: max(1, workers) segments of ceil(size / segments) bytes
 * The last segment always ends at size - 1.
 */

#include <parafetch/downloader/downloader.hpp>

#include <algorithm>
#include <cstdint>

namespace parafetch::downloader {

namespace {

constexpr std::uint64_t kMiB = 1024ull * 1024ull;

std::uint64_t ceilDiv(std::uint64_t a, std::uint64_t b) {
    return a / b + (a % b != 0 ? 1 : 0);
}

} // namespace

RangePlan planRanges(std::uint64_t totalSize, int workers, int chunkSizeMb) {
    RangePlan plan;
    const auto requested = static_cast<std::uint64_t>(std::max(1, workers));
    if (totalSize == 0) {
        plan.effectiveWorkers = 1;
        return plan;
    }

    std::uint64_t numParts = 0;
    if (chunkSizeMb > 0) {
        plan.chunkSize = static_cast<std::uint64_t>(chunkSizeMb) * kMiB;
        numParts = ceilDiv(totalSize, plan.chunkSize);
        plan.effectiveWorkers = static_cast<int>(std::min(requested, numParts));
    } else {
        // Fewer bytes than workers would leave empty segments
        numParts = std::min(requested, totalSize);
        plan.chunkSize = ceilDiv(totalSize, numParts);
        plan.effectiveWorkers = static_cast<int>(numParts);
    }

    plan.segments.reserve(static_cast<std::size_t>(numParts));
    std::uint64_t start = 0;
    for (std::uint64_t i = 1; i <= numParts && start < totalSize; ++i) {
        const std::uint64_t end = std::min(start + plan.chunkSize - 1, totalSize - 1);
        plan.segments.push_back(RangeSegment{static_cast<int>(i), start, end});
        start = end + 1;
    }
    // ceil rounding can exhaust the size before numParts segments (e.g. 10 bytes / 6)
    plan.effectiveWorkers =
        std::max(1, std::min(plan.effectiveWorkers, static_cast<int>(plan.segments.size())));
    return plan;
}

} // namespace parafetch::downloader
